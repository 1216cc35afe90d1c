#ifndef STRATA_CAPTURE_H
#define STRATA_CAPTURE_H

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "command.h"
#include "config.h"

// Recursive copy of source into dest, skipping files larger than max_bytes.
// Returns the copy tool's exit status; 0 is a complete copy.
typedef std::function<int(const std::string &source, const std::string &dest, uint64_t max_bytes)> CopyFn;

CopyFn rsync_copy(const RunMode &mode);

// One subdirectory name per source, in source order: the source's base name,
// suffixed -2, -3, ... when two sources share one.
std::vector<std::string> staging_names(const std::vector<SourceSpec> &sources);

// Copies every source into its own subdirectory of dest_dir, one thread per
// source. Failures are logged and do not stop the other copies. Returns the
// number of sources that did not copy cleanly.
size_t capture_sources(const std::vector<SourceSpec> &sources, const std::string &dest_dir, const CopyFn &copy);

#endif
