#ifndef STRATA_PATHS_H
#define STRATA_PATHS_H

#include <cstddef>
#include <ctime>
#include <string>

bool path_has_parent_dir(const std::string &path);
bool path_starts_with(const std::string &path, const std::string &prefix);
std::string strip_trailing_slashes(const std::string &path);
std::string base_name(const std::string &path);

// mkdir -p. Existing directories are not an error.
bool ensure_dir(const std::string &path, std::string *err);
int remove_dir_recursive(const std::string &path);
bool is_directory(const std::string &path);

void format_time(char *buf, size_t len, time_t t);
// YYYYMMDD_HHMMSS in local time; names archives and staging directories.
std::string format_stamp(time_t t);

#endif
