#ifndef STRATA_RETENTION_H
#define STRATA_RETENTION_H

#include <ctime>
#include <set>
#include <string>
#include <vector>

#include "backup_entry.h"
#include "config.h"

// Age in whole minutes, rounded to nearest.
long entry_age_minutes(time_t now, const BackupEntry &entry);

// Bucket index for an age, 0 when the age falls in no bucket. Bucket b
// covers (b*W, (b+1)*W] for b in 1 .. M/W - 1.
long retention_bucket(long age_minutes, const RetentionConfig &cfg);

/*
 * Selects the entries to delete:
 *   age < W            kept
 *   age > M            deleted
 *   age in bucket b    only the oldest entry of the bucket is kept
 * Ages in no tier (exactly W, or past the last full bucket but not beyond M)
 * are left alone. Re-running on the surviving set selects nothing.
 */
std::set<std::string> select_expired(time_t now, const std::vector<BackupEntry> &entries,
                                     const RetentionConfig &cfg, bool verbose = false);

#endif
