#include "retention.h"

#include <cmath>
#include <cstdio>
#include <map>

long entry_age_minutes(time_t now, const BackupEntry &entry) {
    return static_cast<long>(std::llround(std::difftime(now, entry.created_at) / 60.0));
}

long retention_bucket(long age_minutes, const RetentionConfig &cfg) {
    long w = cfg.short_window_minutes;
    if (age_minutes <= w) return 0;
    long bucket = (age_minutes - 1) / w;
    if (bucket > cfg.max_age_minutes / w - 1) return 0;
    return bucket;
}

// Older wins; equal ages fall back to the creation time, then the name.
static bool older_than(const BackupEntry &a, long age_a, const BackupEntry &b, long age_b) {
    if (age_a != age_b) return age_a > age_b;
    if (a.created_at != b.created_at) return a.created_at < b.created_at;
    return a.name < b.name;
}

std::set<std::string> select_expired(time_t now, const std::vector<BackupEntry> &entries,
                                     const RetentionConfig &cfg, bool verbose) {
    std::set<std::string> doomed;
    std::map<long, std::vector<size_t>> buckets;
    std::vector<long> ages(entries.size(), 0);

    for (size_t i = 0; i < entries.size(); i++) {
        long age = entry_age_minutes(now, entries[i]);
        ages[i] = age;
        if (age < cfg.short_window_minutes) continue;
        if (age > cfg.max_age_minutes) {
            if (verbose) {
                std::printf("expired: %s (age=%ldmin)\n", entries[i].name.c_str(), age);
            }
            doomed.insert(entries[i].name);
            continue;
        }
        long bucket = retention_bucket(age, cfg);
        if (bucket > 0) buckets[bucket].push_back(i);
    }

    for (const auto &bucket : buckets) {
        const std::vector<size_t> &members = bucket.second;
        size_t keep = members[0];
        for (size_t i = 1; i < members.size(); i++) {
            size_t idx = members[i];
            if (older_than(entries[idx], ages[idx], entries[keep], ages[keep])) keep = idx;
        }
        for (size_t idx : members) {
            if (idx == keep) continue;
            if (verbose) {
                std::printf("thinned: %s (age=%ldmin, bucket %ld keeps %s)\n",
                            entries[idx].name.c_str(), ages[idx], bucket.first, entries[keep].name.c_str());
            }
            doomed.insert(entries[idx].name);
        }
    }
    return doomed;
}
