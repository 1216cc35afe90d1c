#ifndef STRATA_CONFIG_H
#define STRATA_CONFIG_H

#include <cstdint>
#include <string>
#include <vector>

enum class StoreKind {
    Directory,
    Container
};

struct SourceSpec {
    std::string path;
    uint64_t max_file_size = 0;
};

struct RetentionConfig {
    long short_window_minutes = 1440;
    long max_age_minutes = 525600;
};

struct Config {
    std::vector<SourceSpec> sources;
    std::string dest;
    StoreKind store = StoreKind::Directory;
    long interval_seconds = 600;
    uint64_t min_free_kb = 1000000;
    uint64_t max_file_size = 10 * 1024 * 1024;
    RetentionConfig retention;
};

const char *store_kind_label(StoreKind kind);

// Accepts a plain byte count or a k/m/g suffix (binary, case-insensitive),
// the same notation rsync --max-size takes.
bool parse_size(const std::string &value, uint64_t *out);

bool validate_config(const Config &cfg, std::string *err);
bool parse_config(const std::string &path, Config *cfg, std::string *err);
bool parse_config_text(const std::string &text, Config *cfg, std::string *err);

void print_config(const Config &cfg);

#endif
