#include "config.h"

#include <cctype>
#include <cstdio>
#include <limits>
#include <yaml-cpp/yaml.h>

#include "paths.h"

const char *store_kind_label(StoreKind kind) {
    switch (kind) {
        case StoreKind::Directory:
            return "directory";
        case StoreKind::Container:
            return "container";
        default:
            return "unknown";
    }
}

static StoreKind parse_store_kind(const std::string &value, bool *ok) {
    std::string v = value;
    for (auto &c : v) c = static_cast<char>(std::tolower(c));
    if (v.empty() || v == "directory") {
        *ok = true;
        return StoreKind::Directory;
    }
    if (v == "container" || v == "zip") {
        *ok = true;
        return StoreKind::Container;
    }
    *ok = false;
    return StoreKind::Directory;
}

bool parse_size(const std::string &value, uint64_t *out) {
    if (value.empty()) return false;
    size_t i = 0;
    uint64_t n = 0;
    while (i < value.size() && std::isdigit(static_cast<unsigned char>(value[i]))) {
        uint64_t digit = static_cast<uint64_t>(value[i] - '0');
        if (n > (std::numeric_limits<uint64_t>::max() - digit) / 10) return false;
        n = n * 10 + digit;
        i++;
    }
    if (i == 0) return false;
    uint64_t mult = 1;
    if (i < value.size()) {
        char suffix = static_cast<char>(std::tolower(static_cast<unsigned char>(value[i])));
        if (suffix == 'k') {
            mult = 1024ULL;
        } else if (suffix == 'm') {
            mult = 1024ULL * 1024;
        } else if (suffix == 'g') {
            mult = 1024ULL * 1024 * 1024;
        } else {
            return false;
        }
        i++;
        if (i < value.size() && (value[i] == 'b' || value[i] == 'B')) i++;
        if (i != value.size()) return false;
    }
    if (n > std::numeric_limits<uint64_t>::max() / mult) return false;
    *out = n * mult;
    return true;
}

static bool validate_path(const std::string &label, const std::string &path, std::string *err) {
    if (path.empty()) {
        *err = label + " path is empty";
        return false;
    }
    if (path[0] != '/') {
        *err = label + " path must be absolute: " + path;
        return false;
    }
    if (path_has_parent_dir(path)) {
        *err = label + " path must not contain ..: " + path;
        return false;
    }
    return true;
}

bool validate_config(const Config &cfg, std::string *err) {
    if (!validate_path("destination", cfg.dest, err)) return false;
    if (strip_trailing_slashes(cfg.dest) == "/") {
        *err = "destination must not be /";
        return false;
    }
    if (cfg.sources.empty()) {
        *err = "no sources configured";
        return false;
    }
    for (const auto &src : cfg.sources) {
        if (!validate_path("source", src.path, err)) return false;
        if (path_starts_with(cfg.dest, src.path)) {
            *err = "destination " + cfg.dest + " is inside source " + src.path;
            return false;
        }
        if (src.max_file_size == 0) {
            *err = "source " + src.path + ": max_file_size must be positive";
            return false;
        }
    }
    if (cfg.interval_seconds <= 0) {
        *err = "interval must be positive";
        return false;
    }
    if (cfg.retention.short_window_minutes <= 0) {
        *err = "retention short_window_minutes must be positive";
        return false;
    }
    if (cfg.retention.max_age_minutes <= cfg.retention.short_window_minutes) {
        *err = "retention max_age_minutes must be greater than short_window_minutes";
        return false;
    }
    return true;
}

static bool load_root(const YAML::Node &root, Config *cfg, std::string *err) {
    if (!root.IsMap()) {
        *err = "top level must be a mapping";
        return false;
    }
    cfg->dest = root["dest"].as<std::string>("");
    bool ok = false;
    std::string store = root["store"].as<std::string>("directory");
    cfg->store = parse_store_kind(store, &ok);
    if (!ok) {
        *err = "invalid store " + store + " (expected directory or container)";
        return false;
    }
    cfg->interval_seconds = root["interval"].as<long>(cfg->interval_seconds);
    cfg->min_free_kb = root["min_free_kb"].as<uint64_t>(cfg->min_free_kb);
    if (root["max_file_size"]) {
        std::string size = root["max_file_size"].as<std::string>();
        if (!parse_size(size, &cfg->max_file_size)) {
            *err = "invalid max_file_size " + size;
            return false;
        }
    }
    if (root["retention"]) {
        const YAML::Node &ret = root["retention"];
        cfg->retention.short_window_minutes =
            ret["short_window_minutes"].as<long>(cfg->retention.short_window_minutes);
        cfg->retention.max_age_minutes = ret["max_age_minutes"].as<long>(cfg->retention.max_age_minutes);
    }
    if (!root["sources"] || !root["sources"].IsSequence()) {
        *err = "missing sources";
        return false;
    }
    for (const auto &node : root["sources"]) {
        SourceSpec src;
        src.max_file_size = cfg->max_file_size;
        if (node.IsScalar()) {
            src.path = node.as<std::string>();
        } else {
            src.path = node["path"].as<std::string>("");
            if (node["max_file_size"]) {
                std::string size = node["max_file_size"].as<std::string>();
                if (!parse_size(size, &src.max_file_size)) {
                    *err = "source " + src.path + ": invalid max_file_size " + size;
                    return false;
                }
            }
        }
        src.path = strip_trailing_slashes(src.path);
        cfg->sources.push_back(src);
    }
    cfg->dest = strip_trailing_slashes(cfg->dest);
    return validate_config(*cfg, err);
}

bool parse_config(const std::string &path, Config *cfg, std::string *err) {
    try {
        YAML::Node root = YAML::LoadFile(path);
        return load_root(root, cfg, err);
    } catch (const std::exception &e) {
        *err = e.what();
        return false;
    }
}

bool parse_config_text(const std::string &text, Config *cfg, std::string *err) {
    try {
        YAML::Node root = YAML::Load(text);
        return load_root(root, cfg, err);
    } catch (const std::exception &e) {
        *err = e.what();
        return false;
    }
}

void print_config(const Config &cfg) {
    std::printf("dest: %s\n", cfg.dest.c_str());
    std::printf("store: %s\n", store_kind_label(cfg.store));
    std::printf("interval: %lds\n", cfg.interval_seconds);
    std::printf("min_free_kb: %llu\n", static_cast<unsigned long long>(cfg.min_free_kb));
    std::printf("retention: short_window=%ldmin max_age=%ldmin\n",
                cfg.retention.short_window_minutes, cfg.retention.max_age_minutes);
    for (const auto &src : cfg.sources) {
        std::printf("source: %s\n", src.path.c_str());
        std::printf("  max_file_size: %llu\n", static_cast<unsigned long long>(src.max_file_size));
    }
}
