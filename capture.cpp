#include "capture.h"

#include <cstdio>
#include <thread>
#include <unordered_set>

#include "paths.h"

CopyFn rsync_copy(const RunMode &mode) {
    return [mode](const std::string &source, const std::string &dest, uint64_t max_bytes) {
        std::vector<std::string> args = {
            "rsync", "-a",
            "--max-size=" + std::to_string(static_cast<unsigned long long>(max_bytes)),
            source + "/",
            dest + "/"
        };
        return run_nice_ionice(args, mode);
    };
}

std::vector<std::string> staging_names(const std::vector<SourceSpec> &sources) {
    std::vector<std::string> names;
    std::unordered_set<std::string> used;
    for (const auto &src : sources) {
        std::string base = base_name(src.path);
        if (base.empty() || base == "/") base = "root";
        std::string name = base;
        for (int n = 2; !used.insert(name).second; n++) {
            name = base + "-" + std::to_string(n);
        }
        names.push_back(name);
    }
    return names;
}

size_t capture_sources(const std::vector<SourceSpec> &sources, const std::string &dest_dir, const CopyFn &copy) {
    std::vector<std::string> names = staging_names(sources);
    std::vector<int> results(sources.size(), 0);
    std::vector<std::thread> workers;

    for (size_t i = 0; i < sources.size(); i++) {
        const SourceSpec &src = sources[i];
        std::string target = dest_dir + "/" + names[i];
        if (!is_directory(src.path)) {
            std::printf("skip source %s: not a directory\n", src.path.c_str());
            results[i] = -1;
            continue;
        }
        std::string err;
        if (!ensure_dir(target, &err)) {
            std::printf("skip source %s: %s\n", src.path.c_str(), err.c_str());
            results[i] = -1;
            continue;
        }
        int *slot = &results[i];
        workers.emplace_back([&copy, &src, target, slot]() {
            *slot = copy(src.path, target, src.max_file_size);
        });
    }
    for (auto &worker : workers) {
        worker.join();
    }

    size_t failed = 0;
    for (size_t i = 0; i < sources.size(); i++) {
        if (results[i] == 0) continue;
        failed++;
        if (results[i] > 0) {
            std::printf("copy of %s incomplete (exit %d)\n", sources[i].path.c_str(), results[i]);
        }
    }
    return failed;
}
