#include "space_guard.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sys/statvfs.h>

bool statvfs_free_kb(const std::string &path, uint64_t *free_kb, std::string *err) {
    struct statvfs sv;
    if (statvfs(path.c_str(), &sv) != 0) {
        *err = "statvfs " + path + ": " + std::strerror(errno);
        return false;
    }
    uint64_t avail = static_cast<uint64_t>(sv.f_bavail) * static_cast<uint64_t>(sv.f_frsize);
    *free_kb = avail / 1024;
    return true;
}

SpaceCheck check_space(const std::string &path, uint64_t threshold_kb, const FreeSpaceFn &free_space) {
    uint64_t free_kb = 0;
    std::string err;
    if (!free_space(path, &free_kb, &err)) {
        std::printf("free space check failed: %s\n", err.c_str());
        return SpaceCheck::Insufficient;
    }
    if (!space_sufficient(free_kb, threshold_kb)) {
        std::printf("insufficient free space on %s: %llu KB free, %llu KB required\n",
                    path.c_str(),
                    static_cast<unsigned long long>(free_kb),
                    static_cast<unsigned long long>(threshold_kb));
        return SpaceCheck::Insufficient;
    }
    return SpaceCheck::Ok;
}

SpaceCheck check_space(const std::string &path, uint64_t threshold_kb) {
    return check_space(path, threshold_kb, statvfs_free_kb);
}
