#ifndef STRATA_SPACE_GUARD_H
#define STRATA_SPACE_GUARD_H

#include <cstdint>
#include <functional>
#include <string>

enum class SpaceCheck {
    Ok,
    Insufficient
};

// Free space in KB available to unprivileged users on the filesystem that
// holds path.
typedef std::function<bool(const std::string &path, uint64_t *free_kb, std::string *err)> FreeSpaceFn;

bool statvfs_free_kb(const std::string &path, uint64_t *free_kb, std::string *err);

// Equal to the threshold counts as sufficient.
inline bool space_sufficient(uint64_t free_kb, uint64_t threshold_kb) {
    return free_kb >= threshold_kb;
}

// A failing free-space query is reported as Insufficient.
SpaceCheck check_space(const std::string &path, uint64_t threshold_kb, const FreeSpaceFn &free_space);
SpaceCheck check_space(const std::string &path, uint64_t threshold_kb);

#endif
