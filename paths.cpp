#include "paths.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ftw.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

bool path_has_parent_dir(const std::string &path) {
    size_t i = 0;
    while (i < path.size()) {
        while (i < path.size() && path[i] == '/') i++;
        if (i >= path.size()) break;
        size_t start = i;
        while (i < path.size() && path[i] != '/') i++;
        size_t len = i - start;
        if (len == 2 && path[start] == '.' && path[start + 1] == '.') {
            return true;
        }
    }
    return false;
}

bool path_starts_with(const std::string &path, const std::string &prefix) {
    if (prefix.empty()) return false;
    size_t prefix_len = prefix.size();
    while (prefix_len > 1 && prefix[prefix_len - 1] == '/') {
        prefix_len--;
    }
    if (prefix_len == 1 && prefix[0] == '/') {
        return !path.empty() && path[0] == '/';
    }
    if (path.size() < prefix_len) return false;
    if (path.compare(0, prefix_len, prefix, 0, prefix_len) != 0) return false;
    return path.size() == prefix_len || path[prefix_len] == '/';
}

std::string strip_trailing_slashes(const std::string &path) {
    size_t len = path.size();
    while (len > 1 && path[len - 1] == '/') {
        len--;
    }
    return path.substr(0, len);
}

std::string base_name(const std::string &path) {
    std::string p = strip_trailing_slashes(path);
    if (p == "/") return p;
    size_t slash = p.rfind('/');
    if (slash == std::string::npos) return p;
    return p.substr(slash + 1);
}

bool is_directory(const std::string &path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool ensure_dir(const std::string &path, std::string *err) {
    if (path.empty()) {
        *err = "empty directory path";
        return false;
    }
    std::string partial;
    size_t i = 0;
    if (path[0] == '/') {
        partial = "/";
        i = 1;
    }
    while (i <= path.size()) {
        size_t end = path.find('/', i);
        if (end == std::string::npos) end = path.size();
        if (end > i) {
            if (!partial.empty() && partial[partial.size() - 1] != '/') partial += "/";
            partial += path.substr(i, end - i);
            if (mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
                *err = "mkdir " + partial + ": " + std::strerror(errno);
                return false;
            }
        }
        i = end + 1;
    }
    if (!is_directory(path)) {
        *err = path + " is not a directory";
        return false;
    }
    return true;
}

static int remove_cb(const char *fpath, const struct stat *sb, int typeflag, struct FTW *ftwbuf) {
    (void)sb;
    (void)typeflag;
    (void)ftwbuf;
    return remove(fpath);
}

int remove_dir_recursive(const std::string &path) {
    return nftw(path.c_str(), remove_cb, 64, FTW_DEPTH | FTW_PHYS);
}

void format_time(char *buf, size_t len, time_t t) {
    struct tm tm;
    localtime_r(&t, &tm);
    std::strftime(buf, len, "%d-%m-%Y %H:%M:%S", &tm);
}

std::string format_stamp(time_t t) {
    struct tm tm;
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
    return buf;
}
