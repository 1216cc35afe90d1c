#include "archive_store.h"

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <dirent.h>
#include <sstream>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include "paths.h"

bool is_stamp_name(const std::string &name, const std::string &suffix) {
    const size_t stamp_len = 15;
    if (name.size() != stamp_len + suffix.size()) return false;
    if (name.compare(stamp_len, suffix.size(), suffix) != 0) return false;
    for (size_t i = 0; i < stamp_len; i++) {
        if (i == 8) {
            if (name[i] != '_') return false;
        } else if (!std::isdigit(static_cast<unsigned char>(name[i]))) {
            return false;
        }
    }
    return true;
}

DirectoryStore::DirectoryStore(const std::string &root) : root_(root) {}

bool DirectoryStore::list(std::vector<BackupEntry> *entries, std::string *err) const {
    entries->clear();
    DIR *d = opendir(root_.c_str());
    if (!d) {
        if (errno == ENOENT) return true;
        *err = "cannot read " + root_ + ": " + std::strerror(errno);
        return false;
    }
    struct dirent *e;
    while ((e = readdir(d)) != nullptr) {
        std::string name = e->d_name;
        if (!is_stamp_name(name, archive_suffix())) continue;
        std::string path = root_ + "/" + name;
        struct stat st;
        if (lstat(path.c_str(), &st) != 0) continue;
        if (!S_ISREG(st.st_mode)) continue;
        BackupEntry entry;
        entry.name = name;
        entry.created_at = st.st_mtime;
        entry.has_size = true;
        entry.size_bytes = static_cast<uint64_t>(st.st_size);
        entries->push_back(entry);
    }
    closedir(d);
    return true;
}

bool DirectoryStore::add(const std::string &archive, const std::string &stamp, std::string *err) {
    if (!ensure_dir(root_, err)) return false;
    std::string target = root_ + "/" + stamp + archive_suffix();
    if (::rename(archive.c_str(), target.c_str()) != 0) {
        *err = "rename " + archive + " to " + target + ": " + std::strerror(errno);
        return false;
    }
    return true;
}

bool DirectoryStore::remove(const std::set<std::string> &names, std::string *err) {
    bool ok = true;
    for (const auto &name : names) {
        if (!is_stamp_name(name, archive_suffix())) {
            std::printf("skip delete of foreign name: %s\n", name.c_str());
            continue;
        }
        std::string path = root_ + "/" + name;
        if (::unlink(path.c_str()) != 0) {
            if (errno == ENOENT) continue;
            if (!err->empty()) *err += "; ";
            *err += "unlink " + path + ": " + std::strerror(errno);
            ok = false;
            continue;
        }
        std::printf("delete: %s\n", path.c_str());
    }
    return ok;
}

ContainerStore::ContainerStore(const std::string &root, const RunMode &mode)
    : container_(root + "/" + CONTAINER_NAME), mode_(mode) {}

bool ContainerStore::list(std::vector<BackupEntry> *entries, std::string *err) const {
    entries->clear();
    if (access(container_.c_str(), F_OK) != 0) return true;
    std::string out;
    int rc = run_command_output({"zipinfo", "-T", container_}, mode_, &out);
    // 1 is a warning, e.g. "Empty zipfile."
    if (rc != 0 && rc != 1) {
        *err = "zipinfo " + container_ + " failed with exit code " + std::to_string(rc);
        return false;
    }
    size_t skipped = 0;
    parse_zipinfo_listing(out, entries, &skipped);
    return true;
}

bool ContainerStore::add(const std::string &archive, const std::string &stamp, std::string *err) {
    if (base_name(archive) != stamp + archive_suffix()) {
        *err = "archive " + archive + " is not named " + stamp + archive_suffix();
        return false;
    }
    int rc = run_nice_ionice({"zip", "-j", "-q", container_, archive}, mode_);
    if (rc != 0) {
        *err = "zip " + container_ + " failed with exit code " + std::to_string(rc);
        return false;
    }
    return true;
}

bool ContainerStore::remove(const std::set<std::string> &names, std::string *err) {
    if (names.empty()) return true;
    std::vector<BackupEntry> present;
    if (!list(&present, err)) return false;
    std::vector<std::string> args = {"zip", "-d", "-q", container_};
    size_t matched = 0;
    for (const auto &entry : present) {
        if (names.count(entry.name) == 0) continue;
        args.push_back(entry.name);
        matched++;
    }
    if (matched == 0) return true;
    int rc = run_nice_ionice(args, mode_);
    // 12: zip found nothing to do
    if (rc != 0 && rc != 12) {
        *err = "zip -d " + container_ + " failed with exit code " + std::to_string(rc);
        return false;
    }
    for (size_t i = 4; i < args.size(); i++) {
        std::printf("delete: %s:%s\n", container_.c_str(), args[i].c_str());
    }
    return true;
}

std::unique_ptr<ArchiveStore> make_archive_store(const Config &cfg, const RunMode &mode) {
    if (cfg.store == StoreKind::Container) {
        return std::unique_ptr<ArchiveStore>(new ContainerStore(cfg.dest, mode));
    }
    return std::unique_ptr<ArchiveStore>(new DirectoryStore(cfg.dest));
}

static bool all_digits(const std::string &s, size_t pos, size_t len) {
    for (size_t i = pos; i < pos + len; i++) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

static int digits_value(const std::string &s, size_t pos, size_t len) {
    return std::atoi(s.substr(pos, len).c_str());
}

static int month_index(const std::string &abbrev) {
    static const char *months[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                   "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
    for (int i = 0; i < 12; i++) {
        if (abbrev == months[i]) return i;
    }
    return -1;
}

bool parse_zip_time(const std::string &text, time_t *out, std::string *err) {
    struct tm tm;
    std::memset(&tm, 0, sizeof(tm));

    if (text.size() == 15 && text[8] == '.' && all_digits(text, 0, 8) && all_digits(text, 9, 6)) {
        tm.tm_year = digits_value(text, 0, 4) - 1900;
        tm.tm_mon = digits_value(text, 4, 2) - 1;
        tm.tm_mday = digits_value(text, 6, 2);
        tm.tm_hour = digits_value(text, 9, 2);
        tm.tm_min = digits_value(text, 11, 2);
        tm.tm_sec = digits_value(text, 13, 2);
    } else if (text.size() == 15 && text[2] == '-' && text[6] == '-' && text[9] == ' ' && text[12] == ':' &&
               all_digits(text, 0, 2) && all_digits(text, 7, 2) && all_digits(text, 10, 2) &&
               all_digits(text, 13, 2)) {
        int month = month_index(text.substr(3, 3));
        if (month < 0) {
            *err = "unknown month in zip timestamp: " + text;
            return false;
        }
        int yy = digits_value(text, 0, 2);
        tm.tm_year = (yy >= 80 ? 1900 + yy : 2000 + yy) - 1900;
        tm.tm_mon = month;
        tm.tm_mday = digits_value(text, 7, 2);
        tm.tm_hour = digits_value(text, 10, 2);
        tm.tm_min = digits_value(text, 13, 2);
    } else {
        *err = "unrecognized zip timestamp: " + text;
        return false;
    }

    if (tm.tm_mon < 0 || tm.tm_mon > 11 || tm.tm_mday < 1 || tm.tm_mday > 31 ||
        tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 59) {
        *err = "zip timestamp out of range: " + text;
        return false;
    }
    int year = tm.tm_year;
    int mon = tm.tm_mon;
    int mday = tm.tm_mday;
    tm.tm_isdst = -1;
    time_t t = mktime(&tm);
    if (t == static_cast<time_t>(-1)) {
        *err = "cannot convert zip timestamp: " + text;
        return false;
    }
    if (tm.tm_year != year || tm.tm_mon != mon || tm.tm_mday != mday) {
        *err = "zip timestamp is not a calendar date: " + text;
        return false;
    }
    *out = t;
    return true;
}

static bool is_mode_string(const std::string &token) {
    if (token.size() != 10) return false;
    return token[0] == '-' || token[0] == 'd' || token[0] == 'l';
}

void parse_zipinfo_listing(const std::string &listing, std::vector<BackupEntry> *entries, size_t *skipped) {
    std::istringstream in(listing);
    std::string line;
    *skipped = 0;
    while (std::getline(in, line)) {
        std::istringstream fields(line);
        std::vector<std::string> tokens;
        std::string token;
        while (fields >> token) tokens.push_back(token);
        if (tokens.size() < 8 || !is_mode_string(tokens[0])) continue;
        if (tokens[0][0] != '-') continue;

        // -T prints one date token; the default listing prints date and time.
        std::string stamp_text = tokens[6];
        size_t name_index = 7;
        if (tokens[6].find('.') == std::string::npos && tokens.size() >= 9) {
            stamp_text = tokens[6] + " " + tokens[7];
            name_index = 8;
        }
        std::string name = tokens[name_index];
        for (size_t i = name_index + 1; i < tokens.size(); i++) {
            name += " " + tokens[i];
        }
        if (!is_stamp_name(name, ".tar")) continue;

        BackupEntry entry;
        entry.name = name;
        std::string err;
        if (!parse_zip_time(stamp_text, &entry.created_at, &err)) {
            std::printf("skip entry %s: %s\n", name.c_str(), err.c_str());
            (*skipped)++;
            continue;
        }
        char *end = nullptr;
        unsigned long long size = std::strtoull(tokens[3].c_str(), &end, 10);
        if (end && *end == '\0') {
            entry.has_size = true;
            entry.size_bytes = size;
        }
        entries->push_back(entry);
    }
}
