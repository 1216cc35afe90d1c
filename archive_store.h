#ifndef STRATA_ARCHIVE_STORE_H
#define STRATA_ARCHIVE_STORE_H

#include <ctime>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "backup_entry.h"
#include "command.h"
#include "config.h"

static const char CONTAINER_NAME[] = "backups.zip";

class ArchiveStore {
public:
    virtual ~ArchiveStore() {}

    virtual const char *kind() const = 0;
    // Suffix of the per-cycle archive handed to add(), ".tgz" or ".tar".
    virtual std::string archive_suffix() const = 0;
    virtual bool gzip_archives() const = 0;

    // Rescans the store. A store that does not exist yet lists as empty.
    virtual bool list(std::vector<BackupEntry> *entries, std::string *err) const = 0;
    // Inserts archive as the entry for stamp, replacing an entry of the same
    // name. Creates the store on first use.
    virtual bool add(const std::string &archive, const std::string &stamp, std::string *err) = 0;
    // Names that are not present are ignored.
    virtual bool remove(const std::set<std::string> &names, std::string *err) = 0;
};

// One <stamp>.tgz file per cycle directly under root.
class DirectoryStore : public ArchiveStore {
public:
    explicit DirectoryStore(const std::string &root);

    const char *kind() const override { return "directory"; }
    std::string archive_suffix() const override { return ".tgz"; }
    bool gzip_archives() const override { return true; }

    bool list(std::vector<BackupEntry> *entries, std::string *err) const override;
    bool add(const std::string &archive, const std::string &stamp, std::string *err) override;
    bool remove(const std::set<std::string> &names, std::string *err) override;

private:
    std::string root_;
};

// root/backups.zip holding one <stamp>.tar entry per cycle.
class ContainerStore : public ArchiveStore {
public:
    ContainerStore(const std::string &root, const RunMode &mode);

    const char *kind() const override { return "container"; }
    std::string archive_suffix() const override { return ".tar"; }
    bool gzip_archives() const override { return false; }

    bool list(std::vector<BackupEntry> *entries, std::string *err) const override;
    bool add(const std::string &archive, const std::string &stamp, std::string *err) override;
    bool remove(const std::set<std::string> &names, std::string *err) override;

    const std::string &container_path() const { return container_; }

private:
    std::string container_;
    RunMode mode_;
};

std::unique_ptr<ArchiveStore> make_archive_store(const Config &cfg, const RunMode &mode);

// True for names of the form YYYYMMDD_HHMMSS<suffix>.
bool is_stamp_name(const std::string &name, const std::string &suffix);

/*
 * Converts a zip entry timestamp as printed by zipinfo to local time.
 * Accepted forms:
 *   YYYYMMDD.HHMMSS     zipinfo -T
 *   yy-Mmm-dd HH:MM     zipinfo default, e.g. "24-Jan-05 13:07"
 * Two-digit years 80-99 are 19yy, 00-79 are 20yy (zip dates start in 1980).
 * Anything else, including out-of-range fields, fails with *err set.
 */
bool parse_zip_time(const std::string &text, time_t *out, std::string *err);

// Parses zipinfo -T output. Entries whose timestamp does not parse are
// logged and counted in *skipped.
void parse_zipinfo_listing(const std::string &listing, std::vector<BackupEntry> *entries, size_t *skipped);

#endif
