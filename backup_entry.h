#ifndef STRATA_BACKUP_ENTRY_H
#define STRATA_BACKUP_ENTRY_H

#include <cstdint>
#include <ctime>
#include <string>

struct BackupEntry {
    std::string name;
    time_t created_at = 0;
    bool has_size = false;
    uint64_t size_bytes = 0;
};

#endif
