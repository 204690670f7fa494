#pragma once
#include "file_access.hpp"
#include <string>
#include <sys/types.h>

namespace largefile {

// Writes byte-identical copies of files into a backup directory, named
// <basename>.<YYYYMMDD_HHMMSS_ffffff>.backup (UTC).
class BackupStore {
public:
    BackupStore(const FileReader& reader, std::string backup_dir);

    // Returns the backup path. Throws AccessError if the directory or the
    // copy cannot be written.
    std::string backup(const std::string& path) const;

    // Canonical form of the configured directory
    std::string directory() const;

private:
    std::string reserve_name(const std::string& dir, const std::string& file_name,
                             mode_t mode) const;

    const FileReader& reader_;
    std::string backup_dir_;
};

} // namespace largefile
