#include "backup.hpp"
#include "errors.hpp"
#include "path.hpp"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace largefile {

namespace {

std::string backup_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        now.time_since_epoch()).count() % 1000000;
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf;
    gmtime_r(&t, &tm_buf);

    char date[32];
    std::strftime(date, sizeof(date), "%Y%m%d_%H%M%S", &tm_buf);
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%s_%06lld", date, static_cast<long long>(micros));
    return buf;
}

} // namespace

BackupStore::BackupStore(const FileReader& reader, std::string backup_dir)
    : reader_(reader), backup_dir_(std::move(backup_dir)) {}

std::string BackupStore::directory() const {
    return resolve_path(backup_dir_);
}

// Creates an empty placeholder so simultaneous backups never share a name.
// The placeholder carries the source's permission bits, which atomic_write
// then keeps for the copy.
std::string BackupStore::reserve_name(const std::string& dir, const std::string& file_name,
                                      mode_t mode) const {
    std::string base = dir + "/" + file_name + "." + backup_timestamp();
    for (int attempt = 0; attempt < 1000; ++attempt) {
        std::string candidate = base + (attempt == 0 ? "" : "-" + std::to_string(attempt)) +
                                ".backup";
        int fd = ::open(candidate.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, mode);
        if (fd >= 0) {
            ::close(fd);
            return candidate;
        }
        if (errno != EEXIST) {
            throw AccessError(AccessError::Kind::WriteFailed, candidate, std::strerror(errno));
        }
    }
    throw AccessError(AccessError::Kind::WriteFailed, base, "no free backup name");
}

std::string BackupStore::backup(const std::string& path) const {
    std::string canonical = resolve_path(path);
    std::string bytes = reader_.read_bytes(canonical);

    struct stat st;
    if (::stat(canonical.c_str(), &st) != 0) {
        throw AccessError(AccessError::Kind::Io, canonical, std::strerror(errno));
    }

    std::string dir = directory();
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw AccessError(AccessError::Kind::WriteFailed, dir,
                          "cannot create backup directory: " + ec.message());
    }

    std::string file_name = std::filesystem::path(canonical).filename().string();
    std::string backup_path = reserve_name(dir, file_name, st.st_mode & 0777);
    try {
        atomic_write(backup_path, bytes);
    } catch (const AccessError&) {
        std::filesystem::remove(backup_path, ec);
        throw;
    }

    std::cerr << "[backup] " << canonical << " -> " << backup_path << "\n";
    return backup_path;
}

} // namespace largefile
