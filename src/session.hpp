#pragma once
#include "encoding.hpp"
#include "file_access.hpp"
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace largefile {

// Metadata snapshot of a file, valid while the live content hash matches.
// Never mutated after construction; a changed file gets a new session.
struct FileSession {
    std::string canonical_path;
    std::string content_hash;   // SHA-256 hex
    uint64_t line_count = 0;
    uint64_t file_size = 0;
    std::string encoding;
    uint32_t chunk_size = 0;
    uint64_t created_at = 0;    // epoch seconds
    bool has_long_lines = false;
    AccessStrategy strategy = AccessStrategy::Memory;
};

// Sessions keyed by (canonical path, content hash). Thread-safe: concurrent
// loads of the same key share one build, and a session is only handed out
// once fully constructed.
class SessionCache {
public:
    SessionCache(const FileReader& reader, uint32_t max_line_length,
                 std::shared_ptr<EncodingDetector> detector = nullptr);

    // Hash the file, then return the cached session or build a new one.
    std::shared_ptr<const FileSession> load(const std::string& path);

    // Hash the file and return the matching session without building one.
    std::shared_ptr<const FileSession> get(const std::string& path);

    // Drop every session of path, whatever its hash.
    void invalidate(const std::string& path);

    size_t size() const;
    void clear();

    // Number of sessions built so far (cache misses)
    uint64_t build_count() const;

    std::string content_hash(const std::string& canonical_path) const;

private:
    using Key = std::pair<std::string, std::string>;

    struct Slot {
        std::shared_future<std::shared_ptr<const FileSession>> result;
    };

    std::shared_ptr<const FileSession> build(const std::string& canonical_path) const;
    void rekey(const Key& stale, const std::shared_ptr<Slot>& slot,
               const std::shared_ptr<const FileSession>& session);

    const FileReader& reader_;
    uint32_t max_line_length_;
    std::shared_ptr<EncodingDetector> detector_;
    std::map<Key, std::shared_ptr<Slot>> sessions_;
    uint64_t builds_ = 0;
    mutable std::mutex mutex_;
};

} // namespace largefile
