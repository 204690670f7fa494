#include "session.hpp"
#include "errors.hpp"
#include "hash.hpp"
#include "path.hpp"
#include "util.hpp"

namespace largefile {

SessionCache::SessionCache(const FileReader& reader, uint32_t max_line_length,
                           std::shared_ptr<EncodingDetector> detector)
    : reader_(reader), max_line_length_(max_line_length), detector_(std::move(detector))
{}

std::string SessionCache::content_hash(const std::string& canonical_path) const {
    Sha256 sha;
    reader_.for_each_chunk(canonical_path, [&](const char* data, size_t len) {
        sha.update(data, len);
    });
    return sha.hex_digest();
}

std::shared_ptr<const FileSession> SessionCache::load(const std::string& path) {
    std::string canonical = resolve_path(path);
    Key key{canonical, content_hash(canonical)};

    std::promise<std::shared_ptr<const FileSession>> promise;
    std::shared_ptr<Slot> slot;
    bool owner = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(key);
        if (it != sessions_.end()) {
            slot = it->second;
        } else {
            slot = std::make_shared<Slot>();
            slot->result = promise.get_future().share();
            sessions_.emplace(key, slot);
            ++builds_;
            owner = true;
        }
    }

    // Another caller is building (or built) this key
    if (!owner) return slot->result.get();

    std::shared_ptr<const FileSession> session;
    try {
        session = build(canonical);
    } catch (...) {
        promise.set_exception(std::current_exception());
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(key);
        if (it != sessions_.end() && it->second == slot) sessions_.erase(it);
        throw;
    }
    promise.set_value(session);
    if (session->content_hash != key.second) rekey(key, slot, session);
    return session;
}

// The file changed between hashing and building. The session describes the
// newer content, so it moves to the key of its own hash.
void SessionCache::rekey(const Key& stale, const std::shared_ptr<Slot>& slot,
                         const std::shared_ptr<const FileSession>& session) {
    std::promise<std::shared_ptr<const FileSession>> ready;
    ready.set_value(session);
    auto fresh = std::make_shared<Slot>();
    fresh->result = ready.get_future().share();

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(stale);
    if (it != sessions_.end() && it->second == slot) sessions_.erase(it);
    sessions_.emplace(Key{session->canonical_path, session->content_hash}, fresh);
}

std::shared_ptr<const FileSession> SessionCache::get(const std::string& path) {
    std::string canonical = resolve_path(path);
    Key key{canonical, content_hash(canonical)};

    std::shared_ptr<Slot> slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(key);
        if (it == sessions_.end()) return nullptr;
        slot = it->second;
    }

    try {
        return slot->result.get();
    } catch (const AccessError&) {
        // The in-flight build failed; its caller sees the error
        return nullptr;
    }
}

void SessionCache::invalidate(const std::string& path) {
    std::string canonical = resolve_path(path);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.lower_bound(Key{canonical, std::string()});
    while (it != sessions_.end() && it->first.first == canonical) {
        it = sessions_.erase(it);
    }
}

size_t SessionCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

void SessionCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.clear();
}

uint64_t SessionCache::build_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return builds_;
}

std::shared_ptr<const FileSession> SessionCache::build(const std::string& canonical_path) const {
    auto session = std::make_shared<FileSession>();
    session->canonical_path = canonical_path;
    session->encoding = detect_file_encoding(canonical_path, detector_.get());
    session->chunk_size = reader_.chunk_size();
    session->created_at = epoch_seconds();

    auto enc = parse_encoding(session->encoding);
    if (!enc) {
        throw AccessError(AccessError::Kind::DecodeFailed, canonical_path,
                          "unsupported encoding " + session->encoding);
    }

    // One pass over the bytes: hash, size, line count and the long-line check
    // all describe the same content. Every line is checked, not just a sample.
    Sha256 sha;
    Decoder decoder(*enc);
    uint64_t size = 0;
    uint64_t lines = 0;
    bool long_lines = false;
    std::string partial;

    auto take_lines = [&](bool at_end) {
        size_t start = 0;
        size_t nl;
        while ((nl = partial.find('\n', start)) != std::string::npos || at_end) {
            size_t end = nl == std::string::npos ? partial.size() : nl + 1;
            if (end == start) break;
            ++lines;
            // Byte length bounds the character count from above
            if (!long_lines && end - start > max_line_length_) {
                long_lines = utf8_length(strip_line_ending(partial.substr(start, end - start))) >
                             max_line_length_;
            }
            start = end;
        }
        partial.erase(0, start);
    };

    try {
        reader_.for_each_chunk(canonical_path, [&](const char* data, size_t len) {
            sha.update(data, len);
            size += len;
            partial += decoder.feed(data, len);
            take_lines(false);
        });
        partial += decoder.finish();
    } catch (const DecodeError& e) {
        throw AccessError(AccessError::Kind::DecodeFailed, canonical_path,
                          "with encoding " + session->encoding + ": " + e.what());
    }
    take_lines(true);

    session->content_hash = sha.hex_digest();
    session->file_size = size;
    session->strategy = reader_.selector().select(size);
    session->line_count = lines;
    session->has_long_lines = long_lines;
    return session;
}

} // namespace largefile
