#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace largefile {

enum class AccessStrategy { Memory, Mapped, Streaming };

const char* strategy_name(AccessStrategy strategy);

// size < memory_threshold            -> Memory
// memory_threshold <= size < mmap    -> Mapped
// size >= mmap_threshold             -> Streaming
class StrategySelector {
public:
    StrategySelector(uint64_t memory_threshold, uint64_t mmap_threshold)
        : memory_threshold_(memory_threshold), mmap_threshold_(mmap_threshold) {}

    AccessStrategy select(uint64_t size) const {
        if (size < memory_threshold_) return AccessStrategy::Memory;
        if (size < mmap_threshold_) return AccessStrategy::Mapped;
        return AccessStrategy::Streaming;
    }

    uint64_t memory_threshold() const { return memory_threshold_; }
    uint64_t mmap_threshold() const { return mmap_threshold_; }

private:
    uint64_t memory_threshold_;
    uint64_t mmap_threshold_;
};

struct FileInfo {
    std::string path;
    uint64_t size = 0;
    AccessStrategy strategy = AccessStrategy::Memory;
};

// Receives each line with its terminator. Return false to stop early.
using LineCallback = std::function<bool(const std::string& line)>;

// Read-only view of an open file for the mapped strategy.
class FileMapper {
public:
    virtual ~FileMapper() = default;
    // First len bytes of fd, or nullptr with errno set.
    virtual const char* map(int fd, size_t len) = 0;
    virtual void unmap(const char* data, size_t len) = 0;
};

class MmapFileMapper : public FileMapper {
public:
    const char* map(int fd, size_t len) override;
    void unmap(const char* data, size_t len) override;
};

// Reads canonical paths using the strategy chosen by file size. Content is
// returned as UTF-8 regardless of the source encoding. All failures throw
// AccessError; the file is never held open between calls.
class FileReader {
public:
    // A null mapper means MmapFileMapper.
    FileReader(StrategySelector selector, uint32_t chunk_size,
               std::shared_ptr<FileMapper> mapper = nullptr);

    FileInfo stat(const std::string& path) const;

    std::string read(const std::string& path, const std::string& encoding) const;
    std::string read(const std::string& path, const std::string& encoding,
                     AccessStrategy strategy) const;

    std::vector<std::string> read_lines(const std::string& path,
                                        const std::string& encoding) const;
    std::vector<std::string> read_lines(const std::string& path,
                                        const std::string& encoding,
                                        AccessStrategy strategy) const;

    // Streams the file chunk by chunk regardless of size.
    void for_each_line(const std::string& path, const std::string& encoding,
                       const LineCallback& on_line) const;

    // Lines [first, last], 1-based inclusive, without reading past `last`.
    std::vector<std::string> read_line_range(const std::string& path,
                                             const std::string& encoding,
                                             size_t first, size_t last) const;

    // Raw bytes, no decoding.
    std::string read_bytes(const std::string& path) const;

    // Raw bytes in chunk_size() pieces.
    void for_each_chunk(const std::string& path,
                        const std::function<void(const char*, size_t)>& on_chunk) const;

    void write(const std::string& path, const std::string& content,
               const std::string& encoding) const;

    const StrategySelector& selector() const { return selector_; }
    uint32_t chunk_size() const { return chunk_size_; }

private:
    std::string read_memory(const std::string& path, const std::string& encoding) const;
    std::string read_mapped(const std::string& path, const std::string& encoding) const;
    std::string read_streaming(const std::string& path, const std::string& encoding) const;

    StrategySelector selector_;
    uint32_t chunk_size_;
    std::shared_ptr<FileMapper> mapper_;
};

// Split after every '\n', keeping terminators. A trailing unterminated
// line is kept; an empty string yields no lines.
std::vector<std::string> split_lines(const std::string& content);

// Strip a trailing "\n" or "\r\n".
std::string strip_line_ending(const std::string& line);

// Write bytes to a sibling temporary file and rename it over path. On
// failure the temporary file is removed, path is left untouched and
// AccessError(WriteFailed) is thrown.
void atomic_write(const std::string& path, const std::string& bytes);

} // namespace largefile
