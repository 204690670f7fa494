#include "file_access.hpp"
#include "encoding.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace largefile {

namespace {

class FdGuard {
public:
    explicit FdGuard(int fd) : fd_(fd) {}
    ~FdGuard() { if (fd_ >= 0) ::close(fd_); }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;
    int get() const { return fd_; }

private:
    int fd_;
};

class MappedRegion {
public:
    MappedRegion(FileMapper& mapper, const char* data, size_t size)
        : mapper_(mapper), data_(data), size_(size) {}
    ~MappedRegion() { mapper_.unmap(data_, size_); }
    MappedRegion(const MappedRegion&) = delete;
    MappedRegion& operator=(const MappedRegion&) = delete;
    const char* data() const { return data_; }

private:
    FileMapper& mapper_;
    const char* data_;
    size_t size_;
};

AccessError errno_error(const std::string& path, int err) {
    std::string cause = std::strerror(err);
    switch (err) {
        case ENOENT:
        case ENOTDIR:
            return AccessError(AccessError::Kind::NotFound, path, cause);
        case EACCES:
        case EPERM:
            return AccessError(AccessError::Kind::PermissionDenied, path, cause);
        default:
            return AccessError(AccessError::Kind::Io, path, cause);
    }
}

int open_for_read(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) throw errno_error(path, errno);

    struct stat st;
    if (fstat(fd, &st) != 0) {
        int err = errno;
        ::close(fd);
        throw errno_error(path, err);
    }
    if (S_ISDIR(st.st_mode)) {
        ::close(fd);
        throw AccessError(AccessError::Kind::Io, path, "is a directory");
    }
    return fd;
}

// Returns bytes read, 0 at end of file.
size_t read_some(int fd, char* buf, size_t len, const std::string& path) {
    while (true) {
        ssize_t n = ::read(fd, buf, len);
        if (n >= 0) return static_cast<size_t>(n);
        if (errno != EINTR) throw errno_error(path, errno);
    }
}

Encoding require_encoding(const std::string& path, const std::string& encoding) {
    auto enc = parse_encoding(encoding);
    if (!enc) {
        throw AccessError(AccessError::Kind::DecodeFailed, path,
                          "unsupported encoding " + encoding);
    }
    return *enc;
}

AccessError decode_failure(const std::string& path, const std::string& encoding,
                           const DecodeError& e) {
    return AccessError(AccessError::Kind::DecodeFailed, path,
                       "with encoding " + encoding + ": " + e.what());
}

} // namespace

const char* strategy_name(AccessStrategy strategy) {
    switch (strategy) {
        case AccessStrategy::Memory:    return "memory";
        case AccessStrategy::Mapped:    return "mapped";
        case AccessStrategy::Streaming: return "streaming";
    }
    return "memory";
}

const char* MmapFileMapper::map(int fd, size_t len) {
    void* data = mmap(nullptr, len, PROT_READ, MAP_PRIVATE, fd, 0);
    if (data == MAP_FAILED) return nullptr;
    madvise(data, len, MADV_SEQUENTIAL);
    return static_cast<const char*>(data);
}

void MmapFileMapper::unmap(const char* data, size_t len) {
    munmap(const_cast<char*>(data), len);
}

FileReader::FileReader(StrategySelector selector, uint32_t chunk_size,
                       std::shared_ptr<FileMapper> mapper)
    : selector_(selector), chunk_size_(chunk_size > 0 ? chunk_size : 8192),
      mapper_(mapper ? std::move(mapper) : std::make_shared<MmapFileMapper>()) {}

FileInfo FileReader::stat(const std::string& path) const {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) throw errno_error(path, errno);
    if (S_ISDIR(st.st_mode)) {
        throw AccessError(AccessError::Kind::Io, path, "is a directory");
    }

    FileInfo info;
    info.path = path;
    info.size = static_cast<uint64_t>(st.st_size);
    info.strategy = selector_.select(info.size);
    return info;
}

std::string FileReader::read(const std::string& path, const std::string& encoding) const {
    return read(path, encoding, stat(path).strategy);
}

std::string FileReader::read(const std::string& path, const std::string& encoding,
                             AccessStrategy strategy) const {
    switch (strategy) {
        case AccessStrategy::Memory:    return read_memory(path, encoding);
        case AccessStrategy::Mapped:    return read_mapped(path, encoding);
        case AccessStrategy::Streaming: return read_streaming(path, encoding);
    }
    return read_memory(path, encoding);
}

std::vector<std::string> FileReader::read_lines(const std::string& path,
                                                const std::string& encoding) const {
    return read_lines(path, encoding, stat(path).strategy);
}

std::vector<std::string> FileReader::read_lines(const std::string& path,
                                                const std::string& encoding,
                                                AccessStrategy strategy) const {
    if (strategy != AccessStrategy::Streaming) {
        return split_lines(read(path, encoding, strategy));
    }
    std::vector<std::string> lines;
    for_each_line(path, encoding, [&](const std::string& line) {
        lines.push_back(line);
        return true;
    });
    return lines;
}

std::string FileReader::read_bytes(const std::string& path) const {
    std::string bytes;
    for_each_chunk(path, [&](const char* data, size_t len) { bytes.append(data, len); });
    return bytes;
}

void FileReader::for_each_chunk(const std::string& path,
                                const std::function<void(const char*, size_t)>& on_chunk) const {
    FdGuard fd(open_for_read(path));
    std::string buf(chunk_size_, '\0');
    while (size_t got = read_some(fd.get(), &buf[0], buf.size(), path)) {
        on_chunk(buf.data(), got);
    }
}

std::string FileReader::read_memory(const std::string& path,
                                    const std::string& encoding) const {
    Encoding enc = require_encoding(path, encoding);
    std::string bytes = read_bytes(path);
    try {
        return decode(bytes, enc);
    } catch (const DecodeError& e) {
        throw decode_failure(path, encoding, e);
    }
}

std::string FileReader::read_mapped(const std::string& path,
                                    const std::string& encoding) const {
    Encoding enc = require_encoding(path, encoding);
    FdGuard fd(open_for_read(path));

    struct stat st;
    if (fstat(fd.get(), &st) != 0) throw errno_error(path, errno);
    auto size = static_cast<size_t>(st.st_size);
    if (size == 0) return read_memory(path, encoding);

    const char* data = mapper_->map(fd.get(), size);
    if (!data) {
        int err = errno;
        std::cerr << "[reader] mmap failed for " << path << " (" << std::strerror(err)
                  << "), falling back to memory read\n";
        return read_memory(path, encoding);
    }
    MappedRegion region(*mapper_, data, size);

    try {
        Decoder decoder(enc);
        std::string out = decoder.feed(region.data(), size);
        out += decoder.finish();
        return out;
    } catch (const DecodeError& e) {
        throw decode_failure(path, encoding, e);
    }
}

std::string FileReader::read_streaming(const std::string& path,
                                       const std::string& encoding) const {
    Encoding enc = require_encoding(path, encoding);
    FdGuard fd(open_for_read(path));

    Decoder decoder(enc);
    std::string content;
    std::string buf(chunk_size_, '\0');
    try {
        while (size_t got = read_some(fd.get(), &buf[0], buf.size(), path)) {
            content += decoder.feed(buf.data(), got);
        }
        content += decoder.finish();
    } catch (const DecodeError& e) {
        throw decode_failure(path, encoding, e);
    }
    return content;
}

void FileReader::for_each_line(const std::string& path, const std::string& encoding,
                               const LineCallback& on_line) const {
    Encoding enc = require_encoding(path, encoding);
    FdGuard fd(open_for_read(path));

    Decoder decoder(enc);
    std::string buf(chunk_size_, '\0');
    std::string partial;  // incomplete trailing line carried between chunks

    while (true) {
        size_t got = read_some(fd.get(), &buf[0], buf.size(), path);
        try {
            partial += got > 0 ? decoder.feed(buf.data(), got) : decoder.finish();
        } catch (const DecodeError& e) {
            throw decode_failure(path, encoding, e);
        }

        size_t start = 0;
        size_t nl;
        while ((nl = partial.find('\n', start)) != std::string::npos) {
            if (!on_line(partial.substr(start, nl + 1 - start))) return;
            start = nl + 1;
        }
        partial.erase(0, start);
        if (got == 0) break;
    }

    if (!partial.empty()) on_line(partial);
}

std::vector<std::string> FileReader::read_line_range(const std::string& path,
                                                     const std::string& encoding,
                                                     size_t first, size_t last) const {
    std::vector<std::string> lines;
    if (first == 0) first = 1;
    if (last < first) return lines;

    size_t line_no = 0;
    for_each_line(path, encoding, [&](const std::string& line) {
        ++line_no;
        if (line_no >= first) lines.push_back(line);
        return line_no < last;
    });
    return lines;
}

void FileReader::write(const std::string& path, const std::string& content,
                       const std::string& encoding) const {
    auto enc = parse_encoding(encoding);
    if (!enc) {
        throw AccessError(AccessError::Kind::WriteFailed, path,
                          "unsupported encoding " + encoding);
    }

    std::string bytes;
    try {
        bytes = encode(content, *enc);
    } catch (const DecodeError& e) {
        throw AccessError(AccessError::Kind::WriteFailed, path,
                          "cannot encode as " + encoding + ": " + e.what());
    }
    atomic_write(path, bytes);
}

std::vector<std::string> split_lines(const std::string& content) {
    std::vector<std::string> lines;
    size_t start = 0;
    size_t nl;
    while ((nl = content.find('\n', start)) != std::string::npos) {
        lines.push_back(content.substr(start, nl + 1 - start));
        start = nl + 1;
    }
    if (start < content.size()) lines.push_back(content.substr(start));
    return lines;
}

std::string strip_line_ending(const std::string& line) {
    size_t end = line.size();
    if (end > 0 && line[end - 1] == '\n') --end;
    if (end > 0 && line[end - 1] == '\r') --end;
    return line.substr(0, end);
}

void atomic_write(const std::string& path, const std::string& bytes) {
    namespace fs = std::filesystem;

    std::string tmp_path = path + ".tmp." + generate_id();
    auto fail = [&](const std::string& cause) {
        std::error_code ec;
        fs::remove(tmp_path, ec);
        throw AccessError(AccessError::Kind::WriteFailed, path, cause);
    };

    std::error_code ec;
    auto st = fs::status(path, ec);
    bool replacing = !ec && fs::exists(st);
    if (replacing && fs::is_directory(st)) {
        throw AccessError(AccessError::Kind::WriteFailed, path, "target is a directory");
    }

    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        fail("cannot create temporary file " + tmp_path + ": " + std::strerror(errno));
    }
    // Permissions go on before any content is written
    if (replacing) {
        fs::permissions(tmp_path, st.permissions(), fs::perm_options::replace, ec);
        if (ec) {
            std::cerr << "[reader] Could not copy permissions to " << tmp_path
                      << ": " << ec.message() << "\n";
        }
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.close();
    if (out.fail()) {
        fail("failed writing temporary file " + tmp_path);
    }

    fs::rename(tmp_path, path, ec);
    if (ec) fail(ec.message());
}

} // namespace largefile
