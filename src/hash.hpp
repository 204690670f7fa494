#pragma once
#include <cstddef>
#include <memory>
#include <string>

namespace largefile {

// Incremental SHA-256.
class Sha256 {
public:
    Sha256();
    ~Sha256();
    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void update(const char* data, size_t len);
    void update(const std::string& data) { update(data.data(), data.size()); }

    // Lowercase hex digest. The object cannot be updated afterwards.
    std::string hex_digest();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

std::string sha256_hex(const std::string& data);

} // namespace largefile
