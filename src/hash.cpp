#include "hash.hpp"

#ifdef LARGEFILE_USE_COMMONCRYPTO
#include <CommonCrypto/CommonDigest.h>
#else
#include <openssl/evp.h>
#endif
#include <stdexcept>

namespace largefile {

namespace {

std::string to_hex(const unsigned char* data, size_t len) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0F];
    }
    return out;
}

} // namespace

#ifdef LARGEFILE_USE_COMMONCRYPTO

struct Sha256::Impl {
    CC_SHA256_CTX ctx;
};

Sha256::Sha256() : impl_(std::make_unique<Impl>()) {
    CC_SHA256_Init(&impl_->ctx);
}

Sha256::~Sha256() = default;

void Sha256::update(const char* data, size_t len) {
    CC_SHA256_Update(&impl_->ctx, data, static_cast<CC_LONG>(len));
}

std::string Sha256::hex_digest() {
    unsigned char hash[CC_SHA256_DIGEST_LENGTH];
    CC_SHA256_Final(hash, &impl_->ctx);
    return to_hex(hash, CC_SHA256_DIGEST_LENGTH);
}

#else

struct Sha256::Impl {
    EVP_MD_CTX* ctx = nullptr;
    ~Impl() { if (ctx) EVP_MD_CTX_free(ctx); }
};

Sha256::Sha256() : impl_(std::make_unique<Impl>()) {
    impl_->ctx = EVP_MD_CTX_new();
    if (!impl_->ctx || EVP_DigestInit_ex(impl_->ctx, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize SHA-256 context");
    }
}

Sha256::~Sha256() = default;

void Sha256::update(const char* data, size_t len) {
    if (EVP_DigestUpdate(impl_->ctx, data, len) != 1) {
        throw std::runtime_error("SHA-256 update failed");
    }
}

std::string Sha256::hex_digest() {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(impl_->ctx, hash, &len) != 1) {
        throw std::runtime_error("SHA-256 finalization failed");
    }
    return to_hex(hash, len);
}

#endif

std::string sha256_hex(const std::string& data) {
    Sha256 sha;
    sha.update(data);
    return sha.hex_digest();
}

} // namespace largefile
