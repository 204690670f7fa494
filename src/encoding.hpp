#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace largefile {

constexpr const char* kDefaultEncoding = "utf-8";
constexpr double kEncodingConfidenceThreshold = 0.7;
constexpr size_t kEncodingSampleSize = 64 * 1024;

enum class Encoding { Utf8, Ascii, Latin1, Utf16LE, Utf16BE, Utf16 };

// Accepts common aliases ("utf8", "ISO-8859-1", ...). nullopt if unsupported.
std::optional<Encoding> parse_encoding(const std::string& name);
const char* encoding_name(Encoding enc);

class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Incremental decoder producing UTF-8. Incomplete multi-byte sequences at the
// end of a chunk are held back until the next feed().
class Decoder {
public:
    explicit Decoder(Encoding enc);

    std::string feed(const char* data, size_t len);
    std::string feed(const std::string& bytes) { return feed(bytes.data(), bytes.size()); }

    // Throws DecodeError if input ended inside a sequence.
    std::string finish();

private:
    std::string decode_utf16(bool big_endian);

    Encoding enc_;
    std::string pending_;
    uint64_t offset_ = 0;  // bytes consumed before pending_
    bool bom_checked_ = false;
    bool big_endian_ = false;
};

// One-shot helpers. decode() throws DecodeError, encode() throws
// DecodeError when the text is not representable in enc.
std::string decode(const std::string& bytes, Encoding enc);
std::string encode(const std::string& text, Encoding enc);

// ── UTF-8 helpers ───────────────────────────────────────────────

// Number of code points. Invalid bytes count as one each.
size_t utf8_length(const std::string& s);

// Invalid bytes decode to U+FFFD.
std::u32string utf8_to_u32(const std::string& s);

// First max_chars code points of s.
std::string utf8_truncate(const std::string& s, size_t max_chars);

// Code point offset of byte offset `byte_pos` in s.
size_t utf8_char_offset(const std::string& s, size_t byte_pos);

// ── Detection ───────────────────────────────────────────────────

struct EncodingGuess {
    std::string name;
    double confidence = 0.0;
};

class EncodingDetector {
public:
    virtual ~EncodingDetector() = default;
    virtual EncodingGuess detect(const std::string& sample) = 0;
};

// BOM sniffing, UTF-8 validation and a single-byte / UTF-16 guess.
class BomEncodingDetector : public EncodingDetector {
public:
    EncodingGuess detect(const std::string& sample) override;
};

// Pick an encoding for a byte sample. Suggestions below the confidence
// threshold, unsupported names and detector failures fall back to
// kDefaultEncoding; "ascii" is promoted to "utf-8". Never throws.
std::string resolve_encoding(EncodingDetector* detector, const std::string& sample);

// Reads the first kEncodingSampleSize bytes of path and resolves them.
// Unreadable files resolve to kDefaultEncoding.
std::string detect_file_encoding(const std::string& path, EncodingDetector* detector);

} // namespace largefile
