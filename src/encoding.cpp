#include "encoding.hpp"
#include "util.hpp"

#include <cstdio>
#include <fstream>
#include <iostream>

namespace largefile {

namespace {

// Length of the UTF-8 sequence at p: 0 when avail ends inside a valid
// prefix, -1 when invalid (overlong, surrogate or out of range).
int utf8_sequence(const unsigned char* p, size_t avail) {
    unsigned char c = p[0];
    if (c < 0x80) return 1;

    int len = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (c >= 0xC2 && c <= 0xDF) {
        len = 2;
    } else if (c == 0xE0) {
        len = 3; lo = 0xA0;
    } else if ((c >= 0xE1 && c <= 0xEC) || c == 0xEE || c == 0xEF) {
        len = 3;
    } else if (c == 0xED) {
        len = 3; hi = 0x9F;
    } else if (c == 0xF0) {
        len = 4; lo = 0x90;
    } else if (c >= 0xF1 && c <= 0xF3) {
        len = 4;
    } else if (c == 0xF4) {
        len = 4; hi = 0x8F;
    } else {
        return -1;
    }

    for (int k = 1; k < len; ++k) {
        if (static_cast<size_t>(k) >= avail) return 0;
        unsigned char b = p[k];
        unsigned char l = (k == 1) ? lo : 0x80;
        unsigned char h = (k == 1) ? hi : 0xBF;
        if (b < l || b > h) return -1;
    }
    return len;
}

char32_t utf8_code_point(const unsigned char* p, int len) {
    switch (len) {
        case 1: return p[0];
        case 2: return (static_cast<char32_t>(p[0] & 0x1F) << 6) | (p[1] & 0x3F);
        case 3: return (static_cast<char32_t>(p[0] & 0x0F) << 12) |
                       (static_cast<char32_t>(p[1] & 0x3F) << 6) | (p[2] & 0x3F);
        default: return (static_cast<char32_t>(p[0] & 0x07) << 18) |
                        (static_cast<char32_t>(p[1] & 0x3F) << 12) |
                        (static_cast<char32_t>(p[2] & 0x3F) << 6) | (p[3] & 0x3F);
    }
}

void append_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

void append_utf16(std::string& out, char32_t cp, bool big_endian) {
    auto put = [&](uint16_t unit) {
        char hi = static_cast<char>(unit >> 8);
        char lo = static_cast<char>(unit & 0xFF);
        if (big_endian) { out += hi; out += lo; }
        else            { out += lo; out += hi; }
    };
    if (cp < 0x10000) {
        put(static_cast<uint16_t>(cp));
    } else {
        cp -= 0x10000;
        put(static_cast<uint16_t>(0xD800 | (cp >> 10)));
        put(static_cast<uint16_t>(0xDC00 | (cp & 0x3FF)));
    }
}

std::string hex_byte(unsigned char b) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%02x", b);
    return buf;
}

std::string code_point_label(char32_t cp) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "U+%04X", static_cast<unsigned>(cp));
    return buf;
}

} // namespace

std::optional<Encoding> parse_encoding(const std::string& name) {
    std::string n = to_lower(trim(name));
    if (n == "utf-8" || n == "utf8") return Encoding::Utf8;
    if (n == "ascii" || n == "us-ascii") return Encoding::Ascii;
    if (n == "latin-1" || n == "latin1" || n == "iso-8859-1" || n == "iso8859-1")
        return Encoding::Latin1;
    if (n == "utf-16le" || n == "utf16le") return Encoding::Utf16LE;
    if (n == "utf-16be" || n == "utf16be") return Encoding::Utf16BE;
    if (n == "utf-16" || n == "utf16") return Encoding::Utf16;
    return std::nullopt;
}

const char* encoding_name(Encoding enc) {
    switch (enc) {
        case Encoding::Utf8:    return "utf-8";
        case Encoding::Ascii:   return "ascii";
        case Encoding::Latin1:  return "latin-1";
        case Encoding::Utf16LE: return "utf-16le";
        case Encoding::Utf16BE: return "utf-16be";
        case Encoding::Utf16:   return "utf-16";
    }
    return "utf-8";
}

// ── Decoder ─────────────────────────────────────────────────────

Decoder::Decoder(Encoding enc) : enc_(enc) {}

std::string Decoder::feed(const char* data, size_t len) {
    pending_.append(data, len);
    const auto* p = reinterpret_cast<const unsigned char*>(pending_.data());
    size_t n = pending_.size();
    std::string out;

    switch (enc_) {
        case Encoding::Utf8: {
            size_t i = 0;
            while (i < n) {
                int l = utf8_sequence(p + i, n - i);
                if (l < 0) {
                    throw DecodeError("invalid utf-8 byte " + hex_byte(p[i]) +
                                      " at offset " + std::to_string(offset_ + i));
                }
                if (l == 0) break;
                i += static_cast<size_t>(l);
            }
            out = pending_.substr(0, i);
            offset_ += i;
            pending_.erase(0, i);
            return out;
        }
        case Encoding::Ascii: {
            for (size_t i = 0; i < n; ++i) {
                if (p[i] >= 0x80) {
                    throw DecodeError("invalid ascii byte " + hex_byte(p[i]) +
                                      " at offset " + std::to_string(offset_ + i));
                }
            }
            out.swap(pending_);
            offset_ += n;
            return out;
        }
        case Encoding::Latin1: {
            out.reserve(n);
            for (size_t i = 0; i < n; ++i) append_utf8(out, p[i]);
            offset_ += n;
            pending_.clear();
            return out;
        }
        case Encoding::Utf16LE:
            return decode_utf16(false);
        case Encoding::Utf16BE:
            return decode_utf16(true);
        case Encoding::Utf16:
            if (!bom_checked_) {
                if (n < 2) return out;
                if (p[0] == 0xFE && p[1] == 0xFF) {
                    big_endian_ = true;
                    pending_.erase(0, 2);
                    offset_ += 2;
                } else if (p[0] == 0xFF && p[1] == 0xFE) {
                    pending_.erase(0, 2);
                    offset_ += 2;
                }
                bom_checked_ = true;
            }
            return decode_utf16(big_endian_);
    }
    return out;
}

std::string Decoder::decode_utf16(bool big_endian) {
    const auto* p = reinterpret_cast<const unsigned char*>(pending_.data());
    size_t n = pending_.size();
    auto unit_at = [&](size_t i) -> uint16_t {
        return big_endian ? static_cast<uint16_t>((p[i] << 8) | p[i + 1])
                          : static_cast<uint16_t>((p[i + 1] << 8) | p[i]);
    };

    std::string out;
    size_t i = 0;
    while (i + 2 <= n) {
        uint16_t u = unit_at(i);
        if (u >= 0xD800 && u <= 0xDBFF) {
            if (i + 4 > n) break;
            uint16_t low = unit_at(i + 2);
            if (low < 0xDC00 || low > 0xDFFF) {
                throw DecodeError("unpaired utf-16 surrogate at offset " +
                                  std::to_string(offset_ + i));
            }
            char32_t cp = 0x10000 + ((static_cast<char32_t>(u - 0xD800) << 10) |
                                     static_cast<char32_t>(low - 0xDC00));
            append_utf8(out, cp);
            i += 4;
        } else if (u >= 0xDC00 && u <= 0xDFFF) {
            throw DecodeError("unpaired utf-16 surrogate at offset " +
                              std::to_string(offset_ + i));
        } else {
            append_utf8(out, u);
            i += 2;
        }
    }
    offset_ += i;
    pending_.erase(0, i);
    return out;
}

std::string Decoder::finish() {
    if (!pending_.empty()) {
        throw DecodeError("truncated " + std::string(encoding_name(enc_)) +
                          " sequence at offset " + std::to_string(offset_));
    }
    return {};
}

std::string decode(const std::string& bytes, Encoding enc) {
    Decoder decoder(enc);
    std::string out = decoder.feed(bytes);
    out += decoder.finish();
    return out;
}

std::string encode(const std::string& text, Encoding enc) {
    if (enc == Encoding::Utf8) {
        // Validates; the bytes are already UTF-8
        return decode(text, Encoding::Utf8);
    }

    std::string out;
    out.reserve(enc == Encoding::Ascii || enc == Encoding::Latin1
                ? text.size() : text.size() * 2 + 2);
    bool big_endian = enc == Encoding::Utf16BE;
    if (enc == Encoding::Utf16) {
        out += '\xFF';
        out += '\xFE';
    }

    const auto* p = reinterpret_cast<const unsigned char*>(text.data());
    size_t n = text.size();
    size_t i = 0;
    while (i < n) {
        int l = utf8_sequence(p + i, n - i);
        if (l <= 0) {
            throw DecodeError("text is not valid utf-8 at offset " + std::to_string(i));
        }
        char32_t cp = utf8_code_point(p + i, l);
        switch (enc) {
            case Encoding::Ascii:
                if (cp >= 0x80) {
                    throw DecodeError("character " + code_point_label(cp) +
                                      " is not representable in ascii");
                }
                out += static_cast<char>(cp);
                break;
            case Encoding::Latin1:
                if (cp > 0xFF) {
                    throw DecodeError("character " + code_point_label(cp) +
                                      " is not representable in latin-1");
                }
                out += static_cast<char>(static_cast<unsigned char>(cp));
                break;
            default:
                append_utf16(out, cp, big_endian);
                break;
        }
        i += static_cast<size_t>(l);
    }
    return out;
}

// ── UTF-8 helpers ───────────────────────────────────────────────

size_t utf8_length(const std::string& s) {
    const auto* p = reinterpret_cast<const unsigned char*>(s.data());
    size_t n = s.size();
    size_t count = 0;
    size_t i = 0;
    while (i < n) {
        int l = utf8_sequence(p + i, n - i);
        i += l > 0 ? static_cast<size_t>(l) : 1;
        ++count;
    }
    return count;
}

std::u32string utf8_to_u32(const std::string& s) {
    const auto* p = reinterpret_cast<const unsigned char*>(s.data());
    size_t n = s.size();
    std::u32string out;
    out.reserve(n);
    size_t i = 0;
    while (i < n) {
        int l = utf8_sequence(p + i, n - i);
        if (l <= 0) {
            out += static_cast<char32_t>(0xFFFD);
            ++i;
        } else {
            out += utf8_code_point(p + i, l);
            i += static_cast<size_t>(l);
        }
    }
    return out;
}

std::string utf8_truncate(const std::string& s, size_t max_chars) {
    const auto* p = reinterpret_cast<const unsigned char*>(s.data());
    size_t n = s.size();
    size_t i = 0;
    for (size_t count = 0; count < max_chars && i < n; ++count) {
        int l = utf8_sequence(p + i, n - i);
        i += l > 0 ? static_cast<size_t>(l) : 1;
    }
    return s.substr(0, i);
}

size_t utf8_char_offset(const std::string& s, size_t byte_pos) {
    return utf8_length(s.substr(0, byte_pos));
}

// ── Detection ───────────────────────────────────────────────────

EncodingGuess BomEncodingDetector::detect(const std::string& sample) {
    if (sample.empty()) return {};

    const auto* p = reinterpret_cast<const unsigned char*>(sample.data());
    size_t n = sample.size();

    if (n >= 3 && p[0] == 0xEF && p[1] == 0xBB && p[2] == 0xBF) return {"utf-8", 1.0};
    if (n >= 2 && ((p[0] == 0xFF && p[1] == 0xFE) || (p[0] == 0xFE && p[1] == 0xFF)))
        return {"utf-16", 1.0};

    size_t even_nuls = 0;
    size_t odd_nuls = 0;
    bool ascii = true;
    for (size_t i = 0; i < n; ++i) {
        if (p[i] == 0) {
            if (i % 2 == 0) ++even_nuls; else ++odd_nuls;
        }
        if (p[i] >= 0x80) ascii = false;
    }

    // Interleaved NULs: UTF-16 text without a BOM
    if (even_nuls + odd_nuls > 0) {
        if (odd_nuls > n / 4 && even_nuls == 0) return {"utf-16le", 0.8};
        if (even_nuls > n / 4 && odd_nuls == 0) return {"utf-16be", 0.8};
        return {};
    }
    if (ascii) return {"ascii", 1.0};

    // The sample may end mid-sequence; a valid prefix still counts
    size_t i = 0;
    while (i < n) {
        int l = utf8_sequence(p + i, n - i);
        if (l < 0) return {"latin-1", 0.73};
        if (l == 0) break;
        i += static_cast<size_t>(l);
    }
    return {"utf-8", 0.99};
}

std::string resolve_encoding(EncodingDetector* detector, const std::string& sample) {
    if (!detector || sample.empty()) return kDefaultEncoding;

    EncodingGuess guess;
    try {
        guess = detector->detect(sample);
    } catch (const std::exception& e) {
        std::cerr << "[encoding] Detector failed, using " << kDefaultEncoding
                  << ": " << e.what() << "\n";
        return kDefaultEncoding;
    }

    if (guess.confidence < kEncodingConfidenceThreshold) return kDefaultEncoding;
    auto enc = parse_encoding(guess.name);
    if (!enc) return kDefaultEncoding;
    if (*enc == Encoding::Ascii) return kDefaultEncoding;
    return encoding_name(*enc);
}

std::string detect_file_encoding(const std::string& path, EncodingDetector* detector) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return kDefaultEncoding;

    std::string sample(kEncodingSampleSize, '\0');
    file.read(&sample[0], static_cast<std::streamsize>(sample.size()));
    sample.resize(static_cast<size_t>(file.gcount()));
    return resolve_encoding(detector, sample);
}

} // namespace largefile
