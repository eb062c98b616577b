#include "hostbridge/bridge/utf8.h"
#include <iostream>

namespace hostbridge {
namespace bridge {

namespace {

// Next code point from a UTF-16 string, combining surrogate pairs.
// Unpaired surrogates are replaced with U+FFFD.
uint32_t nextCodePoint(const std::u16string& str, size_t& i) {
    uint32_t c = str[i++];
    if (c >= 0xD800 && c <= 0xDBFF) {
        if (i < str.size()) {
            uint32_t low = str[i];
            if (low >= 0xDC00 && low <= 0xDFFF) {
                i++;
                return 0x10000 + ((c & 0x3FF) << 10) + (low & 0x3FF);
            }
        }
        return 0xFFFD;
    }
    if (c >= 0xDC00 && c <= 0xDFFF) {
        return 0xFFFD;
    }
    return c;
}

size_t encodedSize(uint32_t cp) {
    if (cp <= 0x7F) return 1;
    if (cp <= 0x7FF) return 2;
    if (cp <= 0xFFFF) return 3;
    return 4;
}

}  // namespace

std::u16string decodeUtf8(const uint8_t* bytes, size_t maxBytes) {
    std::u16string out;
    if (!bytes) return out;

    size_t i = 0;
    while (i < maxBytes) {
        uint32_t b0 = bytes[i++];
        if (b0 == 0) break;

        if (!(b0 & 0x80)) {
            out.push_back(static_cast<char16_t>(b0));
            continue;
        }

        uint32_t b1 = i < maxBytes ? (bytes[i++] & 0x3F) : 0;
        if ((b0 & 0xE0) == 0xC0) {
            out.push_back(static_cast<char16_t>(((b0 & 0x1F) << 6) | b1));
            continue;
        }

        uint32_t b2 = i < maxBytes ? (bytes[i++] & 0x3F) : 0;
        uint32_t cp;
        if ((b0 & 0xF0) == 0xE0) {
            cp = ((b0 & 0x0F) << 12) | (b1 << 6) | b2;
        } else {
            if ((b0 & 0xF8) != 0xF0) {
                std::cerr << "[UTF8] Invalid UTF-8 leading byte 0x" << std::hex << b0 << std::dec
                          << " encountered while decoding guest string" << std::endl;
            }
            uint32_t b3 = i < maxBytes ? (bytes[i++] & 0x3F) : 0;
            cp = ((b0 & 0x07) << 18) | (b1 << 12) | (b2 << 6) | b3;
        }

        if (cp < 0x10000) {
            out.push_back(static_cast<char16_t>(cp));
        } else {
            uint32_t c = cp - 0x10000;
            out.push_back(static_cast<char16_t>(0xD800 | (c >> 10)));
            out.push_back(static_cast<char16_t>(0xDC00 | (c & 0x3FF)));
        }
    }
    return out;
}

size_t encodeUtf8(const std::u16string& str, uint8_t* out, size_t maxBytes) {
    size_t n = 0;
    size_t i = 0;
    while (i < str.size()) {
        uint32_t cp = nextCodePoint(str, i);
        size_t need = encodedSize(cp);
        if (n + need > maxBytes) break;

        if (need == 1) {
            out[n++] = static_cast<uint8_t>(cp);
        } else if (need == 2) {
            out[n++] = static_cast<uint8_t>(0xC0 | (cp >> 6));
            out[n++] = static_cast<uint8_t>(0x80 | (cp & 0x3F));
        } else if (need == 3) {
            out[n++] = static_cast<uint8_t>(0xE0 | (cp >> 12));
            out[n++] = static_cast<uint8_t>(0x80 | ((cp >> 6) & 0x3F));
            out[n++] = static_cast<uint8_t>(0x80 | (cp & 0x3F));
        } else {
            out[n++] = static_cast<uint8_t>(0xF0 | (cp >> 18));
            out[n++] = static_cast<uint8_t>(0x80 | ((cp >> 12) & 0x3F));
            out[n++] = static_cast<uint8_t>(0x80 | ((cp >> 6) & 0x3F));
            out[n++] = static_cast<uint8_t>(0x80 | (cp & 0x3F));
        }
    }
    return n;
}

size_t utf8Length(const std::u16string& str) {
    size_t n = 0;
    size_t i = 0;
    while (i < str.size()) {
        n += encodedSize(nextCodePoint(str, i));
    }
    return n;
}

std::u16string fromUtf8(const std::string& utf8) {
    return decodeUtf8(reinterpret_cast<const uint8_t*>(utf8.data()), utf8.size());
}

std::string toUtf8(const std::u16string& str) {
    std::string out(utf8Length(str), '\0');
    size_t written = encodeUtf8(str, reinterpret_cast<uint8_t*>(&out[0]), out.size());
    out.resize(written);
    return out;
}

}  // namespace bridge
}  // namespace hostbridge
