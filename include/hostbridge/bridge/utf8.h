#pragma once

/**
 * UTF-8 <-> host string conversion.
 *
 * Host strings are UTF-16 (std::u16string) so code points above U+FFFF
 * travel as surrogate pairs and must be combined/split on the way through.
 */

#include <cstddef>
#include <cstdint>
#include <string>

namespace hostbridge {
namespace bridge {

/**
 * Decode at most maxBytes of UTF-8. Stops early at a NUL byte.
 * Code points above U+FFFF become surrogate pairs.
 */
std::u16string decodeUtf8(const uint8_t* bytes, size_t maxBytes);

/**
 * Encode into a caller-provided buffer of maxBytes.
 * A character that does not fit entirely is dropped along with the rest
 * of the string. Returns the number of bytes written (no terminator).
 */
size_t encodeUtf8(const std::u16string& str, uint8_t* out, size_t maxBytes);

/**
 * Encoded UTF-8 length of a host string.
 */
size_t utf8Length(const std::u16string& str);

std::u16string fromUtf8(const std::string& utf8);
std::string toUtf8(const std::u16string& str);

}  // namespace bridge
}  // namespace hostbridge
