#pragma once

#include <string>
#include <string_view>

namespace Logmux {

/**
 * @brief Decodes a vis(3)-encoded system log line back to UTF-8.
 *
 * The device system log is 7-bit clean. Bytes outside the printable range
 * are written as escapes:
 * - 0x5c (backslash) and 0xa0 as an octal triplet: \134, \240.
 * - 0x80 to 0x9f as \M^x, using control-character notation for 0x00-0x40.
 * - 0xa1 to 0xf7 as \M-x, x being the byte with its high bit stripped.
 *
 * A backslash within the last three bytes of the line, or followed by
 * anything else, is copied through unchanged. If the decoded bytes are not
 * valid UTF-8 the original line is returned as-is.
 */
std::string decode_syslog(std::string_view line);

/**
 * @brief Strict UTF-8 validation: rejects overlong forms, surrogates and
 * code points above U+10FFFF.
 */
bool is_valid_utf8(std::string_view bytes);

} // namespace Logmux
