#include "logmux/vis_decoder.hpp"

#include <cstdint>

namespace Logmux {

namespace {
constexpr uint8_t kBackslash = 0x5c;
constexpr uint8_t kM = 0x4d;
constexpr uint8_t kDash = 0x2d;
constexpr uint8_t kCaret = 0x5e;

bool is_digit(uint8_t byte) { return byte >= '0' && byte <= '9'; }

uint8_t decode_octal(uint8_t x, uint8_t y, uint8_t z) {
  return static_cast<uint8_t>((x & 0x3) << 6 | (y & 0x7) << 3 | (z & 0x7));
}
} // namespace

bool is_valid_utf8(std::string_view bytes) {
  size_t i = 0;
  const size_t n = bytes.size();
  while (i < n) {
    const auto lead = static_cast<uint8_t>(bytes[i]);
    if (lead < 0x80) {
      ++i;
      continue;
    }

    size_t length;
    uint32_t code_point;
    if ((lead & 0xe0) == 0xc0) {
      length = 2;
      code_point = lead & 0x1f;
    } else if ((lead & 0xf0) == 0xe0) {
      length = 3;
      code_point = lead & 0x0f;
    } else if ((lead & 0xf8) == 0xf0) {
      length = 4;
      code_point = lead & 0x07;
    } else {
      return false;
    }
    if (i + length > n) {
      return false;
    }
    for (size_t k = 1; k < length; ++k) {
      const auto cont = static_cast<uint8_t>(bytes[i + k]);
      if ((cont & 0xc0) != 0x80) {
        return false;
      }
      code_point = (code_point << 6) | (cont & 0x3f);
    }

    // Overlong encodings.
    if ((length == 2 && code_point < 0x80) ||
        (length == 3 && code_point < 0x800) ||
        (length == 4 && code_point < 0x10000)) {
      return false;
    }
    if (code_point > 0x10ffff ||
        (code_point >= 0xd800 && code_point <= 0xdfff)) {
      return false;
    }
    i += length;
  }
  return true;
}

std::string decode_syslog(std::string_view line) {
  const size_t n = line.size();
  std::string out;
  out.reserve(n);

  auto byte_at = [&](size_t index) { return static_cast<uint8_t>(line[index]); };

  for (size_t i = 0; i < n;) {
    if (byte_at(i) != kBackslash || i + 4 > n) {
      out.push_back(line[i++]);
      continue;
    }

    const uint8_t b1 = byte_at(i + 1);
    const uint8_t b2 = byte_at(i + 2);
    const uint8_t b3 = byte_at(i + 3);
    if (b1 == kM && b2 == kCaret) {
      // \M^x: 0x80 to 0x9f.
      out.push_back(static_cast<char>((b3 & 0x7f) + 0x40));
    } else if (b1 == kM && b2 == kDash) {
      // \M-x: 0xa1 to 0xf7.
      out.push_back(static_cast<char>(b3 | 0x80));
    } else if (is_digit(b1) && is_digit(b2) && is_digit(b3)) {
      out.push_back(static_cast<char>(decode_octal(b1, b2, b3)));
    } else {
      out.append(line.substr(i, 4));
    }
    i += 4;
  }

  if (!is_valid_utf8(out)) {
    return std::string(line);
  }
  return out;
}

} // namespace Logmux
