/**
 * @file utf8.cpp
 * @brief Реализация UTF-8 утилит
 */

#include "linkage/utf8.hpp"

namespace linkage {

bool decode_utf8_char(std::string_view bytes, Char &out) noexcept {
  if (bytes.empty()) {
    return false;
  }

  const auto b0 = static_cast<unsigned char>(bytes[0]);
  const std::size_t len = utf8_char_len(b0);
  if (len == 0 || len != bytes.size()) {
    return false;
  }

  if (len == 1) {
    out = b0;
    return true;
  }

  // Полезные биты первого байта: 5 (2-байтовый), 4 (3-байтовый), 3 (4-байтовый)
  Char cp = b0 & (0x7F >> len);
  for (std::size_t i = 1; i < len; ++i) {
    const auto b = static_cast<unsigned char>(bytes[i]);
    if ((b & 0xC0) != 0x80) {
      return false;
    }
    cp = (cp << 6) | (b & 0x3F);
  }

  // Отсекаем overlong-последовательности, суррогаты и выход за U+10FFFF
  static constexpr Char kMinForLen[] = {0, 0, 0x80, 0x800, 0x10000};
  if (cp < kMinForLen[len] || cp > 0x10FFFF ||
      (cp >= 0xD800 && cp <= 0xDFFF)) {
    return false;
  }

  out = cp;
  return true;
}

Word decode_utf8(std::string_view text) {
  Word result;
  result.reserve(text.size());

  std::size_t i = 0;
  while (i < text.size()) {
    auto len = utf8_char_len(static_cast<unsigned char>(text[i]));
    if (len == 0 || i + len > text.size()) {
      ++i;
      continue;
    }

    Char c = 0;
    if (decode_utf8_char(text.substr(i, len), c)) {
      result.push_back(c);
      i += len;
    } else {
      ++i;
    }
  }

  return result;
}

std::string encode_utf8(Char c) {
  std::string out;
  if (c < 0x80) {
    out += static_cast<char>(c);
  } else if (c < 0x800) {
    out += static_cast<char>(0xC0 | (c >> 6));
    out += static_cast<char>(0x80 | (c & 0x3F));
  } else if (c < 0x10000) {
    out += static_cast<char>(0xE0 | (c >> 12));
    out += static_cast<char>(0x80 | ((c >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (c & 0x3F));
  } else if (c <= 0x10FFFF) {
    out += static_cast<char>(0xF0 | (c >> 18));
    out += static_cast<char>(0x80 | ((c >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((c >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (c & 0x3F));
  }
  return out;
}

std::string encode_utf8(std::u32string_view text) {
  std::string out;
  out.reserve(text.size());
  for (Char c : text) {
    out += encode_utf8(c);
  }
  return out;
}

} // namespace linkage
