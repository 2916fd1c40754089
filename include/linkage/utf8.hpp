/**
 * @file utf8.hpp
 * @brief UTF-8 утилиты: перевод между внешним текстом и кодовыми точками
 *
 * Невалидные байты пропускаются, декодирование никогда не падает.
 */

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "linkage/types.hpp"

namespace linkage {

/**
 * @brief Определяет длину UTF-8 символа по первому байту
 * @param first_byte Первый байт UTF-8 последовательности
 * @return Длина в байтах (1-4), или 0 для невалидного байта
 */
[[nodiscard]] constexpr std::size_t
utf8_char_len(unsigned char first_byte) noexcept {
  if ((first_byte & 0x80) == 0)
    return 1; // ASCII
  if ((first_byte & 0xE0) == 0xC0)
    return 2; // 110xxxxx
  if ((first_byte & 0xF0) == 0xE0)
    return 3; // 1110xxxx
  if ((first_byte & 0xF8) == 0xF0)
    return 4; // 11110xxx
  return 0;   // Invalid
}

/**
 * @brief Декодирует один символ из последовательности байт
 * @param bytes Полная последовательность (длина = utf8_char_len)
 * @param out Кодовая точка
 * @return true если последовательность корректна
 */
[[nodiscard]] bool decode_utf8_char(std::string_view bytes, Char &out) noexcept;

/**
 * @brief Декодирует UTF-8 строку в кодовые точки
 * @param text UTF-8 строка
 * @return Строка кодовых точек (невалидные байты пропущены)
 */
[[nodiscard]] Word decode_utf8(std::string_view text);

/// Кодирует одну кодовую точку в UTF-8
[[nodiscard]] std::string encode_utf8(Char c);

/// Кодирует строку кодовых точек в UTF-8
[[nodiscard]] std::string encode_utf8(std::u32string_view text);

} // namespace linkage
