/**
 * @file types.hpp
 * @brief Базовые типы и константы тренажёра Linkage
 *
 * Этот файл содержит фундаментальные типы, используемые во всём движке:
 * символы, слова, попадания (Hit) и коды результатов операций.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace linkage {

// ===========================================================================
// Константы
// ===========================================================================

/// Ширина строки (в символах) по умолчанию
inline constexpr std::size_t kCharsPerLine = 40;

/// Минимально допустимая ширина строки
inline constexpr std::size_t kMinCharsPerLine = 16;

/// Максимальная ширина строки
inline constexpr std::size_t kMaxCharsPerLine = 512;

/// Максимум ошибок на одну цель (буфер ошибок вмещает kMaxErrors - 1)
inline constexpr std::size_t kMaxErrors = 4;

/// Глубина буфера следующих строк
inline constexpr std::size_t kNextLines = 2;

/// Порог запаса внедрённых слов, ниже которого запрашиваем новую порцию
inline constexpr std::size_t kRefillThreshold = 8;

/// Размер порции слов в запросе
inline constexpr std::size_t kWordBatch = 16;

/// Доля чистых нажатий, ниже которой буква считается слабой
inline constexpr double kMinCleanPct = 0.9;

/// Сколько слабых букв подмешивать в запрос слов
inline constexpr std::size_t kFocusLetters = 3;

/// Максимальная длина слова корпуса (в кодовых точках)
inline constexpr std::size_t kMaxCorpusWordLen = 16;

/// Путь к системному конфигурационному файлу
inline constexpr std::string_view kConfigPath = "/etc/linkage/config.yaml";

/// Путь к пользовательскому конфигу (относительно $HOME)
inline constexpr std::string_view kUserConfigRelPath =
    ".config/linkage/config.yaml";

/// Частотный словарь по умолчанию
inline constexpr std::string_view kCorpusPath = "/usr/share/linkage/freq.txt";

/// Хранилище профилей (относительно $HOME)
inline constexpr std::string_view kProfilesRelPath =
    ".local/share/linkage/profiles.txt";

// ===========================================================================
// Символы и слова
// ===========================================================================

/// Символ — кодовая точка Unicode
using Char = char32_t;

/// Слово или строка тренировки
using Word = std::u32string;

/// Результат одного нажатия по цели
struct Hit {
  Char target = 0;
  bool dirty = false; // была хотя бы одна ошибка перед верным нажатием

  constexpr bool operator==(const Hit &) const noexcept = default;
};

/// Запрос новой порции слов (с упором на слабые буквы)
struct WordRequest {
  std::size_t count = 0;
  std::vector<Char> focus;
};

// ===========================================================================
// Типы результатов операций
// ===========================================================================

/// Результат парсинга конфигурации
enum class ConfigResult { Ok, FileNotFound, ParseError, InvalidValue };

/// Результат загрузки данных (корпус, профили)
enum class LoadResult { Ok, IoError, UnsupportedVersion };

/// Результат записи данных
enum class StorageResult { Ok, IoError };

// ===========================================================================
// Inline утилиты
// ===========================================================================

/// Символ слова: ASCII буквы/цифры, латиница U+00C0-U+024F, кириллица
[[nodiscard]] constexpr bool is_word_char(Char c) noexcept {
  if ((c >= U'a' && c <= U'z') || (c >= U'A' && c <= U'Z') ||
      (c >= U'0' && c <= U'9')) {
    return true;
  }
  if (c >= 0x00C0 && c <= 0x024F) {
    return c != 0x00D7 && c != 0x00F7; // × и ÷
  }
  return c >= 0x0400 && c <= 0x04FF;
}

/// Символ, который принимает сессия (всё остальное игнорируется)
[[nodiscard]] constexpr bool is_typable(Char c) noexcept {
  return c == U' ' || is_word_char(c);
}

} // namespace linkage
