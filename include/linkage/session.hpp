/**
 * @file session.hpp
 * @brief Посимвольная машина состояний тренировки
 *
 * Состояние — пара (очередь целей, буфер ошибок) для активной строки.
 * Голова очереди — активная цель. Верное нажатие фиксирует Hit и двигает
 * очередь; неверное попадает в буфер ошибок (ограниченный, лишнее молча
 * отбрасывается). Backspace откатывает только ещё не исправленные ошибки,
 * зафиксированные Hit никогда не отзываются.
 *
 * Все операции тотальны: мусорный ввод — это no-op, а не ошибка.
 */

#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <optional>
#include <span>
#include <variant>
#include <vector>

#include "linkage/text_feed.hpp"
#include "linkage/types.hpp"
#include "linkage/word_source.hpp"

namespace linkage {

/// Строка ещё набирается
struct LineInProgress {};

/// Строка завершена: полный протокол попаданий для трекера
struct CompletedLine {
  Word text;
  std::vector<Hit> hits;
};

/// Итог одного нажатия
using LineStep = std::variant<LineInProgress, CompletedLine>;

/// Параметры сессии
struct SessionOptions {
  std::size_t chars_per_line = kCharsPerLine;
  std::size_t max_errors = kMaxErrors;
  std::size_t next_lines = kNextLines;
  bool score_line_end = false;
};

class Session {
public:
  /**
   * @brief Создаёт сессию и сразу загружает первую строку
   * @param source Общий источник слов
   * @param options Геометрия строки и лимит ошибок
   */
  Session(std::shared_ptr<WordSource> source, SessionOptions options);

  /**
   * @brief Применяет символ к активной цели
   * @param c Введённый символ (не буква/цифра/пробел — игнорируется)
   * @return CompletedLine, если этим нажатием строка закончена
   *
   * После завершения сессия сама загружает следующую строку из буфера.
   */
  LineStep apply_char(Char c);

  /**
   * @brief Снимает последнюю неисправленную ошибку
   *
   * На пустом буфере — no-op.
   */
  void backspace() noexcept;

  /// Держит буфер следующих строк заполненным
  void fill_next_lines();

  /// Внедряет слова (запрос трекера) в очередь сборки строк
  void update_words(std::vector<Word> words);

  /**
   * @brief Бросает активную строку и загружает следующую
   *
   * Попадания брошенной строки не оцениваются.
   */
  void reset();

  // =========================================================================
  // Снимки для отрисовки
  // =========================================================================

  /// Зафиксированные попадания текущей строки
  [[nodiscard]] std::span<const Hit> hits() const noexcept { return hits_; }

  /// Неисправленные ошибки по активной цели
  [[nodiscard]] std::span<const Char> errors() const noexcept {
    return errors_;
  }

  /// Активная цель (голова очереди)
  [[nodiscard]] std::optional<Char> active_target() const noexcept;

  /// Все ещё не набранные цели, включая активную
  [[nodiscard]] const std::deque<Char> &targets() const noexcept {
    return targets_;
  }

  /// Полный текст активной строки
  [[nodiscard]] const Word &line() const noexcept { return line_; }

  [[nodiscard]] const std::deque<Word> &next_lines() const noexcept {
    return feed_.next_lines();
  }

  /// Запас внедрённых слов в TextFeed
  [[nodiscard]] std::size_t pending_words() const noexcept {
    return feed_.pending_words();
  }

  /// Вместимость буфера ошибок (max_errors - 1)
  [[nodiscard]] std::size_t error_capacity() const noexcept {
    return options_.max_errors - 1;
  }

  [[nodiscard]] const SessionOptions &options() const noexcept {
    return options_;
  }

private:
  void load_line(Word line);

  SessionOptions options_;
  TextFeed feed_;

  Word line_;
  std::vector<Hit> hits_;
  std::vector<Char> errors_;
  std::deque<Char> targets_;

  // Была ли ошибка по активной цели (даже стёртая или отброшенная)
  bool missed_ = false;
};

} // namespace linkage
