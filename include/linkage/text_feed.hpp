/**
 * @file text_feed.hpp
 * @brief Сборка строк тренировки из слов и буфер следующих строк
 *
 * Слова упаковываются слева направо жадно: слово, которое не помещается
 * в бюджет колонок, начинает следующую строку.
 */

#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <optional>
#include <vector>

#include "linkage/types.hpp"
#include "linkage/word_source.hpp"

namespace linkage {

class TextFeed {
public:
  /**
   * @brief Конструктор
   * @param source Общий источник слов (не может быть nullptr)
   * @param chars_per_line Бюджет колонок строки
   * @param min_depth Минимальная глубина буфера следующих строк
   */
  TextFeed(std::shared_ptr<WordSource> source, std::size_t chars_per_line,
           std::size_t min_depth);

  /**
   * @brief Дособирает строки, пока в буфере меньше min_depth
   *
   * Идемпотентна, если глубина уже достаточна.
   */
  void fill_next_lines(std::size_t min_depth);

  /// Дособирает строки до глубины, заданной в конструкторе
  void fill_next_lines() { fill_next_lines(min_depth_); }

  /**
   * @brief Ставит внешнюю порцию слов в очередь сборки
   *
   * Эти слова идут раньше свежей выборки из WordSource.
   */
  void update_words(std::vector<Word> words);

  /**
   * @brief Снимает следующую строку из буфера и дозаполняет буфер
   */
  [[nodiscard]] Word advance_line();

  [[nodiscard]] const std::deque<Word> &next_lines() const noexcept {
    return next_lines_;
  }

  /// Запас внедрённых, ещё не уложенных в строки слов
  [[nodiscard]] std::size_t pending_words() const noexcept {
    return pending_.size();
  }

  [[nodiscard]] std::size_t chars_per_line() const noexcept {
    return chars_per_line_;
  }

  [[nodiscard]] std::size_t min_depth() const noexcept { return min_depth_; }

private:
  /// Следующее слово: перенос, затем внедрённые, затем выборка
  [[nodiscard]] Word take_word();

  /// Собирает одну строку
  [[nodiscard]] Word assemble_line();

  std::shared_ptr<WordSource> source_;
  std::size_t chars_per_line_;
  std::size_t min_depth_;

  std::deque<Word> pending_;

  // Слово, не влезшее в предыдущую строку
  std::optional<Word> carry_;
  std::deque<Word> next_lines_;
};

} // namespace linkage
