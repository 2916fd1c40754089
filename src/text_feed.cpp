/**
 * @file text_feed.cpp
 * @brief Реализация сборки строк
 */

#include "linkage/text_feed.hpp"

#include <algorithm>
#include <utility>

namespace linkage {

TextFeed::TextFeed(std::shared_ptr<WordSource> source,
                   std::size_t chars_per_line, std::size_t min_depth)
    : source_{std::move(source)},
      chars_per_line_{std::max(chars_per_line, kMinCharsPerLine)},
      min_depth_{std::max<std::size_t>(min_depth, 1U)} {
  if (!source_) {
    source_ = std::make_shared<WordSource>();
  }
}

void TextFeed::fill_next_lines(std::size_t min_depth) {
  while (next_lines_.size() < min_depth) {
    next_lines_.push_back(assemble_line());
  }
}

void TextFeed::update_words(std::vector<Word> words) {
  for (auto &w : words) {
    // Пустые и непечатаемые слова в строку не попадут
    if (w.empty() || !std::all_of(w.begin(), w.end(), is_word_char)) {
      continue;
    }
    pending_.push_back(std::move(w));
  }
}

Word TextFeed::advance_line() {
  fill_next_lines(min_depth_);
  Word line = std::move(next_lines_.front());
  next_lines_.pop_front();
  fill_next_lines(min_depth_);
  return line;
}

Word TextFeed::take_word() {
  if (carry_) {
    Word w = std::move(*carry_);
    carry_.reset();
    return w;
  }
  if (!pending_.empty()) {
    Word w = std::move(pending_.front());
    pending_.pop_front();
    return w;
  }
  return source_->random_word();
}

Word TextFeed::assemble_line() {
  Word line;

  for (;;) {
    Word word = take_word();

    // Слово длиннее всей строки никуда не поместится
    if (word.size() > chars_per_line_) {
      continue;
    }

    if (line.empty()) {
      line = std::move(word);
      continue;
    }

    if (line.size() + 1 + word.size() <= chars_per_line_) {
      line.push_back(U' ');
      line += word;
      continue;
    }

    // Не влезло — слово начнёт следующую строку
    carry_ = std::move(word);
    break;
  }

  return line;
}

} // namespace linkage
