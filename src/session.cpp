/**
 * @file session.cpp
 * @brief Реализация машины состояний тренировки
 */

#include "linkage/session.hpp"

#include <algorithm>
#include <utility>

namespace linkage {

namespace {

SessionOptions sanitize(SessionOptions options) {
  options.max_errors = std::max<std::size_t>(options.max_errors, 1U);
  options.next_lines = std::max<std::size_t>(options.next_lines, 1U);
  options.chars_per_line = std::max(options.chars_per_line, kMinCharsPerLine);
  return options;
}

} // namespace

Session::Session(std::shared_ptr<WordSource> source, SessionOptions options)
    : options_{sanitize(options)},
      feed_{std::move(source), options_.chars_per_line, options_.next_lines} {
  load_line(feed_.advance_line());
}

std::optional<Char> Session::active_target() const noexcept {
  if (targets_.empty()) {
    return std::nullopt;
  }
  return targets_.front();
}

LineStep Session::apply_char(Char c) {
  if (!is_typable(c)) {
    return LineInProgress{};
  }

  // Пустая очередь возможна только у строки без целей
  if (targets_.empty()) {
    load_line(feed_.advance_line());
    if (targets_.empty()) {
      return LineInProgress{};
    }
  }

  if (c != targets_.front()) {
    missed_ = true;
    if (errors_.size() < error_capacity()) {
      errors_.push_back(c);
    }
    return LineInProgress{};
  }

  hits_.push_back(Hit{c, missed_ || !errors_.empty()});
  errors_.clear();
  missed_ = false;
  targets_.pop_front();

  if (!targets_.empty()) {
    return LineInProgress{};
  }

  CompletedLine done{std::move(line_), std::move(hits_)};
  load_line(feed_.advance_line());
  return done;
}

void Session::backspace() noexcept {
  if (!errors_.empty()) {
    errors_.pop_back();
  }
}

void Session::fill_next_lines() { feed_.fill_next_lines(); }

void Session::update_words(std::vector<Word> words) {
  feed_.update_words(std::move(words));
}

void Session::reset() { load_line(feed_.advance_line()); }

void Session::load_line(Word line) {
  line_ = std::move(line);
  hits_.clear();
  errors_.clear();
  missed_ = false;

  targets_.assign(line_.begin(), line_.end());
  if (options_.score_line_end) {
    targets_.push_back(U' ');
  }
}

} // namespace linkage
