/**
 * @file proficiency_tracker.cpp
 * @brief Реализация трекера чистоты набора
 */

#include "linkage/proficiency_tracker.hpp"

#include <algorithm>

namespace linkage {

ProficiencyTracker::ProficiencyTracker(TrackerOptions options)
    : options_{options} {}

std::optional<WordRequest>
ProficiencyTracker::add_line(const CompletedLine &line, std::size_t inventory) {
  for (const Hit &hit : line.hits) {
    LetterStat &s = stats_[hit.target];
    if (hit.dirty) {
      ++s.dirty;
    } else {
      ++s.clean;
    }
  }
  ++lines_completed_;

  if (inventory >= options_.refill_threshold) {
    return std::nullopt;
  }

  WordRequest request;
  request.count = options_.word_batch;
  request.focus = weak_letters(options_.focus_letters);
  return request;
}

std::vector<std::pair<Char, double>> ProficiencyTracker::clean_letters() const {
  std::vector<std::pair<Char, double>> out;
  out.reserve(stats_.size());
  // std::map уже упорядочен по коду символа
  for (const auto &[c, s] : stats_) {
    out.emplace_back(c, s.ratio());
  }
  return out;
}

std::vector<Char> ProficiencyTracker::weak_letters(std::size_t limit) const {
  std::vector<std::pair<double, Char>> weak;
  for (const auto &[c, s] : stats_) {
    if (!is_word_char(c)) {
      continue;
    }
    const double r = s.ratio();
    if (r < options_.min_clean) {
      weak.emplace_back(r, c);
    }
  }

  std::sort(weak.begin(), weak.end());

  std::vector<Char> out;
  for (std::size_t i = 0; i < weak.size() && i < limit; ++i) {
    out.push_back(weak[i].second);
  }
  return out;
}

LetterStat ProficiencyTracker::stat(Char c) const {
  auto it = stats_.find(c);
  return it != stats_.end() ? it->second : LetterStat{};
}

void ProficiencyTracker::set_stat(Char c, LetterStat stat) {
  stats_[c] = stat;
}

} // namespace linkage
