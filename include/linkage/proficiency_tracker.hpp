/**
 * @file proficiency_tracker.hpp
 * @brief Статистика чистоты набора по каждому символу
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <utility>
#include <vector>

#include "linkage/session.hpp"
#include "linkage/types.hpp"

namespace linkage {

/// Счётчики одного символа
struct LetterStat {
  std::uint64_t clean = 0;
  std::uint64_t dirty = 0;

  /// clean / (clean + dirty); без данных — нейтральная 1.0
  [[nodiscard]] double ratio() const noexcept {
    const std::uint64_t total = clean + dirty;
    if (total == 0) {
      return 1.0;
    }
    return static_cast<double>(clean) / static_cast<double>(total);
  }

  constexpr bool operator==(const LetterStat &) const noexcept = default;
};

/// Параметры дозапроса слов
struct TrackerOptions {
  std::size_t refill_threshold = kRefillThreshold;
  std::size_t word_batch = kWordBatch;
  double min_clean = kMinCleanPct;
  std::size_t focus_letters = kFocusLetters;
};

class ProficiencyTracker {
public:
  explicit ProficiencyTracker(TrackerOptions options = {});

  /**
   * @brief Учитывает завершённую строку
   * @param line Протокол попаданий строки
   * @param inventory Сколько внедрённых слов ещё ждёт сборки
   * @return Запрос слов, если запас ниже порога
   */
  [[nodiscard]] std::optional<WordRequest>
  add_line(const CompletedLine &line, std::size_t inventory);

  /**
   * @brief Доля чистых нажатий по символам
   * @return Пары (символ, доля), по возрастанию кода символа
   */
  [[nodiscard]] std::vector<std::pair<Char, double>> clean_letters() const;

  /**
   * @brief Слабые символы слов (доля < min_clean)
   * @param limit Максимум символов в ответе
   * @return Сначала самые слабые, при равенстве — по коду
   */
  [[nodiscard]] std::vector<Char> weak_letters(std::size_t limit) const;

  [[nodiscard]] LetterStat stat(Char c) const;

  [[nodiscard]] const std::map<Char, LetterStat> &stats() const noexcept {
    return stats_;
  }

  /// Восстановление из хранилища
  void set_stat(Char c, LetterStat stat);

  [[nodiscard]] std::uint64_t lines_completed() const noexcept {
    return lines_completed_;
  }

  [[nodiscard]] const TrackerOptions &options() const noexcept {
    return options_;
  }

private:
  TrackerOptions options_;
  std::map<Char, LetterStat> stats_;
  std::uint64_t lines_completed_ = 0;
};

} // namespace linkage
