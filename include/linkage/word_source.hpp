/**
 * @file word_source.hpp
 * @brief Частотный словарь: случайная выборка слов пропорционально весу
 *
 * Формат корпуса (v1, UTF-8):
 *   #!linkage-freq 1        -- необязательный заголовок версии
 *   # комментарий
 *   the 23135851162         -- слово и неотрицательный вес
 *
 * Кривые записи пропускаются. Если нет ни одного положительного веса,
 * источник считается пустым и выдаёт слова встроенного запасного словаря.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

#include "linkage/types.hpp"

namespace linkage {

/// Слово корпуса с весом
struct WeightedWord {
  Word word;
  double weight = 0.0;
};

/// Параметры загрузки корпуса
struct CorpusOptions {
  bool spellcheck = false;
  std::uint64_t seed = 0; // 0 = std::random_device
};

class WordSource;

/// Результат загрузки корпуса (без скрытых фолбэков)
struct WordSourceLoadOutcome;

/**
 * @brief Источник слов с выборкой по частоте
 *
 * Единственный владелец — движок; random_word() меняет состояние ГСЧ,
 * поэтому объект не потокобезопасен.
 */
class WordSource {
public:
  /// Пустая таблица, активен запасной словарь
  WordSource();

  /**
   * @brief Строит источник из готовой таблицы
   * @param entries Слова с весами (нулевые веса допустимы, но не выпадают;
   *                слова длиннее kMaxCorpusWordLen и с небуквенными
   *                символами отбрасываются)
   * @param seed Зерно ГСЧ (0 = std::random_device)
   */
  explicit WordSource(std::vector<WeightedWord> entries,
                      std::uint64_t seed = 0);

  /**
   * @brief Загружает корпус из файла
   * @return Outcome с кодом результата; при ошибке source = WordSource{}
   */
  [[nodiscard]] static WordSourceLoadOutcome
  load_checked(const std::filesystem::path &path,
               const CorpusOptions &options = {});

  /**
   * @brief Загружает корпус из файла (best-effort)
   *
   * При ошибке чтения логирует предупреждение и возвращает WordSource{}.
   */
  [[nodiscard]] static WordSource load(const std::filesystem::path &path,
                                       const CorpusOptions &options = {});

  /**
   * @brief Случайное слово, вероятность пропорциональна весу
   *
   * Никогда не падает: пустая таблица → запасной словарь.
   */
  [[nodiscard]] Word random_word();

  /**
   * @brief Выполняет запрос слов с упором на слабые буквы
   *
   * Для каждого слова тянет несколько кандидатов и оставляет того, в котором
   * больше всего букв из request.focus. Это весовой сдвиг, а не фильтр.
   */
  [[nodiscard]] std::vector<Word> random_words(const WordRequest &request);

  /// Пересевает ГСЧ (0 = std::random_device)
  void seed(std::uint64_t seed);

  /// Активен ли запасной словарь
  [[nodiscard]] bool is_fallback() const noexcept { return entries_.empty(); }

  /// Количество слов с положительным весом
  [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

  [[nodiscard]] double total_weight() const noexcept { return total_weight_; }

  [[nodiscard]] const std::vector<WeightedWord> &entries() const noexcept {
    return entries_;
  }

private:
  std::vector<WeightedWord> entries_;
  double total_weight_ = 0.0;

  std::mt19937_64 rng_;
  std::discrete_distribution<std::size_t> dist_;
};

struct WordSourceLoadOutcome {
  WordSource source;
  LoadResult result = LoadResult::Ok;
  std::size_t loaded = 0;
  std::size_t skipped = 0; // кривые записи (FormatError)
  std::string error;
};

/**
 * @brief Разбирает одну запись корпуса "слово вес"
 * @param line Строка файла без перевода строки
 * @param out Результат разбора
 * @return false если запись кривая (её нужно пропустить)
 */
[[nodiscard]] bool parse_corpus_record(std::string_view line,
                                       WeightedWord &out);

} // namespace linkage
