/**
 * @file spell_filter.hpp
 * @brief Фильтр слов корпуса по словарям Hunspell
 *
 * Отсекает из частотного словаря опечатки и мусор, если в системе есть
 * словари hunspell. Без Hunspell фильтр недоступен и пропускает всё.
 */

#pragma once

#include <memory>
#include <string>

#ifdef HAVE_HUNSPELL
#include <hunspell/hunspell.hxx>
#endif

namespace linkage {

class SpellFilter {
public:
  SpellFilter() = default;
  ~SpellFilter();

  SpellFilter(const SpellFilter &) = delete;
  SpellFilter &operator=(const SpellFilter &) = delete;

  /**
   * @brief Загружает словари hunspell (EN и RU)
   * @return true если доступен хотя бы один словарь
   */
  bool initialize();

  /**
   * @brief Проверяет, доступен ли Hunspell
   */
  [[nodiscard]] bool is_available() const noexcept { return available_; }

  /**
   * @brief Принимает ли хотя бы один словарь слово
   * @param word Слово (UTF-8)
   * @return true если слово корректно или фильтр недоступен
   */
  [[nodiscard]] bool accepts(const std::string &word) const;

private:
#ifdef HAVE_HUNSPELL
  std::unique_ptr<Hunspell> hunspell_en_;
  std::unique_ptr<Hunspell> hunspell_ru_;
#endif

  bool available_ = false;
};

} // namespace linkage
