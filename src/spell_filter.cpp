/**
 * @file spell_filter.cpp
 * @brief Реализация фильтра слов по словарям Hunspell
 */

#include "linkage/spell_filter.hpp"

#include <fstream>
#include <iostream>
#include <new>

namespace linkage {

namespace {

// Пути к hunspell словарям (с .aff файлами)
constexpr const char *kEnAffPath = "/usr/share/hunspell/en_US.aff";
constexpr const char *kEnDicPath = "/usr/share/hunspell/en_US.dic";
constexpr const char *kRuAffPath = "/usr/share/hunspell/ru_RU.aff";
constexpr const char *kRuDicPath = "/usr/share/hunspell/ru_RU.dic";

} // namespace

SpellFilter::~SpellFilter() = default;

bool SpellFilter::initialize() {
  if (available_) {
    return true;
  }

#ifdef HAVE_HUNSPELL
  std::ifstream test_en(kEnAffPath);
  std::ifstream test_ru(kRuAffPath);

  // Hunspell сообщает о нехватке памяти только через std::bad_alloc
  if (test_en.good()) {
    try {
      hunspell_en_ = std::make_unique<Hunspell>(kEnAffPath, kEnDicPath);
      std::cerr << "[linkage] Hunspell EN loaded\n";
    } catch (const std::bad_alloc &) {
      std::cerr << "[linkage] Hunspell EN init failed\n";
    }
  }

  if (test_ru.good()) {
    try {
      hunspell_ru_ = std::make_unique<Hunspell>(kRuAffPath, kRuDicPath);
      std::cerr << "[linkage] Hunspell RU loaded\n";
    } catch (const std::bad_alloc &) {
      std::cerr << "[linkage] Hunspell RU init failed\n";
    }
  }

  available_ = (hunspell_en_ != nullptr || hunspell_ru_ != nullptr);
#else
  (void)kEnAffPath;
  (void)kEnDicPath;
  (void)kRuAffPath;
  (void)kRuDicPath;
#endif

  if (!available_) {
    std::cerr << "[linkage] Warning: spellcheck requested but no Hunspell "
                 "dictionaries are available, corpus is not filtered\n";
  }
  return available_;
}

bool SpellFilter::accepts(const std::string &word) const {
  if (!available_) {
    return true;
  }

#ifdef HAVE_HUNSPELL
  if (hunspell_en_ && hunspell_en_->spell(word)) {
    return true;
  }
  if (hunspell_ru_ && hunspell_ru_->spell(word)) {
    return true;
  }
  return false;
#else
  (void)word;
  return true;
#endif
}

} // namespace linkage
