/**
 * @file engine.hpp
 * @brief Фасад движка для слоя отображения
 *
 * Владеет общим WordSource, набором профилей и метрикой. Однопоточный:
 * все вызовы должны идти из одного потока-владельца (события ввода
 * доставляются ему сообщениями, см. EventLoop).
 */

#pragma once

#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

#include "linkage/config.hpp"
#include "linkage/metric.hpp"
#include "linkage/profile_store.hpp"
#include "linkage/session.hpp"
#include "linkage/types.hpp"
#include "linkage/word_source.hpp"

namespace linkage {

/// Единое событие ввода
struct InputEvent {
  enum class Kind : std::uint8_t { Char, Backspace, Stop };

  Kind kind = Kind::Char;
  Char ch = 0;

  [[nodiscard]] static constexpr InputEvent character(Char c) noexcept {
    return InputEvent{Kind::Char, c};
  }
  [[nodiscard]] static constexpr InputEvent backspace() noexcept {
    return InputEvent{Kind::Backspace, 0};
  }
  [[nodiscard]] static constexpr InputEvent stop() noexcept {
    return InputEvent{Kind::Stop, 0};
  }
};

/// Метрика из конфига; невалидная тройка заменяется метрикой по умолчанию
[[nodiscard]] TriplePoint make_metric(const MetricConfig &config);

class Engine {
public:
  /**
   * @brief Конструктор
   * @param config Конфигурация (metric; training берётся из набора)
   * @param profiles Набор профилей; его источник слов и training главнее
   */
  Engine(Config config, ProfileStore profiles);

  /**
   * @brief Движок с одним профилем по умолчанию
   * @param source Источник слов (nullptr — встроенный словарь)
   */
  explicit Engine(Config config = {},
                  std::shared_ptr<WordSource> source = nullptr);

  Engine(const Engine &) = delete;
  Engine &operator=(const Engine &) = delete;
  Engine(Engine &&) = default;
  Engine &operator=(Engine &&) = default;

  /**
   * @brief Применяет символ к сессии активного профиля
   *
   * При завершении строки учитывает её в трекере, при необходимости
   * подкладывает новые слова и дозаполняет буфер строк.
   */
  LineStep apply_char(Char c);

  void backspace() noexcept;

  void fill_next_lines();

  /**
   * @brief Диспетчеризует событие ввода
   * @return Итог нажатия (для Backspace/Stop — LineInProgress)
   */
  LineStep handle(const InputEvent &event);

  // =========================================================================
  // Снимки для отрисовки
  // =========================================================================

  [[nodiscard]] const Session &session() const { return profiles_.session(); }

  [[nodiscard]] std::vector<std::pair<Char, double>> clean_letters() const {
    return profiles_.active().tracker.clean_letters();
  }

  /// Severity для доли чистых нажатий
  [[nodiscard]] double severity(double ratio) const noexcept {
    return metric_.value(ratio);
  }

  [[nodiscard]] const TriplePoint &metric() const noexcept { return metric_; }

  [[nodiscard]] ProfileStore &profiles() noexcept { return profiles_; }
  [[nodiscard]] const ProfileStore &profiles() const noexcept {
    return profiles_;
  }

  [[nodiscard]] WordSource &words() noexcept { return *source_; }

  [[nodiscard]] const Config &config() const noexcept { return config_; }

private:
  Config config_;
  std::shared_ptr<WordSource> source_;
  ProfileStore profiles_;
  TriplePoint metric_;
};

} // namespace linkage
