/**
 * @file engine.cpp
 * @brief Реализация фасада движка
 */

#include "linkage/engine.hpp"

#include <iostream>

namespace linkage {

TriplePoint make_metric(const MetricConfig &config) {
  auto metric = TriplePoint::create(config.lo, config.mid, config.hi);
  if (!metric) {
    std::cerr << "[linkage] Warning: invalid metric points (" << config.lo
              << ", " << config.mid << ", " << config.hi
              << "), using default metric\n";
    return TriplePoint::default_metric();
  }
  return *metric;
}

Engine::Engine(Config config, ProfileStore profiles)
    : config_{std::move(config)}, source_{profiles.source()},
      profiles_{std::move(profiles)}, metric_{make_metric(config_.metric)} {
  // Сессии уже собраны с параметрами набора: подстраиваем конфиг под них
  if (config_.training != profiles_.training()) {
    std::cerr << "[linkage] Warning: training config differs from the "
                 "profile store, using the store's\n";
    config_.training = profiles_.training();
  }
}

Engine::Engine(Config config, std::shared_ptr<WordSource> source)
    : config_{std::move(config)},
      source_{source ? std::move(source) : std::make_shared<WordSource>()},
      profiles_{source_, config_.training},
      metric_{make_metric(config_.metric)} {}

LineStep Engine::apply_char(Char c) {
  LineStep step = profiles_.session().apply_char(c);

  if (auto *done = std::get_if<CompletedLine>(&step)) {
    Profile &profile = profiles_.active();
    if (auto request = profile.add_line(*done)) {
      profile.session.update_words(source_->random_words(*request));
    }
    profile.session.fill_next_lines();
  }

  return step;
}

void Engine::backspace() noexcept { profiles_.session().backspace(); }

void Engine::fill_next_lines() { profiles_.session().fill_next_lines(); }

LineStep Engine::handle(const InputEvent &event) {
  switch (event.kind) {
  case InputEvent::Kind::Char:
    return apply_char(event.ch);
  case InputEvent::Kind::Backspace:
    backspace();
    break;
  case InputEvent::Kind::Stop:
    break;
  }
  return LineInProgress{};
}

} // namespace linkage
