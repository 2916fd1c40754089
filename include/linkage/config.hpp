/**
 * @file config.hpp
 * @brief Конфигурация тренажёра Linkage
 *
 * Типобезопасная конфигурация с YAML парсингом.
 * Все значения имеют разумные дефолты.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "linkage/types.hpp"

namespace linkage {

// ===========================================================================
// Структура конфигурации
// ===========================================================================

/// Параметры тренировки (сессия + трекер)
struct TrainingConfig {
  /// Бюджет колонок одной строки
  std::size_t chars_per_line = kCharsPerLine;

  /// Буфер ошибок вмещает max_errors - 1 символов
  std::size_t max_errors = kMaxErrors;

  /// Минимальная глубина буфера следующих строк
  std::size_t next_lines = kNextLines;

  /// Запас внедрённых слов, ниже которого трекер просит новую порцию
  std::size_t refill_threshold = kRefillThreshold;

  /// Сколько слов просить за раз
  std::size_t word_batch = kWordBatch;

  /// Порог "чистоты", ниже которого буква считается слабой
  double min_clean = kMinCleanPct;

  /// Сколько слабых букв подмешивать в запрос
  std::size_t focus_letters = kFocusLetters;

  /// Завершать строку набором пробела (пробел засчитывается как Hit)
  bool score_line_end = false;

  bool operator==(const TrainingConfig &) const = default;
};

/// Точки метрики severity (проверяются при построении TriplePoint)
struct MetricConfig {
  double lo = 0.5;
  double mid = kMinCleanPct;
  double hi = 0.975;
};

/// Источник частотного словаря
struct CorpusConfig {
  std::filesystem::path path{std::string{kCorpusPath}};

  /// Отбрасывать слова, которых нет в словарях Hunspell
  bool spellcheck = false;

  /// 0 = случайное зерно из std::random_device
  std::uint64_t seed = 0;
};

/// Хранилище профилей
struct ProfilesConfig {
  std::filesystem::path path;
};

/// Полная конфигурация приложения
struct Config {
  TrainingConfig training;
  MetricConfig metric;
  CorpusConfig corpus;
  ProfilesConfig profiles;
  std::filesystem::path config_path{std::string{kConfigPath}};
};

// ===========================================================================
// Загрузчик конфигурации
// ===========================================================================

/// Результат загрузки конфигурации из файла.
///
/// В отличие от `load_config()`, это API НЕ делает скрытых фолбэков и
/// позволяет вызывающему коду принять решение (fail-fast / fallback).
struct ConfigLoadOutcome {
  Config config;
  ConfigResult result = ConfigResult::Ok;
  std::filesystem::path used_path;
  std::string error;
};

/**
 * @brief Загружает конфигурацию из конкретного файла
 *
 * @param path Абсолютный или относительный путь к конфигу
 * @return ConfigLoadOutcome с кодом результата и сообщением ошибки
 */
[[nodiscard]] ConfigLoadOutcome load_config_checked(std::filesystem::path path);

/**
 * @brief Загружает конфигурацию из YAML файла (best-effort)
 *
 * @param path Путь к конфигурационному файлу
 * @return Config с загруженными или дефолтными значениями
 *
 * Best-effort поведение: при ошибках чтения/валидации возвращает дефолты.
 */
[[nodiscard]] Config load_config(std::string_view path = kConfigPath);

/**
 * @brief Парсит конфигурацию из строки (без валидации)
 */
[[nodiscard]] Config parse_config(std::string_view text);

/**
 * @brief Валидирует конфигурацию
 *
 * @param config Конфигурация для проверки
 * @return true если все значения в допустимых пределах
 *
 * Точки метрики здесь не проверяются: невалидная тройка заменяется
 * метрикой по умолчанию при построении движка.
 */
[[nodiscard]] bool validate_config(const Config &config);

/// Путь к хранилищу профилей по умолчанию ($HOME/.local/share/...)
[[nodiscard]] std::filesystem::path default_profiles_path();

} // namespace linkage
