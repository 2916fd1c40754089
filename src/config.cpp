/**
 * @file config.cpp
 * @brief Реализация загрузчика конфигурации
 */

#include "linkage/config.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace linkage {

namespace {

/// Удаляет пробелы с начала и конца строки
std::string_view trim(std::string_view sv) {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) {
    sv.remove_suffix(1);
  }
  return sv;
}

/// Парсит неотрицательное целое из строки
std::optional<std::uint64_t> parse_uint(std::string_view sv) {
  sv = trim(sv);
  std::uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
  if (ec == std::errc{} && ptr == sv.data() + sv.size()) {
    return value;
  }
  return std::nullopt;
}

std::optional<std::size_t> parse_size(std::string_view sv) {
  auto v = parse_uint(sv);
  if (v) {
    return static_cast<std::size_t>(*v);
  }
  return std::nullopt;
}

/// Парсит число с плавающей точкой из строки
std::optional<double> parse_double(std::string_view sv) {
  sv = trim(sv);
  if (sv.empty()) {
    return std::nullopt;
  }
  // std::from_chars для double не везде поддерживается, используем strtod
  std::string str{sv};
  char *end = nullptr;
  double value = std::strtod(str.c_str(), &end);
  if (end == str.c_str() + str.size() && std::isfinite(value)) {
    return value;
  }
  return std::nullopt;
}

/// Парсит булево значение из строки
std::optional<bool> parse_bool(std::string_view sv) {
  sv = trim(sv);
  if (sv == "true" || sv == "yes" || sv == "1" || sv == "on") {
    return true;
  }
  if (sv == "false" || sv == "no" || sv == "0" || sv == "off") {
    return false;
  }
  return std::nullopt;
}

/// Убирает кавычки вокруг строкового значения
std::string_view unquote(std::string_view sv) {
  sv = trim(sv);
  if (sv.size() >= 2 && ((sv.front() == '"' && sv.back() == '"') ||
                         (sv.front() == '\'' && sv.back() == '\''))) {
    sv.remove_prefix(1);
    sv.remove_suffix(1);
  }
  return sv;
}

} // namespace

bool validate_config(const Config &config) {
  const auto &t = config.training;

  // Проверка геометрии строки
  if (t.chars_per_line < kMinCharsPerLine ||
      t.chars_per_line > kMaxCharsPerLine) {
    return false;
  }

  // Проверка буферов
  if (t.max_errors == 0 || t.max_errors > 32) {
    return false;
  }
  if (t.next_lines == 0 || t.next_lines > 16) {
    return false;
  }
  if (t.word_batch == 0 || t.word_batch > 1024) {
    return false;
  }
  if (t.focus_letters > 26) {
    return false;
  }

  // Проверка порога
  if (!(t.min_clean >= 0.0 && t.min_clean <= 1.0)) {
    return false;
  }

  return true;
}

std::filesystem::path default_profiles_path() {
  const char *home = std::getenv("HOME");
  if (home) {
    return std::filesystem::path{home} / std::string{kProfilesRelPath};
  }
  return std::filesystem::path{"profiles.txt"};
}

namespace {

/// Получает путь к user config (~/.config/linkage/config.yaml)
std::string get_user_config_path() {
  const char *home = std::getenv("HOME");
  if (home) {
    return std::string(home) + "/" + std::string(kUserConfigRelPath);
  }
  return "";
}

Config parse_config_stream(std::istream &file) {
  Config config;
  config.profiles.path = default_profiles_path();

  std::string line;
  std::string current_section;

  while (std::getline(file, line)) {
    std::string_view sv = trim(line);

    // Пропуск пустых строк и комментариев
    if (sv.empty() || sv.front() == '#') {
      continue;
    }

    // Определение секции
    if (sv.starts_with("training:")) {
      current_section = "training";
      continue;
    }
    if (sv.starts_with("metric:")) {
      current_section = "metric";
      continue;
    }
    if (sv.starts_with("corpus:")) {
      current_section = "corpus";
      continue;
    }
    if (sv.starts_with("profiles:")) {
      current_section = "profiles";
      continue;
    }

    // Парсинг key: value
    auto colon_pos = sv.find(':');
    if (colon_pos == std::string_view::npos) {
      continue;
    }

    std::string_view key = trim(sv.substr(0, colon_pos));
    std::string_view value = trim(sv.substr(colon_pos + 1));

    if (current_section == "training") {
      auto &t = config.training;
      if (key == "score_line_end") {
        if (auto val = parse_bool(value)) {
          t.score_line_end = *val;
        }
      } else if (key == "min_clean") {
        if (auto val = parse_double(value)) {
          t.min_clean = *val;
        }
      } else if (auto val = parse_size(value)) {
        if (key == "chars_per_line") {
          t.chars_per_line = *val;
        } else if (key == "max_errors") {
          t.max_errors = *val;
        } else if (key == "next_lines") {
          t.next_lines = *val;
        } else if (key == "refill_threshold") {
          t.refill_threshold = *val;
        } else if (key == "word_batch") {
          t.word_batch = *val;
        } else if (key == "focus_letters") {
          t.focus_letters = *val;
        }
      }
    } else if (current_section == "metric") {
      if (auto val = parse_double(value)) {
        if (key == "lo") {
          config.metric.lo = *val;
        } else if (key == "mid") {
          config.metric.mid = *val;
        } else if (key == "hi") {
          config.metric.hi = *val;
        }
      }
    } else if (current_section == "corpus") {
      if (key == "path") {
        auto p = unquote(value);
        if (!p.empty()) {
          config.corpus.path = std::string{p};
        }
      } else if (key == "spellcheck") {
        if (auto val = parse_bool(value)) {
          config.corpus.spellcheck = *val;
        }
      } else if (key == "seed") {
        if (auto val = parse_uint(value)) {
          config.corpus.seed = *val;
        }
      }
    } else if (current_section == "profiles") {
      if (key == "path") {
        auto p = unquote(value);
        if (!p.empty()) {
          config.profiles.path = std::string{p};
        }
      }
    }
  }

  return config;
}

} // namespace

Config parse_config(std::string_view text) {
  std::istringstream in{std::string{text}};
  return parse_config_stream(in);
}

ConfigLoadOutcome load_config_checked(std::filesystem::path path) {
  ConfigLoadOutcome out;
  out.config.profiles.path = default_profiles_path();
  out.used_path = std::move(path);

  if (out.used_path.empty()) {
    out.result = ConfigResult::FileNotFound;
    out.error = "Empty config path";
    return out;
  }

  std::ifstream file{out.used_path};
  if (!file.is_open()) {
    out.result = ConfigResult::FileNotFound;
    out.error = "Config file not found: " + out.used_path.string();
    return out;
  }

  out.config = parse_config_stream(file);
  out.config.config_path = out.used_path;

  if (!validate_config(out.config)) {
    out.result = ConfigResult::InvalidValue;
    out.error = "Invalid configuration in: " + out.used_path.string();
    out.config = Config{};
    out.config.profiles.path = default_profiles_path();
    return out;
  }

  out.result = ConfigResult::Ok;
  return out;
}

Config load_config(std::string_view path) {
  // Best-effort логика: если запрошен дефолтный путь, пробуем user-config
  // первым.
  std::filesystem::path effective_path{std::string{path}};

  if (path == kConfigPath) {
    std::string user_path = get_user_config_path();
    if (!user_path.empty()) {
      std::error_code ec;
      bool exists = std::filesystem::exists(user_path, ec);
      if (!ec && exists) {
        effective_path = user_path;
        std::cerr << "[linkage] Using user config: " << user_path << "\n";
      }
    }
  }

  ConfigLoadOutcome out = load_config_checked(effective_path);
  if (out.result != ConfigResult::Ok) {
    // Файл не найден/битый — используем дефолты.
    if (!out.error.empty()) {
      std::cerr << "[linkage] Warning: " << out.error << "\n";
    }
    Config config;
    config.profiles.path = default_profiles_path();
    return config;
  }

  return out.config;
}

} // namespace linkage
