/**
 * @file main.cpp
 * @brief Точка входа тренажёра Linkage
 *
 * Читает нажатия (UTF-8 байты) из stdin, печатает завершённые строки и
 * итоговую таблицу чистоты. Backspace = 0x7F/0x08, Ctrl+D = стоп.
 *
 * Запуск: linkage [-c config.yaml] < keys.txt
 */

#include "linkage/config.hpp"
#include "linkage/engine.hpp"
#include "linkage/event_loop.hpp"
#include "linkage/persistence.hpp"

#include <charconv>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <signal.h>
#include <string>
#include <string_view>
#include <unistd.h>

namespace {

linkage::EventLoop *g_loop = nullptr;

void signal_handler(int sig) {
  if ((sig == SIGINT || sig == SIGTERM) && g_loop != nullptr) {
    g_loop->request_stop();
  }
}

void print_version() {
  std::cout << "Linkage 1.0.0 (C++20)\n"
            << "Typing practice engine with per-letter proficiency\n";
}

void print_usage(const char *argv0) {
  std::cout << "Usage: " << argv0 << " [options] < keystrokes\n"
            << "\n"
            << "Options:\n"
            << "  -h, --help           Show this help\n"
            << "  -v, --version        Show version\n"
            << "  -c, --config PATH    Config file (default: "
            << linkage::kConfigPath << ")\n"
            << "      --corpus PATH    Frequency corpus\n"
            << "      --profiles PATH  Profile store\n"
            << "      --profile INDEX  Profile to activate\n"
            << "      --no-save        Do not save profiles on exit\n"
            << "\n"
            << "Input: UTF-8 text; 0x7F/0x08 = backspace, Ctrl+D = stop\n";
}

struct Options {
  std::string config_path{linkage::kConfigPath};
  std::optional<std::string> corpus;
  std::optional<std::string> profiles;
  std::optional<std::size_t> profile;
  bool save = true;
};

std::optional<std::size_t> parse_index(std::string_view sv) {
  std::size_t value = 0;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
  if (ec == std::errc{} && ptr == sv.data() + sv.size() && !sv.empty()) {
    return value;
  }
  return std::nullopt;
}

} // namespace

int main(int argc, char *argv[]) {
  Options opts;

  // Обработка аргументов командной строки
  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    auto next_value = [&](std::string_view name) -> std::optional<std::string> {
      if (i + 1 >= argc) {
        std::cerr << "[linkage] Missing value for " << name << "\n";
        return std::nullopt;
      }
      return std::string{argv[++i]};
    };

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return 0;
    }
    if (arg == "-v" || arg == "--version") {
      print_version();
      return 0;
    }
    if (arg == "--no-save") {
      opts.save = false;
      continue;
    }

    std::optional<std::string> value;
    if (arg == "-c" || arg == "--config" || arg == "--corpus" ||
        arg == "--profiles" || arg == "--profile") {
      value = next_value(arg);
      if (!value) {
        return 2;
      }
    } else {
      std::cerr << "[linkage] Unknown option: " << arg << "\n";
      print_usage(argv[0]);
      return 2;
    }

    if (arg == "-c" || arg == "--config") {
      opts.config_path = *value;
    } else if (arg == "--corpus") {
      opts.corpus = *value;
    } else if (arg == "--profiles") {
      opts.profiles = *value;
    } else {
      opts.profile = parse_index(*value);
      if (!opts.profile) {
        std::cerr << "[linkage] Invalid profile index: " << *value << "\n";
        return 2;
      }
    }
  }

  // Загрузка конфигурации
  linkage::Config config = linkage::load_config(opts.config_path);
  if (opts.corpus) {
    config.corpus.path = *opts.corpus;
  }
  if (opts.profiles) {
    config.profiles.path = *opts.profiles;
  }
  if (config.profiles.path.empty()) {
    config.profiles.path = linkage::default_profiles_path();
  }

  // Корпус и профили грузятся до приёма ввода
  auto loading = linkage::load_state_async(config);
  linkage::LoadedState state = loading.get();

  linkage::Engine engine{config, std::move(state.profiles)};

  if (opts.profile && !engine.profiles().select(*opts.profile)) {
    std::cerr << "[linkage] Warning: no profile #" << *opts.profile
              << ", keeping #" << engine.profiles().active_index() << "\n";
  }

  linkage::EventLoop loop{engine, STDIN_FILENO, std::cout};
  g_loop = &loop;

  // Установка обработчиков сигналов
  struct sigaction sa{};
  sa.sa_handler = signal_handler;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;

  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);

  int rc = loop.run();
  g_loop = nullptr;

  loop.print_summary();

  if (opts.save) {
    auto saving = linkage::save_state_async(engine.profiles().to_records(),
                                            engine.profiles().active_index(),
                                            config.profiles.path);
    if (saving.get() != linkage::StorageResult::Ok && rc == 0) {
      rc = 1;
    }
  }

  return rc;
}
