#include "linkage/engine.hpp"
#include "linkage/event_loop.hpp"
#include "linkage/persistence.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <unistd.h>
#include <utility>
#include <variant>
#include <vector>

namespace {

[[noreturn]] void test_fail(const char* expr, const char* file, int line) {
  std::cerr << "TEST FAIL: " << expr << " (" << file << ":" << line << ")\n";
  std::abort();
}

#define CHECK(expr) \
  do { \
    if (!(expr)) { \
      test_fail(#expr, __FILE__, __LINE__); \
    } \
  } while (0)

using linkage::CompletedLine;
using linkage::Config;
using linkage::Engine;
using linkage::EventLoop;
using linkage::InputEvent;
using linkage::LetterStat;
using linkage::LineStep;
using linkage::WeightedWord;
using linkage::Word;
using linkage::WordSource;

Config small_config() {
  Config c;
  c.training.chars_per_line = 16;
  c.training.refill_threshold = 8;
  c.training.word_batch = 16;
  return c;
}

std::shared_ptr<WordSource> cat_source() {
  return std::make_shared<WordSource>(
      std::vector<WeightedWord>{{U"cat", 1.0}}, 11);
}

void test_line_flow_and_refill() {
  Engine engine{small_config(), cat_source()};
  CHECK(engine.session().line() == U"cat cat cat cat");

  LineStep step = engine.handle(InputEvent::character(U'x'));
  CHECK(std::holds_alternative<linkage::LineInProgress>(step));
  engine.handle(InputEvent::backspace());
  CHECK(engine.session().errors().empty());

  for (char32_t c : Word{U"cat cat cat cat"}) {
    step = engine.handle(InputEvent::character(c));
  }
  CHECK(std::holds_alternative<CompletedLine>(step));

  const auto &tracker = engine.profiles().active().tracker;
  CHECK((tracker.stat(U'c') == LetterStat{3, 1}));
  CHECK((tracker.stat(U'a') == LetterStat{4, 0}));
  CHECK((tracker.stat(U' ') == LetterStat{3, 0}));
  CHECK(tracker.lines_completed() == 1);

  // Запас был пуст: трекер запросил порцию, она ждёт сборки
  CHECK(engine.session().pending_words() == 16);
  CHECK(engine.session().hits().empty());
  CHECK(engine.session().next_lines().size() == 2);

  auto letters = engine.clean_letters();
  CHECK(!letters.empty());
  CHECK(letters.front().first == U' ');
}

void test_stop_is_noop() {
  Engine engine{small_config(), cat_source()};
  engine.handle(InputEvent::character(U'c'));
  LineStep step = engine.handle(InputEvent::stop());
  CHECK(std::holds_alternative<linkage::LineInProgress>(step));
  CHECK(engine.session().hits().size() == 1);
}

void test_metric_from_config() {
  Config c = small_config();
  c.metric = {0.2, 0.4, 0.8};
  Engine engine{c, cat_source()};
  CHECK(engine.severity(0.2) == 0.0);
  CHECK(engine.severity(0.4) == 0.5);
  CHECK(engine.severity(0.9) == 1.0);

  // Невалидная тройка: метрика по умолчанию
  c.metric = {0.9, 0.5, 0.2};
  Engine fallback{c, cat_source()};
  CHECK(fallback.metric().lo() == 0.25);
  CHECK(fallback.metric().mid() == 0.5);
  CHECK(fallback.metric().hi() == 0.75);
}

void test_profile_switch_through_engine() {
  Engine engine{small_config(), cat_source()};
  engine.apply_char(U'c');
  std::size_t idx = engine.profiles().add("second", "dvorak");
  CHECK(engine.profiles().select(idx));
  CHECK(engine.session().hits().empty());
  CHECK(engine.profiles().select(0));
  CHECK(engine.session().hits().size() == 1);
}

void test_event_loop_pipe() {
  int fds[2];
  CHECK(pipe(fds) == 0);

  // 'x' + backspace: ошибка стёрта, но 'c' всё равно грязная
  const std::string input = "x\x7f" "cat cat cat cat" "ca";
  CHECK(write(fds[1], input.data(), input.size()) ==
        static_cast<ssize_t>(input.size()));
  close(fds[1]);

  Engine engine{small_config(), cat_source()};
  std::ostringstream out;
  EventLoop loop{engine, fds[0], out};
  CHECK(loop.run() == 0);
  close(fds[0]);

  CHECK(loop.lines_completed() == 1);
  CHECK(out.str().find("[1] clean 14/15  cat cat cat cat") !=
        std::string::npos);
  CHECK(engine.session().hits().size() == 2);

  loop.print_summary();
  CHECK(out.str().find("profile: default (qwerty)") != std::string::npos);
}

void test_event_loop_utf8_and_eot() {
  int fds[2];
  CHECK(pipe(fds) == 0);

  auto src = std::make_shared<WordSource>(
      std::vector<WeightedWord>{{U"мир", 1.0}}, 3);
  // После Ctrl+D ввод больше не читается
  const std::string input = "\xD0\xBC\xD0\xB8" "\x04" "\xD1\x80";
  CHECK(write(fds[1], input.data(), input.size()) ==
        static_cast<ssize_t>(input.size()));
  close(fds[1]);

  Engine engine{small_config(), src};
  std::ostringstream out;
  EventLoop loop{engine, fds[0], out};
  CHECK(loop.run() == 0);
  close(fds[0]);

  CHECK(engine.session().hits().size() == 2);
  CHECK(engine.session().active_target() == U'р');
}

void test_engine_uses_store_source_and_training() {
  auto src = cat_source();
  linkage::TrainingConfig store_training = small_config().training;
  store_training.refill_threshold = 2;
  linkage::ProfileStore store{src, store_training};

  // Конфиг расходится с набором: главнее набор
  Config c = small_config();
  c.training.chars_per_line = 64;
  Engine engine{c, std::move(store)};

  CHECK(&engine.words() == src.get());
  CHECK(engine.config().training == store_training);
  CHECK(engine.session().line() == U"cat cat cat cat");

  // Дозапрос идёт из того же источника, что и строки
  for (char32_t ch : Word{U"cat cat cat cat"}) {
    engine.handle(InputEvent::character(ch));
  }
  CHECK(engine.session().pending_words() == 16);
  engine.words().seed(1);
  CHECK(engine.words().random_word() == U"cat");
}

void test_state_persistence() {
  auto dir = std::filesystem::temp_directory_path() / "linkage_test_state";
  std::filesystem::remove_all(dir);

  Config c = small_config();
  c.corpus.path = dir / "missing_corpus.txt";
  c.corpus.seed = 17;
  c.profiles.path = dir / "profiles.txt";

  linkage::LoadedState state = linkage::load_state_async(c).get();
  CHECK(state.source->is_fallback());
  CHECK(state.profiles.size() == 1);

  Engine engine{c, std::move(state.profiles)};
  CHECK(&engine.words() == state.source.get());
  engine.profiles().active().tracker.set_stat(U'q', LetterStat{2, 2});
  CHECK(linkage::save_state_async(engine.profiles().to_records(),
                                  engine.profiles().active_index(),
                                  c.profiles.path)
            .get() == linkage::StorageResult::Ok);

  linkage::LoadedState again = linkage::load_state(c);
  CHECK((again.profiles.active().tracker.stat(U'q') == LetterStat{2, 2}));

  std::filesystem::remove_all(dir);
}

} // namespace

#undef CHECK

int main() {
  test_line_flow_and_refill();
  test_stop_is_noop();
  test_metric_from_config();
  test_profile_switch_through_engine();
  test_event_loop_pipe();
  test_event_loop_utf8_and_eot();
  test_engine_uses_store_source_and_training();
  test_state_persistence();

  std::cout << "OK\n";
  return 0;
}
