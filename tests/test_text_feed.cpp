#include "linkage/session.hpp"
#include "linkage/text_feed.hpp"
#include "linkage/word_source.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
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

using linkage::TextFeed;
using linkage::WeightedWord;
using linkage::Word;
using linkage::WordSource;

std::shared_ptr<WordSource> source_of(std::vector<WeightedWord> words) {
  return std::make_shared<WordSource>(std::move(words), /*seed=*/7);
}

void test_fill_depth_and_budget() {
  TextFeed feed{source_of({{U"the", 5.0}, {U"quick", 3.0}, {U"jumps", 1.0},
                           {U"keyboard", 1.0}}),
                20, 3};

  feed.fill_next_lines(3);
  CHECK(feed.next_lines().size() == 3);
  for (const Word &line : feed.next_lines()) {
    CHECK(!line.empty());
    CHECK(line.size() <= 20);
    CHECK(line.front() != U' ');
    CHECK(line.back() != U' ');
  }

  // Идемпотентность: глубина достигнута — ничего не меняется
  const auto before = feed.next_lines();
  feed.fill_next_lines(3);
  feed.fill_next_lines(1);
  CHECK(feed.next_lines() == before);

  feed.fill_next_lines(5);
  CHECK(feed.next_lines().size() == 5);
}

void test_greedy_packing() {
  // "abcdefgh abcdefgh" = 17 > 16: по одному слову на строку
  TextFeed feed{source_of({{U"abcdefgh", 1.0}}), 16, 2};
  feed.fill_next_lines();
  for (const Word &line : feed.next_lines()) {
    CHECK(line == U"abcdefgh");
  }

  // "abc" x4 = 15 <= 16, пятое уже не влезает
  TextFeed feed3{source_of({{U"abc", 1.0}}), 16, 1};
  feed3.fill_next_lines();
  CHECK(feed3.next_lines().front() == U"abc abc abc abc");
}

void test_update_words_go_first() {
  TextFeed feed{source_of({{U"cat", 1.0}}), 16, 1};

  feed.update_words({U"zebra", U"quokka"});
  CHECK(feed.pending_words() == 2);

  feed.fill_next_lines();
  // 5 + 1 + 6 + 1 + 3 = 16
  CHECK(feed.next_lines().front() == U"zebra quokka cat");
  CHECK(feed.pending_words() == 0);
}

void test_update_words_filters_garbage() {
  TextFeed feed{source_of({{U"cat", 1.0}}), 16, 1};
  feed.update_words({U"", U"a-b", U"ok", U"abcdefghijklmnopqrstu"});
  // Пустое слово и слово с дефисом отбрасываются сразу
  CHECK(feed.pending_words() == 2);

  feed.fill_next_lines();
  const Word &line = feed.next_lines().front();
  CHECK(line.size() <= 16);
  CHECK(line.substr(0, 3) == U"ok ");
}

void test_advance_line() {
  TextFeed feed{source_of({{U"abcdefgh", 1.0}}), 16, 2};
  Word line = feed.advance_line();
  CHECK(line == U"abcdefgh");
  CHECK(feed.next_lines().size() == 2);
}

void test_fallback_source() {
  TextFeed feed{std::make_shared<WordSource>(), 24, 4};
  feed.fill_next_lines();
  CHECK(feed.next_lines().size() == 4);
  for (const Word &line : feed.next_lines()) {
    CHECK(!line.empty());
    CHECK(line.size() <= 24);
  }
}

void test_words_longer_than_any_line() {
  // Ни одно слово таблицы не влезает в строку: таблица пуста,
  // сборка идёт из встроенного словаря и завершается
  auto src = source_of({{Word(41, U'a'), 1.0}, {Word(100, U'b'), 3.0}});
  CHECK(src->is_fallback());

  TextFeed feed{src, 40, 2};
  feed.fill_next_lines();
  CHECK(feed.next_lines().size() == 2);
  for (const Word &line : feed.next_lines()) {
    CHECK(!line.empty());
    CHECK(line.size() <= 40);
  }

  linkage::Session session{src, linkage::SessionOptions{}};
  CHECK(!session.line().empty());
  CHECK(session.line().size() <= linkage::kCharsPerLine);
}

void test_long_words_dropped_from_table() {
  auto src = source_of({{U"abcdefghijklmnopq", 5.0}, {U"ok", 1.0}});
  CHECK(src->size() == 1);
  CHECK(!src->is_fallback());

  TextFeed feed{src, 16, 1};
  feed.fill_next_lines();
  CHECK(feed.next_lines().front() == U"ok ok ok ok ok");
}

} // namespace

#undef CHECK

int main() {
  test_fill_depth_and_budget();
  test_greedy_packing();
  test_update_words_go_first();
  test_update_words_filters_garbage();
  test_advance_line();
  test_fallback_source();
  test_words_longer_than_any_line();
  test_long_words_dropped_from_table();

  std::cout << "OK\n";
  return 0;
}
