#include "linkage/proficiency_tracker.hpp"

#include <cmath>
#include <cstdlib>
#include <iostream>
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

using linkage::Char;
using linkage::CompletedLine;
using linkage::Hit;
using linkage::LetterStat;
using linkage::ProficiencyTracker;
using linkage::TrackerOptions;

bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

CompletedLine line_of(std::vector<Hit> hits) {
  CompletedLine line;
  for (const Hit &h : hits) {
    line.text.push_back(h.target);
  }
  line.hits = std::move(hits);
  return line;
}

void test_ratio() {
  ProficiencyTracker t;

  // 3 чистых и 1 грязное попадание по 'a'
  (void)t.add_line(line_of({{U'a', false}, {U'a', true}, {U'a', false},
                            {U'a', false}, {U' ', false}}),
                   100);

  CHECK((t.stat(U'a') == LetterStat{3, 1}));
  CHECK(near(t.stat(U'a').ratio(), 0.75));
  CHECK(t.lines_completed() == 1);

  // Неизвестный символ — нейтральная единица
  CHECK(t.stat(U'q').ratio() == 1.0);

  t.set_stat(U'q', LetterStat{0, 0});
  auto letters = t.clean_letters();
  bool found = false;
  for (const auto &[c, r] : letters) {
    if (c == U'q') {
      found = true;
      CHECK(r == 1.0);
    }
  }
  CHECK(found);
}

void test_clean_letters_order() {
  ProficiencyTracker t;
  (void)t.add_line(line_of({{U'z', false}, {U'b', true}, {U' ', false},
                            {U'a', false}, {U'я', false}}),
                   100);

  auto letters = t.clean_letters();
  CHECK(letters.size() == 5);
  for (std::size_t i = 1; i < letters.size(); ++i) {
    CHECK(letters[i - 1].first < letters[i].first);
  }
  CHECK(letters.front().first == U' ');
  CHECK(letters.back().first == U'я');
  CHECK(letters[2].first == U'b');
  CHECK(letters[2].second == 0.0);
}

void test_accumulates_across_lines() {
  ProficiencyTracker t;
  (void)t.add_line(line_of({{U'k', true}}), 100);
  (void)t.add_line(line_of({{U'k', false}}), 100);
  (void)t.add_line(line_of({{U'k', false}, {U'k', false}}), 100);
  CHECK((t.stat(U'k') == LetterStat{3, 1}));
  CHECK(t.lines_completed() == 3);
}

void test_word_request() {
  TrackerOptions opts;
  opts.refill_threshold = 8;
  opts.word_batch = 16;
  opts.min_clean = 0.9;
  opts.focus_letters = 2;
  ProficiencyTracker t{opts};

  auto none = t.add_line(line_of({{U'a', false}}), 8);
  CHECK(!none.has_value());

  // 'x' 0/1, 'y' 1/2, 'z' 2/3, пробел грязный — но пробел не буква слова
  auto req = t.add_line(line_of({{U'x', true}, {U'y', true}, {U'y', false},
                                 {U'z', true}, {U'z', false}, {U'z', false},
                                 {U' ', true}}),
                        7);
  CHECK(req.has_value());
  CHECK(req->count == 16);
  CHECK(req->focus.size() == 2);
  CHECK(req->focus[0] == U'x');
  CHECK(req->focus[1] == U'y');
}

void test_weak_letters() {
  ProficiencyTracker t;
  t.set_stat(U'a', LetterStat{9, 1});  // 0.9: не слабая
  t.set_stat(U'b', LetterStat{1, 1});  // 0.5
  t.set_stat(U'c', LetterStat{1, 1});  // 0.5
  t.set_stat(U'd', LetterStat{0, 5});  // 0.0
  t.set_stat(U'.', LetterStat{0, 5});  // не буква

  auto weak = t.weak_letters(10);
  CHECK((weak == std::vector<Char>{U'd', U'b', U'c'}));

  CHECK(t.weak_letters(1).size() == 1);
  CHECK(t.weak_letters(0).empty());
}

} // namespace

#undef CHECK

int main() {
  test_ratio();
  test_clean_letters_order();
  test_accumulates_across_lines();
  test_word_request();
  test_weak_letters();

  std::cout << "OK\n";
  return 0;
}
