/**
 * @file word_source.cpp
 * @brief Реализация частотного словаря
 */

#include "linkage/word_source.hpp"
#include "linkage/spell_filter.hpp"
#include "linkage/utf8.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>

namespace linkage {

namespace {

constexpr std::string_view kHeaderPrefix = "#!linkage-freq";
constexpr std::string_view kSupportedVersion = "1";

// Сколько кандидатов тянуть на одно слово при упоре на слабые буквы
constexpr std::size_t kEmphasisCandidates = 4;

// Встроенный запасной словарь (частые английские слова)
// clang-format off
constexpr std::u32string_view kFallbackWords[] = {
    U"the", U"of", U"and", U"to", U"in", U"for", U"is", U"on", U"that",
    U"by", U"this", U"with", U"you", U"it", U"not", U"or", U"be", U"are",
    U"from", U"at", U"as", U"your", U"all", U"have", U"new", U"more", U"an",
    U"was", U"we", U"will", U"home", U"can", U"us", U"about", U"if", U"page",
    U"my", U"has", U"but", U"our", U"one", U"other", U"do", U"no", U"time",
    U"they", U"he", U"up", U"may", U"what", U"which", U"their", U"out",
    U"use", U"any", U"there", U"see", U"only", U"so", U"his", U"when",
    U"here", U"who", U"also", U"now", U"help", U"get", U"view", U"first",
    U"been", U"would", U"how", U"were", U"me", U"some", U"these", U"its",
    U"like", U"than", U"find", U"back", U"top", U"people", U"had", U"list",
    U"name", U"just", U"over", U"year", U"day", U"into", U"two", U"world",
    U"next", U"used", U"go", U"work", U"last", U"most", U"make", U"them",
    U"should", U"system", U"her", U"city", U"add", U"number", U"such",
    U"after", U"best", U"then", U"good", U"well", U"where", U"public",
    U"book", U"high", U"school", U"through", U"each", U"she", U"order",
    U"very", U"read", U"group", U"need", U"many", U"said", U"does", U"set",
    U"under", U"general", U"full", U"map", U"life", U"know", U"way", U"part",
    U"could", U"great", U"real", U"must", U"made", U"line", U"before",
    U"right", U"type", U"because", U"local", U"those", U"using", U"quick",
    U"brown", U"fox", U"jumps", U"lazy", U"dog", U"zero", U"jazz", U"queen",
    U"box", U"keep", U"value", U"power", U"water", U"history", U"sixty",
};
// clang-format on

std::string_view trim(std::string_view sv) {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) {
    sv.remove_suffix(1);
  }
  return sv;
}

/// Делит строку по пробельным символам
std::vector<std::string_view> split_ws(std::string_view sv) {
  std::vector<std::string_view> out;
  std::size_t i = 0;
  while (i < sv.size()) {
    while (i < sv.size() && std::isspace(static_cast<unsigned char>(sv[i]))) {
      ++i;
    }
    std::size_t start = i;
    while (i < sv.size() && !std::isspace(static_cast<unsigned char>(sv[i]))) {
      ++i;
    }
    if (i > start) {
      out.push_back(sv.substr(start, i - start));
    }
  }
  return out;
}

std::mt19937_64 make_rng(std::uint64_t seed) {
  if (seed == 0) {
    std::random_device rd;
    seed = (static_cast<std::uint64_t>(rd()) << 32) | rd();
  }
  return std::mt19937_64{seed};
}

std::size_t count_focus(const Word &word, const std::vector<Char> &focus) {
  std::size_t n = 0;
  for (Char c : word) {
    if (std::find(focus.begin(), focus.end(), c) != focus.end()) {
      ++n;
    }
  }
  return n;
}

} // namespace

bool parse_corpus_record(std::string_view line, WeightedWord &out) {
  auto fields = split_ws(line);
  if (fields.size() != 2) {
    return false;
  }

  Word word = decode_utf8(fields[0]);
  // Декодер молча выбрасывает битые байты: сверяем длину обратно
  if (word.empty() || word.size() > kMaxCorpusWordLen ||
      encode_utf8(word).size() != fields[0].size()) {
    return false;
  }
  if (!std::all_of(word.begin(), word.end(), is_word_char)) {
    return false;
  }

  // Только десятичная запись: strtod принял бы ещё 0x.., inf и nan
  if (fields[1].find_first_not_of("0123456789.eE+-") !=
      std::string_view::npos) {
    return false;
  }

  std::string weight_str{fields[1]};
  char *end = nullptr;
  double weight = std::strtod(weight_str.c_str(), &end);
  if (end != weight_str.c_str() + weight_str.size() || !std::isfinite(weight) ||
      weight < 0.0) {
    return false;
  }

  out.word = std::move(word);
  out.weight = weight;
  return true;
}

WordSource::WordSource() : rng_{make_rng(0)} {}

WordSource::WordSource(std::vector<WeightedWord> entries, std::uint64_t seed)
    : rng_{make_rng(seed)} {
  // Нулевые веса никогда не выпадут: не держим их в таблице.
  // Слово длиннее kMaxCorpusWordLen может не влезть ни в одну строку.
  entries.erase(std::remove_if(entries.begin(), entries.end(),
                               [](const WeightedWord &e) {
                                 return e.word.empty() ||
                                        e.word.size() > kMaxCorpusWordLen ||
                                        !std::all_of(e.word.begin(),
                                                     e.word.end(),
                                                     is_word_char) ||
                                        !(e.weight > 0.0);
                               }),
                entries.end());
  entries_ = std::move(entries);

  std::vector<double> weights;
  weights.reserve(entries_.size());
  for (const auto &e : entries_) {
    weights.push_back(e.weight);
    total_weight_ += e.weight;
  }
  dist_ = std::discrete_distribution<std::size_t>(weights.begin(),
                                                  weights.end());
}

void WordSource::seed(std::uint64_t seed) {
  rng_ = make_rng(seed);
  dist_.reset();
}

Word WordSource::random_word() {
  if (entries_.empty()) {
    std::uniform_int_distribution<std::size_t> pick(
        0, std::size(kFallbackWords) - 1);
    return Word{kFallbackWords[pick(rng_)]};
  }
  return entries_[dist_(rng_)].word;
}

std::vector<Word> WordSource::random_words(const WordRequest &request) {
  std::vector<Word> out;
  out.reserve(request.count);

  for (std::size_t i = 0; i < request.count; ++i) {
    Word best = random_word();
    if (!request.focus.empty()) {
      std::size_t best_score = count_focus(best, request.focus);
      for (std::size_t k = 1; k < kEmphasisCandidates; ++k) {
        Word candidate = random_word();
        std::size_t score = count_focus(candidate, request.focus);
        if (score > best_score) {
          best = std::move(candidate);
          best_score = score;
        }
      }
    }
    out.push_back(std::move(best));
  }

  return out;
}

WordSourceLoadOutcome WordSource::load_checked(const std::filesystem::path &path,
                                               const CorpusOptions &options) {
  WordSourceLoadOutcome out;

  std::ifstream file{path};
  if (!file.is_open()) {
    out.result = LoadResult::IoError;
    out.error = "Corpus not readable: " + path.string();
    return out;
  }

  SpellFilter spell;
  if (options.spellcheck) {
    spell.initialize();
  }

  std::vector<WeightedWord> entries;
  std::string line;
  bool first_line = true;

  while (std::getline(file, line)) {
    std::string_view sv = trim(line);

    // Заголовок версии допустим только первой непустой строкой
    if (first_line && sv.starts_with(kHeaderPrefix)) {
      first_line = false;
      std::string_view version = trim(sv.substr(kHeaderPrefix.size()));
      if (version != kSupportedVersion) {
        out.result = LoadResult::UnsupportedVersion;
        out.error = "Unsupported corpus version '" + std::string{version} +
                    "' in: " + path.string();
        return out;
      }
      continue;
    }

    if (sv.empty() || sv.front() == '#') {
      continue;
    }
    first_line = false;

    WeightedWord entry;
    if (!parse_corpus_record(sv, entry)) {
      ++out.skipped;
      continue;
    }
    if (options.spellcheck && !spell.accepts(encode_utf8(entry.word))) {
      ++out.skipped;
      continue;
    }
    entries.push_back(std::move(entry));
  }

  if (file.bad()) {
    out.result = LoadResult::IoError;
    out.error = "Read error in corpus: " + path.string();
    return out;
  }

  out.source = WordSource{std::move(entries), options.seed};
  out.loaded = out.source.size();
  out.result = LoadResult::Ok;
  return out;
}

WordSource WordSource::load(const std::filesystem::path &path,
                            const CorpusOptions &options) {
  WordSourceLoadOutcome out = load_checked(path, options);
  if (out.result != LoadResult::Ok) {
    std::cerr << "[linkage] Warning: " << out.error
              << ", using built-in vocabulary\n";
    WordSource fallback;
    fallback.seed(options.seed);
    return fallback;
  }

  std::cerr << "[linkage] Loaded corpus: " << path.string() << " ("
            << out.loaded << " words, " << out.skipped << " skipped)\n";
  if (out.source.is_fallback()) {
    std::cerr << "[linkage] Warning: corpus has no positive weights, "
                 "using built-in vocabulary\n";
  }
  return std::move(out.source);
}

} // namespace linkage
