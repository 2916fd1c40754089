/**
 * @file profile_store.cpp
 * @brief Реализация набора профилей
 */

#include "linkage/profile_store.hpp"

#include <cstdlib>
#include <iostream>
#include <utility>

namespace linkage {

namespace {

[[noreturn]] void fatal_no_active_profile(std::size_t index,
                                          std::size_t size) {
  std::cerr << "[linkage] FATAL: no active profile (index=" << index
            << ", size=" << size << ")\n";
  std::abort();
}

SessionOptions session_options(const TrainingConfig &t) {
  SessionOptions o;
  o.chars_per_line = t.chars_per_line;
  o.max_errors = t.max_errors;
  o.next_lines = t.next_lines;
  o.score_line_end = t.score_line_end;
  return o;
}

TrackerOptions tracker_options(const TrainingConfig &t) {
  TrackerOptions o;
  o.refill_threshold = t.refill_threshold;
  o.word_batch = t.word_batch;
  o.min_clean = t.min_clean;
  o.focus_letters = t.focus_letters;
  return o;
}

} // namespace

ProfileStore::ProfileStore(std::shared_ptr<WordSource> source,
                           TrainingConfig training)
    : source_{source ? std::move(source) : std::make_shared<WordSource>()},
      training_{training} {
  profiles_.push_back(make_profile(std::string{kDefaultProfileName},
                                   std::string{kDefaultLayout}));
}

Profile ProfileStore::make_profile(std::string name,
                                   std::string layout) const {
  return Profile{std::move(name), std::move(layout),
                 ProficiencyTracker{tracker_options(training_)},
                 Session{source_, session_options(training_)}};
}

ProfileStore ProfileStore::from_records(
    std::shared_ptr<WordSource> source, TrainingConfig training,
    const std::vector<ProfileRecord> &records, std::size_t active) {
  ProfileStore store{std::move(source), training};
  if (records.empty()) {
    return store;
  }

  store.profiles_.clear();
  for (const auto &rec : records) {
    Profile p = store.make_profile(rec.name, rec.layout);
    for (const auto &[c, s] : rec.stats) {
      p.tracker.set_stat(c, s);
    }
    store.profiles_.push_back(std::move(p));
  }
  store.active_ = active < store.profiles_.size() ? active : 0;
  return store;
}

ProfileStore ProfileStore::load(const std::filesystem::path &path,
                                std::shared_ptr<WordSource> source,
                                TrainingConfig training) {
  ProfilesLoadOutcome out = load_profiles_checked(path);
  if (out.result != LoadResult::Ok) {
    std::cerr << "[linkage] Warning: " << out.error
              << ", starting with a default profile\n";
    return ProfileStore{std::move(source), training};
  }

  std::cerr << "[linkage] Loaded profiles: " << path.string() << " ("
            << out.records.size() << " profiles, " << out.skipped
            << " lines skipped)\n";
  return from_records(std::move(source), training, out.records, out.active);
}

StorageResult ProfileStore::save(const std::filesystem::path &path) const {
  return save_profiles(path, to_records(), active_);
}

std::vector<ProfileRecord> ProfileStore::to_records() const {
  std::vector<ProfileRecord> records;
  records.reserve(profiles_.size());
  for (const auto &p : profiles_) {
    records.push_back(ProfileRecord{p.name, p.layout, p.tracker.stats()});
  }
  return records;
}

Profile &ProfileStore::active() {
  if (active_ >= profiles_.size()) {
    fatal_no_active_profile(active_, profiles_.size());
  }
  return profiles_[active_];
}

const Profile &ProfileStore::active() const {
  if (active_ >= profiles_.size()) {
    fatal_no_active_profile(active_, profiles_.size());
  }
  return profiles_[active_];
}

bool ProfileStore::select(std::size_t index) noexcept {
  if (index >= profiles_.size()) {
    return false;
  }
  active_ = index;
  return true;
}

std::size_t ProfileStore::add(std::string name, std::string layout) {
  profiles_.push_back(make_profile(std::move(name), std::move(layout)));
  return profiles_.size() - 1;
}

bool ProfileStore::remove(std::size_t index) {
  if (profiles_.size() <= 1 || index >= profiles_.size()) {
    return false;
  }

  profiles_.erase(profiles_.begin() + static_cast<std::ptrdiff_t>(index));

  // Активный профиль остаётся тем же, если удалён не он
  if (index < active_) {
    --active_;
  } else if (active_ >= profiles_.size()) {
    active_ = profiles_.size() - 1;
  }
  return true;
}

} // namespace linkage
