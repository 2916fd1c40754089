/**
 * @file persistence.cpp
 * @brief Реализация загрузки/сохранения состояния
 */

#include "linkage/persistence.hpp"

#include <iostream>
#include <utility>

namespace linkage {

LoadedState load_state(const Config &config) {
  CorpusOptions options;
  options.spellcheck = config.corpus.spellcheck;
  options.seed = config.corpus.seed;

  auto source =
      std::make_shared<WordSource>(WordSource::load(config.corpus.path, options));

  std::filesystem::path profiles_path = config.profiles.path.empty()
                                            ? default_profiles_path()
                                            : config.profiles.path;
  ProfileStore profiles =
      ProfileStore::load(profiles_path, source, config.training);

  return LoadedState{std::move(source), std::move(profiles)};
}

std::future<LoadedState> load_state_async(Config config) {
  return std::async(std::launch::async, [config = std::move(config)] {
    return load_state(config);
  });
}

std::future<StorageResult>
save_state_async(std::vector<ProfileRecord> records, std::size_t active,
                 std::filesystem::path path) {
  return std::async(std::launch::async, [records = std::move(records), active,
                                         path = std::move(path)] {
    StorageResult res = save_profiles(path, records, active);
    if (res != StorageResult::Ok) {
      std::cerr << "[linkage] Warning: failed to save profiles to "
                << path.string() << "\n";
    } else {
      std::cerr << "[linkage] Saved " << records.size() << " profiles to "
                << path.string() << "\n";
    }
    return res;
  });
}

} // namespace linkage
