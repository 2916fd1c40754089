/**
 * @file profile_storage.hpp
 * @brief Чтение и запись хранилища профилей
 *
 * Формат v1 (UTF-8, поля через TAB):
 *   #!linkage-profiles 1
 *   active  0
 *   profile <имя> <раскладка>
 *   stat    <hex-код символа> <clean> <dirty>   -- к последнему profile
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "linkage/proficiency_tracker.hpp"
#include "linkage/types.hpp"

namespace linkage {

/// Запись одного профиля
struct ProfileRecord {
  std::string name;
  std::string layout;
  std::map<Char, LetterStat> stats;
};

/// Результат чтения хранилища (без скрытых фолбэков)
struct ProfilesLoadOutcome {
  std::vector<ProfileRecord> records;
  std::size_t active = 0;
  LoadResult result = LoadResult::Ok;
  std::size_t skipped = 0; // кривые строки
  std::string error;
};

/**
 * @brief Читает профили из файла
 *
 * Активный индекс вне диапазона сбрасывается в 0.
 */
[[nodiscard]] ProfilesLoadOutcome
load_profiles_checked(const std::filesystem::path &path);

/// Разбирает хранилище из потока
[[nodiscard]] ProfilesLoadOutcome parse_profiles(std::istream &in);

/**
 * @brief Пишет профили в файл (через временный файл + rename)
 */
[[nodiscard]] StorageResult
save_profiles(const std::filesystem::path &path,
              const std::vector<ProfileRecord> &records, std::size_t active);

/// Сериализует профили в поток
void write_profiles(std::ostream &out,
                    const std::vector<ProfileRecord> &records,
                    std::size_t active);

} // namespace linkage
