/**
 * @file profile_store.hpp
 * @brief Набор профилей пользователя и активный профиль
 *
 * Инвариант: профилей всегда >= 1, активный индекс всегда валиден.
 * Хранилище создаётся с профилем по умолчанию, удалить последний нельзя.
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "linkage/config.hpp"
#include "linkage/proficiency_tracker.hpp"
#include "linkage/profile_storage.hpp"
#include "linkage/session.hpp"
#include "linkage/word_source.hpp"

namespace linkage {

/// Имя и раскладка профиля по умолчанию
inline constexpr std::string_view kDefaultProfileName = "default";
inline constexpr std::string_view kDefaultLayout = "qwerty";

struct Profile {
  std::string name;
  std::string layout;
  ProficiencyTracker tracker;
  Session session;

  /// Учитывает строку с учётом запаса внедрённых слов сессии
  [[nodiscard]] std::optional<WordRequest> add_line(const CompletedLine &line) {
    return tracker.add_line(line, session.pending_words());
  }
};

class ProfileStore {
public:
  /**
   * @brief Создаёт хранилище с одним профилем по умолчанию
   * @param source Общий источник слов для сессий
   * @param training Параметры сессий и трекеров
   */
  ProfileStore(std::shared_ptr<WordSource> source, TrainingConfig training);

  /**
   * @brief Восстанавливает хранилище из записей
   *
   * Пустой набор записей — профиль по умолчанию.
   */
  [[nodiscard]] static ProfileStore
  from_records(std::shared_ptr<WordSource> source, TrainingConfig training,
               const std::vector<ProfileRecord> &records, std::size_t active);

  /**
   * @brief Загружает хранилище (best-effort)
   *
   * Нечитаемый или пустой источник — профиль по умолчанию.
   */
  [[nodiscard]] static ProfileStore load(const std::filesystem::path &path,
                                         std::shared_ptr<WordSource> source,
                                         TrainingConfig training);

  /// Сохраняет все профили
  [[nodiscard]] StorageResult save(const std::filesystem::path &path) const;

  [[nodiscard]] std::vector<ProfileRecord> to_records() const;

  // =========================================================================
  // Активный профиль
  // =========================================================================

  [[nodiscard]] Profile &active();
  [[nodiscard]] const Profile &active() const;

  [[nodiscard]] Session &session() { return active().session; }
  [[nodiscard]] const Session &session() const { return active().session; }

  /**
   * @brief Делает профиль активным
   * @return false если индекс вне диапазона
   *
   * Состояние остальных профилей не сбрасывается.
   */
  bool select(std::size_t index) noexcept;

  // =========================================================================
  // Управление набором
  // =========================================================================

  /// Добавляет профиль, возвращает его индекс
  std::size_t add(std::string name, std::string layout);

  /**
   * @brief Удаляет профиль
   * @return false для последнего профиля или неверного индекса
   */
  bool remove(std::size_t index);

  [[nodiscard]] std::size_t size() const noexcept { return profiles_.size(); }
  [[nodiscard]] std::size_t active_index() const noexcept { return active_; }

  [[nodiscard]] std::span<const Profile> profiles() const noexcept {
    return profiles_;
  }

  /// Источник слов, общий для сессий всех профилей
  [[nodiscard]] const std::shared_ptr<WordSource> &source() const noexcept {
    return source_;
  }
  [[nodiscard]] const TrainingConfig &training() const noexcept {
    return training_;
  }

private:
  [[nodiscard]] Profile make_profile(std::string name,
                                     std::string layout) const;

  std::shared_ptr<WordSource> source_;
  TrainingConfig training_;
  std::vector<Profile> profiles_;
  std::size_t active_ = 0;
};

} // namespace linkage
