/**
 * @file persistence.hpp
 * @brief Асинхронная загрузка при старте и сохранение при выходе
 *
 * Вся работа с диском вынесена из горячего пути нажатий: загрузка должна
 * полностью завершиться до приёма ввода, сохранение движок не ждёт —
 * future ждёт хост перед выходом из процесса.
 */

#pragma once

#include <filesystem>
#include <future>
#include <memory>
#include <vector>

#include "linkage/config.hpp"
#include "linkage/profile_store.hpp"
#include "linkage/profile_storage.hpp"
#include "linkage/word_source.hpp"

namespace linkage {

/// Состояние, готовое для построения Engine
struct LoadedState {
  std::shared_ptr<WordSource> source;
  ProfileStore profiles;
};

/**
 * @brief Загружает корпус, затем профили (с фолбэками на дефолты)
 */
[[nodiscard]] LoadedState load_state(const Config &config);

/// То же в отдельном потоке
[[nodiscard]] std::future<LoadedState> load_state_async(Config config);

/**
 * @brief Сохраняет снимок профилей в отдельном потоке
 * @param records Снимок (копия, движок может продолжать работу)
 */
[[nodiscard]] std::future<StorageResult>
save_state_async(std::vector<ProfileRecord> records, std::size_t active,
                 std::filesystem::path path);

} // namespace linkage
