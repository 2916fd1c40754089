/**
 * @file event_loop.hpp
 * @brief Главный цикл: поток ввода -> очередь -> владелец движка
 *
 * Поток ввода читает байты (UTF-8) из файлового дескриптора и превращает их
 * в InputEvent. Движок трогает только поток, вызвавший run().
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <ostream>
#include <stop_token>

#include "linkage/concurrent_queue.hpp"
#include "linkage/engine.hpp"

namespace linkage {

class EventLoop {
public:
  /**
   * @brief Конструктор
   * @param engine Движок (владеет вызывающий, должен пережить цикл)
   * @param input_fd Дескриптор ввода (обычно STDIN_FILENO)
   * @param out Поток для отчёта о строках
   */
  EventLoop(Engine &engine, int input_fd, std::ostream &out);

  // Запрет копирования
  EventLoop(const EventLoop &) = delete;
  EventLoop &operator=(const EventLoop &) = delete;

  /**
   * @brief Запрашивает остановку цикла
   *
   * Thread-safe. Может вызываться из signal handler.
   */
  void request_stop() noexcept;

  /**
   * @brief Запускает цикл до EOF, Ctrl+D или request_stop()
   * @return Код возврата (0 = успех)
   */
  [[nodiscard]] int run();

  /// Печатает таблицу чистоты по символам с severity
  void print_summary() const;

  [[nodiscard]] std::size_t lines_completed() const noexcept {
    return lines_;
  }

private:
  /// Поток ввода: байты -> события
  void reader_main(std::stop_token st);

  void report_line(const CompletedLine &line);

  Engine &engine_;
  int input_fd_;
  std::ostream &out_;

  ConcurrentQueue<InputEvent> events_;
  std::atomic<bool> stop_requested_{false};
  std::size_t lines_ = 0;
};

} // namespace linkage
