/**
 * @file event_loop.cpp
 * @brief Реализация главного цикла
 */

#include "linkage/event_loop.hpp"
#include "linkage/utf8.hpp"

#include <cerrno>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <poll.h>
#include <string>
#include <thread>
#include <unistd.h>

namespace linkage {

namespace {

constexpr unsigned char kBackspace = 0x08;
constexpr unsigned char kDelete = 0x7F;
constexpr unsigned char kEndOfTransmission = 0x04; // Ctrl+D

constexpr auto kPollTick = std::chrono::milliseconds{50};

/// Копит байты многобайтового символа между вызовами read()
class Utf8Accumulator {
public:
  /// @return true если символ собран в out
  bool feed(unsigned char byte, Char &out) {
    if (pending_.empty()) {
      expected_ = utf8_char_len(byte);
      if (expected_ == 0) {
        return false; // Мусорный байт
      }
    } else if ((byte & 0xC0) != 0x80) {
      // Оборванная последовательность: начинаем заново с этого байта
      pending_.clear();
      return feed(byte, out);
    }

    pending_.push_back(static_cast<char>(byte));
    if (pending_.size() < expected_) {
      return false;
    }

    bool ok = decode_utf8_char(pending_, out);
    pending_.clear();
    return ok;
  }

private:
  std::string pending_;
  std::size_t expected_ = 0;
};

} // namespace

EventLoop::EventLoop(Engine &engine, int input_fd, std::ostream &out)
    : engine_{engine}, input_fd_{input_fd}, out_{out} {}

void EventLoop::request_stop() noexcept {
  stop_requested_.store(true, std::memory_order_relaxed);
}

void EventLoop::reader_main(std::stop_token st) {
  Utf8Accumulator utf8;
  pollfd pfd{input_fd_, POLLIN, 0};
  unsigned char buf[256];

  while (!st.stop_requested() &&
         !stop_requested_.load(std::memory_order_relaxed)) {
    pfd.revents = 0;
    int ret = poll(&pfd, 1, static_cast<int>(kPollTick.count()));
    if (ret == 0) {
      continue; // timeout
    }
    if (ret < 0) {
      if (errno == EINTR) {
        continue;
      }
      std::cerr << "[linkage] poll failed (errno=" << errno << ")\n";
      break;
    }

    if (!(pfd.revents & POLLIN)) {
      // Только HUP/ERR без данных — ввод закончен
      break;
    }

    ssize_t n = read(input_fd_, buf, sizeof(buf));
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      break; // EOF или ошибка
    }

    bool stop = false;
    for (ssize_t i = 0; i < n && !stop; ++i) {
      const unsigned char b = buf[i];
      if (b == kBackspace || b == kDelete) {
        events_.push(InputEvent::backspace());
      } else if (b == kEndOfTransmission) {
        events_.push(InputEvent::stop());
        stop = true;
      } else {
        Char c = 0;
        if (utf8.feed(b, c)) {
          events_.push(InputEvent::character(c));
        }
      }
    }
    if (stop) {
      break;
    }
  }

  events_.close();
}

int EventLoop::run() {
  engine_.fill_next_lines();

  std::jthread reader{[this](std::stop_token st) { reader_main(st); }};

  while (!stop_requested_.load(std::memory_order_relaxed)) {
    bool drained = false;
    auto event = events_.pop_wait_for(kPollTick, drained);
    if (!event) {
      if (drained) {
        break;
      }
      continue;
    }

    if (event->kind == InputEvent::Kind::Stop) {
      break;
    }

    LineStep step = engine_.handle(*event);
    if (auto *done = std::get_if<CompletedLine>(&step)) {
      report_line(*done);
    }
  }

  reader.request_stop();
  std::cerr << "[linkage] Event loop terminated gracefully (" << lines_
            << " lines)\n";
  return 0;
}

void EventLoop::report_line(const CompletedLine &line) {
  ++lines_;

  std::size_t clean = 0;
  for (const Hit &hit : line.hits) {
    if (!hit.dirty) {
      ++clean;
    }
  }

  out_ << "[" << lines_ << "] clean " << clean << "/" << line.hits.size()
       << "  " << encode_utf8(line.text) << "\n";
  out_.flush();
}

void EventLoop::print_summary() const {
  const auto &profile = engine_.profiles().active();
  out_ << "profile: " << profile.name << " (" << profile.layout << ")\n";

  for (const auto &[c, ratio] : engine_.clean_letters()) {
    const LetterStat s = profile.tracker.stat(c);
    out_ << "  " << (c == U' ' ? std::string{"░"} : encode_utf8(c))
         << "  " << std::fixed << std::setprecision(3) << ratio
         << "  severity " << std::setprecision(2) << engine_.severity(ratio)
         << "  (" << s.clean << "/" << (s.clean + s.dirty) << ")\n";
  }
  out_.flush();
}

} // namespace linkage
