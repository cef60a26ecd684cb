#pragma once

#include "benchdock/util/record_queue.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <memory>
#include <mutex>
#include <print>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace benchdock::log {

[[nodiscard]] constexpr auto level_name(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view names[] = {"trace", "debug", "info", "warn",
                                        "error"};
  return names[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto level_color(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view colors[] = {
      "\033[90m",  // trace: gray
      "\033[36m",  // debug: cyan
      "\033[32m",  // info: green
      "\033[33m",  // warn: yellow
      "\033[31m"   // error: red
  };
  return colors[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto parse_level(std::string_view name) noexcept
    -> Level {
  if (name == "trace")
    return Level::Trace;
  if (name == "debug")
    return Level::Debug;
  if (name == "warn" || name == "warning")
    return Level::Warn;
  if (name == "error")
    return Level::Error;
  return Level::Info;
}

// Asynchronous logger: producers format a Record and offer it to a bounded
// queue, a single writer thread prints to the console and the optional file.
class Logger {
  static constexpr std::size_t QUEUE_CAPACITY = 8192;
  static constexpr std::size_t BATCH_SIZE = 64;

  struct FileCloser {
    void operator()(std::FILE* f) const {
      if (f)
        std::fclose(f);
    }
  };

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<bool> accepting_{false};
  RecordQueue queue_{QUEUE_CAPACITY};
  std::thread writer_;
  std::mutex sink_mutex_;
  std::unique_ptr<std::FILE, FileCloser> file_;

  auto emit(const Record& rec) -> void {
    std::lock_guard lock(sink_mutex_);
    std::print("[{}] [{}{}\033[0m] [{}] {}\n", rec.stamp,
               level_color(rec.level), level_name(rec.level), rec.tid,
               rec.message);
    if (file_) {
      std::print(file_.get(), "[{}] [{}] [{}] {}\n", rec.stamp,
                 level_name(rec.level), rec.tid, rec.message);
      std::fflush(file_.get());
    }
  }

  auto writer_loop() -> void {
    std::vector<Record> batch;
    batch.reserve(BATCH_SIZE);

    while (running_.load(std::memory_order_acquire)) {
      batch.clear();
      if (queue_.drain(batch, BATCH_SIZE) == 0) {
        std::this_thread::sleep_for(std::chrono::microseconds(100));
        continue;
      }
      for (const auto& rec : batch) {
        emit(rec);
      }
    }

    // accepting_ is already false here, nothing new can be queued
    do {
      batch.clear();
      queue_.drain(batch, BATCH_SIZE);
      for (const auto& rec : batch) {
        emit(rec);
      }
    } while (!batch.empty());
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  auto start() -> void {
    if (running_.exchange(true))
      return;
    accepting_.store(true, std::memory_order_release);
    writer_ = std::thread([this] { writer_loop(); });
  }

  auto stop() -> void {
    accepting_.store(false, std::memory_order_release);
    std::atomic_thread_fence(std::memory_order_seq_cst);

    if (!running_.exchange(false))
      return;

    if (writer_.joinable()) {
      writer_.join();
    }
  }

  // Appends to `path` in addition to the console. An empty path closes the
  // current file sink.
  auto set_file(const std::string& path) -> bool {
    std::lock_guard lock(sink_mutex_);
    file_.reset();
    if (path.empty())
      return true;
    file_.reset(std::fopen(path.c_str(), "a"));
    return file_ != nullptr;
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args&&... args)
      -> void {
    if (level < level_.load(std::memory_order_acquire))
      return;

    auto now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    Record rec{
        .level = level,
        .stamp = std::format("{:%Y-%m-%d %H:%M:%S}", now),
        .tid = std::hash<std::thread::id>{}(std::this_thread::get_id()) %
               1000000,
        .message = std::format(fmt, std::forward<Args>(args)...),
    };

    // Synchronous while stopped or when the queue is full
    if (!accepting_.load(std::memory_order_acquire) || !queue_.offer(rec)) {
      emit(rec);
    }
  }
};

inline Logger& logger() {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name));
}

inline auto set_file(const std::string& path) -> bool {
  return logger().set_file(path);
}

inline auto start() -> void {
  logger().start();
}
inline auto stop() -> void {
  logger().stop();
}

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

}  // namespace benchdock::log
