#pragma once

#include "dockworker/core/mpsc_queue.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <format>
#include <mutex>
#include <print>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace dockworker::log {

enum class Level : std::uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error
};

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
  if (name == "warn")
    return Level::Warn;
  if (name == "error")
    return Level::Error;
  return Level::Info;
}

// Async process logger. Producers format on their own thread and hand the
// line to a single writer thread; a full queue degrades to a direct write.
class Logger {
  static constexpr std::size_t QUEUE_CAPACITY = 8192;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<bool> accepting_{false};
  BoundedMPSCQueue<std::string> queue_{QUEUE_CAPACITY};
  std::thread writer_;

  std::mutex output_mutex_;
  std::FILE* output_{stdout};
  bool owns_output_{false};
  bool colored_{true};

  auto emit(std::string_view line) -> void {
    std::scoped_lock lock(output_mutex_);
    std::print(output_, "{}", line);
  }

  auto writer_loop() -> void {
    std::vector<std::string> batch;
    batch.reserve(64);

    while (running_.load(std::memory_order_acquire)) {
      batch.clear();
      while (batch.size() < 64) {
        if (auto msg = queue_.try_pop()) {
          batch.push_back(std::move(*msg));
        } else {
          break;
        }
      }
      for (const auto& msg : batch) {
        emit(msg);
      }
      if (batch.empty()) {
        std::this_thread::sleep_for(std::chrono::microseconds(100));
      }
    }

    // accepting_ is already false here, so the queue only shrinks.
    while (auto msg = queue_.try_pop()) {
      emit(*msg);
    }
    std::scoped_lock lock(output_mutex_);
    std::fflush(output_);
  }

  template <typename... Args>
  auto format_line(Level level, std::format_string<Args...> fmt,
                   Args&&... args) -> std::string {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::floor<std::chrono::milliseconds>(now);
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    if (colored_) {
      return std::format("[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] {}\n", time,
                         level_color(level), level_name(level), "\033[0m", tid,
                         std::format(fmt, std::forward<Args>(args)...));
    }
    return std::format("[{:%Y-%m-%d %H:%M:%S}] [{}] [{}] {}\n", time,
                       level_name(level), tid,
                       std::format(fmt, std::forward<Args>(args)...));
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
    if (owns_output_ && output_) {
      std::fclose(output_);
    }
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

  // Redirects output to a file (appending). Colors are dropped for files.
  auto set_output_file(const std::string& path) -> bool {
    auto* file = std::fopen(path.c_str(), "a");
    if (!file) {
      return false;
    }
    std::scoped_lock lock(output_mutex_);
    if (owns_output_ && output_) {
      std::fclose(output_);
    }
    output_ = file;
    owns_output_ = true;
    colored_ = false;
    return true;
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

    auto line = format_line(level, fmt, std::forward<Args>(args)...);
    if (!accepting_.load(std::memory_order_acquire) ||
        !queue_.push(line)) {
      emit(line);
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

inline auto set_output_file(const std::string& path) -> bool {
  return logger().set_output_file(path);
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

}  // namespace dockworker::log
