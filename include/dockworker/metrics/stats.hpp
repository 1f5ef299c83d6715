#pragma once

#include "dockworker/core/coroutine.hpp"
#include "dockworker/core/error.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>

namespace dockworker {

struct TimingStats {
  std::uint64_t count{0};
  std::chrono::milliseconds total{0};
  std::chrono::milliseconds max{0};
};

// Process-wide counters, gauges and timers. Shared by concurrent task runs,
// so every update takes the lock.
class Stats {
public:
  auto increment(std::string_view name, std::int64_t by = 1) -> void;
  auto gauge(std::string_view name, double value) -> void;
  auto record_timing(std::string_view name, std::chrono::milliseconds elapsed)
      -> void;

  [[nodiscard]] auto counter(std::string_view name) const -> std::int64_t;
  [[nodiscard]] auto gauge_value(std::string_view name) const -> double;
  [[nodiscard]] auto timing(std::string_view name) const -> TimingStats;

  [[nodiscard]] auto snapshot() const -> nlohmann::json;
  auto log_snapshot() const -> void;

  // Awaits `inner` and records how long it took under `name`.
  template <typename T>
  auto time(std::string name, task<T> inner) -> task<T> {
    auto start = std::chrono::steady_clock::now();
    if constexpr (std::is_void_v<T>) {
      co_await std::move(inner);
      record_timing(name, elapsed_since(start));
    } else {
      auto result = co_await std::move(inner);
      record_timing(name, elapsed_since(start));
      co_return result;
    }
  }

private:
  static auto elapsed_since(std::chrono::steady_clock::time_point start)
      -> std::chrono::milliseconds {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
  }

  mutable std::mutex mutex_;
  std::map<std::string, std::int64_t, std::less<>> counters_;
  std::map<std::string, double, std::less<>> gauges_;
  std::map<std::string, TimingStats, std::less<>> timings_;
};

}  // namespace dockworker
