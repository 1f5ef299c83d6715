#include "dockworker/metrics/stats.hpp"

#include "dockworker/util/log.hpp"

#include <algorithm>

namespace dockworker {

auto Stats::increment(std::string_view name, std::int64_t by) -> void {
  std::lock_guard lock(mutex_);
  auto it = counters_.find(name);
  if (it == counters_.end()) {
    counters_.emplace(std::string(name), by);
  } else {
    it->second += by;
  }
}

auto Stats::gauge(std::string_view name, double value) -> void {
  std::lock_guard lock(mutex_);
  auto it = gauges_.find(name);
  if (it == gauges_.end()) {
    gauges_.emplace(std::string(name), value);
  } else {
    it->second = value;
  }
}

auto Stats::record_timing(std::string_view name,
                          std::chrono::milliseconds elapsed) -> void {
  std::lock_guard lock(mutex_);
  auto it = timings_.find(name);
  if (it == timings_.end()) {
    it = timings_.emplace(std::string(name), TimingStats{}).first;
  }
  auto& t = it->second;
  ++t.count;
  t.total += elapsed;
  t.max = std::max(t.max, elapsed);
}

auto Stats::counter(std::string_view name) const -> std::int64_t {
  std::lock_guard lock(mutex_);
  auto it = counters_.find(name);
  return it == counters_.end() ? 0 : it->second;
}

auto Stats::gauge_value(std::string_view name) const -> double {
  std::lock_guard lock(mutex_);
  auto it = gauges_.find(name);
  return it == gauges_.end() ? 0.0 : it->second;
}

auto Stats::timing(std::string_view name) const -> TimingStats {
  std::lock_guard lock(mutex_);
  auto it = timings_.find(name);
  return it == timings_.end() ? TimingStats{} : it->second;
}

auto Stats::snapshot() const -> nlohmann::json {
  std::lock_guard lock(mutex_);
  nlohmann::json out;
  out["counters"] = nlohmann::json::object();
  for (const auto& [name, value] : counters_) {
    out["counters"][name] = value;
  }
  out["gauges"] = nlohmann::json::object();
  for (const auto& [name, value] : gauges_) {
    out["gauges"][name] = value;
  }
  out["timers"] = nlohmann::json::object();
  for (const auto& [name, t] : timings_) {
    out["timers"][name] = {{"count", t.count},
                           {"total_ms", t.total.count()},
                           {"max_ms", t.max.count()}};
  }
  return out;
}

auto Stats::log_snapshot() const -> void {
  log::info("stats {}", snapshot().dump());
}

}  // namespace dockworker
