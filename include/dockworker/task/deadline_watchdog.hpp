#pragma once

#include "dockworker/core/coroutine.hpp"
#include "dockworker/core/timer.hpp"
#include "dockworker/metrics/stats.hpp"
#include "dockworker/task/container_executor.hpp"
#include "dockworker/task/log_format.hpp"
#include "dockworker/task/log_stream.hpp"

#include <chrono>

namespace dockworker {

// Bounds a run's wall time. On expiry it kills the container and notes the
// timeout in the transcript; the exit code decides the outcome.
class DeadlineWatchdog {
public:
  DeadlineWatchdog(TimerService& timers, scheduler& sched,
                   ContainerExecutor& executor, LogStream& log, Stats& stats,
                   const LogFormatter& formatter);
  ~DeadlineWatchdog();

  DeadlineWatchdog(const DeadlineWatchdog&) = delete;
  DeadlineWatchdog& operator=(const DeadlineWatchdog&) = delete;

  auto arm(std::chrono::seconds max_run_time) -> void;
  auto disarm() noexcept -> void;

  [[nodiscard]] auto armed() const noexcept -> bool {
    return timer_ != kInvalidTimer;
  }
  [[nodiscard]] auto fired() const noexcept -> bool {
    return fired_;
  }
  [[nodiscard]] auto duration() const noexcept -> std::chrono::milliseconds {
    return duration_;
  }

private:
  auto expire() -> void;
  static auto force_kill(ContainerExecutor& executor) -> spawn_task;

  TimerService& timers_;
  scheduler& sched_;
  ContainerExecutor& executor_;
  LogStream& log_;
  Stats& stats_;
  const LogFormatter& formatter_;
  TimerId timer_{kInvalidTimer};
  std::chrono::milliseconds duration_{0};
  int max_run_time_{0};
  bool fired_{false};
};

}  // namespace dockworker
