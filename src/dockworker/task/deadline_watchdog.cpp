#include "dockworker/task/deadline_watchdog.hpp"

#include "dockworker/util/log.hpp"

namespace dockworker {

DeadlineWatchdog::DeadlineWatchdog(TimerService& timers, scheduler& sched,
                                   ContainerExecutor& executor, LogStream& log,
                                   Stats& stats, const LogFormatter& formatter)
    : timers_(timers),
      sched_(sched),
      executor_(executor),
      log_(log),
      stats_(stats),
      formatter_(formatter) {
}

DeadlineWatchdog::~DeadlineWatchdog() {
  disarm();
}

auto DeadlineWatchdog::arm(std::chrono::seconds max_run_time) -> void {
  disarm();
  fired_ = false;
  max_run_time_ = static_cast<int>(max_run_time.count());
  duration_ = std::chrono::duration_cast<std::chrono::milliseconds>(max_run_time);
  timer_ = timers_.schedule_after(duration_, [this] { expire(); });
}

auto DeadlineWatchdog::disarm() noexcept -> void {
  if (timer_ != kInvalidTimer) {
    timers_.cancel(timer_);
    timer_ = kInvalidTimer;
  }
}

auto DeadlineWatchdog::expire() -> void {
  timer_ = kInvalidTimer;
  fired_ = true;
  log::warn("max run time of {}s reached, killing container", max_run_time_);

  stats_.increment("tasks.timed_out");
  stats_.gauge("tasks.timed_out.max_run_time", max_run_time_);

  spawn(sched_, force_kill(executor_));
  log_.write(formatter_.timeout(max_run_time_));
}

auto DeadlineWatchdog::force_kill(ContainerExecutor& executor) -> spawn_task {
  auto killed = co_await executor.kill();
  if (!killed) {
    log::error("deadline kill failed: {}", killed.error().message());
  }
}

}  // namespace dockworker
