#pragma once

#include <chrono>
#include <coroutine>
#include <cstdint>
#include <functional>

namespace dockworker {

using TimerId = std::uint64_t;
inline constexpr TimerId kInvalidTimer = 0;

// One-shot timers. A cancelled timer's callback never runs, even when its
// expiry was already in flight at the moment of cancellation.
class TimerService {
public:
  using Callback = std::move_only_function<void()>;

  virtual ~TimerService() = default;

  // Wall clock used for lease arithmetic against queue timestamps.
  [[nodiscard]] virtual auto now() const noexcept
      -> std::chrono::system_clock::time_point = 0;

  virtual auto schedule_after(std::chrono::milliseconds delay, Callback cb)
      -> TimerId = 0;

  virtual auto cancel(TimerId id) noexcept -> bool = 0;
};

class sleep_awaiter {
public:
  sleep_awaiter(TimerService& timers, std::chrono::milliseconds delay) noexcept
      : timers_{timers}, delay_{delay} {
  }

  sleep_awaiter(const sleep_awaiter&) = delete;
  sleep_awaiter& operator=(const sleep_awaiter&) = delete;

  [[nodiscard]] auto await_ready() const noexcept -> bool {
    return delay_.count() <= 0;
  }

  auto await_suspend(std::coroutine_handle<> handle) -> void {
    timers_.schedule_after(delay_, [handle] { handle.resume(); });
  }

  auto await_resume() const noexcept -> void {
  }

private:
  TimerService& timers_;
  std::chrono::milliseconds delay_;
};

[[nodiscard]] inline auto sleep_for(TimerService& timers,
                                    std::chrono::milliseconds delay) noexcept
    -> sleep_awaiter {
  return sleep_awaiter{timers, delay};
}

}  // namespace dockworker
