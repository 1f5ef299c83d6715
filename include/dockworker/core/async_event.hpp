#pragma once

#include "dockworker/core/coroutine.hpp"

#include <coroutine>
#include <vector>

namespace dockworker {

// Manual-reset event for coroutines sharing one scheduler. Waiters are
// resumed through the scheduler, never inline from set().
class AsyncEvent {
public:
  explicit AsyncEvent(scheduler& sched) noexcept : sched_{&sched} {
  }

  AsyncEvent(const AsyncEvent&) = delete;
  AsyncEvent& operator=(const AsyncEvent&) = delete;

  auto set() noexcept -> void {
    if (set_) {
      return;
    }
    set_ = true;
    auto waiters = std::exchange(waiters_, {});
    for (auto h : waiters) {
      sched_->schedule(h);
    }
  }

  auto reset() noexcept -> void {
    set_ = false;
  }

  [[nodiscard]] auto is_set() const noexcept -> bool {
    return set_;
  }

  class awaiter {
  public:
    explicit awaiter(AsyncEvent& event) noexcept : event_{event} {
    }

    [[nodiscard]] auto await_ready() const noexcept -> bool {
      return event_.set_;
    }

    auto await_suspend(std::coroutine_handle<> handle) -> void {
      event_.waiters_.push_back(handle);
    }

    auto await_resume() const noexcept -> void {
    }

  private:
    AsyncEvent& event_;
  };

  [[nodiscard]] auto wait() noexcept -> awaiter {
    return awaiter{*this};
  }

private:
  scheduler* sched_;
  bool set_{false};
  std::vector<std::coroutine_handle<>> waiters_;
};

}  // namespace dockworker
