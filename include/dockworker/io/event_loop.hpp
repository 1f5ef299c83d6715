#pragma once

#include "dockworker/core/coroutine.hpp"
#include "dockworker/core/error.hpp"
#include "dockworker/core/mpsc_queue.hpp"
#include "dockworker/core/timer.hpp"

#include <sys/socket.h>

#include <chrono>
#include <coroutine>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <type_traits>
#include <unordered_map>

namespace dockworker::io {

inline constexpr std::uint32_t kDefaultQueueDepth = 256;

class EventLoop;

enum class IoOpType : std::uint8_t {
  Read,
  Write,
  Connect,
  Close,
};

struct IoRequest {
  IoOpType op{IoOpType::Read};
  int fd{-1};
  void* buf{nullptr};
  std::uint32_t len{0};
  const sockaddr* addr{nullptr};
  socklen_t addrlen{0};
};

// Tag at the front of every object whose address travels as io_uring
// user_data, so a completion can be routed without a lookup.
struct Completion {
  enum class Kind : std::uint8_t { Io, Timer, Wake };
  Kind kind;
};

class IoAwaitable : private Completion {
public:
  IoAwaitable(EventLoop& loop, IoRequest req) noexcept
      : Completion{Kind::Io}, loop_{&loop}, req_{req} {
  }

  IoAwaitable(const IoAwaitable&) = delete;
  IoAwaitable& operator=(const IoAwaitable&) = delete;
  IoAwaitable(IoAwaitable&&) = delete;
  IoAwaitable& operator=(IoAwaitable&&) = delete;

  [[nodiscard]] auto await_ready() const noexcept -> bool {
    return false;
  }

  auto await_suspend(std::coroutine_handle<> handle) noexcept -> bool;

  // Bytes transferred, or the errno reported by the kernel.
  [[nodiscard]] auto await_resume() const noexcept -> Result<std::size_t> {
    if (result_ < 0) {
      return std::unexpected{
          std::error_code{-result_, std::system_category()}};
    }
    return static_cast<std::size_t>(result_);
  }

private:
  friend class EventLoop;

  EventLoop* loop_;
  IoRequest req_;
  std::coroutine_handle<> handle_;
  std::int32_t result_{0};
};

// Single-threaded io_uring reactor. Everything except post() must be called
// from the thread currently running the loop.
class EventLoop : public scheduler, public TimerService {
public:
  explicit EventLoop(std::uint32_t queue_depth = kDefaultQueueDepth);
  ~EventLoop() override;

  EventLoop(const EventLoop&) = delete;
  EventLoop& operator=(const EventLoop&) = delete;

  [[nodiscard]] auto valid() const noexcept -> bool;

  auto schedule(std::coroutine_handle<> handle) noexcept -> void override;

  [[nodiscard]] auto now() const noexcept
      -> std::chrono::system_clock::time_point override;
  auto schedule_after(std::chrono::milliseconds delay, Callback cb)
      -> TimerId override;
  auto cancel(TimerId id) noexcept -> bool override;

  // Thread-safe hand-off onto the loop thread.
  auto post(std::move_only_function<void()> fn) -> bool;

  auto run() -> void;
  auto run_once(std::chrono::milliseconds timeout) -> std::size_t;
  auto stop() noexcept -> void;
  [[nodiscard]] auto stopped() const noexcept -> bool;

  [[nodiscard]] auto pending_timers() const noexcept -> std::size_t;

  template <typename T>
  auto block_on(task<T> t) -> T {
    if constexpr (std::is_void_v<T>) {
      bool done = false;
      spawn(*this, drive_void(std::move(t), &done));
      while (!done) {
        run_once(std::chrono::milliseconds(100));
      }
    } else {
      std::optional<T> result;
      spawn(*this, drive(std::move(t), &result));
      while (!result.has_value()) {
        run_once(std::chrono::milliseconds(100));
      }
      return std::move(*result);
    }
  }

  [[nodiscard]] auto async_read(int fd, std::span<std::byte> buf) noexcept
      -> IoAwaitable;
  [[nodiscard]] auto async_write(int fd, std::span<const std::byte> buf) noexcept
      -> IoAwaitable;
  [[nodiscard]] auto async_connect(int fd, const sockaddr* addr,
                                   socklen_t addrlen) noexcept -> IoAwaitable;
  [[nodiscard]] auto async_close(int fd) noexcept -> IoAwaitable;

private:
  friend class IoAwaitable;

  struct TimerEntry;
  struct Impl;

  template <typename T>
  static auto drive(task<T> t, std::optional<T>* out) -> spawn_task {
    out->emplace(co_await std::move(t));
  }

  static auto drive_void(task<void> t, bool* done) -> spawn_task {
    co_await std::move(t);
    *done = true;
  }

  auto submit_io(const IoRequest& req, Completion* completion) -> bool;
  auto process_completions() -> std::size_t;
  auto process_posted() -> std::size_t;
  auto process_ready() -> std::size_t;
  auto wake() noexcept -> void;

  std::unique_ptr<Impl> impl_;
  std::deque<std::coroutine_handle<>> ready_;
  BoundedMPSCQueue<std::move_only_function<void()>> posted_{1024};
  std::unordered_map<TimerId, std::unique_ptr<TimerEntry>> timers_;
  TimerId next_timer_id_{1};
  std::size_t live_timers_{0};
  bool stopped_{false};
};

}  // namespace dockworker::io
