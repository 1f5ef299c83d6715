#include "dockworker/io/event_loop.hpp"

#include "dockworker/util/log.hpp"

#include <liburing.h>
#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace dockworker::io {

struct EventLoop::TimerEntry : Completion {
  TimerId id{kInvalidTimer};
  __kernel_timespec ts{};
  Callback cb;
  bool cancelled{false};
};

struct EventLoop::Impl {
  io_uring ring{};
  bool initialized{false};
  int wake_fd{-1};
  Completion wake_token{Completion::Kind::Wake};
  std::uint64_t wake_buf{0};

  auto get_sqe() -> io_uring_sqe* {
    auto* sqe = io_uring_get_sqe(&ring);
    if (!sqe) {
      io_uring_submit(&ring);
      sqe = io_uring_get_sqe(&ring);
    }
    return sqe;
  }

  auto arm_wake_poll() -> void {
    auto* sqe = get_sqe();
    if (!sqe) {
      return;
    }
    io_uring_prep_poll_multishot(sqe, wake_fd, POLLIN);
    io_uring_sqe_set_data(sqe, &wake_token);
    io_uring_submit(&ring);
  }
};

auto IoAwaitable::await_suspend(std::coroutine_handle<> handle) noexcept
    -> bool {
  handle_ = handle;
  if (!loop_->submit_io(req_, this)) {
    result_ = -EAGAIN;
    return false;
  }
  return true;
}

EventLoop::EventLoop(std::uint32_t queue_depth)
    : impl_{std::make_unique<Impl>()} {
  if (int rc = io_uring_queue_init(queue_depth, &impl_->ring, 0); rc != 0) {
    log::error("io_uring_queue_init failed: {}", std::strerror(-rc));
    return;
  }
  impl_->initialized = true;

  impl_->wake_fd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
  if (impl_->wake_fd < 0) {
    log::error("eventfd failed: {}", std::strerror(errno));
    return;
  }
  impl_->arm_wake_poll();
}

EventLoop::~EventLoop() {
  if (impl_->initialized) {
    io_uring_queue_exit(&impl_->ring);
  }
  if (impl_->wake_fd >= 0) {
    ::close(impl_->wake_fd);
  }
  // Entries may only be released once the kernel no longer references them.
  timers_.clear();
}

auto EventLoop::valid() const noexcept -> bool {
  return impl_->initialized && impl_->wake_fd >= 0;
}

auto EventLoop::schedule(std::coroutine_handle<> handle) noexcept -> void {
  ready_.push_back(handle);
}

auto EventLoop::now() const noexcept -> std::chrono::system_clock::time_point {
  return std::chrono::system_clock::now();
}

auto EventLoop::schedule_after(std::chrono::milliseconds delay, Callback cb)
    -> TimerId {
  if (!impl_->initialized) {
    return kInvalidTimer;
  }
  auto* sqe = impl_->get_sqe();
  if (!sqe) {
    log::warn("submission queue full, timer dropped");
    return kInvalidTimer;
  }

  auto entry = std::make_unique<TimerEntry>();
  entry->kind = Completion::Kind::Timer;
  entry->id = next_timer_id_++;
  auto ms = std::max<std::int64_t>(delay.count(), 0);
  entry->ts.tv_sec = ms / 1000;
  entry->ts.tv_nsec = (ms % 1000) * 1'000'000;
  entry->cb = std::move(cb);

  io_uring_prep_timeout(sqe, &entry->ts, 0, 0);
  io_uring_sqe_set_data(sqe, static_cast<Completion*>(entry.get()));

  auto id = entry->id;
  timers_.emplace(id, std::move(entry));
  ++live_timers_;
  return id;
}

auto EventLoop::cancel(TimerId id) noexcept -> bool {
  auto it = timers_.find(id);
  if (it == timers_.end() || it->second->cancelled) {
    return false;
  }
  auto& entry = *it->second;
  entry.cancelled = true;
  entry.cb = nullptr;
  --live_timers_;

  // The entry stays allocated until the original timeout completes with
  // -ECANCELED (or -ETIME if it raced), so the kernel never sees freed memory.
  if (auto* sqe = impl_->get_sqe()) {
    io_uring_prep_timeout_remove(
        sqe, reinterpret_cast<std::uint64_t>(static_cast<Completion*>(&entry)),
        0);
    io_uring_sqe_set_data(sqe, nullptr);
  }
  return true;
}

auto EventLoop::pending_timers() const noexcept -> std::size_t {
  return live_timers_;
}

auto EventLoop::post(std::move_only_function<void()> fn) -> bool {
  if (!posted_.push(std::move(fn))) {
    return false;
  }
  wake();
  return true;
}

auto EventLoop::wake() noexcept -> void {
  if (impl_->wake_fd < 0) {
    return;
  }
  std::uint64_t one = 1;
  [[maybe_unused]] auto n = ::write(impl_->wake_fd, &one, sizeof(one));
}

auto EventLoop::submit_io(const IoRequest& req, Completion* completion)
    -> bool {
  if (!impl_->initialized) {
    return false;
  }
  auto* sqe = impl_->get_sqe();
  if (!sqe) {
    return false;
  }

  switch (req.op) {
    case IoOpType::Read:
      io_uring_prep_recv(sqe, req.fd, req.buf, req.len, 0);
      break;
    case IoOpType::Write:
      io_uring_prep_send(sqe, req.fd, req.buf, req.len, MSG_NOSIGNAL);
      break;
    case IoOpType::Connect:
      io_uring_prep_connect(sqe, req.fd, req.addr, req.addrlen);
      break;
    case IoOpType::Close:
      io_uring_prep_close(sqe, req.fd);
      break;
  }
  io_uring_sqe_set_data(sqe, completion);
  return true;
}

auto EventLoop::process_completions() -> std::size_t {
  std::size_t count = 0;
  io_uring_cqe* cqe = nullptr;
  while (io_uring_peek_cqe(&impl_->ring, &cqe) == 0 && cqe) {
    auto* completion = static_cast<Completion*>(io_uring_cqe_get_data(cqe));
    auto res = cqe->res;
    auto flags = cqe->flags;
    io_uring_cqe_seen(&impl_->ring, cqe);
    ++count;

    if (!completion) {
      continue;
    }

    switch (completion->kind) {
      case Completion::Kind::Io: {
        auto* op = static_cast<IoAwaitable*>(completion);
        op->result_ = res;
        ready_.push_back(op->handle_);
        break;
      }
      case Completion::Kind::Timer: {
        auto* entry = static_cast<TimerEntry*>(completion);
        auto it = timers_.find(entry->id);
        if (it == timers_.end()) {
          break;
        }
        auto owned = std::move(it->second);
        timers_.erase(it);
        if (!owned->cancelled) {
          --live_timers_;
          if (owned->cb) {
            owned->cb();
          }
        }
        break;
      }
      case Completion::Kind::Wake: {
        [[maybe_unused]] auto n =
            ::read(impl_->wake_fd, &impl_->wake_buf, sizeof(impl_->wake_buf));
        if ((flags & IORING_CQE_F_MORE) == 0) {
          // Multishot poll terminated; re-arm so later posts still wake us.
          impl_->arm_wake_poll();
        }
        break;
      }
    }
  }
  return count;
}

auto EventLoop::process_posted() -> std::size_t {
  std::size_t count = 0;
  while (auto fn = posted_.try_pop()) {
    (*fn)();
    ++count;
  }
  return count;
}

auto EventLoop::process_ready() -> std::size_t {
  std::size_t count = 0;
  // Only drain what is queued now; handles scheduled while resuming run on
  // the next turn.
  auto batch = std::exchange(ready_, {});
  for (auto h : batch) {
    h.resume();
    ++count;
  }
  return count;
}

auto EventLoop::run_once(std::chrono::milliseconds timeout) -> std::size_t {
  std::size_t work = process_posted();
  work += process_ready();

  if (!impl_->initialized) {
    return work;
  }

  io_uring_submit(&impl_->ring);

  if (work == 0 && ready_.empty()) {
    __kernel_timespec ts{.tv_sec = timeout.count() / 1000,
                         .tv_nsec = (timeout.count() % 1000) * 1'000'000};
    io_uring_cqe* cqe = nullptr;
    (void)io_uring_wait_cqe_timeout(&impl_->ring, &cqe, &ts);
  }

  work += process_completions();
  return work;
}

auto EventLoop::run() -> void {
  stopped_ = false;
  while (!stopped_) {
    run_once(std::chrono::milliseconds(100));
  }
}

auto EventLoop::stop() noexcept -> void {
  stopped_ = true;
  wake();
}

auto EventLoop::stopped() const noexcept -> bool {
  return stopped_;
}

auto EventLoop::async_read(int fd, std::span<std::byte> buf) noexcept
    -> IoAwaitable {
  return IoAwaitable{*this, IoRequest{.op = IoOpType::Read,
                                      .fd = fd,
                                      .buf = buf.data(),
                                      .len = static_cast<std::uint32_t>(buf.size())}};
}

auto EventLoop::async_write(int fd, std::span<const std::byte> buf) noexcept
    -> IoAwaitable {
  return IoAwaitable{
      *this,
      IoRequest{.op = IoOpType::Write,
                .fd = fd,
                .buf = const_cast<std::byte*>(buf.data()),
                .len = static_cast<std::uint32_t>(buf.size())}};
}

auto EventLoop::async_connect(int fd, const sockaddr* addr,
                              socklen_t addrlen) noexcept -> IoAwaitable {
  return IoAwaitable{*this, IoRequest{.op = IoOpType::Connect,
                                      .fd = fd,
                                      .addr = addr,
                                      .addrlen = addrlen}};
}

auto EventLoop::async_close(int fd) noexcept -> IoAwaitable {
  return IoAwaitable{*this, IoRequest{.op = IoOpType::Close, .fd = fd}};
}

}  // namespace dockworker::io
