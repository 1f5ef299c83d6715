#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace dockworker {

class CancellationToken;
class CancellationRegistration;

class CancellationSource {
public:
  CancellationSource() : state_(std::make_shared<State>()) {
  }

  [[nodiscard]] auto token() const noexcept -> CancellationToken;

  // Runs every registered callback exactly once; later calls are no-ops.
  auto cancel() -> void {
    if (state_->cancelled.exchange(true, std::memory_order_acq_rel)) {
      return;
    }
    std::vector<std::pair<std::uint64_t, std::move_only_function<void()>>>
        callbacks;
    {
      std::scoped_lock lock(state_->mutex);
      callbacks.swap(state_->callbacks);
    }
    for (auto& [id, cb] : callbacks) {
      cb();
    }
  }

  [[nodiscard]] auto is_cancelled() const noexcept -> bool {
    return state_->cancelled.load(std::memory_order_acquire);
  }

private:
  struct State {
    std::atomic<bool> cancelled{false};
    std::mutex mutex;
    std::uint64_t next_id{1};
    std::vector<std::pair<std::uint64_t, std::move_only_function<void()>>>
        callbacks;
  };
  std::shared_ptr<State> state_;

  friend class CancellationToken;
  friend class CancellationRegistration;
};

// Unregisters its callback on destruction.
class CancellationRegistration {
public:
  CancellationRegistration() = default;
  ~CancellationRegistration() {
    reset();
  }

  CancellationRegistration(CancellationRegistration&& other) noexcept
      : state_(std::move(other.state_)), id_(std::exchange(other.id_, 0)) {
  }
  CancellationRegistration& operator=(CancellationRegistration&& other) noexcept {
    if (this != &other) {
      reset();
      state_ = std::move(other.state_);
      id_ = std::exchange(other.id_, 0);
    }
    return *this;
  }

  CancellationRegistration(const CancellationRegistration&) = delete;
  CancellationRegistration& operator=(const CancellationRegistration&) = delete;

  auto reset() -> void {
    if (auto state = state_.lock(); state && id_ != 0) {
      std::scoped_lock lock(state->mutex);
      std::erase_if(state->callbacks,
                    [id = id_](const auto& entry) { return entry.first == id; });
    }
    state_.reset();
    id_ = 0;
  }

private:
  CancellationRegistration(std::weak_ptr<CancellationSource::State> state,
                           std::uint64_t id)
      : state_(std::move(state)), id_(id) {
  }

  std::weak_ptr<CancellationSource::State> state_;
  std::uint64_t id_{0};

  friend class CancellationToken;
};

class CancellationToken {
public:
  CancellationToken() = default;

  [[nodiscard]] auto is_cancelled() const noexcept -> bool {
    return state_ && state_->cancelled.load(std::memory_order_acquire);
  }

  [[nodiscard]] explicit operator bool() const noexcept {
    return !is_cancelled();
  }

  [[nodiscard]] static auto none() noexcept -> CancellationToken {
    return {};
  }

  // Invokes cb immediately when the source is already cancelled.
  [[nodiscard]] auto on_cancel(std::move_only_function<void()> cb)
      -> CancellationRegistration {
    if (!state_) {
      return {};
    }
    {
      std::scoped_lock lock(state_->mutex);
      if (!state_->cancelled.load(std::memory_order_acquire)) {
        auto id = state_->next_id++;
        state_->callbacks.emplace_back(id, std::move(cb));
        return CancellationRegistration{state_, id};
      }
    }
    cb();
    return {};
  }

private:
  explicit CancellationToken(std::shared_ptr<CancellationSource::State> state)
      : state_(std::move(state)) {
  }

  std::shared_ptr<CancellationSource::State> state_;

  friend class CancellationSource;
};

inline auto CancellationSource::token() const noexcept -> CancellationToken {
  return CancellationToken{state_};
}

}  // namespace dockworker
