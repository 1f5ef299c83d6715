#pragma once

#include "dockworker/core/coroutine.hpp"
#include "dockworker/core/error.hpp"
#include "dockworker/core/timer.hpp"
#include "dockworker/metrics/stats.hpp"
#include "dockworker/queue/queue_client.hpp"
#include "dockworker/util/id.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <system_error>

namespace dockworker {

struct ReclaimPolicy {
  double divisor{1.3};
  // Total attempts per reclaim, the first included.
  int max_attempts{3};
  std::chrono::milliseconds retry_delay{5000};
  bool abort_on_failure{true};
  // Floor for the reclaim delay when the queue hands back a lapsed lease.
  std::chrono::milliseconds min_delay{1000};
};

// Holds the lease on one task run. A successful claim schedules the next
// reclaim at (takenUntil - now) / divisor; there is never more than one
// reclaim timer outstanding.
class LeaseManager {
public:
  using LostCallback = std::move_only_function<void(std::error_code)>;

  LeaseManager(QueueClient& queue, TimerService& timers, scheduler& sched,
               Stats& stats, TaskId task_id, RunId run_id, ClaimRequest request,
               ReclaimPolicy policy = {});
  ~LeaseManager();

  LeaseManager(const LeaseManager&) = delete;
  LeaseManager& operator=(const LeaseManager&) = delete;

  auto claim() -> task<Result<Claim>>;

  // Stops the reclaim cadence. Idempotent.
  auto cancel() noexcept -> void;

  // Resolves once no reclaim call is in flight.
  auto join() -> task<void>;

  // Invoked when reclaiming gave up and the policy says to abort the run.
  auto on_lost(LostCallback cb) -> void;

  [[nodiscard]] auto current() const -> std::optional<Claim>;
  [[nodiscard]] auto pending_timer() const noexcept -> TimerId;
  [[nodiscard]] auto cancelled() const noexcept -> bool;

  [[nodiscard]] static auto next_reclaim_delay(
      std::chrono::system_clock::time_point taken_until,
      std::chrono::system_clock::time_point now, double divisor)
      -> std::chrono::milliseconds;

private:
  struct State;

  static auto claim_once(std::shared_ptr<State> state) -> task<Result<Claim>>;
  static auto reclaim(std::shared_ptr<State> state, std::uint64_t generation,
                      int attempt) -> spawn_task;
  static auto arm(const std::shared_ptr<State>& state,
                  std::chrono::milliseconds delay, int attempt) -> void;

  std::shared_ptr<State> state_;
};

}  // namespace dockworker
