#include "dockworker/task/lease_manager.hpp"

#include "dockworker/core/async_event.hpp"
#include "dockworker/util/log.hpp"
#include "dockworker/util/time.hpp"

#include <algorithm>

namespace dockworker {

struct LeaseManager::State {
  QueueClient& queue;
  TimerService& timers;
  scheduler& sched;
  Stats& stats;
  TaskId task_id;
  RunId run_id;
  ClaimRequest request;
  ReclaimPolicy policy;

  std::optional<Claim> claim;
  TimerId timer{kInvalidTimer};
  std::uint64_t generation{0};
  bool cancelled{false};
  int in_flight{0};
  AsyncEvent idle;
  LostCallback on_lost;

  State(QueueClient& q, TimerService& t, scheduler& s, Stats& st, TaskId id,
        RunId run, ClaimRequest req, ReclaimPolicy p)
      : queue(q),
        timers(t),
        sched(s),
        stats(st),
        task_id(std::move(id)),
        run_id(run),
        request(std::move(req)),
        policy(p),
        idle(s) {
    idle.set();
  }

  auto disarm() noexcept -> void {
    ++generation;
    if (timer != kInvalidTimer) {
      timers.cancel(timer);
      timer = kInvalidTimer;
    }
  }
};

LeaseManager::LeaseManager(QueueClient& queue, TimerService& timers,
                           scheduler& sched, Stats& stats, TaskId task_id,
                           RunId run_id, ClaimRequest request,
                           ReclaimPolicy policy)
    : state_(std::make_shared<State>(queue, timers, sched, stats,
                                     std::move(task_id), run_id,
                                     std::move(request), policy)) {
}

LeaseManager::~LeaseManager() {
  cancel();
}

auto LeaseManager::next_reclaim_delay(
    std::chrono::system_clock::time_point taken_until,
    std::chrono::system_clock::time_point now, double divisor)
    -> std::chrono::milliseconds {
  auto remaining =
      std::chrono::duration_cast<std::chrono::milliseconds>(taken_until - now);
  if (remaining.count() <= 0) {
    return std::chrono::milliseconds{0};
  }
  return std::chrono::milliseconds{static_cast<std::int64_t>(
      static_cast<double>(remaining.count()) / divisor)};
}

auto LeaseManager::arm(const std::shared_ptr<State>& state,
                       std::chrono::milliseconds delay, int attempt) -> void {
  state->disarm();
  auto generation = state->generation;
  std::weak_ptr<State> weak = state;
  state->timer = state->timers.schedule_after(delay, [weak, generation, attempt] {
    auto s = weak.lock();
    if (!s || s->cancelled || s->generation != generation) {
      return;
    }
    s->timer = kInvalidTimer;
    spawn(s->sched, reclaim(s, generation, attempt));
  });
}

auto LeaseManager::claim_once(std::shared_ptr<State> state)
    -> task<Result<Claim>> {
  state->stats.increment("tasks.claims");
  auto claimed = co_await state->stats.time(
      "tasks.time.claim",
      state->queue.claim_task(state->task_id, state->run_id, state->request));
  if (!claimed) {
    co_return claimed;
  }

  state->claim = *claimed;
  if (state->cancelled) {
    co_return claimed;
  }

  auto delay = std::max(next_reclaim_delay(claimed->taken_until,
                                           state->timers.now(),
                                           state->policy.divisor),
                        state->policy.min_delay);
  log::info("next claim taskId={} runId={} time={}ms takenUntil={}",
            state->task_id, state->run_id, delay.count(),
            format_iso8601(claimed->taken_until));
  arm(state, delay, 1);
  co_return claimed;
}

auto LeaseManager::reclaim(std::shared_ptr<State> state,
                           std::uint64_t generation, int attempt) -> spawn_task {
  if (state->in_flight++ == 0) {
    state->idle.reset();
  }

  auto claimed = co_await claim_once(state);

  if (!claimed && !state->cancelled && state->generation == generation) {
    log::warn("reclaim taskId={} runId={} attempt {}/{} failed: {}",
              state->task_id, state->run_id, attempt,
              state->policy.max_attempts, claimed.error().message());

    auto now = state->timers.now();
    bool lease_left =
        state->claim && now + state->policy.retry_delay < state->claim->taken_until;

    if (attempt < state->policy.max_attempts && lease_left) {
      arm(state, state->policy.retry_delay, attempt + 1);
    } else {
      log::error("reclaim taskId={} runId={} gave up after {} attempt(s)",
                 state->task_id, state->run_id, attempt);
      state->disarm();
      if (state->policy.abort_on_failure && state->on_lost) {
        state->on_lost(make_error_code(Error::ReclaimFailed));
      }
    }
  }

  if (--state->in_flight == 0) {
    state->idle.set();
  }
}

auto LeaseManager::claim() -> task<Result<Claim>> {
  auto claimed = co_await claim_once(state_);
  if (!claimed) {
    co_return fail(Error::ClaimFailed);
  }
  co_return claimed;
}

auto LeaseManager::cancel() noexcept -> void {
  if (state_->cancelled) {
    return;
  }
  state_->cancelled = true;
  state_->disarm();
}

auto LeaseManager::join() -> task<void> {
  co_await state_->idle.wait();
}

auto LeaseManager::on_lost(LostCallback cb) -> void {
  state_->on_lost = std::move(cb);
}

auto LeaseManager::current() const -> std::optional<Claim> {
  return state_->claim;
}

auto LeaseManager::pending_timer() const noexcept -> TimerId {
  return state_->timer;
}

auto LeaseManager::cancelled() const noexcept -> bool {
  return state_->cancelled;
}

}  // namespace dockworker
