#pragma once

#include "dockworker/core/coroutine.hpp"
#include "dockworker/core/error.hpp"
#include "dockworker/core/timer.hpp"
#include "dockworker/features/feature.hpp"
#include "dockworker/metrics/stats.hpp"
#include "dockworker/queue/queue_client.hpp"
#include "dockworker/runtime/container_runtime.hpp"
#include "dockworker/schema/payload_validator.hpp"
#include "dockworker/task/lease_manager.hpp"
#include "dockworker/task/log_format.hpp"
#include "dockworker/task/task.hpp"

#include <chrono>
#include <string>

namespace dockworker {

struct RunOutcome {
  bool success{false};
  int exit_code{0};
  std::chrono::system_clock::time_point started_at;
  std::chrono::system_clock::time_point finished_at;
};

struct RunnerContext {
  QueueClient& queue;
  ContainerRuntime& runtime;
  const PayloadValidator& validator;
  Stats& stats;
  TimerService& timers;
  scheduler& sched;
  const FeatureRegistry& registry;
  FeatureSettings feature_settings;
  std::string worker_id;
  std::string worker_group;
  ReclaimPolicy reclaim;
  LogFormatter formatter;
};

// Drives one task run from claim to completion report.
//
// Submitter errors (invalid payload) and run failures end in a report with
// success=false. Infrastructure errors (claim, hook, container runtime, lost
// lease) stop the reclaim cadence, tear down what was started and return the
// error without reporting, so the lease lapses and the task can be retried.
class TaskRunner {
public:
  explicit TaskRunner(RunnerContext ctx);

  auto run(Task& t) -> task<Result<RunOutcome>>;

  [[nodiscard]] auto context() const noexcept -> const RunnerContext& {
    return ctx_;
  }

private:
  struct RunScope;

  auto execute(Task& t, RunScope& scope) -> task<Result<RunOutcome>>;
  auto abort(Task& t, RunScope& scope) -> task<void>;

  RunnerContext ctx_;
};

}  // namespace dockworker
