#include "dockworker/task/task_runner.hpp"

#include "dockworker/core/cancellation.hpp"
#include "dockworker/task/deadline_watchdog.hpp"
#include "dockworker/util/log.hpp"
#include "dockworker/util/time.hpp"

#include <optional>

namespace dockworker {

namespace {

constexpr std::string_view kPayloadPrefix = "`task.payload`";

auto kill_for_lost_lease(ContainerExecutor& executor) -> spawn_task {
  auto killed = co_await executor.kill();
  if (!killed) {
    log::error("kill after lost lease failed: {}", killed.error().message());
  }
}

}  // namespace

struct TaskRunner::RunScope {
  LeaseManager lease;
  CancellationSource cancel;
  std::optional<DeadlineWatchdog> watchdog;
  std::error_code lease_error;

  RunScope(const RunnerContext& ctx, const Task& t)
      : lease(ctx.queue, ctx.timers, ctx.sched, ctx.stats, t.task_id, t.run_id,
              ClaimRequest{ctx.worker_id, ctx.worker_group}, ctx.reclaim) {
  }
};

TaskRunner::TaskRunner(RunnerContext ctx) : ctx_(std::move(ctx)) {
}

auto TaskRunner::run(Task& t) -> task<Result<RunOutcome>> {
  RunScope scope(ctx_, t);
  t.state = TaskState::Idle;
  t.pipeline = FeaturePipeline::build(
      ctx_.registry, t.payload.features,
      FeatureServices{ctx_.runtime, ctx_.sched, ctx_.feature_settings});

  auto claimed = co_await scope.lease.claim();
  if (!claimed) {
    log::error("claim taskId={} runId={} failed: {}", t.task_id, t.run_id,
               claimed.error().message());
    t.state = TaskState::Aborted;
    co_return std::unexpected(claimed.error());
  }
  t.claim = *claimed;
  t.state = TaskState::Claimed;
  log::info("claim and run taskId={} runId={} takenUntil={}", t.task_id,
            t.run_id, format_iso8601(claimed->taken_until));

  // One cancellation per run stops the reclaim cadence and the deadline
  // together, whichever way the run ends.
  auto registration = scope.cancel.token().on_cancel([&scope] {
    scope.lease.cancel();
    if (scope.watchdog) {
      scope.watchdog->disarm();
    }
  });

  scope.lease.on_lost([this, &t, &scope](std::error_code ec) {
    log::error("lease on taskId={} runId={} lost: {}", t.task_id, t.run_id,
               ec.message());
    scope.lease_error = ec;
    if (t.executor) {
      spawn(ctx_.sched, kill_for_lost_lease(*t.executor));
    }
  });

  auto outcome = co_await execute(t, scope);
  scope.cancel.cancel();

  if (outcome && scope.lease_error) {
    outcome = std::unexpected(scope.lease_error);
  }

  if (!outcome) {
    log::error("taskId={} runId={} aborted in state {}: {}", t.task_id,
               t.run_id, to_string_view(t.state), outcome.error().message());
    co_await abort(t, scope);
    co_await scope.lease.join();
    t.claim = scope.lease.current();
    t.state = TaskState::Aborted;
    co_return outcome;
  }

  co_await scope.lease.join();
  t.claim = scope.lease.current();

  auto reported = co_await ctx_.stats.time(
      "tasks.time.completed",
      ctx_.queue.report_completed(t.task_id, t.run_id, outcome->success));
  if (!reported) {
    log::error("report completed taskId={} runId={} failed: {}", t.task_id,
               t.run_id, reported.error().message());
    t.state = TaskState::Aborted;
    co_return fail(Error::ReportFailed);
  }

  t.state = TaskState::Reported;
  log::info("taskId={} runId={} reported success={} exitCode={}", t.task_id,
            t.run_id, outcome->success, outcome->exit_code);
  co_return outcome;
}

auto TaskRunner::execute(Task& t, RunScope& scope) -> task<Result<RunOutcome>> {
  auto& stats = ctx_.stats;
  const auto& fmt = ctx_.formatter;

  RunOutcome outcome;
  outcome.started_at = ctx_.timers.now();

  t.log.hold();
  t.log.write(fmt.header(t.task_id.value(), ctx_.worker_id));

  t.state = TaskState::Linking;
  auto links =
      co_await stats.time("tasks.time.states.linked", t.pipeline.link(t));
  if (!links) {
    co_return std::unexpected(links.error());
  }
  if (scope.lease_error) {
    co_return std::unexpected(scope.lease_error);
  }

  auto spec = ContainerExecutor::configure(t.payload, t.task_id, t.run_id,
                                           std::move(*links));
  t.executor = std::make_unique<ContainerExecutor>(
      ctx_.runtime, ctx_.sched,
      [&log = t.log](std::string_view chunk) { log.write(std::string(chunk)); });
  scope.watchdog.emplace(ctx_.timers, ctx_.sched, *t.executor, t.log, stats,
                         fmt);

  t.state = TaskState::Created;
  auto created =
      co_await stats.time("tasks.time.states.created", t.pipeline.created(t));
  if (!created) {
    co_return std::unexpected(created.error());
  }
  t.log.release();
  if (scope.lease_error) {
    co_return std::unexpected(scope.lease_error);
  }

  t.state = TaskState::Validating;
  auto errors = ctx_.validator.validate(t.payload_json(), kPayloadSchema);
  if (!errors.empty()) {
    log::warn("taskId={} runId={} has an invalid payload ({} error(s))",
              t.task_id, t.run_id, errors.size());
    t.log.write(fmt.schema_errors(kPayloadPrefix, errors));
    outcome.success = false;
    outcome.exit_code = -1;
    outcome.finished_at = ctx_.timers.now();
    t.log.write(fmt.footer(false, -1, outcome.started_at, outcome.finished_at));
    co_await t.log.end();

    // The container never ran, but link peers still need releasing.
    t.state = TaskState::KilledHooks;
    auto killed =
        co_await stats.time("tasks.time.states.killed", t.pipeline.killed(t));
    if (!killed) {
      co_return std::unexpected(killed.error());
    }
    co_return outcome;
  }

  t.state = TaskState::Running;
  // A lease lost while the container was being created wins over whatever
  // start() reports, including the Cancelled it returns after the kill.
  auto started = co_await t.executor->start(std::move(spec));
  if (scope.lease_error) {
    co_return std::unexpected(scope.lease_error);
  }
  if (!started) {
    co_return std::unexpected(started.error());
  }
  scope.watchdog->arm(std::chrono::seconds(t.payload.max_run_time));

  auto exit_code = co_await stats.time("tasks.time.run", t.executor->run());
  scope.watchdog->disarm();
  if (!exit_code) {
    co_return std::unexpected(exit_code.error());
  }
  if (scope.lease_error) {
    co_return std::unexpected(scope.lease_error);
  }
  outcome.exit_code = *exit_code;
  outcome.success = *exit_code == 0;

  // Trailing output must reach the transcript before the stopped hooks run.
  co_await t.executor->drain();

  t.state = TaskState::StoppedHooks;
  auto stopped =
      co_await stats.time("tasks.time.states.stopped", t.pipeline.stopped(t));
  if (!stopped) {
    co_return std::unexpected(stopped.error());
  }

  outcome.finished_at = ctx_.timers.now();
  t.log.write(fmt.footer(outcome.success, outcome.exit_code, outcome.started_at,
                         outcome.finished_at));
  co_await t.log.end();

  auto removed =
      co_await stats.time("tasks.time.removed", t.executor->remove());
  if (!removed) {
    co_return std::unexpected(removed.error());
  }

  t.state = TaskState::KilledHooks;
  auto killed =
      co_await stats.time("tasks.time.states.killed", t.pipeline.killed(t));
  if (!killed) {
    co_return std::unexpected(killed.error());
  }

  co_return outcome;
}

auto TaskRunner::abort(Task& t, RunScope& scope) -> task<void> {
  if (scope.watchdog) {
    scope.watchdog->disarm();
  }

  if (t.executor) {
    auto killed = co_await t.executor->kill();
    if (!killed) {
      log::warn("abort: kill failed: {}", killed.error().message());
    }
    // An unkillable container never ends its output stream.
    if (killed || t.executor->state() != ContainerState::Running) {
      co_await t.executor->drain();
    } else if (!t.executor->output_done()) {
      log::warn("abort: container {} may still be running, not waiting for "
                "its output",
                *t.executor->container_id());
    }
  }

  if (!t.log.drained()) {
    co_await t.log.end();
  }

  if (t.executor) {
    if (auto removed = co_await t.executor->remove(); !removed) {
      log::warn("abort: remove failed: {}", removed.error().message());
    }
  }

  if (t.state < TaskState::KilledHooks) {
    if (auto killed = co_await t.pipeline.killed(t); !killed) {
      log::warn("abort: killed hooks failed: {}", killed.error().message());
    }
  }
}

}  // namespace dockworker
