#include "dockworker/task/container_executor.hpp"

#include "dockworker/util/log.hpp"

#include <format>

namespace dockworker {

ContainerExecutor::ContainerExecutor(ContainerRuntime& runtime,
                                     scheduler& sched, OutputSink output)
    : runtime_(runtime),
      sched_(sched),
      channel_(std::make_shared<OutputChannel>(sched, std::move(output))),
      kill_idle_(sched) {
  kill_idle_.set();
}

ContainerExecutor::~ContainerExecutor() {
  channel_->sink = nullptr;
}

auto ContainerExecutor::configure(const TaskPayload& payload,
                                  const TaskId& task_id, RunId run_id,
                                  std::vector<ContainerLink> links)
    -> ContainerSpec {
  ContainerSpec spec;
  spec.name = std::format("task-{}-{}-{}", task_id, run_id,
                          generate_short_suffix());
  spec.image = payload.image;
  spec.command = payload.command;
  spec.env = payload.env;
  spec.env["TASK_ID"] = task_id.str();
  spec.env["RUN_ID"] = std::to_string(run_id);
  spec.links = std::move(links);
  return spec;
}

auto ContainerExecutor::start(ContainerSpec spec) -> task<Result<void>> {
  if (state_ != ContainerState::Configured) {
    co_return fail(Error::ContainerStartFailed);
  }
  spec_ = std::move(spec);
  if (kill_requested_) {
    channel_->done.set();
    co_return fail(Error::Cancelled);
  }

  auto created = co_await runtime_.create(spec_);
  if (!created) {
    // Nothing was created, so there is no output to wait for.
    channel_->done.set();
    co_return std::unexpected(created.error());
  }
  id_ = *created;
  log::debug("container {} created from {}", *id_, spec_.image);
  if (kill_requested_) {
    log::info("container {} not started: kill requested", *id_);
    channel_->done.set();
    co_return fail(Error::Cancelled);
  }

  auto started = co_await runtime_.start(*id_);
  if (!started) {
    channel_->done.set();
    co_return std::unexpected(started.error());
  }
  state_ = ContainerState::Running;
  spawn(sched_, pump_output(runtime_, channel_, *id_));

  if (kill_requested_) {
    if (auto killed = co_await kill_now(); !killed) {
      co_return std::unexpected(killed.error());
    }
    co_return fail(Error::Cancelled);
  }
  co_return ok();
}

auto ContainerExecutor::pump_output(ContainerRuntime& runtime,
                                    std::shared_ptr<OutputChannel> channel,
                                    ContainerId id) -> spawn_task {
  auto attached =
      co_await runtime.attach(id, [channel](std::string_view chunk) {
        if (channel->sink) {
          channel->sink(chunk);
        }
      });
  if (!attached) {
    log::warn("container {} output stream ended with error: {}", id,
              attached.error().message());
  }
  channel->done.set();
}

auto ContainerExecutor::run() -> task<Result<int>> {
  if (!id_ || state_ != ContainerState::Running) {
    co_return fail(Error::ContainerWaitFailed);
  }
  auto exit_code = co_await runtime_.wait(*id_);
  if (exit_code) {
    state_ = ContainerState::Exited;
  }
  co_return exit_code;
}

auto ContainerExecutor::drain() -> task<void> {
  if (!id_) {
    co_return;
  }
  co_await channel_->done.wait();
}

auto ContainerExecutor::kill() -> task<Result<void>> {
  if (kill_requested_) {
    co_return ok();
  }
  if (state_ == ContainerState::Configured) {
    kill_requested_ = true;
    co_return ok();
  }
  if (state_ != ContainerState::Running || !id_) {
    co_return ok();
  }
  kill_requested_ = true;
  co_return co_await kill_now();
}

auto ContainerExecutor::kill_now() -> task<Result<void>> {
  kill_idle_.reset();
  log::info("killing container {}", *id_);
  auto killed = co_await runtime_.kill(*id_);
  kill_idle_.set();
  if (!killed) {
    kill_requested_ = false;
  }
  co_return killed;
}

auto ContainerExecutor::remove() -> task<Result<void>> {
  co_await kill_idle_.wait();
  if (!id_ || state_ == ContainerState::Removed) {
    co_return ok();
  }
  auto removed = co_await runtime_.remove(*id_);
  if (removed) {
    state_ = ContainerState::Removed;
  }
  co_return removed;
}

}  // namespace dockworker
