#pragma once

#include "dockworker/core/async_event.hpp"
#include "dockworker/core/coroutine.hpp"
#include "dockworker/core/error.hpp"
#include "dockworker/runtime/container_runtime.hpp"
#include "dockworker/task/payload.hpp"
#include "dockworker/util/id.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace dockworker {

enum class ContainerState : std::uint8_t {
  Configured,
  Running,
  Exited,
  Removed,
};

// Owns one container for the length of a run. Output is forwarded to the
// sink from start() until the runtime signals the natural end of output.
class ContainerExecutor {
public:
  ContainerExecutor(ContainerRuntime& runtime, scheduler& sched,
                    OutputSink output);

  ~ContainerExecutor();

  ContainerExecutor(const ContainerExecutor&) = delete;
  ContainerExecutor& operator=(const ContainerExecutor&) = delete;

  // Task-derived TASK_ID and RUN_ID override payload entries of the same name.
  [[nodiscard]] static auto configure(const TaskPayload& payload,
                                      const TaskId& task_id, RunId run_id,
                                      std::vector<ContainerLink> links)
      -> ContainerSpec;

  // Fails with Cancelled when kill() was requested before the container
  // could run; a container that launched meanwhile is killed right away.
  auto start(ContainerSpec spec) -> task<Result<void>>;

  // Suspends until the container exits; yields its exit code.
  auto run() -> task<Result<int>>;

  // Resolves once every byte of output has reached the sink.
  auto drain() -> task<void>;

  // Forcibly stops the container. Only the first successful call reaches the
  // runtime; a failed kill may be retried. A container that already exited is
  // left alone, and one not yet started never launches.
  auto kill() -> task<Result<void>>;

  // Waits for an in-flight kill, then deletes the container.
  auto remove() -> task<Result<void>>;

  [[nodiscard]] auto state() const noexcept -> ContainerState {
    return state_;
  }
  [[nodiscard]] auto container_id() const noexcept
      -> const std::optional<ContainerId>& {
    return id_;
  }
  [[nodiscard]] auto kill_requested() const noexcept -> bool {
    return kill_requested_;
  }
  [[nodiscard]] auto output_done() const noexcept -> bool {
    return channel_->done.is_set();
  }
  [[nodiscard]] auto spec() const noexcept -> const ContainerSpec& {
    return spec_;
  }

private:
  // Shared with the output pump, which may outlive the executor when a run is
  // abandoned with the stream still open. Detaching clears the sink.
  struct OutputChannel {
    OutputChannel(scheduler& sched, OutputSink out)
        : sink(std::move(out)), done(sched) {
    }
    OutputSink sink;
    AsyncEvent done;
  };

  static auto pump_output(ContainerRuntime& runtime,
                          std::shared_ptr<OutputChannel> channel,
                          ContainerId id) -> spawn_task;

  auto kill_now() -> task<Result<void>>;

  ContainerRuntime& runtime_;
  scheduler& sched_;
  std::shared_ptr<OutputChannel> channel_;
  ContainerSpec spec_;
  std::optional<ContainerId> id_;
  ContainerState state_{ContainerState::Configured};
  bool kill_requested_{false};
  AsyncEvent kill_idle_;
};

}  // namespace dockworker
