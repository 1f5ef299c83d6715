#pragma once

#include "dockworker/core/coroutine.hpp"
#include "dockworker/features/feature.hpp"
#include "dockworker/queue/queue_client.hpp"
#include "dockworker/task/container_executor.hpp"
#include "dockworker/task/log_stream.hpp"
#include "dockworker/task/payload.hpp"
#include "dockworker/util/id.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace dockworker {

enum class TaskState : std::uint8_t {
  Idle,
  Claimed,
  Linking,
  Created,
  Validating,
  Running,
  StoppedHooks,
  KilledHooks,
  Reported,
  Aborted,
};

[[nodiscard]] constexpr auto to_string_view(TaskState state) noexcept
    -> std::string_view {
  switch (state) {
    case TaskState::Idle: return "idle";
    case TaskState::Claimed: return "claimed";
    case TaskState::Linking: return "linking";
    case TaskState::Created: return "created";
    case TaskState::Validating: return "validating";
    case TaskState::Running: return "running";
    case TaskState::StoppedHooks: return "stopped_hooks";
    case TaskState::KilledHooks: return "killed_hooks";
    case TaskState::Reported: return "reported";
    case TaskState::Aborted: return "aborted";
  }
  return "unknown";
}

// Everything one run of one task owns. Mutated only by the TaskRunner flow
// and the timer callbacks it installs.
struct Task {
  Task(TaskId id, RunId run, nlohmann::json task_definition,
       nlohmann::json task_status, scheduler& sched);

  Task(const Task&) = delete;
  Task& operator=(const Task&) = delete;

  TaskId task_id;
  RunId run_id;
  nlohmann::json definition;
  nlohmann::json status;
  TaskPayload payload;

  std::optional<Claim> claim;
  FeaturePipeline pipeline;
  LogStream log;
  std::unique_ptr<ContainerExecutor> executor;
  std::map<std::string, std::filesystem::path, std::less<>> artifacts;
  TaskState state{TaskState::Idle};

  // The raw payload object, or null when the definition has none.
  [[nodiscard]] auto payload_json() const -> const nlohmann::json&;
};

}  // namespace dockworker
