#pragma once

#include "dockworker/config/worker_config.hpp"
#include "dockworker/core/error.hpp"
#include "dockworker/features/feature.hpp"
#include "dockworker/metrics/stats.hpp"
#include "dockworker/task/task_runner.hpp"
#include "dockworker/util/id.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string_view>

namespace dockworker {

// One task as handed to the worker: identity plus the queue's task
// definition and status documents.
struct TaskInput {
  TaskId task_id;
  RunId run_id{0};
  nlohmann::json definition;
  nlohmann::json status;
};

// Reads a task definition document from disk.
[[nodiscard]] auto load_task_file(std::string_view path)
    -> Result<nlohmann::json>;

// Application facade: owns the event loop and every collaborator a task run
// needs, wired from WorkerConfig.
class Application {
public:
  explicit Application(WorkerConfig config);
  ~Application();

  Application(const Application&) = delete;
  auto operator=(const Application&) -> Application& = delete;

  [[nodiscard]] auto init() -> Result<void>;

  // Runs one task to completion on the event loop. The task log is echoed
  // to stdout besides any feature consumers.
  [[nodiscard]] auto run_task(TaskInput input) -> Result<RunOutcome>;

  [[nodiscard]] auto config() const noexcept -> const WorkerConfig&;
  [[nodiscard]] auto registry() const noexcept -> const FeatureRegistry&;
  [[nodiscard]] auto stats() noexcept -> Stats&;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace dockworker
