#include "dockworker/task/task.hpp"

namespace dockworker {

Task::Task(TaskId id, RunId run, nlohmann::json task_definition,
           nlohmann::json task_status, scheduler& sched)
    : task_id(std::move(id)),
      run_id(run),
      definition(std::move(task_definition)),
      status(std::move(task_status)),
      payload(parse_payload(payload_json())),
      log(sched) {
}

auto Task::payload_json() const -> const nlohmann::json& {
  static const nlohmann::json null_payload;
  if (definition.is_object()) {
    if (auto it = definition.find("payload"); it != definition.end()) {
      return *it;
    }
  }
  return null_payload;
}

}  // namespace dockworker
