#include "dockworker/app/application.hpp"
#include "dockworker/cli/commands.hpp"
#include "dockworker/config/config.hpp"
#include "dockworker/util/log.hpp"

#include <print>

namespace dockworker::cli {

namespace {

auto setup_logging(const WorkerSection& worker) -> void {
  log::set_level(worker.log_level);
  if (!worker.log_file.empty() && !log::set_output_file(worker.log_file)) {
    std::println(stderr, "Warning: cannot open log file {}", worker.log_file);
  }
  log::start();
}

}  // namespace

auto cmd_run(const RunOptions& opts) -> int {
  auto config = ConfigLoader::load_from_file(opts.config_file);
  if (!config) {
    std::println(stderr, "Error: Failed to load config: {}",
                 config.error().message());
    return 1;
  }

  auto definition = load_task_file(opts.task_file);
  if (!definition) {
    std::println(stderr, "Error: Failed to load task {}: {}", opts.task_file,
                 definition.error().message());
    return 1;
  }

  setup_logging(config->worker);

  Application app(std::move(*config));
  if (auto r = app.init(); !r) {
    std::println(stderr, "Error: {}", r.error().message());
    log::stop();
    return 1;
  }

  nlohmann::json status = definition->value("status", nlohmann::json::object());
  auto outcome = app.run_task(TaskInput{
      .task_id = TaskId{opts.task_id},
      .run_id = opts.run_id,
      .definition = std::move(*definition),
      .status = std::move(status),
  });

  log::stop();
  if (!outcome) {
    std::println(stderr, "Error: task {} run {} failed: {}", opts.task_id,
                 opts.run_id, outcome.error().message());
    return 1;
  }
  return 0;
}

}  // namespace dockworker::cli
