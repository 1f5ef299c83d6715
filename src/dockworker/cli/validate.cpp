#include "dockworker/app/application.hpp"
#include "dockworker/cli/commands.hpp"
#include "dockworker/schema/payload_validator.hpp"
#include "dockworker/task/log_format.hpp"
#include "dockworker/task/payload.hpp"

#include <print>

namespace dockworker::cli {

auto cmd_validate(const ValidateOptions& opts) -> int {
  auto definition = load_task_file(opts.task_file);
  if (!definition) {
    std::println(stderr, "Error: {}", definition.error().message());
    return 1;
  }

  const auto& payload =
      definition->contains("payload") ? (*definition)["payload"] : *definition;

  DockerPayloadValidator validator;
  auto errors = validator.validate(payload, kPayloadSchema);
  if (errors.empty()) {
    std::println("✓ {} - Valid", opts.task_file);
    return 0;
  }

  LogFormatter formatter;
  std::print("{}", formatter.schema_errors("`task.payload`", errors));
  std::println("✗ {} - {} error(s)", opts.task_file, errors.size());
  return 1;
}

}  // namespace dockworker::cli
