#pragma once

#include <string>

namespace dockworker::cli {

struct RunOptions {
  std::string config_file;
  std::string task_file;
  std::string task_id;
  int run_id{0};
};

struct ValidateOptions {
  std::string task_file;
};

struct FeaturesOptions {
  std::string config_file;
};

[[nodiscard]] auto cmd_run(const RunOptions& opts) -> int;
[[nodiscard]] auto cmd_validate(const ValidateOptions& opts) -> int;
[[nodiscard]] auto cmd_features(const FeaturesOptions& opts) -> int;

}  // namespace dockworker::cli
