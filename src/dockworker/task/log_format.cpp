#include "dockworker/task/log_format.hpp"

#include <format>

namespace dockworker {

LogFormatter::LogFormatter(std::string tag) : tag_(std::move(tag)) {
}

auto LogFormatter::line(std::string_view text) const -> std::string {
  return std::format("{} {}\r\n", tag_, text);
}

auto LogFormatter::header(std::string_view task_id,
                          std::string_view worker_id) const -> std::string {
  return line(std::format("taskId: {}, workerId: {} \r\n", task_id, worker_id));
}

auto LogFormatter::footer(bool success, int exit_code,
                          std::chrono::system_clock::time_point started,
                          std::chrono::system_clock::time_point finished) const
    -> std::string {
  auto elapsed =
      std::chrono::duration_cast<std::chrono::milliseconds>(finished - started);
  // Shortest form: 3000ms prints "3", 3400ms prints "3.4".
  auto seconds = static_cast<double>(elapsed.count()) / 1000.0;
  return line(std::format("{} task run with exit code: {} completed in {} seconds",
                          success ? "Successful" : "Unsuccessful", exit_code,
                          seconds));
}

auto LogFormatter::schema_errors(std::string_view prefix,
                                 const nlohmann::json& errors) const
    -> std::string {
  return line(std::format("{} format is invalid json schema errors:\n{}",
                          prefix, errors.dump(2)));
}

auto LogFormatter::timeout(int max_run_time_seconds) const -> std::string {
  return line(std::format("Task timeout after {} seconds. Force killing container.",
                          max_run_time_seconds));
}

}  // namespace dockworker
