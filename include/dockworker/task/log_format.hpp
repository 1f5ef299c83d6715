#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <string_view>

namespace dockworker {

// Renders worker-authored lines of the task transcript. Every line starts
// with the tag and a space and ends in CRLF; downstream log consumers match
// on these exact strings.
class LogFormatter {
public:
  explicit LogFormatter(std::string tag = "[taskcluster]");

  [[nodiscard]] auto line(std::string_view text) const -> std::string;

  [[nodiscard]] auto header(std::string_view task_id,
                            std::string_view worker_id) const -> std::string;

  // Duration is reported in seconds at millisecond precision.
  [[nodiscard]] auto footer(bool success, int exit_code,
                            std::chrono::system_clock::time_point started,
                            std::chrono::system_clock::time_point finished) const
      -> std::string;

  [[nodiscard]] auto schema_errors(std::string_view prefix,
                                   const nlohmann::json& errors) const
      -> std::string;

  [[nodiscard]] auto timeout(int max_run_time_seconds) const -> std::string;

  [[nodiscard]] auto tag() const noexcept -> const std::string& {
    return tag_;
  }

private:
  std::string tag_;
};

}  // namespace dockworker
