#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace dockworker {

inline constexpr std::string_view kPayloadSchema =
    "http://schemas.taskcluster.net/docker-worker/v1/payload.json#";

struct TaskPayload {
  std::string image;
  std::vector<std::string> command;
  std::map<std::string, std::string, std::less<>> env;
  int max_run_time{0};
  std::map<std::string, bool, std::less<>> features;
};

// Lenient: wrongly typed fields are skipped rather than rejected so feature
// flags are usable before the payload has been validated. Validation proper
// is PayloadValidator's job.
[[nodiscard]] auto parse_payload(const nlohmann::json& payload) -> TaskPayload;

}  // namespace dockworker
