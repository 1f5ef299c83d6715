#include "dockworker/schema/payload_validator.hpp"

#include "dockworker/task/payload.hpp"

#include <format>
#include <limits>
#include <string>

namespace dockworker {

namespace {

class ErrorList {
public:
  explicit ErrorList(std::string_view schema) : schema_(schema) {
  }

  auto add(std::string field, std::string message) -> void {
    errors_.push_back({{"field", std::move(field)},
                       {"message", std::move(message)},
                       {"schema", schema_}});
  }

  [[nodiscard]] auto take() -> nlohmann::json {
    return std::move(errors_);
  }

private:
  std::string schema_;
  nlohmann::json errors_ = nlohmann::json::array();
};

auto check_image(const nlohmann::json& payload, ErrorList& errors) -> void {
  auto it = payload.find("image");
  if (it == payload.end()) {
    errors.add("image", "is required");
  } else if (!it->is_string()) {
    errors.add("image", "must be a string");
  } else if (it->get_ref<const std::string&>().empty()) {
    errors.add("image", "must not be empty");
  }
}

auto check_command(const nlohmann::json& payload, ErrorList& errors) -> void {
  auto it = payload.find("command");
  if (it == payload.end()) {
    return;
  }
  if (!it->is_array()) {
    errors.add("command", "must be an array of strings");
    return;
  }
  for (std::size_t i = 0; i < it->size(); ++i) {
    if (!(*it)[i].is_string()) {
      errors.add(std::format("command[{}]", i), "must be a string");
    }
  }
}

auto check_env(const nlohmann::json& payload, ErrorList& errors) -> void {
  auto it = payload.find("env");
  if (it == payload.end()) {
    return;
  }
  if (!it->is_object()) {
    errors.add("env", "must be an object");
    return;
  }
  for (const auto& [name, value] : it->items()) {
    if (!value.is_string()) {
      errors.add(std::format("env.{}", name), "must be a string");
    }
  }
}

auto check_max_run_time(const nlohmann::json& payload, ErrorList& errors)
    -> void {
  auto it = payload.find("maxRunTime");
  if (it == payload.end()) {
    errors.add("maxRunTime", "is required");
    return;
  }
  if (!it->is_number_integer()) {
    errors.add("maxRunTime", "must be an integer");
    return;
  }
  auto value = it->get<std::int64_t>();
  if (value < 1) {
    errors.add("maxRunTime", "must be at least 1");
  } else if (value > std::numeric_limits<int>::max()) {
    errors.add("maxRunTime", "is too large");
  }
}

auto check_features(const nlohmann::json& payload, ErrorList& errors) -> void {
  auto it = payload.find("features");
  if (it == payload.end()) {
    return;
  }
  if (!it->is_object()) {
    errors.add("features", "must be an object");
    return;
  }
  for (const auto& [name, value] : it->items()) {
    if (!value.is_boolean()) {
      errors.add(std::format("features.{}", name), "must be a boolean");
    }
  }
}

}  // namespace

auto DockerPayloadValidator::validate(const nlohmann::json& payload,
                                      std::string_view schema_id) const
    -> nlohmann::json {
  ErrorList errors(schema_id);

  if (schema_id != kPayloadSchema) {
    errors.add("", std::format("unknown schema {}", schema_id));
    return errors.take();
  }

  if (!payload.is_object()) {
    errors.add("", "payload must be an object");
    return errors.take();
  }

  check_image(payload, errors);
  check_command(payload, errors);
  check_env(payload, errors);
  check_max_run_time(payload, errors);
  check_features(payload, errors);
  return errors.take();
}

}  // namespace dockworker
