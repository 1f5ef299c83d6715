#include "dockworker/task/payload.hpp"

namespace dockworker {

namespace {

auto scalar_to_string(const nlohmann::json& value) -> std::string {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  return value.dump();
}

}  // namespace

auto parse_payload(const nlohmann::json& payload) -> TaskPayload {
  TaskPayload out;
  if (!payload.is_object()) {
    return out;
  }

  if (auto it = payload.find("image"); it != payload.end() && it->is_string()) {
    out.image = it->get<std::string>();
  }

  if (auto it = payload.find("command"); it != payload.end() && it->is_array()) {
    for (const auto& arg : *it) {
      out.command.push_back(scalar_to_string(arg));
    }
  }

  if (auto it = payload.find("env"); it != payload.end() && it->is_object()) {
    for (const auto& [name, value] : it->items()) {
      out.env[name] = scalar_to_string(value);
    }
  }

  if (auto it = payload.find("maxRunTime");
      it != payload.end() && it->is_number_integer()) {
    out.max_run_time = it->get<int>();
  }

  if (auto it = payload.find("features"); it != payload.end() && it->is_object()) {
    for (const auto& [name, value] : it->items()) {
      if (value.is_boolean()) {
        out.features[name] = value.get<bool>();
      }
    }
  }
  return out;
}

}  // namespace dockworker
