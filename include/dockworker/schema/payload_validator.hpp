#pragma once

#include <nlohmann/json.hpp>

#include <string_view>

namespace dockworker {

class PayloadValidator {
public:
  virtual ~PayloadValidator() = default;

  // Returns a JSON array of error objects; empty when the payload conforms.
  [[nodiscard]] virtual auto validate(const nlohmann::json& payload,
                                      std::string_view schema_id) const
      -> nlohmann::json = 0;
};

// Built-in rules for the docker-worker v1 payload schema. Each error object
// carries "field", "message" and "schema".
class DockerPayloadValidator : public PayloadValidator {
public:
  [[nodiscard]] auto validate(const nlohmann::json& payload,
                              std::string_view schema_id) const
      -> nlohmann::json override;
};

}  // namespace dockworker
