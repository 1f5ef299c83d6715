#pragma once

#include "dockworker/config/worker_config.hpp"
#include "dockworker/core/error.hpp"

#include <string_view>

namespace dockworker {

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<WorkerConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<WorkerConfig>;
};

}  // namespace dockworker
