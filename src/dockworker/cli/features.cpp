#include "dockworker/cli/commands.hpp"
#include "dockworker/config/config.hpp"
#include "dockworker/features/builtin.hpp"

#include <print>

namespace dockworker::cli {

auto cmd_features(const FeaturesOptions& opts) -> int {
  WorkerConfig config;
  if (!opts.config_file.empty()) {
    auto loaded = ConfigLoader::load_from_file(opts.config_file);
    if (!loaded) {
      std::println(stderr, "Error: {}", loaded.error().message());
      return 1;
    }
    config = std::move(*loaded);
  }

  const auto builtin = builtin_registry();
  auto effective = builtin_registry();
  apply_feature_defaults(effective, config.features.defaults);

  std::println("{:<16} {:<8} {}", "FEATURE", "DEFAULT", "EFFECTIVE");
  for (const auto& entry : effective.entries()) {
    const auto* base = builtin.find(entry.name);
    std::println("{:<16} {:<8} {}", entry.name,
                 base != nullptr && base->default_enabled ? "on" : "off",
                 entry.default_enabled ? "on" : "off");
  }
  return 0;
}

}  // namespace dockworker::cli
