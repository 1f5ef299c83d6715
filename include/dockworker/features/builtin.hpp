#pragma once

#include "dockworker/features/feature.hpp"

#include <map>
#include <string>

namespace dockworker {

// dind (off), localLiveLog (on), bufferLog (off); in that order.
[[nodiscard]] auto builtin_registry() -> FeatureRegistry;

// Overrides registry defaults from configuration. Unknown names are logged
// and skipped.
auto apply_feature_defaults(FeatureRegistry& registry,
                            const std::map<std::string, bool, std::less<>>& defaults)
    -> void;

}  // namespace dockworker
