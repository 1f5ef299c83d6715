#include "dockworker/features/builtin.hpp"

#include "dockworker/features/buffer_log.hpp"
#include "dockworker/features/dind.hpp"
#include "dockworker/features/live_log.hpp"
#include "dockworker/util/log.hpp"

namespace dockworker {

namespace {

template <typename Feature>
auto factory() -> FeatureFactory {
  return [](const FeatureServices& services) -> std::unique_ptr<FeatureHandler> {
    return std::make_unique<Feature>(services);
  };
}

}  // namespace

auto builtin_registry() -> FeatureRegistry {
  FeatureRegistry registry;
  registry.add(std::string(DindFeature::kName), false, factory<DindFeature>())
      .add(std::string(LiveLogFeature::kName), true, factory<LiveLogFeature>())
      .add(std::string(BufferLogFeature::kName), false,
           factory<BufferLogFeature>());
  return registry;
}

auto apply_feature_defaults(FeatureRegistry& registry,
                            const std::map<std::string, bool, std::less<>>& defaults)
    -> void {
  for (const auto& [name, enabled] : defaults) {
    if (!registry.set_default(name, enabled)) {
      log::warn("config names unknown feature '{}'", name);
    }
  }
}

}  // namespace dockworker
