#pragma once

#include "dockworker/features/feature.hpp"

#include <optional>

namespace dockworker {

// Runs a privileged Docker-in-Docker sidecar for the task container to link
// against under the alias "dind".
class DindFeature : public FeatureHandler {
public:
  static constexpr std::string_view kName = "dind";
  static constexpr std::string_view kAlias = "dind";

  explicit DindFeature(const FeatureServices& services);

  [[nodiscard]] auto name() const -> std::string_view override {
    return kName;
  }

  auto link(Task& t) -> task<Result<std::vector<ContainerLink>>> override;
  auto killed(Task& t) -> task<Result<void>> override;

  [[nodiscard]] auto sidecar() const noexcept
      -> const std::optional<ContainerId>& {
    return sidecar_;
  }

private:
  ContainerRuntime& runtime_;
  std::string image_;
  std::optional<ContainerId> sidecar_;
};

}  // namespace dockworker
