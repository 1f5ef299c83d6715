#pragma once

#include "dockworker/docker/docker_client.hpp"
#include "dockworker/runtime/container_runtime.hpp"

namespace dockworker {

class DockerContainerRuntime : public ContainerRuntime {
public:
  explicit DockerContainerRuntime(docker::DockerClient& client);

  auto create(const ContainerSpec& spec) -> task<Result<ContainerId>> override;
  auto start(const ContainerId& id) -> task<Result<void>> override;
  auto attach(const ContainerId& id, OutputSink sink)
      -> task<Result<void>> override;
  auto wait(const ContainerId& id) -> task<Result<int>> override;
  auto kill(const ContainerId& id) -> task<Result<void>> override;
  auto remove(const ContainerId& id) -> task<Result<void>> override;

private:
  docker::DockerClient& client_;
};

}  // namespace dockworker
