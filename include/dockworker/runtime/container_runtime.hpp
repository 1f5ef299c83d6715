#pragma once

#include "dockworker/core/coroutine.hpp"
#include "dockworker/core/error.hpp"
#include "dockworker/util/id.hpp"

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace dockworker {

struct ContainerLink {
  std::string name;
  std::string alias;

  friend auto operator==(const ContainerLink&, const ContainerLink&)
      -> bool = default;
};

struct ContainerSpec {
  std::string name;
  std::string image;
  std::vector<std::string> command;
  std::map<std::string, std::string, std::less<>> env;
  std::vector<ContainerLink> links;
  bool privileged{false};

  // "NAME=value" in key order.
  [[nodiscard]] auto env_list() const -> std::vector<std::string>;
  // "name:alias" in link order.
  [[nodiscard]] auto link_list() const -> std::vector<std::string>;
};

using OutputSink = std::move_only_function<void(std::string_view)>;

// Container lifecycle operations the executor needs. kill() of a container
// that is no longer running and remove() of one that is already gone both
// succeed.
class ContainerRuntime {
public:
  virtual ~ContainerRuntime() = default;

  virtual auto create(const ContainerSpec& spec) -> task<Result<ContainerId>> = 0;
  virtual auto start(const ContainerId& id) -> task<Result<void>> = 0;

  // Streams combined output into `sink` and completes at the output's
  // natural end, after the container has exited.
  virtual auto attach(const ContainerId& id, OutputSink sink)
      -> task<Result<void>> = 0;

  virtual auto wait(const ContainerId& id) -> task<Result<int>> = 0;
  virtual auto kill(const ContainerId& id) -> task<Result<void>> = 0;
  virtual auto remove(const ContainerId& id) -> task<Result<void>> = 0;
};

}  // namespace dockworker
