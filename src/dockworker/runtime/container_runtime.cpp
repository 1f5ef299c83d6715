#include "dockworker/runtime/container_runtime.hpp"

#include <format>

namespace dockworker {

auto ContainerSpec::env_list() const -> std::vector<std::string> {
  std::vector<std::string> out;
  out.reserve(env.size());
  for (const auto& [name, value] : env) {
    out.push_back(std::format("{}={}", name, value));
  }
  return out;
}

auto ContainerSpec::link_list() const -> std::vector<std::string> {
  std::vector<std::string> out;
  out.reserve(links.size());
  for (const auto& link : links) {
    out.push_back(std::format("{}:{}", link.name, link.alias));
  }
  return out;
}

}  // namespace dockworker
