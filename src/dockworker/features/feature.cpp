#include "dockworker/features/feature.hpp"

#include "dockworker/task/task.hpp"
#include "dockworker/util/log.hpp"

#include <algorithm>

namespace dockworker {

auto FeatureHandler::link(Task&) -> task<Result<std::vector<ContainerLink>>> {
  co_return std::vector<ContainerLink>{};
}

auto FeatureHandler::created(Task&) -> task<Result<void>> {
  co_return ok();
}

auto FeatureHandler::stopped(Task&) -> task<Result<void>> {
  co_return ok();
}

auto FeatureHandler::killed(Task&) -> task<Result<void>> {
  co_return ok();
}

auto FeatureRegistry::add(std::string name, bool default_enabled,
                          FeatureFactory factory) -> FeatureRegistry& {
  entries_.push_back(
      FeatureEntry{std::move(name), default_enabled, std::move(factory)});
  return *this;
}

auto FeatureRegistry::set_default(std::string_view name, bool enabled) -> bool {
  auto it = std::ranges::find(entries_, name, &FeatureEntry::name);
  if (it == entries_.end()) {
    return false;
  }
  it->default_enabled = enabled;
  return true;
}

auto FeatureRegistry::find(std::string_view name) const -> const FeatureEntry* {
  auto it = std::ranges::find(entries_, name, &FeatureEntry::name);
  return it == entries_.end() ? nullptr : &*it;
}

auto FeaturePipeline::build(const FeatureRegistry& registry,
                            const std::map<std::string, bool, std::less<>>& flags,
                            const FeatureServices& services) -> FeaturePipeline {
  for (const auto& [name, _] : flags) {
    if (!registry.find(name)) {
      log::debug("ignoring unknown feature flag {}", name);
    }
  }

  FeaturePipeline pipeline;
  for (const auto& entry : registry.entries()) {
    auto flag = flags.find(entry.name);
    bool enabled = flag != flags.end() ? flag->second : entry.default_enabled;
    if (enabled) {
      pipeline.handlers_.push_back(entry.factory(services));
    }
  }
  return pipeline;
}

auto FeaturePipeline::link(Task& t)
    -> task<Result<std::vector<ContainerLink>>> {
  std::vector<ContainerLink> links;
  for (auto& handler : handlers_) {
    auto produced = co_await handler->link(t);
    if (!produced) {
      log::error("feature {} failed at link: {}", handler->name(),
                 produced.error().message());
      co_return std::unexpected(produced.error());
    }
    links.insert(links.end(), produced->begin(), produced->end());
  }
  co_return links;
}

auto FeaturePipeline::dispatch(Task& t, Hook hook, std::string_view point)
    -> task<Result<void>> {
  for (auto& handler : handlers_) {
    auto done = co_await ((*handler).*hook)(t);
    if (!done) {
      log::error("feature {} failed at {}: {}", handler->name(), point,
                 done.error().message());
      co_return done;
    }
  }
  co_return ok();
}

auto FeaturePipeline::created(Task& t) -> task<Result<void>> {
  return dispatch(t, &FeatureHandler::created, "created");
}

auto FeaturePipeline::stopped(Task& t) -> task<Result<void>> {
  return dispatch(t, &FeatureHandler::stopped, "stopped");
}

auto FeaturePipeline::killed(Task& t) -> task<Result<void>> {
  return dispatch(t, &FeatureHandler::killed, "killed");
}

auto FeaturePipeline::names() const -> std::vector<std::string_view> {
  std::vector<std::string_view> out;
  out.reserve(handlers_.size());
  for (const auto& handler : handlers_) {
    out.push_back(handler->name());
  }
  return out;
}

}  // namespace dockworker
