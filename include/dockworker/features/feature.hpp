#pragma once

#include "dockworker/core/coroutine.hpp"
#include "dockworker/core/error.hpp"
#include "dockworker/runtime/container_runtime.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace dockworker {

struct Task;

// Lifecycle extension around a task run. Every hook defaults to a no-op.
class FeatureHandler {
public:
  virtual ~FeatureHandler() = default;

  [[nodiscard]] virtual auto name() const -> std::string_view = 0;

  virtual auto link(Task& t) -> task<Result<std::vector<ContainerLink>>>;
  virtual auto created(Task& t) -> task<Result<void>>;
  virtual auto stopped(Task& t) -> task<Result<void>>;
  virtual auto killed(Task& t) -> task<Result<void>>;
};

struct FeatureSettings {
  std::filesystem::path live_log_dir{"/tmp/dockworker/live"};
  std::filesystem::path artifact_dir{"/tmp/dockworker/artifacts"};
  std::string dind_image{"docker:dind"};
};

struct FeatureServices {
  ContainerRuntime& runtime;
  scheduler& sched;
  FeatureSettings settings;
};

using FeatureFactory =
    std::function<std::unique_ptr<FeatureHandler>(const FeatureServices&)>;

struct FeatureEntry {
  std::string name;
  bool default_enabled{false};
  FeatureFactory factory;
};

// Ordered set of known features. Registration order is dispatch order.
class FeatureRegistry {
public:
  auto add(std::string name, bool default_enabled, FeatureFactory factory)
      -> FeatureRegistry&;

  // Returns false for an unknown name.
  auto set_default(std::string_view name, bool enabled) -> bool;

  [[nodiscard]] auto find(std::string_view name) const -> const FeatureEntry*;
  [[nodiscard]] auto entries() const noexcept
      -> const std::vector<FeatureEntry>& {
    return entries_;
  }
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return entries_.size();
  }

private:
  std::vector<FeatureEntry> entries_;
};

// Enabled handlers for one task, in registry order. Each dispatch point runs
// the handlers one after another; the first error stops the rest.
class FeaturePipeline {
public:
  FeaturePipeline() = default;

  [[nodiscard]] static auto build(
      const FeatureRegistry& registry,
      const std::map<std::string, bool, std::less<>>& flags,
      const FeatureServices& services) -> FeaturePipeline;

  auto link(Task& t) -> task<Result<std::vector<ContainerLink>>>;
  auto created(Task& t) -> task<Result<void>>;
  auto stopped(Task& t) -> task<Result<void>>;
  auto killed(Task& t) -> task<Result<void>>;

  [[nodiscard]] auto names() const -> std::vector<std::string_view>;
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return handlers_.size();
  }

private:
  using Hook = task<Result<void>> (FeatureHandler::*)(Task&);

  auto dispatch(Task& t, Hook hook, std::string_view point)
      -> task<Result<void>>;

  std::vector<std::unique_ptr<FeatureHandler>> handlers_;
};

}  // namespace dockworker
