#include "dockworker/features/dind.hpp"

#include "dockworker/task/task.hpp"
#include "dockworker/util/log.hpp"

#include <format>

namespace dockworker {

DindFeature::DindFeature(const FeatureServices& services)
    : runtime_(services.runtime), image_(services.settings.dind_image) {
}

auto DindFeature::link(Task& t) -> task<Result<std::vector<ContainerLink>>> {
  ContainerSpec spec;
  spec.name = std::format("dind-{}-{}-{}", t.task_id, t.run_id,
                          generate_short_suffix());
  spec.image = image_;
  spec.privileged = true;

  auto created = co_await runtime_.create(spec);
  if (!created) {
    co_return std::unexpected(created.error());
  }
  sidecar_ = *created;

  if (auto started = co_await runtime_.start(*sidecar_); !started) {
    co_return std::unexpected(started.error());
  }
  log::info("dind sidecar {} started for taskId={}", spec.name, t.task_id);

  co_return std::vector<ContainerLink>{
      ContainerLink{.name = spec.name, .alias = std::string(kAlias)}};
}

auto DindFeature::killed(Task& t) -> task<Result<void>> {
  if (!sidecar_) {
    co_return ok();
  }
  if (auto killed = co_await runtime_.kill(*sidecar_); !killed) {
    log::warn("dind sidecar for taskId={} kill failed: {}", t.task_id,
              killed.error().message());
  }
  auto removed = co_await runtime_.remove(*sidecar_);
  if (!removed) {
    co_return removed;
  }
  sidecar_.reset();
  co_return ok();
}

}  // namespace dockworker
