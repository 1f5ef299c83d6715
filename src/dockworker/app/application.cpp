#include "dockworker/app/application.hpp"

#include "dockworker/docker/docker_client.hpp"
#include "dockworker/features/builtin.hpp"
#include "dockworker/io/event_loop.hpp"
#include "dockworker/queue/http_queue_client.hpp"
#include "dockworker/runtime/docker_runtime.hpp"
#include "dockworker/schema/payload_validator.hpp"
#include "dockworker/task/task.hpp"
#include "dockworker/util/log.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>

namespace dockworker {

namespace {

class StdoutLogConsumer : public LogConsumer {
public:
  auto write(std::string_view chunk) -> task<void> override {
    std::fwrite(chunk.data(), 1, chunk.size(), stdout);
    co_return;
  }

  auto close() -> task<void> override {
    std::fflush(stdout);
    co_return;
  }
};

}  // namespace

auto load_task_file(std::string_view path) -> Result<nlohmann::json> {
  std::ifstream file{std::string(path)};
  if (!file.is_open()) {
    return fail(Error::FileNotFound);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  auto doc = nlohmann::json::parse(buffer.str(), nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    log::error("task file {} is not a JSON object", path);
    return fail(Error::ParseError);
  }
  return doc;
}

struct Application::Impl {
  WorkerConfig config;
  io::EventLoop loop;
  FeatureRegistry registry;
  Stats stats;
  DockerPayloadValidator validator;

  std::unique_ptr<docker::DockerClient> docker;
  std::unique_ptr<DockerContainerRuntime> runtime;
  std::unique_ptr<HttpQueueClient> queue;
  std::unique_ptr<TaskRunner> runner;

  explicit Impl(WorkerConfig cfg)
      : config(std::move(cfg)), registry(builtin_registry()) {
  }
};

Application::Application(WorkerConfig config)
    : impl_{std::make_unique<Impl>(std::move(config))} {
  apply_feature_defaults(impl_->registry, impl_->config.features.defaults);
}

Application::~Application() = default;

auto Application::init() -> Result<void> {
  auto& cfg = impl_->config;
  if (!impl_->loop.valid()) {
    return fail(Error::Unknown);
  }

  if (cfg.worker.worker_id.empty()) {
    cfg.worker.worker_id = std::format("dockworker-{}", generate_short_suffix());
    log::info("no worker_id configured, using {}", cfg.worker.worker_id);
  }

  auto queue = HttpQueueClient::create(impl_->loop, cfg.queue.base_url);
  if (!queue) {
    log::error("invalid queue base_url '{}'", cfg.queue.base_url);
    return std::unexpected(queue.error());
  }
  impl_->queue = std::move(*queue);

  impl_->docker = std::make_unique<docker::DockerClient>(
      impl_->loop, docker::DockerClientConfig{
                       .socket_path = cfg.docker.socket,
                       .api_version = cfg.docker.api_version,
                   });
  impl_->runtime = std::make_unique<DockerContainerRuntime>(*impl_->docker);

  impl_->runner = std::make_unique<TaskRunner>(RunnerContext{
      .queue = *impl_->queue,
      .runtime = *impl_->runtime,
      .validator = impl_->validator,
      .stats = impl_->stats,
      .timers = impl_->loop,
      .sched = impl_->loop,
      .registry = impl_->registry,
      .feature_settings =
          FeatureSettings{
              .live_log_dir = cfg.features.live_log_dir,
              .artifact_dir = cfg.features.artifact_dir,
              .dind_image = cfg.features.dind_image,
          },
      .worker_id = cfg.worker.worker_id,
      .worker_group = cfg.worker.worker_group,
      .reclaim =
          ReclaimPolicy{
              .divisor = cfg.reclaim.divisor,
              .max_attempts = cfg.reclaim.max_attempts,
              .retry_delay = std::chrono::milliseconds(cfg.reclaim.retry_delay_ms),
              .abort_on_failure = cfg.reclaim.abort_on_failure,
          },
      .formatter = LogFormatter(cfg.worker.log_tag),
  });

  log::info("worker {} ready (group={}, docker={}, queue={})",
            cfg.worker.worker_id, cfg.worker.worker_group, cfg.docker.socket,
            cfg.queue.base_url);
  return ok();
}

auto Application::run_task(TaskInput input) -> Result<RunOutcome> {
  if (!impl_->runner) {
    return fail(Error::InvalidArgument);
  }

  if (!input.status.is_object()) {
    input.status = nlohmann::json::object();
  }
  if (!input.status.contains("taskId")) {
    input.status["taskId"] = input.task_id.str();
  }

  Task t(std::move(input.task_id), input.run_id, std::move(input.definition),
         std::move(input.status), impl_->loop);
  t.log.attach(std::make_shared<StdoutLogConsumer>());

  auto result = impl_->loop.block_on(impl_->runner->run(t));
  impl_->stats.log_snapshot();

  for (const auto& [name, path] : t.artifacts) {
    log::info("artifact {} -> {}", name, path.string());
  }
  if (!result) {
    log::error("task {} run {} ended in state {}: {}", t.task_id, t.run_id,
               to_string_view(t.state), result.error().message());
  }
  return result;
}

auto Application::config() const noexcept -> const WorkerConfig& {
  return impl_->config;
}

auto Application::registry() const noexcept -> const FeatureRegistry& {
  return impl_->registry;
}

auto Application::stats() noexcept -> Stats& {
  return impl_->stats;
}

}  // namespace dockworker
