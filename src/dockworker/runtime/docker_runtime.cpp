#include "dockworker/runtime/docker_runtime.hpp"

#include "dockworker/util/log.hpp"

namespace dockworker {

namespace {

auto to_error(docker::DockerError error, Error fallback) -> Error {
  switch (error) {
    case docker::DockerError::ContainerNotFound:
      return Error::ContainerNotFound;
    case docker::DockerError::ImageNotFound:
      return Error::ImageNotFound;
    case docker::DockerError::ConnectionFailed:
      return Error::ConnectionFailed;
    default:
      return fallback;
  }
}

auto to_request(const ContainerSpec& spec) -> docker::CreateContainerRequest {
  return docker::CreateContainerRequest{
      .name = spec.name,
      .image = spec.image,
      .cmd = spec.command,
      .env = spec.env_list(),
      .links = spec.link_list(),
      .tty = true,
      .privileged = spec.privileged,
  };
}

}  // namespace

DockerContainerRuntime::DockerContainerRuntime(docker::DockerClient& client)
    : client_(client) {
}

auto DockerContainerRuntime::create(const ContainerSpec& spec)
    -> task<Result<ContainerId>> {
  auto request = to_request(spec);
  auto created = co_await client_.create_container(request);

  if (!created && created.error() == docker::DockerError::ImageNotFound) {
    if (auto pulled = co_await client_.pull_image(spec.image); !pulled) {
      co_return fail(to_error(pulled.error(), Error::ImageNotFound));
    }
    created = co_await client_.create_container(request);
  }

  if (!created) {
    log::error("create container from {} failed: {}", spec.image,
               docker::to_string_view(created.error()));
    co_return fail(to_error(created.error(), Error::ContainerCreateFailed));
  }
  for (const auto& warning : created->warnings) {
    log::warn("docker: {}", warning);
  }
  co_return ContainerId{created->id};
}

auto DockerContainerRuntime::start(const ContainerId& id) -> task<Result<void>> {
  auto started = co_await client_.start_container(id.value());
  if (!started) {
    co_return fail(to_error(started.error(), Error::ContainerStartFailed));
  }
  co_return ok();
}

auto DockerContainerRuntime::attach(const ContainerId& id, OutputSink sink)
    -> task<Result<void>> {
  auto streamed = co_await client_.stream_logs(id.value(), std::move(sink));
  if (!streamed) {
    co_return fail(to_error(streamed.error(), Error::ConnectionFailed));
  }
  co_return ok();
}

auto DockerContainerRuntime::wait(const ContainerId& id) -> task<Result<int>> {
  auto waited = co_await client_.wait_container(id.value());
  if (!waited) {
    co_return fail(to_error(waited.error(), Error::ContainerWaitFailed));
  }
  if (!waited->error.empty()) {
    log::warn("container {} wait reported: {}", id, waited->error);
  }
  co_return waited->status_code;
}

auto DockerContainerRuntime::kill(const ContainerId& id) -> task<Result<void>> {
  auto killed = co_await client_.kill_container(id.value());
  if (!killed && killed.error() != docker::DockerError::NotRunning) {
    co_return fail(to_error(killed.error(), Error::ContainerKillFailed));
  }
  co_return ok();
}

auto DockerContainerRuntime::remove(const ContainerId& id) -> task<Result<void>> {
  auto removed = co_await client_.remove_container(id.value(), true);
  if (!removed && removed.error() != docker::DockerError::ContainerNotFound) {
    co_return fail(to_error(removed.error(), Error::ContainerRemoveFailed));
  }
  co_return ok();
}

}  // namespace dockworker
