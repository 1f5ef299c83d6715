#pragma once

#include "dockworker/core/coroutine.hpp"
#include "dockworker/http/http_client.hpp"
#include "dockworker/io/event_loop.hpp"

#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace dockworker::docker {

struct DockerClientConfig {
  std::string socket_path{"/var/run/docker.sock"};
  std::string api_version{"v1.43"};
};

struct CreateContainerRequest {
  std::string name;
  std::string image;
  std::vector<std::string> cmd;
  std::vector<std::string> env;
  std::vector<std::string> links;
  bool tty{true};
  bool privileged{false};
};

struct CreateContainerResponse {
  std::string id;
  std::vector<std::string> warnings;
};

struct WaitContainerResponse {
  int status_code{0};
  std::string error;
};

enum class DockerError {
  ConnectionFailed,
  ApiError,
  ContainerNotFound,
  ImageNotFound,
  Conflict,
  NotRunning,
  ParseError,
  InvalidInput,
};

[[nodiscard]] constexpr auto to_string_view(DockerError error) noexcept
    -> std::string_view {
  switch (error) {
    case DockerError::ConnectionFailed:
      return "connection failed";
    case DockerError::ApiError:
      return "API error";
    case DockerError::ContainerNotFound:
      return "container not found";
    case DockerError::ImageNotFound:
      return "image not found";
    case DockerError::Conflict:
      return "conflict";
    case DockerError::NotRunning:
      return "container not running";
    case DockerError::ParseError:
      return "parse error";
    case DockerError::InvalidInput:
      return "invalid input";
  }
  return "unknown error";
}

template <typename T>
using DockerResult = std::expected<T, DockerError>;

using LogChunkSink = std::move_only_function<void(std::string_view)>;

// Docker Engine API over a UNIX socket. Short control calls share one
// keep-alive connection; wait and log streaming open their own because they
// stay open for the container's lifetime.
class DockerClient {
public:
  DockerClient(io::EventLoop& loop, DockerClientConfig config = {});
  ~DockerClient();

  DockerClient(const DockerClient&) = delete;
  auto operator=(const DockerClient&) -> DockerClient& = delete;

  auto ping() -> task<DockerResult<void>>;

  auto create_container(const CreateContainerRequest& request)
      -> task<DockerResult<CreateContainerResponse>>;

  auto pull_image(std::string_view image) -> task<DockerResult<void>>;

  auto start_container(std::string_view container_id)
      -> task<DockerResult<void>>;

  auto wait_container(std::string_view container_id)
      -> task<DockerResult<WaitContainerResponse>>;

  // Follows the combined output of a started container until it exits.
  auto stream_logs(std::string_view container_id, LogChunkSink sink)
      -> task<DockerResult<void>>;

  auto kill_container(std::string_view container_id,
                      std::string_view signal = "SIGKILL")
      -> task<DockerResult<void>>;

  auto remove_container(std::string_view container_id, bool force = true)
      -> task<DockerResult<void>>;

  [[nodiscard]] auto config() const noexcept -> const DockerClientConfig&;

private:
  auto send(http::HttpRequest req) -> task<DockerResult<http::HttpResponse>>;
  auto open_dedicated() -> task<DockerResult<std::unique_ptr<http::HttpClient>>>;

  struct Impl;
  std::unique_ptr<Impl> impl_;
};

[[nodiscard]] auto build_create_body(const CreateContainerRequest& request)
    -> std::string;

}  // namespace dockworker::docker
