#include "dockworker/docker/docker_client.hpp"

#include "dockworker/util/log.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <format>
#include <iterator>

namespace dockworker::docker {

using json = nlohmann::json;

namespace {

auto url_encode(std::string_view input) -> std::string {
  std::string result;
  result.reserve(input.size() * 3);
  for (char c : input) {
    if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' ||
        c == '.' || c == '~') {
      result += c;
    } else {
      std::format_to(std::back_inserter(result), "%{:02X}",
                     static_cast<unsigned char>(c));
    }
  }
  return result;
}

auto is_valid_container_id(std::string_view id) -> bool {
  if (id.empty() || id.size() > 128) {
    return false;
  }
  for (char c : id) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-' &&
        c != '.') {
      return false;
    }
  }
  return true;
}

auto status_of(const http::HttpResponse& r) -> int {
  return static_cast<int>(r.status);
}

}  // namespace

auto build_create_body(const CreateContainerRequest& request) -> std::string {
  json body;
  body["Image"] = request.image;
  body["Hostname"] = "";
  body["User"] = "";
  body["AttachStdin"] = false;
  body["AttachStdout"] = true;
  body["AttachStderr"] = true;
  body["Tty"] = request.tty;
  body["OpenStdin"] = false;
  body["StdinOnce"] = false;

  if (!request.cmd.empty()) {
    body["Cmd"] = request.cmd;
  }
  body["Env"] = request.env;

  json host_config = json::object();
  if (!request.links.empty()) {
    host_config["Links"] = request.links;
  }
  if (request.privileged) {
    host_config["Privileged"] = true;
  }
  body["HostConfig"] = std::move(host_config);
  return body.dump();
}

struct DockerClient::Impl {
  io::EventLoop* loop{nullptr};
  DockerClientConfig config;
  std::unique_ptr<http::HttpClient> control;
  bool control_busy{false};

  Impl(io::EventLoop& l, DockerClientConfig cfg)
      : loop(&l), config(std::move(cfg)) {
  }

  auto path(std::string_view suffix) const -> std::string {
    return std::format("/{}{}", config.api_version, suffix);
  }
};

DockerClient::DockerClient(io::EventLoop& loop, DockerClientConfig config)
    : impl_(std::make_unique<Impl>(loop, std::move(config))) {
}

DockerClient::~DockerClient() = default;

auto DockerClient::config() const noexcept -> const DockerClientConfig& {
  return impl_->config;
}

auto DockerClient::open_dedicated()
    -> task<DockerResult<std::unique_ptr<http::HttpClient>>> {
  http::HttpClientConfig http_config{
      .max_response_size = 100 * 1024 * 1024,
      .keep_alive = false,
  };
  auto client = co_await http::HttpClient::connect_unix(
      *impl_->loop, impl_->config.socket_path, http_config);
  if (!client) {
    log::error("Failed to connect to Docker socket: {}",
               impl_->config.socket_path);
    co_return std::unexpected(DockerError::ConnectionFailed);
  }
  co_return std::move(*client);
}

auto DockerClient::send(http::HttpRequest req)
    -> task<DockerResult<http::HttpResponse>> {
  if (impl_->control_busy) {
    auto dedicated = co_await open_dedicated();
    if (!dedicated) {
      co_return std::unexpected(dedicated.error());
    }
    auto response = co_await (*dedicated)->request(std::move(req));
    if (!response) {
      co_return std::unexpected(DockerError::ConnectionFailed);
    }
    co_return std::move(*response);
  }

  impl_->control_busy = true;
  if (!impl_->control || !impl_->control->is_connected()) {
    auto client = co_await http::HttpClient::connect_unix(
        *impl_->loop, impl_->config.socket_path,
        http::HttpClientConfig{.max_response_size = 100 * 1024 * 1024});
    if (!client) {
      impl_->control_busy = false;
      log::error("Failed to connect to Docker socket: {}",
                 impl_->config.socket_path);
      co_return std::unexpected(DockerError::ConnectionFailed);
    }
    impl_->control = std::move(*client);
  }

  auto response = co_await impl_->control->request(std::move(req));
  impl_->control_busy = false;
  if (!response) {
    impl_->control.reset();
    co_return std::unexpected(DockerError::ConnectionFailed);
  }
  co_return std::move(*response);
}

auto DockerClient::ping() -> task<DockerResult<void>> {
  auto response = co_await send(
      http::HttpRequest{http::HttpMethod::GET, impl_->path("/_ping"), {}, {}});
  if (!response) {
    co_return std::unexpected(response.error());
  }
  if (!response->is_success()) {
    co_return std::unexpected(DockerError::ApiError);
  }
  co_return DockerResult<void>{};
}

auto DockerClient::create_container(const CreateContainerRequest& request)
    -> task<DockerResult<CreateContainerResponse>> {
  if (request.image.empty()) {
    co_return std::unexpected(DockerError::InvalidInput);
  }

  std::string path = impl_->path("/containers/create");
  if (!request.name.empty()) {
    std::format_to(std::back_inserter(path), "?name={}",
                   url_encode(request.name));
  }

  auto body = build_create_body(request);
  http::HttpRequest req{http::HttpMethod::POST,
                        path,
                        {{"Content-Type", "application/json"}},
                        std::vector<std::uint8_t>(body.begin(), body.end())};

  auto response = co_await send(std::move(req));
  if (!response) {
    co_return std::unexpected(response.error());
  }

  if (response->status == http::HttpStatus::NotFound) {
    log::warn("Docker image not found: {}", request.image);
    co_return std::unexpected(DockerError::ImageNotFound);
  }

  if (response->status == http::HttpStatus::Conflict) {
    log::error("Container name conflict: {}", request.name);
    co_return std::unexpected(DockerError::Conflict);
  }

  if (response->status != http::HttpStatus::Created) {
    log::error("Failed to create container: status={} body={}",
               status_of(*response), response->body_as_string());
    co_return std::unexpected(DockerError::ApiError);
  }

  try {
    auto json_body = json::parse(response->body.begin(), response->body.end());
    CreateContainerResponse result;
    result.id = json_body.value("Id", "");
    if (json_body.contains("Warnings") && json_body["Warnings"].is_array()) {
      for (const auto& w : json_body["Warnings"]) {
        result.warnings.push_back(w.get<std::string>());
      }
    }
    if (result.id.empty()) {
      co_return std::unexpected(DockerError::ParseError);
    }
    co_return result;
  } catch (const json::exception& e) {
    log::error("Failed to parse create container response: {}", e.what());
    co_return std::unexpected(DockerError::ParseError);
  }
}

auto DockerClient::pull_image(std::string_view image)
    -> task<DockerResult<void>> {
  if (image.empty()) {
    co_return std::unexpected(DockerError::InvalidInput);
  }

  std::string image_name{image};
  std::string tag = "latest";
  if (auto pos = image.rfind(':'); pos != std::string_view::npos) {
    if (image.find('/', pos) == std::string_view::npos) {
      image_name = std::string(image.substr(0, pos));
      tag = std::string(image.substr(pos + 1));
    }
  }

  log::info("DockerClient: pulling image {}:{}", image_name, tag);

  // Pull progress is streamed as JSON lines; a dedicated connection reads it
  // to the end so the pull has finished when this returns.
  auto client = co_await open_dedicated();
  if (!client) {
    co_return std::unexpected(client.error());
  }
  std::string last_error;
  auto response = co_await (*client)->request_stream(
      http::HttpRequest{
          http::HttpMethod::POST,
          impl_->path(std::format("/images/create?fromImage={}&tag={}",
                                  url_encode(image_name), url_encode(tag))),
          {},
          {}},
      [&last_error](std::span<const std::uint8_t> bytes) {
        std::string_view text(reinterpret_cast<const char*>(bytes.data()),
                              bytes.size());
        if (text.find("\"error\"") != std::string_view::npos) {
          last_error.assign(text);
        }
      });

  if (!response) {
    co_return std::unexpected(DockerError::ConnectionFailed);
  }
  if (response->status == http::HttpStatus::NotFound) {
    log::error("Image not found: {}:{}", image_name, tag);
    co_return std::unexpected(DockerError::ImageNotFound);
  }
  if (!response->is_success() || !last_error.empty()) {
    log::error("Failed to pull image {}:{}: status={} {}", image_name, tag,
               status_of(*response), last_error);
    co_return std::unexpected(DockerError::ApiError);
  }

  log::info("DockerClient: pulled image {}:{}", image_name, tag);
  co_return DockerResult<void>{};
}

auto DockerClient::start_container(std::string_view container_id)
    -> task<DockerResult<void>> {
  if (!is_valid_container_id(container_id)) {
    log::error("Invalid container ID: {}", container_id);
    co_return std::unexpected(DockerError::InvalidInput);
  }

  auto response = co_await send(http::HttpRequest{
      http::HttpMethod::POST,
      impl_->path(std::format("/containers/{}/start", container_id)),
      {},
      {}});
  if (!response) {
    co_return std::unexpected(response.error());
  }

  if (response->status == http::HttpStatus::NotFound) {
    log::error("Container not found: {}", container_id);
    co_return std::unexpected(DockerError::ContainerNotFound);
  }

  if (response->status != http::HttpStatus::NoContent &&
      response->status != http::HttpStatus::NotModified) {
    log::error("Failed to start container {}: status={} body={}", container_id,
               status_of(*response), response->body_as_string());
    co_return std::unexpected(DockerError::ApiError);
  }

  co_return DockerResult<void>{};
}

auto DockerClient::wait_container(std::string_view container_id)
    -> task<DockerResult<WaitContainerResponse>> {
  if (!is_valid_container_id(container_id)) {
    log::error("Invalid container ID: {}", container_id);
    co_return std::unexpected(DockerError::InvalidInput);
  }

  auto client = co_await open_dedicated();
  if (!client) {
    co_return std::unexpected(client.error());
  }

  auto response = co_await (*client)->request(http::HttpRequest{
      http::HttpMethod::POST,
      impl_->path(std::format("/containers/{}/wait", container_id)),
      {},
      {}});
  if (!response) {
    co_return std::unexpected(DockerError::ConnectionFailed);
  }

  if (response->status == http::HttpStatus::NotFound) {
    log::error("Container not found: {}", container_id);
    co_return std::unexpected(DockerError::ContainerNotFound);
  }

  if (response->status != http::HttpStatus::Ok) {
    log::error("Failed to wait for container {}: status={}", container_id,
               status_of(*response));
    co_return std::unexpected(DockerError::ApiError);
  }

  try {
    auto json_body = json::parse(response->body.begin(), response->body.end());
    WaitContainerResponse result;
    result.status_code = json_body.value("StatusCode", 0);
    if (json_body.contains("Error") && json_body["Error"].is_object()) {
      result.error = json_body["Error"].value("Message", "");
    }
    co_return result;
  } catch (const json::exception& e) {
    log::error("Failed to parse wait container response: {}", e.what());
    co_return std::unexpected(DockerError::ParseError);
  }
}

auto DockerClient::stream_logs(std::string_view container_id,
                               LogChunkSink sink) -> task<DockerResult<void>> {
  if (!is_valid_container_id(container_id)) {
    log::error("Invalid container ID: {}", container_id);
    co_return std::unexpected(DockerError::InvalidInput);
  }

  auto client = co_await open_dedicated();
  if (!client) {
    co_return std::unexpected(client.error());
  }

  auto response = co_await (*client)->request_stream(
      http::HttpRequest{
          http::HttpMethod::GET,
          impl_->path(std::format(
              "/containers/{}/logs?follow=1&stdout=1&stderr=1", container_id)),
          {},
          {}},
      [&sink](std::span<const std::uint8_t> bytes) {
        sink(std::string_view(reinterpret_cast<const char*>(bytes.data()),
                              bytes.size()));
      });
  if (!response) {
    co_return std::unexpected(DockerError::ConnectionFailed);
  }

  if (response->status == http::HttpStatus::NotFound) {
    co_return std::unexpected(DockerError::ContainerNotFound);
  }
  if (!response->is_success()) {
    log::error("Failed to stream logs for container {}: status={}",
               container_id, status_of(*response));
    co_return std::unexpected(DockerError::ApiError);
  }
  co_return DockerResult<void>{};
}

auto DockerClient::kill_container(std::string_view container_id,
                                  std::string_view signal)
    -> task<DockerResult<void>> {
  if (!is_valid_container_id(container_id)) {
    log::error("Invalid container ID: {}", container_id);
    co_return std::unexpected(DockerError::InvalidInput);
  }

  auto response = co_await send(http::HttpRequest{
      http::HttpMethod::POST,
      impl_->path(std::format("/containers/{}/kill?signal={}", container_id,
                              url_encode(signal))),
      {},
      {}});
  if (!response) {
    co_return std::unexpected(response.error());
  }

  switch (response->status) {
    case http::HttpStatus::NoContent:
      co_return DockerResult<void>{};
    case http::HttpStatus::NotFound:
      co_return std::unexpected(DockerError::ContainerNotFound);
    case http::HttpStatus::Conflict:
      co_return std::unexpected(DockerError::NotRunning);
    default:
      log::error("Failed to kill container {}: status={}", container_id,
                 status_of(*response));
      co_return std::unexpected(DockerError::ApiError);
  }
}

auto DockerClient::remove_container(std::string_view container_id, bool force)
    -> task<DockerResult<void>> {
  if (!is_valid_container_id(container_id)) {
    log::error("Invalid container ID: {}", container_id);
    co_return std::unexpected(DockerError::InvalidInput);
  }

  auto response = co_await send(http::HttpRequest{
      http::HttpMethod::DELETE,
      impl_->path(std::format("/containers/{}?force={}&v=true", container_id,
                              force ? "true" : "false")),
      {},
      {}});
  if (!response) {
    co_return std::unexpected(response.error());
  }

  if (response->status == http::HttpStatus::NotFound) {
    co_return std::unexpected(DockerError::ContainerNotFound);
  }

  if (response->status != http::HttpStatus::NoContent) {
    log::error("Failed to remove container {}: status={}", container_id,
               status_of(*response));
    co_return std::unexpected(DockerError::ApiError);
  }

  co_return DockerResult<void>{};
}

}  // namespace dockworker::docker
