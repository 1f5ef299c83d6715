#pragma once

#include "dockworker/core/coroutine.hpp"
#include "dockworker/core/error.hpp"
#include "dockworker/http/http_parser.hpp"
#include "dockworker/http/http_types.hpp"
#include "dockworker/io/event_loop.hpp"

#include <cstdint>
#include <memory>
#include <string_view>

namespace dockworker::http {

struct HttpClientConfig {
  std::size_t max_response_size{10 * 1024 * 1024};
  bool keep_alive{true};
};

class HttpClient {
public:
  HttpClient(io::EventLoop& loop, int fd, HttpClientConfig config = {});
  ~HttpClient();

  HttpClient(const HttpClient&) = delete;
  auto operator=(const HttpClient&) -> HttpClient& = delete;
  HttpClient(HttpClient&&) noexcept;
  auto operator=(HttpClient&&) noexcept -> HttpClient&;

  static auto connect_tcp(io::EventLoop& loop, std::string_view host,
                          std::uint16_t port, HttpClientConfig config = {})
      -> task<Result<std::unique_ptr<HttpClient>>>;

  static auto connect_unix(io::EventLoop& loop, std::string_view socket_path,
                           HttpClientConfig config = {})
      -> task<Result<std::unique_ptr<HttpClient>>>;

  auto request(HttpRequest req) -> task<Result<HttpResponse>>;

  // Streams a successful response body into `sink` until the server ends the
  // message; non-2xx bodies are buffered into the returned response instead.
  auto request_stream(HttpRequest req, BodySink sink)
      -> task<Result<HttpResponse>>;

  auto get(std::string_view path, const HttpHeaders& headers = {})
      -> task<Result<HttpResponse>>;

  auto post(std::string_view path, std::vector<std::uint8_t> body,
            const HttpHeaders& headers = {}) -> task<Result<HttpResponse>>;

  auto post_json(std::string_view path, std::string_view json,
                 const HttpHeaders& headers = {}) -> task<Result<HttpResponse>>;

  auto delete_(std::string_view path, const HttpHeaders& headers = {})
      -> task<Result<HttpResponse>>;

  [[nodiscard]] auto is_connected() const noexcept -> bool;
  auto close() -> void;

private:
  auto exchange(HttpRequest req, HttpResponseParser& parser)
      -> task<Result<HttpResponse>>;

  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace dockworker::http
