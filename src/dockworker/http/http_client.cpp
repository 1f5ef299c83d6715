#include "dockworker/http/http_client.hpp"

#include "dockworker/util/log.hpp"

#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace dockworker::http {

struct HttpClient::Impl {
  io::EventLoop* loop{nullptr};
  int fd{-1};
  HttpClientConfig config;
  std::string host;

  Impl(io::EventLoop& l, int socket_fd, HttpClientConfig cfg)
      : loop(&l), fd(socket_fd), config(std::move(cfg)) {
  }

  ~Impl() {
    if (fd >= 0) {
      ::close(fd);
    }
  }
};

HttpClient::HttpClient(io::EventLoop& loop, int fd, HttpClientConfig config)
    : impl_(std::make_unique<Impl>(loop, fd, std::move(config))) {
}

HttpClient::~HttpClient() = default;

HttpClient::HttpClient(HttpClient&&) noexcept = default;
auto HttpClient::operator=(HttpClient&&) noexcept -> HttpClient& = default;

auto HttpClient::connect_tcp(io::EventLoop& loop, std::string_view host,
                             std::uint16_t port, HttpClientConfig config)
    -> task<Result<std::unique_ptr<HttpClient>>> {
  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo* result = nullptr;
  std::string host_str(host);
  std::string port_str = std::to_string(port);

  int ret = ::getaddrinfo(host_str.c_str(), port_str.c_str(), &hints, &result);
  if (ret != 0 || result == nullptr) {
    log::error("Failed to resolve {}:{} - {}", host, port, gai_strerror(ret));
    co_return fail(Error::ConnectionFailed);
  }
  auto addr_guard =
      std::unique_ptr<addrinfo, decltype(&freeaddrinfo)>(result, freeaddrinfo);

  int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    log::error("Failed to create socket: {}", std::strerror(errno));
    co_return fail(Error::ConnectionFailed);
  }

  auto connected = co_await loop.async_connect(fd, result->ai_addr,
                                               result->ai_addrlen);
  if (!connected) {
    log::error("Failed to connect to {}:{} - {}", host, port,
               connected.error().message());
    ::close(fd);
    co_return fail(Error::ConnectionFailed);
  }

  auto client = std::make_unique<HttpClient>(loop, fd, std::move(config));
  client->impl_->host = port == 80 ? host_str : std::format("{}:{}", host, port);
  co_return client;
}

auto HttpClient::connect_unix(io::EventLoop& loop, std::string_view socket_path,
                              HttpClientConfig config)
    -> task<Result<std::unique_ptr<HttpClient>>> {
  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  if (socket_path.size() >= sizeof(addr.sun_path)) {
    log::error("Socket path too long: {}", socket_path);
    co_return fail(Error::InvalidArgument);
  }
  std::memcpy(addr.sun_path, socket_path.data(), socket_path.size());
  addr.sun_path[socket_path.size()] = '\0';

  int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    log::error("Failed to create unix socket: {}", std::strerror(errno));
    co_return fail(Error::ConnectionFailed);
  }

  auto connected = co_await loop.async_connect(
      fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
  if (!connected) {
    log::error("Failed to connect to {} - {}", socket_path,
               connected.error().message());
    ::close(fd);
    co_return fail(Error::ConnectionFailed);
  }

  auto client = std::make_unique<HttpClient>(loop, fd, std::move(config));
  client->impl_->host = "localhost";
  co_return client;
}

auto HttpClient::exchange(HttpRequest req, HttpResponseParser& parser)
    -> task<Result<HttpResponse>> {
  if (!is_connected()) {
    co_return fail(Error::ConnectionFailed);
  }

  if (!req.headers.contains("Host")) {
    req.headers["Host"] = impl_->host;
  }
  if (!req.headers.contains("Connection")) {
    req.headers["Connection"] = impl_->config.keep_alive ? "keep-alive" : "close";
  }

  auto request_data = req.serialize();
  std::size_t written = 0;
  while (written < request_data.size()) {
    auto remaining = std::as_bytes(std::span{request_data}).subspan(written);
    auto n = co_await impl_->loop->async_write(impl_->fd, remaining);
    if (!n || *n == 0) {
      log::error("Failed to write {} {}: {}", req.method, req.path,
                 n ? "connection closed" : n.error().message());
      close();
      co_return fail(Error::ConnectionFailed);
    }
    written += *n;
  }

  std::vector<std::byte> buffer(8192);
  std::size_t total_read = 0;

  while (total_read < impl_->config.max_response_size) {
    auto n = co_await impl_->loop->async_read(impl_->fd, buffer);
    if (!n) {
      log::error("Failed to read response: {}", n.error().message());
      close();
      co_return fail(Error::ConnectionFailed);
    }

    if (*n == 0) {
      close();
      if (auto response = parser.finish()) {
        co_return std::move(*response);
      }
      break;
    }

    total_read += *n;
    auto chunk = std::span{reinterpret_cast<const std::uint8_t*>(buffer.data()), *n};
    if (auto response = parser.parse(chunk)) {
      if (!impl_->config.keep_alive) {
        close();
      }
      co_return std::move(*response);
    }
    if (parser.has_error()) {
      close();
      co_return fail(Error::ParseError);
    }
  }

  log::error("Failed to parse response or response too large");
  close();
  co_return fail(Error::ParseError);
}

auto HttpClient::request(HttpRequest req) -> task<Result<HttpResponse>> {
  HttpResponseParser parser;
  co_return co_await exchange(std::move(req), parser);
}

auto HttpClient::request_stream(HttpRequest req, BodySink sink)
    -> task<Result<HttpResponse>> {
  HttpResponseParser parser;
  parser.set_body_sink(std::move(sink));
  co_return co_await exchange(std::move(req), parser);
}

auto HttpClient::get(std::string_view path, const HttpHeaders& headers)
    -> task<Result<HttpResponse>> {
  HttpRequest req{HttpMethod::GET, std::string(path), headers, {}};
  co_return co_await request(std::move(req));
}

auto HttpClient::post(std::string_view path, std::vector<std::uint8_t> body,
                      const HttpHeaders& headers) -> task<Result<HttpResponse>> {
  HttpRequest req{HttpMethod::POST, std::string(path), headers, std::move(body)};
  co_return co_await request(std::move(req));
}

auto HttpClient::post_json(std::string_view path, std::string_view json,
                           const HttpHeaders& headers)
    -> task<Result<HttpResponse>> {
  HttpHeaders merged_headers = headers;
  merged_headers["Content-Type"] = "application/json";

  std::vector<std::uint8_t> body(json.begin(), json.end());
  HttpRequest req{HttpMethod::POST, std::string(path),
                  std::move(merged_headers), std::move(body)};
  co_return co_await request(std::move(req));
}

auto HttpClient::delete_(std::string_view path, const HttpHeaders& headers)
    -> task<Result<HttpResponse>> {
  HttpRequest req{HttpMethod::DELETE, std::string(path), headers, {}};
  co_return co_await request(std::move(req));
}

auto HttpClient::is_connected() const noexcept -> bool {
  return impl_ && impl_->fd >= 0;
}

auto HttpClient::close() -> void {
  if (impl_ && impl_->fd >= 0) {
    ::close(impl_->fd);
    impl_->fd = -1;
  }
}

}  // namespace dockworker::http
