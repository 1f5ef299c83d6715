#pragma once

#include "dockworker/core/error.hpp"

#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace dockworker::http {

enum class HttpMethod : std::uint8_t {
  GET,
  POST,
  PUT,
  DELETE,
};

enum class HttpStatus : std::uint16_t {
  Ok = 200,
  Created = 201,
  NoContent = 204,

  NotModified = 304,

  BadRequest = 400,
  Unauthorized = 401,
  Forbidden = 403,
  NotFound = 404,
  Conflict = 409,

  InternalServerError = 500,
  ServiceUnavailable = 503
};

using HttpHeaders =
    std::unordered_map<std::string, std::string, StringHash, StringEqual>;

struct HttpRequest {
  HttpMethod method{HttpMethod::GET};
  std::string path;
  HttpHeaders headers;
  std::vector<std::uint8_t> body;

  [[nodiscard]] auto serialize() const -> std::vector<std::uint8_t>;
};

struct HttpResponse {
  HttpStatus status{HttpStatus::Ok};
  HttpHeaders headers;
  std::vector<std::uint8_t> body;

  [[nodiscard]] auto header(std::string_view key) const
      -> std::optional<std::string>;
  [[nodiscard]] auto body_as_string() const -> std::string_view;
  [[nodiscard]] auto is_success() const noexcept -> bool;
};

// Only plain http:// is supported; the queue is reached through a local
// proxy when TLS is needed.
struct Url {
  std::string host;
  std::uint16_t port{80};
  std::string base_path;
};

[[nodiscard]] auto parse_url(std::string_view url) -> Result<Url>;

}  // namespace dockworker::http

template <>
struct std::formatter<dockworker::http::HttpMethod>
    : std::formatter<std::string_view> {
  auto format(dockworker::http::HttpMethod method, auto& ctx) const {
    using enum dockworker::http::HttpMethod;
    std::string_view name = [method] {
      switch (method) {
        case GET: return "GET";
        case POST: return "POST";
        case PUT: return "PUT";
        case DELETE: return "DELETE";
      }
      return "UNKNOWN";
    }();
    return std::formatter<std::string_view>::format(name, ctx);
  }
};

template <>
struct std::formatter<dockworker::http::HttpStatus>
    : std::formatter<std::uint16_t> {
  auto format(dockworker::http::HttpStatus status, auto& ctx) const {
    return std::formatter<std::uint16_t>::format(
        static_cast<std::uint16_t>(status), ctx);
  }
};
