#pragma once

#include "dockworker/http/http_types.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>

namespace dockworker::http {

using BodySink = std::move_only_function<void(std::span<const std::uint8_t>)>;

class HttpResponseParser {
public:
  HttpResponseParser();
  ~HttpResponseParser();

  HttpResponseParser(const HttpResponseParser&) = delete;
  auto operator=(const HttpResponseParser&) -> HttpResponseParser& = delete;

  // With a sink installed, body bytes (de-chunked) go to the sink as they
  // arrive and the returned response carries headers only.
  auto set_body_sink(BodySink sink) -> void;

  auto parse(std::span<const std::uint8_t> data) -> std::optional<HttpResponse>;

  // Signals EOF, completing responses delimited by connection close.
  auto finish() -> std::optional<HttpResponse>;

  [[nodiscard]] auto has_error() const noexcept -> bool;
  [[nodiscard]] auto headers_complete() const noexcept -> bool;

  auto reset() -> void;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace dockworker::http
