#include "dockworker/http/http_parser.hpp"

#include "dockworker/util/log.hpp"

#include <llhttp.h>

namespace dockworker::http {

struct HttpResponseParser::Impl {
  llhttp_t parser;
  llhttp_settings_t settings;
  HttpResponse current_response;
  BodySink sink;
  bool response_complete = false;
  bool headers_done = false;
  bool error = false;
  std::string current_header_field;
  std::string current_header_value;
  bool in_header_field = false;

  auto flush_header() -> void {
    if (!current_header_field.empty()) {
      current_response.headers[current_header_field] = current_header_value;
      current_header_field.clear();
      current_header_value.clear();
    }
  }

  static auto on_header_field(llhttp_t* parser, const char* at, size_t length)
      -> int {
    auto* impl = static_cast<Impl*>(parser->data);
    if (!impl->in_header_field) {
      impl->flush_header();
    }
    impl->current_header_field.append(at, length);
    impl->in_header_field = true;
    return 0;
  }

  static auto on_header_value(llhttp_t* parser, const char* at, size_t length)
      -> int {
    auto* impl = static_cast<Impl*>(parser->data);
    impl->current_header_value.append(at, length);
    impl->in_header_field = false;
    return 0;
  }

  static auto on_headers_complete(llhttp_t* parser) -> int {
    auto* impl = static_cast<Impl*>(parser->data);
    impl->flush_header();
    impl->current_response.status =
        static_cast<HttpStatus>(llhttp_get_status_code(&impl->parser));
    impl->headers_done = true;
    return 0;
  }

  static auto on_body(llhttp_t* parser, const char* at, size_t length) -> int {
    auto* impl = static_cast<Impl*>(parser->data);
    auto bytes = std::span{reinterpret_cast<const std::uint8_t*>(at), length};
    if (impl->sink && impl->current_response.is_success()) {
      impl->sink(bytes);
    } else {
      impl->current_response.body.insert(impl->current_response.body.end(),
                                         bytes.begin(), bytes.end());
    }
    return 0;
  }

  static auto on_message_complete(llhttp_t* parser) -> int {
    auto* impl = static_cast<Impl*>(parser->data);
    impl->response_complete = true;
    return 0;
  }

  auto take_if_complete() -> std::optional<HttpResponse> {
    if (!response_complete) {
      return std::nullopt;
    }
    auto resp = std::move(current_response);
    current_response = HttpResponse{};
    response_complete = false;
    return resp;
  }
};

HttpResponseParser::HttpResponseParser() : impl_(std::make_unique<Impl>()) {
  llhttp_settings_init(&impl_->settings);
  impl_->settings.on_header_field = Impl::on_header_field;
  impl_->settings.on_header_value = Impl::on_header_value;
  impl_->settings.on_headers_complete = Impl::on_headers_complete;
  impl_->settings.on_body = Impl::on_body;
  impl_->settings.on_message_complete = Impl::on_message_complete;

  llhttp_init(&impl_->parser, HTTP_RESPONSE, &impl_->settings);
  impl_->parser.data = impl_.get();
}

HttpResponseParser::~HttpResponseParser() = default;

auto HttpResponseParser::set_body_sink(BodySink sink) -> void {
  impl_->sink = std::move(sink);
}

auto HttpResponseParser::parse(std::span<const std::uint8_t> data)
    -> std::optional<HttpResponse> {
  if (impl_->error) {
    return std::nullopt;
  }

  enum llhttp_errno err = llhttp_execute(
      &impl_->parser, reinterpret_cast<const char*>(data.data()), data.size());

  if (err != HPE_OK) {
    const char* reason = llhttp_get_error_reason(&impl_->parser);
    log::warn("HTTP response parse error: {} (reason: {})",
              llhttp_errno_name(err), reason ? reason : "");
    impl_->error = true;
    return std::nullopt;
  }

  return impl_->take_if_complete();
}

auto HttpResponseParser::finish() -> std::optional<HttpResponse> {
  if (impl_->error) {
    return std::nullopt;
  }
  if (llhttp_finish(&impl_->parser) != HPE_OK) {
    impl_->error = true;
    return std::nullopt;
  }
  return impl_->take_if_complete();
}

auto HttpResponseParser::has_error() const noexcept -> bool {
  return impl_->error;
}

auto HttpResponseParser::headers_complete() const noexcept -> bool {
  return impl_->headers_done;
}

auto HttpResponseParser::reset() -> void {
  impl_->current_response = HttpResponse{};
  impl_->response_complete = false;
  impl_->headers_done = false;
  impl_->error = false;
  impl_->current_header_field.clear();
  impl_->current_header_value.clear();
  impl_->in_header_field = false;
  llhttp_init(&impl_->parser, HTTP_RESPONSE, &impl_->settings);
  impl_->parser.data = impl_.get();
}

}  // namespace dockworker::http
