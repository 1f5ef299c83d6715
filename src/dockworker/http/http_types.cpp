#include "dockworker/http/http_types.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iterator>

namespace dockworker::http {

namespace {

auto iequals(std::string_view a, std::string_view b) -> bool {
  return std::ranges::equal(a, b, [](char x, char y) {
    return std::tolower(static_cast<unsigned char>(x)) ==
           std::tolower(static_cast<unsigned char>(y));
  });
}

}  // namespace

auto HttpRequest::serialize() const -> std::vector<std::uint8_t> {
  std::vector<std::uint8_t> result;
  result.reserve(256 + body.size());

  std::format_to(std::back_inserter(result), "{} {} HTTP/1.1\r\n", method,
                 path);

  bool has_content_length = false;
  bool has_host = false;
  for (const auto& [key, value] : headers) {
    std::format_to(std::back_inserter(result), "{}: {}\r\n", key, value);
    has_content_length |= iequals(key, "Content-Length");
    has_host |= iequals(key, "Host");
  }

  if (!has_host) {
    constexpr std::string_view host_header = "Host: localhost\r\n";
    result.insert(result.end(), host_header.begin(), host_header.end());
  }

  // POST and PUT always carry a length, even when empty.
  if (!has_content_length &&
      (!body.empty() || method == HttpMethod::POST || method == HttpMethod::PUT)) {
    std::format_to(std::back_inserter(result), "Content-Length: {}\r\n",
                   body.size());
  }

  result.push_back('\r');
  result.push_back('\n');
  result.insert(result.end(), body.begin(), body.end());
  return result;
}

auto HttpResponse::header(std::string_view key) const
    -> std::optional<std::string> {
  for (const auto& [name, value] : headers) {
    if (iequals(name, key)) {
      return value;
    }
  }
  return std::nullopt;
}

auto HttpResponse::body_as_string() const -> std::string_view {
  return std::string_view(reinterpret_cast<const char*>(body.data()),
                          body.size());
}

auto HttpResponse::is_success() const noexcept -> bool {
  auto code = static_cast<std::uint16_t>(status);
  return code >= 200 && code < 300;
}

auto parse_url(std::string_view url) -> Result<Url> {
  constexpr std::string_view scheme = "http://";
  if (!url.starts_with(scheme)) {
    return fail(Error::InvalidArgument);
  }
  url.remove_prefix(scheme.size());

  Url out;
  auto slash = url.find('/');
  auto authority = url.substr(0, slash);
  if (slash != std::string_view::npos) {
    out.base_path = std::string(url.substr(slash));
    while (out.base_path.ends_with('/')) {
      out.base_path.pop_back();
    }
  }

  auto colon = authority.rfind(':');
  if (colon != std::string_view::npos) {
    auto port_str = authority.substr(colon + 1);
    std::uint16_t port = 0;
    auto [ptr, ec] =
        std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
    if (ec != std::errc{} || ptr != port_str.data() + port_str.size() ||
        port == 0) {
      return fail(Error::InvalidArgument);
    }
    out.port = port;
    authority = authority.substr(0, colon);
  }

  if (authority.empty()) {
    return fail(Error::InvalidArgument);
  }
  out.host = std::string(authority);
  return out;
}

}  // namespace dockworker::http
