#pragma once

#include "dockworker/core/error.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace dockworker {

// "2014-03-01T22:19:32.124Z"; fractional seconds and the trailing Z are
// optional.
[[nodiscard]] auto parse_iso8601(std::string_view text)
    -> Result<std::chrono::system_clock::time_point>;

[[nodiscard]] auto format_iso8601(std::chrono::system_clock::time_point tp)
    -> std::string;

}  // namespace dockworker
