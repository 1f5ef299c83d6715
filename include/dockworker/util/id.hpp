#pragma once

#include <compare>
#include <format>
#include <functional>
#include <ostream>
#include <random>
#include <string>
#include <string_view>

namespace dockworker {

struct TaskTag {};
struct WorkerTag {};
struct ContainerTag {};

// Phantom-typed string id; keeps task, worker and container ids apart.
template <typename Tag>
class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {}

  TypedId() = default;

  [[nodiscard]] auto value() const -> std::string_view { return value_; }
  [[nodiscard]] auto str() const -> const std::string& { return value_; }

  [[nodiscard]] explicit operator std::string_view() const { return value_; }

  [[nodiscard]] auto empty() const -> bool { return value_.empty(); }

  [[nodiscard]] friend auto operator<=>(const TypedId& lhs,
                                        const TypedId& rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId& lhs,
                                       const TypedId& rhs) -> bool = default;

private:
  std::string value_;
};

using TaskId = TypedId<TaskTag>;
using WorkerId = TypedId<WorkerTag>;
using ContainerId = TypedId<ContainerTag>;

// Queue run numbers are small non-negative integers.
using RunId = int;

inline auto generate_short_suffix() -> std::string {
  thread_local std::mt19937_64 gen(std::random_device{}());
  thread_local std::uniform_int_distribution<std::uint32_t> dis;
  return std::format("{:08x}", dis(gen));
}

template <typename Tag>
inline auto operator<<(std::ostream& os, const TypedId<Tag>& id)
    -> std::ostream& {
  return os << id.value();
}

}  // namespace dockworker

template <typename Tag>
struct std::hash<dockworker::TypedId<Tag>> {
  auto operator()(const dockworker::TypedId<Tag>& id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<dockworker::TypedId<Tag>>
    : std::formatter<std::string_view> {
  auto format(const dockworker::TypedId<Tag>& id, auto& ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};
