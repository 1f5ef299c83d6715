#pragma once

#include "dockworker/core/async_event.hpp"
#include "dockworker/core/coroutine.hpp"

#include <cstddef>
#include <deque>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace dockworker {

class LogConsumer {
public:
  virtual ~LogConsumer() = default;

  // `chunk` stays valid until the returned task completes.
  virtual auto write(std::string_view chunk) -> task<void> = 0;
  virtual auto close() -> task<void> = 0;
};

// Ordered transcript of one task run. While held, writes are buffered; once
// released they are delivered to every attached consumer in write order, one
// chunk at a time, awaiting each consumer before the next. end() resolves
// after all consumers have received every chunk and been closed.
//
// The stream must not be destroyed while delivery is in progress; await
// end() first.
class LogStream {
public:
  explicit LogStream(scheduler& sched);
  ~LogStream();

  LogStream(const LogStream&) = delete;
  LogStream& operator=(const LogStream&) = delete;

  auto attach(std::shared_ptr<LogConsumer> consumer) -> void;

  auto hold() noexcept -> void;
  auto release() -> void;
  auto write(std::string chunk) -> void;
  auto end() -> task<void>;

  [[nodiscard]] auto held() const noexcept -> bool {
    return held_;
  }
  [[nodiscard]] auto ended() const noexcept -> bool {
    return ended_;
  }
  [[nodiscard]] auto drained() const noexcept -> bool {
    return drained_.is_set();
  }
  [[nodiscard]] auto consumer_count() const noexcept -> std::size_t {
    return consumers_.size();
  }
  [[nodiscard]] auto bytes_written() const noexcept -> std::size_t {
    return bytes_written_;
  }

private:
  auto kick() -> void;
  auto deliver() -> spawn_task;

  scheduler& sched_;
  std::vector<std::shared_ptr<LogConsumer>> consumers_;
  std::deque<std::string> buffered_;
  std::deque<std::string> pending_;
  std::size_t bytes_written_{0};
  bool held_{false};
  bool ended_{false};
  bool delivering_{false};
  bool closed_{false};
  AsyncEvent drained_;
};

}  // namespace dockworker
