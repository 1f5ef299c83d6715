#include "dockworker/task/log_stream.hpp"

#include "dockworker/util/log.hpp"

namespace dockworker {

LogStream::LogStream(scheduler& sched) : sched_(sched), drained_(sched) {
}

LogStream::~LogStream() {
  if (delivering_) {
    log::error("LogStream destroyed with delivery in progress");
  }
}

auto LogStream::attach(std::shared_ptr<LogConsumer> consumer) -> void {
  if (ended_) {
    log::warn("LogStream: consumer attached after end, ignored");
    return;
  }
  consumers_.push_back(std::move(consumer));
}

auto LogStream::hold() noexcept -> void {
  if (!ended_) {
    held_ = true;
  }
}

auto LogStream::release() -> void {
  if (!held_) {
    return;
  }
  held_ = false;
  while (!buffered_.empty()) {
    pending_.push_back(std::move(buffered_.front()));
    buffered_.pop_front();
  }
  if (!pending_.empty()) {
    kick();
  }
}

auto LogStream::write(std::string chunk) -> void {
  if (ended_) {
    log::warn("LogStream: write after end dropped ({} bytes)", chunk.size());
    return;
  }
  if (chunk.empty()) {
    return;
  }
  bytes_written_ += chunk.size();
  if (held_) {
    buffered_.push_back(std::move(chunk));
    return;
  }
  pending_.push_back(std::move(chunk));
  kick();
}

auto LogStream::end() -> task<void> {
  if (!ended_) {
    release();
    ended_ = true;
    kick();
  }
  co_await drained_.wait();
}

auto LogStream::kick() -> void {
  if (delivering_ || closed_) {
    return;
  }
  delivering_ = true;
  spawn(sched_, deliver());
}

auto LogStream::deliver() -> spawn_task {
  while (!pending_.empty()) {
    auto chunk = std::move(pending_.front());
    pending_.pop_front();
    // Snapshot so a consumer attached mid-chunk does not see half a delivery.
    auto consumers = consumers_;
    for (auto& consumer : consumers) {
      co_await consumer->write(chunk);
    }
  }

  if (ended_ && !closed_) {
    closed_ = true;
    auto consumers = consumers_;
    for (auto& consumer : consumers) {
      co_await consumer->close();
    }
    delivering_ = false;
    drained_.set();
    co_return;
  }
  delivering_ = false;
}

}  // namespace dockworker
