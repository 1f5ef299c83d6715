#pragma once

#include "dockworker/core/async_event.hpp"
#include "dockworker/core/coroutine.hpp"
#include "dockworker/core/error.hpp"
#include "dockworker/core/timer.hpp"
#include "dockworker/features/feature.hpp"
#include "dockworker/queue/queue_client.hpp"
#include "dockworker/runtime/container_runtime.hpp"
#include "dockworker/util/id.hpp"

#include <chrono>
#include <deque>
#include <format>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace dockworker::test {

[[nodiscard]] inline auto task_id(std::string_view s) -> TaskId {
  return TaskId{std::string{s}};
}

// Single-threaded scheduler and timer service on a virtual clock. Nothing
// runs until the test drives it with run_until_idle() or advance().
class ManualScheduler : public scheduler, public TimerService {
public:
  ManualScheduler()
      : now_(std::chrono::system_clock::time_point{} +
             std::chrono::hours(24 * 365 * 50)) {
  }

  auto schedule(std::coroutine_handle<> handle) noexcept -> void override {
    ready_.push_back(handle);
  }

  [[nodiscard]] auto now() const noexcept
      -> std::chrono::system_clock::time_point override {
    return now_;
  }

  auto schedule_after(std::chrono::milliseconds delay, Callback cb)
      -> TimerId override {
    auto id = next_id_++;
    timers_.emplace(id, Timer{now_ + delay, std::move(cb)});
    delays_.push_back(delay);
    return id;
  }

  auto cancel(TimerId id) noexcept -> bool override {
    return timers_.erase(id) > 0;
  }

  auto run_until_idle() -> void {
    while (!ready_.empty()) {
      auto handle = ready_.front();
      ready_.pop_front();
      handle.resume();
    }
  }

  // Moves the clock forward, firing due timers in expiry order.
  auto advance(std::chrono::milliseconds by) -> void {
    auto target = now_ + by;
    run_until_idle();
    while (true) {
      auto next = timers_.end();
      for (auto it = timers_.begin(); it != timers_.end(); ++it) {
        if (it->second.due <= target &&
            (next == timers_.end() || it->second.due < next->second.due)) {
          next = it;
        }
      }
      if (next == timers_.end()) {
        break;
      }
      now_ = next->second.due;
      auto cb = std::move(next->second.cb);
      timers_.erase(next);
      cb();
      run_until_idle();
    }
    now_ = target;
    run_until_idle();
  }

  // Starts `t` and drives the scheduler until it can make no more progress.
  template <typename T>
    requires(!std::is_void_v<T>)
  auto launch(task<T> t) -> std::shared_ptr<std::optional<T>> {
    auto out = std::make_shared<std::optional<T>>();
    spawn(*this, capture(std::move(t), out));
    run_until_idle();
    return out;
  }

  auto launch(task<void> t) -> std::shared_ptr<bool> {
    auto done = std::make_shared<bool>(false);
    spawn(*this, capture_void(std::move(t), done));
    run_until_idle();
    return done;
  }

  [[nodiscard]] auto pending_timers() const noexcept -> std::size_t {
    return timers_.size();
  }

  [[nodiscard]] auto delays() const noexcept
      -> const std::vector<std::chrono::milliseconds>& {
    return delays_;
  }

private:
  struct Timer {
    std::chrono::system_clock::time_point due;
    Callback cb;
  };

  template <typename T>
  static auto capture(task<T> t, std::shared_ptr<std::optional<T>> out)
      -> spawn_task {
    out->emplace(co_await std::move(t));
  }

  static auto capture_void(task<void> t, std::shared_ptr<bool> done)
      -> spawn_task {
    co_await std::move(t);
    *done = true;
  }

  std::chrono::system_clock::time_point now_;
  std::deque<std::coroutine_handle<>> ready_;
  std::map<TimerId, Timer> timers_;
  std::vector<std::chrono::milliseconds> delays_;
  TimerId next_id_{1};
};

class FakeQueueClient : public QueueClient {
public:
  explicit FakeQueueClient(TimerService& timers) : timers_(timers) {
  }

  auto claim_task(const TaskId& id, RunId run, const ClaimRequest& request)
      -> task<Result<Claim>> override {
    ++claim_calls;
    last_task = id;
    last_run = run;
    last_request = request;
    if (fail_claims > 0) {
      --fail_claims;
      co_return fail(Error::ClaimFailed);
    }
    co_return Claim{request.worker_id, request.worker_group,
                    timers_.now() + lease};
  }

  auto report_completed(const TaskId&, RunId, bool success)
      -> task<Result<void>> override {
    reports.push_back(success);
    if (fail_report) {
      co_return fail(Error::ReportFailed);
    }
    co_return ok();
  }

  std::chrono::milliseconds lease{600000};
  int fail_claims{0};
  bool fail_report{false};

  int claim_calls{0};
  TaskId last_task;
  RunId last_run{-1};
  ClaimRequest last_request;
  std::vector<bool> reports;

private:
  TimerService& timers_;
};

// Scriptable container runtime. Each started container writes `output` to
// its attached sink; it then exits with `exit_code` when `auto_exit` is set,
// otherwise only when killed or exit() is called. `create_gate` and
// `start_gate`, when set, hold create() and start() until the event fires.
class FakeContainerRuntime : public ContainerRuntime {
public:
  explicit FakeContainerRuntime(scheduler& sched) : sched_(sched) {
  }

  auto create(const ContainerSpec& spec) -> task<Result<ContainerId>> override {
    created.push_back(spec);
    if (create_gate != nullptr) {
      co_await create_gate->wait();
    }
    if (fail_create) {
      co_return fail(Error::ContainerCreateFailed);
    }
    ContainerId id{std::format("c{}", created.size())};
    containers_.emplace(id.str(), std::make_unique<Container>(sched_));
    co_return id;
  }

  auto start(const ContainerId& id) -> task<Result<void>> override {
    started.push_back(id.str());
    if (start_gate != nullptr) {
      co_await start_gate->wait();
    }
    if (fail_start) {
      co_return fail(Error::ContainerStartFailed);
    }
    container(id).running = true;
    co_return ok();
  }

  auto attach(const ContainerId& id, OutputSink sink)
      -> task<Result<void>> override {
    auto& c = container(id);
    for (const auto& chunk : output) {
      sink(chunk);
    }
    if (auto_exit) {
      finish(c, exit_code);
    }
    co_await c.exited.wait();
    co_return ok();
  }

  auto wait(const ContainerId& id) -> task<Result<int>> override {
    if (fail_wait) {
      co_return fail(Error::ContainerWaitFailed);
    }
    auto& c = container(id);
    co_await c.exited.wait();
    co_return c.code;
  }

  auto kill(const ContainerId& id) -> task<Result<void>> override {
    killed.push_back(id.str());
    if (fail_kills > 0) {
      --fail_kills;
      co_return fail(Error::ContainerKillFailed);
    }
    finish(container(id), kill_exit_code);
    co_return ok();
  }

  auto remove(const ContainerId& id) -> task<Result<void>> override {
    removed.push_back(id.str());
    co_return ok();
  }

  auto exit(std::string_view id, int code) -> void {
    finish(*containers_.at(std::string(id)), code);
  }

  [[nodiscard]] auto running(std::string_view id) const -> bool {
    return containers_.at(std::string(id))->running;
  }

  std::vector<std::string> output;
  bool auto_exit{true};
  int exit_code{0};
  int kill_exit_code{137};
  bool fail_create{false};
  bool fail_start{false};
  bool fail_wait{false};
  int fail_kills{0};
  AsyncEvent* create_gate{nullptr};
  AsyncEvent* start_gate{nullptr};

  std::vector<ContainerSpec> created;
  std::vector<std::string> started;
  std::vector<std::string> killed;
  std::vector<std::string> removed;

private:
  struct Container {
    explicit Container(scheduler& sched) : exited(sched) {
    }
    AsyncEvent exited;
    bool running{false};
    int code{0};
  };

  auto container(const ContainerId& id) -> Container& {
    return *containers_.at(id.str());
  }

  static auto finish(Container& c, int code) -> void {
    if (!c.running) {
      return;
    }
    c.running = false;
    c.code = code;
    c.exited.set();
  }

  scheduler& sched_;
  std::map<std::string, std::unique_ptr<Container>> containers_;
};

// Appends "<name>:<hook>" to a shared journal. `fail_at` names the hook that
// returns HookFailed.
class RecordingFeature : public FeatureHandler {
public:
  RecordingFeature(std::string name, std::shared_ptr<std::vector<std::string>> journal,
                   std::string fail_at = {},
                   std::optional<ContainerLink> link = std::nullopt)
      : name_(std::move(name)),
        journal_(std::move(journal)),
        fail_at_(std::move(fail_at)),
        link_(std::move(link)) {
  }

  [[nodiscard]] auto name() const -> std::string_view override {
    return name_;
  }

  auto link(Task&) -> task<Result<std::vector<ContainerLink>>> override {
    if (auto r = record("link"); !r) {
      co_return std::unexpected(r.error());
    }
    std::vector<ContainerLink> links;
    if (link_) {
      links.push_back(*link_);
    }
    co_return links;
  }

  auto created(Task&) -> task<Result<void>> override {
    co_return record("created");
  }
  auto stopped(Task&) -> task<Result<void>> override {
    co_return record("stopped");
  }
  auto killed(Task&) -> task<Result<void>> override {
    co_return record("killed");
  }

private:
  auto record(std::string_view hook) -> Result<void> {
    journal_->push_back(std::format("{}:{}", name_, hook));
    if (hook == fail_at_) {
      return fail(Error::HookFailed);
    }
    return ok();
  }

  std::string name_;
  std::shared_ptr<std::vector<std::string>> journal_;
  std::string fail_at_;
  std::optional<ContainerLink> link_;
};

[[nodiscard]] inline auto recording_factory(
    std::string name, std::shared_ptr<std::vector<std::string>> journal,
    std::string fail_at = {}, std::optional<ContainerLink> link = std::nullopt)
    -> FeatureFactory {
  return [=](const FeatureServices&) -> std::unique_ptr<FeatureHandler> {
    return std::make_unique<RecordingFeature>(name, journal, fail_at, link);
  };
}

}  // namespace dockworker::test
