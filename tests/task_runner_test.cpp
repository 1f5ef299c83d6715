#include "dockworker/features/buffer_log.hpp"
#include "dockworker/schema/payload_validator.hpp"
#include "dockworker/task/task_runner.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

namespace dockworker::test {

using namespace std::chrono_literals;
using nlohmann::json;

// Attaches `consumer` to the task log and/or sleeps inside its created hook.
class LateFeature : public FeatureHandler {
public:
  LateFeature(TimerService& timers, std::shared_ptr<MemoryLogConsumer> consumer,
              std::chrono::milliseconds delay)
      : timers_(timers), consumer_(std::move(consumer)), delay_(delay) {
  }

  [[nodiscard]] auto name() const -> std::string_view override {
    return "late";
  }

  auto created(Task& t) -> task<Result<void>> override {
    if (consumer_) {
      t.log.attach(consumer_);
    }
    if (delay_.count() > 0) {
      co_await sleep_for(timers_, delay_);
    }
    co_return ok();
  }

private:
  TimerService& timers_;
  std::shared_ptr<MemoryLogConsumer> consumer_;
  std::chrono::milliseconds delay_;
};

class TaskRunnerTest : public ::testing::Test {
protected:
  TaskRunnerTest()
      : queue_(sched_),
        runtime_(sched_),
        journal_(std::make_shared<std::vector<std::string>>()) {
  }

  auto runner(std::string fail_at = {}, ReclaimPolicy policy = {},
              std::shared_ptr<MemoryLogConsumer> late_consumer = nullptr,
              std::chrono::milliseconds late_delay = {})
      -> std::unique_ptr<TaskRunner> {
    registry_ = FeatureRegistry{};
    registry_.add("rec", true, recording_factory("rec", journal_, fail_at));
    if (late_consumer || late_delay.count() > 0) {
      registry_.add("late", true,
                    [this, late_consumer, late_delay](const FeatureServices&)
                        -> std::unique_ptr<FeatureHandler> {
                      return std::make_unique<LateFeature>(
                          sched_, late_consumer, late_delay);
                    });
    }
    return std::make_unique<TaskRunner>(RunnerContext{
        .queue = queue_,
        .runtime = runtime_,
        .validator = validator_,
        .stats = stats_,
        .timers = sched_,
        .sched = sched_,
        .registry = registry_,
        .feature_settings = {},
        .worker_id = "worker-1",
        .worker_group = "group-a",
        .reclaim = policy,
        .formatter = LogFormatter{},
    });
  }

  auto make_task(json payload) -> std::unique_ptr<Task> {
    auto t = std::make_unique<Task>(task_id("T1"), 0,
                                    json{{"payload", std::move(payload)}},
                                    json{{"taskId", "T1"}}, sched_);
    t->log.attach(transcript_);
    return t;
  }

  static auto valid_payload(int max_run_time = 60) -> json {
    return json{{"image", "ubuntu:22.04"},
                {"command", {"/bin/bash", "-c", "echo hi"}},
                {"maxRunTime", max_run_time}};
  }

  auto transcript() const -> const std::string& {
    return transcript_->contents();
  }

  ManualScheduler sched_;
  FakeQueueClient queue_;
  FakeContainerRuntime runtime_;
  DockerPayloadValidator validator_;
  Stats stats_;
  FeatureRegistry registry_;
  std::shared_ptr<std::vector<std::string>> journal_;
  std::shared_ptr<MemoryLogConsumer> transcript_ =
      std::make_shared<MemoryLogConsumer>();
};

TEST_F(TaskRunnerTest, SuccessfulRunReportsSuccess) {
  runtime_.output = {"hi\r\n"};
  auto r = runner();
  auto t = make_task(valid_payload());

  auto result = sched_.launch(r->run(*t));

  ASSERT_TRUE(result->has_value());
  ASSERT_TRUE(result->value().has_value());
  EXPECT_TRUE(result->value()->success);
  EXPECT_EQ(result->value()->exit_code, 0);
  EXPECT_EQ(queue_.reports, (std::vector<bool>{true}));
  EXPECT_EQ(runtime_.removed, (std::vector<std::string>{"c1"}));
  EXPECT_TRUE(runtime_.killed.empty());
  EXPECT_EQ(t->state, TaskState::Reported);
  EXPECT_EQ(*journal_, (std::vector<std::string>{"rec:link", "rec:created",
                                                 "rec:stopped", "rec:killed"}));
  EXPECT_EQ(stats_.counter("tasks.timed_out"), 0);
  EXPECT_EQ(sched_.pending_timers(), 0u);
  EXPECT_TRUE(transcript_->closed());

  EXPECT_TRUE(transcript().starts_with(
      "[taskcluster] taskId: T1, workerId: worker-1 \r\n\r\n"));
  auto output = transcript().find("hi\r\n");
  auto footer = transcript().find(
      "[taskcluster] Successful task run with exit code: 0 completed in 0 "
      "seconds\r\n");
  ASSERT_NE(output, std::string::npos);
  ASSERT_NE(footer, std::string::npos);
  EXPECT_LT(output, footer);
}

TEST_F(TaskRunnerTest, ConsumerAttachedInCreatedSeesHeaderFirst) {
  runtime_.output = {"hi\r\n"};
  auto late = std::make_shared<MemoryLogConsumer>();
  auto r = runner({}, {}, late);
  auto t = make_task(valid_payload());

  auto result = sched_.launch(r->run(*t));
  ASSERT_TRUE(result->has_value());
  ASSERT_TRUE(result->value().has_value());

  EXPECT_TRUE(late->contents().starts_with(
      "[taskcluster] taskId: T1, workerId: worker-1 \r\n\r\n"));
  EXPECT_EQ(late->contents(), transcript());
  EXPECT_NE(late->contents().find("Successful task run with exit code: 0"),
            std::string::npos);
  EXPECT_TRUE(late->closed());
}

TEST_F(TaskRunnerTest, ContainerGetsTaskEnvironment) {
  auto r = runner();
  auto payload = valid_payload();
  payload["env"] = {{"FOO", "bar"}};
  auto t = make_task(payload);

  auto result = sched_.launch(r->run(*t));
  ASSERT_TRUE(result->value().has_value());

  ASSERT_EQ(runtime_.created.size(), 1u);
  EXPECT_EQ(runtime_.created[0].image, "ubuntu:22.04");
  EXPECT_EQ(runtime_.created[0].env_list(),
            (std::vector<std::string>{"FOO=bar", "RUN_ID=0", "TASK_ID=T1"}));
}

TEST_F(TaskRunnerTest, NonZeroExitReportsFailure) {
  runtime_.exit_code = 2;
  auto r = runner();
  auto t = make_task(valid_payload());

  auto result = sched_.launch(r->run(*t));
  ASSERT_TRUE(result->value().has_value());
  EXPECT_FALSE(result->value()->success);
  EXPECT_EQ(result->value()->exit_code, 2);
  EXPECT_EQ(queue_.reports, (std::vector<bool>{false}));
  EXPECT_NE(transcript().find("Unsuccessful task run with exit code: 2"),
            std::string::npos);
}

TEST_F(TaskRunnerTest, InvalidPayloadNeverRunsContainer) {
  auto r = runner();
  auto t = make_task(json{{"image", "ubuntu"}});

  auto result = sched_.launch(r->run(*t));

  ASSERT_TRUE(result->value().has_value());
  EXPECT_FALSE(result->value()->success);
  EXPECT_EQ(result->value()->exit_code, -1);
  EXPECT_TRUE(runtime_.created.empty());
  EXPECT_EQ(queue_.reports, (std::vector<bool>{false}));
  EXPECT_EQ(*journal_,
            (std::vector<std::string>{"rec:link", "rec:created", "rec:killed"}));

  auto schema = transcript().find(
      "[taskcluster] `task.payload` format is invalid json schema errors:\n");
  auto footer = transcript().find(
      "[taskcluster] Unsuccessful task run with exit code: -1 completed in 0 "
      "seconds\r\n");
  ASSERT_NE(schema, std::string::npos);
  ASSERT_NE(footer, std::string::npos);
  EXPECT_LT(schema, footer);
  EXPECT_NE(transcript().find("maxRunTime"), std::string::npos);
}

TEST_F(TaskRunnerTest, DeadlineKillsOnceAndFails) {
  runtime_.auto_exit = false;
  auto r = runner();
  auto t = make_task(valid_payload(5));

  auto result = sched_.launch(r->run(*t));
  EXPECT_FALSE(result->has_value());

  sched_.advance(4999ms);
  EXPECT_FALSE(result->has_value());
  EXPECT_TRUE(runtime_.killed.empty());

  sched_.advance(1ms);

  ASSERT_TRUE(result->has_value());
  ASSERT_TRUE(result->value().has_value());
  EXPECT_FALSE(result->value()->success);
  EXPECT_EQ(result->value()->exit_code, 137);
  EXPECT_EQ(runtime_.killed.size(), 1u);
  EXPECT_EQ(queue_.reports, (std::vector<bool>{false}));
  EXPECT_EQ(stats_.counter("tasks.timed_out"), 1);

  auto timeout = transcript().find(
      "[taskcluster] Task timeout after 5 seconds. Force killing container.\r\n");
  auto footer = transcript().find("Unsuccessful task run with exit code: 137");
  ASSERT_NE(timeout, std::string::npos);
  ASSERT_NE(footer, std::string::npos);
  EXPECT_LT(timeout, footer);
}

TEST_F(TaskRunnerTest, FooterReportsElapsedSeconds) {
  runtime_.auto_exit = false;
  auto r = runner();
  auto t = make_task(valid_payload());

  auto result = sched_.launch(r->run(*t));
  sched_.advance(3400ms);
  runtime_.exit("c1", 0);
  sched_.run_until_idle();

  ASSERT_TRUE(result->has_value());
  ASSERT_TRUE(result->value().has_value());
  EXPECT_NE(transcript().find("[taskcluster] Successful task run with exit "
                              "code: 0 completed in 3.4 seconds\r\n"),
            std::string::npos);
  EXPECT_EQ(stats_.timing("tasks.time.run").count, 1u);
}

TEST_F(TaskRunnerTest, ClaimFailureRunsNothing) {
  queue_.fail_claims = 1;
  auto r = runner();
  auto t = make_task(valid_payload());

  auto result = sched_.launch(r->run(*t));

  ASSERT_TRUE(result->has_value());
  ASSERT_FALSE(result->value().has_value());
  EXPECT_EQ(result->value().error(), make_error_code(Error::ClaimFailed));
  EXPECT_TRUE(journal_->empty());
  EXPECT_TRUE(queue_.reports.empty());
  EXPECT_EQ(t->state, TaskState::Aborted);
}

TEST_F(TaskRunnerTest, HookErrorAbortsWithoutReport) {
  auto r = runner("created");
  auto t = make_task(valid_payload());

  auto result = sched_.launch(r->run(*t));

  ASSERT_TRUE(result->has_value());
  ASSERT_FALSE(result->value().has_value());
  EXPECT_EQ(result->value().error(), make_error_code(Error::HookFailed));
  EXPECT_TRUE(queue_.reports.empty());
  EXPECT_TRUE(runtime_.created.empty());
  EXPECT_EQ(t->state, TaskState::Aborted);
  EXPECT_EQ(*journal_,
            (std::vector<std::string>{"rec:link", "rec:created", "rec:killed"}));
  EXPECT_TRUE(t->log.drained());
  EXPECT_EQ(sched_.pending_timers(), 0u);
}

TEST_F(TaskRunnerTest, LostLeaseKillsContainer) {
  runtime_.auto_exit = false;
  queue_.lease = 13000ms;
  auto r = runner({}, ReclaimPolicy{.max_attempts = 1});
  auto t = make_task(valid_payload());

  auto result = sched_.launch(r->run(*t));
  queue_.fail_claims = 1;
  sched_.advance(10s);

  ASSERT_TRUE(result->has_value());
  ASSERT_FALSE(result->value().has_value());
  EXPECT_EQ(result->value().error(), make_error_code(Error::ReclaimFailed));
  EXPECT_EQ(runtime_.killed.size(), 1u);
  EXPECT_EQ(runtime_.removed.size(), 1u);
  EXPECT_TRUE(queue_.reports.empty());
  EXPECT_EQ(t->state, TaskState::Aborted);
}

TEST_F(TaskRunnerTest, LeaseLostBeforeStartNeverRunsContainer) {
  queue_.lease = 13000ms;
  auto r = runner({}, ReclaimPolicy{.max_attempts = 1}, nullptr, 20s);
  auto t = make_task(valid_payload());

  auto result = sched_.launch(r->run(*t));
  queue_.fail_claims = 1;
  sched_.advance(10s);
  EXPECT_FALSE(result->has_value());

  sched_.advance(10s);
  ASSERT_TRUE(result->has_value());
  ASSERT_FALSE(result->value().has_value());
  EXPECT_EQ(result->value().error(), make_error_code(Error::ReclaimFailed));
  EXPECT_TRUE(runtime_.created.empty());
  EXPECT_TRUE(runtime_.started.empty());
  EXPECT_TRUE(queue_.reports.empty());
  EXPECT_EQ(*journal_,
            (std::vector<std::string>{"rec:link", "rec:created", "rec:killed"}));
  EXPECT_EQ(t->state, TaskState::Aborted);
  EXPECT_TRUE(t->log.drained());
  EXPECT_EQ(sched_.pending_timers(), 0u);
}

TEST_F(TaskRunnerTest, LeaseLostWhileCreatingKillsOnLaunch) {
  runtime_.auto_exit = false;
  queue_.lease = 13000ms;
  AsyncEvent gate(sched_);
  runtime_.start_gate = &gate;
  auto r = runner({}, ReclaimPolicy{.max_attempts = 1});
  auto t = make_task(valid_payload());

  auto result = sched_.launch(r->run(*t));
  ASSERT_EQ(runtime_.started, (std::vector<std::string>{"c1"}));
  queue_.fail_claims = 1;
  sched_.advance(10s);
  EXPECT_FALSE(result->has_value());

  gate.set();
  sched_.run_until_idle();
  ASSERT_TRUE(result->has_value());
  ASSERT_FALSE(result->value().has_value());
  EXPECT_EQ(result->value().error(), make_error_code(Error::ReclaimFailed));
  EXPECT_EQ(runtime_.killed, (std::vector<std::string>{"c1"}));
  EXPECT_EQ(runtime_.removed, (std::vector<std::string>{"c1"}));
  EXPECT_TRUE(queue_.reports.empty());
  EXPECT_EQ(sched_.pending_timers(), 0u);
}

TEST_F(TaskRunnerTest, UnkillableContainerDoesNotHangAbort) {
  runtime_.auto_exit = false;
  runtime_.fail_wait = true;
  runtime_.fail_kills = 1;
  auto r = runner();
  auto t = make_task(valid_payload());

  auto result = sched_.launch(r->run(*t));

  ASSERT_TRUE(result->has_value());
  ASSERT_FALSE(result->value().has_value());
  EXPECT_EQ(result->value().error(),
            make_error_code(Error::ContainerWaitFailed));
  EXPECT_EQ(runtime_.killed, (std::vector<std::string>{"c1"}));
  EXPECT_EQ(runtime_.removed, (std::vector<std::string>{"c1"}));
  EXPECT_TRUE(queue_.reports.empty());
  EXPECT_TRUE(t->log.drained());
  EXPECT_EQ(*journal_,
            (std::vector<std::string>{"rec:link", "rec:created", "rec:killed"}));

  // The stream ending after the task is gone must not touch it.
  t.reset();
  runtime_.exit("c1", 1);
  sched_.run_until_idle();
}

TEST_F(TaskRunnerTest, FailedReportIsInfrastructureError) {
  queue_.fail_report = true;
  auto r = runner();
  auto t = make_task(valid_payload());

  auto result = sched_.launch(r->run(*t));
  ASSERT_TRUE(result->has_value());
  ASSERT_FALSE(result->value().has_value());
  EXPECT_EQ(result->value().error(), make_error_code(Error::ReportFailed));
  EXPECT_EQ(queue_.reports.size(), 1u);
}

}  // namespace dockworker::test
