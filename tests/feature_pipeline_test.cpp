#include "dockworker/features/buffer_log.hpp"
#include "dockworker/features/builtin.hpp"
#include "dockworker/features/dind.hpp"
#include "dockworker/features/feature.hpp"
#include "dockworker/features/live_log.hpp"
#include "dockworker/task/task.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace dockworker::test {

namespace {

auto read_file(const std::filesystem::path& path) -> std::string {
  std::ifstream in(path, std::ios::binary);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

}  // namespace

class FeaturePipelineTest : public ::testing::Test {
protected:
  FeaturePipelineTest()
      : runtime_(sched_),
        journal_(std::make_shared<std::vector<std::string>>()),
        task_(task_id("T1"), 3, nlohmann::json{{"payload", nlohmann::json::object()}},
              nlohmann::json::object(), sched_) {
  }

  auto services() -> FeatureServices {
    return FeatureServices{runtime_, sched_, FeatureSettings{}};
  }

  ManualScheduler sched_;
  FakeContainerRuntime runtime_;
  std::shared_ptr<std::vector<std::string>> journal_;
  Task task_;
};

TEST_F(FeaturePipelineTest, FlagsOverrideDefaults) {
  FeatureRegistry registry;
  registry.add("a", true, recording_factory("a", journal_))
      .add("b", false, recording_factory("b", journal_))
      .add("c", true, recording_factory("c", journal_));

  std::map<std::string, bool, std::less<>> flags{{"b", true}, {"c", false}};
  auto pipeline = FeaturePipeline::build(registry, flags, services());

  EXPECT_EQ(pipeline.names(), (std::vector<std::string_view>{"a", "b"}));
}

TEST_F(FeaturePipelineTest, UnknownFlagsAreIgnored) {
  FeatureRegistry registry;
  registry.add("a", true, recording_factory("a", journal_));

  std::map<std::string, bool, std::less<>> flags{{"nope", true}};
  auto pipeline = FeaturePipeline::build(registry, flags, services());
  EXPECT_EQ(pipeline.size(), 1u);
}

TEST_F(FeaturePipelineTest, HooksRunInRegistryOrder) {
  FeatureRegistry registry;
  registry.add("first", true, recording_factory("first", journal_))
      .add("second", true, recording_factory("second", journal_));
  auto pipeline = FeaturePipeline::build(registry, {}, services());

  auto created = sched_.launch(pipeline.created(task_));
  auto killed = sched_.launch(pipeline.killed(task_));

  ASSERT_TRUE(created->has_value() && created->value().has_value());
  ASSERT_TRUE(killed->has_value() && killed->value().has_value());
  EXPECT_EQ(*journal_, (std::vector<std::string>{"first:created", "second:created",
                                                 "first:killed", "second:killed"}));
}

TEST_F(FeaturePipelineTest, LinkConcatenatesLinks) {
  FeatureRegistry registry;
  registry
      .add("x", true,
           recording_factory("x", journal_, {}, ContainerLink{"x-svc", "x"}))
      .add("y", true, recording_factory("y", journal_))
      .add("z", true,
           recording_factory("z", journal_, {}, ContainerLink{"z-svc", "z"}));
  auto pipeline = FeaturePipeline::build(registry, {}, services());

  auto links = sched_.launch(pipeline.link(task_));
  ASSERT_TRUE(links->has_value() && links->value().has_value());
  EXPECT_EQ(links->value().value(),
            (std::vector<ContainerLink>{{"x-svc", "x"}, {"z-svc", "z"}}));
}

TEST_F(FeaturePipelineTest, FailingHookStopsRemainingHandlers) {
  FeatureRegistry registry;
  registry.add("a", true, recording_factory("a", journal_))
      .add("b", true, recording_factory("b", journal_, "stopped"))
      .add("c", true, recording_factory("c", journal_));
  auto pipeline = FeaturePipeline::build(registry, {}, services());

  auto stopped = sched_.launch(pipeline.stopped(task_));
  ASSERT_TRUE(stopped->has_value());
  EXPECT_EQ(stopped->value().error(), make_error_code(Error::HookFailed));
  EXPECT_EQ(*journal_, (std::vector<std::string>{"a:stopped", "b:stopped"}));
}

TEST(BuiltinRegistryTest, OrderAndDefaults) {
  auto registry = builtin_registry();
  ASSERT_EQ(registry.size(), 3u);
  EXPECT_EQ(registry.entries()[0].name, "dind");
  EXPECT_FALSE(registry.entries()[0].default_enabled);
  EXPECT_EQ(registry.entries()[1].name, "localLiveLog");
  EXPECT_TRUE(registry.entries()[1].default_enabled);
  EXPECT_EQ(registry.entries()[2].name, "bufferLog");
  EXPECT_FALSE(registry.entries()[2].default_enabled);
}

TEST(BuiltinRegistryTest, ConfigDefaultsApply) {
  auto registry = builtin_registry();
  apply_feature_defaults(registry, {{"bufferLog", true}, {"unknown", true}});
  EXPECT_TRUE(registry.find("bufferLog")->default_enabled);
  EXPECT_EQ(registry.find("unknown"), nullptr);
}

class BuiltinFeatureTest : public FeaturePipelineTest {
protected:
  void SetUp() override {
    root_ = std::filesystem::temp_directory_path() /
            std::format("dockworker-test-{}", generate_short_suffix());
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  auto settings() -> FeatureSettings {
    return FeatureSettings{
        .live_log_dir = root_ / "live",
        .artifact_dir = root_ / "artifacts",
        .dind_image = "docker:dind",
    };
  }

  std::filesystem::path root_;
};

TEST_F(BuiltinFeatureTest, LiveLogWritesTranscript) {
  LiveLogFeature feature(FeatureServices{runtime_, sched_, settings()});
  auto created = sched_.launch(feature.created(task_));
  ASSERT_TRUE(created->value().has_value());

  task_.log.write("hello\r\n");
  auto ended = sched_.launch(task_.log.end());
  ASSERT_TRUE(*ended);

  auto path = root_ / "live" / "T1" / "3" / "live.log";
  EXPECT_EQ(read_file(path), "hello\r\n");
  EXPECT_EQ(task_.artifacts.at("public/logs/live.log"), path);
}

TEST_F(BuiltinFeatureTest, BufferLogPersistsOnKilled) {
  BufferLogFeature feature(FeatureServices{runtime_, sched_, settings()});
  auto created = sched_.launch(feature.created(task_));
  ASSERT_TRUE(created->value().has_value());

  task_.log.write("line one\r\n");
  task_.log.write("line two\r\n");
  auto ended = sched_.launch(task_.log.end());
  ASSERT_TRUE(*ended);

  auto killed = sched_.launch(feature.killed(task_));
  ASSERT_TRUE(killed->value().has_value());

  auto path = root_ / "artifacts" / "T1" / "3" / "terminal.log";
  EXPECT_EQ(read_file(path), "line one\r\nline two\r\n");
}

TEST_F(BuiltinFeatureTest, DindStartsAndRemovesSidecar) {
  DindFeature feature(FeatureServices{runtime_, sched_, settings()});

  auto links = sched_.launch(feature.link(task_));
  ASSERT_TRUE(links->value().has_value());
  ASSERT_EQ(links->value()->size(), 1u);
  EXPECT_EQ(links->value()->front().alias, "dind");

  ASSERT_EQ(runtime_.created.size(), 1u);
  EXPECT_TRUE(runtime_.created[0].privileged);
  EXPECT_EQ(runtime_.created[0].image, "docker:dind");
  EXPECT_EQ(links->value()->front().name, runtime_.created[0].name);
  EXPECT_EQ(runtime_.started.size(), 1u);

  auto killed = sched_.launch(feature.killed(task_));
  ASSERT_TRUE(killed->value().has_value());
  EXPECT_EQ(runtime_.killed.size(), 1u);
  EXPECT_EQ(runtime_.removed.size(), 1u);
  EXPECT_FALSE(feature.sidecar().has_value());
}

}  // namespace dockworker::test
