#include "dockworker/config/config.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace dockworker;

TEST(ConfigTest, Defaults) {
  WorkerConfig config;

  EXPECT_TRUE(config.worker.worker_id.empty());
  EXPECT_EQ(config.worker.worker_group, "default");
  EXPECT_EQ(config.worker.log_level, "info");
  EXPECT_EQ(config.worker.log_tag, "[taskcluster]");
  EXPECT_EQ(config.queue.base_url, "http://127.0.0.1:8080/v1");
  EXPECT_EQ(config.docker.socket, "/var/run/docker.sock");
  EXPECT_EQ(config.docker.api_version, "v1.43");
  EXPECT_DOUBLE_EQ(config.reclaim.divisor, 1.3);
  EXPECT_EQ(config.reclaim.max_attempts, 3);
  EXPECT_EQ(config.reclaim.retry_delay_ms, 5000);
  EXPECT_TRUE(config.reclaim.abort_on_failure);
  EXPECT_TRUE(config.features.defaults.empty());
  EXPECT_EQ(config.features.dind_image, "docker:dind");
}

TEST(ConfigTest, LoadFromString) {
  auto result = ConfigLoader::load_from_string(R"(
worker:
  worker_id: worker-7
  worker_group: us-east
  log_level: debug
queue:
  base_url: http://queue.local:9000/v1
docker:
  socket: /run/docker.sock
reclaim:
  divisor: 2.0
  max_attempts: 5
  retry_delay_ms: 250
  abort_on_failure: false
features:
  bufferLog: true
  localLiveLog: false
  live_log_dir: /var/lib/dockworker/live
)");

  ASSERT_TRUE(result.has_value()) << result.error().message();
  const auto& config = *result;
  EXPECT_EQ(config.worker.worker_id, "worker-7");
  EXPECT_EQ(config.worker.worker_group, "us-east");
  EXPECT_EQ(config.worker.log_level, "debug");
  EXPECT_EQ(config.worker.log_tag, "[taskcluster]");
  EXPECT_EQ(config.queue.base_url, "http://queue.local:9000/v1");
  EXPECT_EQ(config.docker.socket, "/run/docker.sock");
  EXPECT_EQ(config.docker.api_version, "v1.43");
  EXPECT_DOUBLE_EQ(config.reclaim.divisor, 2.0);
  EXPECT_EQ(config.reclaim.max_attempts, 5);
  EXPECT_EQ(config.reclaim.retry_delay_ms, 250);
  EXPECT_FALSE(config.reclaim.abort_on_failure);
  EXPECT_EQ(config.features.live_log_dir, "/var/lib/dockworker/live");
  ASSERT_EQ(config.features.defaults.size(), 2u);
  EXPECT_TRUE(config.features.defaults.at("bufferLog"));
  EXPECT_FALSE(config.features.defaults.at("localLiveLog"));
}

TEST(ConfigTest, MissingSectionsKeepDefaults) {
  auto result = ConfigLoader::load_from_string("worker:\n  worker_id: w1\n");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->worker.worker_id, "w1");
  EXPECT_EQ(result->queue.base_url, "http://127.0.0.1:8080/v1");
  EXPECT_EQ(result->reclaim.max_attempts, 3);
}

TEST(ConfigTest, RejectsDivisorNotAboveOne) {
  auto result = ConfigLoader::load_from_string("reclaim:\n  divisor: 1.0\n");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::InvalidArgument));
}

TEST(ConfigTest, RejectsUnknownLogLevel) {
  auto result =
      ConfigLoader::load_from_string("worker:\n  log_level: verbose\n");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::InvalidArgument));
}

TEST(ConfigTest, InvalidYaml) {
  auto result = ConfigLoader::load_from_string("worker: [unclosed");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, EmptyInput) {
  auto result = ConfigLoader::load_from_string("");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, LoadFromMissingFile) {
  auto result = ConfigLoader::load_from_file("/nonexistent/worker.yaml");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::FileNotFound));
}

TEST(ConfigTest, LoadFromFile) {
  auto path = std::filesystem::temp_directory_path() / "dockworker_config_test.yaml";
  {
    std::ofstream out(path);
    out << "worker:\n  worker_id: from-file\n";
  }
  auto result = ConfigLoader::load_from_file(path.string());
  std::filesystem::remove(path);

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->worker.worker_id, "from-file");
}
