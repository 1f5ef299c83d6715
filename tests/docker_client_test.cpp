#include "dockworker/docker/docker_client.hpp"
#include "dockworker/io/event_loop.hpp"
#include "dockworker/runtime/docker_runtime.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

namespace dockworker::docker::test {

using nlohmann::json;

TEST(DockerCreateBodyTest, TaskContainerConfig) {
  CreateContainerRequest req{
      .name = "task-abc-0-1",
      .image = "ubuntu:22.04",
      .cmd = {"/bin/bash", "-c", "echo hi"},
      .env = {"FOO=bar", "RUN_ID=0", "TASK_ID=abc"},
      .links = {"dind-abc-0-2:dind"},
  };

  auto body = json::parse(build_create_body(req));

  EXPECT_EQ(body["Image"], "ubuntu:22.04");
  EXPECT_EQ(body["Cmd"], json({"/bin/bash", "-c", "echo hi"}));
  EXPECT_EQ(body["Env"], json({"FOO=bar", "RUN_ID=0", "TASK_ID=abc"}));
  EXPECT_EQ(body["Tty"], true);
  EXPECT_EQ(body["AttachStdout"], true);
  EXPECT_EQ(body["AttachStderr"], true);
  EXPECT_EQ(body["AttachStdin"], false);
  EXPECT_EQ(body["HostConfig"]["Links"], json({"dind-abc-0-2:dind"}));
  EXPECT_FALSE(body["HostConfig"].contains("Privileged"));
}

TEST(DockerCreateBodyTest, PrivilegedSidecarWithoutCommand) {
  CreateContainerRequest req{.image = "docker:dind", .privileged = true};

  auto body = json::parse(build_create_body(req));

  EXPECT_FALSE(body.contains("Cmd"));
  EXPECT_EQ(body["Env"], json::array());
  EXPECT_EQ(body["HostConfig"]["Privileged"], true);
  EXPECT_FALSE(body["HostConfig"].contains("Links"));
}

TEST(DockerClientConfigTest, Defaults) {
  DockerClientConfig config;
  EXPECT_EQ(config.socket_path, "/var/run/docker.sock");
  EXPECT_EQ(config.api_version, "v1.43");
}

TEST(DockerErrorTest, Names) {
  EXPECT_EQ(to_string_view(DockerError::NotRunning), "container not running");
  EXPECT_EQ(to_string_view(DockerError::ImageNotFound), "image not found");
}

class DockerClientTest : public ::testing::Test {
protected:
  io::EventLoop loop_;
};

TEST_F(DockerClientTest, PingFailsForNonExistentSocket) {
  ASSERT_TRUE(loop_.valid());
  DockerClient client(loop_, DockerClientConfig{
                                 .socket_path = "/tmp/nonexistent_docker_socket_12345.sock"});

  auto result = loop_.block_on(client.ping());

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), DockerError::ConnectionFailed);
}

TEST_F(DockerClientTest, RuntimeMapsConnectionFailure) {
  ASSERT_TRUE(loop_.valid());
  DockerClient client(loop_, DockerClientConfig{
                                 .socket_path = "/tmp/nonexistent_docker_socket_12345.sock"});
  DockerContainerRuntime runtime(client);

  ContainerSpec spec;
  spec.name = "task-x";
  spec.image = "ubuntu";
  auto created = loop_.block_on(runtime.create(spec));

  ASSERT_FALSE(created.has_value());
  EXPECT_EQ(created.error(), make_error_code(Error::ConnectionFailed));
}

}  // namespace dockworker::docker::test
