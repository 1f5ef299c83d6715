#include "dockworker/schema/payload_validator.hpp"
#include "dockworker/task/payload.hpp"

#include <gtest/gtest.h>

using namespace dockworker;
using nlohmann::json;

namespace {

auto fields(const json& errors) -> std::vector<std::string> {
  std::vector<std::string> out;
  for (const auto& e : errors) {
    out.push_back(e.at("field").get<std::string>());
  }
  return out;
}

}  // namespace

class PayloadValidatorTest : public ::testing::Test {
protected:
  auto validate(const json& payload) const -> json {
    return validator_.validate(payload, kPayloadSchema);
  }

  DockerPayloadValidator validator_;
};

TEST_F(PayloadValidatorTest, AcceptsCompletePayload) {
  auto errors = validate({{"image", "ubuntu:22.04"},
                          {"command", {"/bin/bash", "-c", "ls"}},
                          {"env", {{"FOO", "bar"}}},
                          {"maxRunTime", 600},
                          {"features", {{"bufferLog", true}}}});
  EXPECT_TRUE(errors.is_array());
  EXPECT_TRUE(errors.empty()) << errors.dump(2);
}

TEST_F(PayloadValidatorTest, ImageAndMaxRunTimeRequired) {
  auto errors = validate(json::object());
  EXPECT_EQ(fields(errors), (std::vector<std::string>{"image", "maxRunTime"}));
  for (const auto& e : errors) {
    EXPECT_EQ(e.at("schema"), kPayloadSchema);
    EXPECT_TRUE(e.contains("message"));
  }
}

TEST_F(PayloadValidatorTest, RejectsWrongTypes) {
  auto errors = validate({{"image", ""},
                          {"command", {"ls", 3}},
                          {"env", {{"N", 1}}},
                          {"maxRunTime", 0},
                          {"features", {{"dind", "yes"}}}});
  EXPECT_EQ(fields(errors),
            (std::vector<std::string>{"image", "command[1]", "env.N",
                                      "maxRunTime", "features.dind"}));
}

TEST_F(PayloadValidatorTest, RejectsFractionalMaxRunTime) {
  auto errors = validate({{"image", "ubuntu"}, {"maxRunTime", 1.5}});
  EXPECT_EQ(fields(errors), (std::vector<std::string>{"maxRunTime"}));
}

TEST_F(PayloadValidatorTest, RejectsNonObjectPayload) {
  auto errors = validate(json::array());
  ASSERT_EQ(errors.size(), 1u);
}

TEST_F(PayloadValidatorTest, UnknownSchema) {
  auto errors = validator_.validate(json::object(), "http://example.com/other#");
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0].at("schema"), "http://example.com/other#");
}

TEST(PayloadParseTest, LenientParseKeepsFeatureFlags) {
  auto payload = parse_payload({{"image", 42},
                                {"maxRunTime", "soon"},
                                {"env", {{"A", "1"}, {"B", 2}}},
                                {"features", {{"bufferLog", true}, {"x", "no"}}}});
  EXPECT_TRUE(payload.image.empty());
  EXPECT_EQ(payload.max_run_time, 0);
  EXPECT_EQ(payload.env.at("A"), "1");
  EXPECT_EQ(payload.env.at("B"), "2");
  EXPECT_EQ(payload.features.size(), 1u);
  EXPECT_TRUE(payload.features.at("bufferLog"));
}
