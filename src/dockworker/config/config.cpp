#include "dockworker/config/config.hpp"

#include "dockworker/config/yaml_utils.hpp"
#include "dockworker/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<dockworker::WorkerSection> {
  static bool decode(const Node& node, dockworker::WorkerSection& w) {
    if (!node.IsMap()) {
      return false;
    }
    w.worker_id = dockworker::yaml_get_or<std::string>(node, "worker_id", "");
    w.worker_group =
        dockworker::yaml_get_or<std::string>(node, "worker_group", "default");
    w.log_level = dockworker::yaml_get_or<std::string>(node, "log_level", "info");
    w.log_file = dockworker::yaml_get_or<std::string>(node, "log_file", "");
    w.log_tag =
        dockworker::yaml_get_or<std::string>(node, "log_tag", "[taskcluster]");
    return true;
  }
};

template <>
struct convert<dockworker::QueueSection> {
  static bool decode(const Node& node, dockworker::QueueSection& q) {
    if (!node.IsMap()) {
      return false;
    }
    q.base_url = dockworker::yaml_get_or<std::string>(
        node, "base_url", "http://127.0.0.1:8080/v1");
    return true;
  }
};

template <>
struct convert<dockworker::DockerSection> {
  static bool decode(const Node& node, dockworker::DockerSection& d) {
    if (!node.IsMap()) {
      return false;
    }
    d.socket = dockworker::yaml_get_or<std::string>(node, "socket",
                                                    "/var/run/docker.sock");
    d.api_version =
        dockworker::yaml_get_or<std::string>(node, "api_version", "v1.43");
    return true;
  }
};

template <>
struct convert<dockworker::ReclaimSection> {
  static bool decode(const Node& node, dockworker::ReclaimSection& r) {
    if (!node.IsMap()) {
      return false;
    }
    r.divisor = dockworker::yaml_get_or(node, "divisor", 1.3);
    r.max_attempts = dockworker::yaml_get_or(node, "max_attempts", 3);
    r.retry_delay_ms = dockworker::yaml_get_or(node, "retry_delay_ms", 5000);
    r.abort_on_failure = dockworker::yaml_get_or(node, "abort_on_failure", true);
    return true;
  }
};

template <>
struct convert<dockworker::FeaturesSection> {
  static bool decode(const Node& node, dockworker::FeaturesSection& f) {
    if (!node.IsMap()) {
      return false;
    }
    f.live_log_dir = dockworker::yaml_get_or<std::string>(
        node, "live_log_dir", "/tmp/dockworker/live");
    f.artifact_dir = dockworker::yaml_get_or<std::string>(
        node, "artifact_dir", "/tmp/dockworker/artifacts");
    f.dind_image =
        dockworker::yaml_get_or<std::string>(node, "dind_image", "docker:dind");

    // Every other key is a feature name mapped to its default.
    for (const auto& entry : node) {
      auto key = entry.first.as<std::string>();
      if (key == "live_log_dir" || key == "artifact_dir" || key == "dind_image") {
        continue;
      }
      f.defaults[key] = entry.second.as<bool>();
    }
    return true;
  }
};

template <>
struct convert<dockworker::WorkerConfig> {
  static bool decode(const Node& node, dockworker::WorkerConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto worker = node["worker"]) {
      c.worker = worker.as<dockworker::WorkerSection>();
    }
    if (auto queue = node["queue"]) {
      c.queue = queue.as<dockworker::QueueSection>();
    }
    if (auto docker = node["docker"]) {
      c.docker = docker.as<dockworker::DockerSection>();
    }
    if (auto reclaim = node["reclaim"]) {
      c.reclaim = reclaim.as<dockworker::ReclaimSection>();
    }
    if (auto features = node["features"]) {
      c.features = features.as<dockworker::FeaturesSection>();
    }
    return true;
  }
};

}  // namespace YAML

namespace dockworker {

namespace {

auto check(const WorkerConfig& config) -> Result<void> {
  if (config.reclaim.divisor <= 1.0) {
    log::error("reclaim.divisor must be greater than 1, got {}",
               config.reclaim.divisor);
    return fail(Error::InvalidArgument);
  }
  if (config.reclaim.max_attempts < 1) {
    log::error("reclaim.max_attempts must be at least 1, got {}",
               config.reclaim.max_attempts);
    return fail(Error::InvalidArgument);
  }
  if (config.reclaim.retry_delay_ms < 0) {
    log::error("reclaim.retry_delay_ms must not be negative");
    return fail(Error::InvalidArgument);
  }
  const auto& level = config.worker.log_level;
  if (level != "trace" && level != "debug" && level != "info" &&
      level != "warn" && level != "error") {
    log::error("Unknown log level: {}", config.worker.log_level);
    return fail(Error::InvalidArgument);
  }
  return ok();
}

}  // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<WorkerConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<WorkerConfig> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse YAML: empty or invalid content");
      return fail(Error::ParseError);
    }
    auto config = root.as<WorkerConfig>();
    if (auto valid = check(config); !valid) {
      return std::unexpected(valid.error());
    }
    return ok(std::move(config));
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

}  // namespace dockworker
