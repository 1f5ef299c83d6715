#pragma once

#include <chrono>
#include <map>
#include <string>

namespace dockworker {

struct WorkerSection {
  std::string worker_id;
  std::string worker_group{"default"};
  std::string log_level{"info"};
  std::string log_file;
  std::string log_tag{"[taskcluster]"};
};

struct QueueSection {
  std::string base_url{"http://127.0.0.1:8080/v1"};
};

struct DockerSection {
  std::string socket{"/var/run/docker.sock"};
  std::string api_version{"v1.43"};
};

struct ReclaimSection {
  double divisor{1.3};
  int max_attempts{3};
  int retry_delay_ms{5000};
  bool abort_on_failure{true};
};

struct FeaturesSection {
  std::map<std::string, bool, std::less<>> defaults;
  std::string live_log_dir{"/tmp/dockworker/live"};
  std::string artifact_dir{"/tmp/dockworker/artifacts"};
  std::string dind_image{"docker:dind"};
};

struct WorkerConfig {
  WorkerSection worker;
  QueueSection queue;
  DockerSection docker;
  ReclaimSection reclaim;
  FeaturesSection features;
};

}  // namespace dockworker
