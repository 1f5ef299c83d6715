#pragma once

#include "dockworker/core/coroutine.hpp"
#include "dockworker/core/error.hpp"
#include "dockworker/util/id.hpp"

#include <chrono>
#include <string>

namespace dockworker {

struct ClaimRequest {
  std::string worker_id;
  std::string worker_group;
};

// Lease on a task run; replaced wholesale on every successful reclaim.
struct Claim {
  std::string worker_id;
  std::string worker_group;
  std::chrono::system_clock::time_point taken_until;
};

class QueueClient {
public:
  virtual ~QueueClient() = default;

  // Used for both the initial claim and every reclaim.
  virtual auto claim_task(const TaskId& task_id, RunId run_id,
                          const ClaimRequest& request) -> task<Result<Claim>> = 0;

  virtual auto report_completed(const TaskId& task_id, RunId run_id,
                                bool success) -> task<Result<void>> = 0;
};

}  // namespace dockworker
