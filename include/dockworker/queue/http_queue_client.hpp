#pragma once

#include "dockworker/http/http_types.hpp"
#include "dockworker/io/event_loop.hpp"
#include "dockworker/queue/queue_client.hpp"

#include <string>

namespace dockworker {

class HttpQueueClient : public QueueClient {
public:
  HttpQueueClient(io::EventLoop& loop, http::Url base);

  [[nodiscard]] static auto create(io::EventLoop& loop,
                                   std::string_view base_url)
      -> Result<std::unique_ptr<HttpQueueClient>>;

  auto claim_task(const TaskId& task_id, RunId run_id,
                  const ClaimRequest& request) -> task<Result<Claim>> override;

  auto report_completed(const TaskId& task_id, RunId run_id, bool success)
      -> task<Result<void>> override;

  [[nodiscard]] auto run_path(const TaskId& task_id, RunId run_id,
                              std::string_view action) const -> std::string;

private:
  auto post(std::string path, std::string body)
      -> task<Result<http::HttpResponse>>;

  io::EventLoop& loop_;
  http::Url base_;
};

}  // namespace dockworker
