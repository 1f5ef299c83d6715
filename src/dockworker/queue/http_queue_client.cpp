#include "dockworker/queue/http_queue_client.hpp"

#include "dockworker/http/http_client.hpp"
#include "dockworker/util/log.hpp"
#include "dockworker/util/time.hpp"

#include <nlohmann/json.hpp>

#include <format>

namespace dockworker {

using json = nlohmann::json;

HttpQueueClient::HttpQueueClient(io::EventLoop& loop, http::Url base)
    : loop_(loop), base_(std::move(base)) {
}

auto HttpQueueClient::create(io::EventLoop& loop, std::string_view base_url)
    -> Result<std::unique_ptr<HttpQueueClient>> {
  auto url = http::parse_url(base_url);
  if (!url) {
    log::error("Invalid queue base_url: {}", base_url);
    return std::unexpected(url.error());
  }
  return std::make_unique<HttpQueueClient>(loop, std::move(*url));
}

auto HttpQueueClient::run_path(const TaskId& task_id, RunId run_id,
                               std::string_view action) const -> std::string {
  return std::format("{}/task/{}/runs/{}/{}", base_.base_path, task_id, run_id,
                     action);
}

auto HttpQueueClient::post(std::string path, std::string body)
    -> task<Result<http::HttpResponse>> {
  // One connection per call; calls are minutes apart.
  auto client = co_await http::HttpClient::connect_tcp(
      loop_, base_.host, base_.port, http::HttpClientConfig{.keep_alive = false});
  if (!client) {
    co_return std::unexpected(client.error());
  }
  co_return co_await (*client)->post_json(path, body);
}

auto HttpQueueClient::claim_task(const TaskId& task_id, RunId run_id,
                                 const ClaimRequest& request)
    -> task<Result<Claim>> {
  json body{{"workerGroup", request.worker_group},
            {"workerId", request.worker_id}};

  auto response = co_await post(run_path(task_id, run_id, "claim"), body.dump());
  if (!response) {
    log::warn("claim {}/{} failed: {}", task_id, run_id,
              response.error().message());
    co_return fail(Error::ClaimFailed);
  }
  if (!response->is_success()) {
    log::warn("claim {}/{} rejected: status={} body={}", task_id, run_id,
              response->status, response->body_as_string());
    co_return fail(Error::ClaimFailed);
  }

  try {
    auto parsed = json::parse(response->body_as_string());
    auto taken_until = parse_iso8601(parsed.at("takenUntil").get<std::string>());
    if (!taken_until) {
      log::warn("claim {}/{}: bad takenUntil", task_id, run_id);
      co_return fail(Error::ParseError);
    }
    co_return Claim{
        .worker_id = parsed.value("workerId", request.worker_id),
        .worker_group = parsed.value("workerGroup", request.worker_group),
        .taken_until = *taken_until,
    };
  } catch (const json::exception& e) {
    log::warn("claim {}/{}: malformed response: {}", task_id, run_id, e.what());
    co_return fail(Error::ParseError);
  }
}

auto HttpQueueClient::report_completed(const TaskId& task_id, RunId run_id,
                                       bool success) -> task<Result<void>> {
  json body{{"success", success}};
  auto response =
      co_await post(run_path(task_id, run_id, "completed"), body.dump());
  if (!response || !response->is_success()) {
    log::error("report completed {}/{} failed", task_id, run_id);
    co_return fail(Error::ReportFailed);
  }
  co_return ok();
}

}  // namespace dockworker
