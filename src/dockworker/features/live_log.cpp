#include "dockworker/features/live_log.hpp"

#include "dockworker/task/task.hpp"
#include "dockworker/util/log.hpp"

#include <system_error>

namespace dockworker {

FileLogConsumer::FileLogConsumer(std::filesystem::path path)
    : path_(std::move(path)) {
}

auto FileLogConsumer::open() -> Result<void> {
  std::error_code ec;
  std::filesystem::create_directories(path_.parent_path(), ec);
  if (ec) {
    log::error("cannot create {}: {}", path_.parent_path().string(),
               ec.message());
    return fail(Error::FileOpenFailed);
  }
  out_.open(path_, std::ios::binary | std::ios::trunc);
  if (!out_.is_open()) {
    log::error("cannot open {}", path_.string());
    return fail(Error::FileOpenFailed);
  }
  return ok();
}

auto FileLogConsumer::write(std::string_view chunk) -> task<void> {
  if (out_.is_open()) {
    out_.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    out_.flush();
  }
  co_return;
}

auto FileLogConsumer::close() -> task<void> {
  if (out_.is_open()) {
    out_.close();
  }
  co_return;
}

LiveLogFeature::LiveLogFeature(const FeatureServices& services)
    : root_(services.settings.live_log_dir) {
}

auto LiveLogFeature::created(Task& t) -> task<Result<void>> {
  auto path = root_ / t.task_id.str() / std::to_string(t.run_id) / "live.log";
  auto consumer = std::make_shared<FileLogConsumer>(path);
  if (auto opened = consumer->open(); !opened) {
    co_return opened;
  }
  t.log.attach(consumer);
  t.artifacts["public/logs/live.log"] = path;
  co_return ok();
}

}  // namespace dockworker
