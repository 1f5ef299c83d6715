#include "dockworker/features/buffer_log.hpp"

#include "dockworker/task/task.hpp"
#include "dockworker/util/log.hpp"

#include <fstream>
#include <system_error>

namespace dockworker {

auto MemoryLogConsumer::write(std::string_view chunk) -> task<void> {
  buffer_.append(chunk);
  co_return;
}

auto MemoryLogConsumer::close() -> task<void> {
  closed_ = true;
  co_return;
}

BufferLogFeature::BufferLogFeature(const FeatureServices& services)
    : root_(services.settings.artifact_dir) {
}

auto BufferLogFeature::created(Task& t) -> task<Result<void>> {
  buffer_ = std::make_shared<MemoryLogConsumer>();
  t.log.attach(buffer_);
  co_return ok();
}

auto BufferLogFeature::killed(Task& t) -> task<Result<void>> {
  if (!buffer_) {
    co_return ok();
  }
  if (!buffer_->closed()) {
    log::warn("bufferLog: transcript for taskId={} not complete", t.task_id);
  }

  auto dir = root_ / t.task_id.str() / std::to_string(t.run_id);
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    log::error("bufferLog: cannot create {}: {}", dir.string(), ec.message());
    co_return fail(Error::FileOpenFailed);
  }

  auto path = dir / "terminal.log";
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    log::error("bufferLog: cannot open {}", path.string());
    co_return fail(Error::FileOpenFailed);
  }
  const auto& contents = buffer_->contents();
  out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
  if (!out) {
    co_return fail(Error::FileOpenFailed);
  }
  t.artifacts["public/logs/terminal.log"] = path;
  log::info("bufferLog: wrote {} bytes to {}", contents.size(), path.string());
  co_return ok();
}

}  // namespace dockworker
