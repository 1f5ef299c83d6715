#pragma once

#include "dockworker/features/feature.hpp"
#include "dockworker/task/log_stream.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace dockworker {

class MemoryLogConsumer : public LogConsumer {
public:
  auto write(std::string_view chunk) -> task<void> override;
  auto close() -> task<void> override;

  [[nodiscard]] auto contents() const noexcept -> const std::string& {
    return buffer_;
  }
  [[nodiscard]] auto closed() const noexcept -> bool {
    return closed_;
  }

private:
  std::string buffer_;
  bool closed_{false};
};

// Keeps the whole transcript in memory and, once the stream has ended,
// persists it to <artifact_dir>/<taskId>/<runId>/terminal.log.
class BufferLogFeature : public FeatureHandler {
public:
  static constexpr std::string_view kName = "bufferLog";

  explicit BufferLogFeature(const FeatureServices& services);

  [[nodiscard]] auto name() const -> std::string_view override {
    return kName;
  }

  auto created(Task& t) -> task<Result<void>> override;
  auto killed(Task& t) -> task<Result<void>> override;

private:
  std::filesystem::path root_;
  std::shared_ptr<MemoryLogConsumer> buffer_;
};

}  // namespace dockworker
