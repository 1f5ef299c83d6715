#pragma once

#include "dockworker/features/feature.hpp"
#include "dockworker/task/log_stream.hpp"

#include <filesystem>
#include <fstream>

namespace dockworker {

// Appends each chunk to a file as it arrives and flushes, so the file can be
// tailed while the task runs.
class FileLogConsumer : public LogConsumer {
public:
  explicit FileLogConsumer(std::filesystem::path path);

  [[nodiscard]] auto open() -> Result<void>;

  auto write(std::string_view chunk) -> task<void> override;
  auto close() -> task<void> override;

  [[nodiscard]] auto path() const noexcept -> const std::filesystem::path& {
    return path_;
  }

private:
  std::filesystem::path path_;
  std::ofstream out_;
};

// Writes the live transcript to <live_log_dir>/<taskId>/<runId>/live.log.
class LiveLogFeature : public FeatureHandler {
public:
  static constexpr std::string_view kName = "localLiveLog";

  explicit LiveLogFeature(const FeatureServices& services);

  [[nodiscard]] auto name() const -> std::string_view override {
    return kName;
  }

  auto created(Task& t) -> task<Result<void>> override;

private:
  std::filesystem::path root_;
};

}  // namespace dockworker
