// File: include/qs/core/log/jsonl_run_log.hpp
#pragma once

#include <fstream>
#include <string>

#include "qs/core/log/run_log.hpp"
#include "qs/core/status.hpp"

namespace qs {

// JSONL run log.
// Writes every line to:
//   1) a unique per-run file: runlog_<wall_start_time_ns>.jsonl
//   2) a stable "latest" file: runlog_latest.jsonl (truncated each run)
class JsonlRunLog final : public RunLogSink {
 public:
  JsonlRunLog() = default;
  ~JsonlRunLog() override;

  const std::string& path() const { return path_; }
  const std::string& latest_path() const { return latest_path_; }

  Status open(const RunInfo& run) override;
  Status emit(const LogRecord& r) override;
  Status flush() override;
  void close() override;

 private:
  Status write_line_(const std::string& line);

  bool open_{false};

  std::string path_;
  std::string latest_path_;

  std::ofstream f_;
  std::ofstream latest_;
};

// JSON string escaping for log values.
std::string json_escape(const std::string& s);

}  // namespace qs
