// File: include/qs/core/model/decluster_runner.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "qs/core/config.hpp"
#include "qs/core/io/catalog_source.hpp"
#include "qs/core/log/run_log.hpp"
#include "qs/core/status.hpp"

namespace qs {

struct RunSummary {
  std::size_t input_rows = 0;
  std::size_t skipped_rows = 0;
  std::size_t independent = 0;
  std::size_t dependent = 0;
};

// DeclusterRunner owns one run's lifecycle: log open, load, decode, decluster,
// assemble, write, log close.
// Time contract for log lines:
//  - t_ns      = relative since run start (starts at 0) using steady clock
//  - t_wall_ns = absolute epoch ns
// Output files are written next to their targets and renamed into place only
// after both succeed, so a failed run leaves no half-written outputs.
class DeclusterRunner {
 public:
  DeclusterRunner(Config cfg, std::string command, std::string config_path);

  Status start(RunLogSink& sink);

  Result<RunSummary> run(ICatalogSource& source, RunLogSink& sink);

  void stop(RunLogSink& sink);

  const Config& config() const { return cfg_; }

 private:
  Result<RunSummary> run_(ICatalogSource& source, RunLogSink& sink);
  Status emit_(RunLogSink& sink, LogRecord r) const;

  static TimestampNs wall_now_epoch_ns();
  TimestampNs since_start_ns() const;

  static void prune_log_dir(const std::string& out_dir, std::size_t keep_last);

  Config cfg_;
  std::string command_;
  std::string config_path_;

  std::chrono::steady_clock::time_point t0_steady_{};
  bool started_{false};
};

}  // namespace qs
