// File: include/qs/core/log/run_log.hpp
#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "qs/core/status.hpp"

namespace qs {

// Run log model.
// Keep output stable and boring; evolve by adding fields (not breaking existing ones).

struct TimestampNs {
  std::int64_t ns = 0;
};

struct RunInfo {
  std::string command;  // CLI subcommand, e.g. "decluster-table"
  std::string config_path;
  std::string out_dir;

  std::string config_hash;

  TimestampNs start_time_ns;       // always 0 (run-relative)
  TimestampNs wall_start_time_ns;  // epoch
};

struct LogField {
  std::string key;
  std::string value;
  bool quoted = true;  // false for numbers / booleans
};

struct LogRecord {
  std::string type;  // e.g. "catalog_loaded", "decluster_finished", "run_failed"
  TimestampNs t_ns;
  TimestampNs t_wall_ns;

  std::string message;  // optional human-readable hint
  std::vector<LogField> fields;

  LogRecord& add(std::string key, std::string value) {
    fields.push_back(LogField{std::move(key), std::move(value), true});
    return *this;
  }
  LogRecord& add_number(std::string key, std::string value) {
    fields.push_back(LogField{std::move(key), std::move(value), false});
    return *this;
  }
};

class RunLogSink {
 public:
  virtual ~RunLogSink() = default;

  virtual Status open(const RunInfo& run) = 0;
  virtual Status emit(const LogRecord& r) = 0;
  virtual Status flush() = 0;
  virtual void close() = 0;
};

// For runs with logging disabled.
class NullRunLogSink final : public RunLogSink {
 public:
  Status open(const RunInfo&) override { return Status::ok_status(); }
  Status emit(const LogRecord&) override { return Status::ok_status(); }
  Status flush() override { return Status::ok_status(); }
  void close() override {}
};

}  // namespace qs
