// File: src/core/model/decluster_runner.cpp
#include "qs/core/model/decluster_runner.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "qs/adapters/csv/csv_catalog_source.hpp"
#include "qs/core/cluster/declusterer.hpp"
#include "qs/core/io/catalog_decoder.hpp"
#include "qs/core/io/result_assembler.hpp"
#include "qs/core/util/repro_hash.hpp"

namespace qs {
namespace {

bool is_digits(const std::string& s) {
  if (s.empty()) return false;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
  }
  return true;
}

std::int64_t parse_runlog_epoch_ns_from_name(const std::string& name) {
  const std::string prefix = "runlog_";
  const std::string suffix = ".jsonl";

  // Never touch the stable tail target.
  if (name == "runlog_latest.jsonl") return -1;

  if (name.rfind(prefix, 0) != 0) return -1;
  if (name.size() <= prefix.size() + suffix.size()) return -1;
  if (name.substr(name.size() - suffix.size()) != suffix) return -1;

  const std::string mid =
      name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());
  if (!is_digits(mid) || mid.size() > 18) return -1;
  return std::stoll(mid);
}

Status rename_into_place(const std::string& from, const std::string& to) {
  std::error_code ec;
  std::filesystem::rename(from, to, ec);
  if (ec) return Status::io_error("failed moving '" + from + "' to '" + to + "': " + ec.message());
  return Status::ok_status();
}

void remove_quietly(const std::string& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

struct PendingOutput {
  std::string tmp;
  std::string target;
  bool set_aside = false;  // previous target moved to target + ".bak"
  bool placed = false;
};

// Moves every .tmp onto its target, all or nothing. Existing regular files are
// set aside first and put back if any move fails.
Status commit_outputs(std::vector<PendingOutput>& outs) {
  namespace fs = std::filesystem;
  Status st = Status::ok_status();

  for (PendingOutput& o : outs) {
    std::error_code ec;
    if (!fs::is_regular_file(o.target, ec)) continue;
    st = rename_into_place(o.target, o.target + ".bak");
    if (!st.ok()) break;
    o.set_aside = true;
  }
  for (PendingOutput& o : outs) {
    if (!st.ok()) break;
    st = rename_into_place(o.tmp, o.target);
    o.placed = st.ok();
  }

  std::string stranded;
  for (PendingOutput& o : outs) {
    if (st.ok()) {
      if (o.set_aside) remove_quietly(o.target + ".bak");
      continue;
    }
    if (o.placed) remove_quietly(o.target);
    if (o.set_aside) {
      std::error_code ec;
      fs::rename(o.target + ".bak", o.target, ec);
      if (ec) stranded += "; previous '" + o.target + "' left at '" + o.target + ".bak'";
    }
    remove_quietly(o.tmp);
  }
  if (!stranded.empty()) return Status(st.code(), st.message() + stranded);
  return st;
}

}  // namespace

DeclusterRunner::DeclusterRunner(Config cfg, std::string command, std::string config_path)
    : cfg_(std::move(cfg)), command_(std::move(command)), config_path_(std::move(config_path)) {}

TimestampNs DeclusterRunner::wall_now_epoch_ns() {
  using clock = std::chrono::system_clock;
  const auto now = clock::now().time_since_epoch();
  const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();
  return TimestampNs{static_cast<std::int64_t>(ns)};
}

TimestampNs DeclusterRunner::since_start_ns() const {
  if (!started_) return TimestampNs{0};
  const auto now = std::chrono::steady_clock::now();
  const auto ns =
      std::chrono::duration_cast<std::chrono::nanoseconds>(now - t0_steady_).count();
  return TimestampNs{static_cast<std::int64_t>(ns)};
}

void DeclusterRunner::prune_log_dir(const std::string& out_dir, std::size_t keep_last) {
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::exists(out_dir, ec)) return;

  struct Entry {
    std::int64_t key_epoch_ns;
    fs::path path;
  };

  std::vector<Entry> files;
  for (const auto& it : fs::directory_iterator(out_dir, ec)) {
    if (ec) return;
    if (!it.is_regular_file(ec)) continue;

    const std::string name = it.path().filename().string();
    const std::int64_t k = parse_runlog_epoch_ns_from_name(name);
    if (k < 0) continue;

    files.push_back(Entry{k, it.path()});
  }

  if (files.size() <= keep_last) return;

  // Newest first, delete the tail.
  std::sort(files.begin(), files.end(),
            [](const Entry& a, const Entry& b) { return a.key_epoch_ns > b.key_epoch_ns; });

  for (std::size_t i = keep_last; i < files.size(); ++i) {
    fs::remove(files[i].path, ec);
    ec.clear();  // best-effort housekeeping
  }
}

Status DeclusterRunner::start(RunLogSink& sink) {
  if (cfg_.log.enabled && cfg_.log.keep_last > 0) {
    // The run about to start takes one slot.
    prune_log_dir(cfg_.log.out_dir, cfg_.log.keep_last - 1);
  }

  t0_steady_ = std::chrono::steady_clock::now();
  started_ = true;

  RunInfo run;
  run.command = command_;
  run.config_path = config_path_;
  run.out_dir = cfg_.log.out_dir;
  run.config_hash = compute_config_hash(cfg_);

  // Contract: logical time starts at zero. Wall time is absolute epoch.
  run.start_time_ns = TimestampNs{0};
  run.wall_start_time_ns = wall_now_epoch_ns();

  return sink.open(run);
}

Status DeclusterRunner::emit_(RunLogSink& sink, LogRecord r) const {
  r.t_ns = since_start_ns();
  r.t_wall_ns = wall_now_epoch_ns();
  return sink.emit(r);
}

Result<RunSummary> DeclusterRunner::run(ICatalogSource& source, RunLogSink& sink) {
  auto r = run_(source, sink);
  if (!r.ok()) {
    LogRecord failed;
    failed.type = "run_failed";
    failed.message = r.status().message();
    failed.add("code", status_code_name(r.status().code()));
    // The run's own error is what the caller needs; a log failure here would mask it.
    (void)emit_(sink, std::move(failed));
    (void)sink.flush();
  }
  return r;
}

Result<RunSummary> DeclusterRunner::run_(ICatalogSource& source, RunLogSink& sink) {
  const Status valid = validate_config(cfg_);
  if (!valid.ok()) return Result<RunSummary>::err(valid);

  RunSummary summary;

  RecordTable table;
  const Status read = source.read(&table);
  if (!read.ok()) return Result<RunSummary>::err(read);
  summary.input_rows = table.size();

  auto decoded_r = decode_catalog(table, cfg_.input.columns, cfg_.input.strict);
  if (!decoded_r.ok()) return Result<RunSummary>::err(decoded_r.status());
  const DecodedCatalog decoded = decoded_r.take_value();
  summary.skipped_rows = decoded.skipped_rows;

  {
    LogRecord r;
    r.type = "catalog_loaded";
    r.add("source", source.name());
    r.add_number("rows", std::to_string(summary.input_rows));
    r.add_number("events", std::to_string(decoded.events.size()));
    r.add_number("skipped_rows", std::to_string(decoded.skipped_rows));
    for (std::size_t i = 0; i < decoded.skipped_reasons.size(); ++i) {
      r.add("skipped_" + std::to_string(i), decoded.skipped_reasons[i]);
    }
    const Status s = emit_(sink, std::move(r));
    if (!s.ok()) return Result<RunSummary>::err(s);
  }

  auto result_r = decluster(decoded.events, cfg_.engine);
  if (!result_r.ok()) return Result<RunSummary>::err(result_r.status());
  const DeclusterResult& result = result_r.value();
  summary.independent = result.independent.size();
  summary.dependent = result.dependent.size();

  {
    LogRecord r;
    r.type = "decluster_finished";
    r.add("model", to_string(cfg_.engine.window.model));
    r.add("claim_mode", to_string(cfg_.engine.claim_mode));
    r.add_number("scale", std::to_string(cfg_.engine.window.scale));
    r.add("engine_hash", compute_engine_hash(cfg_.engine));
    r.add_number("independent", std::to_string(summary.independent));
    r.add_number("dependent", std::to_string(summary.dependent));
    const Status s = emit_(sink, std::move(r));
    if (!s.ok()) return Result<RunSummary>::err(s);
  }

  const AssembledOutput out =
      assemble_result(table, decoded.events, result, cfg_.output.attribution);

  std::vector<PendingOutput> pending(2);
  pending[0].tmp = cfg_.output.independent_path + ".tmp";
  pending[0].target = cfg_.output.independent_path;
  pending[1].tmp = cfg_.output.dependent_path + ".tmp";
  pending[1].target = cfg_.output.dependent_path;

  Status w = write_csv(pending[0].tmp, out.independent);
  if (w.ok()) w = write_csv(pending[1].tmp, out.dependent);
  if (w.ok()) w = commit_outputs(pending);
  if (!w.ok()) {
    for (const PendingOutput& o : pending) remove_quietly(o.tmp);
    return Result<RunSummary>::err(w);
  }

  {
    LogRecord r;
    r.type = "output_written";
    r.add("independent_path", cfg_.output.independent_path);
    r.add("dependent_path", cfg_.output.dependent_path);
    r.add_number("attribution", cfg_.output.attribution ? "true" : "false");
    const Status s = emit_(sink, std::move(r));
    if (!s.ok()) return Result<RunSummary>::err(s);
  }

  return Result<RunSummary>::ok(summary);
}

void DeclusterRunner::stop(RunLogSink& sink) {
  if (started_) {
    LogRecord r;
    r.type = "run_finished";
    (void)emit_(sink, std::move(r));
  }
  (void)sink.flush();
  sink.close();
  started_ = false;
}

}  // namespace qs
