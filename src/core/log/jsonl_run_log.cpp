// File: src/core/log/jsonl_run_log.cpp
#include "qs/core/log/jsonl_run_log.hpp"

#include <cstdio>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <system_error>

namespace qs {
namespace {

double ns_to_s(std::int64_t ns) { return static_cast<double>(ns) * 1e-9; }

std::string join_path(const std::string& a, const std::string& b) {
  namespace fs = std::filesystem;
  return (fs::path(a) / fs::path(b)).string();
}

}  // namespace

std::string json_escape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 2);
  for (const char ch : s) {
    const auto c = static_cast<unsigned char>(ch);
    switch (ch) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (c < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
          out += buf;
        } else {
          out.push_back(ch);
        }
    }
  }
  return out;
}

JsonlRunLog::~JsonlRunLog() { close(); }

Status JsonlRunLog::open(const RunInfo& run) {
  close();

  std::error_code ec;
  std::filesystem::create_directories(run.out_dir, ec);
  if (ec) {
    return Status::io_error("failed creating log dir '" + run.out_dir + "': " + ec.message());
  }

  const std::int64_t wall0 = run.wall_start_time_ns.ns;
  const std::int64_t t0 = run.start_time_ns.ns;

  path_ = join_path(run.out_dir, "runlog_" + std::to_string(wall0) + ".jsonl");
  latest_path_ = join_path(run.out_dir, "runlog_latest.jsonl");

  f_.open(path_, std::ios::out | std::ios::trunc);
  if (!f_.is_open()) return Status::io_error("failed opening '" + path_ + "'");

  latest_.open(latest_path_, std::ios::out | std::ios::trunc);
  if (!latest_.is_open()) return Status::io_error("failed opening '" + latest_path_ + "'");

  open_ = true;

  // Run header line (written to BOTH files).
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(6);
  ss << "{"
     << "\"type\":\"run_started\","
     << "\"t_ns\":" << t0 << ","
     << "\"t_s\":" << ns_to_s(t0) << ","
     << "\"t_wall_ns\":" << wall0 << ","
     << "\"t_wall_s\":" << ns_to_s(wall0) << ","
     << "\"command\":\"" << json_escape(run.command) << "\","
     << "\"config_path\":\"" << json_escape(run.config_path) << "\","
     << "\"config_hash\":\"" << run.config_hash << "\""
     << "}";

  QS_RETURN_IF_ERROR(write_line_(ss.str()));
  return flush();
}

Status JsonlRunLog::emit(const LogRecord& r) {
  if (!open_) return Status::invalid_argument("JsonlRunLog::emit called while not open");

  const std::int64_t t = r.t_ns.ns;
  const std::int64_t tw = r.t_wall_ns.ns;

  std::ostringstream ss;
  ss << std::fixed << std::setprecision(6);

  ss << "{"
     << "\"type\":\"" << json_escape(r.type) << "\","
     << "\"t_ns\":" << t << ","
     << "\"t_s\":" << ns_to_s(t) << ","
     << "\"t_wall_ns\":" << tw << ","
     << "\"t_wall_s\":" << ns_to_s(tw);

  if (!r.message.empty()) {
    ss << ",\"message\":\"" << json_escape(r.message) << "\"";
  }
  for (const LogField& f : r.fields) {
    ss << ",\"" << json_escape(f.key) << "\":";
    if (f.quoted) {
      ss << "\"" << json_escape(f.value) << "\"";
    } else {
      ss << f.value;
    }
  }

  ss << "}";

  return write_line_(ss.str());
}

Status JsonlRunLog::write_line_(const std::string& line) {
  f_ << line << "\n";
  latest_ << line << "\n";

  if (!f_.good()) return Status::io_error("failed writing to '" + path_ + "'");
  if (!latest_.good()) return Status::io_error("failed writing to '" + latest_path_ + "'");

  return Status{};
}

Status JsonlRunLog::flush() {
  if (!open_) return Status{};

  f_.flush();
  latest_.flush();

  if (!f_.good()) return Status::io_error("failed flushing '" + path_ + "'");
  if (!latest_.good()) return Status::io_error("failed flushing '" + latest_path_ + "'");

  return Status{};
}

void JsonlRunLog::close() {
  if (f_.is_open()) f_.close();
  if (latest_.is_open()) latest_.close();
  open_ = false;
}

}  // namespace qs
