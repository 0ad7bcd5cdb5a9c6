// File: include/qs/core/config.hpp
#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>

#include "qs/core/status.hpp"

namespace qs {

// Units policy:
// - Distances in kilometres
// - Angles in degrees at the API, radians inside geodesic math
// - Window durations in days (as published), instants in epoch seconds

// -----------------------------
// Window model selection
// -----------------------------
enum class WindowModelKind {
  kGkFormula,   // Gardner & Knopoff (1974) fitted formula
  kGkTable,     // Gardner & Knopoff (1974) published table
  kFixed,       // magnitude-independent extents
  kReasenberg,  // adaptive interaction clustering (separate engine)
};

enum class ClaimMode {
  kSingleClaim,    // first qualifying trigger keeps the event
  kNearestInTime,  // re-evaluated: the trigger closest in time wins
};

// What the table model does with magnitudes below its lowest threshold.
enum class BelowTablePolicy {
  kClamp,   // use the lowest entry
  kReject,  // fail the run with out_of_range
};

inline const char* to_string(WindowModelKind k) {
  switch (k) {
    case WindowModelKind::kGkFormula: return "gk_formula";
    case WindowModelKind::kGkTable: return "gk_table";
    case WindowModelKind::kFixed: return "fixed";
    case WindowModelKind::kReasenberg: return "reasenberg";
  }
  return "unknown";
}

inline const char* to_string(ClaimMode m) {
  return m == ClaimMode::kSingleClaim ? "single_claim" : "nearest_in_time";
}

inline const char* to_string(BelowTablePolicy p) {
  return p == BelowTablePolicy::kClamp ? "clamp" : "reject";
}

// -----------------------------
// Engine
// -----------------------------

// "Informed" fixed window. Defaults match the A1b analysis.
struct FixedWindowConfig {
  double spatial_km = 83.2;
  double temporal_days = 95.6;
};

struct WindowConfig {
  WindowModelKind model = WindowModelKind::kGkFormula;

  // Multiplies both extents. 1.0 leaves the model untouched.
  double scale = 1.0;

  FixedWindowConfig fixed;
  BelowTablePolicy below_table = BelowTablePolicy::kClamp;
};

// Reasenberg (1985). Literature defaults.
struct ReasenbergConfig {
  double r_fact = 10.0;       // interaction radius multiplier
  double tau_min_days = 1.0;  // shortest lookback
  double tau_max_days = 10.0; // longest lookback
  double p = 0.95;            // probability of detecting the next event
  double xmeff = 1.5;         // effective magnitude floor
  double b_value = 1.0;       // Gutenberg-Richter b
};

struct EngineConfig {
  WindowConfig window;
  ClaimMode claim_mode = ClaimMode::kSingleClaim;
  ReasenbergConfig reasenberg;
};

// -----------------------------
// Input
// -----------------------------
struct ColumnsConfig {
  std::string id = "event_id";
  std::string magnitude = "magnitude";
  std::string time = "timestamp";
  std::string latitude = "latitude";
  std::string longitude = "longitude";
  std::string depth = "depth_km";  // optional column
};

// Deterministic synthetic catalog: clustered sequences plus background.
struct InputSynthConfig {
  std::uint32_t seed = 1;
  int num_sequences = 5;
  int aftershocks_per_sequence = 20;
  int background_events = 50;
  std::int64_t start_epoch_s = 946684800;  // 2000-01-01T00:00:00Z
  double span_days = 3650.0;
};

struct InputConfig {
  std::string type = "csv";  // csv | synth
  std::string path;

  ColumnsConfig columns;

  // Strict: the first invalid row fails the run. Lenient: invalid rows are skipped and counted.
  bool strict = true;

  InputSynthConfig synth;
};

// -----------------------------
// Output
// -----------------------------
struct OutputConfig {
  std::string independent_path;
  std::string dependent_path;

  // Append parent_id, parent_magnitude, delta_t_seconds, delta_distance_km to dependent rows.
  bool attribution = false;
};

// -----------------------------
// Run log
// -----------------------------
struct LogConfig {
  bool enabled = true;
  std::string out_dir = "runs";
  std::size_t keep_last = 50;
};

// -----------------------------
// Root config
// -----------------------------
struct Config {
  EngineConfig engine;
  InputConfig input;
  OutputConfig output;
  LogConfig log;
};

inline Status validate_window_config(const WindowConfig& w) {
  if (!std::isfinite(w.scale) || w.scale <= 0.0) {
    return Status::invalid_argument("window.scale must be > 0");
  }
  if (w.model == WindowModelKind::kFixed) {
    if (!std::isfinite(w.fixed.spatial_km) || w.fixed.spatial_km <= 0.0) {
      return Status::invalid_argument("window.fixed.spatial_km must be > 0");
    }
    if (!std::isfinite(w.fixed.temporal_days) || w.fixed.temporal_days <= 0.0) {
      return Status::invalid_argument("window.fixed.temporal_days must be > 0");
    }
  }
  return Status::ok_status();
}

inline Status validate_reasenberg_config(const ReasenbergConfig& r) {
  if (!std::isfinite(r.r_fact) || r.r_fact <= 0.0) {
    return Status::invalid_argument("reasenberg.r_fact must be > 0");
  }
  if (!std::isfinite(r.tau_min_days) || r.tau_min_days <= 0.0) {
    return Status::invalid_argument("reasenberg.tau_min must be > 0");
  }
  if (!std::isfinite(r.tau_max_days) || r.tau_min_days > r.tau_max_days) {
    return Status::invalid_argument("reasenberg.tau_min must be <= reasenberg.tau_max");
  }
  if (!(r.p > 0.0 && r.p < 1.0)) {
    return Status::invalid_argument("reasenberg.p must be in (0, 1)");
  }
  if (!std::isfinite(r.xmeff)) {
    return Status::invalid_argument("reasenberg.xmeff must be finite");
  }
  if (!std::isfinite(r.b_value) || r.b_value <= 0.0) {
    return Status::invalid_argument("reasenberg.b_value must be > 0");
  }
  return Status::ok_status();
}

inline Status validate_engine_config(const EngineConfig& e) {
  if (e.window.model == WindowModelKind::kReasenberg) {
    return validate_reasenberg_config(e.reasenberg);
  }
  return validate_window_config(e.window);
}

// Minimal validation (keep it strict; fail early).
inline Status validate_config(const Config& cfg) {
  QS_RETURN_IF_ERROR(validate_engine_config(cfg.engine));

  if (cfg.input.type != "csv" && cfg.input.type != "synth") {
    return Status::invalid_argument("input.type must be 'csv' or 'synth'");
  }
  if (cfg.input.type == "csv" && cfg.input.path.empty()) {
    return Status::invalid_argument("input.path must not be empty for csv input");
  }
  const ColumnsConfig& c = cfg.input.columns;
  if (c.id.empty() || c.magnitude.empty() || c.time.empty() || c.latitude.empty() ||
      c.longitude.empty()) {
    return Status::invalid_argument("input.columns: required column names must not be empty");
  }
  if (cfg.input.type == "synth") {
    const InputSynthConfig& s = cfg.input.synth;
    if (s.num_sequences < 0 || s.aftershocks_per_sequence < 0 || s.background_events < 0) {
      return Status::invalid_argument("input.synth counts must be >= 0");
    }
    if (!(s.span_days > 0.0)) {
      return Status::invalid_argument("input.synth.span_days must be > 0");
    }
  }
  if (cfg.output.independent_path.empty()) {
    return Status::invalid_argument("output.independent_path must not be empty");
  }
  if (cfg.output.dependent_path.empty()) {
    return Status::invalid_argument("output.dependent_path must not be empty");
  }
  if (cfg.log.enabled && cfg.log.out_dir.empty()) {
    return Status::invalid_argument("log.out_dir must not be empty");
  }
  return Status::ok_status();
}

}  // namespace qs
