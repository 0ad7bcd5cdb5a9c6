// File: src/core/util/config_loader.cpp
#include "qs/core/util/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <set>

#include <yaml-cpp/yaml.h>

namespace qs {
namespace fs = std::filesystem;

static std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

static bool is_map(const YAML::Node& n) { return n && n.IsMap(); }

// Recursive merge: maps merge keys; scalars/sequences override.
static YAML::Node merge_yaml(const YAML::Node& base, const YAML::Node& override_) {
  if (!base) return override_;
  if (!override_) return base;

  if (base.IsMap() && override_.IsMap()) {
    YAML::Node out = YAML::Clone(base);
    for (auto it : override_) {
      const auto key = it.first.as<std::string>();
      const auto val = it.second;
      if (out[key]) out[key] = merge_yaml(out[key], val);
      else out[key] = val;
    }
    return out;
  }

  // For scalars, sequences, etc., override completely.
  return override_;
}

template <typename T>
static void maybe_set(const YAML::Node& n, const char* key, T& out) {
  if (!n || !n[key]) return;
  out = n[key].as<T>();
}

static Result<YAML::Node> load_yaml_file(const fs::path& path) {
  try {
    if (!fs::exists(path)) {
      return Result<YAML::Node>::err(Status::not_found("config not found: " + path.string()));
    }
    return Result<YAML::Node>::ok(YAML::LoadFile(path.string()));
  } catch (const YAML::Exception& e) {
    return Result<YAML::Node>::err(Status::parse_error("YAML parse error in " + path.string() + ": " + e.what()));
  } catch (const std::exception& e) {
    return Result<YAML::Node>::err(Status::io_error("failed to load " + path.string() + ": " + e.what()));
  }
}

// `chain` holds the canonical paths currently being expanded, to stop include cycles.
static Result<YAML::Node> load_with_includes(const fs::path& path, std::set<std::string>& chain) {
  std::error_code ec;
  const fs::path canon = fs::weakly_canonical(path, ec);
  const std::string key = ec ? path.string() : canon.string();
  if (chain.count(key)) {
    return Result<YAML::Node>::err(Status::invalid_argument("include cycle at " + path.string()));
  }

  auto root_r = load_yaml_file(path);
  if (!root_r.ok()) return Result<YAML::Node>::err(root_r.status());
  YAML::Node root = root_r.take_value();
  if (root.IsNull()) return Result<YAML::Node>::ok(YAML::Node(YAML::NodeType::Map));
  if (!root.IsMap()) {
    return Result<YAML::Node>::err(Status::invalid_argument("config root must be a map: " + path.string()));
  }

  chain.insert(key);

  YAML::Node merged;  // empty
  const fs::path dir = path.parent_path();

  // Optional top-level includes: ["a.yaml", "b.yaml"]
  if (root["includes"]) {
    const YAML::Node inc = root["includes"];
    if (!inc.IsSequence()) {
      return Result<YAML::Node>::err(Status::invalid_argument("includes must be a YAML sequence"));
    }

    for (std::size_t i = 0; i < inc.size(); ++i) {
      const auto rel = inc[i].as<std::string>();
      const fs::path child = fs::path(rel).is_absolute() ? fs::path(rel) : (dir / rel);
      auto child_r = load_with_includes(child, chain);  // recursive
      if (!child_r.ok()) return Result<YAML::Node>::err(child_r.status());
      merged = merge_yaml(merged, child_r.take_value());
    }
  }

  chain.erase(key);

  // Finally override with this file's contents (excluding includes itself).
  if (root["includes"]) root.remove("includes");
  merged = merge_yaml(merged, root);
  return Result<YAML::Node>::ok(merged);
}

Result<WindowModelKind> parse_window_model_kind(const std::string& str) {
  const auto s = to_lower(str);
  if (s == "gk_formula" || s == "gardner_knopoff") return Result<WindowModelKind>::ok(WindowModelKind::kGkFormula);
  if (s == "gk_table") return Result<WindowModelKind>::ok(WindowModelKind::kGkTable);
  if (s == "fixed") return Result<WindowModelKind>::ok(WindowModelKind::kFixed);
  if (s == "reasenberg") return Result<WindowModelKind>::ok(WindowModelKind::kReasenberg);
  return Result<WindowModelKind>::err(Status::invalid_argument("unknown window model: " + str));
}

Result<ClaimMode> parse_claim_mode(const std::string& str) {
  const auto s = to_lower(str);
  if (s == "single_claim") return Result<ClaimMode>::ok(ClaimMode::kSingleClaim);
  if (s == "nearest_in_time") return Result<ClaimMode>::ok(ClaimMode::kNearestInTime);
  return Result<ClaimMode>::err(Status::invalid_argument("unknown claim mode: " + str));
}

Result<BelowTablePolicy> parse_below_table_policy(const std::string& str) {
  const auto s = to_lower(str);
  if (s == "clamp") return Result<BelowTablePolicy>::ok(BelowTablePolicy::kClamp);
  if (s == "reject") return Result<BelowTablePolicy>::ok(BelowTablePolicy::kReject);
  return Result<BelowTablePolicy>::err(Status::invalid_argument("unknown below_table policy: " + str));
}

static Status apply_yaml(const YAML::Node& y, Config& cfg) {
  // --- engine
  if (is_map(y["engine"])) {
    const auto e = y["engine"];
    if (e["model"]) {
      auto m = parse_window_model_kind(e["model"].as<std::string>());
      if (!m.ok()) return m.status();
      cfg.engine.window.model = m.value();
    }
    maybe_set(e, "scale", cfg.engine.window.scale);
    if (e["claim_mode"]) {
      auto m = parse_claim_mode(e["claim_mode"].as<std::string>());
      if (!m.ok()) return m.status();
      cfg.engine.claim_mode = m.value();
    }
    if (e["below_table"]) {
      auto p = parse_below_table_policy(e["below_table"].as<std::string>());
      if (!p.ok()) return p.status();
      cfg.engine.window.below_table = p.value();
    }

    if (is_map(e["fixed"])) {
      const auto f = e["fixed"];
      maybe_set(f, "spatial_km", cfg.engine.window.fixed.spatial_km);
      maybe_set(f, "temporal_days", cfg.engine.window.fixed.temporal_days);
    }

    if (is_map(e["reasenberg"])) {
      const auto r = e["reasenberg"];
      maybe_set(r, "r_fact", cfg.engine.reasenberg.r_fact);
      maybe_set(r, "tau_min", cfg.engine.reasenberg.tau_min_days);
      maybe_set(r, "tau_max", cfg.engine.reasenberg.tau_max_days);
      maybe_set(r, "p", cfg.engine.reasenberg.p);
      maybe_set(r, "xmeff", cfg.engine.reasenberg.xmeff);
      maybe_set(r, "b_value", cfg.engine.reasenberg.b_value);
    }
  }

  // --- input
  if (is_map(y["input"])) {
    const auto i = y["input"];
    maybe_set(i, "type", cfg.input.type);
    cfg.input.type = to_lower(cfg.input.type);
    maybe_set(i, "path", cfg.input.path);
    maybe_set(i, "strict", cfg.input.strict);

    if (is_map(i["columns"])) {
      const auto c = i["columns"];
      maybe_set(c, "id", cfg.input.columns.id);
      maybe_set(c, "magnitude", cfg.input.columns.magnitude);
      maybe_set(c, "time", cfg.input.columns.time);
      maybe_set(c, "latitude", cfg.input.columns.latitude);
      maybe_set(c, "longitude", cfg.input.columns.longitude);
      maybe_set(c, "depth", cfg.input.columns.depth);
    }

    if (is_map(i["synth"])) {
      const auto s = i["synth"];
      maybe_set(s, "seed", cfg.input.synth.seed);
      maybe_set(s, "num_sequences", cfg.input.synth.num_sequences);
      maybe_set(s, "aftershocks_per_sequence", cfg.input.synth.aftershocks_per_sequence);
      maybe_set(s, "background_events", cfg.input.synth.background_events);
      maybe_set(s, "start_epoch_s", cfg.input.synth.start_epoch_s);
      maybe_set(s, "span_days", cfg.input.synth.span_days);
    }
  }

  // --- output
  if (is_map(y["output"])) {
    const auto o = y["output"];
    maybe_set(o, "independent_path", cfg.output.independent_path);
    maybe_set(o, "dependent_path", cfg.output.dependent_path);
    maybe_set(o, "attribution", cfg.output.attribution);
  }

  // --- log
  if (is_map(y["log"])) {
    const auto l = y["log"];
    maybe_set(l, "enabled", cfg.log.enabled);
    maybe_set(l, "out_dir", cfg.log.out_dir);
    maybe_set(l, "keep_last", cfg.log.keep_last);
  }

  return Status::ok_status();
}

Status apply_config_file(const std::string& path_str, Config* cfg) {
  if (!cfg) return Status::invalid_argument("apply_config_file: cfg is null");

  std::set<std::string> chain;
  auto yaml_r = load_with_includes(fs::path(path_str), chain);
  if (!yaml_r.ok()) return yaml_r.status();

  // Work on a copy so a half-applied file never leaks out.
  Config next = *cfg;
  try {
    QS_RETURN_IF_ERROR(apply_yaml(yaml_r.value(), next));
  } catch (const YAML::Exception& e) {
    return Status::parse_error("bad value in " + path_str + ": " + e.what());
  }
  *cfg = std::move(next);
  return Status::ok_status();
}

Result<Config> load_config(const std::string& path) {
  Config cfg;  // defaults
  const Status s = apply_config_file(path, &cfg);
  if (!s.ok()) return Result<Config>::err(s);

  // Final validation (fail early).
  const Status v = validate_config(cfg);
  if (!v.ok()) return Result<Config>::err(v);

  return Result<Config>::ok(cfg);
}

}  // namespace qs
