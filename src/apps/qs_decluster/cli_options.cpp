// File: src/apps/qs_decluster/cli_options.cpp
#include "cli_options.hpp"

#include <charconv>
#include <iostream>
#include <optional>
#include <utility>

#include "qs/core/util/config_loader.hpp"

namespace qs::cli {
namespace {

bool is_switch(const std::string& s) {
  return s == "--lenient" || s == "--strict" || s == "--attribution" || s == "--no-log";
}

std::optional<double> to_double(const std::string& s) {
  double v = 0.0;
  const char* begin = s.data();
  const char* end = s.data() + s.size();
  const auto [ptr, ec] = std::from_chars(begin, end, v);
  if (ec != std::errc() || ptr != end) return std::nullopt;
  return v;
}

// Reads a numeric option into `out` if present.
Status take_double(const Args& a, const char* flag, double& out) {
  const auto it = a.opts.find(flag);
  if (it == a.opts.end()) return Status::ok_status();
  const auto v = to_double(it->second);
  if (!v) return Status::invalid_argument(std::string(flag) + ": not a number: " + it->second);
  out = *v;
  return Status::ok_status();
}

}  // namespace

Args parse_args(int argc, const char* const* argv) {
  Args a;
  int i = 1;
  if (i < argc) {
    const std::string first = argv[i];
    if (first == "--help" || first == "-h") {
      a.help = true;
      return a;
    }
    a.command = first;
    ++i;
  }
  for (; i < argc; ++i) {
    const std::string s = argv[i];
    if (s == "--help" || s == "-h") {
      a.help = true;
      return a;
    }
    if (s.rfind("--", 0) != 0) {
      a.error = "unexpected argument: " + s;
      return a;
    }
    if (is_switch(s)) {
      a.opts[s] = "";
      continue;
    }
    if (i + 1 >= argc) {
      a.error = "missing value for " + s;
      return a;
    }
    a.opts[s] = argv[++i];
  }
  return a;
}

void print_usage() {
  std::cout << "qs_decluster <command> [options]\n"
            << "\n"
            << "commands:\n"
            << "  decluster             Gardner-Knopoff formula windows\n"
            << "  decluster-table       Gardner-Knopoff published table windows\n"
            << "  decluster-a1b         fixed windows (--radius km, --window days)\n"
            << "  decluster-reasenberg  Reasenberg (1985) interaction clustering\n"
            << "  window                scaled G-K windows (--window-size), nearest-in-time parents,\n"
            << "                        attribution columns on the aftershock output\n"
            << "  run                   everything from --config\n"
            << "\n"
            << "common options:\n"
            << "  --input <csv>  --mainshocks <csv>  --aftershocks <csv>\n"
            << "  --config <yaml>     layered under command-line options\n"
            << "  --log-dir <dir>     run log directory (default: runs)\n"
            << "  --no-log            disable the run log\n"
            << "  --lenient           skip invalid rows instead of failing\n"
            << "  --attribution       append parent columns to aftershock rows\n"
            << "  --scale <f>         window scale factor (G-K commands)\n"
            << "  --claim-mode <single_claim|nearest_in_time>\n"
            << "\n"
            << "decluster-table:      --below-table <clamp|reject>\n"
            << "decluster-a1b:        --radius <km> (83.2)  --window <days> (95.6)\n"
            << "decluster-reasenberg: --rfact (10)  --tau-min (1)  --tau-max (10)\n"
            << "                      --p-value (0.95)  --xmeff (1.5)  --b-value (1)\n";
}

Status apply_command(const Args& a, Config& cfg) {
  const std::string& c = a.command;

  if (c == "decluster") {
    cfg.engine.window.model = WindowModelKind::kGkFormula;
  } else if (c == "decluster-table") {
    cfg.engine.window.model = WindowModelKind::kGkTable;
  } else if (c == "decluster-a1b") {
    cfg.engine.window.model = WindowModelKind::kFixed;
  } else if (c == "decluster-reasenberg") {
    cfg.engine.window.model = WindowModelKind::kReasenberg;
  } else if (c == "window") {
    if (!a.opts.count("--window-size")) {
      return Status::invalid_argument("window: --window-size is required");
    }
    cfg.engine.window.model = WindowModelKind::kGkFormula;
    cfg.engine.claim_mode = ClaimMode::kNearestInTime;
    cfg.output.attribution = true;
    QS_RETURN_IF_ERROR(take_double(a, "--window-size", cfg.engine.window.scale));
  } else if (c != "run") {
    return Status::invalid_argument("unknown command: " + c);
  }
  return Status::ok_status();
}

Status apply_options(const Args& a, Config& cfg) {
  const auto get = [&](const char* flag) -> const std::string* {
    const auto it = a.opts.find(flag);
    return it == a.opts.end() ? nullptr : &it->second;
  };

  if (const auto* v = get("--input")) {
    cfg.input.type = "csv";
    cfg.input.path = *v;
  }
  if (const auto* v = get("--mainshocks")) cfg.output.independent_path = *v;
  if (const auto* v = get("--aftershocks")) cfg.output.dependent_path = *v;
  if (const auto* v = get("--log-dir")) cfg.log.out_dir = *v;
  if (get("--no-log")) cfg.log.enabled = false;
  if (get("--lenient")) cfg.input.strict = false;
  if (get("--strict")) cfg.input.strict = true;
  if (get("--attribution")) cfg.output.attribution = true;

  if (const auto* v = get("--claim-mode")) {
    auto m = parse_claim_mode(*v);
    if (!m.ok()) return m.status();
    cfg.engine.claim_mode = m.value();
  }
  if (const auto* v = get("--below-table")) {
    auto p = parse_below_table_policy(*v);
    if (!p.ok()) return p.status();
    cfg.engine.window.below_table = p.value();
  }

  QS_RETURN_IF_ERROR(take_double(a, "--scale", cfg.engine.window.scale));
  QS_RETURN_IF_ERROR(take_double(a, "--radius", cfg.engine.window.fixed.spatial_km));
  QS_RETURN_IF_ERROR(take_double(a, "--window", cfg.engine.window.fixed.temporal_days));

  QS_RETURN_IF_ERROR(take_double(a, "--rfact", cfg.engine.reasenberg.r_fact));
  QS_RETURN_IF_ERROR(take_double(a, "--tau-min", cfg.engine.reasenberg.tau_min_days));
  QS_RETURN_IF_ERROR(take_double(a, "--tau-max", cfg.engine.reasenberg.tau_max_days));
  QS_RETURN_IF_ERROR(take_double(a, "--p-value", cfg.engine.reasenberg.p));
  QS_RETURN_IF_ERROR(take_double(a, "--xmeff", cfg.engine.reasenberg.xmeff));
  QS_RETURN_IF_ERROR(take_double(a, "--b-value", cfg.engine.reasenberg.b_value));
  return Status::ok_status();
}

Status build_config(const Args& a, Config* cfg, std::string* config_path) {
  if (!cfg || !config_path) return Status::invalid_argument("build_config: null output");

  Config staged = *cfg;
  std::string path;
  if (const auto it = a.opts.find("--config"); it != a.opts.end()) {
    path = it->second;
    QS_RETURN_IF_ERROR(apply_config_file(path, &staged));
  }
  QS_RETURN_IF_ERROR(apply_command(a, staged));
  QS_RETURN_IF_ERROR(apply_options(a, staged));
  QS_RETURN_IF_ERROR(validate_config(staged));

  *cfg = std::move(staged);
  *config_path = std::move(path);
  return Status::ok_status();
}

int exit_code_for_run(const Status& run_status) noexcept {
  return run_status.ok() ? kExitOk : kExitRunError;
}

}  // namespace qs::cli
