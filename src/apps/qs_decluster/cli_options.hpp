// File: src/apps/qs_decluster/cli_options.hpp
#pragma once

#include <map>
#include <string>

#include "qs/core/config.hpp"
#include "qs/core/status.hpp"

namespace qs::cli {

constexpr int kExitOk = 0;
constexpr int kExitRunError = 1;  // bad catalog data, I/O
constexpr int kExitUsage = 2;     // bad command line or configuration

struct Args {
  std::string command;
  std::map<std::string, std::string> opts;  // "--flag" -> value ("" for switches)
  bool help{false};
  std::string error;
};

Args parse_args(int argc, const char* const* argv);

void print_usage();

// Subcommand presets (model, claim mode, attribution).
Status apply_command(const Args& a, Config& cfg);

// Explicit flags, applied over the presets.
Status apply_options(const Args& a, Config& cfg);

// --config file, then the subcommand, then flags, then validation. On success
// `*config_path` holds the --config value ("" without one).
Status build_config(const Args& a, Config* cfg, std::string* config_path);

// Everything that fails after the configuration was accepted is a run error.
int exit_code_for_run(const Status& run_status) noexcept;

}  // namespace qs::cli
