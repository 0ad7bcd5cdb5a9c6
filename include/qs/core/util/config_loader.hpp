// File: include/qs/core/util/config_loader.hpp
#pragma once

#include <string>

#include "qs/core/config.hpp"
#include "qs/core/status.hpp"

namespace qs {

// Loads a YAML config file (supports optional `includes:` for layering).
// - Includes are loaded first (in order), then overridden by the main file.
// - Relative include paths are resolved relative to the including file.
//
// Returns a fully populated Config with defaults applied + validated.
Result<Config> load_config(const std::string& path);

// Same layering, but applied on top of `cfg` and not validated. For callers
// that override further (CLI flags) before validating.
Status apply_config_file(const std::string& path, Config* cfg);

Result<WindowModelKind> parse_window_model_kind(const std::string& s);
Result<ClaimMode> parse_claim_mode(const std::string& s);
Result<BelowTablePolicy> parse_below_table_policy(const std::string& s);

}  // namespace qs
