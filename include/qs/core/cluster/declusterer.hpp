// File: include/qs/core/cluster/declusterer.hpp
#pragma once

#include <vector>

#include "qs/core/config.hpp"
#include "qs/core/status.hpp"
#include "qs/core/types.hpp"

namespace qs {

// Single entry point over both engine families. Validates the engine config
// first (nothing is processed on a config error), then runs either the
// magnitude-ordered pass with the configured window model or Reasenberg.
Result<DeclusterResult> decluster(const std::vector<Event>& events, const EngineConfig& cfg);

}  // namespace qs
