// File: include/qs/core/util/repro_hash.hpp
#pragma once

#include <string>

#include "qs/core/config.hpp"

namespace qs {

// Hash of the full effective config (engine, input, output, log).
// Goal: if the run changes, this hash should change.
std::string compute_config_hash(const Config& cfg);

// Hash of the engine config only. Two runs with equal engine hashes classify
// the same catalog identically.
std::string compute_engine_hash(const EngineConfig& engine);

}  // namespace qs
