// File: src/core/util/repro_hash.cpp
#include "qs/core/util/repro_hash.hpp"

#include <bit>
#include <cstdint>
#include <string>

namespace qs {
namespace {

// FNV-1a 64-bit. Not cryptographic; a stable fingerprint is all the run log needs.
struct Fnv1a64 {
  std::uint64_t h = 1469598103934665603ull;

  void add_bytes(const void* data, std::size_t n) {
    const auto* p = static_cast<const std::uint8_t*>(data);
    for (std::size_t i = 0; i < n; ++i) {
      h ^= static_cast<std::uint64_t>(p[i]);
      h *= 1099511628211ull;
    }
  }

  void add_u64(std::uint64_t v) { add_bytes(&v, sizeof(v)); }
  void add_i64(std::int64_t v)  { add_bytes(&v, sizeof(v)); }
  void add_u32(std::uint32_t v) { add_bytes(&v, sizeof(v)); }
  void add_i32(std::int32_t v)  { add_bytes(&v, sizeof(v)); }

  void add_bool(bool v) {
    const std::uint8_t b = v ? 1u : 0u;
    add_bytes(&b, sizeof(b));
  }

  void add_string(const std::string& s) {
    // Length prefix so ("ab","c") != ("a","bc").
    add_u64(static_cast<std::uint64_t>(s.size()));
    add_bytes(s.data(), s.size());
  }

  void add_double(double v) { add_u64(std::bit_cast<std::uint64_t>(v)); }
};

std::string to_hex(std::uint64_t v) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[static_cast<std::size_t>(i)] = kHex[v & 0xF];
    v >>= 4;
  }
  return out;
}

void add_engine(Fnv1a64& h, const EngineConfig& e) {
  h.add_i32(static_cast<std::int32_t>(e.window.model));
  h.add_double(e.window.scale);
  h.add_double(e.window.fixed.spatial_km);
  h.add_double(e.window.fixed.temporal_days);
  h.add_i32(static_cast<std::int32_t>(e.window.below_table));

  h.add_i32(static_cast<std::int32_t>(e.claim_mode));

  h.add_double(e.reasenberg.r_fact);
  h.add_double(e.reasenberg.tau_min_days);
  h.add_double(e.reasenberg.tau_max_days);
  h.add_double(e.reasenberg.p);
  h.add_double(e.reasenberg.xmeff);
  h.add_double(e.reasenberg.b_value);
}

}  // namespace

std::string compute_engine_hash(const EngineConfig& engine) {
  Fnv1a64 h;
  add_engine(h, engine);
  return to_hex(h.h);
}

std::string compute_config_hash(const Config& cfg) {
  Fnv1a64 h;

  add_engine(h, cfg.engine);

  // Input.
  h.add_string(cfg.input.type);
  h.add_string(cfg.input.path);
  h.add_string(cfg.input.columns.id);
  h.add_string(cfg.input.columns.magnitude);
  h.add_string(cfg.input.columns.time);
  h.add_string(cfg.input.columns.latitude);
  h.add_string(cfg.input.columns.longitude);
  h.add_string(cfg.input.columns.depth);
  h.add_bool(cfg.input.strict);

  h.add_u32(cfg.input.synth.seed);
  h.add_i32(cfg.input.synth.num_sequences);
  h.add_i32(cfg.input.synth.aftershocks_per_sequence);
  h.add_i32(cfg.input.synth.background_events);
  h.add_i64(cfg.input.synth.start_epoch_s);
  h.add_double(cfg.input.synth.span_days);

  // Output.
  h.add_string(cfg.output.independent_path);
  h.add_string(cfg.output.dependent_path);
  h.add_bool(cfg.output.attribution);

  // Log.
  h.add_bool(cfg.log.enabled);
  h.add_string(cfg.log.out_dir);
  h.add_u64(static_cast<std::uint64_t>(cfg.log.keep_last));

  return to_hex(h.h);
}

}  // namespace qs
