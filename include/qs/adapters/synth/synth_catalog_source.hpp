// File: include/qs/adapters/synth/synth_catalog_source.hpp
#pragma once

#include <cstdint>
#include <string>

#include "qs/core/config.hpp"
#include "qs/core/io/catalog_source.hpp"

namespace qs {

struct SynthSourceConfig {
  std::uint32_t seed{1};

  // Mainshock-aftershock sequences.
  int num_sequences{5};
  int aftershocks_per_sequence{20};
  double mainshock_min_mag{6.0};
  double mainshock_max_mag{7.5};
  double aftershock_spread_km{20.0};  // max epicentral offset from the mainshock
  double aftershock_span_days{30.0};  // Omori-like decay truncated here

  // Uncorrelated background.
  int background_events{50};
  double background_min_mag{4.0};
  double background_max_mag{6.0};

  std::int64_t start_epoch_s{946684800};  // 2000-01-01T00:00:00Z
  double span_days{3650.0};

  // Header names for the generated table.
  ColumnsConfig columns;
};

// Deterministic synthetic catalog: the same seed always yields the same table.
// Rows are in generation order (sequence by sequence, then background), not
// time order, so consumers cannot rely on sorted input.
class SynthCatalogSource final : public ICatalogSource {
 public:
  explicit SynthCatalogSource(SynthSourceConfig cfg);

  Status read(RecordTable* out) override;

  std::string name() const override { return "synth"; }

 private:
  SynthSourceConfig cfg_;
};

}  // namespace qs
