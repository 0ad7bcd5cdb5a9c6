// File: src/adapters/synth/synth_catalog_source.cpp
#include "qs/adapters/synth/synth_catalog_source.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <random>
#include <sstream>
#include <utility>
#include <vector>

#include "qs/core/geo/geodesic.hpp"
#include "qs/core/util/time_util.hpp"

namespace qs {
namespace {

constexpr double kPi = 3.14159265358979323846;

std::string fmt(double v, int precision) {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(precision) << v;
  return ss.str();
}

std::string padded(int v, int width) {
  std::ostringstream ss;
  ss << std::setw(width) << std::setfill('0') << v;
  return ss.str();
}

double wrap_lon(double lon) {
  while (lon > 180.0) lon -= 360.0;
  while (lon < -180.0) lon += 360.0;
  return lon;
}

// Moves `p` by `dist_km` along `bearing_rad` on the sphere.
GeoPoint offset(const GeoPoint& p, double dist_km, double bearing_rad) {
  const double d = dist_km / kEarthRadiusKm;
  const double lat1 = p.lat_deg * kPi / 180.0;
  const double lon1 = p.lon_deg * kPi / 180.0;
  const double lat2 =
      std::asin(std::sin(lat1) * std::cos(d) + std::cos(lat1) * std::sin(d) * std::cos(bearing_rad));
  const double lon2 = lon1 + std::atan2(std::sin(bearing_rad) * std::sin(d) * std::cos(lat1),
                                        std::cos(d) - std::sin(lat1) * std::sin(lat2));
  return GeoPoint{lat2 * 180.0 / kPi, wrap_lon(lon2 * 180.0 / kPi)};
}

struct Row {
  std::string id;
  double mag;
  std::int64_t t_s;
  GeoPoint loc;
  double depth_km;
};

}  // namespace

SynthCatalogSource::SynthCatalogSource(SynthSourceConfig cfg) : cfg_(std::move(cfg)) {}

Status SynthCatalogSource::read(RecordTable* out) {
  if (!out) return Status::invalid_argument("SynthCatalogSource::read: out is null");
  if (cfg_.num_sequences < 0 || cfg_.aftershocks_per_sequence < 0 || cfg_.background_events < 0) {
    return Status::invalid_argument("SynthCatalogSource: counts must be >= 0");
  }
  if (!(cfg_.span_days > 0.0)) {
    return Status::invalid_argument("SynthCatalogSource: span_days must be > 0");
  }

  std::mt19937 rng(cfg_.seed);
  std::uniform_real_distribution<double> unit(0.0, 1.0);
  auto uniform = [&](double lo, double hi) { return lo + (hi - lo) * unit(rng); };

  const double span_s = cfg_.span_days * kSecondsPerDay;
  std::vector<Row> rows;

  for (int s = 0; s < cfg_.num_sequences; ++s) {
    Row main;
    main.id = "syn_m" + padded(s, 3);
    main.mag = uniform(cfg_.mainshock_min_mag, cfg_.mainshock_max_mag);
    main.t_s = cfg_.start_epoch_s + static_cast<std::int64_t>(uniform(0.0, span_s));
    main.loc = GeoPoint{uniform(-60.0, 60.0), uniform(-180.0, 180.0)};
    main.depth_km = uniform(5.0, 40.0);
    rows.push_back(main);

    for (int a = 0; a < cfg_.aftershocks_per_sequence; ++a) {
      // Omori-like: most aftershocks land early.
      const double u = unit(rng);
      const double dt_days = cfg_.aftershock_span_days * u * u * u;
      Row after;
      after.id = "syn_a" + padded(s, 3) + "_" + padded(a, 3);
      after.mag = std::max(2.5, main.mag - uniform(1.2, 3.0));
      after.t_s = main.t_s + 60 + static_cast<std::int64_t>(dt_days * kSecondsPerDay);
      after.loc = offset(main.loc, uniform(0.0, cfg_.aftershock_spread_km), uniform(0.0, 2.0 * kPi));
      after.depth_km = uniform(5.0, 40.0);
      rows.push_back(after);
    }
  }

  for (int b = 0; b < cfg_.background_events; ++b) {
    Row bg;
    bg.id = "syn_b" + padded(b, 4);
    bg.mag = uniform(cfg_.background_min_mag, cfg_.background_max_mag);
    bg.t_s = cfg_.start_epoch_s + static_cast<std::int64_t>(uniform(0.0, span_s));
    bg.loc = GeoPoint{uniform(-60.0, 60.0), uniform(-180.0, 180.0)};
    bg.depth_km = uniform(0.0, 300.0);
    rows.push_back(bg);
  }

  const ColumnsConfig& c = cfg_.columns;
  out->header = {c.id, c.magnitude, c.time, c.latitude, c.longitude};
  if (!c.depth.empty()) out->header.push_back(c.depth);

  out->rows.clear();
  out->rows.reserve(rows.size());
  for (const Row& r : rows) {
    std::vector<std::string> fields = {r.id, fmt(r.mag, 1), format_iso8601_utc(TimestampS{r.t_s}),
                                       fmt(r.loc.lat_deg, 4), fmt(r.loc.lon_deg, 4)};
    if (!c.depth.empty()) fields.push_back(fmt(r.depth_km, 1));
    out->rows.push_back(std::move(fields));
  }
  return Status::ok_status();
}

}  // namespace qs
