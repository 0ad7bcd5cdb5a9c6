// File: src/core/geo/geodesic.cpp
#include "qs/core/geo/geodesic.hpp"

#include <algorithm>
#include <cmath>

namespace qs {
namespace {

constexpr double kDegToRad = 3.14159265358979323846 / 180.0;

}  // namespace

double haversine_km(double lat1_deg, double lon1_deg, double lat2_deg, double lon2_deg) noexcept {
  const double lat1 = lat1_deg * kDegToRad;
  const double lat2 = lat2_deg * kDegToRad;
  const double dlat = lat2 - lat1;
  const double dlon = (lon2_deg - lon1_deg) * kDegToRad;

  const double s_lat = std::sin(0.5 * dlat);
  const double s_lon = std::sin(0.5 * dlon);
  double a = s_lat * s_lat + std::cos(lat1) * std::cos(lat2) * s_lon * s_lon;

  // Rounding can push a a hair past 1 for antipodal pairs.
  a = std::clamp(a, 0.0, 1.0);
  return 2.0 * kEarthRadiusKm * std::asin(std::sqrt(a));
}

}  // namespace qs
