// File: include/qs/core/geo/geodesic.hpp
#pragma once

#include "qs/core/types.hpp"

namespace qs {

constexpr double kEarthRadiusKm = 6371.0;

// Great-circle distance (km) on a spherical Earth, haversine form.
// Longitude wrap needs no special casing: only sin^2(dlon/2) enters, which is
// the same for dlon and dlon +/- 360. Near the poles cos(lat) shrinks the
// longitude term, so meridian convergence falls out of the formula.
double haversine_km(double lat1_deg, double lon1_deg, double lat2_deg, double lon2_deg) noexcept;

inline double haversine_km(const GeoPoint& a, const GeoPoint& b) noexcept {
  return haversine_km(a.lat_deg, a.lon_deg, b.lat_deg, b.lon_deg);
}

}  // namespace qs
