// File: tests/test_geodesic.cpp
#include <cmath>

#include <gtest/gtest.h>

#include "qs/core/geo/geodesic.hpp"

using namespace qs;

namespace {
constexpr double kPi = 3.14159265358979323846;
const double kKmPerDegree = kPi / 180.0 * kEarthRadiusKm;  // ~111.195
}  // namespace

TEST(Geodesic, SamePointIsZero) {
  EXPECT_DOUBLE_EQ(haversine_km(35.0, 139.0, 35.0, 139.0), 0.0);
}

TEST(Geodesic, OneDegreeOfLatitude) {
  EXPECT_NEAR(haversine_km(0.0, 0.0, 1.0, 0.0), kKmPerDegree, 1e-9);
  EXPECT_NEAR(haversine_km(0.0, 0.0, 1.0, 0.0), 111.195, 1e-3);
}

TEST(Geodesic, Symmetric) {
  const double ab = haversine_km(35.0, 139.0, -33.9, 151.2);
  const double ba = haversine_km(-33.9, 151.2, 35.0, 139.0);
  EXPECT_DOUBLE_EQ(ab, ba);
}

TEST(Geodesic, AntipodesAreHalfCircumference) {
  const double d = haversine_km(0.0, 0.0, 0.0, 180.0);
  EXPECT_TRUE(std::isfinite(d));
  EXPECT_NEAR(d, kPi * kEarthRadiusKm, 1e-6);
}

TEST(Geodesic, CrossesAntimeridian) {
  // 0.2 degrees apart across +/-180, not 359.8.
  const double d = haversine_km(0.0, 179.9, 0.0, -179.9);
  EXPECT_NEAR(d, 0.2 * kKmPerDegree, 1e-6);
}

TEST(Geodesic, NearPoleAcrossMeridians) {
  // Opposite meridians at 89.9N are 0.2 degrees apart over the pole.
  const double d = haversine_km(89.9, 0.0, 89.9, 180.0);
  EXPECT_NEAR(d, 0.2 * kKmPerDegree, 1e-6);
}

TEST(Geodesic, LongitudeShrinksWithLatitude) {
  const double at_equator = haversine_km(0.0, 0.0, 0.0, 1.0);
  const double at_60 = haversine_km(60.0, 0.0, 60.0, 1.0);
  EXPECT_NEAR(at_60 / at_equator, 0.5, 1e-4);
}

TEST(Geodesic, GeoPointOverload) {
  const GeoPoint a{35.0, 139.0};
  const GeoPoint b{35.05, 139.05};
  EXPECT_DOUBLE_EQ(haversine_km(a, b), haversine_km(35.0, 139.0, 35.05, 139.05));
}
