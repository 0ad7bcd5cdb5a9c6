// File: include/qs/core/types.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace qs {

// -----------------------------
// Basic identifiers
// -----------------------------

using EventId = std::string;  // e.g. "us7000abcd"

// -----------------------------
// Time
// -----------------------------
// Catalog instants are integer seconds since the Unix epoch, UTC.
// Second resolution is all the windows need and keeps every comparison exact.

struct TimestampS {
  std::int64_t s = 0;

  constexpr bool operator==(const TimestampS& other) const noexcept { return s == other.s; }
  constexpr bool operator!=(const TimestampS& other) const noexcept { return s != other.s; }
  constexpr bool operator<(const TimestampS& other) const noexcept { return s < other.s; }
  constexpr bool operator<=(const TimestampS& other) const noexcept { return s <= other.s; }
  constexpr bool operator>(const TimestampS& other) const noexcept { return s > other.s; }
  constexpr bool operator>=(const TimestampS& other) const noexcept { return s >= other.s; }
};

constexpr double kSecondsPerDay = 86400.0;

// -----------------------------
// Catalog events
// -----------------------------

struct GeoPoint {
  double lat_deg = 0.0;  // [-90, 90]
  double lon_deg = 0.0;  // [-180, 180]
};

// Immutable once decoded. Classification lives in ClassificationState, never here.
struct Event {
  EventId id;
  double magnitude = 0.0;
  std::string magnitude_text;  // as written in the input; empty when built in code
  TimestampS time;
  GeoPoint location;
  double depth_km = 0.0;

  // Row of the record table this event was decoded from (pass-through fields).
  std::size_t source_row = 0;
};

// -----------------------------
// Windows
// -----------------------------

struct Window {
  double spatial_km = 0.0;
  double temporal_days = 0.0;

  [[nodiscard]] double temporal_seconds() const noexcept { return temporal_days * kSecondsPerDay; }
};

// -----------------------------
// Classification
// -----------------------------

enum class Tag {
  kIndependent,
  kDependent,
};

struct Attribution {
  EventId parent_id;
  double parent_magnitude = 0.0;
  std::int64_t delta_t_s = 0;  // event time minus parent time (negative: foreshock)
  double distance_km = 0.0;
};

struct ClassificationState {
  Tag tag = Tag::kIndependent;
  std::optional<Attribution> attribution;  // set iff tag == kDependent

  [[nodiscard]] bool dependent() const noexcept { return tag == Tag::kDependent; }
};

// Indices refer to the input event vector and are in input order.
struct DeclusterResult {
  std::vector<std::size_t> independent;
  std::vector<std::size_t> dependent;
  std::vector<ClassificationState> states;  // same length as the input
};

}  // namespace qs
