// File: src/core/cluster/gardner_knopoff.cpp
#include "qs/core/cluster/gardner_knopoff.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <numeric>
#include <utility>

#include "qs/core/cluster/partition.hpp"
#include "qs/core/geo/geodesic.hpp"

namespace qs {
namespace {

// Indices sorted by (time, index). Used to restrict each trigger to its time window.
std::vector<std::size_t> chronological_order(const std::vector<Event>& events) {
  std::vector<std::size_t> idx(events.size());
  std::iota(idx.begin(), idx.end(), std::size_t{0});
  std::sort(idx.begin(), idx.end(), [&](std::size_t a, std::size_t b) {
    if (events[a].time != events[b].time) return events[a].time < events[b].time;
    return a < b;
  });
  return idx;
}

// True if `cand` should replace `cur` in nearest-in-time mode.
bool closer_claim(const Attribution& cand, const Attribution& cur) {
  const std::int64_t a = std::llabs(cand.delta_t_s);
  const std::int64_t b = std::llabs(cur.delta_t_s);
  if (a != b) return a < b;
  return cand.distance_km < cur.distance_km;
}

}  // namespace

std::vector<std::size_t> magnitude_order(const std::vector<Event>& events) {
  std::vector<std::size_t> idx(events.size());
  std::iota(idx.begin(), idx.end(), std::size_t{0});
  std::sort(idx.begin(), idx.end(), [&](std::size_t a, std::size_t b) {
    const Event& ea = events[a];
    const Event& eb = events[b];
    if (ea.magnitude != eb.magnitude) return ea.magnitude > eb.magnitude;
    if (ea.time != eb.time) return ea.time < eb.time;
    return a < b;
  });
  return idx;
}

Result<DeclusterResult> decluster_gardner_knopoff(const std::vector<Event>& events,
                                                  const ScaledWindowModel& model,
                                                  ClaimMode mode) {
  const std::size_t n = events.size();

  // Windows first: nothing is classified unless every event has one.
  std::vector<Window> windows;
  windows.reserve(n);
  for (const Event& e : events) {
    auto w = model.window_for(e.magnitude);
    if (!w.ok()) {
      return Result<DeclusterResult>::err(w.status().with_prefix("event '" + e.id + "': "));
    }
    windows.push_back(w.take_value());
  }

  const std::vector<std::size_t> by_mag = magnitude_order(events);
  const std::vector<std::size_t> by_time = chronological_order(events);

  std::vector<ClassificationState> states(n);
  std::vector<bool> triggered(n, false);

  for (const std::size_t p : by_mag) {
    if (states[p].dependent()) continue;
    triggered[p] = true;

    const Event& ep = events[p];
    const Window& w = windows[p];
    const double tw_s = w.temporal_seconds();
    const double t_lo = static_cast<double>(ep.time.s) - tw_s;
    const double t_hi = static_cast<double>(ep.time.s) + tw_s;

    auto it = std::lower_bound(by_time.begin(), by_time.end(), t_lo,
                               [&](std::size_t i, double bound) {
                                 return static_cast<double>(events[i].time.s) < bound;
                               });

    for (; it != by_time.end(); ++it) {
      const std::size_t q = *it;
      const Event& eq = events[q];
      if (static_cast<double>(eq.time.s) > t_hi) break;

      if (q == p || triggered[q]) continue;
      if (eq.magnitude > ep.magnitude) continue;
      if (mode == ClaimMode::kSingleClaim && states[q].dependent()) continue;

      const std::int64_t dt = eq.time.s - ep.time.s;
      const double dist = haversine_km(ep.location, eq.location);
      if (dist > w.spatial_km) continue;

      Attribution cand{ep.id, ep.magnitude, dt, dist};
      ClassificationState& st = states[q];
      if (!st.dependent()) {
        st.tag = Tag::kDependent;
        st.attribution = std::move(cand);
      } else if (closer_claim(cand, *st.attribution)) {
        st.attribution = std::move(cand);
      }
    }
  }

  return Result<DeclusterResult>::ok(partition_states(std::move(states)));
}

}  // namespace qs
