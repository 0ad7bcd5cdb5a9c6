// File: src/core/cluster/reasenberg.cpp
#include "qs/core/cluster/reasenberg.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <utility>

#include "qs/core/cluster/partition.hpp"
#include "qs/core/geo/geodesic.hpp"

namespace qs {

double reasenberg_interaction_radius_km(double max_magnitude, double r_fact) noexcept {
  return r_fact * std::pow(10.0, 0.11 * max_magnitude + 0.024);
}

double reasenberg_lookback_days(double max_magnitude, const ReasenbergConfig& cfg) noexcept {
  const double exponent = cfg.b_value * (max_magnitude - cfg.xmeff);
  // 10^300 is the edge of double range; tau is ~0 there anyway.
  if (exponent > 300.0) return cfg.tau_min_days;
  const double expected = std::pow(10.0, exponent);
  const double tau = -std::log(1.0 - cfg.p) / expected;
  return std::clamp(tau, cfg.tau_min_days, cfg.tau_max_days);
}

Result<ReasenbergClusterer> ReasenbergClusterer::create(const std::vector<Event>& events,
                                                        const ReasenbergConfig& cfg) {
  const Status s = validate_reasenberg_config(cfg);
  if (!s.ok()) return Result<ReasenbergClusterer>::err(s);
  return Result<ReasenbergClusterer>::ok(ReasenbergClusterer(events, cfg));
}

void ReasenbergClusterer::close_elapsed(TimestampS now) {
  const auto& ev = *events_;
  auto keep = std::remove_if(open_.begin(), open_.end(), [&](std::size_t id) {
    ReasenbergCluster& c = clusters_[id];
    const double dt_days = static_cast<double>(now.s - ev[c.last].time.s) / kSecondsPerDay;
    if (dt_days > reasenberg_lookback_days(c.max_magnitude, cfg_)) {
      c.state = ClusterState::kClosed;
      return true;
    }
    return false;
  });
  open_.erase(keep, open_.end());
}

Result<std::size_t> ReasenbergClusterer::add(std::size_t event_index) {
  const auto& ev = *events_;
  if (event_index >= ev.size()) {
    return Result<std::size_t>::err(Status::out_of_range("event index out of range"));
  }
  const Event& e = ev[event_index];
  if (seen_any_ && e.time < last_time_) {
    return Result<std::size_t>::err(
        Status::invalid_argument("events must be added in chronological order ('" + e.id + "')"));
  }
  seen_any_ = true;
  last_time_ = e.time;

  close_elapsed(e.time);

  // Pick the dominant reachable cluster.
  bool found = false;
  std::size_t best = 0;
  for (const std::size_t id : open_) {
    const ReasenbergCluster& c = clusters_[id];
    const double dist = haversine_km(e.location, ev[c.largest].location);
    if (dist > reasenberg_interaction_radius_km(c.max_magnitude, cfg_.r_fact)) continue;

    if (!found) {
      found = true;
      best = id;
      continue;
    }
    const ReasenbergCluster& b = clusters_[best];
    if (c.max_magnitude > b.max_magnitude ||
        (c.max_magnitude == b.max_magnitude && ev[c.last].time > ev[b.last].time)) {
      best = id;
    }
  }

  if (found) {
    ReasenbergCluster& c = clusters_[best];
    c.members.push_back(event_index);
    if (e.magnitude > c.max_magnitude) {
      c.max_magnitude = e.magnitude;
      c.largest = event_index;
    }
    c.last = event_index;
    return Result<std::size_t>::ok(best);
  }

  ReasenbergCluster c;
  c.id = clusters_.size();
  c.largest = event_index;
  c.last = event_index;
  c.max_magnitude = e.magnitude;
  c.members.push_back(event_index);
  clusters_.push_back(std::move(c));
  open_.push_back(clusters_.back().id);
  return Result<std::size_t>::ok(clusters_.back().id);
}

std::vector<ReasenbergCluster> ReasenbergClusterer::finish() {
  for (const std::size_t id : open_) clusters_[id].state = ClusterState::kClosed;
  open_.clear();
  return std::move(clusters_);
}

Result<ReasenbergResult> decluster_reasenberg(const std::vector<Event>& events,
                                              const ReasenbergConfig& cfg) {
  auto clusterer_r = ReasenbergClusterer::create(events, cfg);
  if (!clusterer_r.ok()) return Result<ReasenbergResult>::err(clusterer_r.status());
  ReasenbergClusterer clusterer = clusterer_r.take_value();

  std::vector<std::size_t> order(events.size());
  std::iota(order.begin(), order.end(), std::size_t{0});
  std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
    return events[a].time < events[b].time;
  });

  for (const std::size_t i : order) {
    auto r = clusterer.add(i);
    if (!r.ok()) return Result<ReasenbergResult>::err(r.status());
  }

  ReasenbergResult out;
  out.clusters = clusterer.finish();

  std::vector<ClassificationState> states(events.size());
  for (const ReasenbergCluster& c : out.clusters) {
    const Event& main = events[c.largest];
    for (const std::size_t m : c.members) {
      if (m == c.largest) continue;
      const Event& e = events[m];
      ClassificationState& st = states[m];
      st.tag = Tag::kDependent;
      st.attribution = Attribution{main.id, main.magnitude, e.time.s - main.time.s,
                                   haversine_km(main.location, e.location)};
    }
  }

  out.partition = partition_states(std::move(states));
  return Result<ReasenbergResult>::ok(std::move(out));
}

}  // namespace qs
