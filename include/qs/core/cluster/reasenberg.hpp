// File: include/qs/core/cluster/reasenberg.hpp
#pragma once

#include <cstddef>
#include <vector>

#include "qs/core/config.hpp"
#include "qs/core/status.hpp"
#include "qs/core/types.hpp"

namespace qs {

// Reasenberg (1985) interaction clustering.
//
//   r_int = r_fact * 10^(0.11 * M_max + 0.024)                         [km]
//   tau   = clamp(-ln(1 - p) / 10^(b * (M_max - xmeff)), tau_min, tau_max) [days]
//
// M_max is the largest magnitude in the cluster. Distance is measured to the
// cluster's largest event, elapsed time from its most recent member.

[[nodiscard]] double reasenberg_interaction_radius_km(double max_magnitude, double r_fact) noexcept;
[[nodiscard]] double reasenberg_lookback_days(double max_magnitude, const ReasenbergConfig& cfg) noexcept;

enum class ClusterState {
  kOpen,
  kClosed,  // terminal; a closed cluster never changes again
};

struct ReasenbergCluster {
  std::size_t id = 0;  // creation order
  ClusterState state = ClusterState::kOpen;

  std::size_t largest = 0;  // event index of the largest member (first one on ties)
  std::size_t last = 0;     // event index of the most recent member
  double max_magnitude = 0.0;

  std::vector<std::size_t> members;  // chronological
};

// Sequential cluster builder. Events must be fed in non-decreasing time order.
//
// On each add():
//  1) every open cluster whose lookback has elapsed since its last member closes;
//  2) among open clusters whose interaction radius reaches the event, the event
//     joins the one with the greatest M_max (ties: most recent last member,
//     then earliest created);
//  3) otherwise the event opens a new cluster.
class ReasenbergClusterer {
 public:
  // `events` must outlive the clusterer.
  static Result<ReasenbergClusterer> create(const std::vector<Event>& events,
                                            const ReasenbergConfig& cfg);

  // Returns the id of the cluster the event joined or opened.
  Result<std::size_t> add(std::size_t event_index);

  [[nodiscard]] const std::vector<ReasenbergCluster>& clusters() const noexcept { return clusters_; }
  [[nodiscard]] std::size_t open_count() const noexcept { return open_.size(); }

  // Closes every remaining cluster and returns them all.
  std::vector<ReasenbergCluster> finish();

 private:
  ReasenbergClusterer(const std::vector<Event>& events, const ReasenbergConfig& cfg)
      : events_(&events), cfg_(cfg) {}

  void close_elapsed(TimestampS now);

  const std::vector<Event>* events_;
  ReasenbergConfig cfg_;

  std::vector<ReasenbergCluster> clusters_;
  std::vector<std::size_t> open_;  // ids of open clusters, creation order

  bool seen_any_{false};
  TimestampS last_time_{};
};

struct ReasenbergResult {
  DeclusterResult partition;
  std::vector<ReasenbergCluster> clusters;  // all closed
};

// Runs the clusterer over the whole catalog in (time, input index) order. The
// largest event of each cluster is independent; every other member is dependent
// and attributed to it. Invalid parameters fail before any event is touched.
Result<ReasenbergResult> decluster_reasenberg(const std::vector<Event>& events,
                                              const ReasenbergConfig& cfg);

}  // namespace qs
