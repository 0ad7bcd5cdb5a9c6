// File: include/qs/core/cluster/gardner_knopoff.hpp
#pragma once

#include <cstddef>
#include <vector>

#include "qs/core/config.hpp"
#include "qs/core/status.hpp"
#include "qs/core/types.hpp"
#include "qs/core/window/window_model.hpp"

namespace qs {

// Processing order for the magnitude-ordered pass:
// magnitude descending, then time ascending, then input index ascending.
std::vector<std::size_t> magnitude_order(const std::vector<Event>& events);

// Gardner-Knopoff style declustering with a pluggable (scaled) window model.
//
// Contract:
//  - Events are walked in magnitude_order(). An event that is still independent
//    when reached becomes a trigger; a dependent event never triggers.
//  - A trigger claims every other not-yet-triggered event of equal or smaller
//    magnitude with |dt| <= temporal window and distance <= spatial window.
//  - kSingleClaim: the first trigger to claim an event keeps it.
//    kNearestInTime: a later trigger takes the event over when it is strictly
//    closer in |dt|, or equally close in |dt| and strictly closer in distance.
//  - Every window is computed before classification starts; a window error
//    (e.g. magnitude below a rejecting table) fails the call with no result.
//
// Deterministic; no state outside the call.
Result<DeclusterResult> decluster_gardner_knopoff(const std::vector<Event>& events,
                                                  const ScaledWindowModel& model,
                                                  ClaimMode mode);

}  // namespace qs
