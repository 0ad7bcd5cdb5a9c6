// File: src/core/cluster/declusterer.cpp
#include "qs/core/cluster/declusterer.hpp"

#include <utility>

#include "qs/core/cluster/gardner_knopoff.hpp"
#include "qs/core/cluster/reasenberg.hpp"
#include "qs/core/window/window_model.hpp"

namespace qs {

Result<DeclusterResult> decluster(const std::vector<Event>& events, const EngineConfig& cfg) {
  const Status s = validate_engine_config(cfg);
  if (!s.ok()) return Result<DeclusterResult>::err(s);

  if (cfg.window.model == WindowModelKind::kReasenberg) {
    auto r = decluster_reasenberg(events, cfg.reasenberg);
    if (!r.ok()) return Result<DeclusterResult>::err(r.status());
    return Result<DeclusterResult>::ok(std::move(r.value().partition));
  }

  auto model = make_window_model(cfg.window);
  if (!model.ok()) return Result<DeclusterResult>::err(model.status());
  return decluster_gardner_knopoff(events, model.value(), cfg.claim_mode);
}

}  // namespace qs
