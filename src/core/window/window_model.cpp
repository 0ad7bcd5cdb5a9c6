// File: src/core/window/window_model.cpp
#include "qs/core/window/window_model.hpp"

#include <cmath>
#include <sstream>
#include <type_traits>
#include <utility>

namespace qs {
namespace {

// Visitor helper for std::visit with lambdas.
template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

std::string magnitude_str(double m) {
  std::ostringstream ss;
  ss << m;
  return ss.str();
}

}  // namespace

Window gk_formula_window(double magnitude) noexcept {
  Window w;
  w.spatial_km = std::pow(10.0, 0.1238 * magnitude + 0.983);
  if (magnitude >= 6.5) {
    w.temporal_days = std::pow(10.0, 0.032 * magnitude + 2.7389);
  } else {
    w.temporal_days = std::pow(10.0, 0.5409 * magnitude - 0.547);
  }
  return w;
}

// -----------------------------
// Table
// -----------------------------

GkTableWindow::GkTableWindow(std::vector<GkTableEntry> entries, BelowTablePolicy below)
    : entries_(std::move(entries)), below_(below) {}

GkTableWindow GkTableWindow::published(BelowTablePolicy below) {
  // M, L (km), T (days)
  return GkTableWindow(
      {
          {2.5, 19.5, 6.0},
          {3.0, 22.5, 11.5},
          {3.5, 26.0, 22.0},
          {4.0, 30.0, 42.0},
          {4.5, 35.0, 83.0},
          {5.0, 40.0, 155.0},
          {5.5, 47.0, 290.0},
          {6.0, 54.0, 510.0},
          {6.5, 61.0, 790.0},
          {7.0, 70.0, 915.0},
          {7.5, 81.0, 960.0},
          {8.0, 94.0, 985.0},
      },
      below);
}

Result<GkTableWindow> GkTableWindow::from_entries(std::vector<GkTableEntry> entries,
                                                  BelowTablePolicy below) {
  if (entries.empty()) {
    return Result<GkTableWindow>::err(Status::invalid_argument("window table must not be empty"));
  }
  for (std::size_t i = 0; i < entries.size(); ++i) {
    const GkTableEntry& e = entries[i];
    if (!std::isfinite(e.min_magnitude)) {
      return Result<GkTableWindow>::err(
          Status::invalid_argument("window table: non-finite magnitude threshold"));
    }
    if (!(e.spatial_km > 0.0) || !(e.temporal_days > 0.0)) {
      return Result<GkTableWindow>::err(
          Status::invalid_argument("window table: extents must be > 0 at M" +
                                   magnitude_str(e.min_magnitude)));
    }
    if (i > 0 && !(e.min_magnitude > entries[i - 1].min_magnitude)) {
      return Result<GkTableWindow>::err(
          Status::invalid_argument("window table: thresholds must be strictly increasing"));
    }
  }
  return Result<GkTableWindow>::ok(GkTableWindow(std::move(entries), below));
}

Result<Window> GkTableWindow::lookup(double magnitude) const {
  if (magnitude < entries_.front().min_magnitude) {
    if (below_ == BelowTablePolicy::kReject) {
      return Result<Window>::err(Status::out_of_range(
          "magnitude " + magnitude_str(magnitude) + " is below the lowest window table threshold " +
          magnitude_str(entries_.front().min_magnitude)));
    }
    const GkTableEntry& e = entries_.front();
    return Result<Window>::ok(Window{e.spatial_km, e.temporal_days});
  }

  // Highest threshold <= magnitude. Tables are short; a linear scan from the top is fine.
  for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
    if (it->min_magnitude <= magnitude) {
      return Result<Window>::ok(Window{it->spatial_km, it->temporal_days});
    }
  }
  return Result<Window>::err(Status::internal("window table lookup fell through"));
}

// -----------------------------
// Dispatch
// -----------------------------

Result<Window> window_for(const WindowModel& model, double magnitude) {
  if (!std::isfinite(magnitude)) {
    return Result<Window>::err(Status::invalid_argument("magnitude must be finite"));
  }
  return std::visit(
      Overloaded{
          [&](const GkFormulaWindow&) { return Result<Window>::ok(gk_formula_window(magnitude)); },
          [&](const GkTableWindow& t) { return t.lookup(magnitude); },
          [&](const FixedWindow& f) { return Result<Window>::ok(f.window); },
      },
      model);
}

const char* window_model_name(const WindowModel& model) noexcept {
  return std::visit(
      [](const auto& m) -> const char* {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, GkFormulaWindow>) return "gk_formula";
        else if constexpr (std::is_same_v<T, GkTableWindow>) return "gk_table";
        else return "fixed";
      },
      model);
}

// -----------------------------
// Scaled wrapper
// -----------------------------

Result<ScaledWindowModel> ScaledWindowModel::create(WindowModel base, double scale) {
  if (!std::isfinite(scale) || scale <= 0.0) {
    return Result<ScaledWindowModel>::err(Status::invalid_argument("window scale must be > 0"));
  }
  if (const auto* f = std::get_if<FixedWindow>(&base)) {
    if (!(f->window.spatial_km > 0.0) || !(f->window.temporal_days > 0.0)) {
      return Result<ScaledWindowModel>::err(
          Status::invalid_argument("fixed window extents must be > 0"));
    }
  }
  return Result<ScaledWindowModel>::ok(ScaledWindowModel(std::move(base), scale));
}

Result<Window> ScaledWindowModel::window_for(double magnitude) const {
  auto w = qs::window_for(base_, magnitude);
  if (!w.ok()) return w;
  Window out = w.take_value();
  out.spatial_km *= scale_;
  out.temporal_days *= scale_;
  return Result<Window>::ok(out);
}

Result<ScaledWindowModel> make_window_model(const WindowConfig& cfg) {
  const Status s = validate_window_config(cfg);
  if (!s.ok()) return Result<ScaledWindowModel>::err(s);

  switch (cfg.model) {
    case WindowModelKind::kGkFormula:
      return ScaledWindowModel::create(GkFormulaWindow{}, cfg.scale);
    case WindowModelKind::kGkTable:
      return ScaledWindowModel::create(GkTableWindow::published(cfg.below_table), cfg.scale);
    case WindowModelKind::kFixed:
      return ScaledWindowModel::create(
          FixedWindow{Window{cfg.fixed.spatial_km, cfg.fixed.temporal_days}}, cfg.scale);
    case WindowModelKind::kReasenberg:
      break;
  }
  return Result<ScaledWindowModel>::err(
      Status::invalid_argument("window model '" + std::string(to_string(cfg.model)) +
                               "' has no fixed window; use the reasenberg engine"));
}

}  // namespace qs
