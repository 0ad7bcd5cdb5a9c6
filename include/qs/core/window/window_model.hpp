// File: include/qs/core/window/window_model.hpp
#pragma once

#include <utility>
#include <variant>
#include <vector>

#include "qs/core/config.hpp"
#include "qs/core/status.hpp"
#include "qs/core/types.hpp"

namespace qs {

// -----------------------------
// Window strategies (closed set)
// -----------------------------

// Gardner & Knopoff (1974) fitted curves:
//   spatial  = 10^(0.1238 M + 0.983) km
//   temporal = 10^(0.5409 M - 0.547) days   M < 6.5
//              10^(0.032  M + 2.7389) days  M >= 6.5
struct GkFormulaWindow {};

struct GkTableEntry {
  double min_magnitude = 0.0;
  double spatial_km = 0.0;
  double temporal_days = 0.0;
};

// Step table keyed by minimum magnitude. Not interpolated.
class GkTableWindow {
 public:
  // Gardner & Knopoff (1974), Table 1.
  static GkTableWindow published(BelowTablePolicy below = BelowTablePolicy::kClamp);

  // Entries must be non-empty, strictly increasing in min_magnitude, with positive extents.
  static Result<GkTableWindow> from_entries(std::vector<GkTableEntry> entries,
                                            BelowTablePolicy below);

  // Highest threshold <= magnitude. Below the lowest threshold: clamp or out_of_range.
  [[nodiscard]] Result<Window> lookup(double magnitude) const;

  [[nodiscard]] const std::vector<GkTableEntry>& entries() const noexcept { return entries_; }
  [[nodiscard]] BelowTablePolicy below_policy() const noexcept { return below_; }

 private:
  GkTableWindow(std::vector<GkTableEntry> entries, BelowTablePolicy below);

  std::vector<GkTableEntry> entries_;
  BelowTablePolicy below_;
};

struct FixedWindow {
  Window window;
};

using WindowModel = std::variant<GkFormulaWindow, GkTableWindow, FixedWindow>;

[[nodiscard]] Window gk_formula_window(double magnitude) noexcept;

// Dispatch over the variant.
[[nodiscard]] Result<Window> window_for(const WindowModel& model, double magnitude);

const char* window_model_name(const WindowModel& model) noexcept;

// -----------------------------
// Scaled wrapper
// -----------------------------

// Multiplies both extents of any model by a fixed factor. The factor is
// validated once at construction; scale 1.0 returns the base window unchanged.
class ScaledWindowModel {
 public:
  static Result<ScaledWindowModel> create(WindowModel base, double scale);

  [[nodiscard]] Result<Window> window_for(double magnitude) const;

  [[nodiscard]] const WindowModel& base() const noexcept { return base_; }
  [[nodiscard]] double scale() const noexcept { return scale_; }

 private:
  ScaledWindowModel(WindowModel base, double scale) : base_(std::move(base)), scale_(scale) {}

  WindowModel base_;
  double scale_;
};

// Builds the scaled model a WindowConfig describes. kReasenberg has no window
// model and is rejected here.
Result<ScaledWindowModel> make_window_model(const WindowConfig& cfg);

}  // namespace qs
