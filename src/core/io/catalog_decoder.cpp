// File: src/core/io/catalog_decoder.cpp
#include "qs/core/io/catalog_decoder.hpp"

#include <charconv>
#include <cmath>
#include <optional>
#include <string_view>
#include <unordered_set>
#include <utility>

#include "qs/core/util/time_util.hpp"

namespace qs {
namespace {

constexpr std::size_t kMaxReasons = 20;

std::string_view trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
  return s;
}

std::optional<double> parse_double(std::string_view s) {
  s = trim(s);
  if (s.empty()) return std::nullopt;
  if (s.front() == '+') s.remove_prefix(1);
  double v = 0.0;
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc() || ptr != s.data() + s.size() || !std::isfinite(v)) return std::nullopt;
  return v;
}

struct ColumnIndex {
  std::size_t id = 0;
  std::size_t magnitude = 0;
  std::size_t time = 0;
  std::size_t latitude = 0;
  std::size_t longitude = 0;
  std::optional<std::size_t> depth;
};

Result<ColumnIndex> resolve_columns(const RecordTable& table, const ColumnsConfig& c) {
  ColumnIndex idx;
  std::string missing;
  auto need = [&](const std::string& name, std::size_t& out) {
    const auto col = table.column(name);
    if (col) {
      out = *col;
    } else {
      missing += (missing.empty() ? "" : ", ") + name;
    }
  };
  need(c.id, idx.id);
  need(c.magnitude, idx.magnitude);
  need(c.time, idx.time);
  need(c.latitude, idx.latitude);
  need(c.longitude, idx.longitude);
  if (!missing.empty()) {
    return Result<ColumnIndex>::err(
        Status::corrupt_data("input is missing required columns: " + missing));
  }
  if (!c.depth.empty()) idx.depth = table.column(c.depth);
  return Result<ColumnIndex>::ok(idx);
}

// Decodes one row. `row_no` is 1-based over data rows, for messages.
Result<Event> decode_row(const std::vector<std::string>& row, const ColumnIndex& idx,
                         const ColumnsConfig& names, std::size_t row_no) {
  const std::string where = "row " + std::to_string(row_no) + ": ";
  auto field = [&](std::size_t col) -> std::string_view {
    return col < row.size() ? trim(row[col]) : std::string_view{};
  };

  Event e;
  e.id = std::string(field(idx.id));
  if (e.id.empty()) return Result<Event>::err(Status::parse_error(where + "empty " + names.id));

  const auto mag = parse_double(field(idx.magnitude));
  if (!mag) return Result<Event>::err(Status::parse_error(where + "bad " + names.magnitude));
  if (*mag <= 0.0) {
    return Result<Event>::err(Status::out_of_range(where + names.magnitude + " must be > 0"));
  }
  e.magnitude = *mag;
  e.magnitude_text = std::string(field(idx.magnitude));

  auto t = parse_iso8601_utc(field(idx.time));
  if (!t.ok()) return Result<Event>::err(t.status().with_prefix(where));
  e.time = t.value();

  const auto lat = parse_double(field(idx.latitude));
  if (!lat) return Result<Event>::err(Status::parse_error(where + "bad " + names.latitude));
  if (*lat < -90.0 || *lat > 90.0) {
    return Result<Event>::err(Status::out_of_range(where + names.latitude + " outside [-90, 90]"));
  }
  const auto lon = parse_double(field(idx.longitude));
  if (!lon) return Result<Event>::err(Status::parse_error(where + "bad " + names.longitude));
  if (*lon < -180.0 || *lon > 180.0) {
    return Result<Event>::err(
        Status::out_of_range(where + names.longitude + " outside [-180, 180]"));
  }
  e.location = GeoPoint{*lat, *lon};

  if (idx.depth && !field(*idx.depth).empty()) {
    const auto depth = parse_double(field(*idx.depth));
    if (!depth) return Result<Event>::err(Status::parse_error(where + "bad " + names.depth));
    if (*depth < 0.0) {
      return Result<Event>::err(Status::out_of_range(where + names.depth + " must be >= 0"));
    }
    e.depth_km = *depth;
  }

  e.source_row = row_no - 1;
  return Result<Event>::ok(std::move(e));
}

}  // namespace

Result<DecodedCatalog> decode_catalog(const RecordTable& table, const ColumnsConfig& columns,
                                      bool strict) {
  auto idx_r = resolve_columns(table, columns);
  if (!idx_r.ok()) return Result<DecodedCatalog>::err(idx_r.status());
  const ColumnIndex idx = idx_r.value();

  DecodedCatalog out;
  out.events.reserve(table.rows.size());
  std::unordered_set<std::string> seen_ids;

  for (std::size_t r = 0; r < table.rows.size(); ++r) {
    auto ev = decode_row(table.rows[r], idx, columns, r + 1);

    Status reject = ev.status();
    if (reject.ok() && !seen_ids.insert(ev.value().id).second) {
      reject = Status::corrupt_data("row " + std::to_string(r + 1) + ": duplicate " + columns.id +
                                    " '" + ev.value().id + "'");
    }

    if (!reject.ok()) {
      if (strict) return Result<DecodedCatalog>::err(reject);
      ++out.skipped_rows;
      if (out.skipped_reasons.size() < kMaxReasons) out.skipped_reasons.push_back(reject.message());
      continue;
    }
    out.events.push_back(ev.take_value());
  }

  return Result<DecodedCatalog>::ok(std::move(out));
}

}  // namespace qs
