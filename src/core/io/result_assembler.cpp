// File: src/core/io/result_assembler.cpp
#include "qs/core/io/result_assembler.hpp"

#include <iomanip>
#include <sstream>
#include <string>
#include <unordered_map>

namespace qs {
namespace {

std::string format_fixed(double v, int precision) {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(precision) << v;
  return ss.str();
}

// Parent magnitude as the parent's own row wrote it; events built in code have
// no input text and fall back to a short decimal form ("7", "6.45").
std::string parent_magnitude_field(const Attribution& a, const std::vector<Event>& events,
                                   const std::unordered_map<EventId, std::size_t>& by_id) {
  const auto it = by_id.find(a.parent_id);
  if (it != by_id.end() && !events[it->second].magnitude_text.empty()) {
    return events[it->second].magnitude_text;
  }
  std::ostringstream ss;
  ss << std::setprecision(6) << a.parent_magnitude;
  return ss.str();
}

}  // namespace

AssembledOutput assemble_result(const RecordTable& input, const std::vector<Event>& events,
                                const DeclusterResult& result, bool attribution) {
  AssembledOutput out;
  out.independent.header = input.header;
  out.dependent.header = input.header;
  if (attribution) {
    for (const char* c : kAttributionColumns) out.dependent.header.emplace_back(c);
  }

  out.independent.rows.reserve(result.independent.size());
  for (const std::size_t i : result.independent) {
    out.independent.rows.push_back(input.rows[events[i].source_row]);
  }

  std::unordered_map<EventId, std::size_t> by_id;
  if (attribution) {
    by_id.reserve(events.size());
    for (std::size_t i = 0; i < events.size(); ++i) by_id.emplace(events[i].id, i);
  }

  out.dependent.rows.reserve(result.dependent.size());
  for (const std::size_t i : result.dependent) {
    std::vector<std::string> row = input.rows[events[i].source_row];
    if (attribution) {
      // Short rows are padded so appended fields land under their headers.
      row.resize(input.header.size());
      const ClassificationState& st = result.states[i];
      if (st.attribution) {
        const Attribution& a = *st.attribution;
        row.push_back(a.parent_id);
        row.push_back(parent_magnitude_field(a, events, by_id));
        row.push_back(std::to_string(a.delta_t_s));
        row.push_back(format_fixed(a.distance_km, 3));
      } else {
        row.insert(row.end(), kAttributionColumns.size(), std::string());
      }
    }
    out.dependent.rows.push_back(std::move(row));
  }

  return out;
}

}  // namespace qs
