// File: include/qs/core/io/result_assembler.hpp
#pragma once

#include <array>
#include <vector>

#include "qs/core/io/record_table.hpp"
#include "qs/core/types.hpp"

namespace qs {

// Appended to dependent rows when attribution is requested, in this order.
inline constexpr std::array<const char*, 4> kAttributionColumns = {
    "parent_id", "parent_magnitude", "delta_t_seconds", "delta_distance_km"};

struct AssembledOutput {
  RecordTable independent;
  RecordTable dependent;
};

// Re-projects a classification onto the input rows. Rows keep input order and
// every input field verbatim. With `attribution` set, the dependent table's
// header and rows gain kAttributionColumns; the independent table never does.
// No classification happens here.
AssembledOutput assemble_result(const RecordTable& input, const std::vector<Event>& events,
                                const DeclusterResult& result, bool attribution);

}  // namespace qs
