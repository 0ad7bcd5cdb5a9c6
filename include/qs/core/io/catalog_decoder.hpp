// File: include/qs/core/io/catalog_decoder.hpp
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "qs/core/config.hpp"
#include "qs/core/io/record_table.hpp"
#include "qs/core/status.hpp"
#include "qs/core/types.hpp"

namespace qs {

struct DecodedCatalog {
  std::vector<Event> events;  // input order; Event::source_row points back into the table

  std::size_t skipped_rows = 0;
  std::vector<std::string> skipped_reasons;  // first few, for the run log
};

// Maps table rows onto Events.
//
// A row is rejected when a required field is empty or unparseable, latitude is
// outside [-90, 90], longitude outside [-180, 180], magnitude <= 0, depth < 0,
// or its id repeats an earlier accepted row.
//  - strict: the first rejected row fails the call (parse_error / out_of_range)
//  - lenient: rejected rows are skipped and counted
// A missing required column always fails. The depth column is optional; empty
// depth decodes as 0.
Result<DecodedCatalog> decode_catalog(const RecordTable& table, const ColumnsConfig& columns,
                                      bool strict);

}  // namespace qs
