// File: include/qs/core/io/catalog_source.hpp
#pragma once

#include <string>

#include "qs/core/io/record_table.hpp"
#include "qs/core/status.hpp"

namespace qs {

class ICatalogSource {
 public:
  virtual ~ICatalogSource() = default;

  // Returns:
  //  - OK and fills `out` with the whole catalog (header + rows)
  //  - not_found / io_error / corrupt_data on failure
  virtual Status read(RecordTable* out) = 0;

  virtual std::string name() const = 0;
};

}  // namespace qs
