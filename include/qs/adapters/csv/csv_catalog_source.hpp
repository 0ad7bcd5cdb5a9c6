// File: include/qs/adapters/csv/csv_catalog_source.hpp
#pragma once

#include <string>
#include <vector>

#include "qs/core/io/catalog_source.hpp"

namespace qs {

struct CsvSourceConfig {
  std::string path;
  char delimiter{','};
};

// Reads a header + rows CSV (RFC 4180 quoting, CRLF or LF line ends, optional
// UTF-8 BOM). Blank lines are ignored.
class CsvCatalogSource final : public ICatalogSource {
 public:
  explicit CsvCatalogSource(CsvSourceConfig cfg);

  Status read(RecordTable* out) override;

  std::string name() const override { return "csv"; }

 private:
  CsvSourceConfig cfg_;
};

// Parses CSV text already in memory. Used by read() and handy in tests.
Status parse_csv(const std::string& text, char delimiter, RecordTable* out);

// Writes `table` to `path` (truncating), quoting fields that need it.
Status write_csv(const std::string& path, const RecordTable& table, char delimiter = ',');

}  // namespace qs
