// File: include/qs/core/io/record_table.hpp
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace qs {

// Column-named string rows. Values are kept verbatim so that fields the engine
// does not read pass through untouched.
struct RecordTable {
  std::vector<std::string> header;
  std::vector<std::vector<std::string>> rows;

  [[nodiscard]] std::optional<std::size_t> column(const std::string& name) const {
    for (std::size_t i = 0; i < header.size(); ++i) {
      if (header[i] == name) return i;
    }
    return std::nullopt;
  }

  [[nodiscard]] std::size_t size() const noexcept { return rows.size(); }
  [[nodiscard]] bool empty() const noexcept { return rows.empty(); }
};

}  // namespace qs
