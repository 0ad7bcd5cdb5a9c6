// File: src/adapters/csv/csv_catalog_source.cpp
#include "qs/adapters/csv/csv_catalog_source.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <utility>

namespace qs {
namespace {

bool row_is_blank(const std::vector<std::string>& row) {
  return row.size() == 1 && row.front().empty();
}

bool needs_quotes(const std::string& s, char delimiter) {
  for (char c : s) {
    if (c == delimiter || c == '"' || c == '\n' || c == '\r') return true;
  }
  return false;
}

void write_field(std::ostream& os, const std::string& s, char delimiter) {
  if (!needs_quotes(s, delimiter)) {
    os << s;
    return;
  }
  os << '"';
  for (char c : s) {
    if (c == '"') os << '"';
    os << c;
  }
  os << '"';
}

}  // namespace

Status parse_csv(const std::string& text, char delimiter, RecordTable* out) {
  if (!out) return Status::invalid_argument("parse_csv: out is null");
  out->header.clear();
  out->rows.clear();

  std::size_t pos = 0;
  if (text.compare(0, 3, "\xEF\xBB\xBF") == 0) pos = 3;

  std::vector<std::vector<std::string>> rows;
  std::vector<std::string> row;
  std::string field;
  bool in_quotes = false;
  bool field_was_quoted = false;
  std::size_t line = 1;

  auto end_row = [&]() {
    row.push_back(std::move(field));
    field.clear();
    field_was_quoted = false;
    if (!row_is_blank(row)) rows.push_back(std::move(row));
    row.clear();
  };

  for (; pos < text.size(); ++pos) {
    const char c = text[pos];
    if (in_quotes) {
      if (c == '"') {
        if (pos + 1 < text.size() && text[pos + 1] == '"') {
          field.push_back('"');
          ++pos;
        } else {
          in_quotes = false;
        }
      } else {
        if (c == '\n') ++line;
        field.push_back(c);
      }
      continue;
    }

    if (c == '"') {
      if (!field.empty() || field_was_quoted) {
        return Status::corrupt_data("csv line " + std::to_string(line) + ": stray quote");
      }
      in_quotes = true;
      field_was_quoted = true;
    } else if (c == delimiter) {
      row.push_back(std::move(field));
      field.clear();
      field_was_quoted = false;
    } else if (c == '\r') {
      // CRLF: the '\n' ends the row.
    } else if (c == '\n') {
      end_row();
      ++line;
    } else {
      field.push_back(c);
    }
  }
  if (in_quotes) return Status::corrupt_data("csv: unterminated quoted field");
  if (!field.empty() || field_was_quoted || !row.empty()) end_row();

  if (rows.empty()) return Status::corrupt_data("csv: missing header row");

  out->header = std::move(rows.front());
  out->rows.assign(std::make_move_iterator(rows.begin() + 1), std::make_move_iterator(rows.end()));
  return Status::ok_status();
}

CsvCatalogSource::CsvCatalogSource(CsvSourceConfig cfg) : cfg_(std::move(cfg)) {}

Status CsvCatalogSource::read(RecordTable* out) {
  namespace fs = std::filesystem;
  if (!out) return Status::invalid_argument("CsvCatalogSource::read: out is null");
  if (cfg_.path.empty()) return Status::invalid_argument("CsvCatalogSource: path is empty");

  std::error_code ec;
  if (!fs::exists(cfg_.path, ec)) {
    return Status::not_found("CsvCatalogSource: file not found: " + cfg_.path);
  }

  std::ifstream f(cfg_.path, std::ios::binary);
  if (!f.is_open()) return Status::io_error("CsvCatalogSource: failed to open " + cfg_.path);

  std::ostringstream ss;
  ss << f.rdbuf();
  if (f.bad()) return Status::io_error("CsvCatalogSource: read failed: " + cfg_.path);

  const Status s = parse_csv(ss.str(), cfg_.delimiter, out);
  return s.with_prefix(cfg_.path + ": ");
}

Status write_csv(const std::string& path, const RecordTable& table, char delimiter) {
  namespace fs = std::filesystem;

  const fs::path p(path);
  if (p.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(p.parent_path(), ec);
    if (ec) {
      return Status::io_error("failed creating directory for '" + path + "': " + ec.message());
    }
  }

  std::ofstream f(path, std::ios::out | std::ios::trunc | std::ios::binary);
  if (!f.is_open()) return Status::io_error("failed opening '" + path + "'");

  auto write_row = [&](const std::vector<std::string>& row) {
    for (std::size_t i = 0; i < row.size(); ++i) {
      if (i > 0) f << delimiter;
      write_field(f, row[i], delimiter);
    }
    f << "\n";
  };

  write_row(table.header);
  for (const auto& row : table.rows) write_row(row);

  f.flush();
  if (!f.good()) return Status::io_error("failed writing to '" + path + "'");
  return Status::ok_status();
}

}  // namespace qs
