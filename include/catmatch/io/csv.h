#pragma once

#include "catmatch/core/result.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace catmatch::io {

/// Error type for loading and writing failures
struct IoError {
  std::string message;
};

/// CsvTable is a header row plus data rows. Rows shorter than the header are
/// padded with empty cells when parsed.
struct CsvTable {
  std::vector<std::string> header;
  std::vector<std::vector<std::string>> rows;

  /// Index of the named column, or nullopt
  [[nodiscard]] std::optional<std::size_t> column_index(std::string_view name) const;
};

using CsvResult = core::Result<CsvTable, IoError>;

/// Parse RFC 4180 style CSV text:
/// - comma separated, double-quote quoting, "" escapes a quote inside quotes
/// - LF or CRLF line endings, quoted fields may span lines
/// - a leading UTF-8 byte order mark is skipped
/// - blank lines are ignored
/// An unterminated quoted field is an error.
[[nodiscard]] CsvResult parse_csv(std::string_view text);

/// Read and parse a CSV file
[[nodiscard]] CsvResult read_csv_file(const std::string& path);

/// Quote a field if it contains a comma, quote, CR or LF
[[nodiscard]] std::string escape_csv_field(std::string_view field);

}  // namespace catmatch::io
