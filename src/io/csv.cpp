#include "catmatch/io/csv.h"

#include <fstream>
#include <sstream>

namespace catmatch::io {

std::optional<std::size_t> CsvTable::column_index(std::string_view name) const {
  for (std::size_t i = 0; i < header.size(); ++i) {
    if (header[i] == name) {
      return i;
    }
  }
  return std::nullopt;
}

namespace {

bool is_blank_row(const std::vector<std::string>& row) {
  return row.size() == 1 && row[0].empty();
}

}  // namespace

CsvResult parse_csv(std::string_view text) {
  constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";
  if (text.substr(0, kUtf8Bom.size()) == kUtf8Bom) {
    text.remove_prefix(kUtf8Bom.size());
  }

  std::vector<std::vector<std::string>> records;
  std::vector<std::string> row;
  std::string field;
  bool in_quotes = false;
  bool field_was_quoted = false;

  const auto end_field = [&]() {
    row.push_back(std::move(field));
    field.clear();
    field_was_quoted = false;
  };
  const auto end_row = [&]() {
    end_field();
    if (!is_blank_row(row)) {
      records.push_back(std::move(row));
    }
    row.clear();
  };

  for (std::size_t i = 0; i < text.size(); ++i) {
    const char ch = text[i];

    if (in_quotes) {
      if (ch == '"') {
        if (i + 1 < text.size() && text[i + 1] == '"') {
          field.push_back('"');
          ++i;  // Skip the escaped quote
        } else {
          in_quotes = false;
        }
      } else {
        field.push_back(ch);
      }
      continue;
    }

    switch (ch) {
      case '"':
        if (field.empty() && !field_was_quoted) {
          in_quotes = true;
          field_was_quoted = true;
        } else {
          field.push_back(ch);  // Stray quote inside an unquoted field is literal
        }
        break;
      case ',':
        end_field();
        break;
      case '\r':
        if (i + 1 < text.size() && text[i + 1] == '\n') {
          ++i;
        }
        end_row();
        break;
      case '\n':
        end_row();
        break;
      default:
        field.push_back(ch);
        break;
    }
  }

  if (in_quotes) {
    return CsvResult::err(IoError{"unterminated quoted field at end of input"});
  }

  if (!field.empty() || field_was_quoted || !row.empty()) {
    end_row();
  }

  if (records.empty()) {
    return CsvResult::err(IoError{"CSV input has no header row"});
  }

  CsvTable table;
  table.header = std::move(records.front());
  table.rows.reserve(records.size() - 1);
  for (std::size_t r = 1; r < records.size(); ++r) {
    auto& data_row = records[r];
    if (data_row.size() < table.header.size()) {
      data_row.resize(table.header.size());
    }
    table.rows.push_back(std::move(data_row));
  }

  return CsvResult::ok(std::move(table));
}

CsvResult read_csv_file(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return CsvResult::err(IoError{"Could not open file: " + path});
  }

  std::ostringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    return CsvResult::err(IoError{"Failed to read file: " + path});
  }

  auto result = parse_csv(buffer.str());
  if (!result.has_value()) {
    return CsvResult::err(IoError{path + ": " + result.error().message});
  }
  return result;
}

std::string escape_csv_field(std::string_view field) {
  if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
    return std::string(field);
  }

  std::string quoted = "\"";
  for (const char ch : field) {
    if (ch == '"') {
      quoted += "\"\"";
    } else {
      quoted.push_back(ch);
    }
  }
  quoted.push_back('"');
  return quoted;
}

}  // namespace catmatch::io
