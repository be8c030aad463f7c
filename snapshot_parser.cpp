#include "snapshot_parser.hpp"

#include <charconv>
#include <iterator>
#include <limits>
#include <memory>
#include <set>

#include "encoding_sniffer.hpp"
#include "pool_columns.hpp"
#include "pool_errors.hpp"

namespace pool_visualizer {

namespace {

bool parseInt64(std::string_view text, int64_t& value) {
  if (text.size() > 1 && text[0] == '+' && text[1] != '-') {
    text.remove_prefix(1);
  }
  if (text.empty()) return false;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(),
                                   value);
  return ec == std::errc() && ptr == text.data() + text.size();
}

bool parseDouble(std::string_view text, double& value) {
  if (text.size() > 1 && text[0] == '+' && text[1] != '-') {
    text.remove_prefix(1);
  }
  if (text.empty()) return false;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(),
                                   value);
  return ec == std::errc() && ptr == text.data() + text.size();
}

}  // namespace

std::tuple<PoolTable, error> SnapshotParser::ParseFile(
    const std::string& csvFile) {
  auto [text, err] = EncodingSniffer::ReadTextFile(csvFile);
  if (err) {
    return {PoolTable(), err};
  }

  auto [table, parseErr] = ParseText(text);
  if (parseErr) {
    return {PoolTable(), errors::Wrap(parseErr, csvFile)};
  }
  return {std::move(table), nullptr};
}

std::tuple<PoolTable, error> SnapshotParser::ParseText(std::string_view text) {
  auto [records, err] = splitRecords(text);
  if (err) {
    return {PoolTable(), err};
  }
  if (records.empty()) {
    return {PoolTable(), errors::New("CSV file is empty")};
  }

  const std::vector<std::string>& header = records.front().fields;
  std::vector<CsvRecord> rows(std::make_move_iterator(records.begin() + 1),
                              std::make_move_iterator(records.end()));

  std::set<std::string> seen;
  for (const auto& name : header) {
    if (!seen.insert(name).second) {
      return {PoolTable(), std::make_shared<SchemaMismatchError>(
                               "duplicate column " + name)};
    }
  }
  for (const auto& required : requiredColumns) {
    if (!seen.count(required.name)) {
      return {PoolTable(), std::make_shared<SchemaMismatchError>(
                               "missing required column " + required.name)};
    }
  }

  for (const auto& row : rows) {
    if (row.fields.size() != header.size()) {
      return {PoolTable(),
              errors::Errorf("line {}: expected {} fields, found {}",
                             row.lineNumber, header.size(), row.fields.size())};
    }
  }

  std::vector<ColumnSpec> specs;
  std::vector<ColumnData> columns;
  specs.reserve(header.size());
  columns.reserve(header.size());

  for (size_t c = 0; c < header.size(); ++c) {
    ColumnSpec spec{header[c], columnTypeFor(header[c], rows, c)};
    auto [data, convErr] = convertColumn(spec, rows, c);
    if (convErr) {
      return {PoolTable(), convErr};
    }
    specs.push_back(std::move(spec));
    columns.push_back(std::move(data));
  }

  return PoolTable::Create(Schema(std::move(specs)), std::move(columns));
}

std::tuple<std::vector<SnapshotParser::CsvRecord>, error>
SnapshotParser::splitRecords(std::string_view text) {
  std::vector<CsvRecord> records;
  size_t lineNumber = 0;

  while (!text.empty()) {
    size_t end = text.find('\n');
    std::string_view line = text.substr(0, end);
    text = end == std::string_view::npos ? std::string_view()
                                         : text.substr(end + 1);
    ++lineNumber;

    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    if (line.empty()) continue;

    auto [fields, err] = splitFields(line, lineNumber);
    if (err) {
      return {std::vector<CsvRecord>(), err};
    }
    records.push_back(CsvRecord{lineNumber, std::move(fields)});
  }

  return {std::move(records), nullptr};
}

std::tuple<std::vector<std::string>, error> SnapshotParser::splitFields(
    std::string_view line, size_t lineNumber) {
  std::vector<std::string> fields;
  std::string field;
  bool quoted = false;

  for (size_t i = 0; i < line.size(); ++i) {
    char ch = line[i];
    if (quoted) {
      if (ch == '"' && i + 1 < line.size() && line[i + 1] == '"') {
        field += '"';
        ++i;
      } else if (ch == '"') {
        quoted = false;
      } else {
        field += ch;
      }
    } else if (ch == '"') {
      quoted = true;
    } else if (ch == ',') {
      fields.push_back(std::move(field));
      field.clear();
    } else {
      field += ch;
    }
  }

  if (quoted) {
    return {std::vector<std::string>(),
            errors::Errorf("line {}: unterminated quoted field", lineNumber)};
  }
  fields.push_back(std::move(field));
  return {std::move(fields), nullptr};
}

ColumnType SnapshotParser::columnTypeFor(const std::string& name,
                                         const std::vector<CsvRecord>& rows,
                                         size_t column) {
  for (const auto& required : requiredColumns) {
    if (required.name == name) return required.type;
  }
  if (IsKnownCounterColumn(name)) return ColumnType::Int64;

  bool allInts = true;
  bool allNumbers = true;
  for (const auto& row : rows) {
    const std::string& value = row.fields[column];
    int64_t i;
    double d;
    if (value.empty()) {
      allInts = false;
      continue;
    }
    if (allInts && parseInt64(value, i)) continue;
    allInts = false;
    if (!parseDouble(value, d)) {
      allNumbers = false;
      break;
    }
  }

  if (allInts) return ColumnType::Int64;
  if (allNumbers) return ColumnType::Float64;
  return ColumnType::String;
}

std::tuple<ColumnData, error> SnapshotParser::convertColumn(
    const ColumnSpec& spec, const std::vector<CsvRecord>& rows,
    size_t column) {
  switch (spec.type) {
    case ColumnType::Int64: {
      std::vector<int64_t> values;
      values.reserve(rows.size());
      for (const auto& row : rows) {
        int64_t value;
        if (!parseInt64(row.fields[column], value)) {
          return {ColumnData(),
                  errors::Errorf("line {}: {} value \"{}\" is not an integer",
                                 row.lineNumber, spec.name,
                                 row.fields[column])};
        }
        values.push_back(value);
      }
      return {std::move(values), nullptr};
    }

    case ColumnType::Float64: {
      std::vector<double> values;
      values.reserve(rows.size());
      for (const auto& row : rows) {
        double value = std::numeric_limits<double>::quiet_NaN();
        if (!row.fields[column].empty() &&
            !parseDouble(row.fields[column], value)) {
          return {ColumnData(),
                  errors::Errorf("line {}: {} value \"{}\" is not a number",
                                 row.lineNumber, spec.name,
                                 row.fields[column])};
        }
        values.push_back(value);
      }
      return {std::move(values), nullptr};
    }

    case ColumnType::Timestamp: {
      std::vector<Timestamp> values;
      values.reserve(rows.size());
      for (const auto& row : rows) {
        auto value = ParseTimestamp(row.fields[column]);
        if (!value) {
          return {ColumnData(), std::make_shared<TimestampParseError>(
                                    spec.name, row.fields[column],
                                    row.lineNumber)};
        }
        values.push_back(*value);
      }
      return {std::move(values), nullptr};
    }

    case ColumnType::String: {
      std::vector<std::string> values;
      values.reserve(rows.size());
      for (const auto& row : rows) {
        values.push_back(row.fields[column]);
      }
      return {std::move(values), nullptr};
    }
  }

  return {ColumnData(), errors::New("unsupported column type")};
}

}  // namespace pool_visualizer
