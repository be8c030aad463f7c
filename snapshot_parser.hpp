#pragma once

#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include "pool_table.hpp"
#include "ports/errors/errors.hpp"

namespace pool_visualizer {

// Reads one poolmon snapshot CSV into a typed table. Tag, DateTime and
// DateTimeUTC are mandatory; known counter columns must hold integers and any
// other column gets the narrowest type that fits all of its values.
class SnapshotParser {
 public:
  static std::tuple<PoolTable, error> ParseFile(const std::string& csvFile);

  // Parses already decoded UTF-8 text.
  static std::tuple<PoolTable, error> ParseText(std::string_view text);

 private:
  struct CsvRecord {
    size_t lineNumber;
    std::vector<std::string> fields;
  };

  static std::tuple<std::vector<CsvRecord>, error> splitRecords(
      std::string_view text);
  static std::tuple<std::vector<std::string>, error> splitFields(
      std::string_view line, size_t lineNumber);
  static ColumnType columnTypeFor(const std::string& name,
                                  const std::vector<CsvRecord>& rows,
                                  size_t column);
  static std::tuple<ColumnData, error> convertColumn(
      const ColumnSpec& spec, const std::vector<CsvRecord>& rows,
      size_t column);
};

}  // namespace pool_visualizer
