#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <variant>
#include <vector>

#include "pool_timestamp.hpp"
#include "ports/errors/errors.hpp"

namespace pool_visualizer {

// Alternative order of ColumnData and CellValue follows this enum.
enum class ColumnType : int {
  Int64 = 0,
  Float64 = 1,
  String = 2,
  Timestamp = 3
};

const char* ColumnTypeName(ColumnType type);

using ColumnData =
    std::variant<std::vector<int64_t>, std::vector<double>,
                 std::vector<std::string>, std::vector<Timestamp>>;

using CellValue = std::variant<int64_t, double, std::string, Timestamp>;

using PoolRow = std::vector<CellValue>;

struct ColumnSpec {
  std::string name;
  ColumnType type;

  bool operator==(const ColumnSpec&) const = default;
};

class Schema {
 public:
  Schema() = default;
  explicit Schema(std::vector<ColumnSpec> columns);

  const std::vector<ColumnSpec>& Columns() const { return columns; }
  size_t Size() const { return columns.size(); }
  std::optional<size_t> IndexOf(std::string_view name) const;
  bool Has(std::string_view name) const { return IndexOf(name).has_value(); }

  // "Tag:string, DateTime:timestamp, ..." for error messages.
  std::string Describe() const;

  bool operator==(const Schema&) const = default;

 private:
  std::vector<ColumnSpec> columns;
};

// Column-oriented table with one typed vector per schema column.
class PoolTable {
 public:
  PoolTable() = default;
  explicit PoolTable(Schema schema);

  // Checks that every column matches its declared type and that all columns
  // have the same length.
  static std::tuple<PoolTable, error> Create(Schema schema,
                                             std::vector<ColumnData> columns);

  const Schema& GetSchema() const { return schema; }
  size_t RowCount() const;
  size_t ColumnCount() const { return columns.size(); }

  const ColumnData& Column(size_t index) const { return columns[index]; }

  // nullptr when the column is missing or holds another type.
  template <typename T>
  const std::vector<T>* ColumnAs(std::string_view name) const {
    auto index = schema.IndexOf(name);
    if (!index) return nullptr;
    return std::get_if<std::vector<T>>(&columns[*index]);
  }

  CellValue Cell(size_t column, size_t row) const;
  PoolRow Row(size_t row) const;

  // Numeric view of an Int64 or Float64 column.
  std::tuple<std::vector<double>, error> NumericColumn(
      std::string_view name) const;

  error AppendRow(const PoolRow& row);
  error AppendRows(const PoolTable& other);
  error AddColumn(ColumnSpec spec, ColumnData data);

  // Reorders every column so that new row i is old row order[i].
  void Permute(const std::vector<size_t>& order);

 private:
  Schema schema;
  std::vector<ColumnData> columns;
};

ColumnData EmptyColumn(ColumnType type);

}  // namespace pool_visualizer
