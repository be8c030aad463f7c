#include "pool_table.hpp"

#include <memory>
#include <sstream>
#include <type_traits>
#include <utility>

#include "pool_errors.hpp"

namespace pool_visualizer {

const char* ColumnTypeName(ColumnType type) {
  switch (type) {
    case ColumnType::Int64:
      return "int64";
    case ColumnType::Float64:
      return "float64";
    case ColumnType::String:
      return "string";
    case ColumnType::Timestamp:
      return "timestamp";
  }
  return "unknown";
}

ColumnData EmptyColumn(ColumnType type) {
  switch (type) {
    case ColumnType::Int64:
      return std::vector<int64_t>();
    case ColumnType::Float64:
      return std::vector<double>();
    case ColumnType::String:
      return std::vector<std::string>();
    case ColumnType::Timestamp:
      return std::vector<Timestamp>();
  }
  return std::vector<std::string>();
}

// ─────────────────────────────────────────────────────────────────────────────
// Schema
// ─────────────────────────────────────────────────────────────────────────────

Schema::Schema(std::vector<ColumnSpec> cols) : columns(std::move(cols)) {}

std::optional<size_t> Schema::IndexOf(std::string_view name) const {
  for (size_t i = 0; i < columns.size(); ++i) {
    if (columns[i].name == name) return i;
  }
  return std::nullopt;
}

std::string Schema::Describe() const {
  std::ostringstream out;
  for (size_t i = 0; i < columns.size(); ++i) {
    if (i > 0) out << ", ";
    out << columns[i].name << ":" << ColumnTypeName(columns[i].type);
  }
  return out.str();
}

// ─────────────────────────────────────────────────────────────────────────────
// PoolTable
// ─────────────────────────────────────────────────────────────────────────────

PoolTable::PoolTable(Schema s) : schema(std::move(s)) {
  columns.reserve(schema.Size());
  for (const auto& spec : schema.Columns()) {
    columns.push_back(EmptyColumn(spec.type));
  }
}

std::tuple<PoolTable, error> PoolTable::Create(
    Schema schema, std::vector<ColumnData> columns) {
  if (columns.size() != schema.Size()) {
    return {PoolTable(), errors::Errorf("table has {} columns, schema has {}",
                                        columns.size(), schema.Size())};
  }

  std::optional<size_t> rows;
  for (size_t i = 0; i < columns.size(); ++i) {
    const auto& spec = schema.Columns()[i];
    if (static_cast<ColumnType>(columns[i].index()) != spec.type) {
      return {PoolTable(),
              errors::Errorf("column {} holds {} values, schema says {}",
                             spec.name,
                             ColumnTypeName(static_cast<ColumnType>(
                                 columns[i].index())),
                             ColumnTypeName(spec.type))};
    }
    size_t size = std::visit([](const auto& v) { return v.size(); },
                             columns[i]);
    if (rows && *rows != size) {
      return {PoolTable(), errors::Errorf("column {} has {} rows, expected {}",
                                          spec.name, size, *rows)};
    }
    rows = size;
  }

  PoolTable table;
  table.schema = std::move(schema);
  table.columns = std::move(columns);
  return {std::move(table), nullptr};
}

size_t PoolTable::RowCount() const {
  if (columns.empty()) return 0;
  return std::visit([](const auto& v) { return v.size(); }, columns.front());
}

CellValue PoolTable::Cell(size_t column, size_t row) const {
  return std::visit([row](const auto& v) -> CellValue { return v[row]; },
                    columns[column]);
}

PoolRow PoolTable::Row(size_t row) const {
  PoolRow result;
  result.reserve(columns.size());
  for (size_t c = 0; c < columns.size(); ++c) {
    result.push_back(Cell(c, row));
  }
  return result;
}

std::tuple<std::vector<double>, error> PoolTable::NumericColumn(
    std::string_view name) const {
  auto index = schema.IndexOf(name);
  if (!index) {
    return {std::vector<double>(),
            std::make_shared<InvalidSelectorError>("column",
                                                   std::string(name))};
  }

  std::vector<double> values;
  if (const auto* ints = std::get_if<std::vector<int64_t>>(&columns[*index])) {
    values.assign(ints->begin(), ints->end());
  } else if (const auto* reals =
                 std::get_if<std::vector<double>>(&columns[*index])) {
    values = *reals;
  } else {
    std::string described = std::string(name) + " (" +
                            ColumnTypeName(schema.Columns()[*index].type) + ")";
    return {std::vector<double>(),
            std::make_shared<InvalidSelectorError>("numeric column",
                                                   described)};
  }
  return {std::move(values), nullptr};
}

error PoolTable::AppendRow(const PoolRow& row) {
  if (row.size() != columns.size()) {
    return errors::Errorf("row has {} values, table has {} columns",
                          row.size(), columns.size());
  }
  for (size_t c = 0; c < row.size(); ++c) {
    if (row[c].index() != columns[c].index()) {
      auto actual = static_cast<ColumnType>(row[c].index());
      return errors::Errorf("value for column {} is {}, expected {}",
                            schema.Columns()[c].name, ColumnTypeName(actual),
                            ColumnTypeName(schema.Columns()[c].type));
    }
  }

  for (size_t c = 0; c < row.size(); ++c) {
    std::visit(
        [&row, c](auto& v) {
          using T = typename std::decay_t<decltype(v)>::value_type;
          v.push_back(std::get<T>(row[c]));
        },
        columns[c]);
  }
  return nullptr;
}

error PoolTable::AppendRows(const PoolTable& other) {
  if (!(other.schema == schema)) {
    return std::make_shared<SchemaMismatchError>(
        "expected [" + schema.Describe() + "], got [" +
        other.schema.Describe() + "]");
  }

  for (size_t c = 0; c < columns.size(); ++c) {
    std::visit(
        [&other, c](auto& v) {
          using V = std::decay_t<decltype(v)>;
          const auto& src = std::get<V>(other.columns[c]);
          v.insert(v.end(), src.begin(), src.end());
        },
        columns[c]);
  }
  return nullptr;
}

error PoolTable::AddColumn(ColumnSpec spec, ColumnData data) {
  if (schema.Has(spec.name)) {
    return errors::New("column already exists: " + spec.name);
  }
  if (static_cast<ColumnType>(data.index()) != spec.type) {
    return errors::New("column data does not match type of " + spec.name);
  }
  size_t size = std::visit([](const auto& v) { return v.size(); }, data);
  if (!columns.empty() && size != RowCount()) {
    return errors::Errorf("column {} has {} rows, table has {}", spec.name,
                          size, RowCount());
  }

  std::vector<ColumnSpec> specs = schema.Columns();
  specs.push_back(std::move(spec));
  schema = Schema(std::move(specs));
  columns.push_back(std::move(data));
  return nullptr;
}

void PoolTable::Permute(const std::vector<size_t>& order) {
  for (auto& column : columns) {
    std::visit(
        [&order](auto& v) {
          std::decay_t<decltype(v)> reordered;
          reordered.reserve(order.size());
          for (size_t index : order) {
            reordered.push_back(std::move(v[index]));
          }
          v = std::move(reordered);
        },
        column);
  }
}

}  // namespace pool_visualizer
