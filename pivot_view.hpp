#pragma once

#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include "pool_columns.hpp"
#include "pool_dataset.hpp"
#include "ports/errors/errors.hpp"

namespace pool_visualizer {

// Number format the renderer should use for the value axis.
enum class ValueFormat { Integer, Decimal3 };

// One column per tag, one row per distinct timestamp. A tag without a sample
// at some timestamp leaves an empty cell. Cells hold the metric as recorded;
// scale converts them to the unit named in the title.
struct WideTable {
  std::string title;
  ValueFormat format = ValueFormat::Integer;
  double scale = 1.0;
  std::string timeColumn;
  std::string metric;
  std::vector<std::string> tags;
  std::vector<Timestamp> timestamps;
  std::vector<std::vector<std::optional<double>>> cells;  // [row][tag]
};

class PivotView {
 public:
  static constexpr double bytesPerMegabyte = 1024.0 * 1024.0;

  // Byte metrics are charted in MB, allocation counts as they are. Requested
  // tags that never occur in the dataset are dropped.
  static std::tuple<WideTable, error> Build(
      const PoolDataset& dataset, const std::vector<std::string>& tags,
      TimeColumn timeColumn, MetricColumn metric);

  static const char* FormatPattern(ValueFormat format);
  static std::string FormatValue(double value, ValueFormat format);

  static error WriteJson(const WideTable& table, const std::string& path);
  static error WriteCsv(const WideTable& table, const std::string& path);
};

}  // namespace pool_visualizer
