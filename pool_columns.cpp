#include "pool_columns.hpp"

#include <algorithm>
#include <memory>

#include "pool_errors.hpp"

namespace pool_visualizer {

std::string_view ColumnName(MetricColumn metric) {
  switch (metric) {
    case MetricColumn::TotalUsedBytes:
      return "TotalUsedBytes";
    case MetricColumn::PagedDiff:
      return "PagedDiff";
    case MetricColumn::NonPagedDiff:
      return "NonPagedDiff";
    case MetricColumn::TotalDiff:
      return "TotalDiff";
    case MetricColumn::PagedUsedBytes:
      return "PagedUsedBytes";
    case MetricColumn::NonPagedUsedBytes:
      return "NonPagedUsedBytes";
  }
  return "TotalUsedBytes";
}

std::string_view ColumnName(TimeColumn time) {
  return time == TimeColumn::DateTimeUtc ? dateTimeUtcColumn
                                         : dateTimeColumn;
}

bool IsByteMetric(MetricColumn metric) {
  return ColumnName(metric).ends_with("Bytes");
}

bool IsKnownCounterColumn(std::string_view name) {
  return std::find(knownCounterColumns.begin(), knownCounterColumns.end(),
                   name) != knownCounterColumns.end();
}

std::tuple<MetricColumn, error> ParseMetricColumn(std::string_view name) {
  for (MetricColumn metric : allMetricColumns) {
    if (ColumnName(metric) == name) return {metric, nullptr};
  }
  return {MetricColumn::TotalUsedBytes,
          std::make_shared<InvalidSelectorError>("metric column",
                                                 std::string(name))};
}

std::tuple<TimeColumn, error> ParseTimeColumn(std::string_view name) {
  if (name == dateTimeColumn) return {TimeColumn::DateTime, nullptr};
  if (name == dateTimeUtcColumn) return {TimeColumn::DateTimeUtc, nullptr};
  return {TimeColumn::DateTime,
          std::make_shared<InvalidSelectorError>("timestamp column",
                                                 std::string(name))};
}

}  // namespace pool_visualizer
