#pragma once

#include <array>
#include <string>
#include <string_view>
#include <tuple>

#include "pool_table.hpp"
#include "ports/errors/errors.hpp"

namespace pool_visualizer {

inline constexpr std::string_view tagColumn = "Tag";
inline constexpr std::string_view dateTimeColumn = "DateTime";
inline constexpr std::string_view dateTimeUtcColumn = "DateTimeUTC";
inline constexpr std::string_view pagedDiffColumn = "PagedDiff";
inline constexpr std::string_view nonPagedDiffColumn = "NonPagedDiff";
inline constexpr std::string_view totalDiffColumn = "TotalDiff";

// Reserved tag of the synthesized per-snapshot row.
inline constexpr std::string_view totalTag = "TOTAL";

// Columns every snapshot file must carry, with their declared types.
inline const std::array<ColumnSpec, 3> requiredColumns = {{
    {std::string(tagColumn), ColumnType::String},
    {std::string(dateTimeColumn), ColumnType::Timestamp},
    {std::string(dateTimeUtcColumn), ColumnType::Timestamp},
}};

// Counter columns that are Int64 whenever a file carries them.
inline constexpr std::array<std::string_view, 5> knownCounterColumns = {
    "TotalUsedBytes", "PagedUsedBytes", "NonPagedUsedBytes", "PagedDiff",
    "NonPagedDiff"};

// Column the corpus is ordered by. Local time repeats an hour when clocks
// fall back, UTC does not.
inline constexpr std::string_view sortColumnName = dateTimeUtcColumn;

enum class MetricColumn {
  TotalUsedBytes,
  PagedDiff,
  NonPagedDiff,
  TotalDiff,
  PagedUsedBytes,
  NonPagedUsedBytes
};

enum class TimeColumn { DateTime, DateTimeUtc };

inline constexpr std::array<MetricColumn, 6> allMetricColumns = {
    MetricColumn::TotalUsedBytes, MetricColumn::PagedDiff,
    MetricColumn::NonPagedDiff,   MetricColumn::TotalDiff,
    MetricColumn::PagedUsedBytes, MetricColumn::NonPagedUsedBytes};

std::string_view ColumnName(MetricColumn metric);
std::string_view ColumnName(TimeColumn time);

// Byte metrics are charted in MB, everything else as allocation counts.
bool IsByteMetric(MetricColumn metric);

bool IsKnownCounterColumn(std::string_view name);

std::tuple<MetricColumn, error> ParseMetricColumn(std::string_view name);
std::tuple<TimeColumn, error> ParseTimeColumn(std::string_view name);

}  // namespace pool_visualizer
