#include "pivot_view.hpp"

#include <format>
#include <fstream>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <set>

#include "pool_errors.hpp"

namespace pool_visualizer {

std::tuple<WideTable, error> PivotView::Build(
    const PoolDataset& dataset, const std::vector<std::string>& tags,
    TimeColumn timeColumn, MetricColumn metric) {
  auto [values, err] = dataset.Table().NumericColumn(ColumnName(metric));
  if (err) {
    return {WideTable(), err};
  }

  const auto* times =
      dataset.Table().ColumnAs<Timestamp>(ColumnName(timeColumn));
  if (times == nullptr) {
    return {WideTable(), std::make_shared<InvalidSelectorError>(
                             "timestamp column",
                             std::string(ColumnName(timeColumn)))};
  }

  WideTable wide;
  wide.timeColumn = std::string(ColumnName(timeColumn));
  wide.metric = std::string(ColumnName(metric));

  if (IsByteMetric(metric)) {
    wide.scale = 1.0 / bytesPerMegabyte;
    wide.title = wide.metric + " (MB)";
    wide.format = ValueFormat::Decimal3;
  } else {
    wide.title = wide.metric + " (n_allocs)";
    wide.format = ValueFormat::Integer;
  }

  const auto& rowTags = dataset.Tags();
  const std::set<std::string> wanted(tags.begin(), tags.end());

  std::set<std::string> present;
  std::set<Timestamp> instants;
  for (size_t row = 0; row < rowTags.size(); ++row) {
    if (!wanted.count(rowTags[row])) continue;
    present.insert(rowTags[row]);
    instants.insert((*times)[row]);
  }

  wide.tags.assign(present.begin(), present.end());
  wide.timestamps.assign(instants.begin(), instants.end());

  std::map<std::string, size_t> tagIndex;
  for (size_t i = 0; i < wide.tags.size(); ++i) {
    tagIndex[wide.tags[i]] = i;
  }
  std::map<Timestamp, size_t> timeIndex;
  for (size_t i = 0; i < wide.timestamps.size(); ++i) {
    timeIndex[wide.timestamps[i]] = i;
  }

  wide.cells.assign(wide.timestamps.size(),
                    std::vector<std::optional<double>>(wide.tags.size()));
  for (size_t row = 0; row < rowTags.size(); ++row) {
    auto tag = tagIndex.find(rowTags[row]);
    if (tag == tagIndex.end()) continue;

    auto& cell = wide.cells[timeIndex.at((*times)[row])][tag->second];
    if (cell) {
      return {WideTable(), std::make_shared<DuplicateEntryError>(
                               rowTags[row], FormatTimestamp((*times)[row]))};
    }
    cell = values[row];
  }

  return {std::move(wide), nullptr};
}

const char* PivotView::FormatPattern(ValueFormat format) {
  return format == ValueFormat::Decimal3 ? "%.3f" : "%d";
}

std::string PivotView::FormatValue(double value, ValueFormat format) {
  if (format == ValueFormat::Decimal3) {
    return std::format("{:.3f}", value);
  }
  return std::format("{:.0f}", value);
}

error PivotView::WriteJson(const WideTable& table, const std::string& path) {
  std::ofstream file(path, std::ios::out | std::ios::trunc);
  if (!file.is_open()) {
    return errors::New("failed to open JSON output file: " + path);
  }

  nlohmann::json rows = nlohmann::json::array();
  for (size_t r = 0; r < table.timestamps.size(); ++r) {
    nlohmann::json values = nlohmann::json::array();
    for (const auto& cell : table.cells[r]) {
      if (cell) {
        values.push_back(*cell * table.scale);
      } else {
        values.push_back(nullptr);
      }
    }
    rows.push_back({{"timestamp", FormatTimestamp(table.timestamps[r])},
                    {"values", values}});
  }

  nlohmann::json doc = {{"title", table.title},
                        {"format", FormatPattern(table.format)},
                        {"time_column", table.timeColumn},
                        {"metric", table.metric},
                        {"tags", table.tags},
                        {"rows", rows}};

  file << doc.dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
       << "\n";
  file.flush();
  if (!file) {
    return errors::New("failed to write JSON output file: " + path);
  }
  return nullptr;
}

error PivotView::WriteCsv(const WideTable& table, const std::string& path) {
  std::ofstream file(path, std::ios::out | std::ios::trunc);
  if (!file.is_open()) {
    return errors::New("failed to open CSV output file: " + path);
  }

  file << table.timeColumn;
  for (const auto& tag : table.tags) {
    file << "," << tag;
  }
  file << "\n";

  for (size_t r = 0; r < table.timestamps.size(); ++r) {
    file << FormatTimestamp(table.timestamps[r], ' ');
    for (const auto& cell : table.cells[r]) {
      file << ",";
      if (cell) file << FormatValue(*cell * table.scale, table.format);
    }
    file << "\n";
  }

  file.flush();
  if (!file) {
    return errors::New("failed to write CSV output file: " + path);
  }
  return nullptr;
}

}  // namespace pool_visualizer
