#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "pool_table.hpp"

namespace pool_visualizer {

// Every snapshot row of a run, TOTAL rows included, in ascending timestamp
// order. Read-only once built.
class PoolDataset {
 public:
  PoolDataset() = default;
  PoolDataset(PoolTable table, std::string sortColumn);

  const PoolTable& Table() const { return table; }
  const Schema& GetSchema() const { return table.GetSchema(); }
  size_t RowCount() const { return table.RowCount(); }
  const std::string& SortColumn() const { return sortColumn; }

  const std::vector<std::string>& Tags() const;
  const std::vector<Timestamp>& Times(std::string_view column) const;

  // Distinct tags in order of first appearance.
  std::vector<std::string> DistinctTags() const;

 private:
  PoolTable table;
  std::string sortColumn;
};

}  // namespace pool_visualizer
