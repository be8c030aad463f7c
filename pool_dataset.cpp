#include "pool_dataset.hpp"

#include <unordered_set>
#include <utility>

#include "pool_columns.hpp"

namespace pool_visualizer {

PoolDataset::PoolDataset(PoolTable t, std::string sortCol)
    : table(std::move(t)), sortColumn(std::move(sortCol)) {}

const std::vector<std::string>& PoolDataset::Tags() const {
  static const std::vector<std::string> noTags;
  const auto* tags = table.ColumnAs<std::string>(tagColumn);
  return tags ? *tags : noTags;
}

const std::vector<Timestamp>& PoolDataset::Times(
    std::string_view column) const {
  static const std::vector<Timestamp> noTimes;
  const auto* times = table.ColumnAs<Timestamp>(column);
  return times ? *times : noTimes;
}

std::vector<std::string> PoolDataset::DistinctTags() const {
  std::vector<std::string> distinct;
  std::unordered_set<std::string> seen;
  for (const auto& tag : Tags()) {
    if (seen.insert(tag).second) distinct.push_back(tag);
  }
  return distinct;
}

}  // namespace pool_visualizer
