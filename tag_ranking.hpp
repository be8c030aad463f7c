#pragma once

#include <map>
#include <set>
#include <string>
#include <tuple>
#include <vector>

#include "pool_columns.hpp"
#include "pool_dataset.hpp"
#include "ports/errors/errors.hpp"

namespace pool_visualizer {

enum class DeltaMode { Absolute, Percentage };

struct TagScore {
  std::string tag;
  double value = 0.0;
};

using TagRanking = std::vector<TagScore>;

// Top-N tag selection over an aggregated dataset. The TOTAL tag and every tag
// in ignoreTags are left out; results are ordered by score descending with
// ties broken by tag name.
class TagRanker {
 public:
  // Keeps (last - first) * 100 / (last + eps) finite when last is zero.
  static constexpr double percentageEpsilon = 0.001;

  // Highest value a tag ever reached.
  static std::tuple<TagRanking, error> ByPeak(
      const PoolDataset& dataset, MetricColumn metric, size_t nTags,
      const std::set<std::string>& ignoreTags);

  // Change between a tag's first and last row in timestamp order.
  static std::tuple<TagRanking, error> ByEndpointDelta(
      const PoolDataset& dataset, MetricColumn metric, size_t nTags,
      const std::set<std::string>& ignoreTags, DeltaMode mode);

  static std::tuple<TagRanking, error> ByAverage(
      const PoolDataset& dataset, MetricColumn metric, size_t nTags,
      const std::set<std::string>& ignoreTags);

  static std::vector<std::string> Names(const TagRanking& ranking);

 private:
  using TagSeries = std::map<std::string, std::vector<double>>;

  static std::tuple<TagSeries, error> groupByTag(
      const PoolDataset& dataset, MetricColumn metric,
      const std::set<std::string>& ignoreTags);
  static TagRanking topN(const std::map<std::string, double>& scores,
                         size_t nTags);
};

}  // namespace pool_visualizer
