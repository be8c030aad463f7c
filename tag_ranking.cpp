#include "tag_ranking.hpp"

#include <algorithm>
#include <numeric>

namespace pool_visualizer {

std::tuple<TagRanking, error> TagRanker::ByPeak(
    const PoolDataset& dataset, MetricColumn metric, size_t nTags,
    const std::set<std::string>& ignoreTags) {
  auto [series, err] = groupByTag(dataset, metric, ignoreTags);
  if (err) {
    return {TagRanking(), err};
  }

  std::map<std::string, double> scores;
  for (const auto& [tag, values] : series) {
    scores[tag] = *std::max_element(values.begin(), values.end());
  }
  return {topN(scores, nTags), nullptr};
}

std::tuple<TagRanking, error> TagRanker::ByEndpointDelta(
    const PoolDataset& dataset, MetricColumn metric, size_t nTags,
    const std::set<std::string>& ignoreTags, DeltaMode mode) {
  auto [series, err] = groupByTag(dataset, metric, ignoreTags);
  if (err) {
    return {TagRanking(), err};
  }

  std::map<std::string, double> scores;
  for (const auto& [tag, values] : series) {
    double first = values.front();
    double last = values.back();
    if (mode == DeltaMode::Absolute) {
      scores[tag] = last - first;
    } else {
      scores[tag] = ((last - first) * 100.0) / (last + percentageEpsilon);
    }
  }
  return {topN(scores, nTags), nullptr};
}

std::tuple<TagRanking, error> TagRanker::ByAverage(
    const PoolDataset& dataset, MetricColumn metric, size_t nTags,
    const std::set<std::string>& ignoreTags) {
  auto [series, err] = groupByTag(dataset, metric, ignoreTags);
  if (err) {
    return {TagRanking(), err};
  }

  std::map<std::string, double> scores;
  for (const auto& [tag, values] : series) {
    double sum = std::accumulate(values.begin(), values.end(), 0.0);
    scores[tag] = sum / static_cast<double>(values.size());
  }
  return {topN(scores, nTags), nullptr};
}

std::vector<std::string> TagRanker::Names(const TagRanking& ranking) {
  std::vector<std::string> names;
  names.reserve(ranking.size());
  for (const auto& score : ranking) {
    names.push_back(score.tag);
  }
  return names;
}

std::tuple<TagRanker::TagSeries, error> TagRanker::groupByTag(
    const PoolDataset& dataset, MetricColumn metric,
    const std::set<std::string>& ignoreTags) {
  auto [values, err] = dataset.Table().NumericColumn(ColumnName(metric));
  if (err) {
    return {TagSeries(), err};
  }

  // Local copy, the caller's set is never modified.
  std::set<std::string> ignored = ignoreTags;
  ignored.insert(std::string(totalTag));

  const auto& tags = dataset.Tags();
  TagSeries series;
  for (size_t row = 0; row < tags.size(); ++row) {
    if (ignored.count(tags[row])) continue;
    series[tags[row]].push_back(values[row]);
  }
  return {std::move(series), nullptr};
}

TagRanking TagRanker::topN(const std::map<std::string, double>& scores,
                           size_t nTags) {
  TagRanking ranking;
  ranking.reserve(scores.size());
  for (const auto& [tag, value] : scores) {
    ranking.push_back(TagScore{tag, value});
  }

  // Map order is by name, so the stable sort leaves equal scores by name.
  std::stable_sort(ranking.begin(), ranking.end(),
                   [](const TagScore& a, const TagScore& b) {
                     return a.value > b.value;
                   });
  if (ranking.size() > nTags) {
    ranking.resize(nTags);
  }
  return ranking;
}

}  // namespace pool_visualizer
