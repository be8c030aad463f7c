// pool_analyzer.hpp
#pragma once

#include <iostream>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include "corpus_aggregator.hpp"
#include "pivot_view.hpp"
#include "pool_columns.hpp"
#include "pool_dataset.hpp"
#include "ports/errors/errors.hpp"
#include "ports/kvalog/kvalog.hpp"
#include "tag_ranking.hpp"

namespace pool_visualizer {

struct PlotOptions {
  MetricColumn metric = MetricColumn::TotalUsedBytes;
  TimeColumn timeColumn = TimeColumn::DateTime;
  std::vector<std::string> includeTags;
  std::vector<std::string> excludeTags;
  size_t nMostChanged = 5;
  size_t nHighest = 5;
  size_t nHighestAverage = 5;
  DeltaMode deltaMode = DeltaMode::Percentage;
};

struct VisualizerConfig {
  std::string directory;
  PlotOptions plot;
  std::string outputJsonFile;
  std::string outputCsvFile;
};

struct SelectionCategory {
  std::string description;
  TagRanking ranking;
};

struct TagSelection {
  // TOTAL first, then include tags, then ranked tags in first-seen order.
  std::vector<std::string> tags;
  std::vector<SelectionCategory> categories;
};

struct PlotData {
  TagSelection selection;
  WideTable table;
};

// Owns one run: snapshots are added, digested once, and then queried.
class PoolAnalyzer {
 public:
  static constexpr const char* snapshotSuffix = "pool.csv";

  PoolAnalyzer();

  // Regular files in directory whose name ends in "pool.csv", sorted.
  static std::tuple<std::vector<std::string>, error> DiscoverSnapshotFiles(
      const std::string& directory);

  error AddDirectory(const std::string& directory);
  error AddCsvFile(const std::string& csvFile);

  // Appends the TOTAL row and hands the snapshot to the aggregator.
  error AddSnapshot(PoolTable snapshot);

  error Digest();
  bool Digested() const { return dataset.has_value(); }

  // Digests on first use.
  std::tuple<const PoolDataset*, error> Dataset();
  std::tuple<std::vector<std::string>, error> AllTags();

  std::tuple<TagSelection, error> SelectTags(const PlotOptions& options);
  std::tuple<PlotData, error> BuildPlot(const PlotOptions& options);

  static void PrintSelectionReport(const TagSelection& selection,
                                   std::ostream& out = std::cout);

  void Flush();

 private:
  kvalog::Logger logger;
  CorpusAggregator aggregator;
  std::optional<PoolDataset> dataset;

  error addRanking(TagSelection& selection, const std::string& description,
                   std::tuple<TagRanking, error> ranked);
};

}  // namespace pool_visualizer
