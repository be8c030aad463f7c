// pool_analyzer.cpp
#include "pool_analyzer.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <set>
#include <sstream>
#include <system_error>

#include "snapshot_parser.hpp"
#include "totals_synthesizer.hpp"

namespace pool_visualizer {

// ─────────────────────────────────────────────────────────────────────────────
// Construction / ingestion
// ─────────────────────────────────────────────────────────────────────────────

PoolAnalyzer::PoolAnalyzer()
    : logger(kvalog::CreateLogger("pool_visualizer", "pool_analyzer")) {}

std::tuple<std::vector<std::string>, error>
PoolAnalyzer::DiscoverSnapshotFiles(const std::string& directory) {
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::is_directory(directory, ec)) {
    return {std::vector<std::string>(),
            errors::New("not a directory: " + directory)};
  }

  std::vector<std::string> files;
  for (fs::directory_iterator it(directory, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (!it->is_regular_file(ec)) continue;
    if (it->path().filename().string().ends_with(snapshotSuffix)) {
      files.push_back(it->path().string());
    }
  }
  if (ec) {
    return {std::vector<std::string>(),
            errors::New("failed to list " + directory + ": " + ec.message())};
  }

  std::sort(files.begin(), files.end());
  return {files, nullptr};
}

error PoolAnalyzer::AddDirectory(const std::string& directory) {
  auto [files, err] = DiscoverSnapshotFiles(directory);
  if (err) {
    return err;
  }
  if (files.empty()) {
    logger.Warning("no_snapshot_files directory=" + directory);
  }

  for (const auto& file : files) {
    if (auto addErr = AddCsvFile(file)) {
      return addErr;
    }
  }
  return nullptr;
}

error PoolAnalyzer::AddCsvFile(const std::string& csvFile) {
  auto [snapshot, err] = SnapshotParser::ParseFile(csvFile);
  if (err) {
    logger.Error("snapshot_rejected file=" + csvFile +
                 " reason=" + err->What());
    return err;
  }

  size_t rows = snapshot.RowCount();
  if (auto addErr = AddSnapshot(std::move(snapshot))) {
    logger.Error("snapshot_rejected file=" + csvFile +
                 " reason=" + addErr->What());
    return errors::Wrap(addErr, csvFile);
  }

  logger.Info("snapshot_added file=" + csvFile +
              " rows=" + std::to_string(rows));
  return nullptr;
}

error PoolAnalyzer::AddSnapshot(PoolTable snapshot) {
  if (auto err = TotalsSynthesizer::AppendTotalsRow(snapshot)) {
    return err;
  }
  return aggregator.Add(std::move(snapshot));
}

error PoolAnalyzer::Digest() {
  size_t snapshots = aggregator.SnapshotCount();
  auto [digested, err] = aggregator.Digest();
  if (err) {
    logger.Error("digest_failed reason=" + err->What());
    return err;
  }

  dataset = std::move(digested);
  logger.Info("digest_completed snapshots=" + std::to_string(snapshots) +
              " rows=" + std::to_string(dataset->RowCount()) +
              " sort_column=" + dataset->SortColumn());
  return nullptr;
}

std::tuple<const PoolDataset*, error> PoolAnalyzer::Dataset() {
  if (!dataset) {
    if (auto err = Digest()) {
      return {nullptr, err};
    }
  }
  return {&*dataset, nullptr};
}

std::tuple<std::vector<std::string>, error> PoolAnalyzer::AllTags() {
  auto [data, err] = Dataset();
  if (err) {
    return {std::vector<std::string>(), err};
  }
  return {data->DistinctTags(), nullptr};
}

// ─────────────────────────────────────────────────────────────────────────────
// Tag selection
// ─────────────────────────────────────────────────────────────────────────────

std::tuple<TagSelection, error> PoolAnalyzer::SelectTags(
    const PlotOptions& options) {
  auto [data, err] = Dataset();
  if (err) {
    return {TagSelection(), err};
  }

  TagSelection selection;
  selection.tags.push_back(std::string(totalTag));

  std::vector<std::string> known = data->DistinctTags();
  for (const auto& tag : options.includeTags) {
    if (std::find(known.begin(), known.end(), tag) == known.end()) {
      logger.Warning("include_tag_missing tag=" + tag);
    }
    if (std::find(selection.tags.begin(), selection.tags.end(), tag) ==
        selection.tags.end()) {
      selection.tags.push_back(tag);
    }
  }

  const std::set<std::string> ignore(options.excludeTags.begin(),
                                     options.excludeTags.end());

  if (options.nMostChanged > 0) {
    auto ranked = TagRanker::ByEndpointDelta(*data, options.metric,
                                             options.nMostChanged, ignore,
                                             options.deltaMode);
    if (auto rankErr =
            addRanking(selection, "GREATEST INCREASE", std::move(ranked))) {
      return {TagSelection(), rankErr};
    }
  }
  if (options.nHighest > 0) {
    auto ranked =
        TagRanker::ByPeak(*data, options.metric, options.nHighest, ignore);
    if (auto rankErr =
            addRanking(selection, "HIGHEST PEAK USAGE", std::move(ranked))) {
      return {TagSelection(), rankErr};
    }
  }
  if (options.nHighestAverage > 0) {
    auto ranked = TagRanker::ByAverage(*data, options.metric,
                                       options.nHighestAverage, ignore);
    if (auto rankErr = addRanking(selection, "HIGHEST AVERAGE USAGE",
                                  std::move(ranked))) {
      return {TagSelection(), rankErr};
    }
  }

  return {std::move(selection), nullptr};
}

std::tuple<PlotData, error> PoolAnalyzer::BuildPlot(
    const PlotOptions& options) {
  auto [selection, err] = SelectTags(options);
  if (err) {
    return {PlotData(), err};
  }

  auto [data, dataErr] = Dataset();
  if (dataErr) {
    return {PlotData(), dataErr};
  }

  auto [table, pivotErr] = PivotView::Build(*data, selection.tags,
                                            options.timeColumn, options.metric);
  if (pivotErr) {
    return {PlotData(), pivotErr};
  }

  logger.Info("plot_built metric=" + table.metric + " tags=" +
              std::to_string(table.tags.size()) +
              " points=" + std::to_string(table.timestamps.size()));
  return {PlotData{std::move(selection), std::move(table)}, nullptr};
}

error PoolAnalyzer::addRanking(TagSelection& selection,
                               const std::string& description,
                               std::tuple<TagRanking, error> ranked) {
  auto& [ranking, err] = ranked;
  if (err) {
    return err;
  }

  for (const auto& score : ranking) {
    if (std::find(selection.tags.begin(), selection.tags.end(), score.tag) ==
        selection.tags.end()) {
      selection.tags.push_back(score.tag);
    }
  }

  std::ostringstream msg;
  msg << "tags_selected category=\"" << description << "\" count="
      << ranking.size();
  logger.Info(msg.str());

  selection.categories.push_back(
      SelectionCategory{description, std::move(ranking)});
  return nullptr;
}

// ─────────────────────────────────────────────────────────────────────────────
// Reporting
// ─────────────────────────────────────────────────────────────────────────────

void PoolAnalyzer::PrintSelectionReport(const TagSelection& selection,
                                        std::ostream& out) {
  for (const auto& category : selection.categories) {
    std::string names;
    for (size_t i = 0; i < category.ranking.size(); ++i) {
      if (i > 0) names += ", ";
      names += category.ranking[i].tag;
    }
    out << std::format("tags with {:25s}: [{}]", category.description, names)
        << std::endl;
  }
}

void PoolAnalyzer::Flush() { logger.Flush(); }

}  // namespace pool_visualizer
