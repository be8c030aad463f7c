#include <iostream>

#include "pivot_view.hpp"
#include "pool_analyzer.hpp"
#include "visualizer_options.hpp"

using pool_visualizer::CommandLine;
using pool_visualizer::VisualizerConfig;

int main(int argc, char* argv[]) {
  VisualizerConfig config;
  bool helpRequested = false;
  if (auto err = CommandLine::Parse(argc, argv, config, helpRequested)) {
    std::cerr << "Error: " << err->What() << std::endl;
    CommandLine::PrintUsage(argv[0]);
    return 1;
  }
  if (helpRequested) {
    CommandLine::PrintUsage(argv[0]);
    return 0;
  }

  std::cout << "Reading snapshots from: " << config.directory << std::endl;

  pool_visualizer::PoolAnalyzer analyzer;
  if (auto err = analyzer.AddDirectory(config.directory)) {
    std::cerr << "Error: " << err->What() << std::endl;
    analyzer.Flush();
    return 1;
  }

  auto [plot, err] = analyzer.BuildPlot(config.plot);
  if (err) {
    std::cerr << "Error: " << err->What() << std::endl;
    analyzer.Flush();
    return 1;
  }

  pool_visualizer::PoolAnalyzer::PrintSelectionReport(plot.selection);
  std::cout << std::endl;
  std::cout << "Plot: " << plot.table.title << ", " << plot.table.tags.size()
            << " series, " << plot.table.timestamps.size() << " points"
            << std::endl;

  if (!config.outputJsonFile.empty()) {
    if (auto writeErr = pool_visualizer::PivotView::WriteJson(
            plot.table, config.outputJsonFile)) {
      std::cerr << "Error: " << writeErr->What() << std::endl;
      analyzer.Flush();
      return 1;
    }
    std::cout << "  - " << config.outputJsonFile << std::endl;
  }
  if (!config.outputCsvFile.empty()) {
    if (auto writeErr = pool_visualizer::PivotView::WriteCsv(
            plot.table, config.outputCsvFile)) {
      std::cerr << "Error: " << writeErr->What() << std::endl;
      analyzer.Flush();
      return 1;
    }
    std::cout << "  - " << config.outputCsvFile << std::endl;
  }

  analyzer.Flush();
  return 0;
}
