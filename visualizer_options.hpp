#pragma once

#include <iostream>
#include <string_view>

#include "pool_analyzer.hpp"
#include "ports/errors/errors.hpp"

namespace pool_visualizer {

// Command-line front end of the visualizer binary.
class CommandLine {
 public:
  // Fills config from argv. helpRequested is set when --help was given, in
  // which case config is left incomplete.
  static error Parse(int argc, const char* const argv[],
                     VisualizerConfig& config, bool& helpRequested);

  static void PrintUsage(const char* program, std::ostream& out = std::cout);

 private:
  static error parseCount(std::string_view flag, std::string_view text,
                          size_t& out);
};

}  // namespace pool_visualizer
