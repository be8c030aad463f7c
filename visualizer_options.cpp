#include "visualizer_options.hpp"

#include <charconv>
#include <string>
#include <vector>

#include "pool_columns.hpp"

namespace pool_visualizer {

void CommandLine::PrintUsage(const char* program, std::ostream& out) {
  out << "Usage: " << program << " -d <directory> -t <column> [options]\n"
      << "  -d,   --directory <dir>                 directory with *pool.csv "
         "files (required)\n"
      << "  -t,   --type <column>                   TotalUsedBytes, PagedDiff, "
         "NonPagedDiff, TotalDiff, PagedUsedBytes, NonPagedUsedBytes "
         "(required)\n"
      << "  -ts,  --time-stamp <column>             DateTime or DateTimeUTC\n"
      << "  -it,  --include-tags <tag>...           tags that must be plotted\n"
      << "  -et,  --exclude-tags <tag>...           tags that are never "
         "ranked\n"
      << "  -nmc, --n-most-changed-tags <n>         default 5\n"
      << "  -nh,  --n-highest-usage-tags <n>        default 5\n"
      << "  -nha, --n-highest-average-usage-tags <n> default 5\n"
      << "        --delta-mode <absolute|percentage> default percentage\n"
      << "        --json <file>                     write the plot table as "
         "JSON\n"
      << "        --csv <file>                      write the plot table as "
         "CSV\n";
}

error CommandLine::parseCount(std::string_view flag, std::string_view text,
                              size_t& out) {
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return errors::New("invalid value for " + std::string(flag) + ": " +
                       std::string(text));
  }
  return nullptr;
}

error CommandLine::Parse(int argc, const char* const argv[],
                         VisualizerConfig& config, bool& helpRequested) {
  helpRequested = false;
  bool haveDirectory = false;
  bool haveType = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg(argv[i]);
    auto needValue = [&]() -> const char* {
      return i + 1 < argc ? argv[++i] : nullptr;
    };
    auto collectTags = [&](std::vector<std::string>& tags) {
      while (i + 1 < argc && argv[i + 1][0] != '-') {
        tags.emplace_back(argv[++i]);
      }
    };

    if (arg == "--help" || arg == "-h") {
      helpRequested = true;
      return nullptr;
    } else if (arg == "-d" || arg == "--directory") {
      const char* value = needValue();
      if (!value) return errors::New(arg + " requires a value");
      config.directory = value;
      haveDirectory = true;
    } else if (arg == "-t" || arg == "--type") {
      const char* value = needValue();
      if (!value) return errors::New(arg + " requires a value");
      auto [metric, err] = ParseMetricColumn(value);
      if (err) return err;
      config.plot.metric = metric;
      haveType = true;
    } else if (arg == "-ts" || arg == "--time-stamp") {
      const char* value = needValue();
      if (!value) return errors::New(arg + " requires a value");
      auto [column, err] = ParseTimeColumn(value);
      if (err) return err;
      config.plot.timeColumn = column;
    } else if (arg == "-it" || arg == "--include-tags") {
      collectTags(config.plot.includeTags);
    } else if (arg == "-et" || arg == "--exclude-tags") {
      collectTags(config.plot.excludeTags);
    } else if (arg == "-nmc" || arg == "--n-most-changed-tags") {
      const char* value = needValue();
      if (!value) return errors::New(arg + " requires a value");
      if (auto err = parseCount(arg, value, config.plot.nMostChanged)) {
        return err;
      }
    } else if (arg == "-nh" || arg == "--n-highest-usage-tags") {
      const char* value = needValue();
      if (!value) return errors::New(arg + " requires a value");
      if (auto err = parseCount(arg, value, config.plot.nHighest)) {
        return err;
      }
    } else if (arg == "-nha" || arg == "--n-highest-average-usage-tags") {
      const char* value = needValue();
      if (!value) return errors::New(arg + " requires a value");
      if (auto err = parseCount(arg, value, config.plot.nHighestAverage)) {
        return err;
      }
    } else if (arg == "--delta-mode") {
      const std::string value = needValue() ? argv[i] : "";
      if (value == "absolute") {
        config.plot.deltaMode = DeltaMode::Absolute;
      } else if (value == "percentage") {
        config.plot.deltaMode = DeltaMode::Percentage;
      } else {
        return errors::New("invalid value for --delta-mode: " + value);
      }
    } else if (arg == "--json") {
      const char* value = needValue();
      if (!value) return errors::New(arg + " requires a value");
      config.outputJsonFile = value;
    } else if (arg == "--csv") {
      const char* value = needValue();
      if (!value) return errors::New(arg + " requires a value");
      config.outputCsvFile = value;
    } else {
      return errors::New("unknown argument: " + arg);
    }
  }

  if (!haveDirectory) {
    return errors::New("the -d/--directory argument is required");
  }
  if (!haveType) {
    return errors::New("the -t/--type argument is required");
  }
  return nullptr;
}

}  // namespace pool_visualizer
