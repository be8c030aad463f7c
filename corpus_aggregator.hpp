#pragma once

#include <tuple>
#include <vector>

#include "pool_dataset.hpp"
#include "pool_table.hpp"
#include "ports/errors/errors.hpp"

namespace pool_visualizer {

// Collects snapshot tables (TOTAL rows already appended) and merges them
// into one time-ordered dataset. Single use: after Digest() the accumulated
// tables are gone and both Add() and Digest() fail.
class CorpusAggregator {
 public:
  enum class State { Accumulating, Finalized };

  // The first snapshot fixes the schema of the run.
  error Add(PoolTable snapshot);

  std::tuple<PoolDataset, error> Digest();

  State GetState() const { return state; }
  size_t SnapshotCount() const { return snapshots.size(); }

 private:
  State state = State::Accumulating;
  std::vector<PoolTable> snapshots;

  static std::vector<size_t> chronologicalOrder(
      const std::vector<Timestamp>& times);
  static error addTotalDiff(PoolTable& table);
};

}  // namespace pool_visualizer
