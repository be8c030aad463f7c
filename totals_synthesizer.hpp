#pragma once

#include <tuple>

#include "pool_table.hpp"
#include "ports/errors/errors.hpp"

namespace pool_visualizer {

class TotalsSynthesizer {
 public:
  // Builds the TOTAL row of one snapshot: Int64 columns hold the column sum,
  // every other column is copied from the first row. Copying is only correct
  // because those columns do not vary within a snapshot.
  static std::tuple<PoolRow, error> SynthesizeTotalsRow(
      const PoolTable& snapshot);

  // Appends the TOTAL row to the snapshot.
  static error AppendTotalsRow(PoolTable& snapshot);
};

}  // namespace pool_visualizer
