#include "totals_synthesizer.hpp"

#include <cstdint>
#include <string>

#include "pool_columns.hpp"

namespace pool_visualizer {

std::tuple<PoolRow, error> TotalsSynthesizer::SynthesizeTotalsRow(
    const PoolTable& snapshot) {
  if (snapshot.RowCount() == 0) {
    return {PoolRow(), errors::New("cannot add TOTAL row to empty snapshot")};
  }

  auto tagIndex = snapshot.GetSchema().IndexOf(tagColumn);
  if (!tagIndex) {
    return {PoolRow(), errors::New("snapshot has no Tag column")};
  }

  PoolRow total = snapshot.Row(0);
  total[*tagIndex] = std::string(totalTag);

  for (size_t c = 0; c < snapshot.ColumnCount(); ++c) {
    const auto* ints = std::get_if<std::vector<int64_t>>(&snapshot.Column(c));
    if (ints == nullptr) continue;

    int64_t sum = 0;
    for (int64_t value : *ints) {
      if (__builtin_add_overflow(sum, value, &sum)) {
        return {PoolRow(),
                errors::Errorf("TOTAL of column {} overflows int64",
                               snapshot.GetSchema().Columns()[c].name)};
      }
    }
    total[c] = sum;
  }

  return {std::move(total), nullptr};
}

error TotalsSynthesizer::AppendTotalsRow(PoolTable& snapshot) {
  auto [total, err] = SynthesizeTotalsRow(snapshot);
  if (err) {
    return err;
  }
  return snapshot.AppendRow(total);
}

}  // namespace pool_visualizer
