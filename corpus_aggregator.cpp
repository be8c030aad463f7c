#include "corpus_aggregator.hpp"

#include <algorithm>
#include <functional>
#include <memory>
#include <numeric>
#include <string>
#include <utility>

#include "pool_columns.hpp"
#include "pool_errors.hpp"

namespace pool_visualizer {

error CorpusAggregator::Add(PoolTable snapshot) {
  if (state == State::Finalized) {
    return std::make_shared<RepeatedDigestError>(
        "snapshot added after digest()");
  }

  if (!snapshots.empty() &&
      !(snapshot.GetSchema() == snapshots.front().GetSchema())) {
    return std::make_shared<SchemaMismatchError>(
        "expected [" + snapshots.front().GetSchema().Describe() + "], got [" +
        snapshot.GetSchema().Describe() + "]");
  }

  snapshots.push_back(std::move(snapshot));
  return nullptr;
}

std::tuple<PoolDataset, error> CorpusAggregator::Digest() {
  if (state == State::Finalized) {
    return {PoolDataset(),
            std::make_shared<RepeatedDigestError>("digest() called again")};
  }
  state = State::Finalized;

  std::vector<PoolTable> pending = std::move(snapshots);
  snapshots.clear();

  if (pending.empty()) {
    return {PoolDataset(), errors::New("no snapshots to digest")};
  }

  PoolTable merged = std::move(pending.front());
  for (size_t i = 1; i < pending.size(); ++i) {
    if (auto err = merged.AppendRows(pending[i])) {
      return {PoolDataset(), err};
    }
  }
  pending.clear();

  const auto* times = merged.ColumnAs<Timestamp>(sortColumnName);
  if (times == nullptr) {
    return {PoolDataset(),
            std::make_shared<SchemaMismatchError>(
                "no timestamp column " + std::string(sortColumnName))};
  }
  merged.Permute(chronologicalOrder(*times));

  if (auto err = addTotalDiff(merged)) {
    return {PoolDataset(), err};
  }

  return {PoolDataset(std::move(merged), std::string(sortColumnName)),
          nullptr};
}

std::vector<size_t> CorpusAggregator::chronologicalOrder(
    const std::vector<Timestamp>& times) {
  std::vector<size_t> order(times.size());
  std::iota(order.begin(), order.end(), size_t{0});
  std::stable_sort(order.begin(), order.end(), [&times](size_t a, size_t b) {
    return times[a] < times[b];
  });
  return order;
}

error CorpusAggregator::addTotalDiff(PoolTable& table) {
  if (table.GetSchema().Has(totalDiffColumn)) return nullptr;

  const auto* paged = table.ColumnAs<int64_t>(pagedDiffColumn);
  const auto* nonPaged = table.ColumnAs<int64_t>(nonPagedDiffColumn);
  if (paged == nullptr || nonPaged == nullptr) return nullptr;

  std::vector<int64_t> total(paged->size());
  std::transform(paged->begin(), paged->end(), nonPaged->begin(),
                 total.begin(), std::plus<int64_t>());

  return table.AddColumn({std::string(totalDiffColumn), ColumnType::Int64},
                         std::move(total));
}

}  // namespace pool_visualizer
