#include <gtest/gtest.h>

#include <memory>
#include <set>
#include <string>
#include <vector>

#include "pool_errors.hpp"
#include "tag_ranking.hpp"
#include "test_support.hpp"

namespace pool_visualizer {
namespace {

using test_support::DigestTexts;
using test_support::SnapshotCsv;

using Names = std::vector<std::string>;

class TagRankingTest : public ::testing::Test {
 protected:
  // Three hourly snapshots, deliberately fed out of order.
  //   Grow: 100 -> 250 -> 400   (peak 400, delta +300, mean 250)
  //   Flat: 500 -> 500 -> 500   (peak 500, delta 0,    mean 500)
  //   Drop: 900 -> 100 -> 50    (peak 900, delta -850, mean 350)
  //   Late:  --  ->  -- -> 80   (peak 80,  delta 0,    mean 80)
  void SetUp() override {
    ASSERT_NO_FATAL_FAILURE(DigestTexts(
        {SnapshotCsv("2024-01-01T02:00:00", "2024-01-01T07:00:00",
                     {{"Grow", 400}, {"Flat", 500}, {"Drop", 50}, {"Late", 80}}),
         SnapshotCsv("2024-01-01T00:00:00", "2024-01-01T05:00:00",
                     {{"Grow", 100}, {"Flat", 500}, {"Drop", 900}}),
         SnapshotCsv("2024-01-01T01:00:00", "2024-01-01T06:00:00",
                     {{"Grow", 250}, {"Flat", 500}, {"Drop", 100}})},
        dataset));
  }

  PoolDataset dataset;
  const std::set<std::string> noIgnores;
};

TEST_F(TagRankingTest, PeakIsMaximumPerTag) {
  auto [ranking, err] = TagRanker::ByPeak(
      dataset, MetricColumn::TotalUsedBytes, 10, noIgnores);
  ASSERT_FALSE(err) << err->What();

  EXPECT_EQ(TagRanker::Names(ranking), (Names{"Drop", "Flat", "Grow", "Late"}));
  EXPECT_DOUBLE_EQ(ranking[0].value, 900);
  EXPECT_DOUBLE_EQ(ranking[1].value, 500);
  EXPECT_DOUBLE_EQ(ranking[2].value, 400);
  EXPECT_DOUBLE_EQ(ranking[3].value, 80);
}

TEST_F(TagRankingTest, ResultLengthIsCappedAtN) {
  auto [ranking, err] = TagRanker::ByPeak(
      dataset, MetricColumn::TotalUsedBytes, 2, noIgnores);
  ASSERT_FALSE(err) << err->What();
  EXPECT_EQ(TagRanker::Names(ranking), (Names{"Drop", "Flat"}));

  auto [none, noneErr] = TagRanker::ByAverage(
      dataset, MetricColumn::TotalUsedBytes, 0, noIgnores);
  ASSERT_FALSE(noneErr) << noneErr->What();
  EXPECT_TRUE(none.empty());
}

TEST_F(TagRankingTest, AbsoluteDeltaFollowsTimestampOrder) {
  auto [ranking, err] = TagRanker::ByEndpointDelta(
      dataset, MetricColumn::TotalUsedBytes, 10, noIgnores,
      DeltaMode::Absolute);
  ASSERT_FALSE(err) << err->What();

  // Flat and Late tie at zero and fall back to name order.
  EXPECT_EQ(TagRanker::Names(ranking), (Names{"Grow", "Flat", "Late", "Drop"}));
  EXPECT_DOUBLE_EQ(ranking[0].value, 300);
  EXPECT_DOUBLE_EQ(ranking[3].value, -850);
}

TEST_F(TagRankingTest, PercentageDeltaUsesEpsilon) {
  auto [ranking, err] = TagRanker::ByEndpointDelta(
      dataset, MetricColumn::TotalUsedBytes, 1, noIgnores,
      DeltaMode::Percentage);
  ASSERT_FALSE(err) << err->What();

  ASSERT_EQ(ranking.size(), 1u);
  EXPECT_EQ(ranking[0].tag, "Grow");
  EXPECT_DOUBLE_EQ(ranking[0].value, (400.0 - 100.0) * 100.0 / (400.0 + 0.001));
}

TEST_F(TagRankingTest, AverageIsArithmeticMean) {
  auto [ranking, err] = TagRanker::ByAverage(
      dataset, MetricColumn::TotalUsedBytes, 10, noIgnores);
  ASSERT_FALSE(err) << err->What();

  EXPECT_EQ(TagRanker::Names(ranking), (Names{"Flat", "Drop", "Grow", "Late"}));
  EXPECT_DOUBLE_EQ(ranking[1].value, 350);
  EXPECT_DOUBLE_EQ(ranking[2].value, 250);
}

TEST_F(TagRankingTest, TotalIsNeverRanked) {
  for (size_t n : {1u, 3u, 100u}) {
    auto [peak, peakErr] = TagRanker::ByPeak(
        dataset, MetricColumn::TotalUsedBytes, n, noIgnores);
    auto [delta, deltaErr] = TagRanker::ByEndpointDelta(
        dataset, MetricColumn::TotalUsedBytes, n, noIgnores,
        DeltaMode::Absolute);
    auto [mean, meanErr] = TagRanker::ByAverage(
        dataset, MetricColumn::TotalUsedBytes, n, noIgnores);
    ASSERT_FALSE(peakErr || deltaErr || meanErr);

    for (const auto* ranking : {&peak, &delta, &mean}) {
      for (const auto& score : *ranking) {
        EXPECT_NE(score.tag, "TOTAL");
      }
    }
  }
}

TEST_F(TagRankingTest, IgnoreSetIsHonouredAndLeftUntouched) {
  const std::set<std::string> ignore = {"Drop", "Flat"};

  for (int call = 0; call < 2; ++call) {
    auto [ranking, err] = TagRanker::ByPeak(
        dataset, MetricColumn::TotalUsedBytes, 10, ignore);
    ASSERT_FALSE(err) << err->What();
    EXPECT_EQ(TagRanker::Names(ranking), (Names{"Grow", "Late"}));
  }
  EXPECT_EQ(ignore, (std::set<std::string>{"Drop", "Flat"}));
}

TEST_F(TagRankingTest, AbsentMetricColumnIsInvalidSelector) {
  PoolDataset bare;
  ASSERT_NO_FATAL_FAILURE(DigestTexts(
      {"Tag,TotalUsedBytes,DateTime,DateTimeUTC\n"
       "X,5,2024-01-01T00:00:00,2024-01-01T00:00:00\n"},
      bare));

  auto [missing, missingErr] = TagRanker::ByAverage(
      bare, MetricColumn::TotalDiff, 10, noIgnores);
  std::shared_ptr<InvalidSelectorError> selectorErr;
  EXPECT_TRUE(errors::As(missingErr, &selectorErr));
}

TEST(TagRankingScenarioTest, TwoSnapshots) {
  PoolDataset dataset;
  ASSERT_NO_FATAL_FAILURE(DigestTexts(
      {SnapshotCsv("2024-01-01T00:00:00", "2024-01-01T00:00:00", {{"X", 100}}),
       SnapshotCsv("2024-01-01T01:00:00", "2024-01-01T01:00:00",
                   {{"X", 300}})},
      dataset));
  ASSERT_EQ(dataset.RowCount(), 4u);

  auto [peak, peakErr] =
      TagRanker::ByPeak(dataset, MetricColumn::TotalUsedBytes, 1, {});
  ASSERT_FALSE(peakErr) << peakErr->What();
  EXPECT_EQ(TagRanker::Names(peak), (Names{"X"}));

  auto [delta, deltaErr] = TagRanker::ByEndpointDelta(
      dataset, MetricColumn::TotalUsedBytes, 1, {}, DeltaMode::Absolute);
  ASSERT_FALSE(deltaErr) << deltaErr->What();
  ASSERT_EQ(delta.size(), 1u);
  EXPECT_EQ(delta[0].tag, "X");
  EXPECT_DOUBLE_EQ(delta[0].value, 200);
}

TEST(TagRankingScenarioTest, DeltaFollowsUtcOverDstFallBack) {
  PoolDataset dataset;
  ASSERT_NO_FATAL_FAILURE(DigestTexts(
      {SnapshotCsv("2024-11-03T01:30:00", "2024-11-03T05:30:00", {{"X", 100}}),
       SnapshotCsv("2024-11-03T01:10:00", "2024-11-03T06:10:00",
                   {{"X", 300}})},
      dataset));

  auto [delta, err] = TagRanker::ByEndpointDelta(
      dataset, MetricColumn::TotalUsedBytes, 1, {}, DeltaMode::Absolute);
  ASSERT_FALSE(err) << err->What();
  ASSERT_EQ(delta.size(), 1u);
  EXPECT_DOUBLE_EQ(delta[0].value, 200);
}

}  // namespace
}  // namespace pool_visualizer
