#include "PrognosExceptions.h"
#include "TestCohorts.h"
#include "ThresholdOptimizer.h"

#include <gtest/gtest.h>

namespace {
// MELD 10..35, outcome present from 20 upwards.
void meldSeparable(std::vector<double>& values, std::vector<bool>& outcomes) {
    for (int v = 10; v <= 35; ++v) {
        values.push_back(v);
        outcomes.push_back(v >= 20);
    }
}
} // namespace

TEST(ThresholdOptimizer, PerfectSeparationFindsLargestNegativeValue) {
    std::vector<double> values;
    std::vector<bool> outcomes;
    meldSeparable(values, outcomes);
    const Threshold t = ThresholdOptimizer::optimize("MELD", values, outcomes);
    EXPECT_EQ(t.variable, "MELD");
    EXPECT_EQ(t.direction, CutDirection::GREATER);
    EXPECT_DOUBLE_EQ(t.cut, 19.0);
    EXPECT_DOUBLE_EQ(t.sensitivity, 1.0);
    EXPECT_DOUBLE_EQ(t.specificity, 1.0);
    EXPECT_DOUBLE_EQ(t.youden, 1.0);
    EXPECT_FALSE(t.confidence.has_value());
}

TEST(ThresholdOptimizer, UnsortedMeldCohortSplitsAtNineteen) {
    const std::vector<double> values = {10, 15, 18, 22, 25, 30, 12, 28, 19, 35};
    std::vector<bool> outcomes;
    for (double v : values) outcomes.push_back(v >= 20.0);
    const Threshold t = ThresholdOptimizer::optimize("MELD", values, outcomes);
    EXPECT_EQ(t.direction, CutDirection::GREATER);
    EXPECT_DOUBLE_EQ(t.cut, 19.0);
    EXPECT_DOUBLE_EQ(t.sensitivity, 1.0);
    EXPECT_DOUBLE_EQ(t.specificity, 1.0);
    EXPECT_DOUBLE_EQ(t.youden, 1.0);
}

TEST(ThresholdOptimizer, EquidistantTieAcrossDirectionsPrefersGreater) {
    // "> 3" and "< 2" both reach Youden 0.5 and sit 0.5 from the median 2.5.
    const std::vector<double> values = {1, 2, 3, 4};
    const std::vector<bool> outcomes = {true, false, false, true};
    const Threshold t = ThresholdOptimizer::optimize("X", values, outcomes);
    EXPECT_EQ(t.direction, CutDirection::GREATER);
    EXPECT_DOUBLE_EQ(t.cut, 3.0);
    EXPECT_DOUBLE_EQ(t.youden, 0.5);
}

TEST(ThresholdOptimizer, TieClosestToMedianWins) {
    // "> 3" and "> 5" tie at Youden 0.75; 5 is nearer the median 4.5.
    const std::vector<double> values = {1, 2, 3, 4, 5, 6, 7, 8};
    const std::vector<bool> outcomes = {false, false, false, true, false, true, true, true};
    const Threshold t = ThresholdOptimizer::optimize("X", values, outcomes, CutDirection::GREATER);
    EXPECT_DOUBLE_EQ(t.youden, 0.75);
    EXPECT_DOUBLE_EQ(t.cut, 5.0);
}

TEST(ThresholdOptimizer, EquidistantTieTakesSmallerCut) {
    // "> 2" and "> 5" tie at Youden 0.5, both 1.5 from the median 3.5.
    const std::vector<double> values = {1, 2, 3, 4, 5, 6};
    const std::vector<bool> outcomes = {false, false, true, false, false, true};
    const Threshold t = ThresholdOptimizer::optimize("X", values, outcomes, CutDirection::GREATER);
    EXPECT_EQ(t.direction, CutDirection::GREATER);
    EXPECT_DOUBLE_EQ(t.youden, 0.5);
    EXPECT_DOUBLE_EQ(t.cut, 2.0);
}

TEST(ThresholdOptimizer, LessDirectionForProtectiveMarker) {
    // Low platelets carry the outcome.
    const std::vector<double> values = {30, 50, 60, 80, 120, 200, 250};
    const std::vector<bool> outcomes = {true, true, true, false, false, false, false};
    const Threshold t = ThresholdOptimizer::optimize("PLATELETS", values, outcomes);
    EXPECT_EQ(t.direction, CutDirection::LESS);
    EXPECT_DOUBLE_EQ(t.cut, 80.0);
    EXPECT_DOUBLE_EQ(t.youden, 1.0);
}

TEST(ThresholdOptimizer, FixedDirectionIsHonoured) {
    std::vector<double> values;
    std::vector<bool> outcomes;
    meldSeparable(values, outcomes);
    const Threshold t = ThresholdOptimizer::optimize("MELD", values, outcomes, CutDirection::LESS);
    EXPECT_EQ(t.direction, CutDirection::LESS);
    EXPECT_LE(t.youden, 0.0);
}

TEST(ThresholdOptimizer, EmptyClassThrows) {
    const std::vector<double> values = {1, 2, 3};
    EXPECT_THROW(ThresholdOptimizer::optimize("X", values, {true, true, true}), Prognos::InsufficientDataError);
    EXPECT_THROW(ThresholdOptimizer::optimize("X", values, {false, false, false}), Prognos::InsufficientDataError);
    EXPECT_THROW(ThresholdOptimizer::optimize("X", values, {true, false}), Prognos::DatasetException);
}

TEST(ThresholdOptimizer, ConfidenceIntervalBracketsTheCut) {
    std::vector<double> values;
    std::vector<bool> outcomes;
    meldSeparable(values, outcomes);
    const Threshold t =
        ThresholdOptimizer::optimizeWithConfidence("MELD", values, outcomes, std::nullopt, 200, 42);
    ASSERT_TRUE(t.confidence.has_value());
    EXPECT_EQ(t.bootstrapEvaluated + t.bootstrapSkipped, 200u);
    EXPECT_GT(t.bootstrapEvaluated, 190u);
    EXPECT_LE(t.confidence->first, t.confidence->second);
    EXPECT_GE(t.confidence->first, 10.0);
    EXPECT_LE(t.confidence->second, 35.0);
    // Every separable resample puts the cut at its largest control, which is at most 19.
    EXPECT_LE(t.confidence->second, 19.0);
}

TEST(ThresholdOptimizer, ConfidenceIsReproducibleForAFixedSeed) {
    std::vector<double> values = {5, 7, 9, 11, 12, 14, 15, 18, 21, 22, 25, 28};
    std::vector<bool> outcomes = {false, false, true, false, false, true, false, true, true, false, true, true};
    const Threshold a = ThresholdOptimizer::optimizeWithConfidence("X", values, outcomes, std::nullopt, 100, 7);
    const Threshold b = ThresholdOptimizer::optimizeWithConfidence("X", values, outcomes, std::nullopt, 100, 7);
    ASSERT_TRUE(a.confidence && b.confidence);
    EXPECT_DOUBLE_EQ(a.confidence->first, b.confidence->first);
    EXPECT_DOUBLE_EQ(a.confidence->second, b.confidence->second);
    EXPECT_EQ(a.bootstrapSkipped, b.bootstrapSkipped);
}

TEST(ThresholdOptimizer, CohortOverloadSkipsMissingValuesAndLabels) {
    std::vector<Subject> subjects;
    const std::vector<std::optional<double>> x = {10, 12, std::nullopt, 30, 35, 40};
    for (size_t i = 0; i < x.size(); ++i) {
        subjects.push_back(TestCohorts::subject("s" + std::to_string(i), {x[i]}, 5.0 + i, true));
    }
    const Cohort cohort(TestCohorts::singleSchema(), std::move(subjects));
    const std::vector<std::optional<bool>> labels = {false, false, true, true, std::nullopt, true};
    const Threshold t = ThresholdOptimizer::optimize(cohort, "X", labels, CutDirection::GREATER, 0, 1);
    EXPECT_DOUBLE_EQ(t.cut, 12.0);
    EXPECT_DOUBLE_EQ(t.youden, 1.0);
    EXPECT_EQ(t.bootstrapEvaluated, 0u);
}
