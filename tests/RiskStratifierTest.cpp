#include "PrognosExceptions.h"
#include "RiskStratifier.h"
#include "ValidationConfig.h"

#include <gtest/gtest.h>

#include <cmath>

namespace {
RiskPartition defaultPartition() {
    return RiskPartition(defaultRiskCategories(), 8);
}

void addGroup(std::vector<int>& scores, std::vector<bool>& outcomes, int score, int events, int nonEvents) {
    for (int i = 0; i < events; ++i) {
        scores.push_back(score);
        outcomes.push_back(true);
    }
    for (int i = 0; i < nonEvents; ++i) {
        scores.push_back(score);
        outcomes.push_back(false);
    }
}
} // namespace

TEST(RiskPartition, CategorizesEveryScore) {
    const RiskPartition p = defaultPartition();
    EXPECT_EQ(p.categorize(0).name, "LOW");
    EXPECT_EQ(p.categorize(1).name, "LOW");
    EXPECT_EQ(p.categorize(2).name, "MEDIUM");
    EXPECT_EQ(p.categorize(3).name, "HIGH");
    EXPECT_EQ(p.categorize(8).name, "HIGH");
    EXPECT_EQ(p.categorize(3).recommendation, "Consider early tracheostomy (Day 5-7)");
    EXPECT_EQ(p.highRiskThreshold(), 3);
    EXPECT_THROW(p.categorize(9), Prognos::InvalidPartitionError);
    EXPECT_THROW(p.categorize(-1), Prognos::InvalidPartitionError);
}

TEST(RiskPartition, RejectsGapsOverlapsAndShortCoverage) {
    EXPECT_THROW(RiskPartition({{"A", 0, 1, ""}, {"B", 3, 8, ""}}, 8), Prognos::InvalidPartitionError);
    EXPECT_THROW(RiskPartition({{"A", 0, 2, ""}, {"B", 2, 8, ""}}, 8), Prognos::InvalidPartitionError);
    EXPECT_THROW(RiskPartition({{"A", 1, 8, ""}}, 8), Prognos::InvalidPartitionError);
    EXPECT_THROW(RiskPartition({{"A", 0, 1, ""}, {"B", 2, 7, ""}}, 8), Prognos::InvalidPartitionError);
    EXPECT_THROW(RiskPartition({{"A", 0, 1, ""}, {"A", 2, 8, ""}}, 8), Prognos::InvalidPartitionError);
    EXPECT_THROW(RiskPartition({}, 8), Prognos::InvalidPartitionError);
    EXPECT_NO_THROW(RiskPartition({{"ALL", 0, 8, ""}}, 8));
}

TEST(RiskStratifier, EventRatesAndWoolfInterval) {
    std::vector<int> scores;
    std::vector<bool> outcomes;
    addGroup(scores, outcomes, 1, 1, 3);
    addGroup(scores, outcomes, 2, 2, 2);
    addGroup(scores, outcomes, 5, 4, 1);
    const StratificationResult r = RiskStratifier(defaultPartition()).stratify(scores, outcomes);

    ASSERT_EQ(r.categories.size(), 3u);
    EXPECT_EQ(r.categories[0].subjects, 4u);
    EXPECT_EQ(r.categories[0].events, 1u);
    EXPECT_DOUBLE_EQ(r.categories[0].eventRate, 0.25);
    EXPECT_DOUBLE_EQ(r.categories[2].eventRate, 0.8);

    ASSERT_EQ(r.oddsRatios.size(), 2u);
    const AdjacentOddsRatio& highVsMedium = r.oddsRatios[1];
    EXPECT_EQ(highVsMedium.lowerCategory, "MEDIUM");
    EXPECT_EQ(highVsMedium.upperCategory, "HIGH");
    EXPECT_TRUE(highVsMedium.estimable);
    EXPECT_FALSE(highVsMedium.continuityCorrected);
    EXPECT_NEAR(highVsMedium.oddsRatio, 4.0, 1e-12);
    const double se = 1.5;
    EXPECT_NEAR(highVsMedium.ciLower, std::exp(std::log(4.0) - 1.959963984540054 * se), 1e-9);
    EXPECT_NEAR(highVsMedium.ciUpper, std::exp(std::log(4.0) + 1.959963984540054 * se), 1e-9);
}

TEST(RiskStratifier, ZeroCellAppliesHaldaneCorrection) {
    std::vector<int> scores;
    std::vector<bool> outcomes;
    addGroup(scores, outcomes, 0, 0, 4);
    addGroup(scores, outcomes, 2, 2, 2);
    addGroup(scores, outcomes, 3, 4, 1);
    const StratificationResult r = RiskStratifier(defaultPartition()).stratify(scores, outcomes);
    const AdjacentOddsRatio& mediumVsLow = r.oddsRatios[0];
    EXPECT_TRUE(mediumVsLow.estimable);
    EXPECT_TRUE(mediumVsLow.continuityCorrected);
    EXPECT_NEAR(mediumVsLow.oddsRatio, (2.5 * 4.5) / (2.5 * 0.5), 1e-12);
    EXPECT_TRUE(std::isfinite(mediumVsLow.ciUpper));
}

TEST(RiskStratifier, EmptyCategoryIsNotEstimable) {
    std::vector<int> scores;
    std::vector<bool> outcomes;
    addGroup(scores, outcomes, 2, 1, 1);
    addGroup(scores, outcomes, 4, 2, 1);
    const StratificationResult r = RiskStratifier(defaultPartition()).stratify(scores, outcomes);
    EXPECT_EQ(r.categories[0].subjects, 0u);
    EXPECT_DOUBLE_EQ(r.categories[0].eventRate, 0.0);
    EXPECT_FALSE(r.oddsRatios[0].estimable);
    EXPECT_TRUE(r.oddsRatios[1].estimable);
}

TEST(RiskStratifier, SummarizeBatch) {
    ScoredCohort scored;
    scored.scores = {0, 2, 5, std::nullopt};
    const BatchSummary s = RiskStratifier(defaultPartition()).summarize(scored);
    EXPECT_EQ(s.total, 4u);
    EXPECT_EQ(s.valid, 3u);
    EXPECT_EQ(s.invalid, 1u);
    EXPECT_NEAR(s.meanScore, 7.0 / 3.0, 1e-12);
    EXPECT_EQ(s.minScore, 0);
    EXPECT_EQ(s.maxScore, 5);
    EXPECT_EQ(s.riskDistribution.at("LOW"), 1u);
    EXPECT_EQ(s.riskDistribution.at("MEDIUM"), 1u);
    EXPECT_EQ(s.riskDistribution.at("HIGH"), 1u);
}

TEST(RiskStratifier, ScoreOutsidePartitionIsRejected) {
    EXPECT_THROW(RiskStratifier(defaultPartition()).stratify({9}, {true}), Prognos::InvalidPartitionError);
}
