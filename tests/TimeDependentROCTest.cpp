#include "PrognosExceptions.h"
#include "TestCohorts.h"
#include "TimeDependentROC.h"

#include <gtest/gtest.h>

using TestCohorts::asScores;
using TestCohorts::timedCohort;

TEST(TimeDependentROC, ClassifiesCasesControlsAndCensoredSubjects) {
    const Cohort cohort = timedCohort({10, 30, 30, 20, 31, 50}, {true, true, false, false, true, false});
    const auto status = TimeDependentROC::classify(cohort, 30.0);
    ASSERT_EQ(status.size(), 6u);
    EXPECT_EQ(status[0], HorizonStatus::CASE);
    EXPECT_EQ(status[1], HorizonStatus::CASE);     // event exactly at the horizon
    EXPECT_EQ(status[2], HorizonStatus::EXCLUDED); // censored exactly at the horizon
    EXPECT_EQ(status[3], HorizonStatus::EXCLUDED);
    EXPECT_EQ(status[4], HorizonStatus::CONTROL);  // event after the horizon
    EXPECT_EQ(status[5], HorizonStatus::CONTROL);

    const auto labels = TimeDependentROC::horizonLabels(cohort, 30.0);
    EXPECT_TRUE(*labels[0]);
    EXPECT_FALSE(labels[2].has_value());
    EXPECT_FALSE(*labels[5]);
}

TEST(TimeDependentROC, RejectsInvalidHorizon) {
    const Cohort cohort = timedCohort({10}, {true});
    EXPECT_THROW(TimeDependentROC::classify(cohort, 0.0), Prognos::ConfigurationException);
}

TEST(TimeDependentROC, PerfectSeparationGivesUnitAuc) {
    const Cohort cohort = timedCohort({10, 20, 100, 120}, {true, true, false, false});
    const auto roc = TimeDependentROC::compute(cohort, asScores({5, 4, 1, 0}), 30.0);
    ASSERT_TRUE(roc.has_value());
    EXPECT_DOUBLE_EQ(roc->auc, 1.0);
    EXPECT_EQ(roc->cases, 2u);
    EXPECT_EQ(roc->controls, 2u);
    EXPECT_DOUBLE_EQ(roc->horizon, 30.0);
    ASSERT_FALSE(roc->points.empty());
    EXPECT_DOUBLE_EQ(roc->points.front().threshold, 5.0);
}

TEST(TimeDependentROC, ReversedScoresGiveZeroAuc) {
    const Cohort cohort = timedCohort({10, 20, 100, 120}, {true, true, false, false});
    const auto roc = TimeDependentROC::compute(cohort, asScores({0, 1, 4, 5}), 30.0);
    ASSERT_TRUE(roc.has_value());
    EXPECT_DOUBLE_EQ(roc->auc, 0.0);
}

TEST(TimeDependentROC, IdenticalDistributionsGiveHalf) {
    const Cohort cohort = timedCohort({10, 20, 100, 120}, {true, true, false, false});
    const auto roc = TimeDependentROC::compute(cohort, asScores({1, 2, 1, 2}), 30.0);
    ASSERT_TRUE(roc.has_value());
    EXPECT_DOUBLE_EQ(roc->auc, 0.5);
}

TEST(TimeDependentROC, EmptyCaseOrControlSetIsNotEvaluable) {
    const Cohort noCases = timedCohort({100, 120}, {true, false});
    EXPECT_FALSE(TimeDependentROC::compute(noCases, asScores({1, 2}), 30.0).has_value());
    const Cohort noControls = timedCohort({10, 20}, {true, true});
    EXPECT_FALSE(TimeDependentROC::compute(noControls, asScores({1, 2}), 30.0).has_value());
    EXPECT_FALSE(TimeDependentROC::operatingPoint(noControls, asScores({1, 2}), 30.0, 1).has_value());
}

TEST(TimeDependentROC, UnscoredSubjectsAreExcluded) {
    const Cohort cohort = timedCohort({10, 20, 100, 120, 15}, {true, true, false, false, false});
    std::vector<std::optional<int>> scores = asScores({5, 4, 1, 0, 3});
    scores[1] = std::nullopt;
    const auto roc = TimeDependentROC::compute(cohort, scores, 30.0);
    ASSERT_TRUE(roc.has_value());
    EXPECT_EQ(roc->cases, 1u);
    EXPECT_EQ(roc->excluded, 2u);
}

TEST(TimeDependentROC, OperatingPointUsesScoreAtOrAboveCut) {
    const Cohort cohort = timedCohort({10, 20, 25, 100, 120, 130}, {true, true, true, false, false, false});
    const auto op = TimeDependentROC::operatingPoint(cohort, asScores({4, 3, 1, 3, 0, 1}), 30.0, 3);
    ASSERT_TRUE(op.has_value());
    EXPECT_EQ(op->threshold, 3);
    EXPECT_NEAR(op->sensitivity, 2.0 / 3.0, 1e-12);
    EXPECT_NEAR(op->specificity, 2.0 / 3.0, 1e-12);
}

TEST(TimeDependentROC, ScoreVectorMustMatchCohort) {
    const Cohort cohort = timedCohort({10, 100}, {true, false});
    EXPECT_THROW(TimeDependentROC::compute(cohort, asScores({1}), 30.0), Prognos::DatasetException);
}
