#include "LandmarkBuilder.h"
#include "PrognosExceptions.h"
#include "TestCohorts.h"

#include <gtest/gtest.h>

TEST(LandmarkBuilder, KeepsSubjectsAtRiskAndShiftsTime) {
    const Cohort cohort = TestCohorts::timedCohort({2, 4, 6, 8, 10}, {true, true, true, false, true});
    const Cohort lm = LandmarkBuilder::build(cohort, 5.0);
    ASSERT_EQ(lm.size(), 3u);
    EXPECT_DOUBLE_EQ(lm.subject(0).timeToEvent, 1.0);
    EXPECT_DOUBLE_EQ(lm.subject(1).timeToEvent, 3.0);
    EXPECT_DOUBLE_EQ(lm.subject(2).timeToEvent, 5.0);
    EXPECT_EQ(lm.subject(0).id, "s2");
    EXPECT_DOUBLE_EQ(lm.landmarkDay(), 5.0);
    EXPECT_EQ(cohort.size(), 5u);
}

TEST(LandmarkBuilder, SubjectAtExactlyTheLandmarkIsNotAtRisk) {
    const Cohort cohort = TestCohorts::timedCohort({5, 5.5}, {true, true});
    const Cohort lm = LandmarkBuilder::build(cohort, 5.0);
    ASSERT_EQ(lm.size(), 1u);
    EXPECT_DOUBLE_EQ(lm.subject(0).timeToEvent, 0.5);
}

TEST(LandmarkBuilder, HorizonClearsLaterEvents) {
    const Cohort cohort = TestCohorts::timedCohort({10, 40, 100}, {true, true, true});
    const Cohort lm = LandmarkBuilder::build(cohort, 5.0, 30.0);
    ASSERT_EQ(lm.size(), 3u);
    EXPECT_TRUE(lm.subject(0).event);
    EXPECT_FALSE(lm.subject(1).event); // shifted time 35 > 30
    EXPECT_FALSE(lm.subject(2).event);
}

TEST(LandmarkBuilder, ChainedLandmarksAccumulateDay) {
    const Cohort cohort = TestCohorts::timedCohort({10, 20}, {true, true});
    const Cohort lm = LandmarkBuilder::build(LandmarkBuilder::build(cohort, 3.0), 2.0);
    EXPECT_DOUBLE_EQ(lm.landmarkDay(), 5.0);
    EXPECT_DOUBLE_EQ(lm.subject(0).timeToEvent, 5.0);
}

TEST(LandmarkBuilder, RejectsInvalidArguments) {
    const Cohort cohort = TestCohorts::timedCohort({10}, {true});
    EXPECT_THROW(LandmarkBuilder::build(cohort, -1.0), Prognos::ConfigurationException);
    EXPECT_THROW(LandmarkBuilder::build(cohort, 1.0, 0.0), Prognos::ConfigurationException);
}

TEST(LandmarkBuilder, EmptyResultIsAllowed) {
    const Cohort cohort = TestCohorts::timedCohort({2, 3}, {true, false});
    EXPECT_TRUE(LandmarkBuilder::build(cohort, 7.0).empty());
}
