#include "StatsUtils.h"

#include <gtest/gtest.h>

#include <cmath>

TEST(StatsUtils, PercentileInterpolatesBetweenOrderStatistics) {
    const std::vector<double> v = {4.0, 1.0, 3.0, 2.0};
    EXPECT_DOUBLE_EQ(StatsUtils::percentile(v, 0.0), 1.0);
    EXPECT_DOUBLE_EQ(StatsUtils::percentile(v, 1.0), 4.0);
    EXPECT_DOUBLE_EQ(StatsUtils::percentile(v, 0.5), 2.5);
    EXPECT_DOUBLE_EQ(StatsUtils::median({5.0, 1.0, 3.0}), 3.0);
    EXPECT_DOUBLE_EQ(StatsUtils::percentile({}, 0.5), 0.0);
}

TEST(StatsUtils, ChiSquareSurvivalMatchesTables) {
    EXPECT_DOUBLE_EQ(StatsUtils::chiSquareSurvival(0.0, 3.0), 1.0);
    // df = 2 has the closed form exp(-x/2).
    EXPECT_NEAR(StatsUtils::chiSquareSurvival(4.0, 2.0), std::exp(-2.0), 1e-10);
    EXPECT_NEAR(StatsUtils::chiSquareSurvival(3.841458820694124, 1.0), 0.05, 1e-8);
    EXPECT_NEAR(StatsUtils::chiSquareSurvival(15.50731305586545, 8.0), 0.05, 1e-8);
    EXPECT_TRUE(std::isnan(StatsUtils::chiSquareSurvival(1.0, 0.0)));
}
