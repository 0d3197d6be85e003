#pragma once

#include "Cohort.h"

#include <optional>
#include <vector>

struct HosmerLemeshowResult {
    double statistic = 0.0;
    double degreesOfFreedom = 0.0;
    double pValue = 1.0;
    size_t groups = 0;
};

struct NetBenefitPoint {
    double thresholdProbability = 0.0;
    double model = 0.0;
    double treatAll = 0.0;
};

namespace Calibration {
/**
 * @brief Observed outcome proportion among evaluable subjects at each score 0..maxScore.
 * @details Score levels without evaluable subjects fall back to the overall proportion.
 * @throws Prognos::InsufficientDataError when no subject is evaluable at the horizon.
 */
std::vector<double> fitScoreRisk(const Cohort& cohort,
                                 const std::vector<std::optional<int>>& scores,
                                 double horizon,
                                 int maxScore);

// Mean squared error of riskByScore against the horizon outcome; nullopt if nothing is evaluable.
std::optional<double> brierScore(const Cohort& cohort,
                                 const std::vector<std::optional<int>>& scores,
                                 double horizon,
                                 const std::vector<double>& riskByScore);

/**
 * @brief Hosmer-Lemeshow statistic with one group per observed score level.
 * @details Degrees of freedom are groups - 2, floored at 1. Groups whose expected
 *          variance is zero do not contribute to the statistic.
 * @post nullopt with fewer than two groups.
 */
std::optional<HosmerLemeshowResult> hosmerLemeshow(const Cohort& cohort,
                                                   const std::vector<std::optional<int>>& scores,
                                                   double horizon,
                                                   const std::vector<double>& riskByScore);

/**
 * @brief Net benefit of treating subjects above a decision rule with the given operating
 *        characteristics, alongside the treat-all strategy. Treat-none is zero everywhere.
 */
std::vector<NetBenefitPoint> decisionCurve(double prevalence,
                                           double sensitivity,
                                           double specificity,
                                           const std::vector<double>& thresholdProbabilities);

// Evenly spaced threshold probabilities in [from, to].
std::vector<double> thresholdGrid(double from, double to, size_t count);
}
