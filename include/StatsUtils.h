#pragma once

#include <cstddef>
#include <vector>

namespace StatsUtils {
double percentileSorted(const std::vector<double>& sorted, double q);

/**
 * @brief Linear-interpolated percentile of an unsorted sample.
 * @post Returns 0.0 for an empty sample.
 */
double percentile(std::vector<double> values, double q);
double median(std::vector<double> values);

/**
 * @brief Upper tail P(X > x) of a chi-square distribution with `df` degrees of freedom.
 * @details Evaluated through the regularized incomplete gamma function Q(df/2, x/2),
 *          series expansion below a+1 and Lentz continued fraction above it.
 */
double chiSquareSurvival(double x, double df);
}
