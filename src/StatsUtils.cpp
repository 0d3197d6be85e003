#include "StatsUtils.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace {
constexpr int kGammaMaxIterations = 500;
constexpr double kGammaEpsilon = 1e-14;
constexpr double kGammaFpMin = 1e-300;

// P(a, x) by its power series; converges quickly for x < a + 1.
double lowerGammaSeries(double a, double x) {
    double ap = a;
    double sum = 1.0 / a;
    double del = sum;
    for (int n = 0; n < kGammaMaxIterations; ++n) {
        ap += 1.0;
        del *= x / ap;
        sum += del;
        if (std::fabs(del) < std::fabs(sum) * kGammaEpsilon) break;
    }
    return sum * std::exp(-x + a * std::log(x) - std::lgamma(a));
}

// Q(a, x) by continued fraction; converges quickly for x >= a + 1.
double upperGammaContinuedFraction(double a, double x) {
    double b = x + 1.0 - a;
    double c = 1.0 / kGammaFpMin;
    double d = 1.0 / b;
    double h = d;
    for (int i = 1; i <= kGammaMaxIterations; ++i) {
        const double an = -static_cast<double>(i) * (static_cast<double>(i) - a);
        b += 2.0;
        d = an * d + b;
        if (std::fabs(d) < kGammaFpMin) d = kGammaFpMin;
        c = b + an / c;
        if (std::fabs(c) < kGammaFpMin) c = kGammaFpMin;
        d = 1.0 / d;
        const double del = d * c;
        h *= del;
        if (std::fabs(del - 1.0) < kGammaEpsilon) break;
    }
    return std::exp(-x + a * std::log(x) - std::lgamma(a)) * h;
}
} // namespace

namespace StatsUtils {
double percentileSorted(const std::vector<double>& sorted, double q) {
    if (sorted.empty()) return 0.0;
    if (sorted.size() == 1) return sorted.front();

    const double qq = std::clamp(q, 0.0, 1.0);
    const double pos = qq * static_cast<double>(sorted.size() - 1);
    const size_t lo = static_cast<size_t>(std::floor(pos));
    const size_t hi = static_cast<size_t>(std::ceil(pos));
    const double t = pos - static_cast<double>(lo);
    return sorted[lo] * (1.0 - t) + sorted[hi] * t;
}

double percentile(std::vector<double> values, double q) {
    std::sort(values.begin(), values.end());
    return percentileSorted(values, q);
}

double median(std::vector<double> values) {
    return percentile(std::move(values), 0.5);
}

double chiSquareSurvival(double x, double df) {
    if (!std::isfinite(x) || df <= 0.0) return std::numeric_limits<double>::quiet_NaN();
    if (x <= 0.0) return 1.0;
    const double a = df / 2.0;
    const double halfX = x / 2.0;
    if (halfX < a + 1.0) {
        return std::clamp(1.0 - lowerGammaSeries(a, halfX), 0.0, 1.0);
    }
    return std::clamp(upperGammaContinuedFraction(a, halfX), 0.0, 1.0);
}
}
