#include "Calibration.h"
#include "PrognosExceptions.h"
#include "StatsUtils.h"
#include "TimeDependentROC.h"

#include <algorithm>

namespace {
struct LevelCounts {
    size_t n = 0;
    size_t events = 0;
};

double riskFor(const std::vector<double>& riskByScore, int score) {
    if (score < 0 || static_cast<size_t>(score) >= riskByScore.size()) {
        throw Prognos::DatasetException("score " + std::to_string(score) + " has no fitted risk");
    }
    return riskByScore[static_cast<size_t>(score)];
}
} // namespace

namespace Calibration {

std::vector<double> fitScoreRisk(const Cohort& cohort,
                                 const std::vector<std::optional<int>>& scores,
                                 double horizon,
                                 int maxScore) {
    if (scores.size() != cohort.size()) {
        throw Prognos::DatasetException("score vector does not match cohort size");
    }
    const auto labels = TimeDependentROC::horizonLabels(cohort, horizon);
    std::vector<LevelCounts> levels(static_cast<size_t>(std::max(maxScore, 0)) + 1);
    size_t total = 0;
    size_t events = 0;
    for (size_t i = 0; i < labels.size(); ++i) {
        if (!labels[i] || !scores[i]) continue;
        const int s = std::clamp(*scores[i], 0, maxScore);
        auto& lv = levels[static_cast<size_t>(s)];
        ++lv.n;
        ++total;
        if (*labels[i]) {
            ++lv.events;
            ++events;
        }
    }
    if (total == 0) {
        throw Prognos::InsufficientDataError("no evaluable subjects at horizon " + std::to_string(horizon));
    }

    const double prevalence = static_cast<double>(events) / static_cast<double>(total);
    std::vector<double> risk(levels.size(), prevalence);
    for (size_t k = 0; k < levels.size(); ++k) {
        if (levels[k].n > 0) risk[k] = static_cast<double>(levels[k].events) / static_cast<double>(levels[k].n);
    }
    return risk;
}

std::optional<double> brierScore(const Cohort& cohort,
                                 const std::vector<std::optional<int>>& scores,
                                 double horizon,
                                 const std::vector<double>& riskByScore) {
    const auto labels = TimeDependentROC::horizonLabels(cohort, horizon);
    double sum = 0.0;
    size_t n = 0;
    for (size_t i = 0; i < labels.size(); ++i) {
        if (!labels[i] || !scores.at(i)) continue;
        const double p = riskFor(riskByScore, *scores[i]);
        const double y = *labels[i] ? 1.0 : 0.0;
        sum += (p - y) * (p - y);
        ++n;
    }
    if (n == 0) return std::nullopt;
    return sum / static_cast<double>(n);
}

std::optional<HosmerLemeshowResult> hosmerLemeshow(const Cohort& cohort,
                                                   const std::vector<std::optional<int>>& scores,
                                                   double horizon,
                                                   const std::vector<double>& riskByScore) {
    const auto labels = TimeDependentROC::horizonLabels(cohort, horizon);
    std::vector<LevelCounts> levels(riskByScore.size());
    for (size_t i = 0; i < labels.size(); ++i) {
        if (!labels[i] || !scores.at(i)) continue;
        if (*scores[i] < 0 || static_cast<size_t>(*scores[i]) >= levels.size()) {
            throw Prognos::DatasetException("score " + std::to_string(*scores[i]) + " has no fitted risk");
        }
        auto& lv = levels[static_cast<size_t>(*scores[i])];
        ++lv.n;
        if (*labels[i]) ++lv.events;
    }

    HosmerLemeshowResult out;
    for (size_t k = 0; k < levels.size(); ++k) {
        if (levels[k].n == 0) continue;
        ++out.groups;
        const double n = static_cast<double>(levels[k].n);
        const double p = riskByScore[k];
        const double expected = n * p;
        const double variance = expected * (1.0 - p);
        if (variance <= 0.0) continue;
        const double diff = static_cast<double>(levels[k].events) - expected;
        out.statistic += diff * diff / variance;
    }
    if (out.groups < 2) return std::nullopt;
    out.degreesOfFreedom = std::max(1.0, static_cast<double>(out.groups) - 2.0);
    out.pValue = StatsUtils::chiSquareSurvival(out.statistic, out.degreesOfFreedom);
    return out;
}

std::vector<NetBenefitPoint> decisionCurve(double prevalence,
                                           double sensitivity,
                                           double specificity,
                                           const std::vector<double>& thresholdProbabilities) {
    std::vector<NetBenefitPoint> out;
    out.reserve(thresholdProbabilities.size());
    const double tp = prevalence * sensitivity;
    const double fp = (1.0 - prevalence) * (1.0 - specificity);
    for (double pt : thresholdProbabilities) {
        NetBenefitPoint point;
        point.thresholdProbability = pt;
        if (pt <= 0.0) {
            point.model = tp;
            point.treatAll = prevalence;
        } else if (pt >= 1.0) {
            point.model = 0.0;
            point.treatAll = 0.0;
        } else {
            const double odds = pt / (1.0 - pt);
            point.model = tp - fp * odds;
            point.treatAll = prevalence - (1.0 - prevalence) * odds;
        }
        out.push_back(point);
    }
    return out;
}

std::vector<double> thresholdGrid(double from, double to, size_t count) {
    std::vector<double> grid;
    if (count == 0) return grid;
    grid.reserve(count);
    if (count == 1) {
        grid.push_back(from);
        return grid;
    }
    const double step = (to - from) / static_cast<double>(count - 1);
    for (size_t i = 0; i < count; ++i) grid.push_back(from + step * static_cast<double>(i));
    return grid;
}

} // namespace Calibration
