#include "ThresholdOptimizer.h"
#include "PrognosExceptions.h"
#include "StatsUtils.h"

#include <algorithm>
#include <cmath>
#include <random>

#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
constexpr double kYoudenEpsilon = 1e-12;

struct Candidate {
    double cut = 0.0;
    CutDirection direction = CutDirection::GREATER;
    double sensitivity = 0.0;
    double specificity = 0.0;
    double youden = -2.0;
};

bool better(const Candidate& a, const Candidate& b, double median) {
    if (a.youden > b.youden + kYoudenEpsilon) return true;
    if (a.youden < b.youden - kYoudenEpsilon) return false;
    const double da = std::abs(a.cut - median);
    const double db = std::abs(b.cut - median);
    if (da < db - kYoudenEpsilon) return true;
    if (da > db + kYoudenEpsilon) return false;
    if (a.direction != b.direction) return a.direction == CutDirection::GREATER;
    return a.cut < b.cut;
}

// Caller guarantees both classes are present.
Candidate sweep(const std::vector<double>& values,
                const std::vector<bool>& outcomes,
                std::optional<CutDirection> direction) {
    std::vector<std::pair<double, bool>> sorted;
    sorted.reserve(values.size());
    size_t cases = 0;
    for (size_t i = 0; i < values.size(); ++i) {
        sorted.emplace_back(values[i], outcomes[i]);
        if (outcomes[i]) ++cases;
    }
    std::sort(sorted.begin(), sorted.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    const double P = static_cast<double>(cases);
    const double N = static_cast<double>(sorted.size() - cases);
    const double median = StatsUtils::median(std::vector<double>(values));
    const bool tryGreater = !direction || *direction == CutDirection::GREATER;
    const bool tryLess = !direction || *direction == CutDirection::LESS;

    Candidate best;
    bool haveBest = false;
    auto consider = [&](const Candidate& c) {
        if (!haveBest || better(c, best, median)) {
            best = c;
            haveBest = true;
        }
    };

    // casesBelow/controlsBelow: counts strictly below the current distinct value.
    size_t casesBelow = 0;
    size_t controlsBelow = 0;
    size_t i = 0;
    while (i < sorted.size()) {
        const double v = sorted[i].first;
        size_t casesAt = 0;
        size_t controlsAt = 0;
        size_t j = i;
        while (j < sorted.size() && sorted[j].first == v) {
            if (sorted[j].second) ++casesAt; else ++controlsAt;
            ++j;
        }

        if (tryLess) {
            Candidate c;
            c.cut = v;
            c.direction = CutDirection::LESS;
            c.sensitivity = static_cast<double>(casesBelow) / P;
            c.specificity = (N - static_cast<double>(controlsBelow)) / N;
            c.youden = c.sensitivity + c.specificity - 1.0;
            consider(c);
        }

        casesBelow += casesAt;
        controlsBelow += controlsAt;

        if (tryGreater) {
            Candidate c;
            c.cut = v;
            c.direction = CutDirection::GREATER;
            c.sensitivity = (P - static_cast<double>(casesBelow)) / P;
            c.specificity = static_cast<double>(controlsBelow) / N;
            c.youden = c.sensitivity + c.specificity - 1.0;
            consider(c);
        }
        i = j;
    }
    return best;
}

bool hasBothClasses(const std::vector<bool>& outcomes) {
    const auto cases = std::count(outcomes.begin(), outcomes.end(), true);
    return cases > 0 && static_cast<size_t>(cases) < outcomes.size();
}
} // namespace

Threshold ThresholdOptimizer::optimize(const std::string& variable,
                                       const std::vector<double>& values,
                                       const std::vector<bool>& outcomes,
                                       std::optional<CutDirection> direction) {
    if (values.size() != outcomes.size()) {
        throw Prognos::DatasetException("threshold search for " + variable + ": value/outcome length mismatch");
    }
    if (!hasBothClasses(outcomes)) {
        throw Prognos::InsufficientDataError("threshold search for " + variable +
                                             " needs at least one case and one control among " +
                                             std::to_string(values.size()) + " observed values");
    }

    const Candidate best = sweep(values, outcomes, direction);
    Threshold out;
    out.variable = variable;
    out.cut = best.cut;
    out.direction = best.direction;
    out.sensitivity = best.sensitivity;
    out.specificity = best.specificity;
    out.youden = best.youden;
    return out;
}

Threshold ThresholdOptimizer::optimizeWithConfidence(const std::string& variable,
                                                     const std::vector<double>& values,
                                                     const std::vector<bool>& outcomes,
                                                     std::optional<CutDirection> direction,
                                                     size_t iterations,
                                                     uint32_t seed) {
    Threshold out = optimize(variable, values, outcomes, direction);
    if (iterations == 0) return out;

    const size_t n = values.size();
    const CutDirection fixed = out.direction;
    std::vector<double> cuts(iterations, 0.0);
    std::vector<char> evaluated(iterations, 0);

    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (size_t b = 0; b < iterations; ++b) {
        std::mt19937 sampleRng(static_cast<uint32_t>(seed + b * 104729u + 31u));
        std::uniform_int_distribution<size_t> pick(0, n - 1);
        std::vector<double> sv(n);
        std::vector<bool> so(n);
        for (size_t k = 0; k < n; ++k) {
            const size_t idx = pick(sampleRng);
            sv[k] = values[idx];
            so[k] = outcomes[idx];
        }
        if (!hasBothClasses(so)) continue;
        cuts[b] = sweep(sv, so, fixed).cut;
        evaluated[b] = 1;
    }

    std::vector<double> kept;
    kept.reserve(iterations);
    for (size_t b = 0; b < iterations; ++b) {
        if (evaluated[b]) kept.push_back(cuts[b]);
    }
    out.bootstrapEvaluated = kept.size();
    out.bootstrapSkipped = iterations - kept.size();
    if (!kept.empty()) {
        out.confidence = std::make_pair(StatsUtils::percentile(kept, 0.025), StatsUtils::percentile(kept, 0.975));
    }
    return out;
}

Threshold ThresholdOptimizer::optimize(const Cohort& cohort,
                                       const std::string& variable,
                                       const std::vector<std::optional<bool>>& labels,
                                       std::optional<CutDirection> direction,
                                       size_t ciIterations,
                                       uint32_t seed) {
    if (labels.size() != cohort.size()) {
        throw Prognos::DatasetException("threshold search for " + variable + ": label count does not match cohort");
    }
    const size_t col = cohort.schema().requireIndex(variable);
    if (cohort.schema().at(col).kind != CovariateKind::CONTINUOUS) {
        throw Prognos::ConfigurationException("threshold search requested for binary covariate " + variable);
    }

    std::vector<double> values;
    std::vector<bool> outcomes;
    values.reserve(cohort.size());
    outcomes.reserve(cohort.size());
    for (size_t i = 0; i < cohort.size(); ++i) {
        const auto& v = cohort.subject(i).covariates[col];
        if (!v || !labels[i]) continue;
        values.push_back(*v);
        outcomes.push_back(*labels[i]);
    }
    return optimizeWithConfidence(variable, values, outcomes, direction, ciIterations, seed);
}
