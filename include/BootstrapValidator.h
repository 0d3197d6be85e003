#pragma once

#include "Cohort.h"
#include "ScoreCalculator.h"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

// Derives a complete score model (cuts and per-score risk) from a development cohort.
using ModelDeveloper = std::function<ScoreModel(const Cohort&)>;

// Performance of a model on a cohort; nullopt when not evaluable there.
using MetricFunction = std::function<std::optional<double>(const Cohort&, const ScoreModel&)>;

struct NamedMetric {
    std::string name;
    MetricFunction evaluate;
};

struct BootstrapOptions {
    size_t iterations = 1000;
    double skipTolerance = 0.05;
    uint32_t seed = 42;
    std::function<void(size_t, size_t)> progress; // (completed, total), optional
};

struct BootstrapReport {
    std::string metric;
    double original = 0.0;
    double meanApparent = 0.0;
    double meanTest = 0.0;
    double meanOptimism = 0.0;
    double biasCorrected = 0.0;
    double ciLower = 0.0;
    double ciUpper = 0.0;
    size_t requested = 0;
    size_t evaluated = 0;
    size_t skipped = 0;
    size_t cancelled = 0;
    double skipRate = 0.0;
    std::map<std::string, size_t> skipReasons;
};

/**
 * @brief Harrell-style optimism bootstrap of a score development procedure.
 * @details Every iteration draws a same-size resample with its own generator seeded from
 *          (seed, iteration), re-develops the model on it, and scores that model on the
 *          resample (apparent) and on the original cohort (test). Iterations are independent
 *          and run in parallel under OpenMP; per-thread results are merged after the loop and
 *          reduced in iteration order, so reports do not depend on the thread count.
 *
 *          An iteration where a metric is not evaluable is skipped for that metric only.
 *          Once any metric's skips exceed floor(skipTolerance * iterations) the remaining
 *          iterations are cancelled and UnstableBootstrapError is raised. A skip rate equal
 *          to the tolerance is accepted.
 */
class BootstrapValidator {
public:
    explicit BootstrapValidator(BootstrapOptions options = {});

    /**
     * @post report.biasCorrected == report.original - report.meanOptimism.
     * @throws Prognos::InsufficientDataError if a metric is not evaluable on the original cohort.
     * @throws Prognos::UnstableBootstrapError when a metric's skip rate exceeds the tolerance.
     * @throws whatever the progress callback throws, after the loop has stopped.
     */
    std::vector<BootstrapReport> validate(const Cohort& original,
                                          const ModelDeveloper& develop,
                                          const std::vector<NamedMetric>& metrics) const;

    const BootstrapOptions& options() const noexcept { return options_; }

private:
    BootstrapOptions options_;
};
