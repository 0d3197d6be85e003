#include "BootstrapValidator.h"
#include "PrognosExceptions.h"
#include "StatsUtils.h"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <exception>
#include <iostream>
#include <random>
#include <utility>

#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
struct IterationResult {
    size_t iteration;
    double apparent;
    double test;
};

struct ThreadAccumulator {
    std::vector<std::vector<IterationResult>> results;
    std::vector<std::map<std::string, size_t>> reasons;
    size_t attempted = 0;

    explicit ThreadAccumulator(size_t metricCount) : results(metricCount), reasons(metricCount) {}
};

constexpr const char* kReasonDevelopment = "model development: insufficient data";
constexpr const char* kReasonMetric = "metric: insufficient data";
constexpr const char* kReasonApparent = "apparent performance not evaluable";
constexpr const char* kReasonTest = "test performance not evaluable";
} // namespace

BootstrapValidator::BootstrapValidator(BootstrapOptions options) : options_(std::move(options)) {
    if (options_.iterations == 0) {
        throw Prognos::ConfigurationException("bootstrap iterations must be >= 1");
    }
    if (!(options_.skipTolerance >= 0.0 && options_.skipTolerance <= 1.0)) {
        throw Prognos::ConfigurationException("bootstrap skip tolerance must be within [0,1]");
    }
}

std::vector<BootstrapReport> BootstrapValidator::validate(const Cohort& original,
                                                          const ModelDeveloper& develop,
                                                          const std::vector<NamedMetric>& metrics) const {
    if (metrics.empty()) throw Prognos::ConfigurationException("bootstrap requires at least one metric");
    if (original.empty()) throw Prognos::InsufficientDataError("bootstrap requested on an empty cohort");

    const ScoreModel originalModel = develop(original);
    std::vector<double> originalValues;
    originalValues.reserve(metrics.size());
    for (const auto& m : metrics) {
        const auto v = m.evaluate(original, originalModel);
        if (!v) {
            throw Prognos::InsufficientDataError("metric " + m.name + " is not evaluable on the original cohort");
        }
        originalValues.push_back(*v);
    }

    const size_t B = options_.iterations;
    const size_t n = original.size();
    const size_t M = metrics.size();
    const size_t skipBudget = static_cast<size_t>(std::floor(options_.skipTolerance * static_cast<double>(B)));
    const size_t progressStep = std::max<size_t>(1, B / 50);

    std::vector<std::atomic<size_t>> skipCounts(M);
    for (auto& c : skipCounts) c.store(0);
    std::atomic<bool> stop{false};
    std::atomic<size_t> completed{0};
    std::exception_ptr failure;

    std::vector<std::vector<IterationResult>> results(M);
    std::vector<std::map<std::string, size_t>> reasons(M);
    size_t attempted = 0;

    #ifdef USE_OPENMP
    #pragma omp parallel
    #endif
    {
        ThreadAccumulator local(M);

        auto recordSkip = [&](size_t m, const std::string& reason) {
            ++local.reasons[m][reason];
            if (skipCounts[m].fetch_add(1) + 1 > skipBudget) stop.store(true);
        };
        auto recordFailure = [&](std::exception_ptr error) {
            #ifdef USE_OPENMP
            #pragma omp critical(prognos_bootstrap_failure)
            #endif
            {
                if (!failure) failure = error;
            }
            stop.store(true);
        };

        #ifdef USE_OPENMP
        #pragma omp for schedule(dynamic)
        #endif
        for (size_t b = 0; b < B; ++b) {
            if (stop.load()) continue;
            ++local.attempted;

            try {
                std::mt19937 sampleRng(static_cast<uint32_t>(options_.seed + b * 104729u + 31u));
                std::uniform_int_distribution<size_t> pick(0, n - 1);
                std::vector<size_t> indices(n);
                for (size_t i = 0; i < n; ++i) indices[i] = pick(sampleRng);
                const Cohort sample = original.resample(indices);

                std::optional<ScoreModel> model;
                try {
                    model.emplace(develop(sample));
                } catch (const Prognos::InsufficientDataError&) {
                    for (size_t m = 0; m < M; ++m) recordSkip(m, kReasonDevelopment);
                }

                if (model) {
                    for (size_t m = 0; m < M; ++m) {
                        std::optional<double> apparent;
                        std::optional<double> test;
                        try {
                            apparent = metrics[m].evaluate(sample, *model);
                            if (apparent) test = metrics[m].evaluate(original, *model);
                        } catch (const Prognos::InsufficientDataError&) {
                            recordSkip(m, kReasonMetric);
                            continue;
                        }
                        if (!apparent) {
                            recordSkip(m, kReasonApparent);
                        } else if (!test) {
                            recordSkip(m, kReasonTest);
                        } else {
                            local.results[m].push_back({b, *apparent, *test});
                        }
                    }
                }
            } catch (...) {
                recordFailure(std::current_exception());
            }

            const size_t done = completed.fetch_add(1) + 1;
            if (options_.progress && (done % progressStep == 0 || done == B)) {
                // Exceptions must not leave the critical region.
                std::exception_ptr progressError;
                #ifdef USE_OPENMP
                #pragma omp critical(prognos_bootstrap_progress)
                #endif
                {
                    try {
                        options_.progress(done, B);
                    } catch (...) {
                        progressError = std::current_exception();
                    }
                }
                if (progressError) recordFailure(progressError);
            }
        }

        #ifdef USE_OPENMP
        #pragma omp critical(prognos_bootstrap_merge)
        #endif
        {
            attempted += local.attempted;
            for (size_t m = 0; m < M; ++m) {
                results[m].insert(results[m].end(), local.results[m].begin(), local.results[m].end());
                for (const auto& kv : local.reasons[m]) reasons[m][kv.first] += kv.second;
            }
        }
    }

    if (failure) std::rethrow_exception(failure);

    const size_t cancelled = B - attempted;
    if (cancelled > 0) {
        std::cerr << "[Prognos][Bootstrap] Skip budget of " << skipBudget << " exhausted, cancelled "
                  << cancelled << " of " << B << " iterations\n";
    }

    std::vector<BootstrapReport> reports;
    reports.reserve(M);
    for (size_t m = 0; m < M; ++m) {
        auto& rows = results[m];
        std::sort(rows.begin(), rows.end(),
                  [](const IterationResult& a, const IterationResult& b) { return a.iteration < b.iteration; });

        BootstrapReport r;
        r.metric = metrics[m].name;
        r.original = originalValues[m];
        r.requested = B;
        r.evaluated = rows.size();
        r.skipped = skipCounts[m].load();
        r.cancelled = cancelled;
        r.skipRate = static_cast<double>(r.skipped) / static_cast<double>(B);
        r.skipReasons = reasons[m];

        if (r.skipped > skipBudget || r.evaluated == 0) {
            throw Prognos::UnstableBootstrapError(r.metric, r.requested, r.evaluated, r.skipped,
                                                  options_.skipTolerance, r.skipReasons);
        }

        std::vector<double> tests;
        tests.reserve(rows.size());
        double sumApparent = 0.0;
        double sumTest = 0.0;
        double sumOptimism = 0.0;
        for (const auto& row : rows) {
            sumApparent += row.apparent;
            sumTest += row.test;
            sumOptimism += row.apparent - row.test;
            tests.push_back(row.test);
        }
        const double count = static_cast<double>(rows.size());
        r.meanApparent = sumApparent / count;
        r.meanTest = sumTest / count;
        r.meanOptimism = sumOptimism / count;
        r.biasCorrected = r.original - r.meanOptimism;
        r.ciLower = StatsUtils::percentile(tests, 0.025);
        r.ciUpper = StatsUtils::percentile(tests, 0.975);
        reports.push_back(std::move(r));
    }
    return reports;
}
