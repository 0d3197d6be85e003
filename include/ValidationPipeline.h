#pragma once

#include "BootstrapValidator.h"
#include "Calibration.h"
#include "CohortStore.h"
#include "RiskStratifier.h"
#include "ScoreCalculator.h"
#include "ThresholdOptimizer.h"
#include "TimeDependentROC.h"
#include "ValidationConfig.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

struct HorizonResult {
    double horizon = 0.0;
    std::optional<ROCResult> roc;          // nullopt: non-evaluable at this horizon
    std::optional<OperatingPoint> highRisk; // rule score >= partition high-risk threshold
};

struct LandmarkResult {
    double landmarkDay = 0.0;
    size_t subjectsAtRisk = 0;
    size_t eventsWithinOutcomeHorizon = 0;
    bool evaluable = false;
    std::vector<std::string> notes;

    std::vector<Threshold> thresholds;
    std::optional<ScoreModel> model;
    size_t scored = 0;
    size_t excludedFromScoring = 0;

    std::vector<HorizonResult> horizons;
    std::optional<double> cIndex;
    std::optional<OperatingPoint> outcomeOperatingPoint;
    std::optional<double> brier;
    std::optional<HosmerLemeshowResult> hosmerLemeshow;
    std::vector<NetBenefitPoint> decisionCurve;
    std::optional<StratificationResult> stratification;
    BatchSummary batch;
    std::vector<BootstrapReport> bootstrap;
};

struct ValidationResult {
    CohortLoadReport load;
    size_t cohortSize = 0;
    int maxScore = 0;
    int highRiskThreshold = 0;
    double outcomeHorizon = 0.0;
    std::vector<RiskCategory> categories;
    std::vector<LandmarkResult> landmarks;
};

struct ScoringResult {
    CohortLoadReport load;
    int maxScore = 0;
    std::vector<std::string> subjectIds;
    std::vector<ScoreBreakdown> breakdowns;
    ScoredCohort scored;
    BatchSummary summary;
};

/**
 * @brief Runs the landmark validation chain for every configured landmark day.
 * @details Per landmark: build the at-risk cohort, derive cut-points and per-score risk at
 *          the outcome horizon, evaluate ROC at each horizon, concordance, calibration and
 *          stratification, then bootstrap the whole development procedure for optimism.
 *          A landmark that cannot be developed is reported as non-evaluable; an unstable
 *          bootstrap aborts the run.
 */
class ValidationPipeline {
public:
    explicit ValidationPipeline(ValidationConfig config);

    ValidationResult run() const;
    ValidationResult run(const Cohort& cohort) const;

    // Fixed-cut scoring of every subject with a per-subject breakdown.
    ScoringResult score() const;
    ScoringResult score(const Cohort& cohort) const;

    /**
     * @brief Derives cuts (unless fixed) and per-score risk on a landmark cohort.
     * @throws Prognos::InsufficientDataError when an outcome class is empty at the outcome horizon.
     */
    ScoreModel developModel(const Cohort& landmarkCohort, size_t ciIterations, std::vector<Threshold>* thresholds) const;

    /**
     * @brief Bootstrap metrics for a landmark: auc@h per evaluable horizon, c_index, brier,
     *        sensitivity and specificity at the high-risk threshold.
     */
    std::vector<NamedMetric> buildMetrics(const std::vector<double>& evaluableHorizons) const;

    const ValidationConfig& config() const noexcept { return config_; }
    const ScoreDefinition& baseDefinition() const noexcept { return baseDefinition_; }
    const RiskPartition& partition() const noexcept { return partition_; }

private:
    LandmarkResult runLandmark(const Cohort& cohort, double landmarkDay) const;
    Cohort loadCohort(CohortLoadReport& report) const;

    ValidationConfig config_;
    std::shared_ptr<const CovariateSchema> schema_;
    ScoreDefinition baseDefinition_;
    RiskPartition partition_;
};
