#pragma once

#include "CohortStore.h"
#include "RiskStratifier.h"
#include "ScoreCalculator.h"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

std::vector<ScoreComponent> defaultScoreComponents();
std::map<std::string, std::pair<double, double>> defaultCovariateRanges();
std::vector<RiskCategory> defaultRiskCategories();

/**
 * @brief Run configuration: command-line flags layered over an optional key: value file.
 *
 * File syntax, one entry per line, '#' starts a comment:
 *   bootstrap_iterations: 1000
 *   landmark_days: 3, 5, 7
 *   component.MELD: continuous > 2 @20
 *   component.HCC: binary 1
 *   range.MELD: 6-40
 *   risk_category.HIGH: 3-8
 *   risk_recommendation.HIGH: Consider early tracheostomy (Day 5-7)
 * The first component.* or risk_category.* line replaces the built-in table; later
 * lines append in file order.
 */
struct ValidationConfig {
    std::string datasetPath;
    std::string outputJson;
    std::string idColumn = "patient_id";
    std::string timeColumn = "time_to_event";
    std::string eventColumn = "event";
    char delimiter = ',';

    size_t bootstrapIterations = 1000;
    size_t thresholdBootstrapIterations = 1000;
    std::vector<double> landmarkDays = {3.0, 5.0, 7.0};
    std::vector<double> horizons = {30.0, 60.0, 90.0};
    double outcomeHorizon = 90.0;
    double skipTolerance = 0.05;
    uint32_t randomSeed = 42;

    MissingPolicy missingPolicy = MissingPolicy::ZERO_POINTS;
    size_t maxMissingComponents = 2;
    bool deriveCuts = true;
    bool scoreOnly = false;
    bool verbose = false;
    bool showHelp = false;
    size_t decisionCurvePoints = 99;

    std::vector<ScoreComponent> components = defaultScoreComponents();
    std::map<std::string, std::pair<double, double>> ranges = defaultCovariateRanges();
    std::vector<RiskCategory> riskCategories = defaultRiskCategories();

    /**
     * @brief Parses `prognos <cohort.csv> [options]`; --config files are applied first, flags win.
     * @throws Prognos::ConfigurationException on unknown flags, bad values or a failed validate().
     */
    static ValidationConfig fromArgs(int argc, char* argv[]);

    /**
     * @throws Prognos::ConfigurationException with the offending line number.
     */
    static ValidationConfig fromFile(const std::string& configPath, const ValidationConfig& base);

    /**
     * @brief Checks scalar bounds and builds schema, score definition and partition once so
     *        that constant-table defects surface at startup.
     * @throws Prognos::ConfigurationException, Prognos::InvalidPartitionError.
     */
    void validate() const;

    std::shared_ptr<const CovariateSchema> buildSchema() const;
    ScoreDefinition buildDefinition(const std::shared_ptr<const CovariateSchema>& schema) const;
    RiskPartition buildPartition(int maxScore) const;
    CohortLoadOptions loadOptions() const;
};

const char* missingPolicyName(MissingPolicy policy);
std::string usageText(const std::string& program);
