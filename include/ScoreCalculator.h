#pragma once

#include "Cohort.h"
#include "ThresholdOptimizer.h"

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct ScoreComponent {
    std::string variable;
    CovariateKind kind = CovariateKind::CONTINUOUS;
    CutDirection direction = CutDirection::GREATER;
    std::optional<double> cut; // continuous only; unset until fixed or derived
    int points = 1;
};

/**
 * @brief Ordered point table of an integer risk score bound to a covariate schema.
 * @details maxScore() is summed once here from the same table score() walks, so the
 *          "out of N" figure and the attainable maximum can never disagree.
 */
class ScoreDefinition {
public:
    /**
     * @throws Prognos::ConfigurationException on negative points, kind mismatch against the
     *         schema, duplicate variables, or a fixed cut outside the covariate's range.
     * @throws Prognos::DatasetException when a component names a covariate absent from the schema.
     */
    ScoreDefinition(std::vector<ScoreComponent> components, std::shared_ptr<const CovariateSchema> schema);

    int maxScore() const noexcept { return maxScore_; }
    const std::vector<ScoreComponent>& components() const noexcept { return components_; }
    const std::vector<size_t>& covariateIndices() const noexcept { return indices_; }
    const CovariateSchema& schema() const noexcept { return *schema_; }
    const std::shared_ptr<const CovariateSchema>& sharedSchema() const noexcept { return schema_; }

    // True when every continuous component carries a cut.
    bool isComplete() const;

    /**
     * @brief Copy of this definition with cut and direction taken from matching thresholds.
     */
    ScoreDefinition withCuts(const std::vector<Threshold>& thresholds) const;

private:
    std::vector<ScoreComponent> components_;
    std::shared_ptr<const CovariateSchema> schema_;
    std::vector<size_t> indices_;
    int maxScore_ = 0;
};

enum class MissingPolicy { STRICT, ZERO_POINTS };

struct ComponentDetail {
    std::string variable;
    std::optional<double> value;
    int points = 0;
    int maxPoints = 0;
    std::string description;
};

struct ScoreBreakdown {
    int total = 0;
    int maxScore = 0;
    std::vector<ComponentDetail> components;
    std::vector<std::string> warnings;
    std::vector<std::string> missingComponents;
    bool valid = true;
};

struct ScoredCohort {
    std::vector<std::optional<int>> scores; // aligned with cohort subjects
    size_t scored = 0;
    size_t excluded = 0;
    std::vector<std::pair<std::string, std::string>> exclusions; // (subject id, reason)
};

class ScoreCalculator {
public:
    /**
     * @throws Prognos::ConfigurationException when a continuous component has no cut.
     */
    ScoreCalculator(ScoreDefinition definition, MissingPolicy policy = MissingPolicy::STRICT, size_t maxMissingComponents = 2);

    /**
     * @post 0 <= result <= definition().maxScore().
     * @throws Prognos::MissingCovariateError under STRICT on any missing component, or under
     *         ZERO_POINTS once more than maxMissingComponents are missing.
     */
    int score(const Subject& subject) const;

    // Never throws on missing data; reports it through warnings and `valid`.
    ScoreBreakdown explain(const Subject& subject) const;

    // Subjects that cannot be scored get nullopt and a recorded exclusion reason.
    ScoredCohort scoreCohort(const Cohort& cohort) const;

    const ScoreDefinition& definition() const noexcept { return definition_; }
    MissingPolicy policy() const noexcept { return policy_; }
    size_t maxMissingComponents() const noexcept { return maxMissing_; }

private:
    ScoreDefinition definition_;
    MissingPolicy policy_;
    size_t maxMissing_;
};

/**
 * @brief A score definition developed on one cohort, with the observed outcome risk
 *        per score level used by calibration metrics.
 */
struct ScoreModel {
    ScoreDefinition definition;
    std::vector<double> riskByScore; // index = score, size maxScore + 1 (empty if not fitted)
    MissingPolicy policy = MissingPolicy::STRICT;
    size_t maxMissingComponents = 2;

    ScoreCalculator calculator() const { return ScoreCalculator(definition, policy, maxMissingComponents); }
};
