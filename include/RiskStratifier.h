#pragma once

#include "ScoreCalculator.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

struct RiskCategory {
    std::string name;
    int lower = 0;
    int upper = 0;
    std::string recommendation;

    bool contains(int score) const { return score >= lower && score <= upper; }
};

/**
 * @brief Ordered integer ranges that tile [0, maxScore] with no gap or overlap.
 */
class RiskPartition {
public:
    /**
     * @throws Prognos::InvalidPartitionError unless categories[0].lower == 0, each next lower is
     *         the previous upper + 1, and the last upper == maxScore.
     */
    RiskPartition(std::vector<RiskCategory> categories, int maxScore);

    /**
     * @throws Prognos::InvalidPartitionError for a score outside [0, maxScore].
     */
    const RiskCategory& categorize(int score) const;
    size_t indexOf(int score) const;

    // Lower bound of the highest category: the score at which a subject is called high risk.
    int highRiskThreshold() const { return categories_.back().lower; }

    const std::vector<RiskCategory>& categories() const noexcept { return categories_; }
    int maxScore() const noexcept { return maxScore_; }

private:
    std::vector<RiskCategory> categories_;
    int maxScore_;
};

struct CategorySummary {
    std::string name;
    int lower = 0;
    int upper = 0;
    size_t subjects = 0;
    size_t events = 0;
    double eventRate = 0.0;
};

// Odds of the outcome in `upperCategory` relative to `lowerCategory`, Woolf 95% interval.
struct AdjacentOddsRatio {
    std::string lowerCategory;
    std::string upperCategory;
    double oddsRatio = 0.0;
    double ciLower = 0.0;
    double ciUpper = 0.0;
    bool continuityCorrected = false;
    bool estimable = false;
};

struct StratificationResult {
    std::vector<CategorySummary> categories;
    std::vector<AdjacentOddsRatio> oddsRatios;
};

struct BatchSummary {
    size_t total = 0;
    size_t valid = 0;
    size_t invalid = 0;
    double meanScore = 0.0;
    int minScore = 0;
    int maxScore = 0;
    std::map<std::string, size_t> riskDistribution; // category name -> subjects
};

class RiskStratifier {
public:
    explicit RiskStratifier(RiskPartition partition);

    /**
     * @brief Per-category counts and event rates plus adjacent odds ratios.
     * @details A zero cell in the 2x2 table of an adjacent pair adds 0.5 to every cell of that
     *          table. A pair where either category is empty is reported as not estimable.
     */
    StratificationResult stratify(const std::vector<int>& scores, const std::vector<bool>& outcomes) const;

    // Count, score range and category distribution of a scored cohort.
    BatchSummary summarize(const ScoredCohort& scored) const;

    const RiskPartition& partition() const noexcept { return partition_; }

private:
    RiskPartition partition_;
};
