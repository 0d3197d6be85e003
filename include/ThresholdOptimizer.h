#pragma once

#include "Cohort.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// GREATER: positive when value > cut. LESS: positive when value < cut.
enum class CutDirection { GREATER, LESS };

inline const char* directionSymbol(CutDirection direction) {
    return direction == CutDirection::GREATER ? ">" : "<";
}

struct Threshold {
    std::string variable;
    double cut = 0.0;
    CutDirection direction = CutDirection::GREATER;
    double sensitivity = 0.0;
    double specificity = 0.0;
    double youden = 0.0;
    std::optional<std::pair<double, double>> confidence;
    size_t bootstrapEvaluated = 0;
    size_t bootstrapSkipped = 0;
};

/**
 * @brief Youden-index cut-point search for one continuous predictor against a binary label.
 * @details Every distinct observed value is a candidate. For `>` the reported cut is the
 *          largest value on the negative side, for `<` the smallest. Ties in Youden index
 *          go to the cut closest to the sample median, then to `>`, then to the smaller cut.
 */
class ThresholdOptimizer {
public:
    /**
     * @throws Prognos::InsufficientDataError when either label class is empty.
     */
    static Threshold optimize(const std::string& variable,
                              const std::vector<double>& values,
                              const std::vector<bool>& outcomes,
                              std::optional<CutDirection> direction = std::nullopt);

    /**
     * @brief optimize() plus a 95% percentile interval for the cut from `iterations` resamples.
     * @details Resamples keep the direction selected on the full sample. A resample lacking
     *          one of the classes is skipped and counted in bootstrapSkipped.
     */
    static Threshold optimizeWithConfidence(const std::string& variable,
                                            const std::vector<double>& values,
                                            const std::vector<bool>& outcomes,
                                            std::optional<CutDirection> direction,
                                            size_t iterations,
                                            uint32_t seed);

    /**
     * @brief Cohort entry point. Subjects with a missing value or a nullopt label are left out.
     */
    static Threshold optimize(const Cohort& cohort,
                              const std::string& variable,
                              const std::vector<std::optional<bool>>& labels,
                              std::optional<CutDirection> direction,
                              size_t ciIterations,
                              uint32_t seed);
};
