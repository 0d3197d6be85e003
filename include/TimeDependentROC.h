#pragma once

#include "Cohort.h"

#include <optional>
#include <vector>

enum class HorizonStatus { CASE, CONTROL, EXCLUDED };

struct RocPoint {
    double threshold = 0.0;
    double sensitivity = 0.0;
    double specificity = 0.0;
};

struct ROCResult {
    double landmarkDay = 0.0;
    double horizon = 0.0;
    std::vector<RocPoint> points; // descending threshold
    double auc = 0.0;
    size_t cases = 0;
    size_t controls = 0;
    size_t excluded = 0;
};

struct OperatingPoint {
    int threshold = 0;
    double sensitivity = 0.0;
    double specificity = 0.0;
    size_t cases = 0;
    size_t controls = 0;
};

/**
 * @brief Cumulative-case / dynamic-control ROC analysis of an integer score at a horizon.
 * @details Cases: time <= horizon with an event. Controls: time > horizon. Subjects censored
 *          before the horizon, or without a score, belong to neither set. A score c classifies
 *          a subject as positive when score >= c.
 */
class TimeDependentROC {
public:
    /**
     * @throws Prognos::ConfigurationException for a non-positive or non-finite horizon.
     */
    static std::vector<HorizonStatus> classify(const Cohort& cohort, double horizon);

    // CASE -> true, CONTROL -> false, EXCLUDED -> nullopt.
    static std::vector<std::optional<bool>> horizonLabels(const Cohort& cohort, double horizon);

    /**
     * @brief Full ROC curve and trapezoidal AUC, anchored at (0,0) and (1,1).
     * @post Returns nullopt when either the case or the control set is empty.
     */
    static std::optional<ROCResult> compute(const Cohort& cohort,
                                            const std::vector<std::optional<int>>& scores,
                                            double horizon);

    // Sensitivity/specificity of the rule score >= cut; nullopt when a set is empty.
    static std::optional<OperatingPoint> operatingPoint(const Cohort& cohort,
                                                        const std::vector<std::optional<int>>& scores,
                                                        double horizon,
                                                        int cut);
};
