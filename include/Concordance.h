#pragma once

#include "Cohort.h"

#include <optional>
#include <vector>

struct ConcordanceResult {
    double cIndex = 0.0;
    double concordant = 0.0;
    double tied = 0.0;
    double comparable = 0.0;
};

/**
 * @brief Harrell's concordance index for right-censored data; a higher score means higher risk.
 * @details A pair is comparable when the subject with the shorter time had the event. An event
 *          and a censoring at the same time also count, the censored subject treated as outliving.
 *          Tied scores count one half. Runs in O(n log n) over a Fenwick tree of score ranks.
 */
namespace Concordance {
/**
 * @param horizon when set, follow-up is truncated there: later times become censored at the horizon.
 * @post nullopt when no comparable pair exists.
 */
std::optional<ConcordanceResult> harrell(const Cohort& cohort,
                                         const std::vector<std::optional<int>>& scores,
                                         std::optional<double> horizon = std::nullopt);

std::optional<double> cIndex(const Cohort& cohort,
                             const std::vector<std::optional<int>>& scores,
                             std::optional<double> horizon = std::nullopt);
}
