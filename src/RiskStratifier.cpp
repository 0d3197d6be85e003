#include "RiskStratifier.h"
#include "PrognosExceptions.h"

#include <algorithm>
#include <cmath>
#include <unordered_set>
#include <utility>

namespace {
constexpr double kZ975 = 1.959963984540054;
constexpr double kHaldane = 0.5;
} // namespace

RiskPartition::RiskPartition(std::vector<RiskCategory> categories, int maxScore)
    : categories_(std::move(categories)), maxScore_(maxScore) {
    if (maxScore_ < 0) throw Prognos::InvalidPartitionError("maximum score must be >= 0");
    if (categories_.empty()) throw Prognos::InvalidPartitionError("no risk categories defined");

    std::unordered_set<std::string> names;
    int expectedLower = 0;
    for (const auto& c : categories_) {
        if (c.name.empty()) throw Prognos::InvalidPartitionError("risk category with empty name");
        if (!names.insert(c.name).second) {
            throw Prognos::InvalidPartitionError("risk category " + c.name + " declared twice");
        }
        if (c.upper < c.lower) {
            throw Prognos::InvalidPartitionError("category " + c.name + " has upper bound below lower bound");
        }
        if (c.lower != expectedLower) {
            throw Prognos::InvalidPartitionError("category " + c.name + " starts at " + std::to_string(c.lower) +
                                                 ", expected " + std::to_string(expectedLower));
        }
        expectedLower = c.upper + 1;
    }
    if (categories_.back().upper != maxScore_) {
        throw Prognos::InvalidPartitionError("last category ends at " + std::to_string(categories_.back().upper) +
                                             " but the maximum score is " + std::to_string(maxScore_));
    }
}

size_t RiskPartition::indexOf(int score) const {
    if (score < 0 || score > maxScore_) {
        throw Prognos::InvalidPartitionError("score " + std::to_string(score) + " outside [0, " +
                                             std::to_string(maxScore_) + "]");
    }
    for (size_t i = 0; i < categories_.size(); ++i) {
        if (categories_[i].contains(score)) return i;
    }
    throw Prognos::InvalidPartitionError("score " + std::to_string(score) + " not covered");
}

const RiskCategory& RiskPartition::categorize(int score) const {
    return categories_[indexOf(score)];
}

RiskStratifier::RiskStratifier(RiskPartition partition) : partition_(std::move(partition)) {}

StratificationResult RiskStratifier::stratify(const std::vector<int>& scores, const std::vector<bool>& outcomes) const {
    if (scores.size() != outcomes.size()) {
        throw Prognos::DatasetException("score/outcome length mismatch in stratification");
    }

    const auto& cats = partition_.categories();
    StratificationResult out;
    out.categories.reserve(cats.size());
    for (const auto& c : cats) {
        CategorySummary s;
        s.name = c.name;
        s.lower = c.lower;
        s.upper = c.upper;
        out.categories.push_back(s);
    }

    for (size_t i = 0; i < scores.size(); ++i) {
        auto& s = out.categories[partition_.indexOf(scores[i])];
        ++s.subjects;
        if (outcomes[i]) ++s.events;
    }
    for (auto& s : out.categories) {
        s.eventRate = s.subjects > 0 ? static_cast<double>(s.events) / static_cast<double>(s.subjects) : 0.0;
    }

    for (size_t k = 1; k < out.categories.size(); ++k) {
        const auto& lo = out.categories[k - 1];
        const auto& hi = out.categories[k];
        AdjacentOddsRatio orr;
        orr.lowerCategory = lo.name;
        orr.upperCategory = hi.name;
        if (lo.subjects > 0 && hi.subjects > 0) {
            double a = static_cast<double>(hi.events);
            double b = static_cast<double>(hi.subjects - hi.events);
            double c = static_cast<double>(lo.events);
            double d = static_cast<double>(lo.subjects - lo.events);
            if (a == 0.0 || b == 0.0 || c == 0.0 || d == 0.0) {
                a += kHaldane;
                b += kHaldane;
                c += kHaldane;
                d += kHaldane;
                orr.continuityCorrected = true;
            }
            const double logOr = std::log((a * d) / (b * c));
            const double se = std::sqrt(1.0 / a + 1.0 / b + 1.0 / c + 1.0 / d);
            orr.oddsRatio = std::exp(logOr);
            orr.ciLower = std::exp(logOr - kZ975 * se);
            orr.ciUpper = std::exp(logOr + kZ975 * se);
            orr.estimable = true;
        }
        out.oddsRatios.push_back(orr);
    }
    return out;
}

BatchSummary RiskStratifier::summarize(const ScoredCohort& scored) const {
    BatchSummary out;
    out.total = scored.scores.size();
    for (const auto& c : partition_.categories()) out.riskDistribution[c.name] = 0;

    double sum = 0.0;
    bool first = true;
    for (const auto& s : scored.scores) {
        if (!s) {
            ++out.invalid;
            continue;
        }
        ++out.valid;
        sum += *s;
        out.minScore = first ? *s : std::min(out.minScore, *s);
        out.maxScore = first ? *s : std::max(out.maxScore, *s);
        first = false;
        ++out.riskDistribution[partition_.categorize(*s).name];
    }
    if (out.valid > 0) out.meanScore = sum / static_cast<double>(out.valid);
    return out;
}
