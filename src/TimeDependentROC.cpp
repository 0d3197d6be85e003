#include "TimeDependentROC.h"
#include "PrognosExceptions.h"

#include <algorithm>
#include <cmath>
#include <functional>

namespace {
void splitScores(const Cohort& cohort,
                 const std::vector<std::optional<int>>& scores,
                 double horizon,
                 std::vector<int>& caseScores,
                 std::vector<int>& controlScores,
                 size_t& excluded) {
    if (scores.size() != cohort.size()) {
        throw Prognos::DatasetException("score vector does not match cohort size");
    }
    const auto status = TimeDependentROC::classify(cohort, horizon);
    excluded = 0;
    for (size_t i = 0; i < status.size(); ++i) {
        if (!scores[i] || status[i] == HorizonStatus::EXCLUDED) {
            ++excluded;
        } else if (status[i] == HorizonStatus::CASE) {
            caseScores.push_back(*scores[i]);
        } else {
            controlScores.push_back(*scores[i]);
        }
    }
}
} // namespace

std::vector<HorizonStatus> TimeDependentROC::classify(const Cohort& cohort, double horizon) {
    if (!std::isfinite(horizon) || horizon <= 0.0) {
        throw Prognos::ConfigurationException("ROC horizon must be a finite value > 0");
    }
    std::vector<HorizonStatus> out;
    out.reserve(cohort.size());
    for (const auto& s : cohort.subjects()) {
        if (s.timeToEvent <= horizon && s.event) {
            out.push_back(HorizonStatus::CASE);
        } else if (s.timeToEvent > horizon) {
            out.push_back(HorizonStatus::CONTROL);
        } else {
            out.push_back(HorizonStatus::EXCLUDED);
        }
    }
    return out;
}

std::vector<std::optional<bool>> TimeDependentROC::horizonLabels(const Cohort& cohort, double horizon) {
    const auto status = classify(cohort, horizon);
    std::vector<std::optional<bool>> out;
    out.reserve(status.size());
    for (HorizonStatus s : status) {
        if (s == HorizonStatus::CASE) out.emplace_back(true);
        else if (s == HorizonStatus::CONTROL) out.emplace_back(false);
        else out.emplace_back(std::nullopt);
    }
    return out;
}

std::optional<ROCResult> TimeDependentROC::compute(const Cohort& cohort,
                                                   const std::vector<std::optional<int>>& scores,
                                                   double horizon) {
    std::vector<int> caseScores;
    std::vector<int> controlScores;
    size_t excluded = 0;
    splitScores(cohort, scores, horizon, caseScores, controlScores, excluded);
    if (caseScores.empty() || controlScores.empty()) return std::nullopt;

    std::sort(caseScores.begin(), caseScores.end(), std::greater<int>());
    std::sort(controlScores.begin(), controlScores.end(), std::greater<int>());

    std::vector<int> thresholds(caseScores);
    thresholds.insert(thresholds.end(), controlScores.begin(), controlScores.end());
    std::sort(thresholds.begin(), thresholds.end(), std::greater<int>());
    thresholds.erase(std::unique(thresholds.begin(), thresholds.end()), thresholds.end());

    const double P = static_cast<double>(caseScores.size());
    const double N = static_cast<double>(controlScores.size());

    ROCResult result;
    result.landmarkDay = cohort.landmarkDay();
    result.horizon = horizon;
    result.cases = caseScores.size();
    result.controls = controlScores.size();
    result.excluded = excluded;
    result.points.reserve(thresholds.size());

    double prevFpr = 0.0;
    double prevTpr = 0.0;
    double area = 0.0;
    size_t ci = 0;
    size_t ni = 0;
    for (int c : thresholds) {
        while (ci < caseScores.size() && caseScores[ci] >= c) ++ci;
        while (ni < controlScores.size() && controlScores[ni] >= c) ++ni;
        RocPoint p;
        p.threshold = static_cast<double>(c);
        p.sensitivity = static_cast<double>(ci) / P;
        p.specificity = 1.0 - static_cast<double>(ni) / N;
        const double fpr = 1.0 - p.specificity;
        area += (fpr - prevFpr) * (p.sensitivity + prevTpr) * 0.5;
        prevFpr = fpr;
        prevTpr = p.sensitivity;
        result.points.push_back(p);
    }
    area += (1.0 - prevFpr) * (1.0 + prevTpr) * 0.5;
    result.auc = std::clamp(area, 0.0, 1.0);
    return result;
}

std::optional<OperatingPoint> TimeDependentROC::operatingPoint(const Cohort& cohort,
                                                               const std::vector<std::optional<int>>& scores,
                                                               double horizon,
                                                               int cut) {
    std::vector<int> caseScores;
    std::vector<int> controlScores;
    size_t excluded = 0;
    splitScores(cohort, scores, horizon, caseScores, controlScores, excluded);
    if (caseScores.empty() || controlScores.empty()) return std::nullopt;

    OperatingPoint op;
    op.threshold = cut;
    op.cases = caseScores.size();
    op.controls = controlScores.size();
    const auto truePos = std::count_if(caseScores.begin(), caseScores.end(), [cut](int s) { return s >= cut; });
    const auto trueNeg = std::count_if(controlScores.begin(), controlScores.end(), [cut](int s) { return s < cut; });
    op.sensitivity = static_cast<double>(truePos) / static_cast<double>(op.cases);
    op.specificity = static_cast<double>(trueNeg) / static_cast<double>(op.controls);
    return op;
}
