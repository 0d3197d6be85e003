#include "TerminalReport.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {
const std::string kRule(100, '=');
const std::string kThinRule(100, '-');

// Restores std::cout flags and precision on scope exit.
class CoutFormatGuard {
public:
    CoutFormatGuard() : flags_(std::cout.flags()), precision_(std::cout.precision()) {}
    ~CoutFormatGuard() {
        std::cout.flags(flags_);
        std::cout.precision(precision_);
    }
    CoutFormatGuard(const CoutFormatGuard&) = delete;
    CoutFormatGuard& operator=(const CoutFormatGuard&) = delete;

private:
    std::ios_base::fmtflags flags_;
    std::streamsize precision_;
};

void printOptional(const std::optional<double>& v, int width, int precision = 3) {
    if (v) {
        std::cout << std::setw(width) << std::fixed << std::setprecision(precision) << *v;
    } else {
        std::cout << std::setw(width) << "n/a";
    }
}

std::string formatDays(double days) {
    std::ostringstream os;
    os << days;
    return os.str();
}

void printTitle(const std::string& title) {
    const size_t used = title.size() + 2;
    const size_t free = used < kRule.size() ? kRule.size() - used : 0;
    std::cout << "\n" << std::string(free / 2, '=') << " " << title << " " << std::string(free - free / 2, '=') << "\n";
}
} // namespace

void TerminalReport::printProgressBar(const std::string& label, size_t current, size_t total) {
    const size_t width = 24;
    const double ratio = (total == 0) ? 0.0 : std::clamp(static_cast<double>(current) / static_cast<double>(total), 0.0, 1.0);
    const size_t fill = static_cast<size_t>(std::floor(ratio * static_cast<double>(width)));
    std::cout << "\r[Prognos] " << label << " [";
    for (size_t i = 0; i < width; ++i) {
        if (i < fill) std::cout << '=';
        else if (i == fill && fill < width) std::cout << '>';
        else std::cout << ' ';
    }
    std::cout << "] " << static_cast<int>(ratio * 100.0) << "%" << std::flush;
    if (current >= total) {
        std::cout << "\n";
    }
}

void TerminalReport::printLoadSummary(const CohortLoadReport& report) {
    std::cout << "[Prognos][Cohort] rows=" << report.rowsRead << " loaded=" << report.subjectsLoaded
              << " excluded=" << report.subjectsExcluded << " malformed=" << report.malformedRows << "\n";
}

void TerminalReport::printThresholds(const std::vector<Threshold>& thresholds) {
    const CoutFormatGuard guard;
    if (thresholds.empty()) {
        std::cout << "        -> Fixed cut-points in use.\n";
        return;
    }
    std::cout << std::left << std::setw(14) << "Variable" << std::setw(6) << "Dir" << std::right
              << std::setw(10) << "Cut" << std::setw(10) << "Sens" << std::setw(10) << "Spec"
              << std::setw(10) << "Youden" << std::setw(22) << "95% CI (cut)" << "\n";
    std::cout << kThinRule << "\n";
    for (const auto& t : thresholds) {
        std::cout << std::left << std::setw(14) << t.variable << std::setw(6) << directionSymbol(t.direction)
                  << std::right << std::fixed << std::setprecision(2) << std::setw(10) << t.cut
                  << std::setprecision(3) << std::setw(10) << t.sensitivity << std::setw(10) << t.specificity
                  << std::setw(10) << t.youden;
        if (t.confidence) {
            std::cout << "      [" << std::setprecision(2) << t.confidence->first << ", " << t.confidence->second << "]";
        } else {
            std::cout << std::setw(22) << "n/a";
        }
        std::cout << "\n";
    }
}

void TerminalReport::printRocTable(const std::vector<HorizonResult>& horizons) {
    const CoutFormatGuard guard;
    std::cout << std::left << std::setw(12) << "Horizon" << std::right << std::setw(8) << "Cases"
              << std::setw(10) << "Controls" << std::setw(10) << "Excluded" << std::setw(10) << "AUC"
              << std::setw(12) << "Sens(>=T)" << std::setw(12) << "Spec(>=T)" << "\n";
    std::cout << kThinRule << "\n";
    for (const auto& h : horizons) {
        std::cout << std::left << std::setw(12) << (formatDays(h.horizon) + "d") << std::right;
        if (!h.roc) {
            std::cout << std::setw(48) << "non-evaluable (empty case or control set)\n";
            continue;
        }
        std::cout << std::setw(8) << h.roc->cases << std::setw(10) << h.roc->controls << std::setw(10) << h.roc->excluded
                  << std::setw(10) << std::fixed << std::setprecision(3) << h.roc->auc;
        printOptional(h.highRisk ? std::optional<double>(h.highRisk->sensitivity) : std::nullopt, 12);
        printOptional(h.highRisk ? std::optional<double>(h.highRisk->specificity) : std::nullopt, 12);
        std::cout << "\n";
    }
}

void TerminalReport::printDiscrimination(const LandmarkResult& landmark, double outcomeHorizon) {
    const CoutFormatGuard guard;
    std::cout << "        -> C-index: ";
    printOptional(landmark.cIndex, 0);
    std::cout << " | Brier@" << formatDays(outcomeHorizon) << "d: ";
    printOptional(landmark.brier, 0);
    if (landmark.hosmerLemeshow) {
        const auto& hl = *landmark.hosmerLemeshow;
        std::cout << " | Hosmer-Lemeshow: chi2=" << std::fixed << std::setprecision(3) << hl.statistic
                  << " df=" << std::setprecision(0) << hl.degreesOfFreedom << " p=" << std::setprecision(4) << hl.pValue;
    }
    std::cout << "\n";
    if (!landmark.decisionCurve.empty()) {
        std::cout << "        -> Net benefit (model / treat-all):";
        for (const auto& p : landmark.decisionCurve) {
            const double pct = p.thresholdProbability * 100.0;
            if (std::abs(pct - std::round(pct / 10.0) * 10.0) > 1e-9 || pct < 5.0) continue;
            std::cout << " " << std::setprecision(0) << pct << "%=" << std::setprecision(3) << p.model << "/" << p.treatAll;
        }
        std::cout << "\n";
    }
}

void TerminalReport::printBootstrap(const std::vector<BootstrapReport>& reports) {
    const CoutFormatGuard guard;
    if (reports.empty()) return;
    std::cout << std::left << std::setw(18) << "Metric" << std::right << std::setw(10) << "Original"
              << std::setw(10) << "Apparent" << std::setw(10) << "Test" << std::setw(10) << "Optimism"
              << std::setw(12) << "Corrected" << std::setw(20) << "95% CI" << std::setw(10) << "Skipped" << "\n";
    std::cout << kThinRule << "\n";
    for (const auto& r : reports) {
        std::cout << std::left << std::setw(18) << r.metric << std::right << std::fixed << std::setprecision(3)
                  << std::setw(10) << r.original << std::setw(10) << r.meanApparent << std::setw(10) << r.meanTest
                  << std::setw(10) << r.meanOptimism << std::setw(12) << r.biasCorrected
                  << "    [" << r.ciLower << ", " << r.ciUpper << "]"
                  << std::setw(8) << r.skipped << "/" << r.requested << "\n";
    }
}

void TerminalReport::printStratification(const StratificationResult& result) {
    const CoutFormatGuard guard;
    std::cout << std::left << std::setw(12) << "Category" << std::setw(10) << "Range" << std::right
              << std::setw(10) << "Subjects" << std::setw(10) << "Events" << std::setw(10) << "Rate" << "\n";
    std::cout << kThinRule << "\n";
    for (const auto& c : result.categories) {
        std::cout << std::left << std::setw(12) << c.name
                  << std::setw(10) << (std::to_string(c.lower) + "-" + std::to_string(c.upper)) << std::right
                  << std::setw(10) << c.subjects << std::setw(10) << c.events
                  << std::setw(10) << std::fixed << std::setprecision(3) << c.eventRate << "\n";
    }
    for (const auto& o : result.oddsRatios) {
        std::cout << "        -> OR " << o.upperCategory << " vs " << o.lowerCategory << ": ";
        if (!o.estimable) {
            std::cout << "not estimable (empty category)\n";
            continue;
        }
        std::cout << std::fixed << std::setprecision(2) << o.oddsRatio << " [" << o.ciLower << ", " << o.ciUpper << "]"
                  << (o.continuityCorrected ? " (0.5 correction)" : "") << "\n";
    }
}

void TerminalReport::printBatchSummary(const BatchSummary& summary, int maxScore) {
    const CoutFormatGuard guard;
    std::cout << "[Prognos][Score] total=" << summary.total << " valid=" << summary.valid
              << " invalid=" << summary.invalid;
    if (summary.valid > 0) {
        std::cout << " mean=" << std::fixed << std::setprecision(2) << summary.meanScore << "/" << maxScore
                  << " range=" << summary.minScore << "-" << summary.maxScore;
    }
    std::cout << "\n";
    for (const auto& kv : summary.riskDistribution) {
        std::cout << "        -> " << std::left << std::setw(10) << kv.first << std::right << kv.second << "\n";
    }
}

void TerminalReport::printBreakdown(const std::string& subjectId, const ScoreBreakdown& breakdown, const RiskPartition& partition) {
    std::cout << "\n" << kThinRule << "\n";
    std::cout << "SUBJECT " << subjectId << " | SCORE: " << breakdown.total << "/" << breakdown.maxScore;
    if (breakdown.total >= 0 && breakdown.total <= partition.maxScore()) {
        const RiskCategory& c = partition.categorize(breakdown.total);
        std::cout << " | " << c.name;
        if (!c.recommendation.empty()) std::cout << " | " << c.recommendation;
    }
    std::cout << " | " << (breakdown.valid ? "VALID" : "INVALID") << "\n";
    for (const auto& d : breakdown.components) {
        std::cout << "  - " << d.description << "\n";
    }
    if (!breakdown.warnings.empty()) {
        std::cout << "  WARNINGS:\n";
        for (const auto& w : breakdown.warnings) std::cout << "  ! " << w << "\n";
    }
}

void TerminalReport::printValidation(const ValidationResult& result) {
    printLoadSummary(result.load);
    std::cout << "[Prognos] Score range 0-" << result.maxScore << ", high-risk threshold >= " << result.highRiskThreshold
              << ", outcome horizon " << formatDays(result.outcomeHorizon) << " days\n";

    for (const auto& lm : result.landmarks) {
        printTitle("LANDMARK DAY " + formatDays(lm.landmarkDay));
        std::cout << "Subjects at risk: " << lm.subjectsAtRisk << " | events within horizon: "
                  << lm.eventsWithinOutcomeHorizon << " | scored: " << lm.scored
                  << " | not scored: " << lm.excludedFromScoring << "\n";
        for (const auto& note : lm.notes) std::cout << "        [note] " << note << "\n";
        if (!lm.evaluable) continue;

        std::cout << "\n[Cut-points]\n";
        printThresholds(lm.thresholds);
        std::cout << "\n[Time-dependent ROC]\n";
        printRocTable(lm.horizons);
        printDiscrimination(lm, result.outcomeHorizon);
        if (lm.stratification) {
            std::cout << "\n[Risk stratification]\n";
            printStratification(*lm.stratification);
        }
        if (!lm.bootstrap.empty()) {
            std::cout << "\n[Bootstrap internal validation]\n";
            printBootstrap(lm.bootstrap);
        }
    }
    std::cout << kRule << "\n";
}

void TerminalReport::printScoring(const ScoringResult& result, const RiskPartition& partition, bool perSubject) {
    printLoadSummary(result.load);
    if (perSubject) {
        for (size_t i = 0; i < result.breakdowns.size(); ++i) {
            printBreakdown(result.subjectIds[i], result.breakdowns[i], partition);
        }
    }
    printBatchSummary(result.summary, result.maxScore);
}
