#pragma once

#include "ValidationPipeline.h"

#include <string>
#include <vector>

class TerminalReport {
public:
    static void printProgressBar(const std::string& label, size_t current, size_t total);

    static void printLoadSummary(const CohortLoadReport& report);
    static void printThresholds(const std::vector<Threshold>& thresholds);
    static void printRocTable(const std::vector<HorizonResult>& horizons);
    static void printDiscrimination(const LandmarkResult& landmark, double outcomeHorizon);
    static void printBootstrap(const std::vector<BootstrapReport>& reports);
    static void printStratification(const StratificationResult& result);
    static void printBatchSummary(const BatchSummary& summary, int maxScore);

    // Single-subject clinical breakdown.
    static void printBreakdown(const std::string& subjectId, const ScoreBreakdown& breakdown, const RiskPartition& partition);

    static void printValidation(const ValidationResult& result);
    static void printScoring(const ScoringResult& result, const RiskPartition& partition, bool perSubject);
};
