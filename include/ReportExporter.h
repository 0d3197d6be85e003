#pragma once

#include "ValidationPipeline.h"

#include <string>

/**
 * @brief JSON rendering of pipeline results for downstream reporting and plotting tools.
 * @details Non-evaluable values are written as null, never as 0.
 */
class ReportExporter {
public:
    static std::string toJson(const ValidationResult& result);
    static std::string toJson(const ScoringResult& result, const RiskPartition& partition);

    /**
     * @throws Prognos::IOException when the file cannot be opened or written.
     */
    static void writeFile(const std::string& path, const std::string& json);
};
