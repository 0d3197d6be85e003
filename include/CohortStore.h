#pragma once

#include "CSVUtils.h"
#include "Cohort.h"

#include <istream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

struct CohortLoadOptions {
    std::string idColumn = "patient_id";
    std::string timeColumn = "time_to_event";
    std::string eventColumn = "event";
    char delimiter = ',';
    size_t maxMissingCovariates = 2;
};

struct CohortLoadReport {
    size_t rowsRead = 0;
    size_t subjectsLoaded = 0;
    size_t subjectsExcluded = 0;
    size_t malformedRows = 0;
    std::vector<std::pair<std::string, std::string>> exclusions; // (subject id, reason)
};

/**
 * @brief Validates raw CSV rows against a CovariateSchema and materialises an immutable Cohort.
 * @details Column lookup happens once per load. A column the schema requires but the
 *          header lacks aborts the load; a problem confined to one row excludes only
 *          that subject and is recorded in lastReport().
 */
class CohortStore {
public:
    CohortStore(std::shared_ptr<const CovariateSchema> schema, CohortLoadOptions options = {});

    /**
     * @throws Prognos::IOException when the file cannot be opened.
     * @throws Prognos::DatasetException on header problems or an empty result.
     */
    Cohort loadCsv(const std::string& path);
    Cohort loadStream(std::istream& in);
    Cohort fromRecords(const std::vector<std::string>& header, const std::vector<std::vector<std::string>>& rows);

    const CohortLoadReport& lastReport() const noexcept { return report_; }
    const CohortLoadOptions& options() const noexcept { return options_; }

private:
    std::shared_ptr<const CovariateSchema> schema_;
    CohortLoadOptions options_;
    CohortLoadReport report_;
};
