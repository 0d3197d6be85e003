#include "CohortStore.h"
#include "CommonUtils.h"
#include "PrognosExceptions.h"

#include <cmath>
#include <fstream>
#include <iostream>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace {
std::optional<double> parseNumberCell(const std::string& raw) {
    const std::string v = CommonUtils::trim(raw);
    try {
        size_t pos = 0;
        const double parsed = std::stod(v, &pos);
        if (pos != v.size() || !std::isfinite(parsed)) return std::nullopt;
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

size_t requireColumn(const std::unordered_map<std::string, size_t>& columns, const std::string& name) {
    auto it = columns.find(name);
    if (it == columns.end()) {
        throw Prognos::DatasetException("required column '" + name + "' not found in header");
    }
    return it->second;
}

// Reason string on failure, empty on success.
std::string parseCovariate(const CovariateSpec& spec, const std::string& raw, std::optional<double>& out) {
    out.reset();
    if (CommonUtils::isMissingToken(raw)) return {};

    if (spec.kind == CovariateKind::BINARY) {
        bool flag = false;
        if (!CommonUtils::parseBoolToken(raw, flag)) {
            return "binary covariate " + spec.name + " has unrecognised value '" + raw + "'";
        }
        out = flag ? 1.0 : 0.0;
        return {};
    }

    const auto value = parseNumberCell(raw);
    if (!value) return "covariate " + spec.name + " is not numeric: '" + raw + "'";
    if (!spec.inRange(*value)) {
        return "covariate " + spec.name + "=" + CommonUtils::trim(raw) + " outside valid range";
    }
    out = value;
    return {};
}
} // namespace

CohortStore::CohortStore(std::shared_ptr<const CovariateSchema> schema, CohortLoadOptions options)
    : schema_(std::move(schema)), options_(std::move(options)) {
    if (!schema_) throw Prognos::DatasetException("cohort store requires a covariate schema");
}

Cohort CohortStore::loadCsv(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw Prognos::IOException("Could not open cohort file: " + path);
    return loadStream(in);
}

Cohort CohortStore::loadStream(std::istream& in) {
    CSVUtils::CSVTable table = CSVUtils::readTable(in, options_.delimiter);
    const size_t malformed = table.malformedRows;
    Cohort cohort = fromRecords(table.header, table.rows);
    report_.malformedRows = malformed;
    report_.rowsRead += malformed;
    if (malformed > 0) {
        std::cerr << "[Prognos][Cohort] Dropped " << malformed << " malformed CSV row(s)\n";
    }
    return cohort;
}

Cohort CohortStore::fromRecords(const std::vector<std::string>& header,
                                const std::vector<std::vector<std::string>>& rows) {
    report_ = CohortLoadReport{};

    std::unordered_map<std::string, size_t> columns;
    for (size_t i = 0; i < header.size(); ++i) columns.emplace(header[i], i);

    const size_t idCol = requireColumn(columns, options_.idColumn);
    const size_t timeCol = requireColumn(columns, options_.timeColumn);
    const size_t eventCol = requireColumn(columns, options_.eventColumn);

    const auto& specs = schema_->covariates();
    std::vector<size_t> covariateCols;
    covariateCols.reserve(specs.size());
    for (const auto& spec : specs) covariateCols.push_back(requireColumn(columns, spec.name));

    std::vector<Subject> subjects;
    subjects.reserve(rows.size());
    std::unordered_set<std::string> seenIds;

    auto exclude = [&](const std::string& id, const std::string& reason) {
        ++report_.subjectsExcluded;
        report_.exclusions.emplace_back(id, reason);
        std::cerr << "[Prognos][Cohort] Excluding subject '" << id << "': " << reason << "\n";
    };

    for (size_t r = 0; r < rows.size(); ++r) {
        const auto& row = rows[r];
        ++report_.rowsRead;
        if (row.size() != header.size()) {
            exclude("row " + std::to_string(r + 1), "expected " + std::to_string(header.size()) + " fields");
            continue;
        }

        Subject subject;
        subject.id = CommonUtils::trim(row[idCol]);
        if (subject.id.empty()) {
            exclude("row " + std::to_string(r + 1), "empty subject id");
            continue;
        }
        if (!seenIds.insert(subject.id).second) {
            exclude(subject.id, "duplicate subject id");
            continue;
        }

        const auto time = parseNumberCell(row[timeCol]);
        if (!time || *time <= 0.0) {
            exclude(subject.id, "time_to_event must be a number > 0, got '" + row[timeCol] + "'");
            continue;
        }
        subject.timeToEvent = *time;

        bool event = false;
        if (!CommonUtils::parseBoolToken(row[eventCol], event)) {
            exclude(subject.id, "unrecognised event indicator '" + row[eventCol] + "'");
            continue;
        }
        subject.event = event;

        subject.covariates.resize(specs.size());
        std::string failure;
        for (size_t c = 0; c < specs.size() && failure.empty(); ++c) {
            failure = parseCovariate(specs[c], row[covariateCols[c]], subject.covariates[c]);
        }
        if (!failure.empty()) {
            exclude(subject.id, failure);
            continue;
        }

        const size_t missing = subject.missingCount();
        if (missing > options_.maxMissingCovariates) {
            exclude(subject.id, std::to_string(missing) + " missing covariates exceeds limit of " +
                                    std::to_string(options_.maxMissingCovariates));
            continue;
        }

        subjects.push_back(std::move(subject));
    }

    report_.subjectsLoaded = subjects.size();
    if (subjects.empty()) {
        throw Prognos::DatasetException("no valid subjects after validation (" +
                                        std::to_string(report_.subjectsExcluded) + " excluded)");
    }
    return Cohort(schema_, std::move(subjects));
}
