#include "Cohort.h"
#include "PrognosExceptions.h"

#include <algorithm>
#include <cmath>
#include <unordered_set>
#include <utility>

CovariateSchema::CovariateSchema(std::vector<CovariateSpec> covariates) : covariates_(std::move(covariates)) {
    std::unordered_set<std::string> seen;
    for (const auto& spec : covariates_) {
        if (spec.name.empty()) {
            throw Prognos::DatasetException("covariate schema contains an empty name");
        }
        if (!seen.insert(spec.name).second) {
            throw Prognos::DatasetException("covariate schema declares '" + spec.name + "' twice");
        }
        if (spec.minValue && spec.maxValue && *spec.minValue > *spec.maxValue) {
            throw Prognos::DatasetException("covariate '" + spec.name + "' has an empty valid range");
        }
    }
}

std::optional<size_t> CovariateSchema::indexOf(const std::string& name) const {
    for (size_t i = 0; i < covariates_.size(); ++i) {
        if (covariates_[i].name == name) return i;
    }
    return std::nullopt;
}

size_t CovariateSchema::requireIndex(const std::string& name) const {
    const auto idx = indexOf(name);
    if (!idx) throw Prognos::DatasetException("covariate '" + name + "' is not declared in the schema");
    return *idx;
}

size_t Subject::missingCount() const {
    return static_cast<size_t>(std::count_if(covariates.begin(), covariates.end(),
                                             [](const std::optional<double>& v) { return !v.has_value(); }));
}

Cohort::Cohort(std::shared_ptr<const CovariateSchema> schema, std::vector<Subject> subjects, double landmarkDay)
    : schema_(std::move(schema)), subjects_(std::move(subjects)), landmarkDay_(landmarkDay) {
    if (!schema_) throw Prognos::DatasetException("cohort requires a covariate schema");
    for (const auto& s : subjects_) {
        if (s.covariates.size() != schema_->size()) {
            throw Prognos::DatasetException("subject '" + s.id + "' has " + std::to_string(s.covariates.size()) +
                                            " covariate slots, schema expects " + std::to_string(schema_->size()));
        }
        if (!std::isfinite(s.timeToEvent) || s.timeToEvent <= 0.0) {
            throw Prognos::DatasetException("subject '" + s.id + "' has non-positive time_to_event");
        }
    }
}

size_t Cohort::eventCount() const {
    return static_cast<size_t>(std::count_if(subjects_.begin(), subjects_.end(),
                                             [](const Subject& s) { return s.event; }));
}

std::vector<std::optional<double>> Cohort::covariateColumn(size_t covariateIndex) const {
    std::vector<std::optional<double>> out;
    out.reserve(subjects_.size());
    for (const auto& s : subjects_) out.push_back(s.covariates.at(covariateIndex));
    return out;
}

Cohort Cohort::resample(const std::vector<size_t>& indices) const {
    std::vector<Subject> picked;
    picked.reserve(indices.size());
    for (size_t idx : indices) picked.push_back(subjects_.at(idx));
    return Cohort(schema_, std::move(picked), landmarkDay_);
}
