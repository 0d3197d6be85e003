#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

enum class CovariateKind { CONTINUOUS, BINARY };

struct CovariateSpec {
    std::string name;
    CovariateKind kind = CovariateKind::CONTINUOUS;
    std::optional<double> minValue;
    std::optional<double> maxValue;

    bool inRange(double value) const {
        if (minValue && value < *minValue) return false;
        if (maxValue && value > *maxValue) return false;
        return true;
    }
};

/**
 * @brief Ordered, name-checked list of covariates shared by every subject of a cohort.
 * @details Subjects store covariate values positionally; the schema is the only place
 *          that maps names to positions, so a renamed or misspelled column fails here
 *          once instead of silently producing missing values downstream.
 */
class CovariateSchema {
public:
    CovariateSchema() = default;

    /**
     * @throws Prognos::DatasetException on empty or duplicate covariate names.
     */
    explicit CovariateSchema(std::vector<CovariateSpec> covariates);

    size_t size() const noexcept { return covariates_.size(); }
    const std::vector<CovariateSpec>& covariates() const noexcept { return covariates_; }
    const CovariateSpec& at(size_t index) const { return covariates_.at(index); }

    std::optional<size_t> indexOf(const std::string& name) const;

    /**
     * @throws Prognos::DatasetException when `name` is not part of the schema.
     */
    size_t requireIndex(const std::string& name) const;

private:
    std::vector<CovariateSpec> covariates_;
};

struct Subject {
    std::string id;
    std::vector<std::optional<double>> covariates;
    double timeToEvent = 0.0;
    bool event = false;

    size_t missingCount() const;
};

/**
 * @brief Immutable ordered collection of subjects sharing one schema.
 * @details A cohort is never modified after construction; landmarking and
 *          bootstrap resampling produce new, independently owned cohorts.
 */
class Cohort {
public:
    /**
     * @pre every subject carries exactly schema->size() covariate slots.
     * @post landmarkDay() reports the cumulative shift of the time origin.
     * @throws Prognos::DatasetException on null schema, slot mismatch or non-positive time.
     */
    Cohort(std::shared_ptr<const CovariateSchema> schema, std::vector<Subject> subjects, double landmarkDay = 0.0);

    size_t size() const noexcept { return subjects_.size(); }
    bool empty() const noexcept { return subjects_.empty(); }
    const std::vector<Subject>& subjects() const noexcept { return subjects_; }
    const Subject& subject(size_t index) const { return subjects_.at(index); }
    const CovariateSchema& schema() const noexcept { return *schema_; }
    const std::shared_ptr<const CovariateSchema>& sharedSchema() const noexcept { return schema_; }
    double landmarkDay() const noexcept { return landmarkDay_; }

    size_t eventCount() const;

    /**
     * @brief Values of one covariate in subject order, missing entries kept as nullopt.
     */
    std::vector<std::optional<double>> covariateColumn(size_t covariateIndex) const;

    /**
     * @brief Builds a new cohort from the given subject positions; positions may repeat.
     * @throws std::out_of_range for an index outside [0, size()).
     */
    Cohort resample(const std::vector<size_t>& indices) const;

private:
    std::shared_ptr<const CovariateSchema> schema_;
    std::vector<Subject> subjects_;
    double landmarkDay_ = 0.0;
};
