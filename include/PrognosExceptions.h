#ifndef PROGNOS_EXCEPTIONS_H
#define PROGNOS_EXCEPTIONS_H

#include <cstddef>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>

namespace Prognos {

class PrognosException : public std::runtime_error {
public:
    explicit PrognosException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public PrognosException {
public:
    explicit IOException(const std::string& message) : PrognosException("IO Error: " + message) {}
};

class DatasetException : public PrognosException {
public:
    explicit DatasetException(const std::string& message) : PrognosException("Dataset Error: " + message) {}
};

class ConfigurationException : public PrognosException {
public:
    explicit ConfigurationException(const std::string& message) : PrognosException("Configuration Error: " + message) {}
};

// An outcome class (cases or controls) is empty for a calculation that needs both.
class InsufficientDataError : public PrognosException {
public:
    explicit InsufficientDataError(const std::string& message) : PrognosException("Insufficient data: " + message) {}
};

class MissingCovariateError : public PrognosException {
public:
    MissingCovariateError(const std::string& subjectId, const std::string& covariate, const std::string& detail)
        : PrognosException("Missing covariate '" + covariate + "' for subject '" + subjectId + "': " + detail),
          subjectId_(subjectId),
          covariate_(covariate) {}

    const std::string& subjectId() const noexcept { return subjectId_; }
    const std::string& covariate() const noexcept { return covariate_; }

private:
    std::string subjectId_;
    std::string covariate_;
};

class InvalidPartitionError : public PrognosException {
public:
    explicit InvalidPartitionError(const std::string& message) : PrognosException("Invalid risk partition: " + message) {}
};

/**
 * @brief Raised when the bootstrap skip rate exceeds the configured tolerance.
 * @details Carries the iteration counts accumulated up to the point of failure so
 *          callers can report how far the run got and why iterations were skipped.
 */
class UnstableBootstrapError : public PrognosException {
public:
    UnstableBootstrapError(const std::string& metric,
                           std::size_t requested,
                           std::size_t evaluated,
                           std::size_t skipped,
                           double tolerance,
                           std::map<std::string, std::size_t> skipReasons)
        : PrognosException("Unstable bootstrap for metric '" + metric + "': " + std::to_string(skipped) +
                           " of " + std::to_string(requested) + " iterations skipped (tolerance " +
                           std::to_string(tolerance) + ")"),
          metric_(metric),
          requested_(requested),
          evaluated_(evaluated),
          skipped_(skipped),
          tolerance_(tolerance),
          skipReasons_(std::move(skipReasons)) {}

    const std::string& metric() const noexcept { return metric_; }
    std::size_t requested() const noexcept { return requested_; }
    std::size_t evaluated() const noexcept { return evaluated_; }
    std::size_t skipped() const noexcept { return skipped_; }
    double tolerance() const noexcept { return tolerance_; }
    const std::map<std::string, std::size_t>& skipReasons() const noexcept { return skipReasons_; }

private:
    std::string metric_;
    std::size_t requested_;
    std::size_t evaluated_;
    std::size_t skipped_;
    double tolerance_;
    std::map<std::string, std::size_t> skipReasons_;
};

} // namespace Prognos

#endif // PROGNOS_EXCEPTIONS_H
