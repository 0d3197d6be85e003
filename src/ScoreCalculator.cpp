#include "ScoreCalculator.h"
#include "PrognosExceptions.h"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <unordered_set>

namespace {
std::string formatValue(double v) {
    std::ostringstream os;
    os << std::setprecision(6) << v;
    return os.str();
}

bool meetsRule(const ScoreComponent& c, double value) {
    if (c.kind == CovariateKind::BINARY) return value != 0.0;
    return c.direction == CutDirection::GREATER ? value > *c.cut : value < *c.cut;
}

std::string ruleText(const ScoreComponent& c) {
    if (c.kind == CovariateKind::BINARY) return c.variable + " present";
    return c.variable + " " + directionSymbol(c.direction) + " " + formatValue(*c.cut);
}
} // namespace

ScoreDefinition::ScoreDefinition(std::vector<ScoreComponent> components, std::shared_ptr<const CovariateSchema> schema)
    : components_(std::move(components)), schema_(std::move(schema)) {
    if (!schema_) throw Prognos::ConfigurationException("score definition requires a covariate schema");
    if (components_.empty()) throw Prognos::ConfigurationException("score definition has no components");

    std::unordered_set<std::string> seen;
    indices_.reserve(components_.size());
    for (const auto& c : components_) {
        if (!seen.insert(c.variable).second) {
            throw Prognos::ConfigurationException("score component " + c.variable + " is declared twice");
        }
        if (c.points < 0) {
            throw Prognos::ConfigurationException("score component " + c.variable + " has negative points");
        }
        const size_t idx = schema_->requireIndex(c.variable);
        const CovariateSpec& spec = schema_->at(idx);
        if (spec.kind != c.kind) {
            throw Prognos::ConfigurationException("score component " + c.variable +
                                                  " kind does not match the covariate schema");
        }
        if (c.kind == CovariateKind::BINARY && c.cut) {
            throw Prognos::ConfigurationException("binary score component " + c.variable + " cannot carry a cut");
        }
        if (c.cut && !spec.inRange(*c.cut)) {
            throw Prognos::ConfigurationException("cut " + formatValue(*c.cut) + " for " + c.variable +
                                                  " lies outside the covariate's valid range");
        }
        indices_.push_back(idx);
        maxScore_ += c.points;
    }
}

bool ScoreDefinition::isComplete() const {
    for (const auto& c : components_) {
        if (c.kind == CovariateKind::CONTINUOUS && !c.cut) return false;
    }
    return true;
}

ScoreDefinition ScoreDefinition::withCuts(const std::vector<Threshold>& thresholds) const {
    std::vector<ScoreComponent> updated = components_;
    for (auto& c : updated) {
        if (c.kind != CovariateKind::CONTINUOUS) continue;
        for (const auto& t : thresholds) {
            if (t.variable != c.variable) continue;
            c.cut = t.cut;
            c.direction = t.direction;
        }
    }
    return ScoreDefinition(std::move(updated), schema_);
}

ScoreCalculator::ScoreCalculator(ScoreDefinition definition, MissingPolicy policy, size_t maxMissingComponents)
    : definition_(std::move(definition)), policy_(policy), maxMissing_(maxMissingComponents) {
    if (!definition_.isComplete()) {
        throw Prognos::ConfigurationException("score definition has continuous components without a cut");
    }
}

int ScoreCalculator::score(const Subject& subject) const {
    const auto& components = definition_.components();
    const auto& indices = definition_.covariateIndices();
    int total = 0;
    size_t missing = 0;
    for (size_t i = 0; i < components.size(); ++i) {
        const auto& value = subject.covariates.at(indices[i]);
        if (!value) {
            if (policy_ == MissingPolicy::STRICT) {
                throw Prognos::MissingCovariateError(subject.id, components[i].variable, "no value under strict policy");
            }
            if (++missing > maxMissing_) {
                throw Prognos::MissingCovariateError(subject.id, components[i].variable,
                                                     std::to_string(missing) + " components missing, limit " +
                                                         std::to_string(maxMissing_));
            }
            continue;
        }
        if (meetsRule(components[i], *value)) total += components[i].points;
    }
    return total;
}

ScoreBreakdown ScoreCalculator::explain(const Subject& subject) const {
    ScoreBreakdown out;
    out.maxScore = definition_.maxScore();
    const auto& components = definition_.components();
    const auto& indices = definition_.covariateIndices();

    for (size_t i = 0; i < components.size(); ++i) {
        const ScoreComponent& c = components[i];
        ComponentDetail detail;
        detail.variable = c.variable;
        detail.maxPoints = c.points;
        detail.value = subject.covariates.at(indices[i]);

        if (!detail.value) {
            out.missingComponents.push_back(c.variable);
            out.warnings.push_back(c.variable + " missing, contributes 0 points");
            detail.description = c.variable + " missing (0 points)";
        } else {
            const bool hit = meetsRule(c, *detail.value);
            detail.points = hit ? c.points : 0;
            detail.description = (c.kind == CovariateKind::BINARY)
                                     ? c.variable + (hit ? " present" : " absent")
                                     : c.variable + "=" + formatValue(*detail.value) + (hit ? " meets " : " fails ") +
                                           ruleText(c);
            detail.description += " (" + std::to_string(detail.points) + " points)";
        }
        out.total += detail.points;
        out.components.push_back(std::move(detail));
    }

    if (!out.missingComponents.empty()) {
        if (policy_ == MissingPolicy::STRICT) {
            out.valid = false;
            out.warnings.push_back("strict policy does not score subjects with missing components");
        } else if (out.missingComponents.size() > maxMissing_) {
            out.valid = false;
            out.warnings.push_back(std::to_string(out.missingComponents.size()) +
                                   " components missing exceeds limit of " + std::to_string(maxMissing_));
        }
    }
    return out;
}

ScoredCohort ScoreCalculator::scoreCohort(const Cohort& cohort) const {
    ScoredCohort out;
    out.scores.reserve(cohort.size());
    for (const auto& s : cohort.subjects()) {
        try {
            out.scores.push_back(score(s));
            ++out.scored;
        } catch (const Prognos::MissingCovariateError& ex) {
            out.scores.push_back(std::nullopt);
            ++out.excluded;
            out.exclusions.emplace_back(s.id, ex.what());
        }
    }
    return out;
}
