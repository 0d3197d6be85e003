#include "ValidationPipeline.h"
#include "Concordance.h"
#include "LandmarkBuilder.h"
#include "PrognosExceptions.h"
#include "TerminalReport.h"

#include <algorithm>
#include <iostream>
#include <sstream>
#include <utility>

namespace {
constexpr double kDecisionCurveFrom = 0.01;
constexpr double kDecisionCurveTo = 0.99;

std::string formatDays(double days) {
    std::ostringstream os;
    os << days;
    return os.str();
}

std::vector<std::optional<int>> scoresOf(const Cohort& cohort, const ScoreModel& model) {
    return model.calculator().scoreCohort(cohort).scores;
}
} // namespace

ValidationPipeline::ValidationPipeline(ValidationConfig config)
    : config_(std::move(config)),
      schema_(config_.buildSchema()),
      baseDefinition_(config_.buildDefinition(schema_)),
      partition_(config_.buildPartition(baseDefinition_.maxScore())) {}

Cohort ValidationPipeline::loadCohort(CohortLoadReport& report) const {
    CohortStore store(schema_, config_.loadOptions());
    Cohort cohort = store.loadCsv(config_.datasetPath);
    report = store.lastReport();
    std::cout << "[Prognos][Cohort] Loaded " << report.subjectsLoaded << " subjects from " << config_.datasetPath
              << " (" << report.subjectsExcluded << " excluded, " << report.malformedRows << " malformed rows)\n";
    return cohort;
}

ValidationResult ValidationPipeline::run() const {
    CohortLoadReport report;
    const Cohort cohort = loadCohort(report);
    ValidationResult result = run(cohort);
    result.load = std::move(report);
    return result;
}

ValidationResult ValidationPipeline::run(const Cohort& cohort) const {
    ValidationResult result;
    result.cohortSize = cohort.size();
    result.maxScore = baseDefinition_.maxScore();
    result.highRiskThreshold = partition_.highRiskThreshold();
    result.outcomeHorizon = config_.outcomeHorizon;
    result.categories = partition_.categories();

    for (double day : config_.landmarkDays) {
        result.landmarks.push_back(runLandmark(cohort, day));
    }
    return result;
}

ScoringResult ValidationPipeline::score() const {
    CohortLoadReport report;
    const Cohort cohort = loadCohort(report);
    ScoringResult result = score(cohort);
    result.load = std::move(report);
    return result;
}

ScoringResult ValidationPipeline::score(const Cohort& cohort) const {
    const ScoreCalculator calculator(baseDefinition_, config_.missingPolicy, config_.maxMissingComponents);
    ScoringResult result;
    result.maxScore = baseDefinition_.maxScore();
    result.subjectIds.reserve(cohort.size());
    result.breakdowns.reserve(cohort.size());
    for (const auto& s : cohort.subjects()) {
        result.subjectIds.push_back(s.id);
        result.breakdowns.push_back(calculator.explain(s));
    }
    result.scored = calculator.scoreCohort(cohort);
    for (const auto& ex : result.scored.exclusions) {
        std::cerr << "[Prognos][Score] Subject '" << ex.first << "' not scored: " << ex.second << "\n";
    }
    result.summary = RiskStratifier(partition_).summarize(result.scored);
    return result;
}

ScoreModel ValidationPipeline::developModel(const Cohort& landmarkCohort,
                                            size_t ciIterations,
                                            std::vector<Threshold>* thresholds) const {
    const double H = config_.outcomeHorizon;
    ScoreDefinition definition = baseDefinition_;
    std::vector<Threshold> derived;

    if (config_.deriveCuts) {
        const auto labels = TimeDependentROC::horizonLabels(landmarkCohort, H);
        for (const auto& c : baseDefinition_.components()) {
            if (c.kind != CovariateKind::CONTINUOUS) continue;
            derived.push_back(ThresholdOptimizer::optimize(landmarkCohort, c.variable, labels, c.direction,
                                                           ciIterations, config_.randomSeed));
        }
        definition = baseDefinition_.withCuts(derived);
    }

    const ScoreCalculator calculator(definition, config_.missingPolicy, config_.maxMissingComponents);
    const ScoredCohort scored = calculator.scoreCohort(landmarkCohort);
    std::vector<double> risk = Calibration::fitScoreRisk(landmarkCohort, scored.scores, H, definition.maxScore());

    if (thresholds) *thresholds = std::move(derived);
    return ScoreModel{std::move(definition), std::move(risk), config_.missingPolicy, config_.maxMissingComponents};
}

std::vector<NamedMetric> ValidationPipeline::buildMetrics(const std::vector<double>& evaluableHorizons) const {
    const double H = config_.outcomeHorizon;
    const int cut = partition_.highRiskThreshold();
    std::vector<NamedMetric> metrics;

    for (double h : evaluableHorizons) {
        metrics.push_back({"auc@" + formatDays(h), [h](const Cohort& c, const ScoreModel& m) -> std::optional<double> {
                               const auto roc = TimeDependentROC::compute(c, scoresOf(c, m), h);
                               if (!roc) return std::nullopt;
                               return roc->auc;
                           }});
    }
    metrics.push_back({"c_index", [H](const Cohort& c, const ScoreModel& m) {
                           return Concordance::cIndex(c, scoresOf(c, m), H);
                       }});
    metrics.push_back({"brier@" + formatDays(H), [H](const Cohort& c, const ScoreModel& m) {
                           return Calibration::brierScore(c, scoresOf(c, m), H, m.riskByScore);
                       }});
    metrics.push_back({"sensitivity@" + formatDays(H),
                       [H, cut](const Cohort& c, const ScoreModel& m) -> std::optional<double> {
                           const auto op = TimeDependentROC::operatingPoint(c, scoresOf(c, m), H, cut);
                           if (!op) return std::nullopt;
                           return op->sensitivity;
                       }});
    metrics.push_back({"specificity@" + formatDays(H),
                       [H, cut](const Cohort& c, const ScoreModel& m) -> std::optional<double> {
                           const auto op = TimeDependentROC::operatingPoint(c, scoresOf(c, m), H, cut);
                           if (!op) return std::nullopt;
                           return op->specificity;
                       }});
    return metrics;
}

LandmarkResult ValidationPipeline::runLandmark(const Cohort& cohort, double landmarkDay) const {
    const double H = config_.outcomeHorizon;
    double followUp = H;
    for (double h : config_.horizons) followUp = std::max(followUp, h);

    LandmarkResult out;
    out.landmarkDay = landmarkDay;
    const Cohort atRisk = LandmarkBuilder::build(cohort, landmarkDay, followUp);
    const auto labels = TimeDependentROC::horizonLabels(atRisk, H);
    out.subjectsAtRisk = atRisk.size();
    out.eventsWithinOutcomeHorizon = static_cast<size_t>(
        std::count_if(labels.begin(), labels.end(), [](const std::optional<bool>& l) { return l && *l; }));

    std::cout << "[Prognos][Landmark] Day " << formatDays(landmarkDay) << ": " << out.subjectsAtRisk
              << " subjects at risk, " << out.eventsWithinOutcomeHorizon << " events within "
              << formatDays(H) << " days\n";

    if (atRisk.empty()) {
        out.notes.push_back("no subjects at risk at landmark day " + formatDays(landmarkDay));
        return out;
    }

    try {
        out.model.emplace(developModel(atRisk, config_.thresholdBootstrapIterations, &out.thresholds));
    } catch (const Prognos::InsufficientDataError& ex) {
        out.notes.push_back(ex.what());
        std::cerr << "[Prognos][Landmark] Day " << formatDays(landmarkDay) << " not evaluable: " << ex.what() << "\n";
        return out;
    }
    out.evaluable = true;
    const ScoreModel& model = *out.model;

    const ScoredCohort scored = model.calculator().scoreCohort(atRisk);
    out.scored = scored.scored;
    out.excludedFromScoring = scored.excluded;
    if (config_.verbose) {
        for (const auto& ex : scored.exclusions) {
            std::cerr << "[Prognos][Score] Subject '" << ex.first << "' not scored: " << ex.second << "\n";
        }
    }

    const int cut = partition_.highRiskThreshold();
    std::vector<double> evaluableHorizons;
    for (double h : config_.horizons) {
        HorizonResult hr;
        hr.horizon = h;
        hr.roc = TimeDependentROC::compute(atRisk, scored.scores, h);
        hr.highRisk = TimeDependentROC::operatingPoint(atRisk, scored.scores, h, cut);
        if (hr.roc) {
            evaluableHorizons.push_back(h);
        } else {
            out.notes.push_back("time-dependent AUC at " + formatDays(h) + " days not evaluable");
        }
        out.horizons.push_back(std::move(hr));
    }

    out.cIndex = Concordance::cIndex(atRisk, scored.scores, H);
    out.outcomeOperatingPoint = TimeDependentROC::operatingPoint(atRisk, scored.scores, H, cut);
    out.brier = Calibration::brierScore(atRisk, scored.scores, H, model.riskByScore);
    out.hosmerLemeshow = Calibration::hosmerLemeshow(atRisk, scored.scores, H, model.riskByScore);

    if (out.outcomeOperatingPoint) {
        const auto& op = *out.outcomeOperatingPoint;
        const double prevalence = static_cast<double>(op.cases) / static_cast<double>(op.cases + op.controls);
        out.decisionCurve = Calibration::decisionCurve(
            prevalence, op.sensitivity, op.specificity,
            Calibration::thresholdGrid(kDecisionCurveFrom, kDecisionCurveTo, config_.decisionCurvePoints));
    }

    std::vector<int> stratScores;
    std::vector<bool> stratOutcomes;
    for (size_t i = 0; i < atRisk.size(); ++i) {
        if (!scored.scores[i] || !labels[i]) continue;
        stratScores.push_back(*scored.scores[i]);
        stratOutcomes.push_back(*labels[i]);
    }
    const RiskStratifier stratifier(partition_);
    if (!stratScores.empty()) out.stratification = stratifier.stratify(stratScores, stratOutcomes);
    out.batch = stratifier.summarize(scored);

    std::vector<NamedMetric> metrics;
    for (auto& m : buildMetrics(evaluableHorizons)) {
        if (m.evaluate(atRisk, model)) {
            metrics.push_back(std::move(m));
        } else {
            out.notes.push_back("metric " + m.name + " not evaluable on the landmark cohort, not bootstrapped");
        }
    }
    if (metrics.empty()) return out;

    BootstrapOptions options;
    options.iterations = config_.bootstrapIterations;
    options.skipTolerance = config_.skipTolerance;
    options.seed = config_.randomSeed;
    if (config_.verbose) {
        const std::string label = "bootstrap day " + formatDays(landmarkDay);
        options.progress = [label](size_t done, size_t total) { TerminalReport::printProgressBar(label, done, total); };
    }
    const BootstrapValidator validator(options);
    const ModelDeveloper develop = [this](const Cohort& sample) { return developModel(sample, 0, nullptr); };
    out.bootstrap = validator.validate(atRisk, develop, metrics);
    return out;
}
