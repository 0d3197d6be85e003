#include "ReportExporter.h"
#include "PrognosExceptions.h"

#include <cmath>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {
std::string escapeJsonString(const std::string& input) {
    std::string escaped;
    escaped.reserve(input.size());
    for (char ch : input) {
        switch (ch) {
            case '"': escaped += "\\\""; break;
            case '\\': escaped += "\\\\"; break;
            case '\b': escaped += "\\b"; break;
            case '\f': escaped += "\\f"; break;
            case '\n': escaped += "\\n"; break;
            case '\r': escaped += "\\r"; break;
            case '\t': escaped += "\\t"; break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(static_cast<unsigned char>(ch)));
                    escaped += buf;
                } else {
                    escaped += ch;
                }
                break;
        }
    }
    return escaped;
}

std::string quoted(const std::string& s) {
    return "\"" + escapeJsonString(s) + "\"";
}

std::string number(double v) {
    if (!std::isfinite(v)) return "null";
    std::ostringstream os;
    os << std::setprecision(10) << v;
    return os.str();
}

std::string number(const std::optional<double>& v) {
    return v ? number(*v) : "null";
}

std::string threshold(const Threshold& t) {
    std::ostringstream os;
    os << "{ \"variable\": " << quoted(t.variable)
       << ", \"direction\": " << quoted(directionSymbol(t.direction))
       << ", \"cut\": " << number(t.cut)
       << ", \"sensitivity\": " << number(t.sensitivity)
       << ", \"specificity\": " << number(t.specificity)
       << ", \"youden\": " << number(t.youden)
       << ", \"ci_lower\": " << (t.confidence ? number(t.confidence->first) : "null")
       << ", \"ci_upper\": " << (t.confidence ? number(t.confidence->second) : "null")
       << ", \"bootstrap_evaluated\": " << t.bootstrapEvaluated
       << ", \"bootstrap_skipped\": " << t.bootstrapSkipped << " }";
    return os.str();
}

std::string operatingPoint(const std::optional<OperatingPoint>& op) {
    if (!op) return "null";
    std::ostringstream os;
    os << "{ \"threshold\": " << op->threshold
       << ", \"sensitivity\": " << number(op->sensitivity)
       << ", \"specificity\": " << number(op->specificity)
       << ", \"cases\": " << op->cases << ", \"controls\": " << op->controls << " }";
    return os.str();
}

std::string roc(const std::optional<ROCResult>& r) {
    if (!r) return "null";
    std::ostringstream os;
    os << "{ \"auc\": " << number(r->auc) << ", \"cases\": " << r->cases << ", \"controls\": " << r->controls
       << ", \"excluded\": " << r->excluded << ", \"points\": [";
    for (size_t i = 0; i < r->points.size(); ++i) {
        const auto& p = r->points[i];
        os << (i == 0 ? "" : ", ") << "{ \"threshold\": " << number(p.threshold)
           << ", \"sensitivity\": " << number(p.sensitivity) << ", \"specificity\": " << number(p.specificity) << " }";
    }
    os << "] }";
    return os.str();
}

std::string bootstrap(const BootstrapReport& r) {
    std::ostringstream os;
    os << "{ \"metric\": " << quoted(r.metric)
       << ", \"original\": " << number(r.original)
       << ", \"mean_apparent\": " << number(r.meanApparent)
       << ", \"mean_test\": " << number(r.meanTest)
       << ", \"mean_optimism\": " << number(r.meanOptimism)
       << ", \"bias_corrected\": " << number(r.biasCorrected)
       << ", \"ci_lower\": " << number(r.ciLower)
       << ", \"ci_upper\": " << number(r.ciUpper)
       << ", \"requested\": " << r.requested
       << ", \"evaluated\": " << r.evaluated
       << ", \"skipped\": " << r.skipped
       << ", \"skip_rate\": " << number(r.skipRate)
       << ", \"skip_reasons\": {";
    size_t k = 0;
    for (const auto& kv : r.skipReasons) {
        os << (k++ == 0 ? " " : ", ") << quoted(kv.first) << ": " << kv.second;
    }
    os << (r.skipReasons.empty() ? "" : " ") << "} }";
    return os.str();
}

std::string stratification(const std::optional<StratificationResult>& s) {
    if (!s) return "null";
    std::ostringstream os;
    os << "{ \"categories\": [";
    for (size_t i = 0; i < s->categories.size(); ++i) {
        const auto& c = s->categories[i];
        os << (i == 0 ? "" : ", ") << "{ \"name\": " << quoted(c.name) << ", \"lower\": " << c.lower
           << ", \"upper\": " << c.upper << ", \"subjects\": " << c.subjects << ", \"events\": " << c.events
           << ", \"event_rate\": " << number(c.eventRate) << " }";
    }
    os << "], \"odds_ratios\": [";
    for (size_t i = 0; i < s->oddsRatios.size(); ++i) {
        const auto& o = s->oddsRatios[i];
        os << (i == 0 ? "" : ", ") << "{ \"lower\": " << quoted(o.lowerCategory) << ", \"upper\": " << quoted(o.upperCategory);
        if (o.estimable) {
            os << ", \"odds_ratio\": " << number(o.oddsRatio) << ", \"ci_lower\": " << number(o.ciLower)
               << ", \"ci_upper\": " << number(o.ciUpper);
        } else {
            os << ", \"odds_ratio\": null, \"ci_lower\": null, \"ci_upper\": null";
        }
        os << ", \"continuity_corrected\": " << (o.continuityCorrected ? "true" : "false") << " }";
    }
    os << "] }";
    return os.str();
}

std::string batch(const BatchSummary& b) {
    std::ostringstream os;
    os << "{ \"total\": " << b.total << ", \"valid\": " << b.valid << ", \"invalid\": " << b.invalid;
    if (b.valid > 0) {
        os << ", \"mean\": " << number(b.meanScore) << ", \"min\": " << b.minScore << ", \"max\": " << b.maxScore;
    } else {
        os << ", \"mean\": null, \"min\": null, \"max\": null";
    }
    os << ", \"risk_distribution\": {";
    size_t k = 0;
    for (const auto& kv : b.riskDistribution) {
        os << (k++ == 0 ? " " : ", ") << quoted(kv.first) << ": " << kv.second;
    }
    os << (b.riskDistribution.empty() ? "" : " ") << "} }";
    return os.str();
}
} // namespace

std::string ReportExporter::toJson(const ValidationResult& result) {
    std::ostringstream out;
    out << "{\n  \"cohort\": { \"subjects\": " << result.cohortSize
        << ", \"rows_read\": " << result.load.rowsRead
        << ", \"excluded\": " << result.load.subjectsExcluded
        << ", \"malformed_rows\": " << result.load.malformedRows << " },\n";
    out << "  \"max_score\": " << result.maxScore << ",\n";
    out << "  \"high_risk_threshold\": " << result.highRiskThreshold << ",\n";
    out << "  \"outcome_horizon\": " << number(result.outcomeHorizon) << ",\n";
    out << "  \"risk_categories\": [";
    for (size_t i = 0; i < result.categories.size(); ++i) {
        const auto& c = result.categories[i];
        out << (i == 0 ? "" : ", ") << "{ \"name\": " << quoted(c.name) << ", \"lower\": " << c.lower
            << ", \"upper\": " << c.upper << ", \"recommendation\": " << quoted(c.recommendation) << " }";
    }
    out << "],\n  \"landmarks\": [\n";

    for (size_t li = 0; li < result.landmarks.size(); ++li) {
        const auto& lm = result.landmarks[li];
        out << "    {\n      \"landmark_day\": " << number(lm.landmarkDay)
            << ",\n      \"subjects_at_risk\": " << lm.subjectsAtRisk
            << ",\n      \"events_within_outcome_horizon\": " << lm.eventsWithinOutcomeHorizon
            << ",\n      \"evaluable\": " << (lm.evaluable ? "true" : "false")
            << ",\n      \"scored\": " << lm.scored
            << ",\n      \"not_scored\": " << lm.excludedFromScoring
            << ",\n      \"notes\": [";
        for (size_t i = 0; i < lm.notes.size(); ++i) out << (i == 0 ? "" : ", ") << quoted(lm.notes[i]);
        out << "],\n      \"thresholds\": [";
        for (size_t i = 0; i < lm.thresholds.size(); ++i) out << (i == 0 ? "" : ", ") << threshold(lm.thresholds[i]);
        out << "],\n      \"horizons\": [";
        for (size_t i = 0; i < lm.horizons.size(); ++i) {
            const auto& h = lm.horizons[i];
            out << (i == 0 ? "" : ", ") << "{ \"horizon\": " << number(h.horizon) << ", \"roc\": " << roc(h.roc)
                << ", \"high_risk\": " << operatingPoint(h.highRisk) << " }";
        }
        out << "],\n      \"c_index\": " << number(lm.cIndex)
            << ",\n      \"outcome_operating_point\": " << operatingPoint(lm.outcomeOperatingPoint)
            << ",\n      \"brier\": " << number(lm.brier)
            << ",\n      \"hosmer_lemeshow\": ";
        if (lm.hosmerLemeshow) {
            const auto& hl = *lm.hosmerLemeshow;
            out << "{ \"statistic\": " << number(hl.statistic) << ", \"df\": " << number(hl.degreesOfFreedom)
                << ", \"p_value\": " << number(hl.pValue) << ", \"groups\": " << hl.groups << " }";
        } else {
            out << "null";
        }
        out << ",\n      \"decision_curve\": [";
        for (size_t i = 0; i < lm.decisionCurve.size(); ++i) {
            const auto& p = lm.decisionCurve[i];
            out << (i == 0 ? "" : ", ") << "{ \"threshold\": " << number(p.thresholdProbability)
                << ", \"model\": " << number(p.model) << ", \"treat_all\": " << number(p.treatAll) << " }";
        }
        out << "],\n      \"risk_by_score\": [";
        if (lm.model) {
            for (size_t i = 0; i < lm.model->riskByScore.size(); ++i) {
                out << (i == 0 ? "" : ", ") << number(lm.model->riskByScore[i]);
            }
        }
        out << "],\n      \"stratification\": " << stratification(lm.stratification)
            << ",\n      \"batch\": " << batch(lm.batch)
            << ",\n      \"bootstrap\": [";
        for (size_t i = 0; i < lm.bootstrap.size(); ++i) out << (i == 0 ? "\n        " : ",\n        ") << bootstrap(lm.bootstrap[i]);
        out << (lm.bootstrap.empty() ? "" : "\n      ") << "]\n    }" << (li + 1 == result.landmarks.size() ? "" : ",") << "\n";
    }
    out << "  ]\n}\n";
    return out.str();
}

std::string ReportExporter::toJson(const ScoringResult& result, const RiskPartition& partition) {
    std::ostringstream out;
    out << "{\n  \"max_score\": " << result.maxScore << ",\n  \"summary\": " << batch(result.summary)
        << ",\n  \"subjects\": [\n";
    for (size_t i = 0; i < result.breakdowns.size(); ++i) {
        const auto& b = result.breakdowns[i];
        out << "    { \"id\": " << quoted(result.subjectIds[i]) << ", \"score\": ";
        if (b.valid) {
            out << b.total << ", \"category\": " << quoted(partition.categorize(b.total).name);
        } else {
            out << "null, \"category\": null";
        }
        out << ", \"valid\": " << (b.valid ? "true" : "false") << ", \"components\": {";
        for (size_t k = 0; k < b.components.size(); ++k) {
            out << (k == 0 ? " " : ", ") << quoted(b.components[k].variable) << ": " << b.components[k].points;
        }
        out << (b.components.empty() ? "" : " ") << "}, \"warnings\": [";
        for (size_t k = 0; k < b.warnings.size(); ++k) out << (k == 0 ? "" : ", ") << quoted(b.warnings[k]);
        out << "] }" << (i + 1 == result.breakdowns.size() ? "" : ",") << "\n";
    }
    out << "  ]\n}\n";
    return out.str();
}

void ReportExporter::writeFile(const std::string& path, const std::string& json) {
    std::ofstream out(path);
    if (!out) {
        throw Prognos::IOException("Failed to open output file: " + path);
    }
    out << json;
    if (!out.good()) {
        throw Prognos::IOException("Failed while writing output file: " + path);
    }
    std::cout << "[Prognos] Results exported to: " << path << "\n";
}
