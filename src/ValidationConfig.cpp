#include "ValidationConfig.h"
#include "CommonUtils.h"
#include "PrognosExceptions.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>
#include <unordered_set>

namespace {
template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw Prognos::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const Prognos::PrognosException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Prognos::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

int parseIntStrict(const std::string& value, const std::string& key, int minValue) {
    int parsed = parseNumericStrict<int>(
        value,
        key,
        "Invalid integer for ",
        [](const std::string& v, size_t* pos) { return std::stoi(v, pos); });
    if (parsed < minValue) {
        throw Prognos::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

uint32_t parseUIntStrict(const std::string& value, const std::string& key) {
    if (!value.empty() && value[0] == '-') {
        throw Prognos::ConfigurationException("Invalid unsigned integer for " + key + ": " + value);
    }
    unsigned long parsed = parseNumericStrict<unsigned long>(
        value,
        key,
        "Invalid unsigned integer for ",
        [](const std::string& v, size_t* pos) { return std::stoul(v, pos); });
    if (parsed > static_cast<unsigned long>(std::numeric_limits<uint32_t>::max())) {
        throw Prognos::ConfigurationException("Value for " + key + " exceeds uint32 range");
    }
    return static_cast<uint32_t>(parsed);
}

double parseDoubleStrict(const std::string& value, const std::string& key, double minValue) {
    double parsed = parseNumericStrict<double>(
        value,
        key,
        "Invalid number for ",
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
    if (!std::isfinite(parsed)) {
        throw Prognos::ConfigurationException("Value for " + key + " must be finite");
    }
    if (parsed < minValue) {
        throw Prognos::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    bool out = false;
    if (!CommonUtils::parseBoolToken(value, out)) {
        throw Prognos::ConfigurationException("Invalid boolean for " + key + ": " + value);
    }
    return out;
}

std::vector<double> parseDoubleList(const std::string& value, const std::string& key, double minValue) {
    std::vector<double> out;
    for (const auto& token : CommonUtils::splitList(value)) out.push_back(parseDoubleStrict(token, key, minValue));
    if (out.empty()) throw Prognos::ConfigurationException(key + " requires at least one value");
    return out;
}

MissingPolicy parseMissingPolicy(const std::string& value) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "strict") return MissingPolicy::STRICT;
    if (v == "zero_points" || v == "zero-points" || v == "zero") return MissingPolicy::ZERO_POINTS;
    throw Prognos::ConfigurationException("missing_policy must be one of: strict, zero_points");
}

char parseDelimiter(const std::string& value, const std::string& key) {
    if (value == "\\t" || CommonUtils::toLower(value) == "tab") return '\t';
    if (value.size() != 1) throw Prognos::ConfigurationException(key + " expects a single character");
    return value[0];
}

// "a-b" with integer or decimal bounds; a leading minus belongs to the lower bound.
std::pair<double, double> parseRange(const std::string& value, const std::string& key) {
    const std::string v = CommonUtils::trim(value);
    const size_t dash = v.find('-', 1);
    if (dash == std::string::npos) {
        throw Prognos::ConfigurationException(key + " expects a range 'min-max', got '" + value + "'");
    }
    const double lo = parseDoubleStrict(CommonUtils::trim(v.substr(0, dash)), key, -std::numeric_limits<double>::max());
    const double hi = parseDoubleStrict(CommonUtils::trim(v.substr(dash + 1)), key, -std::numeric_limits<double>::max());
    if (lo > hi) throw Prognos::ConfigurationException(key + " has min greater than max");
    return {lo, hi};
}

// "continuous > 2 @20", "continuous < 1", "binary 1"
ScoreComponent parseComponent(const std::string& name, const std::string& value) {
    const std::string key = "component." + name;
    std::istringstream in(value);
    std::vector<std::string> tokens;
    std::string tok;
    while (in >> tok) tokens.push_back(tok);
    if (tokens.empty()) throw Prognos::ConfigurationException(key + " requires a kind");

    ScoreComponent c;
    c.variable = name;
    const std::string kind = CommonUtils::toLower(tokens[0]);
    size_t next = 1;
    if (kind == "binary") {
        c.kind = CovariateKind::BINARY;
    } else if (kind == "continuous") {
        c.kind = CovariateKind::CONTINUOUS;
        if (next >= tokens.size() || (tokens[next] != ">" && tokens[next] != "<")) {
            throw Prognos::ConfigurationException(key + " requires a direction '>' or '<'");
        }
        c.direction = tokens[next] == ">" ? CutDirection::GREATER : CutDirection::LESS;
        ++next;
    } else {
        throw Prognos::ConfigurationException(key + " kind must be continuous or binary, got '" + tokens[0] + "'");
    }

    if (next >= tokens.size()) throw Prognos::ConfigurationException(key + " requires a point weight");
    c.points = parseIntStrict(tokens[next++], key, 0);

    if (next < tokens.size()) {
        if (tokens[next].front() != '@' || c.kind == CovariateKind::BINARY) {
            throw Prognos::ConfigurationException(key + " has unexpected token '" + tokens[next] + "'");
        }
        c.cut = parseDoubleStrict(tokens[next].substr(1), key, -std::numeric_limits<double>::max());
        ++next;
    }
    if (next != tokens.size()) {
        throw Prognos::ConfigurationException(key + " has trailing tokens");
    }
    return c;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

// Table keys keep the case of their suffix; scalar keys are lower-cased with '-' mapped to '_'.
std::string normalizeConfigKey(std::string key) {
    key = CommonUtils::trim(key);
    const std::string lowered = CommonUtils::toLower(key);
    for (const char* prefix : {"component.", "range.", "risk_category.", "risk_recommendation."}) {
        const std::string p(prefix);
        if (lowered.rfind(p, 0) == 0) return p + CommonUtils::trim(key.substr(p.size()));
    }
    std::string out = lowered;
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

struct FileState {
    bool componentsReplaced = false;
    bool categoriesReplaced = false;
    std::unordered_set<std::string> rangesFromFile;
};

RiskCategory& findOrAddCategory(ValidationConfig& config, const std::string& name) {
    for (auto& c : config.riskCategories) {
        if (c.name == name) return c;
    }
    RiskCategory c;
    c.name = name;
    config.riskCategories.push_back(c);
    return config.riskCategories.back();
}

void assignKeyValue(ValidationConfig& config, FileState& state, const std::string& key, const std::string& value) {
    if (key.rfind("component.", 0) == 0) {
        const std::string name = key.substr(10);
        if (name.empty()) throw Prognos::ConfigurationException("component.<name> requires a covariate name");
        if (!state.componentsReplaced) {
            // Built-in ranges belong to the built-in table.
            config.components.clear();
            for (auto it = config.ranges.begin(); it != config.ranges.end();) {
                it = state.rangesFromFile.count(it->first) ? std::next(it) : config.ranges.erase(it);
            }
            state.componentsReplaced = true;
        }
        config.components.push_back(parseComponent(name, value));
    } else if (key.rfind("range.", 0) == 0) {
        const std::string name = key.substr(6);
        if (name.empty()) throw Prognos::ConfigurationException("range.<name> requires a covariate name");
        config.ranges[name] = parseRange(value, key);
        state.rangesFromFile.insert(name);
    } else if (key.rfind("risk_category.", 0) == 0) {
        const std::string name = key.substr(14);
        if (name.empty()) throw Prognos::ConfigurationException("risk_category.<name> requires a category name");
        if (!state.categoriesReplaced) {
            config.riskCategories.clear();
            state.categoriesReplaced = true;
        }
        const auto range = parseRange(value, key);
        if (range.first != std::floor(range.first) || range.second != std::floor(range.second)) {
            throw Prognos::ConfigurationException(key + " bounds must be integers");
        }
        RiskCategory& c = findOrAddCategory(config, name);
        c.lower = static_cast<int>(range.first);
        c.upper = static_cast<int>(range.second);
    } else if (key.rfind("risk_recommendation.", 0) == 0) {
        const std::string name = key.substr(20);
        bool found = false;
        for (auto& c : config.riskCategories) {
            if (c.name == name) {
                c.recommendation = value;
                found = true;
            }
        }
        if (!found) throw Prognos::ConfigurationException("risk_recommendation for unknown category " + name);
    } else if (key == "dataset") {
        config.datasetPath = value;
    } else if (key == "output_json" || key == "output") {
        config.outputJson = value;
    } else if (key == "id_column") {
        config.idColumn = value;
    } else if (key == "time_column") {
        config.timeColumn = value;
    } else if (key == "event_column") {
        config.eventColumn = value;
    } else if (key == "delimiter") {
        config.delimiter = parseDelimiter(value, key);
    } else if (key == "bootstrap_iterations") {
        config.bootstrapIterations = static_cast<size_t>(parseIntStrict(value, key, 1));
    } else if (key == "threshold_bootstrap_iterations") {
        config.thresholdBootstrapIterations = static_cast<size_t>(parseIntStrict(value, key, 0));
    } else if (key == "landmark_days") {
        config.landmarkDays = parseDoubleList(value, key, 0.0);
    } else if (key == "horizons") {
        config.horizons = parseDoubleList(value, key, 0.0);
    } else if (key == "outcome_horizon") {
        config.outcomeHorizon = parseDoubleStrict(value, key, 0.0);
    } else if (key == "skip_tolerance") {
        config.skipTolerance = parseDoubleStrict(value, key, 0.0);
    } else if (key == "random_seed" || key == "seed") {
        config.randomSeed = parseUIntStrict(value, key);
    } else if (key == "missing_policy") {
        config.missingPolicy = parseMissingPolicy(value);
    } else if (key == "max_missing_components") {
        config.maxMissingComponents = static_cast<size_t>(parseIntStrict(value, key, 0));
    } else if (key == "derive_cuts") {
        config.deriveCuts = parseBoolStrict(value, key);
    } else if (key == "score_only") {
        config.scoreOnly = parseBoolStrict(value, key);
    } else if (key == "verbose") {
        config.verbose = parseBoolStrict(value, key);
    } else if (key == "decision_curve_points") {
        config.decisionCurvePoints = static_cast<size_t>(parseIntStrict(value, key, 2));
    } else {
        throw Prognos::ConfigurationException("Unknown configuration key: " + key);
    }
}
} // namespace

std::vector<ScoreComponent> defaultScoreComponents() {
    return {
        {"MELD", CovariateKind::CONTINUOUS, CutDirection::GREATER, 20.0, 2},
        {"SAPS_II", CovariateKind::CONTINUOUS, CutDirection::GREATER, 42.0, 1},
        {"AGE", CovariateKind::CONTINUOUS, CutDirection::GREATER, 52.0, 1},
        {"PLATELETS", CovariateKind::CONTINUOUS, CutDirection::LESS, 78.0, 1},
        {"HCC", CovariateKind::BINARY, CutDirection::GREATER, std::nullopt, 1},
        {"CVVHD", CovariateKind::BINARY, CutDirection::GREATER, std::nullopt, 1},
        {"VHF", CovariateKind::BINARY, CutDirection::GREATER, std::nullopt, 1},
    };
}

std::map<std::string, std::pair<double, double>> defaultCovariateRanges() {
    return {
        {"MELD", {6.0, 40.0}},
        {"SAPS_II", {0.0, 163.0}},
        {"AGE", {18.0, 80.0}},
        {"PLATELETS", {10.0, 500.0}},
    };
}

std::vector<RiskCategory> defaultRiskCategories() {
    return {
        {"LOW", 0, 1, "Standard weaning protocol"},
        {"MEDIUM", 2, 2, "Enhanced monitoring and assessment"},
        {"HIGH", 3, 8, "Consider early tracheostomy (Day 5-7)"},
    };
}

const char* missingPolicyName(MissingPolicy policy) {
    return policy == MissingPolicy::STRICT ? "strict" : "zero_points";
}

std::string usageText(const std::string& program) {
    return "Usage: " + program + " <cohort.csv> [options]\n"
           "Options:\n"
           "  --config <file>                  Load key: value settings (flags override)\n"
           "  --bootstrap <n>                  Validation bootstrap iterations (default: 1000)\n"
           "  --threshold-bootstrap <n>        Cut-point CI iterations, 0 disables (default: 1000)\n"
           "  --landmarks <d1,d2,...>          Landmark days (default: 3,5,7)\n"
           "  --horizons <h1,h2,...>           ROC horizons after the landmark (default: 30,60,90)\n"
           "  --outcome-horizon <h>            Horizon used to derive cut-points and risk (default: 90)\n"
           "  --seed <n>                       Random seed (default: 42)\n"
           "  --skip-tolerance <0..1>          Max fraction of skipped bootstrap iterations (default: 0.05)\n"
           "  --missing-policy <strict|zero_points>  Missing component handling (default: zero_points)\n"
           "  --max-missing <n>                Missing components allowed per subject (default: 2)\n"
           "  --fixed-cuts                     Use configured cut-points instead of deriving them\n"
           "  --score-only                     Score every subject with fixed cuts and skip validation\n"
           "  --id-column <name>               Subject id column (default: patient_id)\n"
           "  --time-column <name>             Time-to-event column (default: time_to_event)\n"
           "  --event-column <name>            Event indicator column (default: event)\n"
           "  --delimiter <char>               CSV delimiter character (default: ,)\n"
           "  --output, -o <file.json>         Export results as JSON\n"
           "  --verbose                        Enable detailed logs and progress bars\n"
           "  --help                           Show this help message\n";
}

ValidationConfig ValidationConfig::fromArgs(int argc, char* argv[]) {
    ValidationConfig config;
    if (argc >= 2 && (std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h")) {
        config.showHelp = true;
        return config;
    }
    if (argc < 2) {
        throw Prognos::ConfigurationException(usageText(argc > 0 ? argv[0] : "prognos"));
    }

    config.datasetPath = argv[1];
    for (int i = 2; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            config = fromFile(argv[i + 1], config);
            break;
        }
    }

    auto requireValue = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) throw Prognos::ConfigurationException(flag + " requires a value");
        return argv[++i];
    };

    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config") {
            requireValue(i, arg);
        } else if (arg == "--bootstrap") {
            config.bootstrapIterations = static_cast<size_t>(parseIntStrict(requireValue(i, arg), arg, 1));
        } else if (arg == "--threshold-bootstrap") {
            config.thresholdBootstrapIterations = static_cast<size_t>(parseIntStrict(requireValue(i, arg), arg, 0));
        } else if (arg == "--landmarks") {
            config.landmarkDays = parseDoubleList(requireValue(i, arg), arg, 0.0);
        } else if (arg == "--horizons") {
            config.horizons = parseDoubleList(requireValue(i, arg), arg, 0.0);
        } else if (arg == "--outcome-horizon") {
            config.outcomeHorizon = parseDoubleStrict(requireValue(i, arg), arg, 0.0);
        } else if (arg == "--seed") {
            config.randomSeed = parseUIntStrict(requireValue(i, arg), arg);
        } else if (arg == "--skip-tolerance") {
            config.skipTolerance = parseDoubleStrict(requireValue(i, arg), arg, 0.0);
        } else if (arg == "--missing-policy") {
            config.missingPolicy = parseMissingPolicy(requireValue(i, arg));
        } else if (arg == "--max-missing") {
            config.maxMissingComponents = static_cast<size_t>(parseIntStrict(requireValue(i, arg), arg, 0));
        } else if (arg == "--fixed-cuts") {
            config.deriveCuts = false;
        } else if (arg == "--score-only") {
            config.scoreOnly = true;
        } else if (arg == "--id-column") {
            config.idColumn = requireValue(i, arg);
        } else if (arg == "--time-column") {
            config.timeColumn = requireValue(i, arg);
        } else if (arg == "--event-column") {
            config.eventColumn = requireValue(i, arg);
        } else if (arg == "--delimiter") {
            config.delimiter = parseDelimiter(requireValue(i, arg), arg);
        } else if (arg == "--output" || arg == "-o") {
            config.outputJson = requireValue(i, arg);
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            config.showHelp = true;
            return config;
        } else {
            throw Prognos::ConfigurationException("Unknown option: " + arg);
        }
    }

    config.validate();
    return config;
}

ValidationConfig ValidationConfig::fromFile(const std::string& configPath, const ValidationConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Prognos::ConfigurationException("Could not open config file: " + configPath);

    ValidationConfig config = base;
    FileState state;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        const size_t sep = line.find(':');
        if (sep == std::string::npos) {
            throw Prognos::ConfigurationException("Config parse error at line " + std::to_string(lineNo) +
                                                  ": expected 'key: value', got '" + line + "'");
        }

        const std::string key = normalizeConfigKey(maybeUnquote(line.substr(0, sep)));
        const std::string value = maybeUnquote(line.substr(sep + 1));
        try {
            assignKeyValue(config, state, key, value);
        } catch (const Prognos::PrognosException& ex) {
            throw Prognos::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
    }
    config.validate();

    return config;
}

void ValidationConfig::validate() const {
    if (datasetPath.empty()) {
        throw Prognos::ConfigurationException("dataset path is required");
    }
    if (idColumn.empty() || timeColumn.empty() || eventColumn.empty()) {
        throw Prognos::ConfigurationException("id, time and event column names must be non-empty");
    }
    if (bootstrapIterations < 1) {
        throw Prognos::ConfigurationException("bootstrap_iterations must be >= 1");
    }
    if (skipTolerance < 0.0 || skipTolerance > 1.0) {
        throw Prognos::ConfigurationException("skip_tolerance must be within [0,1]");
    }
    if (landmarkDays.empty() || horizons.empty()) {
        throw Prognos::ConfigurationException("at least one landmark day and one horizon are required");
    }
    for (double d : landmarkDays) {
        if (!std::isfinite(d) || d < 0.0) throw Prognos::ConfigurationException("landmark days must be >= 0");
    }
    for (double h : horizons) {
        if (!std::isfinite(h) || h <= 0.0) throw Prognos::ConfigurationException("horizons must be > 0");
    }
    if (!std::isfinite(outcomeHorizon) || outcomeHorizon <= 0.0) {
        throw Prognos::ConfigurationException("outcome_horizon must be > 0");
    }
    if (decisionCurvePoints < 2) {
        throw Prognos::ConfigurationException("decision_curve_points must be >= 2");
    }

    std::unordered_set<std::string> componentNames;
    for (const auto& c : components) componentNames.insert(c.variable);
    for (const auto& kv : ranges) {
        if (componentNames.count(kv.first) == 0) {
            throw Prognos::ConfigurationException("range declared for unknown covariate " + kv.first);
        }
    }
    if (!deriveCuts || scoreOnly) {
        for (const auto& c : components) {
            if (c.kind == CovariateKind::CONTINUOUS && !c.cut) {
                throw Prognos::ConfigurationException("fixed cuts requested but component " + c.variable +
                                                      " has no '@cut'");
            }
        }
    }

    const auto schema = buildSchema();
    const ScoreDefinition definition = buildDefinition(schema);
    buildPartition(definition.maxScore());
}

std::shared_ptr<const CovariateSchema> ValidationConfig::buildSchema() const {
    std::vector<CovariateSpec> specs;
    specs.reserve(components.size());
    for (const auto& c : components) {
        CovariateSpec spec;
        spec.name = c.variable;
        spec.kind = c.kind;
        auto it = ranges.find(c.variable);
        if (it != ranges.end()) {
            if (c.kind == CovariateKind::BINARY) {
                throw Prognos::ConfigurationException("binary covariate " + c.variable + " cannot declare a range");
            }
            spec.minValue = it->second.first;
            spec.maxValue = it->second.second;
        }
        specs.push_back(spec);
    }
    try {
        return std::make_shared<const CovariateSchema>(std::move(specs));
    } catch (const Prognos::DatasetException& ex) {
        throw Prognos::ConfigurationException(ex.what());
    }
}

ScoreDefinition ValidationConfig::buildDefinition(const std::shared_ptr<const CovariateSchema>& schema) const {
    return ScoreDefinition(components, schema);
}

RiskPartition ValidationConfig::buildPartition(int maxScore) const {
    return RiskPartition(riskCategories, maxScore);
}

CohortLoadOptions ValidationConfig::loadOptions() const {
    CohortLoadOptions options;
    options.idColumn = idColumn;
    options.timeColumn = timeColumn;
    options.eventColumn = eventColumn;
    options.delimiter = delimiter;
    options.maxMissingCovariates = maxMissingComponents;
    return options;
}
