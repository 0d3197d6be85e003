#include "PrognosExceptions.h"
#include "ReportExporter.h"
#include "TerminalReport.h"
#include "ValidationConfig.h"
#include "ValidationPipeline.h"

#include <iostream>
#include <string>

namespace {
int runScoring(const ValidationPipeline& pipeline) {
    const ValidationConfig& config = pipeline.config();
    const ScoringResult result = pipeline.score();
    TerminalReport::printScoring(result, pipeline.partition(), config.verbose);
    if (!config.outputJson.empty()) {
        ReportExporter::writeFile(config.outputJson, ReportExporter::toJson(result, pipeline.partition()));
    }
    return result.summary.valid > 0 ? 0 : 1;
}

int runValidation(const ValidationPipeline& pipeline) {
    const ValidationConfig& config = pipeline.config();
    std::cout << "[Prognos] Bootstrap: " << config.bootstrapIterations << " iterations, seed " << config.randomSeed
              << ", skip tolerance " << config.skipTolerance << ", missing policy "
              << missingPolicyName(config.missingPolicy) << "\n";
    const ValidationResult result = pipeline.run();
    TerminalReport::printValidation(result);
    if (!config.outputJson.empty()) {
        ReportExporter::writeFile(config.outputJson, ReportExporter::toJson(result));
    }
    return 0;
}
} // namespace

int main(int argc, char* argv[]) {
    std::cout << "Prognos: Landmark Risk Score Validation Engine...\n";
    ValidationConfig config;
    try {
        config = ValidationConfig::fromArgs(argc, argv);
    } catch (const Prognos::PrognosException& e) {
        std::cerr << "[Prognos Error] " << e.what() << "\n";
        return 2;
    }

    if (config.showHelp) {
        std::cout << usageText(argc > 0 ? argv[0] : "prognos");
        return 0;
    }

    try {
        const ValidationPipeline pipeline(config);
        return config.scoreOnly ? runScoring(pipeline) : runValidation(pipeline);
    } catch (const Prognos::UnstableBootstrapError& e) {
        std::cerr << "[Prognos Error] " << e.what() << "\n";
        std::cerr << "        -> evaluated " << e.evaluated() << " of " << e.requested() << ", skipped " << e.skipped() << "\n";
        for (const auto& kv : e.skipReasons()) {
            std::cerr << "        -> " << kv.first << ": " << kv.second << "\n";
        }
        return 3;
    } catch (const Prognos::ConfigurationException& e) {
        std::cerr << "[Prognos Error] " << e.what() << "\n";
        return 2;
    } catch (const Prognos::InvalidPartitionError& e) {
        std::cerr << "[Prognos Error] " << e.what() << "\n";
        return 2;
    } catch (const Prognos::PrognosException& e) {
        std::cerr << "[Prognos Error] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Prognos Exception] " << e.what() << "\n";
        return 1;
    }
}
