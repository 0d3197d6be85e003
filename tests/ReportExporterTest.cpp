#include "CohortStore.h"
#include "PrognosExceptions.h"
#include "ReportExporter.h"
#include "SyntheticCohort.h"
#include "TempFile.h"

#include <gtest/gtest.h>

#include <fstream>
#include <iterator>
#include <sstream>

namespace {
ValidationConfig exportConfig() {
    ValidationConfig config;
    config.datasetPath = "unused.csv";
    config.bootstrapIterations = 10;
    config.thresholdBootstrapIterations = 0;
    config.skipTolerance = 0.3;
    config.landmarkDays = {5.0, 500.0};
    config.horizons = {30.0};
    config.decisionCurvePoints = 5;
    return config;
}

Cohort loadSynthetic(const ValidationConfig& config) {
    std::istringstream in(SyntheticCohort::csv());
    CohortStore store(config.buildSchema(), config.loadOptions());
    return store.loadStream(in);
}
} // namespace

TEST(ReportExporter, ValidationJsonCarriesLandmarksAndNulls) {
    const ValidationConfig config = exportConfig();
    const ValidationPipeline pipeline(config);
    const std::string json = ReportExporter::toJson(pipeline.run(loadSynthetic(config)));

    EXPECT_NE(json.find("\"landmarks\""), std::string::npos);
    EXPECT_NE(json.find("\"landmark_day\": 5,"), std::string::npos);
    EXPECT_NE(json.find("\"landmark_day\": 500,"), std::string::npos);
    EXPECT_NE(json.find("\"evaluable\": false"), std::string::npos);
    EXPECT_NE(json.find("\"c_index\": null"), std::string::npos);
    EXPECT_NE(json.find("\"metric\": \"auc@30\""), std::string::npos);
    EXPECT_NE(json.find("\"ci_lower\": null"), std::string::npos); // no cut-point CI iterations
    EXPECT_EQ(json.find("nan"), std::string::npos);
    EXPECT_EQ(json.find("inf"), std::string::npos);
    EXPECT_EQ(json.front(), '{');
}

TEST(ReportExporter, ScoringJsonEscapesIdsAndMarksInvalidSubjects) {
    ValidationConfig config = exportConfig();
    config.missingPolicy = MissingPolicy::STRICT;
    const ValidationPipeline pipeline(config);

    std::istringstream in("patient_id,MELD,SAPS_II,AGE,PLATELETS,HCC,CVVHD,VHF,time_to_event,event\n"
                          "\"ICU \"\"7\"\"\",25,45,55,70,1,0,0,12,1\n"
                          "ICU8,NA,45,55,70,1,0,0,12,1\n");
    CohortStore store(config.buildSchema(), config.loadOptions());
    const Cohort cohort = store.loadStream(in);
    const std::string json = ReportExporter::toJson(pipeline.score(cohort), pipeline.partition());

    EXPECT_NE(json.find("\"id\": \"ICU \\\"7\\\"\", \"score\": 6, \"category\": \"HIGH\""), std::string::npos);
    EXPECT_NE(json.find("\"id\": \"ICU8\", \"score\": null, \"category\": null, \"valid\": false"), std::string::npos);
    EXPECT_NE(json.find("\"valid\": 1"), std::string::npos);
}

TEST(ReportExporter, WritesFileAndReportsFailures) {
    TempFile target("prognos_export", "");
    ReportExporter::writeFile(target.path(), "{ \"ok\": true }\n");
    std::ifstream in(target.path());
    const std::string written((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(written, "{ \"ok\": true }\n");

    EXPECT_THROW(ReportExporter::writeFile("/nonexistent/prognos/out.json", "{}"), Prognos::IOException);
}

TEST(ReportExporter, ControlCharactersAreUnicodeEscaped) {
    ScoringResult result;
    result.maxScore = 8;
    result.subjectIds = {std::string("bed\x01") + "7\ttab"};
    ScoreBreakdown breakdown;
    breakdown.valid = false;
    breakdown.warnings = {"line\nbreak"};
    result.breakdowns = {breakdown};
    const RiskPartition partition(defaultRiskCategories(), 8);

    const std::string json = ReportExporter::toJson(result, partition);
    EXPECT_NE(json.find("\"id\": \"bed\\u00017\\ttab\""), std::string::npos);
    EXPECT_NE(json.find("\"line\\nbreak\""), std::string::npos);
    EXPECT_EQ(json.find('?'), std::string::npos);
}
