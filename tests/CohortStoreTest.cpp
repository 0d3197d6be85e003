#include "CohortStore.h"
#include "PrognosExceptions.h"
#include "TestCohorts.h"

#include <gtest/gtest.h>

#include <sstream>

namespace {
const char* kHeader = "patient_id,MELD,SAPS_II,AGE,PLATELETS,HCC,CVVHD,VHF,time_to_event,event\n";
}

TEST(CohortStore, LoadsValidRowsAndParsesBinaryTokens) {
    std::istringstream in(std::string(kHeader) +
                          "P1,25,45,55,70,yes,0,1,12.5,1\n"
                          "P2,15,35,45,100,no,false,0,90,0\n");
    CohortStore store(TestCohorts::defaultSchema());
    const Cohort cohort = store.loadStream(in);
    ASSERT_EQ(cohort.size(), 2u);
    const Subject& p1 = cohort.subject(0);
    EXPECT_EQ(p1.id, "P1");
    EXPECT_DOUBLE_EQ(*p1.covariates[0], 25.0);
    EXPECT_DOUBLE_EQ(*p1.covariates[4], 1.0);
    EXPECT_DOUBLE_EQ(*p1.covariates[5], 0.0);
    EXPECT_DOUBLE_EQ(p1.timeToEvent, 12.5);
    EXPECT_TRUE(p1.event);
    EXPECT_FALSE(cohort.subject(1).event);
    EXPECT_EQ(store.lastReport().subjectsLoaded, 2u);
    EXPECT_EQ(store.lastReport().subjectsExcluded, 0u);
}

TEST(CohortStore, ExcludesInvalidRowsWithReasons) {
    std::istringstream in(std::string(kHeader) +
                          "P1,25,45,55,70,1,0,1,12,1\n"
                          "P1,25,45,55,70,1,0,1,12,1\n"     // duplicate id
                          "P2,50,45,55,70,1,0,1,12,1\n"     // MELD above 40
                          "P3,25,45,55,70,maybe,0,1,12,1\n" // bad binary
                          "P4,25,45,55,70,1,0,1,0,1\n"      // time not > 0
                          "P5,25,45,55,70,1,0,1,12,2\n"     // bad event
                          "P6,NA,NA,NA,70,1,0,1,12,1\n"     // three missing
                          "P7,NA,NA,55,70,1,0,1,12,0\n"     // two missing is allowed
                          "P8,25,45\n");                     // malformed width
    CohortStore store(TestCohorts::defaultSchema());
    const Cohort cohort = store.loadStream(in);
    ASSERT_EQ(cohort.size(), 2u);
    EXPECT_EQ(cohort.subject(1).id, "P7");
    EXPECT_EQ(cohort.subject(1).missingCount(), 2u);

    const CohortLoadReport& report = store.lastReport();
    EXPECT_EQ(report.subjectsExcluded, 6u);
    EXPECT_EQ(report.malformedRows, 1u);
    EXPECT_EQ(report.rowsRead, 9u);
    ASSERT_EQ(report.exclusions.size(), 6u);
    EXPECT_EQ(report.exclusions[0].first, "P1");
    EXPECT_NE(report.exclusions[0].second.find("duplicate"), std::string::npos);
    EXPECT_NE(report.exclusions[1].second.find("outside valid range"), std::string::npos);
}

TEST(CohortStore, MissingRequiredColumnAbortsLoad) {
    std::istringstream in("patient_id,MELD,time_to_event,event\nP1,20,5,1\n");
    CohortStore store(TestCohorts::defaultSchema());
    EXPECT_THROW(store.loadStream(in), Prognos::DatasetException);
}

TEST(CohortStore, NoValidSubjectsIsAnError) {
    std::istringstream in(std::string(kHeader) + "P1,25,45,55,70,1,0,1,-3,1\n");
    CohortStore store(TestCohorts::defaultSchema());
    EXPECT_THROW(store.loadStream(in), Prognos::DatasetException);
}

TEST(CohortStore, CustomColumnNamesAndDelimiter) {
    CohortLoadOptions options;
    options.idColumn = "mrn";
    options.timeColumn = "days";
    options.eventColumn = "died";
    options.delimiter = ';';
    std::istringstream in("mrn;X;days;died\nA;1.5;10;1\nB;2.5;20;0\n");
    CohortStore store(TestCohorts::singleSchema(), options);
    const Cohort cohort = store.loadStream(in);
    ASSERT_EQ(cohort.size(), 2u);
    EXPECT_DOUBLE_EQ(cohort.subject(1).timeToEvent, 20.0);
}

TEST(CohortStore, MissingFileRaisesIOException) {
    CohortStore store(TestCohorts::defaultSchema());
    EXPECT_THROW(store.loadCsv("/nonexistent/prognos/cohort.csv"), Prognos::IOException);
}
