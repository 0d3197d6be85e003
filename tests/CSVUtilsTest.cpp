#include "CSVUtils.h"
#include "PrognosExceptions.h"

#include <gtest/gtest.h>

#include <sstream>

TEST(CSVUtils, ParsesQuotedFieldsAndEscapedQuotes) {
    std::istringstream in("a, \"b,c\",\"say \"\"hi\"\"\"\n");
    bool malformed = true;
    const auto row = CSVUtils::parseCSVLine(in, ',', &malformed);
    ASSERT_EQ(row.size(), 3u);
    EXPECT_EQ(row[0], "a");
    EXPECT_EQ(row[1], "b,c");
    EXPECT_EQ(row[2], "say \"hi\"");
    EXPECT_FALSE(malformed);
}

TEST(CSVUtils, QuotedFieldMaySpanLines) {
    std::istringstream in("1,\"two\nlines\",3\n4,5,6\n");
    size_t consumed = 0;
    const auto row = CSVUtils::parseCSVLine(in, ',', nullptr, &consumed);
    ASSERT_EQ(row.size(), 3u);
    EXPECT_EQ(row[1], "two\nlines");
    EXPECT_EQ(consumed, 2u);
}

TEST(CSVUtils, ReadTableSkipsBomAndCountsMalformedRows) {
    std::istringstream in("\xEF\xBB\xBFid,x\r\n1,2\r\n3\r\n\r\n4,5\r\n");
    const auto table = CSVUtils::readTable(in, ',');
    ASSERT_EQ(table.header.size(), 2u);
    EXPECT_EQ(table.header[0], "id");
    ASSERT_EQ(table.rows.size(), 2u);
    EXPECT_EQ(table.rows[1][1], "5");
    EXPECT_EQ(table.malformedRows, 1u);
}

TEST(CSVUtils, RejectsDuplicateHeader) {
    std::istringstream in("id,id\n1,2\n");
    EXPECT_THROW(CSVUtils::readTable(in, ','), Prognos::DatasetException);
}

TEST(CSVUtils, RejectsEmptyInput) {
    std::istringstream in("");
    EXPECT_THROW(CSVUtils::readTable(in, ','), Prognos::DatasetException);
}

TEST(CSVUtils, HonoursAlternateDelimiter) {
    std::istringstream in("id;x\n7;8.5\n");
    const auto table = CSVUtils::readTable(in, ';');
    ASSERT_EQ(table.rows.size(), 1u);
    EXPECT_EQ(table.rows[0][1], "8.5");
}
