#include "AxonExceptions.h"
#include "CSVUtils.h"

#include <gtest/gtest.h>

#include <sstream>

TEST(CSVUtilsTest, ParsesQuotedFields) {
    std::istringstream in("a, \"b,c\" ,\"say \"\"hi\"\"\"\nnext\n");
    bool malformed = true;
    const auto row = CSVUtils::parseCSVLine(in, ',', &malformed);
    EXPECT_FALSE(malformed);
    ASSERT_EQ(row.size(), 3u);
    EXPECT_EQ(row[0], "a");
    EXPECT_EQ(row[1], "b,c ");
    EXPECT_EQ(row[2], "say \"hi\"");

    const auto second = CSVUtils::parseCSVLine(in, ',');
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0], "next");
    EXPECT_TRUE(CSVUtils::parseCSVLine(in, ',').empty());
}

TEST(CSVUtilsTest, FlagsUnterminatedQuote) {
    std::istringstream in("1,\"open\n");
    bool malformed = false;
    CSVUtils::parseCSVLine(in, ',', &malformed);
    EXPECT_TRUE(malformed);
}

TEST(CSVUtilsTest, SkipsUtf8Bom) {
    std::istringstream in("\xEF\xBB\xBFx,y\n");
    CSVUtils::skipBOM(in);
    const auto row = CSVUtils::parseCSVLine(in, ',');
    ASSERT_EQ(row.size(), 2u);
    EXPECT_EQ(row[0], "x");
}

TEST(CSVUtilsTest, NormalizeHeaderFillsAndDeduplicates) {
    const auto header = CSVUtils::normalizeHeader({"a", "", "a", "a"});
    EXPECT_EQ(header, (std::vector<std::string>{"a", "column_2", "a_2", "a_3"}));
}

TEST(CSVUtilsTest, ReadsDatasetWithHeader) {
    std::istringstream in("x0,x1,c0,c1\r\n0,0,1,0\r\n0,1,0,1\r\n\r\n1,0,0,1\r\n");
    const auto data = CSVUtils::readNumericDataset(in, ',', 2);
    EXPECT_EQ(data.header, (std::vector<std::string>{"x0", "x1", "c0", "c1"}));
    ASSERT_EQ(data.rows(), 3u);
    EXPECT_EQ(data.features[1], (std::vector<double>{0.0, 1.0}));
    EXPECT_EQ(data.targets[2], (std::vector<double>{0.0, 1.0}));
}

TEST(CSVUtilsTest, ReadsHeaderlessDatasetWithOtherDelimiter) {
    std::istringstream in("0.5;1.5;-2\n3;4;5e-1\n");
    const auto data = CSVUtils::readNumericDataset(in, ';', 1);
    EXPECT_TRUE(data.header.empty());
    ASSERT_EQ(data.rows(), 2u);
    EXPECT_EQ(data.features[0], (std::vector<double>{0.5, 1.5}));
    EXPECT_EQ(data.targets[1], (std::vector<double>{0.5}));
}

TEST(CSVUtilsTest, RejectsBadDatasets) {
    auto read = [](const std::string& text, size_t targets) {
        std::istringstream in(text);
        return CSVUtils::readNumericDataset(in, ',', targets);
    };
    EXPECT_THROW(read("1,2,3\n4,5\n", 1), Axon::DatasetException);
    EXPECT_THROW(read("1,2,3\n4,five,6\n", 1), Axon::DatasetException);
    EXPECT_THROW(read("a,b\n", 1), Axon::DatasetException);
    EXPECT_THROW(read("1,2\n", 2), Axon::DatasetException);
    EXPECT_THROW(read("", 1), Axon::DatasetException);
    EXPECT_THROW(read("1,2\n", 0), Axon::DatasetException);
    EXPECT_THROW(CSVUtils::loadNumericDataset("/nonexistent/axon.csv", ',', 1), Axon::IOException);
}
