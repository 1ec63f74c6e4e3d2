#include <gtest/gtest.h>
#include "tabexport/utils/CommonUtils.hpp"
#include "tabexport/utils/ColumnWidthCalculator.hpp"

using namespace tabexport::utils;

TEST(CommonUtilsTest, ColumnLetters) {
    EXPECT_EQ(CommonUtils::columnToLetter(0), "A");
    EXPECT_EQ(CommonUtils::columnToLetter(25), "Z");
    EXPECT_EQ(CommonUtils::columnToLetter(26), "AA");
    EXPECT_EQ(CommonUtils::cellReference(0, 0), "A1");
    EXPECT_EQ(CommonUtils::cellReference(9, 27), "AB10");
}

TEST(CommonUtilsTest, SheetNameValidation) {
    EXPECT_TRUE(CommonUtils::isValidSheetName("Q1"));
    EXPECT_FALSE(CommonUtils::isValidSheetName(""));
    EXPECT_FALSE(CommonUtils::isValidSheetName("a/b"));
    EXPECT_FALSE(CommonUtils::isValidSheetName(std::string(32, 'x')));
}

TEST(CommonUtilsTest, StringHelpers) {
    EXPECT_TRUE(CommonUtils::iequals("QUIT", "quit"));
    EXPECT_FALSE(CommonUtils::iequals("quit", "quits"));
    EXPECT_TRUE(CommonUtils::startsWith("jdbc:sqlite:x.db", "jdbc:"));
    EXPECT_EQ(CommonUtils::trim("  select 1 \r\n"), "select 1");
    EXPECT_EQ(CommonUtils::trim("   "), "");
    
    auto parts = CommonUtils::splitAny("Q1|First][Q2", "][|");
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "Q1");
    EXPECT_EQ(parts[1], "First");
    EXPECT_EQ(parts[2], "Q2");
}

TEST(CommonUtilsTest, ParseDouble) {
    EXPECT_DOUBLE_EQ(*CommonUtils::parseDouble("1234"), 1234.0);
    EXPECT_DOUBLE_EQ(*CommonUtils::parseDouble(" -12.5 "), -12.5);
    EXPECT_FALSE(CommonUtils::parseDouble("12abc").has_value());
    EXPECT_FALSE(CommonUtils::parseDouble("").has_value());
    EXPECT_FALSE(CommonUtils::parseDouble("inf").has_value());
    EXPECT_FALSE(CommonUtils::parseDouble("1,5").has_value());
    EXPECT_FALSE(CommonUtils::parseDouble("1e999").has_value());
    EXPECT_DOUBLE_EQ(*CommonUtils::parseDouble("2.5e3\n"), 2500.0);
}

TEST(CommonUtilsTest, FormatNumber) {
    EXPECT_EQ(CommonUtils::formatNumber(1234.0, "###########0"), "1234");
    EXPECT_EQ(CommonUtils::formatNumber(1234567.891, "###,###,###,##0.00"), "1,234,567.89");
    EXPECT_EQ(CommonUtils::formatNumber(-1000.5, "###,###,###,##0.00"), "-1,000.50");
    EXPECT_EQ(CommonUtils::formatNumber(12.0, "###,###,###,##0.00"), "12.00");
}

TEST(ColumnWidthCalculatorTest, ScalesWithFontSize) {
    ColumnWidthCalculator normal;
    EXPECT_EQ(normal.getMDW(), 7);
    EXPECT_EQ(ColumnWidthCalculator::forFontSize(20.0).getMDW(), 14);
    
    // 字号越大，同样字符数的列越宽
    EXPECT_GT(ColumnWidthCalculator::forFontSize(14.0).charsToPoints(10),
              normal.charsToPoints(10));
    EXPECT_GT(normal.charsToPoints(10), normal.charsToPoints(5));
}
