#include <gtest/gtest.h>
#include "tabexport/core/StyleCache.hpp"
#include "tabexport/core/StyledCellWriter.hpp"
#include "tabexport/core/Workbook.hpp"

using namespace tabexport::core;

class StyleCacheTest : public ::testing::Test {
protected:
    StyleCache cache;
};

// 同一指令重复请求返回同一个样式对象
TEST_F(StyleCacheTest, GetOrCreateIsIdempotent) {
    auto directive = StyleDirectiveParser::parse("{B3}Title");
    auto first = cache.getOrCreate(directive);
    auto second = cache.getOrCreate(directive);
    
    EXPECT_EQ(first, second);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.hits(), 1u);
    EXPECT_TRUE(cache.contains("3B"));
    EXPECT_TRUE(first->isBold());
    EXPECT_DOUBLE_EQ(first->getFontSize(), 14.0);
}

// 居中和合并不参与键，只影响单元格
TEST_F(StyleCacheTest, CenterAndMergeShareFontStyle) {
    auto plain = cache.getOrCreate(StyleDirectiveParser::parse("{BU}a"));
    auto centered = cache.getOrCreate(StyleDirectiveParser::parse("{UCB>4}b"));
    EXPECT_EQ(plain, centered);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_TRUE(cache.contains("5BU"));
}

TEST_F(StyleCacheTest, DistinctFlagsCreateDistinctStyles) {
    cache.getOrCreate(StyleDirectiveParser::parse("{B}a"));
    cache.getOrCreate(StyleDirectiveParser::parse("{I}a"));
    cache.getOrCreate(StyleDirectiveParser::parse("{B1}a"));
    cache.getOrCreate(StyleDirectiveParser::parse("{}a"));
    EXPECT_EQ(cache.size(), 4u);
    EXPECT_TRUE(cache.contains("5"));
    EXPECT_TRUE(cache.contains("1B"));
    
    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.hits(), 0u);
}

TEST_F(StyleCacheTest, HeadingLevelSetsFontSize) {
    EXPECT_DOUBLE_EQ(cache.getOrCreate(StyleDirectiveParser::parse("{1}x"))->getFontSize(), 18.0);
    EXPECT_DOUBLE_EQ(cache.getOrCreate(StyleDirectiveParser::parse("{9}x"))->getFontSize(), 2.0);
    EXPECT_DOUBLE_EQ(cache.getOrCreate(StyleDirectiveParser::parse("{B}x"))->getFontSize(), 10.0);
}

class StyledCellWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        sheet = workbook.addSheet("Report");
    }
    
    Workbook workbook;
    StyleCache cache;
    std::shared_ptr<Worksheet> sheet;
};

// 默认标题指令：粗体、下划线、居中、3 级标题、向右合并 6 列
TEST_F(StyledCellWriterTest, WritesDefaultTitleDirective) {
    StyledCellWriter writer(workbook, cache);
    auto directive = writer.write(*sheet, 0, 0, "{BUC3>6}Monthly Report");
    
    EXPECT_EQ(directive.text, "Monthly Report");
    const Cell* cell = sheet->findCell(0, 0);
    ASSERT_NE(cell, nullptr);
    EXPECT_EQ(cell->getStringValue(), "Monthly Report");
    
    const FormatDescriptor& format = cell->effectiveFormat();
    EXPECT_TRUE(format.isBold());
    EXPECT_EQ(format.getUnderline(), UnderlineType::Single);
    EXPECT_EQ(format.getHorizontalAlign(), HorizontalAlign::Center);
    EXPECT_DOUBLE_EQ(format.getFontSize(), 14.0);
    
    ASSERT_EQ(sheet->getMergeRanges().size(), 1u);
    EXPECT_EQ(sheet->getMergeRanges()[0], (MergeRange{0, 0, 0, 6}));
    
    // 样式已登记到工作簿，保存时可以找到
    EXPECT_GE(workbook.getFormatRepository().findFormatId(format), 1);
}

TEST_F(StyledCellWriterTest, PlainValueGetsDefaultHeadingSize) {
    StyledCellWriter writer(workbook, cache);
    writer.write(*sheet, 2, 1, "plain");
    
    const Cell* cell = sheet->findCell(2, 1);
    ASSERT_NE(cell, nullptr);
    EXPECT_EQ(cell->getStringValue(), "plain");
    EXPECT_DOUBLE_EQ(cell->effectiveFormat().getFontSize(), 10.0);
    EXPECT_FALSE(cell->effectiveFormat().isBold());
    EXPECT_TRUE(sheet->getMergeRanges().empty());
}

// 未闭合的指令写入空文本
TEST_F(StyledCellWriterTest, UnterminatedDirectiveWritesEmptyText) {
    StyledCellWriter writer(workbook, cache);
    writer.write(*sheet, 0, 0, "{B");
    ASSERT_NE(sheet->findCell(0, 0), nullptr);
    EXPECT_EQ(sheet->findCell(0, 0)->getStringValue(), "");
}

TEST_F(StyledCellWriterTest, ZeroSpanDoesNotMerge) {
    StyledCellWriter writer(workbook, cache);
    writer.write(*sheet, 0, 0, "{B>}x");
    writer.write(*sheet, 1, 0, "{B>0}y");
    EXPECT_TRUE(sheet->getMergeRanges().empty());
    EXPECT_EQ(cache.size(), 1u);
}
