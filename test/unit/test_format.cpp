#include <gtest/gtest.h>
#include "tabexport/core/FormatDescriptor.hpp"
#include "tabexport/core/StyleBuilder.hpp"
#include "tabexport/core/FormatRepository.hpp"

using namespace tabexport::core;

// 默认格式：Arial 10，底端对齐
TEST(FormatDescriptorTest, Default) {
    const FormatDescriptor& def = FormatDescriptor::getDefault();
    EXPECT_EQ(def.getFontName(), "Arial");
    EXPECT_DOUBLE_EQ(def.getFontSize(), 10.0);
    EXPECT_FALSE(def.isBold());
    EXPECT_EQ(def.getHorizontalAlign(), HorizontalAlign::None);
    EXPECT_EQ(def.getVerticalAlign(), VerticalAlign::Bottom);
    EXPECT_FALSE(def.hasAnyFormatting());
}

TEST(StyleBuilderTest, BuildsEqualDescriptors) {
    auto a = StyleBuilder().bold().fontSize(14).underline().build();
    auto b = StyleBuilder().underline().fontSize(14).bold().build();
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.hash(), b.hash());
    EXPECT_TRUE(a.hasFont());
    EXPECT_FALSE(a.hasAlignment());
    
    auto c = StyleBuilder(a).centerAlign().build();
    EXPECT_NE(a, c);
    EXPECT_TRUE(c.isBold());
    EXPECT_EQ(c.getHorizontalAlign(), HorizontalAlign::Center);
}

TEST(StyleBuilderTest, FontSizeIsClamped) {
    EXPECT_DOUBLE_EQ(StyleBuilder().fontSize(0).build().getFontSize(), 1.0);
    EXPECT_DOUBLE_EQ(StyleBuilder().fontSize(1000).build().getFontSize(), 409.0);
}

TEST(FormatTypesTest, SpreadsheetNames) {
    EXPECT_STREQ(toString(HorizontalAlign::Right), "Right");
    EXPECT_STREQ(toString(VerticalAlign::Bottom), "Bottom");
    EXPECT_STREQ(toString(UnderlineType::Single), "Single");
    EXPECT_EQ(parseHorizontalAlign("Center"), HorizontalAlign::Center);
    EXPECT_EQ(parseUnderline("Double"), UnderlineType::Double);
    EXPECT_EQ(parseVerticalAlign("Top"), VerticalAlign::Top);
}

TEST(FormatRepositoryTest, DefaultFormatHasIdZero) {
    FormatRepository repo;
    EXPECT_EQ(repo.getFormatCount(), 1u);
    EXPECT_EQ(repo.findFormatId(FormatDescriptor::getDefault()), 0);
    EXPECT_EQ(repo.addFormat(StyleBuilder().build()), 0);
}

// 相同格式只登记一次
TEST(FormatRepositoryTest, Deduplicates) {
    FormatRepository repo;
    int bold = repo.addFormat(StyleBuilder().bold().build());
    int italic = repo.addFormat(StyleBuilder().italic().build());
    EXPECT_EQ(bold, 1);
    EXPECT_EQ(italic, 2);
    EXPECT_EQ(repo.addFormat(StyleBuilder().bold().build()), bold);
    EXPECT_EQ(repo.getFormatCount(), 3u);
    EXPECT_GT(repo.getCacheHitRate(), 0.0);
    EXPECT_TRUE(repo.getFormat(bold)->isBold());
}

TEST(FormatRepositoryTest, InvalidIdFallsBackToDefault) {
    FormatRepository repo;
    EXPECT_FALSE(repo.isValidFormatId(7));
    EXPECT_EQ(*repo.getFormat(7), FormatDescriptor::getDefault());
    EXPECT_EQ(repo.findFormatId(StyleBuilder().italic().build()), -1);
}

TEST(FormatRepositoryTest, ClearKeepsDefault) {
    FormatRepository repo;
    repo.addFormat(StyleBuilder().bold().build());
    repo.clear();
    EXPECT_EQ(repo.getFormatCount(), 1u);
    EXPECT_EQ(repo.findFormatId(StyleBuilder().bold().build()), -1);
}
