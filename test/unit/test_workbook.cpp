#include <gtest/gtest.h>
#include "tabexport/core/Workbook.hpp"
#include "tabexport/core/StyleBuilder.hpp"
#include "tabexport/core/Exception.hpp"
#include "helpers/TempFile.hpp"
#include <fstream>

using namespace tabexport::core;
using tabexport::test::TempFile;

class WorkbookTest : public ::testing::Test {
protected:
    Workbook workbook;
};

TEST_F(WorkbookTest, AddNamedSheets) {
    workbook.addSheet("Q1");
    workbook.addSheet("Q2");
    EXPECT_EQ(workbook.getSheetCount(), 2u);
    EXPECT_EQ(workbook.getSheetNames(), (std::vector<std::string>{"Q1", "Q2"}));
    EXPECT_EQ(workbook.getSheetIndex("Q2"), size_t{1});
    EXPECT_TRUE(workbook.hasSheet("Q1"));
    EXPECT_EQ(workbook.getSheet("Q3"), nullptr);
}

// 未命名的工作表自动编号
TEST_F(WorkbookTest, AutoNamedSheets) {
    auto first = workbook.addSheet();
    auto second = workbook.addSheet();
    EXPECT_EQ(first->getName(), "Sheet1");
    EXPECT_EQ(second->getName(), "Sheet2");
    
    // 编号被占用时继续往后找
    Workbook other;
    other.addSheet("Sheet2");
    other.addSheet();
    EXPECT_EQ(other.getSheet(size_t{1})->getName(), "Sheet3");
}

TEST_F(WorkbookTest, DuplicateSheetNameThrows) {
    workbook.addSheet("Q1");
    try {
        workbook.addSheet("Q1");
        FAIL() << "expected WorksheetException";
    } catch (const WorksheetException& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::DuplicateSheetName);
        EXPECT_EQ(e.getWorksheetName(), "Q1");
    }
}

TEST_F(WorkbookTest, InvalidSheetNameThrows) {
    EXPECT_THROW(workbook.addSheet("a:b"), WorksheetException);
    EXPECT_THROW(workbook.addSheet(std::string(40, 'x')), WorksheetException);
}

TEST_F(WorkbookTest, AddFormatSharesDescriptor) {
    auto a = workbook.addFormat(StyleBuilder().bold().build());
    auto b = workbook.addFormat(StyleBuilder().bold().build());
    EXPECT_EQ(a, b);
    EXPECT_EQ(workbook.getFormatRepository().getFormatCount(), 2u);
}

// 保存后重新加载：工作表顺序、单元格、样式、合并、列宽保持不变
TEST_F(WorkbookTest, SaveAndLoadRoundTrip) {
    TempFile file(".xml");
    
    auto title_format = workbook.addFormat(StyleBuilder().fontSize(14).bold().underline().centerAlign().build());
    auto number_format = workbook.addFormat(StyleBuilder().rightAlign().numberFormat("###########0").build());
    
    auto q1 = workbook.addSheet("Q1");
    q1->writeString(0, 0, "Report <2024> & \"more\"", title_format);
    q1->mergeCells(0, 0, 0, 6);
    q1->writeString(1, 0, "id");
    q1->writeNumber(2, 0, 1234.0, number_format);
    q1->writeString(2, 1, "  padded  ");
    q1->setColumnWidth(1, 48.75);
    workbook.addSheet("Q2")->writeNumber(5, 3, -0.5);
    
    workbook.save(file.path());
    ASSERT_TRUE(file.exists());
    
    auto result = Workbook::load(file.path());
    ASSERT_TRUE(result.hasValue()) << result.error().fullMessage();
    auto loaded = std::move(result).value();
    
    ASSERT_EQ(loaded->getSheetNames(), (std::vector<std::string>{"Q1", "Q2"}));
    auto sheet = loaded->getSheet("Q1");
    
    const Cell* title = sheet->findCell(0, 0);
    ASSERT_NE(title, nullptr);
    EXPECT_EQ(title->getStringValue(), "Report <2024> & \"more\"");
    EXPECT_EQ(*title->getFormatDescriptor(), *title_format);
    ASSERT_EQ(sheet->getMergeRanges().size(), 1u);
    EXPECT_EQ(sheet->getMergeRanges()[0], (MergeRange{0, 0, 0, 6}));
    
    const Cell* number = sheet->findCell(2, 0);
    ASSERT_NE(number, nullptr);
    EXPECT_TRUE(number->isNumber());
    EXPECT_DOUBLE_EQ(number->getNumberValue(), 1234.0);
    EXPECT_EQ(number->getFormatDescriptor()->getNumberFormat(), "###########0");
    
    EXPECT_EQ(sheet->findCell(2, 1)->getStringValue(), "  padded  ");
    EXPECT_DOUBLE_EQ(*sheet->getColumnWidth(1), 48.75);
    EXPECT_EQ(sheet->getLastRowNum(), 2);
    
    EXPECT_DOUBLE_EQ(loaded->getSheet("Q2")->findCell(5, 3)->getNumberValue(), -0.5);
}

TEST_F(WorkbookTest, LoadMissingFileReturnsError) {
    TempFile file(".xml");
    auto result = Workbook::load(file.path());
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().code, ErrorCode::FileNotFound);
}

TEST_F(WorkbookTest, LoadMalformedFileReturnsError) {
    TempFile file(".xml");
    {
        std::ofstream out(file.path());
        out << "<Workbook><Worksheet ss:Name=\"A\">";
    }
    auto result = Workbook::load(file.path());
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().code, ErrorCode::XmlParseError);
}

TEST_F(WorkbookTest, SaveToUnwritablePathThrows) {
    workbook.addSheet("A");
    try {
        workbook.save("/nonexistent-dir/sub/out.xml");
        FAIL() << "expected an exception";
    } catch (const FileException& e) {
        EXPECT_EQ(e.getFilename(), "/nonexistent-dir/sub/out.xml");
    }
}
