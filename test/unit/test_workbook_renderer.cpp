#include <gtest/gtest.h>
#include "tabexport/render/WorkbookRenderer.hpp"
#include "tabexport/render/RendererFactory.hpp"
#include "tabexport/session/WorkbookSession.hpp"
#include "tabexport/core/Constants.hpp"
#include "tabexport/core/Exception.hpp"
#include "helpers/TempFile.hpp"
#include <sstream>

using namespace tabexport;
using namespace tabexport::core;
using namespace tabexport::render;
using tabexport::test::TempFile;

class WorkbookRendererTest : public ::testing::Test {
protected:
    void SetUp() override {
        options.format = OutputFormat::Xls;
        options.output_file = output.path();
        session = std::make_unique<session::WorkbookSession>(options);
        session->beginStatement();
        renderer = std::make_unique<WorkbookRenderer>(*session);
        renderer->beginDocument(std::nullopt, true);
    }
    
    void beginResultSet() {
        session->nextResultSet();
        renderer->beginResultSet(columns, widths, std::nullopt);
    }
    
    TempFile output{".xml"};
    ExportOptions options;
    std::unique_ptr<session::WorkbookSession> session;
    std::unique_ptr<WorkbookRenderer> renderer;
    std::vector<ColumnDescriptor> columns{
        {"id", ColumnType::IntegerLike},
        {"price", ColumnType::Fractional},
        {"name", ColumnType::Other}
    };
    std::vector<size_t> widths{2, 5, 4};
};

// 整数列写成数字并使用整数格式
TEST_F(WorkbookRendererTest, IntegerColumnWritesNumber) {
    beginResultSet();
    renderer->emitRow({"1234", "9.5", "widget"}, columns);
    
    const Worksheet& sheet = *renderer->currentTab().sheet;
    const Cell* id = sheet.findCell(2, 0);
    ASSERT_NE(id, nullptr);
    ASSERT_TRUE(id->isNumber());
    EXPECT_DOUBLE_EQ(id->getNumberValue(), 1234.0);
    EXPECT_EQ(id->effectiveFormat().getNumberFormat(), Constants::kIntegerNumberFormat);
    EXPECT_EQ(id->effectiveFormat().getHorizontalAlign(), HorizontalAlign::Right);
    
    const Cell* price = sheet.findCell(2, 1);
    ASSERT_TRUE(price->isNumber());
    EXPECT_DOUBLE_EQ(price->getNumberValue(), 9.5);
    EXPECT_EQ(price->effectiveFormat().getNumberFormat(), Constants::kDecimalNumberFormat);
    
    const Cell* name = sheet.findCell(2, 2);
    ASSERT_TRUE(name->isString());
    EXPECT_EQ(name->getStringValue(), "widget");
}

// 空值不创建单元格
TEST_F(WorkbookRendererTest, NullMarkerLeavesCellEmpty) {
    beginResultSet();
    renderer->emitRow({Constants::kNullMarker, Constants::kNullMarker, "x"}, columns);
    
    const Worksheet& sheet = *renderer->currentTab().sheet;
    EXPECT_FALSE(sheet.hasCellAt(2, 0));
    EXPECT_FALSE(sheet.hasCellAt(2, 1));
    EXPECT_TRUE(sheet.hasCellAt(2, 2));
}

// 数值列里无法解析的值按文本写入
TEST_F(WorkbookRendererTest, UnparsableNumberFallsBackToText) {
    beginResultSet();
    renderer->emitRow({"12abc", "", "x"}, columns);
    
    const Worksheet& sheet = *renderer->currentTab().sheet;
    ASSERT_TRUE(sheet.findCell(2, 0)->isString());
    EXPECT_EQ(sheet.findCell(2, 0)->getStringValue(), "12abc");
    EXPECT_FALSE(sheet.findCell(2, 0)->hasFormat());
    EXPECT_EQ(sheet.findCell(2, 1)->getStringValue(), "");
}

TEST_F(WorkbookRendererTest, StyledValuesUseDirective) {
    beginResultSet();
    renderer->emitRow({"1", "2", "{BC>2}Total"}, columns);
    
    const Worksheet& sheet = *renderer->currentTab().sheet;
    const Cell* total = sheet.findCell(2, 2);
    EXPECT_EQ(total->getStringValue(), "Total");
    EXPECT_TRUE(total->effectiveFormat().isBold());
    EXPECT_EQ(total->effectiveFormat().getHorizontalAlign(), HorizontalAlign::Center);
    ASSERT_EQ(sheet.getMergeRanges().size(), 1u);
    EXPECT_EQ(sheet.getMergeRanges()[0], (MergeRange{2, 2, 2, 4}));
}

// 同一结果集的后续分页接着写在同一个工作表上
TEST_F(WorkbookRendererTest, LaterPagesContinueOnSameSheet) {
    beginResultSet();
    renderer->emitRow({"1", "1.0", "a"}, columns);
    renderer->emitRow({"2", "2.0", "b"}, columns);
    renderer->endResultSet(widths);
    auto first_sheet = renderer->currentTab().sheet;
    
    renderer->beginResultSet(columns, widths, std::nullopt);
    renderer->emitRow({"3", "3.0", "c"}, columns);
    renderer->endResultSet(widths);
    
    EXPECT_EQ(renderer->currentTab().sheet, first_sheet);
    EXPECT_EQ(session->workbook().getSheetCount(), 1u);
    EXPECT_EQ(first_sheet->findCell(4, 2)->getStringValue(), "c");
    EXPECT_EQ(first_sheet->findCell(1, 0)->getStringValue(), "id");
    EXPECT_EQ(first_sheet->getLastRowNum(), 4);
}

TEST_F(WorkbookRendererTest, NextResultSetGetsNewSheet) {
    beginResultSet();
    renderer->emitRow({"1", "1.0", "a"}, columns);
    renderer->endResultSet(widths);
    
    beginResultSet();
    EXPECT_EQ(renderer->currentTab().sheet->getName(), "Sheet2");
    EXPECT_EQ(session->workbook().getSheetCount(), 2u);
}

TEST_F(WorkbookRendererTest, EndResultSetSizesColumns) {
    beginResultSet();
    renderer->emitRow({"1", "1.0", "a fairly long product name"}, columns);
    renderer->endResultSet(widths);
    
    const Worksheet& sheet = *renderer->currentTab().sheet;
    ASSERT_TRUE(sheet.getColumnWidth(2).has_value());
    ASSERT_TRUE(sheet.getColumnWidth(0).has_value());
    EXPECT_GT(*sheet.getColumnWidth(2), *sheet.getColumnWidth(0));
}

TEST_F(WorkbookRendererTest, RowBeforeResultSetThrows) {
    EXPECT_THROW(renderer->emitRow({"1", "2", "3"}, columns), OperationException);
}

TEST(RendererFactoryTest, CreatesRendererPerFormat) {
    std::ostringstream out;
    ExportOptions options;
    EXPECT_STREQ(RendererFactory::create(options, out)->getTypeName(), "text");
    options.format = OutputFormat::Csv;
    EXPECT_STREQ(RendererFactory::create(options, out)->getTypeName(), "csv");
    options.format = OutputFormat::Html;
    EXPECT_STREQ(RendererFactory::create(options, out)->getTypeName(), "html");
    
    options.format = OutputFormat::Xls;
    try {
        RendererFactory::create(options, out);
        FAIL() << "expected an exception";
    } catch (const ParameterException& e) {
        EXPECT_EQ(e.getParameterName(), "session");
    }
    
    session::WorkbookSession session(options);
    EXPECT_STREQ(RendererFactory::create(options, out, &session)->getTypeName(), "xls");
}
