#include <gtest/gtest.h>
#include "tabexport/session/ExportEngine.hpp"
#include "tabexport/core/Workbook.hpp"
#include "tabexport/core/Exception.hpp"
#include "helpers/FakeStatementExecutor.hpp"
#include "helpers/TempFile.hpp"
#include <sstream>

using namespace tabexport;
using namespace tabexport::core;
using tabexport::session::ExportEngine;
using tabexport::test::FakeResult;
using tabexport::test::FakeStatementExecutor;
using tabexport::test::TempFile;
using tabexport::test::numberedRows;

namespace {

size_t countOccurrences(const std::string& text, const std::string& fragment) {
    size_t count = 0;
    for (size_t pos = text.find(fragment); pos != std::string::npos; pos = text.find(fragment, pos + 1)) {
        ++count;
    }
    return count;
}

} // namespace

class ExportEngineTest : public ::testing::Test {
protected:
    FakeStatementExecutor executor;
    ExportOptions options;
    std::ostringstream out;
    std::vector<ColumnDescriptor> single{{"n", ColumnType::IntegerLike}};
};

TEST_F(ExportEngineTest, RendersTextTable) {
    executor.on("select", {FakeResult::table({{"id"}, {"name"}}, {{"1", "ann"}, {"2", "bo"}})});
    ExportEngine engine(options, executor, out);
    engine.executeStatement("select");
    
    EXPECT_EQ(out.str(),
              "-------------\n"
              "| id | name |\n"
              "-------------\n"
              "| 1  | ann  |\n"
              "| 2  | bo   |\n"
              "-------------\n");
}

// 每页单独成表，行数正好是容量的整数倍时不产生空页
TEST_F(ExportEngineTest, PagesLargeResultSets) {
    options.format = OutputFormat::Csv;
    executor.on("select", {FakeResult::table(single, numberedRows(6))});
    ExportEngine engine(options, executor, out, 3);
    engine.executeStatement("select");
    
    EXPECT_EQ(out.str(), "n\n1\n2\n3\nn\n4\n5\n6\n");
    EXPECT_EQ(engine.getStats().pages, 2u);
    EXPECT_EQ(engine.getStats().rows, 6u);
    EXPECT_EQ(engine.getStats().result_sets, 1u);
}

TEST_F(ExportEngineTest, PartialLastPage) {
    options.format = OutputFormat::Csv;
    executor.on("select", {FakeResult::table(single, numberedRows(4))});
    ExportEngine engine(options, executor, out, 3);
    engine.executeStatement("select");
    
    EXPECT_EQ(out.str(), "n\n1\n2\n3\nn\n4\n");
    EXPECT_EQ(engine.getStats().pages, 2u);
}

// 空结果集仍然输出一次表头
TEST_F(ExportEngineTest, EmptyResultSetFramedOnce) {
    options.format = OutputFormat::Csv;
    executor.on("select", {FakeResult::table(single, {})});
    ExportEngine engine(options, executor, out, 3);
    engine.executeStatement("select");
    
    EXPECT_EQ(out.str(), "n\n");
    EXPECT_EQ(engine.getStats().pages, 1u);
    EXPECT_EQ(engine.getStats().rows, 0u);
}

TEST_F(ExportEngineTest, ReportsUpdateCounts) {
    executor.on("update", {FakeResult::update(3)});
    ExportEngine engine(options, executor, out);
    engine.executeStatement("update");
    
    EXPECT_EQ(out.str(), "\nUpdated: 3\n\n");
    EXPECT_EQ(engine.getStats().update_counts, 1u);
}

TEST_F(ExportEngineTest, ResultsOnlySuppressesUpdateCounts) {
    options.format = OutputFormat::Csv;
    options.results_only = true;
    executor.on("batch", {FakeResult::update(1), FakeResult::table(single, {{"9"}}), FakeResult::update(0)});
    ExportEngine engine(options, executor, out);
    engine.executeStatement("batch");
    
    EXPECT_EQ(out.str(), "n\n9\n");
    EXPECT_EQ(engine.getStats().update_counts, 2u);
}

// 多个结果集按顺序输出
TEST_F(ExportEngineTest, MultipleResultSetsInOrder) {
    options.format = OutputFormat::Csv;
    options.headings = false;
    executor.on("multi", {FakeResult::table(single, {{"1"}}), FakeResult::update(2),
                          FakeResult::table({{"s"}}, {{"x"}})});
    ExportEngine engine(options, executor, out);
    engine.executeStatement("multi");
    
    EXPECT_EQ(out.str(), "1\n\nUpdated: 2\n\nx\n");
    EXPECT_EQ(engine.getStats().result_sets, 2u);
}

TEST_F(ExportEngineTest, HtmlDocumentPerStatement) {
    options.format = OutputFormat::Html;
    executor.on("select", {FakeResult::table(single, {{"1"}}), FakeResult::table(single, {{"2"}})});
    ExportEngine engine(options, executor, out);
    engine.executeStatement("select");
    engine.executeStatement("select");
    
    std::string html = out.str();
    EXPECT_EQ(countOccurrences(html, "<html>"), 2u);
    EXPECT_EQ(countOccurrences(html, "</html>"), 2u);
    EXPECT_EQ(countOccurrences(html, "<table width=\"100%\">"), 4u);
}

TEST_F(ExportEngineTest, ExecutorErrorPropagates) {
    ExportEngine engine(options, executor, out);
    EXPECT_THROW(engine.executeStatement("bogus"), DatabaseException);
    EXPECT_EQ(out.str(), "");
}

// 工作簿输出：语句结束时保存到文件
TEST_F(ExportEngineTest, WorkbookSavedAfterStatement) {
    TempFile output(".xml");
    options.format = OutputFormat::Xls;
    options.output_file = output.path();
    options.tabs = parseTabSpec("[Orders]");
    executor.on("select", {FakeResult::table({{"id", ColumnType::IntegerLike}, {"item"}},
                                             {{"1", "bolt"}, {"2", "<NULL>"}}),
                           FakeResult::update(5)});
    
    ExportEngine engine(options, executor, out, 1);
    engine.executeStatement("select");
    ASSERT_TRUE(output.exists());
    EXPECT_EQ(out.str(), "\nUpdated: 5\n\n");
    
    auto loaded = Workbook::load(output.path());
    ASSERT_TRUE(loaded.hasValue()) << loaded.error().fullMessage();
    auto workbook = std::move(loaded).value();
    ASSERT_EQ(workbook->getSheetNames(), (std::vector<std::string>{"Orders"}));
    
    auto sheet = workbook->getSheet("Orders");
    EXPECT_EQ(sheet->findCell(0, 0)->getStringValue(), "Orders");
    EXPECT_EQ(sheet->findCell(1, 1)->getStringValue(), "item");
    EXPECT_DOUBLE_EQ(sheet->findCell(2, 0)->getNumberValue(), 1.0);
    EXPECT_DOUBLE_EQ(sheet->findCell(3, 0)->getNumberValue(), 2.0);
    EXPECT_EQ(sheet->findCell(3, 1), nullptr);
    EXPECT_EQ(engine.getStats().pages, 2u);
}
