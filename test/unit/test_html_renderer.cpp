#include <gtest/gtest.h>
#include "tabexport/render/HtmlRenderer.hpp"
#include "tabexport/render/DefaultStylesheet.hpp"
#include "helpers/TempFile.hpp"
#include <fstream>
#include <sstream>

using namespace tabexport::core;
using namespace tabexport::render;
using tabexport::test::TempFile;

namespace {

const char* kHead =
    "<html><head><title>Report</title>"
    "<meta http-equiv=\"content-type\" content=\"text/html;charset=UTF-8\"/>\n";

std::vector<ColumnDescriptor> twoColumns() {
    return {{"id"}, {"name"}};
}

} // namespace

// 完整文档：head、标题表格、结果表格
TEST(HtmlRendererTest, RendersDocumentWithTitle) {
    std::ostringstream out;
    HtmlRenderer renderer(out, std::nullopt);
    auto columns = twoColumns();
    
    renderer.beginDocument(std::string("{BUC3>6}Report"), true);
    renderer.beginResultSet(columns, {2, 4}, std::string("{BUC3>6}Report"));
    renderer.emitRow({"1", "ann"}, columns);
    renderer.endResultSet({2, 4});
    renderer.endDocument();
    
    std::string expected = std::string(kHead) +
        "<style type=\"text/css\">\n" + kDefaultStylesheet + "</style>\n"
        "</head>\n<body>\n"
        "<table width=\"100%\">\n<tr><th class=\"title\">Report</th></tr>\n</table>\n"
        "<table width=\"100%\">\n"
        "<tr><th align=\"center\">id</th><th align=\"center\">name</th></tr>\n"
        "<tr><td align=\"center\">1</td><td align=\"center\">ann</td></tr>\n"
        "</table>\n\n"
        "</body>\n</html>\n";
    EXPECT_EQ(out.str(), expected);
}

// 关闭标题行时 head 仍然输出，表头行省略
TEST(HtmlRendererTest, HeadingsOffOmitsHeaderRow) {
    std::ostringstream out;
    HtmlRenderer renderer(out, std::nullopt);
    auto columns = twoColumns();
    
    renderer.beginDocument(std::nullopt, false);
    renderer.beginResultSet(columns, {2, 4}, std::nullopt);
    renderer.emitRow({"1", "ann"}, columns);
    renderer.endResultSet({2, 4});
    renderer.endDocument();
    
    std::string html = out.str();
    EXPECT_EQ(html.rfind("<html><head><title></title>", 0), 0u);
    EXPECT_EQ(html.find("<th"), std::string::npos);
    EXPECT_NE(html.find("<table width=\"100%\">\n<tr><td align=\"center\">1</td>"), std::string::npos);
}

TEST(HtmlRendererTest, UsesCustomStylesheet) {
    TempFile css(".css");
    {
        std::ofstream file(css.path());
        file << "td { color: red; }";
    }
    
    std::ostringstream out;
    HtmlRenderer renderer(out, css.path());
    renderer.beginDocument(std::nullopt, true);
    
    EXPECT_NE(out.str().find("<style type=\"text/css\">\ntd { color: red; }\n</style>\n</head>"), std::string::npos);
}

// 样式表文件读不到时不输出 <style>，文档照常生成
TEST(HtmlRendererTest, MissingStylesheetIsSkipped) {
    TempFile css(".css");
    std::ostringstream out;
    HtmlRenderer renderer(out, css.path());
    renderer.beginDocument(std::nullopt, true);
    renderer.endDocument();
    
    std::string html = out.str();
    EXPECT_EQ(html.find("<style"), std::string::npos);
    EXPECT_NE(html.find("</head>\n<body>\n</body>\n</html>\n"), std::string::npos);
}
