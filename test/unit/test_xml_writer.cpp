#include <gtest/gtest.h>
#include "tabexport/xml/XMLStreamWriter.hpp"
#include "tabexport/core/Exception.hpp"
#include "helpers/TempFile.hpp"
#include <fstream>
#include <sstream>
#include <memory>

using namespace tabexport::xml;
using tabexport::test::TempFile;

class XMLStreamWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        writer = std::make_unique<XMLStreamWriter>();
    }
    
    std::unique_ptr<XMLStreamWriter> writer;
};

// 测试基本元素写入
TEST_F(XMLStreamWriterTest, BasicElementWriting) {
    writer->startDocument();
    writer->startElement("root");
    writer->writeText("Hello World");
    writer->endElement();
    
    EXPECT_EQ(writer->toString(), "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<root>Hello World</root>");
}

// 测试属性写入
TEST_F(XMLStreamWriterTest, AttributeWriting) {
    writer->startElement("Cell");
    writer->writeAttribute("ss:Index", 3);
    writer->writeAttribute("ss:Width", 48.75);
    writer->writeAttribute("ss:StyleID", "s1");
    writer->endElement();
    
    EXPECT_EQ(writer->toString(), "<Cell ss:Index=\"3\" ss:Width=\"48.75\" ss:StyleID=\"s1\"/>");
}

TEST_F(XMLStreamWriterTest, NestedElements) {
    writer->startElement("Row");
    writer->startElement("Cell");
    writer->startElement("Data");
    writer->writeText(1234.0);
    writer->endElement();
    writer->endElement();
    writer->writeEmptyElement("Cell");
    EXPECT_EQ(writer->getDepth(), 1u);
    writer->endElement();
    
    EXPECT_EQ(writer->toString(), "<Row><Cell><Data>1234</Data></Cell><Cell/></Row>");
    EXPECT_EQ(writer->getDepth(), 0u);
}

// 测试特殊字符转义
TEST_F(XMLStreamWriterTest, SpecialCharacterEscaping) {
    writer->startElement("Data");
    writer->writeAttribute("title", "a\"b'<c>\nd");
    writer->writeText("R&D <beta>\nline");
    writer->endElement();
    
    EXPECT_EQ(writer->toString(),
              "<Data title=\"a&quot;b&apos;&lt;c&gt;&#10;d\">R&amp;D &lt;beta&gt;\nline</Data>");
}

TEST_F(XMLStreamWriterTest, ProcessingInstruction) {
    writer->writeProcessingInstruction("mso-application", "progid=\"Excel.Sheet\"");
    EXPECT_EQ(writer->toString(), "<?mso-application progid=\"Excel.Sheet\"?>\n");
}

TEST_F(XMLStreamWriterTest, RawDataIsNotEscaped) {
    writer->startElement("x");
    writer->writeRaw("<y/>");
    writer->endElement();
    EXPECT_EQ(writer->toString(), "<x><y/></x>");
}

// XML 1.0 不允许的字符替换为 U+FFFD，\r 写成字符引用
TEST_F(XMLStreamWriterTest, ReplacesCharactersNotAllowedInXml) {
    writer->startElement("c");
    writer->writeAttribute("n", std::string("a\tb\rc"));
    writer->writeText(std::string("x\x01y\r\nz\tw"));
    writer->endElement();
    EXPECT_EQ(writer->toString(),
              "<c n=\"a&#9;b&#13;c\">x\xEF\xBF\xBDy&#13;\nz\tw</c>");
}

TEST_F(XMLStreamWriterTest, ReplacesInvalidUtf8AndNonCharacters) {
    writer->startElement("c");
    writer->writeText(std::string("ok\xC3(\xEF\xBF\xBF\xE4\xB8\xAD"));
    writer->endElement();
    // 截断的两字节序列和 U+FFFF 都被替换，合法的“中”保留
    EXPECT_EQ(writer->toString(), "<c>ok\xEF\xBF\xBD(\xEF\xBF\xBD\xE4\xB8\xAD</c>");
}

// 测试错误使用
TEST_F(XMLStreamWriterTest, MisuseThrows) {
    EXPECT_THROW(writer->endElement(), tabexport::core::OperationException);
    EXPECT_THROW(writer->startElement(""), tabexport::core::ParameterException);
    EXPECT_THROW(writer->writeAttribute("a", "b"), tabexport::core::OperationException);
    
    writer->startElement("x");
    writer->writeText("body");
    EXPECT_THROW(writer->writeAttribute("late", "b"), tabexport::core::OperationException);
}

// endDocument 关闭所有未结束的元素
TEST_F(XMLStreamWriterTest, EndDocumentClosesOpenElements) {
    writer->startElement("a");
    writer->startElement("b");
    writer->writeText("t");
    writer->endDocument();
    EXPECT_EQ(writer->toString(), "<a><b>t</b></a>\n");
}

// 测试文件输出
TEST_F(XMLStreamWriterTest, FileOutput) {
    TempFile file(".xml");
    {
        XMLStreamWriter file_writer(file.path());
        EXPECT_EQ(file_writer.getOutputMode(), XMLStreamWriter::OutputMode::FILE_DIRECT);
        file_writer.startDocument();
        file_writer.startElement("root");
        for (int i = 0; i < 2000; ++i) {
            file_writer.startElement("item");
            file_writer.writeAttribute("id", i);
            file_writer.endElement();
        }
        file_writer.endElement();
        file_writer.endDocument();
        EXPECT_GT(file_writer.getBytesWritten(), 0u);
        EXPECT_EQ(file_writer.toString(), "");
    }
    
    std::ifstream in(file.path());
    std::stringstream content;
    content << in.rdbuf();
    std::string text = content.str();
    EXPECT_EQ(text.rfind("<?xml", 0), 0u);
    EXPECT_NE(text.find("<item id=\"1999\"/>"), std::string::npos);
    EXPECT_NE(text.find("</root>\n"), std::string::npos);
}

TEST_F(XMLStreamWriterTest, UnwritableFileThrows) {
    EXPECT_THROW(XMLStreamWriter("/nonexistent-dir/sub/out.xml"), tabexport::core::FileException);
}
