#pragma once

#include "tabexport/core/Workbook.hpp"
#include "tabexport/core/Expected.hpp"
#include "tabexport/xml/XMLStreamReader.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <unordered_map>
#include <memory>

namespace tabexport {
namespace reader {

/**
 * @brief 2003 XML 表格文件读取器
 * 
 * 基于 XMLStreamReader 的 SAX 事件重建 Workbook：样式、工作表、
 * 列宽、单元格（数字/文本）和合并区域。ss:Index 省略时按前一项加一推算。
 * 不认识的元素直接忽略。
 */
class SpreadsheetMLReader {
public:
    SpreadsheetMLReader() = default;
    
    SpreadsheetMLReader(const SpreadsheetMLReader&) = delete;
    SpreadsheetMLReader& operator=(const SpreadsheetMLReader&) = delete;
    
    /**
     * @brief 读取文件
     * @return 文件不存在返回 FileNotFound；内容无法解析返回 XmlParseError 或 InvalidWorkbook
     */
    core::Result<std::unique_ptr<core::Workbook>> read(const std::string& path);
    
    /**
     * @brief 从内存中的文档读取
     */
    core::Result<std::unique_ptr<core::Workbook>> readFromString(const std::string& content);

private:
    // 解析状态
    struct StyleState {
        std::string id;
        std::string font_name = "Arial";
        double font_size = 10.0;
        bool bold = false;
        bool italic = false;
        core::UnderlineType underline = core::UnderlineType::None;
        core::HorizontalAlign horizontal = core::HorizontalAlign::None;
        core::VerticalAlign vertical = core::VerticalAlign::Bottom;
        std::string number_format;
    };
    
    struct CellState {
        int row = 0;
        int col = 0;
        std::shared_ptr<const core::FormatDescriptor> format;
        std::string data_type;
        std::string text;
        bool has_data = false;
    };
    
    std::unique_ptr<core::Workbook> workbook_;
    std::unordered_map<std::string, std::shared_ptr<const core::FormatDescriptor>> styles_;
    std::optional<StyleState> style_;
    std::shared_ptr<core::Worksheet> sheet_;
    std::optional<CellState> cell_;
    bool in_data_ = false;
    bool seen_workbook_ = false;
    int current_row_ = -1;
    int current_col_ = -1;
    int current_column_ = -1;   // <Column> 序号
    
    void reset();
    void bindCallbacks(xml::XMLStreamReader& reader);
    core::Result<std::unique_ptr<core::Workbook>> finish(xml::XMLParseError result,
                                                         const xml::XMLStreamReader& reader);
    
    void onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes);
    void onEndElement(std::string_view name);
    void onText(std::string_view text);
    
    void startStyle(const std::vector<xml::XMLAttribute>& attributes);
    void endStyle();
    void startCell(const std::vector<xml::XMLAttribute>& attributes);
    void endCell();
    
    // 去掉 "ss:" 之类的前缀
    static std::string_view localName(std::string_view name);
    
    static std::optional<std::string_view> findAttribute(const std::vector<xml::XMLAttribute>& attributes,
                                                         std::string_view name);
    static std::optional<int> findIntAttribute(const std::vector<xml::XMLAttribute>& attributes,
                                               std::string_view name);
    static std::optional<double> findDoubleAttribute(const std::vector<xml::XMLAttribute>& attributes,
                                                     std::string_view name);
    static bool findBoolAttribute(const std::vector<xml::XMLAttribute>& attributes, std::string_view name);
};

}} // namespace tabexport::reader
