#pragma once

#include "tabexport/xml/XMLStreamWriter.hpp"
#include <string>
#include <vector>

namespace tabexport {

namespace core {
    class Workbook;
    class Worksheet;
    class Cell;
    struct MergeRange;
}

namespace xml {

/**
 * @brief 工作簿序列化为 2003 XML 表格格式
 * 
 * 输出单个 XML 文件：Styles 区 + 每个工作表一个 Worksheet/Table。
 * 行、列、单元格都带显式的 ss:Index。空单元格不输出，已登记但没有单元格的行
 * 输出为空 <Row/>，重新加载后行号不变。
 */
class SpreadsheetMLWriter {
private:
    const core::Workbook& workbook_;
    
    void writeWorkbook(XMLStreamWriter& writer) const;
    void writeWorksheet(const core::Worksheet& worksheet, XMLStreamWriter& writer) const;
    void writeCell(int col, const core::Cell* cell, const core::MergeRange* merge,
                   XMLStreamWriter& writer) const;
    
    /**
     * @brief 保存用的合并区域：合并只能覆盖空单元格
     *
     * 区域内出现有值的单元格时，横向收缩到它之前的一列，纵向收缩到它之前的一行，
     * 保证这些值能写进文件。收缩后只剩一个单元格的区域被丢弃。
     */
    static std::vector<core::MergeRange> clipMerges(const core::Worksheet& worksheet);
    static const core::MergeRange* findMerge(const std::vector<core::MergeRange>& merges, int row, int col);
    int resolveStyleId(const core::Cell& cell) const;

public:
    explicit SpreadsheetMLWriter(const core::Workbook& workbook);
    
    /**
     * @brief 写入文件（覆盖）
     * @throws FileException 文件无法打开或写入失败
     */
    void writeToFile(const std::string& path) const;
    
    /**
     * @brief 生成完整文档文本
     */
    std::string writeToString() const;
};

}} // namespace tabexport::xml
