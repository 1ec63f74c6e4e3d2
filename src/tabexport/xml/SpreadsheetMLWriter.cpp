#include "tabexport/xml/SpreadsheetMLWriter.hpp"
#include "tabexport/xml/SpreadsheetMLNames.hpp"
#include "tabexport/xml/StyleSerializer.hpp"
#include "tabexport/core/Workbook.hpp"
#include "tabexport/utils/CommonUtils.hpp"
#include "tabexport/utils/ModuleLoggers.hpp"
#include <map>

namespace tabexport {
namespace xml {

SpreadsheetMLWriter::SpreadsheetMLWriter(const core::Workbook& workbook)
    : workbook_(workbook) {
}

void SpreadsheetMLWriter::writeToFile(const std::string& path) const {
    XMLStreamWriter writer(path);
    writeWorkbook(writer);
    XML_DEBUG("Wrote {} bytes to {}", writer.getBytesWritten(), path);
}

std::string SpreadsheetMLWriter::writeToString() const {
    XMLStreamWriter writer;
    writeWorkbook(writer);
    return writer.toString();
}

void SpreadsheetMLWriter::writeWorkbook(XMLStreamWriter& writer) const {
    writer.startDocument();
    writer.writeProcessingInstruction(SpreadsheetML::PI_TARGET, SpreadsheetML::PI_DATA);
    
    writer.startElement("Workbook");
    writer.writeAttribute("xmlns", SpreadsheetML::NS_SPREADSHEET);
    writer.writeAttribute("xmlns:o", SpreadsheetML::NS_OFFICE);
    writer.writeAttribute("xmlns:x", SpreadsheetML::NS_EXCEL);
    writer.writeAttribute("xmlns:ss", SpreadsheetML::NS_SPREADSHEET);
    writer.writeAttribute("xmlns:html", SpreadsheetML::NS_HTML);
    
    StyleSerializer::serialize(workbook_.getFormatRepository(), writer);
    
    for (size_t i = 0; i < workbook_.getSheetCount(); ++i) {
        writeWorksheet(*workbook_.getSheet(i), writer);
    }
    
    writer.endElement(); // Workbook
    writer.endDocument();
}

void SpreadsheetMLWriter::writeWorksheet(const core::Worksheet& worksheet, XMLStreamWriter& writer) const {
    writer.startElement("Worksheet");
    writer.writeAttribute("ss:Name", worksheet.getName());
    writer.startElement("Table");
    
    for (const auto& [col, width] : worksheet.getColumnWidths()) {
        writer.startElement("Column");
        writer.writeAttribute("ss:Index", col + 1);
        writer.writeAttribute("ss:Width", width);
        writer.endElement();
    }
    
    std::vector<core::MergeRange> merges = clipMerges(worksheet);
    
    // 行号 -> (列号 -> 单元格)；合并区域左上角没有单元格时占位为 nullptr，
    // 被合并覆盖的其余单元格不输出。没有单元格的已登记行写成空 <Row/>
    std::map<int, std::map<int, const core::Cell*>> layout;
    for (const auto& [row, row_cells] : worksheet.rows()) {
        auto& row_layout = layout[row];
        for (const auto& [col, cell] : row_cells) {
            const core::MergeRange* merge = findMerge(merges, row, col);
            if (merge && (merge->first_row != row || merge->first_col != col)) {
                continue;
            }
            row_layout[col] = &cell;
        }
    }
    for (const auto& merge : merges) {
        auto& row_layout = layout[merge.first_row];
        if (row_layout.find(merge.first_col) == row_layout.end()) {
            row_layout[merge.first_col] = nullptr;
        }
    }
    
    for (const auto& [row, row_layout] : layout) {
        writer.startElement("Row");
        writer.writeAttribute("ss:Index", row + 1);
        for (const auto& [col, cell] : row_layout) {
            writeCell(col, cell, findMerge(merges, row, col), writer);
        }
        writer.endElement(); // Row
    }
    
    writer.endElement(); // Table
    writer.endElement(); // Worksheet
}

void SpreadsheetMLWriter::writeCell(int col, const core::Cell* cell, const core::MergeRange* merge,
                                    XMLStreamWriter& writer) const {
    writer.startElement("Cell");
    writer.writeAttribute("ss:Index", col + 1);
    
    if (cell) {
        int style_id = resolveStyleId(*cell);
        if (style_id != 0) {
            writer.writeAttribute("ss:StyleID", StyleSerializer::styleId(style_id));
        }
    }
    
    if (merge) {
        if (merge->last_col > merge->first_col) {
            writer.writeAttribute("ss:MergeAcross", merge->last_col - merge->first_col);
        }
        if (merge->last_row > merge->first_row) {
            writer.writeAttribute("ss:MergeDown", merge->last_row - merge->first_row);
        }
    }
    
    if (cell && !cell->isEmpty()) {
        writer.startElement("Data");
        if (cell->isNumber()) {
            writer.writeAttribute("ss:Type", SpreadsheetML::TYPE_NUMBER);
            writer.writeText(cell->getNumberValue());
        } else {
            writer.writeAttribute("ss:Type", SpreadsheetML::TYPE_STRING);
            writer.writeText(cell->getStringValue());
        }
        writer.endElement(); // Data
    }
    
    writer.endElement(); // Cell
}

std::vector<core::MergeRange> SpreadsheetMLWriter::clipMerges(const core::Worksheet& worksheet) {
    auto filled = [&worksheet](int row, int col) {
        const core::Cell* cell = worksheet.findCell(row, col);
        return cell && !cell->isEmpty();
    };
    
    std::vector<core::MergeRange> clipped;
    for (const auto& merge : worksheet.getMergeRanges()) {
        core::MergeRange range = merge;
        for (int col = range.first_col + 1; col <= range.last_col; ++col) {
            if (filled(range.first_row, col)) {
                range.last_col = col - 1;
                break;
            }
        }
        for (int row = range.first_row + 1; row <= range.last_row; ++row) {
            bool row_filled = false;
            for (int col = range.first_col; col <= range.last_col && !row_filled; ++col) {
                row_filled = filled(row, col);
            }
            if (row_filled) {
                range.last_row = row - 1;
                break;
            }
        }
        
        if (!(range == merge)) {
            XML_WARN("Merge {}:{} in '{}' covers cells with values, shrunk to {}:{}",
                     utils::CommonUtils::cellReference(merge.first_row, merge.first_col),
                     utils::CommonUtils::cellReference(merge.last_row, merge.last_col),
                     worksheet.getName(),
                     utils::CommonUtils::cellReference(range.first_row, range.first_col),
                     utils::CommonUtils::cellReference(range.last_row, range.last_col));
        }
        if (range.last_row > range.first_row || range.last_col > range.first_col) {
            clipped.push_back(range);
        }
    }
    return clipped;
}

const core::MergeRange* SpreadsheetMLWriter::findMerge(const std::vector<core::MergeRange>& merges,
                                                       int row, int col) {
    for (const auto& merge : merges) {
        if (merge.contains(row, col)) {
            return &merge;
        }
    }
    return nullptr;
}

int SpreadsheetMLWriter::resolveStyleId(const core::Cell& cell) const {
    auto format = cell.getFormatDescriptor();
    if (!format) {
        return 0;
    }
    int id = workbook_.getFormatRepository().findFormatId(*format);
    if (id < 0) {
        XML_WARN("Cell format not registered in workbook, falling back to default style");
        return 0;
    }
    return id;
}

}} // namespace tabexport::xml
