#include "tabexport/reader/SpreadsheetMLReader.hpp"
#include "tabexport/core/StyleBuilder.hpp"
#include "tabexport/core/Exception.hpp"
#include "tabexport/utils/CommonUtils.hpp"
#include "tabexport/utils/ModuleLoggers.hpp"
#include <filesystem>
#include <fmt/format.h>

namespace tabexport {
namespace reader {

void SpreadsheetMLReader::reset() {
    workbook_ = std::make_unique<core::Workbook>();
    styles_.clear();
    style_.reset();
    sheet_.reset();
    cell_.reset();
    in_data_ = false;
    seen_workbook_ = false;
    current_row_ = -1;
    current_col_ = -1;
    current_column_ = -1;
}

core::Result<std::unique_ptr<core::Workbook>> SpreadsheetMLReader::read(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return core::makeError(core::ErrorCode::FileNotFound, "Workbook file not found", path);
    }
    
    reset();
    xml::XMLStreamReader reader;
    bindCallbacks(reader);
    auto result = reader.parseFromFile(path);
    READER_DEBUG("Parsed {} bytes, {} elements from {}", reader.getBytesParsed(), reader.getElementsParsed(), path);
    return finish(result, reader);
}

core::Result<std::unique_ptr<core::Workbook>> SpreadsheetMLReader::readFromString(const std::string& content) {
    reset();
    xml::XMLStreamReader reader;
    bindCallbacks(reader);
    return finish(reader.parseFromString(content), reader);
}

void SpreadsheetMLReader::bindCallbacks(xml::XMLStreamReader& reader) {
    // 单元格文本里的首尾空白要原样保留
    reader.setTrimWhitespace(false);
    reader.setStartElementCallback([this](std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int) {
        onStartElement(localName(name), attributes);
    });
    reader.setEndElementCallback([this](std::string_view name, int) {
        onEndElement(localName(name));
    });
    reader.setTextCallback([this](std::string_view text, int) {
        onText(text);
    });
}

core::Result<std::unique_ptr<core::Workbook>> SpreadsheetMLReader::finish(xml::XMLParseError result,
                                                                          const xml::XMLStreamReader& reader) {
    if (result == xml::XMLParseError::IoError) {
        return core::makeError(core::ErrorCode::FileReadError, reader.getLastErrorMessage());
    }
    if (result == xml::XMLParseError::CallbackError) {
        return core::makeError(core::ErrorCode::XmlInvalidFormat, reader.getLastErrorMessage());
    }
    if (!xml::isSuccess(result)) {
        return core::makeError(core::ErrorCode::XmlParseError, reader.getLastErrorMessage());
    }
    if (!seen_workbook_) {
        return core::makeError(core::ErrorCode::InvalidWorkbook, "Document has no Workbook element");
    }
    
    READER_INFO("Loaded workbook with {} sheet(s), {} style(s)",
                workbook_->getSheetCount(), workbook_->getFormatRepository().getFormatCount());
    return std::move(workbook_);
}

void SpreadsheetMLReader::onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes) {
    if (name == "Workbook") {
        seen_workbook_ = true;
    } else if (name == "Style") {
        startStyle(attributes);
    } else if (style_ && name == "Font") {
        if (auto font_name = findAttribute(attributes, "FontName")) style_->font_name = std::string(*font_name);
        if (auto size = findDoubleAttribute(attributes, "Size")) style_->font_size = *size;
        style_->bold = findBoolAttribute(attributes, "Bold");
        style_->italic = findBoolAttribute(attributes, "Italic");
        if (auto underline = findAttribute(attributes, "Underline")) {
            style_->underline = core::parseUnderline(std::string(*underline).c_str());
        }
    } else if (style_ && name == "Alignment") {
        if (auto horizontal = findAttribute(attributes, "Horizontal")) {
            style_->horizontal = core::parseHorizontalAlign(std::string(*horizontal).c_str());
        }
        if (auto vertical = findAttribute(attributes, "Vertical")) {
            style_->vertical = core::parseVerticalAlign(std::string(*vertical).c_str());
        }
    } else if (style_ && name == "NumberFormat") {
        if (auto format = findAttribute(attributes, "Format")) style_->number_format = std::string(*format);
    } else if (name == "Worksheet") {
        auto sheet_name = findAttribute(attributes, "Name");
        sheet_ = workbook_->addSheet(sheet_name ? std::string(*sheet_name) : std::string());
        current_row_ = -1;
        current_column_ = -1;
    } else if (sheet_ && name == "Column") {
        current_column_ = findIntAttribute(attributes, "Index").value_or(current_column_ + 2) - 1;
        if (auto width = findDoubleAttribute(attributes, "Width")) {
            sheet_->setColumnWidth(current_column_, *width);
        }
    } else if (sheet_ && name == "Row") {
        current_row_ = findIntAttribute(attributes, "Index").value_or(current_row_ + 2) - 1;
        current_col_ = -1;
        sheet_->createRow(current_row_);
    } else if (sheet_ && name == "Cell") {
        startCell(attributes);
    } else if (cell_ && name == "Data") {
        in_data_ = true;
        cell_->has_data = true;
        cell_->text.clear();
        auto type = findAttribute(attributes, "Type");
        cell_->data_type = type ? std::string(*type) : "String";
    }
}

void SpreadsheetMLReader::onEndElement(std::string_view name) {
    if (name == "Style") {
        endStyle();
    } else if (name == "Data") {
        in_data_ = false;
    } else if (name == "Cell") {
        endCell();
    } else if (name == "Worksheet") {
        sheet_.reset();
    }
}

void SpreadsheetMLReader::onText(std::string_view text) {
    if (cell_ && in_data_) {
        cell_->text.append(text.data(), text.size());
    }
}

void SpreadsheetMLReader::startStyle(const std::vector<xml::XMLAttribute>& attributes) {
    style_.emplace();
    auto id = findAttribute(attributes, "ID");
    style_->id = id ? std::string(*id) : std::string();
}

void SpreadsheetMLReader::endStyle() {
    if (!style_) return;
    
    auto format = core::StyleBuilder()
        .fontName(style_->font_name)
        .fontSize(style_->font_size)
        .bold(style_->bold)
        .italic(style_->italic)
        .underline(style_->underline)
        .horizontalAlign(style_->horizontal)
        .verticalAlign(style_->vertical)
        .numberFormat(style_->number_format)
        .build();
    styles_[style_->id] = workbook_->addFormat(format);
    style_.reset();
}

void SpreadsheetMLReader::startCell(const std::vector<xml::XMLAttribute>& attributes) {
    CellState state;
    state.row = current_row_ < 0 ? 0 : current_row_;
    state.col = findIntAttribute(attributes, "Index").value_or(current_col_ + 2) - 1;
    
    if (auto style_id = findAttribute(attributes, "StyleID")) {
        auto it = styles_.find(std::string(*style_id));
        if (it != styles_.end()) {
            state.format = it->second;
        } else {
            READER_WARN("Unknown style '{}' at {}", std::string(*style_id),
                        utils::CommonUtils::cellReference(state.row, state.col));
        }
    }
    
    int merge_across = findIntAttribute(attributes, "MergeAcross").value_or(0);
    int merge_down = findIntAttribute(attributes, "MergeDown").value_or(0);
    if (merge_across > 0 || merge_down > 0) {
        sheet_->mergeCells(state.row, state.col, state.row + merge_down, state.col + merge_across);
    }
    
    // 合并区域覆盖的单元格不再出现在文件里，下一个隐式序号跳过它们
    current_col_ = state.col + merge_across;
    cell_ = std::move(state);
}

void SpreadsheetMLReader::endCell() {
    if (!cell_) return;
    CellState& state = *cell_;
    
    if (state.has_data) {
        if (state.data_type == "Number") {
            auto number = utils::CommonUtils::parseDouble(state.text);
            if (number) {
                sheet_->writeNumber(state.row, state.col, *number, state.format);
            } else {
                READER_WARN("Invalid number '{}' at {}, kept as text", state.text,
                            utils::CommonUtils::cellReference(state.row, state.col));
                sheet_->writeString(state.row, state.col, state.text, state.format);
            }
        } else {
            sheet_->writeString(state.row, state.col, state.text, state.format);
        }
    } else if (state.format) {
        sheet_->getCell(state.row, state.col).setFormat(state.format);
    }
    cell_.reset();
}

std::string_view SpreadsheetMLReader::localName(std::string_view name) {
    size_t colon = name.find(':');
    return colon == std::string_view::npos ? name : name.substr(colon + 1);
}

std::optional<std::string_view> SpreadsheetMLReader::findAttribute(const std::vector<xml::XMLAttribute>& attributes,
                                                                   std::string_view name) {
    for (const auto& attr : attributes) {
        if (localName(attr.name) == name) {
            return attr.value;
        }
    }
    return std::nullopt;
}

std::optional<int> SpreadsheetMLReader::findIntAttribute(const std::vector<xml::XMLAttribute>& attributes,
                                                         std::string_view name) {
    auto value = findDoubleAttribute(attributes, name);
    if (!value) {
        return std::nullopt;
    }
    return static_cast<int>(*value);
}

std::optional<double> SpreadsheetMLReader::findDoubleAttribute(const std::vector<xml::XMLAttribute>& attributes,
                                                               std::string_view name) {
    auto value = findAttribute(attributes, name);
    if (!value) {
        return std::nullopt;
    }
    return utils::CommonUtils::parseDouble(*value);
}

bool SpreadsheetMLReader::findBoolAttribute(const std::vector<xml::XMLAttribute>& attributes, std::string_view name) {
    auto value = findAttribute(attributes, name);
    return value && (*value == "1" || *value == "true");
}

}} // namespace tabexport::reader
