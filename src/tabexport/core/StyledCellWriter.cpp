#include "tabexport/core/StyledCellWriter.hpp"
#include "tabexport/core/StyleBuilder.hpp"
#include "tabexport/utils/ModuleLoggers.hpp"

namespace tabexport {
namespace core {

StyleDirective StyledCellWriter::write(Worksheet& sheet, int row, int col, const std::string& value) {
    StyleDirective directive = StyleDirectiveParser::parse(value);
    
    auto font_style = cache_.getOrCreate(directive);
    std::shared_ptr<const FormatDescriptor> format;
    if (directive.center) {
        format = workbook_.addFormat(StyleBuilder(*font_style).centerAlign().build());
    } else {
        format = workbook_.addFormat(*font_style);
    }
    
    sheet.writeString(row, col, directive.text, format);
    
    if (directive.merge_span && *directive.merge_span > 0) {
        sheet.mergeCells(row, col, row, col + *directive.merge_span);
        CORE_DEBUG("Merged {} cells right of ({}, {}) in '{}'", *directive.merge_span, row, col, sheet.getName());
    }
    return directive;
}

}} // namespace tabexport::core
