#include "tabexport/xml/StyleSerializer.hpp"
#include "tabexport/xml/SpreadsheetMLNames.hpp"
#include "tabexport/utils/ModuleLoggers.hpp"

namespace tabexport {
namespace xml {

std::string StyleSerializer::styleId(int format_id) {
    if (format_id <= 0) {
        return SpreadsheetML::DEFAULT_STYLE_ID;
    }
    return SpreadsheetML::STYLE_ID_PREFIX + std::to_string(format_id);
}

void StyleSerializer::serialize(const core::FormatRepository& repository, XMLStreamWriter& writer) {
    writer.startElement("Styles");
    
    int id = 0;
    for (const auto& format : repository) {
        writeStyle(styleId(id), *format, writer);
        ++id;
    }
    
    writer.endElement(); // Styles
    XML_DEBUG("Serialized {} styles", repository.getFormatCount());
}

void StyleSerializer::writeStyle(const std::string& id, const core::FormatDescriptor& format,
                                 XMLStreamWriter& writer) {
    writer.startElement("Style");
    writer.writeAttribute("ss:ID", id);
    if (id == SpreadsheetML::DEFAULT_STYLE_ID) {
        writer.writeAttribute("ss:Name", "Normal");
    }
    
    writer.startElement("Alignment");
    if (format.getHorizontalAlign() != core::HorizontalAlign::None) {
        writer.writeAttribute("ss:Horizontal", core::toString(format.getHorizontalAlign()));
    }
    writer.writeAttribute("ss:Vertical", core::toString(format.getVerticalAlign()));
    writer.endElement();
    
    writer.startElement("Font");
    writer.writeAttribute("ss:FontName", format.getFontName());
    writer.writeAttribute("ss:Size", format.getFontSize());
    if (format.isBold()) {
        writer.writeAttribute("ss:Bold", 1);
    }
    if (format.isItalic()) {
        writer.writeAttribute("ss:Italic", 1);
    }
    if (format.getUnderline() != core::UnderlineType::None) {
        writer.writeAttribute("ss:Underline", core::toString(format.getUnderline()));
    }
    writer.endElement();
    
    if (!format.getNumberFormat().empty()) {
        writer.startElement("NumberFormat");
        writer.writeAttribute("ss:Format", format.getNumberFormat());
        writer.endElement();
    }
    
    writer.endElement(); // Style
}

}} // namespace tabexport::xml
