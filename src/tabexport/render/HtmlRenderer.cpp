#include "tabexport/render/HtmlRenderer.hpp"
#include "tabexport/render/DefaultStylesheet.hpp"
#include "tabexport/core/StyleDirective.hpp"
#include "tabexport/utils/ModuleLoggers.hpp"
#include <fstream>
#include <sstream>

namespace tabexport {
namespace render {

void HtmlRenderer::writeStylesheet() {
    std::string css;
    if (css_file_) {
        std::ifstream in(*css_file_);
        if (!in) {
            RENDER_WARN("Cannot read stylesheet '{}', continuing without custom styling", *css_file_);
            return;
        }
        std::ostringstream buffer;
        buffer << in.rdbuf();
        css = buffer.str();
    } else {
        css = kDefaultStylesheet;
    }
    
    out_ << "<style type=\"text/css\">\n" << css;
    if (!css.empty() && css.back() != '\n') {
        out_ << '\n';
    }
    out_ << "</style>\n";
}

void HtmlRenderer::beginDocument(const std::optional<std::string>& title, bool headings) {
    headings_ = headings;
    std::string text = title ? core::StyleDirectiveParser::displayText(*title) : std::string();
    
    out_ << "<html><head><title>" << text << "</title>"
         << "<meta http-equiv=\"content-type\" content=\"text/html;charset=UTF-8\"/>\n";
    writeStylesheet();
    out_ << "</head>\n";
    out_ << "<body>\n";
    
    if (title) {
        out_ << "<table width=\"100%\">\n";
        out_ << "<tr><th class=\"title\">" << text << "</th></tr>\n";
        out_ << "</table>\n";
    }
}

void HtmlRenderer::beginResultSet(const std::vector<core::ColumnDescriptor>& columns,
                                  const std::vector<size_t>& /*widths*/,
                                  const std::optional<std::string>& /*title*/) {
    out_ << "<table width=\"100%\">\n";
    if (!headings_) {
        return;
    }
    
    out_ << "<tr>";
    for (const auto& column : columns) {
        out_ << "<th align=\"center\">" << column.name << "</th>";
    }
    out_ << "</tr>\n";
}

void HtmlRenderer::emitRow(const core::Row& row, const std::vector<core::ColumnDescriptor>& /*columns*/) {
    out_ << "<tr>";
    for (const auto& value : row) {
        out_ << "<td align=\"center\">" << value << "</td>";
    }
    out_ << "</tr>\n";
}

void HtmlRenderer::endResultSet(const std::vector<size_t>& /*widths*/) {
    out_ << "</table>\n\n";
}

void HtmlRenderer::endDocument() {
    out_ << "</body>\n";
    out_ << "</html>\n";
}

}} // namespace tabexport::render
