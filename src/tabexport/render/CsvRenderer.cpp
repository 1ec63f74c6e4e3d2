#include "tabexport/render/CsvRenderer.hpp"
#include "tabexport/core/StyleDirective.hpp"

namespace tabexport {
namespace render {

void CsvRenderer::writeLine(const std::vector<std::string>& values) {
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            out_ << ',';
        }
        out_ << values[i];
    }
    out_ << '\n';
}

void CsvRenderer::beginDocument(const std::optional<std::string>& /*title*/, bool headings) {
    headings_ = headings;
}

void CsvRenderer::beginResultSet(const std::vector<core::ColumnDescriptor>& columns,
                                 const std::vector<size_t>& /*widths*/,
                                 const std::optional<std::string>& title) {
    if (!headings_) {
        return;
    }
    
    if (title) {
        out_ << core::StyleDirectiveParser::displayText(*title) << '\n';
    }
    
    std::vector<std::string> names;
    names.reserve(columns.size());
    for (const auto& column : columns) {
        names.push_back(column.name);
    }
    writeLine(names);
}

void CsvRenderer::emitRow(const core::Row& row, const std::vector<core::ColumnDescriptor>& /*columns*/) {
    writeLine(row);
}

}} // namespace tabexport::render
