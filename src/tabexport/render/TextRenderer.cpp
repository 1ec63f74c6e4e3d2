#include "tabexport/render/TextRenderer.hpp"

namespace tabexport {
namespace render {

size_t TextRenderer::dividerLength(const std::vector<size_t>& widths) {
    size_t length = 1;
    for (size_t width : widths) {
        length += width + 3;
    }
    return length;
}

void TextRenderer::writeDivider(const std::vector<size_t>& widths) {
    out_ << std::string(dividerLength(widths), '-') << '\n';
}

void TextRenderer::writeCells(const std::vector<std::string>& values) {
    out_ << '|';
    for (size_t i = 0; i < values.size(); ++i) {
        const std::string& value = values[i];
        size_t width = i < widths_.size() ? widths_[i] : value.size();
        out_ << ' ' << value;
        if (value.size() < width) {
            out_ << std::string(width - value.size(), ' ');
        }
        out_ << " |";
    }
    out_ << '\n';
}

void TextRenderer::beginDocument(const std::optional<std::string>& /*title*/, bool headings) {
    headings_ = headings;
}

void TextRenderer::beginResultSet(const std::vector<core::ColumnDescriptor>& columns,
                                  const std::vector<size_t>& widths,
                                  const std::optional<std::string>& /*title*/) {
    widths_ = widths;
    if (!headings_) {
        return;
    }
    
    std::vector<std::string> names;
    names.reserve(columns.size());
    for (const auto& column : columns) {
        names.push_back(column.name);
    }
    
    writeDivider(widths_);
    writeCells(names);
    writeDivider(widths_);
}

void TextRenderer::emitRow(const core::Row& row, const std::vector<core::ColumnDescriptor>& /*columns*/) {
    writeCells(row);
}

void TextRenderer::endResultSet(const std::vector<size_t>& widths) {
    writeDivider(widths);
}

}} // namespace tabexport::render
