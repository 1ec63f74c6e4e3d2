#pragma once

#include "tabexport/render/IResultRenderer.hpp"
#include <ostream>

namespace tabexport {
namespace render {

/**
 * @brief HTML 表格输出
 * 
 * 每条语句输出一个完整的 HTML 文档，每个结果集（页）一个 <table>。
 * 样式表内联在 <head> 中：优先读取 css_file，缺省使用内置样式。
 */
class HtmlRenderer : public IResultRenderer {
private:
    std::ostream& out_;
    std::optional<std::string> css_file_;
    bool headings_ = true;
    
    void writeStylesheet();

public:
    HtmlRenderer(std::ostream& out, std::optional<std::string> css_file)
        : out_(out), css_file_(std::move(css_file)) {}
    
    void beginDocument(const std::optional<std::string>& title, bool headings) override;
    void beginResultSet(const std::vector<core::ColumnDescriptor>& columns,
                        const std::vector<size_t>& widths,
                        const std::optional<std::string>& title) override;
    void emitRow(const core::Row& row, const std::vector<core::ColumnDescriptor>& columns) override;
    void endResultSet(const std::vector<size_t>& widths) override;
    void endDocument() override;
    const char* getTypeName() const override { return "html"; }
};

}} // namespace tabexport::render
