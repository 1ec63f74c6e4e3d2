#pragma once

#include "tabexport/render/IResultRenderer.hpp"
#include <ostream>

namespace tabexport {
namespace render {

/**
 * @brief 定宽文本表格
 * 
 * ---------------
 * | id | name   |
 * ---------------
 * | 1  | apple  |
 * ---------------
 */
class TextRenderer : public IResultRenderer {
private:
    std::ostream& out_;
    bool headings_ = true;
    std::vector<size_t> widths_;
    
    void writeDivider(const std::vector<size_t>& widths);
    void writeCells(const std::vector<std::string>& values);

public:
    explicit TextRenderer(std::ostream& out) : out_(out) {}
    
    void beginDocument(const std::optional<std::string>& title, bool headings) override;
    void beginResultSet(const std::vector<core::ColumnDescriptor>& columns,
                        const std::vector<size_t>& widths,
                        const std::optional<std::string>& title) override;
    void emitRow(const core::Row& row, const std::vector<core::ColumnDescriptor>& columns) override;
    void endResultSet(const std::vector<size_t>& widths) override;
    void endDocument() override {}
    const char* getTypeName() const override { return "text"; }
    
    /**
     * @brief 分隔线长度：1 + Σ(width + 3)
     */
    static size_t dividerLength(const std::vector<size_t>& widths);
};

}} // namespace tabexport::render
