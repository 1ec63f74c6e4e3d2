#pragma once

#include "tabexport/render/IResultRenderer.hpp"
#include <ostream>

namespace tabexport {
namespace render {

/**
 * @brief 逗号分隔输出
 * @note 值中的逗号、引号和换行不做转义
 */
class CsvRenderer : public IResultRenderer {
private:
    std::ostream& out_;
    bool headings_ = true;
    
    void writeLine(const std::vector<std::string>& values);

public:
    explicit CsvRenderer(std::ostream& out) : out_(out) {}
    
    void beginDocument(const std::optional<std::string>& title, bool headings) override;
    void beginResultSet(const std::vector<core::ColumnDescriptor>& columns,
                        const std::vector<size_t>& widths,
                        const std::optional<std::string>& title) override;
    void emitRow(const core::Row& row, const std::vector<core::ColumnDescriptor>& columns) override;
    void endResultSet(const std::vector<size_t>& /*widths*/) override {}
    void endDocument() override {}
    const char* getTypeName() const override { return "csv"; }
};

}} // namespace tabexport::render
