#pragma once

#include "tabexport/render/IResultRenderer.hpp"
#include "tabexport/session/TabResolver.hpp"
#include "tabexport/core/FormatDescriptor.hpp"
#include <memory>

namespace tabexport {
namespace render {

/**
 * @brief 工作簿输出
 * 
 * 每个结果集由 TabResolver 定位到一张工作表，数据行接在工作表最后一行之后。
 * 同一结果集的后续分页继续写在同一张工作表上，不再重复标题和列头。
 * 工作簿的加载和保存由 WorkbookSession 负责，本类只写单元格。
 */
class WorkbookRenderer : public IResultRenderer {
private:
    session::WorkbookSession& session_;
    session::TabResolver resolver_;
    session::ResolvedTab current_;
    int current_sequence_ = 0;
    int next_row_ = 0;
    
    // 当前工作簿中注册过的数字格式
    std::shared_ptr<const core::FormatDescriptor> integer_format_;
    std::shared_ptr<const core::FormatDescriptor> decimal_format_;
    
    void writeValue(core::Worksheet& sheet, int row, int col,
                    const std::string& value, core::ColumnType type);

public:
    explicit WorkbookRenderer(session::WorkbookSession& session);
    
    void beginDocument(const std::optional<std::string>& title, bool headings) override;
    void beginResultSet(const std::vector<core::ColumnDescriptor>& columns,
                        const std::vector<size_t>& widths,
                        const std::optional<std::string>& title) override;
    void emitRow(const core::Row& row, const std::vector<core::ColumnDescriptor>& columns) override;
    void endResultSet(const std::vector<size_t>& widths) override;
    void endDocument() override {}
    const char* getTypeName() const override { return "xls"; }
    
    const session::ResolvedTab& currentTab() const { return current_; }
};

}} // namespace tabexport::render
