#include "tabexport/render/WorkbookRenderer.hpp"
#include "tabexport/session/WorkbookSession.hpp"
#include "tabexport/core/StyleBuilder.hpp"
#include "tabexport/core/StyledCellWriter.hpp"
#include "tabexport/core/Constants.hpp"
#include "tabexport/core/Exception.hpp"
#include "tabexport/utils/CommonUtils.hpp"
#include "tabexport/utils/ModuleLoggers.hpp"

namespace tabexport {
namespace render {

WorkbookRenderer::WorkbookRenderer(session::WorkbookSession& session)
    : session_(session)
    , resolver_(session) {
}

void WorkbookRenderer::beginDocument(const std::optional<std::string>& /*title*/, bool /*headings*/) {
    // 标题和列头开关以会话状态为准（追加加载成功后会被关闭）
    current_ = session::ResolvedTab{};
    current_sequence_ = 0;
}

void WorkbookRenderer::beginResultSet(const std::vector<core::ColumnDescriptor>& columns,
                                      const std::vector<size_t>& /*widths*/,
                                      const std::optional<std::string>& /*title*/) {
    core::Workbook& workbook = session_.workbook();
    integer_format_ = workbook.addFormat(core::StyleBuilder()
        .rightAlign()
        .numberFormat(core::Constants::kIntegerNumberFormat)
        .build());
    decimal_format_ = workbook.addFormat(core::StyleBuilder()
        .rightAlign()
        .numberFormat(core::Constants::kDecimalNumberFormat)
        .build());
    
    // 分页续写
    if (current_.sheet && current_sequence_ == session_.resultSetSequence()) {
        RENDER_DEBUG("Continuing result set {} on sheet '{}' at row {}",
                     current_sequence_, current_.sheet->getName(), next_row_);
        return;
    }
    
    current_ = resolver_.resolve(columns);
    current_sequence_ = session_.resultSetSequence();
    next_row_ = current_.sheet->getLastRowNum() + 1;
}

void WorkbookRenderer::writeValue(core::Worksheet& sheet, int row, int col,
                                  const std::string& value, core::ColumnType type) {
    if (value == core::Constants::kNullMarker) {
        return;
    }
    
    if (core::isNumeric(type)) {
        auto number = utils::CommonUtils::parseDouble(value);
        if (number) {
            const auto& format = type == core::ColumnType::IntegerLike ? integer_format_ : decimal_format_;
            sheet.writeNumber(row, col, *number, format);
            return;
        }
        RENDER_WARN("Value '{}' in numeric column {} of '{}' is not a number, writing as text",
                    value, col, sheet.getName());
    }
    
    if (!value.empty() && value.front() == '{') {
        core::StyledCellWriter writer(session_.workbook(), session_.styleCache());
        writer.write(sheet, row, col, value);
        return;
    }
    
    sheet.writeString(row, col, value);
}

void WorkbookRenderer::emitRow(const core::Row& row, const std::vector<core::ColumnDescriptor>& columns) {
    if (!current_.sheet) {
        TABEXPORT_THROW(core::OperationException, "Row emitted before a sheet was resolved", "emitRow",
                        core::ErrorCode::RenderError);
    }
    
    core::Worksheet& sheet = *current_.sheet;
    sheet.createRow(next_row_);
    for (size_t i = 0; i < row.size(); ++i) {
        core::ColumnType type = i < columns.size() ? columns[i].type : core::ColumnType::Other;
        writeValue(sheet, next_row_, static_cast<int>(i), row[i], type);
    }
    ++next_row_;
}

void WorkbookRenderer::endResultSet(const std::vector<size_t>& widths) {
    if (!current_.sheet) {
        return;
    }
    for (size_t i = 0; i < widths.size(); ++i) {
        current_.sheet->autoSizeColumn(static_cast<int>(i));
    }
}

}} // namespace tabexport::render
