#include "tabexport/core/Worksheet.hpp"
#include "tabexport/core/Exception.hpp"
#include "tabexport/utils/CommonUtils.hpp"
#include "tabexport/utils/ColumnWidthCalculator.hpp"
#include "tabexport/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace tabexport {
namespace core {

Worksheet::Worksheet(const std::string& name, FormatRepository* format_repo)
    : name_(name), format_repo_(format_repo) {
}

void Worksheet::validateCellPosition(int row, int col) const {
    if (!utils::CommonUtils::isValidCellPosition(row, col)) {
        TABEXPORT_THROW(OperationException,
                        fmt::format("Invalid cell position ({}, {}) in sheet '{}'", row, col, name_),
                        "writeCell", ErrorCode::InvalidCellReference);
    }
}

void Worksheet::writeString(int row, int col, const std::string& value,
                            std::shared_ptr<const FormatDescriptor> format) {
    validateCellPosition(row, col);
    Cell& cell = cells_[row][col];
    cell = value;
    cell.setFormat(std::move(format));
}

void Worksheet::writeNumber(int row, int col, double value,
                            std::shared_ptr<const FormatDescriptor> format) {
    validateCellPosition(row, col);
    Cell& cell = cells_[row][col];
    cell = value;
    cell.setFormat(std::move(format));
}

void Worksheet::setCellFormat(int row, int col, const FormatDescriptor& format) {
    validateCellPosition(row, col);
    int id = format_repo_->addFormat(format);
    cells_[row][col].setFormat(format_repo_->getFormat(id));
}

bool Worksheet::hasCellAt(int row, int col) const {
    return findCell(row, col) != nullptr;
}

Cell& Worksheet::getCell(int row, int col) {
    validateCellPosition(row, col);
    return cells_[row][col];
}

const Cell* Worksheet::findCell(int row, int col) const {
    auto row_it = cells_.find(row);
    if (row_it == cells_.end()) {
        return nullptr;
    }
    auto cell_it = row_it->second.find(col);
    return cell_it == row_it->second.end() ? nullptr : &cell_it->second;
}

void Worksheet::createRow(int row) {
    validateCellPosition(row, 0);
    cells_[row];
}

int Worksheet::getLastRowNum() const {
    return cells_.empty() ? 0 : cells_.rbegin()->first;
}

std::pair<int, int> Worksheet::getUsedRange() const {
    int max_row = -1;
    int max_col = -1;
    for (const auto& [row, row_cells] : cells_) {
        if (row_cells.empty()) continue;
        max_row = std::max(max_row, row);
        max_col = std::max(max_col, row_cells.rbegin()->first);
    }
    return {max_row, max_col};
}

size_t Worksheet::getCellCount() const {
    size_t count = 0;
    for (const auto& entry : cells_) {
        count += entry.second.size();
    }
    return count;
}

void Worksheet::mergeCells(int first_row, int first_col, int last_row, int last_col) {
    validateCellPosition(first_row, first_col);
    validateCellPosition(last_row, last_col);
    if (first_row > last_row || first_col > last_col) {
        TABEXPORT_THROW(OperationException,
                        fmt::format("Invalid merge range {}:{}",
                                    utils::CommonUtils::cellReference(first_row, first_col),
                                    utils::CommonUtils::cellReference(last_row, last_col)),
                        "mergeCells", ErrorCode::InvalidCellReference);
    }
    merges_.push_back({first_row, first_col, last_row, last_col});
}

const MergeRange* Worksheet::findMerge(int row, int col) const {
    for (const auto& merge : merges_) {
        if (merge.contains(row, col)) {
            return &merge;
        }
    }
    return nullptr;
}

void Worksheet::setColumnWidth(int col, double width_points) {
    column_widths_[col] = width_points;
}

std::optional<double> Worksheet::getColumnWidth(int col) const {
    auto it = column_widths_.find(col);
    if (it == column_widths_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void Worksheet::autoSizeColumn(int col) {
    double width = 0.0;
    bool found = false;
    
    for (const auto& [row, row_cells] : cells_) {
        auto it = row_cells.find(col);
        if (it == row_cells.end() || it->second.isEmpty()) {
            continue;
        }
        if (findMerge(row, col)) {
            continue;
        }
        const Cell& cell = it->second;
        auto calculator = utils::ColumnWidthCalculator::forFontSize(cell.effectiveFormat().getFontSize());
        width = std::max(width, calculator.charsToPoints(cell.getDisplayText().size()));
        found = true;
    }
    
    if (found) {
        column_widths_[col] = width;
        CORE_DEBUG("Auto-sized column {} of '{}' to {:.2f}pt", col, name_, width);
    }
}

}} // namespace tabexport::core
