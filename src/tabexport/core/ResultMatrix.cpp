#include "tabexport/core/ResultMatrix.hpp"
#include "tabexport/core/Exception.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace tabexport {
namespace core {

ResultMatrix::ResultMatrix(std::vector<ColumnDescriptor> columns, size_t capacity)
    : columns_(std::move(columns))
    , capacity_(capacity) {
    widths_.reserve(columns_.size());
    for (const auto& column : columns_) {
        widths_.push_back(column.name.size());
    }
}

void ResultMatrix::append(Row row) {
    if (isFull()) {
        TABEXPORT_THROW(ResultOverflowException, "Result page is full", capacity_);
    }
    if (row.size() != columns_.size()) {
        TABEXPORT_THROW(OperationException,
                        fmt::format("Row has {} cells but {} columns are defined", row.size(), columns_.size()),
                        "append", ErrorCode::ColumnCountMismatch);
    }
    
    for (size_t i = 0; i < row.size(); ++i) {
        widths_[i] = std::max(widths_[i], row[i].size());
    }
    rows_.push_back(std::move(row));
}

}} // namespace tabexport::core
