#pragma once

#include "tabexport/core/ColumnTypes.hpp"
#include "tabexport/core/Constants.hpp"
#include <vector>
#include <cstddef>

namespace tabexport {
namespace core {

/**
 * @brief 单页结果缓存
 *
 * 缓存一页（最多 kMaxPageRows 行）的数据并维护每列的显示宽度。
 * 宽度只针对当前页计算，翻页时由调用方新建一个 ResultMatrix。
 */
class ResultMatrix {
public:
    /**
     * @brief 构造函数
     * @param columns 列描述
     * @param capacity 页容量
     */
    explicit ResultMatrix(std::vector<ColumnDescriptor> columns,
                          size_t capacity = Constants::kMaxPageRows);
    
    /**
     * @brief 追加一行
     * @param row 行数据，单元格数必须等于列数
     * @throws ResultOverflowException 当前页已满
     * @throws OperationException 单元格数与列数不一致
     */
    void append(Row row);
    
    bool isFull() const { return rows_.size() >= capacity_; }
    bool empty() const { return rows_.empty(); }
    size_t rowCount() const { return rows_.size(); }
    size_t columnCount() const { return columns_.size(); }
    size_t capacity() const { return capacity_; }
    
    const std::vector<ColumnDescriptor>& columns() const { return columns_; }
    const std::vector<Row>& rows() const { return rows_; }
    
    /**
     * @brief 每列显示宽度：列名长度与本页所有值长度的最大值
     */
    const std::vector<size_t>& widths() const { return widths_; }

private:
    std::vector<ColumnDescriptor> columns_;
    std::vector<Row> rows_;
    std::vector<size_t> widths_;
    size_t capacity_;
};

}} // namespace tabexport::core
