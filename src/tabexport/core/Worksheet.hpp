#pragma once

#include "tabexport/core/Cell.hpp"
#include "tabexport/core/FormatRepository.hpp"
#include <string>
#include <map>
#include <vector>
#include <memory>
#include <optional>
#include <utility>

namespace tabexport {
namespace core {

/**
 * @brief 合并区域（闭区间，0开始）
 */
struct MergeRange {
    int first_row;
    int first_col;
    int last_row;
    int last_col;
    
    bool contains(int row, int col) const {
        return row >= first_row && row <= last_row && col >= first_col && col <= last_col;
    }
    
    bool operator==(const MergeRange& other) const {
        return first_row == other.first_row && first_col == other.first_col &&
               last_row == other.last_row && last_col == other.last_col;
    }
};

/**
 * @brief 工作表
 * 
 * 单元格按行稀疏存储；格式来自所属工作簿的 FormatRepository。
 * 列宽以磅为单位保存，与 2003 XML 中 ss:Width 一致。
 */
class Worksheet {
public:
    using RowMap = std::map<int, Cell>;
    using CellMap = std::map<int, RowMap>;

private:
    std::string name_;
    FormatRepository* format_repo_;
    CellMap cells_;
    std::vector<MergeRange> merges_;
    std::map<int, double> column_widths_;
    
    void validateCellPosition(int row, int col) const;

public:
    Worksheet(const std::string& name, FormatRepository* format_repo);
    
    Worksheet(const Worksheet&) = delete;
    Worksheet& operator=(const Worksheet&) = delete;
    
    const std::string& getName() const { return name_; }
    
    // ========== 单元格 ==========
    
    /**
     * @brief 写入文本
     * @param format 单元格格式，为空时使用默认格式
     * @throws OperationException 坐标超出工作表范围
     */
    void writeString(int row, int col, const std::string& value,
                     std::shared_ptr<const FormatDescriptor> format = nullptr);
    
    /**
     * @brief 写入数字
     */
    void writeNumber(int row, int col, double value,
                     std::shared_ptr<const FormatDescriptor> format = nullptr);
    
    /**
     * @brief 按格式写入：格式先登记到工作簿的格式仓储再引用
     */
    void setCellFormat(int row, int col, const FormatDescriptor& format);
    
    bool hasCellAt(int row, int col) const;
    
    /**
     * @brief 获取单元格，不存在时创建空单元格
     */
    Cell& getCell(int row, int col);
    
    /**
     * @brief 查找单元格
     * @return 不存在时返回 nullptr
     */
    const Cell* findCell(int row, int col) const;
    
    const CellMap& rows() const { return cells_; }
    
    /**
     * @brief 登记一行（可以没有单元格），使其计入 getLastRowNum()
     *
     * 全部为空值的结果行不产生单元格，但仍占用行号。
     */
    void createRow(int row);
    
    /**
     * @brief 最后一个已登记或有数据的行号；空表返回 0
     */
    int getLastRowNum() const;
    
    /**
     * @brief 已用范围 (最大行, 最大列)，空表返回 (-1, -1)
     */
    std::pair<int, int> getUsedRange() const;
    
    size_t getCellCount() const;
    
    // ========== 合并单元格 ==========
    
    /**
     * @brief 合并区域
     * @throws OperationException 区域无效
     */
    void mergeCells(int first_row, int first_col, int last_row, int last_col);
    
    const std::vector<MergeRange>& getMergeRanges() const { return merges_; }
    
    /**
     * @brief 该单元格所在的合并区域
     */
    const MergeRange* findMerge(int row, int col) const;
    
    // ========== 列宽 ==========
    
    void setColumnWidth(int col, double width_points);
    std::optional<double> getColumnWidth(int col) const;
    const std::map<int, double>& getColumnWidths() const { return column_widths_; }
    
    /**
     * @brief 按列内容自动调整列宽
     * 
     * 位于合并区域内的单元格不参与计算；列中没有可用单元格时列宽不变。
     */
    void autoSizeColumn(int col);
};

}} // namespace tabexport::core
