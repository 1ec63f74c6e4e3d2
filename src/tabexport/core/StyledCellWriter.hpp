#pragma once

#include "tabexport/core/Workbook.hpp"
#include "tabexport/core/StyleCache.hpp"
#include <string>

namespace tabexport {
namespace core {

/**
 * @brief 按样式指令写入单元格
 * 
 * 解析 `{flags}text`，从 StyleCache 取字体样式，按需叠加居中，
 * 写入文本并在 mergeSpan > 0 时向右合并。
 */
class StyledCellWriter {
private:
    Workbook& workbook_;
    StyleCache& cache_;

public:
    StyledCellWriter(Workbook& workbook, StyleCache& cache)
        : workbook_(workbook), cache_(cache) {}
    
    /**
     * @brief 写入一个带指令的单元格
     * @param sheet 目标工作表（必须属于 workbook）
     * @param value 原始值，可以不带指令
     * @return 解析出的指令
     */
    StyleDirective write(Worksheet& sheet, int row, int col, const std::string& value);
};

}} // namespace tabexport::core
