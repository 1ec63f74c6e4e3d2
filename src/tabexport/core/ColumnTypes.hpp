#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace tabexport {
namespace core {

/**
 * @brief 列的粗粒度类型标记
 *
 * 只区分"按整数格式输出""按小数格式输出"和其他，
 * 具体的数据库类型在进入渲染层之前就已经被折叠掉。
 */
enum class ColumnType : uint8_t {
    Other = 0,
    IntegerLike,
    Fractional
};

inline bool isNumeric(ColumnType type) {
    return type == ColumnType::IntegerLike || type == ColumnType::Fractional;
}

/**
 * @brief 列描述
 */
struct ColumnDescriptor {
    std::string name;
    ColumnType type = ColumnType::Other;
    
    ColumnDescriptor() = default;
    ColumnDescriptor(std::string n, ColumnType t = ColumnType::Other)
        : name(std::move(n)), type(t) {}
    
    bool operator==(const ColumnDescriptor& other) const {
        return name == other.name && type == other.type;
    }
};

// 一行数据：与列按位置对齐的字符串值，空值使用 Constants::kNullMarker
using Row = std::vector<std::string>;

}} // namespace tabexport::core
