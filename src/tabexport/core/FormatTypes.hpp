#pragma once

#include <cstdint>

namespace tabexport {
namespace core {

/**
 * @file FormatTypes.hpp
 * @brief 单元格格式用到的枚举类型
 */

/**
 * @brief 下划线类型
 */
enum class UnderlineType : uint8_t {
    None = 0,
    Single = 1,
    Double = 2
};

/**
 * @brief 水平对齐方式
 */
enum class HorizontalAlign : uint8_t {
    None = 0,
    Left = 1,
    Center = 2,
    Right = 3
};

/**
 * @brief 垂直对齐方式
 */
enum class VerticalAlign : uint8_t {
    Top = 0,
    Center = 1,
    Bottom = 2
};

// 2003 XML 工作簿中的属性值，None 返回空串
const char* toString(UnderlineType underline);
const char* toString(HorizontalAlign align);
const char* toString(VerticalAlign align);

UnderlineType parseUnderline(const char* value);
HorizontalAlign parseHorizontalAlign(const char* value);
VerticalAlign parseVerticalAlign(const char* value);

}} // namespace tabexport::core
