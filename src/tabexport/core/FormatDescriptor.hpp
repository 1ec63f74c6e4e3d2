#pragma once

#include "tabexport/core/FormatTypes.hpp"
#include <string>
#include <cstddef>
#include <functional>

namespace tabexport {
namespace core {

/**
 * @brief 不可变的格式描述符
 * 
 * 所有字段在构造时确定，创建后不可修改；哈希值预先计算，
 * 便于 FormatRepository 去重。只能通过 StyleBuilder 创建。
 */
class FormatDescriptor {
private:
    // 字体属性
    const std::string font_name_;
    const double font_size_;
    const bool bold_;
    const bool italic_;
    const UnderlineType underline_;
    
    // 对齐属性
    const HorizontalAlign horizontal_align_;
    const VerticalAlign vertical_align_;
    
    // 数字格式，空串表示常规
    const std::string num_format_;
    
    const size_t hash_value_;
    
    FormatDescriptor(const std::string& font_name,
                     double font_size,
                     bool bold,
                     bool italic,
                     UnderlineType underline,
                     HorizontalAlign horizontal_align,
                     VerticalAlign vertical_align,
                     const std::string& num_format);
    
    size_t calculateHash() const;

public:
    friend class StyleBuilder;
    
    FormatDescriptor(const FormatDescriptor& other) = default;
    FormatDescriptor(FormatDescriptor&& other) = default;
    
    // 所有成员都是const，不支持赋值
    FormatDescriptor& operator=(const FormatDescriptor& other) = delete;
    FormatDescriptor& operator=(FormatDescriptor&& other) = delete;
    
    /**
     * @brief 默认格式：Arial 10，无修饰，常规数字格式
     */
    static const FormatDescriptor& getDefault();
    
    const std::string& getFontName() const { return font_name_; }
    double getFontSize() const { return font_size_; }
    bool isBold() const { return bold_; }
    bool isItalic() const { return italic_; }
    UnderlineType getUnderline() const { return underline_; }
    
    HorizontalAlign getHorizontalAlign() const { return horizontal_align_; }
    VerticalAlign getVerticalAlign() const { return vertical_align_; }
    
    const std::string& getNumberFormat() const { return num_format_; }
    
    bool hasFont() const;
    bool hasAlignment() const;
    bool hasAnyFormatting() const;
    
    bool operator==(const FormatDescriptor& other) const;
    bool operator!=(const FormatDescriptor& other) const { return !(*this == other); }
    
    size_t hash() const { return hash_value_; }
};

}} // namespace tabexport::core

namespace std {
template<>
struct hash<tabexport::core::FormatDescriptor> {
    size_t operator()(const tabexport::core::FormatDescriptor& desc) const {
        return desc.hash();
    }
};
} // namespace std
