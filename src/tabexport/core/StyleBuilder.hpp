#pragma once

#include "tabexport/core/FormatDescriptor.hpp"
#include <string>

namespace tabexport {
namespace core {

/**
 * @brief 样式构建器 - 流式API创建格式
 * 
 * 链式设置各项属性，最后 build() 得到不可变的 FormatDescriptor。
 */
class StyleBuilder {
private:
    std::string font_name_ = "Arial";
    double font_size_ = 10.0;
    bool bold_ = false;
    bool italic_ = false;
    UnderlineType underline_ = UnderlineType::None;
    
    HorizontalAlign horizontal_align_ = HorizontalAlign::None;
    VerticalAlign vertical_align_ = VerticalAlign::Bottom;
    
    std::string num_format_;

public:
    StyleBuilder() = default;
    
    // 以现有格式为起点
    explicit StyleBuilder(const FormatDescriptor& format);
    
    // ========== 字体 ==========
    
    StyleBuilder& fontName(const std::string& name) {
        font_name_ = name;
        return *this;
    }
    
    /**
     * @brief 设置字体大小
     * @param size 字号（磅），超出 1-409 时截断
     */
    StyleBuilder& fontSize(double size);
    
    StyleBuilder& bold(bool b = true) {
        bold_ = b;
        return *this;
    }
    
    StyleBuilder& italic(bool i = true) {
        italic_ = i;
        return *this;
    }
    
    StyleBuilder& underline(UnderlineType type = UnderlineType::Single) {
        underline_ = type;
        return *this;
    }
    
    // ========== 对齐 ==========
    
    StyleBuilder& horizontalAlign(HorizontalAlign align) {
        horizontal_align_ = align;
        return *this;
    }
    
    StyleBuilder& verticalAlign(VerticalAlign align) {
        vertical_align_ = align;
        return *this;
    }
    
    StyleBuilder& centerAlign() { return horizontalAlign(HorizontalAlign::Center); }
    StyleBuilder& rightAlign() { return horizontalAlign(HorizontalAlign::Right); }
    
    // ========== 数字格式 ==========
    
    StyleBuilder& numberFormat(const std::string& format) {
        num_format_ = format;
        return *this;
    }
    
    FormatDescriptor build() const;
};

}} // namespace tabexport::core
