#pragma once

#include "tabexport/core/FormatDescriptor.hpp"
#include <string>
#include <memory>
#include <variant>
#include <cstdint>

namespace tabexport {
namespace core {

enum class CellType : uint8_t {
    Empty = 0,
    Number,
    String
};

/**
 * @brief 工作表单元格
 * 
 * 值只有数字和文本两种；格式以共享指针引用工作簿
 * FormatRepository 中的不可变格式，未设置时使用默认格式。
 */
class Cell {
private:
    std::variant<std::monostate, double, std::string> value_;
    std::shared_ptr<const FormatDescriptor> format_;

public:
    Cell() = default;
    explicit Cell(double value) : value_(value) {}
    explicit Cell(const std::string& value) : value_(value) {}
    explicit Cell(const char* value) : value_(std::string(value)) {}
    
    Cell& operator=(double value) {
        value_ = value;
        return *this;
    }
    
    Cell& operator=(const std::string& value) {
        value_ = value;
        return *this;
    }
    
    CellType getType() const {
        return static_cast<CellType>(value_.index());
    }
    
    bool isEmpty() const { return getType() == CellType::Empty; }
    bool isNumber() const { return getType() == CellType::Number; }
    bool isString() const { return getType() == CellType::String; }
    
    /**
     * @brief 数值，非数字单元格返回 0.0
     */
    double getNumberValue() const;
    
    /**
     * @brief 文本，非文本单元格返回空串
     */
    const std::string& getStringValue() const;
    
    /**
     * @brief 单元格的显示文本，用于列宽估算
     */
    std::string getDisplayText() const;
    
    void setFormat(std::shared_ptr<const FormatDescriptor> format) {
        format_ = std::move(format);
    }
    
    std::shared_ptr<const FormatDescriptor> getFormatDescriptor() const { return format_; }
    bool hasFormat() const { return format_ != nullptr; }
    
    /**
     * @brief 实际生效的格式（未设置时为默认格式）
     */
    const FormatDescriptor& effectiveFormat() const {
        return format_ ? *format_ : FormatDescriptor::getDefault();
    }
    
    void clear() {
        value_ = std::monostate{};
        format_.reset();
    }
};

}} // namespace tabexport::core
