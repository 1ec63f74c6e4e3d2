#pragma once

#include <cstddef>

namespace tabexport {
namespace core {

// 通用常量集中定义，便于统一调整与复用
struct Constants {
    // I/O 缓冲区大小
    static constexpr size_t kIOBufferSize = 8192;
    
    // 每页缓存的最大行数，超过后分页输出
    static constexpr size_t kMaxPageRows = 50000;
    
    // 空值占位文本
    static constexpr const char* kNullMarker = "<NULL>";
    
    // 未显式指定样式时套用的标题指令
    static constexpr const char* kDefaultTitleDirective = "{BUC3>6}";
    
    // 工作簿数字格式
    static constexpr const char* kIntegerNumberFormat = "###########0";
    static constexpr const char* kDecimalNumberFormat = "###,###,###,##0.00";
};

} // namespace core
} // namespace tabexport
