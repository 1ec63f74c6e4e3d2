#pragma once

#include "tabexport/core/StyleDirective.hpp"
#include "tabexport/core/FormatDescriptor.hpp"
#include <string>
#include <memory>
#include <unordered_map>

namespace tabexport {
namespace core {

/**
 * @brief 按样式键缓存字体样式
 * 
 * 键为 StyleDirective::styleKey()（标题级别 + B/I/U），值为只含字体属性的
 * 不可变格式。居中和合并不进缓存，由调用方按单元格叠加。
 * 生命周期与工作簿会话相同，不做淘汰。
 */
class StyleCache {
private:
    std::unordered_map<std::string, std::shared_ptr<const FormatDescriptor>> styles_;
    size_t hits_ = 0;

public:
    StyleCache() = default;
    
    StyleCache(const StyleCache&) = delete;
    StyleCache& operator=(const StyleCache&) = delete;
    
    /**
     * @brief 获取或创建指令对应的字体样式（幂等）
     */
    std::shared_ptr<const FormatDescriptor> getOrCreate(const StyleDirective& directive);
    
    bool contains(const std::string& key) const { return styles_.count(key) > 0; }
    size_t size() const { return styles_.size(); }
    size_t hits() const { return hits_; }
    
    void clear() {
        styles_.clear();
        hits_ = 0;
    }
};

}} // namespace tabexport::core
