#pragma once

#include "tabexport/core/FormatDescriptor.hpp"
#include <memory>
#include <unordered_map>
#include <vector>
#include <cstddef>

namespace tabexport {
namespace core {

/**
 * @brief 格式仓储 - 工作簿内的格式去重存储
 * 
 * 相同的格式只保存一份并分配稳定的ID，保存工作簿时
 * 按ID顺序写出 Styles 区（ID 0 对应 "Default"，其余为 "sN"）。
 * 导出流程是单线程的，这里不加锁。
 */
class FormatRepository {
private:
    std::vector<std::shared_ptr<const FormatDescriptor>> formats_;
    
    // 哈希到ID的映射，用于快速查找
    std::unordered_map<size_t, int> hash_to_id_;
    
    // 统计信息
    size_t total_requests_ = 0;
    size_t cache_hits_ = 0;
    
    static constexpr int DEFAULT_FORMAT_ID = 0;

public:
    FormatRepository();
    
    FormatRepository(const FormatRepository&) = delete;
    FormatRepository& operator=(const FormatRepository&) = delete;
    FormatRepository(FormatRepository&&) = default;
    FormatRepository& operator=(FormatRepository&&) = default;
    
    /**
     * @brief 添加格式到仓储（幂等操作）
     * @param format 格式描述符
     * @return 格式ID，如果已存在则返回现有ID
     */
    int addFormat(const FormatDescriptor& format);
    
    /**
     * @brief 根据ID获取格式
     * @return 格式描述符的共享指针，ID无效时返回默认格式
     */
    std::shared_ptr<const FormatDescriptor> getFormat(int id) const;
    
    /**
     * @brief 查找格式ID
     * @return 未收录时返回 -1
     */
    int findFormatId(const FormatDescriptor& format) const;
    
    size_t getFormatCount() const { return formats_.size(); }
    
    bool isValidFormatId(int id) const {
        return id >= 0 && static_cast<size_t>(id) < formats_.size();
    }
    
    /**
     * @brief 清空仓储（保留默认格式）
     */
    void clear();
    
    /**
     * @brief 缓存命中率（0.0-1.0）
     */
    double getCacheHitRate() const;
    
    // 按ID顺序遍历
    auto begin() const { return formats_.begin(); }
    auto end() const { return formats_.end(); }
};

}} // namespace tabexport::core
