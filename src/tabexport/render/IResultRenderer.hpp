#pragma once

#include "tabexport/core/ColumnTypes.hpp"
#include <optional>
#include <string>
#include <vector>

namespace tabexport {
namespace render {

/**
 * @brief 结果渲染接口 - 策略模式
 * 
 * 每种输出格式实现一次，由 RendererFactory 在启动时按配置选出。
 * 调用顺序：beginDocument，然后每页 beginResultSet / emitRow* / endResultSet，
 * 最后 endDocument。
 */
class IResultRenderer {
public:
    virtual ~IResultRenderer() = default;
    
    /**
     * @brief 文档开始（每条语句一次）
     * @param title 全局标题指令
     * @param headings 是否输出列头
     */
    virtual void beginDocument(const std::optional<std::string>& title, bool headings) = 0;
    
    /**
     * @brief 结果集（一页）开始
     * @param columns 列描述
     * @param widths 本页列宽
     * @param title 全局标题指令
     */
    virtual void beginResultSet(const std::vector<core::ColumnDescriptor>& columns,
                                const std::vector<size_t>& widths,
                                const std::optional<std::string>& title) = 0;
    
    /**
     * @brief 输出一行
     */
    virtual void emitRow(const core::Row& row, const std::vector<core::ColumnDescriptor>& columns) = 0;
    
    virtual void endResultSet(const std::vector<size_t>& widths) = 0;
    
    virtual void endDocument() = 0;
    
    /**
     * @brief 渲染器名称（用于日志）
     */
    virtual const char* getTypeName() const = 0;
};

}} // namespace tabexport::render
