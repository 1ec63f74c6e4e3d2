#pragma once

#include "tabexport/session/WorkbookSession.hpp"
#include "tabexport/core/ColumnTypes.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tabexport {
namespace session {

/**
 * @brief 结果集对应的目标工作表
 */
struct ResolvedTab {
    std::shared_ptr<core::Worksheet> sheet;
    size_t index = 0;                    // 在配置列表中的位置（或序号-1）
    bool configured = false;             // index 落在配置的工作表范围内
    bool new_sheet = false;              // 本次新建
    bool wrote_framing = false;          // 写入了标题/列头
    std::optional<std::string> title;    // 该工作表适用的标题指令
};

/**
 * @brief 工作表解析
 * 
 * 按固定工作表名或结果集序号找到配置中的工作表：配置范围内的按名取用或新建
 * （并补齐前面缺失的工作表，保证顺序与配置一致），超出范围的新建自动命名的工作表。
 * 只有新建工作表且不处于单纯追加模式时才写标题行和列头行。
 */
class TabResolver {
private:
    WorkbookSession& session_;
    
    void writeTitle(core::Worksheet& sheet, const std::string& title);

public:
    explicit TabResolver(WorkbookSession& session) : session_(session) {}
    
    /**
     * @brief 计算目标位置：固定工作表在配置中时取其位置，否则为序号-1
     */
    size_t resolveIndex(int sequence) const;
    
    /**
     * @brief 为当前结果集解析（必要时创建）工作表，并按规则写入标题和列头
     * @param columns 结果集列，用于列头行
     */
    ResolvedTab resolve(const std::vector<core::ColumnDescriptor>& columns);
};

}} // namespace tabexport::session
