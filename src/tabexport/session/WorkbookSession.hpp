#pragma once

#include "tabexport/core/ExportOptions.hpp"
#include "tabexport/core/Workbook.hpp"
#include "tabexport/core/StyleCache.hpp"
#include <memory>
#include <optional>
#include <string>

namespace tabexport {
namespace session {

/**
 * @brief 工作簿会话
 * 
 * 持有整个运行期间的工作簿、样式缓存和结果集序号，负责追加模式下
 * 的文件加载与回退，以及每条语句结束时的保存。
 * 
 * 每条语句的调用顺序：beginStatement() -> nextResultSet() ... -> endStatement()
 */
class WorkbookSession {
private:
    const core::ExportOptions& options_;
    std::unique_ptr<core::Workbook> workbook_;
    core::StyleCache style_cache_;
    
    bool headings_;
    std::optional<std::string> title_;
    
    bool loaded_ = false;            // 已从文件加载过
    bool effective_append_ = false;  // 本条语句是否按追加模式处理
    int result_set_seq_ = 0;

    void startFreshWorkbook();

public:
    explicit WorkbookSession(const core::ExportOptions& options);
    
    WorkbookSession(const WorkbookSession&) = delete;
    WorkbookSession& operator=(const WorkbookSession&) = delete;
    
    /**
     * @brief 语句开始
     * 
     * 非追加模式下新建工作簿；追加模式下首次尝试加载输出文件，
     * 加载失败时本条语句按新建处理，下一条语句再次尝试。
     * 未开启序号累加时把结果集序号清零。
     */
    void beginStatement();
    
    /**
     * @brief 进入下一个结果集
     * @return 新的结果集序号（1开始）
     */
    int nextResultSet() { return ++result_set_seq_; }
    
    /**
     * @brief 语句结束：把工作簿完整写回输出文件
     * @throws FileException 写入失败
     * @throws ParameterException 未配置输出文件
     */
    void endStatement();
    
    int resultSetSequence() const { return result_set_seq_; }
    bool effectiveAppend() const { return effective_append_; }
    bool isLoadedFromFile() const { return loaded_; }
    
    /**
     * @brief 当前是否输出列头（加载已有文件后强制关闭）
     */
    bool headingsEnabled() const { return headings_; }
    
    /**
     * @brief 当前全局标题（加载已有文件后清空）
     */
    const std::optional<std::string>& title() const { return title_; }
    
    bool hasWorkbook() const { return workbook_ != nullptr; }
    
    /**
     * @throws OperationException 尚未调用 beginStatement()
     */
    core::Workbook& workbook();
    
    core::StyleCache& styleCache() { return style_cache_; }
    const core::ExportOptions& options() const { return options_; }
};

}} // namespace tabexport::session
