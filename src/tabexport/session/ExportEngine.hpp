#pragma once

#include "tabexport/core/ExportOptions.hpp"
#include "tabexport/core/Constants.hpp"
#include "tabexport/core/ResultMatrix.hpp"
#include "tabexport/db/ResultSet.hpp"
#include "tabexport/render/IResultRenderer.hpp"
#include "tabexport/session/WorkbookSession.hpp"
#include <memory>
#include <ostream>
#include <string>

namespace tabexport {
namespace session {

/**
 * @brief 导出引擎：执行一条语句并把它的全部结果交给渲染器
 * 
 * 结果集按页（默认 kMaxPageRows 行）缓存，每页单独计算列宽并重新输出表头。
 * 只有确实还有下一行时才开始新的一页；空结果集也输出一次表头。
 * 工作簿输出时，每条语句前后分别调用 WorkbookSession 的 beginStatement/endStatement。
 */
class ExportEngine {
public:
    struct Stats {
        size_t statements = 0;
        size_t result_sets = 0;
        size_t pages = 0;
        size_t rows = 0;
        size_t update_counts = 0;
    };

private:
    const core::ExportOptions& options_;
    db::IStatementExecutor& executor_;
    std::ostream& out_;
    size_t page_capacity_;
    std::unique_ptr<WorkbookSession> session_;
    std::unique_ptr<render::IResultRenderer> renderer_;
    Stats stats_;
    
    void renderResultSet(db::IResultSet& result_set);
    void renderPage(const core::ResultMatrix& page, const std::optional<std::string>& title);
    void logWarnings(db::IResultSet& result_set);
    std::optional<std::string> documentTitle() const;

public:
    ExportEngine(const core::ExportOptions& options,
                 db::IStatementExecutor& executor,
                 std::ostream& out,
                 size_t page_capacity = core::Constants::kMaxPageRows);
    
    ExportEngine(const ExportEngine&) = delete;
    ExportEngine& operator=(const ExportEngine&) = delete;
    
    /**
     * @brief 执行并渲染一条语句
     * @throws DatabaseException 语句执行失败
     * @throws FileException 工作簿保存失败
     */
    void executeStatement(const std::string& sql);
    
    /**
     * @brief 工作簿会话，非工作簿输出时为 nullptr
     */
    WorkbookSession* session() { return session_.get(); }
    
    const Stats& getStats() const { return stats_; }
};

}} // namespace tabexport::session
