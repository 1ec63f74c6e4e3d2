#include "tabexport/session/ExportEngine.hpp"
#include "tabexport/render/RendererFactory.hpp"
#include "tabexport/utils/ModuleLoggers.hpp"

namespace tabexport {
namespace session {

ExportEngine::ExportEngine(const core::ExportOptions& options,
                           db::IStatementExecutor& executor,
                           std::ostream& out,
                           size_t page_capacity)
    : options_(options)
    , executor_(executor)
    , out_(out)
    , page_capacity_(page_capacity) {
    if (options_.format == core::OutputFormat::Xls) {
        session_ = std::make_unique<WorkbookSession>(options_);
    }
    renderer_ = render::RendererFactory::create(options_, out_, session_.get());
}

std::optional<std::string> ExportEngine::documentTitle() const {
    return session_ ? session_->title() : options_.title;
}

void ExportEngine::logWarnings(db::IResultSet& result_set) {
    for (const auto& warning : result_set.drainWarnings()) {
        SESSION_WARN("Warning: {}", warning);
    }
}

void ExportEngine::executeStatement(const std::string& sql) {
    SESSION_DEBUG("Executing: {}", sql);
    ++stats_.statements;
    
    if (session_) {
        session_->beginStatement();
    }
    bool headings = session_ ? session_->headingsEnabled() : options_.headings;
    
    auto results = executor_.execute(sql);
    renderer_->beginDocument(documentTitle(), headings);
    
    while (auto result = results->next()) {
        if (result->isResultSet()) {
            renderResultSet(*result->result_set);
        } else {
            ++stats_.update_counts;
            if (!options_.results_only) {
                out_ << "\nUpdated: " << result->update_count << "\n\n";
            }
        }
    }
    
    renderer_->endDocument();
    out_.flush();
    
    if (session_) {
        session_->endStatement();
    }
}

void ExportEngine::renderResultSet(db::IResultSet& result_set) {
    logWarnings(result_set);
    ++stats_.result_sets;
    if (session_) {
        session_->nextResultSet();
    }
    
    const auto& columns = result_set.columns();
    const auto title = documentTitle();
    
    core::Row row;
    bool has_row = result_set.nextRow(row);
    logWarnings(result_set);
    
    do {
        core::ResultMatrix page(columns, page_capacity_);
        while (has_row && !page.isFull()) {
            page.append(std::move(row));
            row = core::Row();
            has_row = result_set.nextRow(row);
            logWarnings(result_set);
        }
        renderPage(page, title);
    } while (has_row);
}

void ExportEngine::renderPage(const core::ResultMatrix& page, const std::optional<std::string>& title) {
    ++stats_.pages;
    stats_.rows += page.rowCount();
    
    renderer_->beginResultSet(page.columns(), page.widths(), title);
    for (const auto& row : page.rows()) {
        renderer_->emitRow(row, page.columns());
    }
    renderer_->endResultSet(page.widths());
}

}} // namespace tabexport::session
