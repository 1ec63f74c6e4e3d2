#include "tabexport/session/WorkbookSession.hpp"
#include "tabexport/core/Exception.hpp"
#include "tabexport/utils/ModuleLoggers.hpp"

namespace tabexport {
namespace session {

WorkbookSession::WorkbookSession(const core::ExportOptions& options)
    : options_(options),
      headings_(options.headings),
      title_(options.title) {
}

void WorkbookSession::startFreshWorkbook() {
    workbook_ = std::make_unique<core::Workbook>();
    style_cache_.clear();
}

void WorkbookSession::beginStatement() {
    if (!options_.append) {
        startFreshWorkbook();
        effective_append_ = false;
    } else if (!loaded_) {
        const std::string path = options_.output_file.value_or("");
        auto result = core::Workbook::load(path);
        if (result) {
            workbook_ = std::move(result).value();
            style_cache_.clear();
            loaded_ = true;
            effective_append_ = true;
            // 已有文件里已经有标题和列头
            headings_ = false;
            title_.reset();
            SESSION_INFO("Appending to existing workbook {} ({} sheet(s))", path, workbook_->getSheetCount());
        } else {
            SESSION_INFO("Cannot load '{}' for append ({}), creating a new workbook",
                         path, result.error().fullMessage());
            startFreshWorkbook();
            effective_append_ = false;
        }
    } else {
        effective_append_ = true;
    }
    
    if (!options_.increment_tab) {
        result_set_seq_ = 0;
    }
}

void WorkbookSession::endStatement() {
    if (!workbook_) {
        return;
    }
    if (!options_.output_file) {
        TABEXPORT_THROW(core::ParameterException, "Workbook output requires an output file", "output_file");
    }
    workbook_->save(*options_.output_file);
}

core::Workbook& WorkbookSession::workbook() {
    if (!workbook_) {
        TABEXPORT_THROW(core::OperationException, "No workbook: beginStatement() was not called",
                        "workbook", core::ErrorCode::InternalError);
    }
    return *workbook_;
}

}} // namespace tabexport::session
