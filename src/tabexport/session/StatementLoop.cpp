#include "tabexport/session/StatementLoop.hpp"
#include "tabexport/core/Exception.hpp"
#include "tabexport/utils/CommonUtils.hpp"
#include "tabexport/utils/ModuleLoggers.hpp"

namespace tabexport {
namespace session {

StatementLoop::StatementLoop(ExportEngine& engine, std::istream& in, std::ostream& prompt_out,
                             const std::string& url, bool quiet)
    : engine_(engine)
    , in_(in)
    , prompt_out_(prompt_out)
    , prompt_(makePrompt(url))
    , show_prompt_(!quiet) {
}

std::string StatementLoop::makePrompt(const std::string& url) {
    std::string_view location(url);
    if (utils::CommonUtils::startsWith(location, "jdbc:")) {
        location.remove_prefix(5);
    }
    return std::string(location) + "> ";
}

bool StatementLoop::isExitCommand(const std::string& line) {
    return utils::CommonUtils::iequals(line, "quit") || utils::CommonUtils::iequals(line, "exit");
}

size_t StatementLoop::run() {
    std::string line;
    while (true) {
        if (show_prompt_) {
            prompt_out_ << prompt_ << std::flush;
        }
        if (!std::getline(in_, line)) {
            if (show_prompt_) {
                prompt_out_ << '\n';
            }
            break;
        }
        
        std::string statement = utils::CommonUtils::trim(line);
        if (statement.empty()) {
            continue;
        }
        if (isExitCommand(statement)) {
            break;
        }
        
        ++executed_;
        try {
            engine_.executeStatement(statement);
        } catch (const core::FileException&) {
            throw;
        } catch (const core::TabExportException& e) {
            ++failed_;
            SESSION_ERROR("Error: {}", e.what());
            SESSION_DEBUG("{}", e.getDetailedMessage());
        }
    }
    
    SESSION_DEBUG("Statement loop finished: {} executed, {} failed", executed_, failed_);
    return failed_;
}

}} // namespace tabexport::session
