#include "tabexport/TabExport.hpp"
#include <iostream>

namespace tabexport {

bool initialize(const std::string& log_file_path, Logger::Level level, bool enable_console) {
    try {
        Logger::getInstance().initialize(log_file_path, level, enable_console);
        TABEXPORT_LOG_DEBUG("tabexport {} initialized", getVersion());
        return true;
    } catch (const std::exception& e) {
        // 日志系统本身不可用时只能直接写 stderr
        std::cerr << "Failed to initialize tabexport logging: " << e.what() << std::endl;
        return false;
    }
}

void cleanup() {
    TABEXPORT_LOG_DEBUG("tabexport cleanup");
    Logger::getInstance().flush();
    Logger::getInstance().shutdown();
}

} // namespace tabexport
