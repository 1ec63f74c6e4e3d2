#pragma once

// tabexport - 查询结果导出引擎
// 文本 / CSV / HTML / 多工作表工作簿

#include <string>
#include "tabexport/utils/Logger.hpp"

// 版本信息
#define TABEXPORT_VERSION_MAJOR 1
#define TABEXPORT_VERSION_MINOR 0
#define TABEXPORT_VERSION_PATCH 0
#define TABEXPORT_VERSION_STRING "1.0.0"

namespace tabexport {

inline std::string getVersion() {
    return TABEXPORT_VERSION_STRING;
}

/**
 * @brief 初始化日志系统
 * @param log_file_path 日志文件路径，为空时只输出到控制台
 * @param level 日志级别
 * @param enable_console 是否启用控制台日志（写到 stderr）
 * @return 初始化是否成功
 */
bool initialize(const std::string& log_file_path = "",
                Logger::Level level = Logger::Level::INFO,
                bool enable_console = true);

/**
 * @brief 刷新并关闭日志
 */
void cleanup();

} // namespace tabexport
