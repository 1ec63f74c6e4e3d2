#pragma once
#include "Logger.hpp"

/**
 * @file ModuleLoggers.hpp
 * @brief 模块化日志宏定义
 *
 * 模块名只出现在日志文件和 DEBUG 控制台输出中，例如:
 * [2025-01-01 12:00:00] [DEBUG] [sess] [WorkbookSession.cpp:42:begin] ...
 */

#define TABEXPORT_MODULE_LOG(level, module, ...) \
    TABEXPORT_LOG_AT(tabexport::Logger::Level::level, module, __VA_ARGS__)

// 核心模块 (core)
#define CORE_DEBUG(...)    TABEXPORT_MODULE_LOG(DEBUG, "core", __VA_ARGS__)
#define CORE_INFO(...)     TABEXPORT_MODULE_LOG(INFO, "core", __VA_ARGS__)
#define CORE_WARN(...)     TABEXPORT_MODULE_LOG(WARN, "core", __VA_ARGS__)
#define CORE_ERROR(...)    TABEXPORT_MODULE_LOG(ERROR, "core", __VA_ARGS__)

// XML模块 (xml)
#define XML_DEBUG(...)     TABEXPORT_MODULE_LOG(DEBUG, "xml", __VA_ARGS__)
#define XML_INFO(...)      TABEXPORT_MODULE_LOG(INFO, "xml", __VA_ARGS__)
#define XML_WARN(...)      TABEXPORT_MODULE_LOG(WARN, "xml", __VA_ARGS__)
#define XML_ERROR(...)     TABEXPORT_MODULE_LOG(ERROR, "xml", __VA_ARGS__)

// 读取模块 (reader)
#define READER_DEBUG(...)  TABEXPORT_MODULE_LOG(DEBUG, "read", __VA_ARGS__)
#define READER_INFO(...)   TABEXPORT_MODULE_LOG(INFO, "read", __VA_ARGS__)
#define READER_WARN(...)   TABEXPORT_MODULE_LOG(WARN, "read", __VA_ARGS__)
#define READER_ERROR(...)  TABEXPORT_MODULE_LOG(ERROR, "read", __VA_ARGS__)

// 渲染模块 (render)
#define RENDER_DEBUG(...)  TABEXPORT_MODULE_LOG(DEBUG, "rndr", __VA_ARGS__)
#define RENDER_INFO(...)   TABEXPORT_MODULE_LOG(INFO, "rndr", __VA_ARGS__)
#define RENDER_WARN(...)   TABEXPORT_MODULE_LOG(WARN, "rndr", __VA_ARGS__)
#define RENDER_ERROR(...)  TABEXPORT_MODULE_LOG(ERROR, "rndr", __VA_ARGS__)

// 会话模块 (session)
#define SESSION_DEBUG(...) TABEXPORT_MODULE_LOG(DEBUG, "sess", __VA_ARGS__)
#define SESSION_INFO(...)  TABEXPORT_MODULE_LOG(INFO, "sess", __VA_ARGS__)
#define SESSION_WARN(...)  TABEXPORT_MODULE_LOG(WARN, "sess", __VA_ARGS__)
#define SESSION_ERROR(...) TABEXPORT_MODULE_LOG(ERROR, "sess", __VA_ARGS__)

// 数据库模块 (db)
#define DB_DEBUG(...)      TABEXPORT_MODULE_LOG(DEBUG, "db", __VA_ARGS__)
#define DB_INFO(...)       TABEXPORT_MODULE_LOG(INFO, "db", __VA_ARGS__)
#define DB_WARN(...)       TABEXPORT_MODULE_LOG(WARN, "db", __VA_ARGS__)
#define DB_ERROR(...)      TABEXPORT_MODULE_LOG(ERROR, "db", __VA_ARGS__)

// 工具模块 (utils)
#define UTILS_DEBUG(...)   TABEXPORT_MODULE_LOG(DEBUG, "util", __VA_ARGS__)
#define UTILS_WARN(...)    TABEXPORT_MODULE_LOG(WARN, "util", __VA_ARGS__)
#define UTILS_ERROR(...)   TABEXPORT_MODULE_LOG(ERROR, "util", __VA_ARGS__)
