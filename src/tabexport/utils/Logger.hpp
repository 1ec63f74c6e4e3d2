#pragma once

#include <string>
#include <fstream>
#include <mutex>
#include <atomic>
#include <fmt/format.h>

#ifdef ERROR
#undef ERROR
#endif

namespace tabexport {

/**
 * @brief 进程级日志器
 *
 * 控制台写 stderr，stdout 只留给导出数据。INFO 及以上在控制台只输出消息正文，
 * 命令行用户看到的就是 "Error: ..." 这样的提示；DEBUG/TRACE 和日志文件
 * 带时间戳、级别、模块和源码位置。日志文件超过上限时滚动为 .1 .. .N。
 */
class Logger {
public:
    enum class Level {
        TRACE = 0,
        DEBUG = 1,
        INFO = 2,
        WARN = 3,
        ERROR = 4,
        CRITICAL = 5,
        OFF = 6
    };

    /**
     * @brief 一条日志的来源（由宏填充）
     */
    struct Origin {
        const char* module;
        const char* file;
        int line;
        const char* func;
    };

    static Logger& getInstance();

    /**
     * @brief 初始化日志器，重复调用无效
     * @param log_file_path 日志文件路径，为空时不写文件
     * @param level 最低输出级别
     * @param enable_console 是否输出到 stderr
     * @param max_file_size 单个日志文件上限（字节）
     * @param max_files 保留的滚动文件数
     */
    void initialize(const std::string& log_file_path = "",
                    Level level = Level::INFO,
                    bool enable_console = true,
                    size_t max_file_size = 10 * 1024 * 1024,
                    size_t max_files = 5);

    void setLevel(Level level);
    Level getLevel() const;

    bool isEnabled(Level level) const;

    template<typename... Args>
    void log(Level level, const Origin& origin, const std::string& fmt_str, Args&&... args) {
        if (!isEnabled(level)) return;
        write(level, origin, safeFormat(fmt_str, args...));
    }

    void flush();
    void shutdown();

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void write(Level level, const Origin& origin, const std::string& message);
    void writeConsole(Level level, const std::string& line);
    void writeFile(const std::string& line);
    void rotateIfNeeded();
    std::string rotatedName(size_t index) const;

    static std::string decorate(Level level, const Origin& origin, const std::string& message);
    static const char* levelName(Level level);
    static const char* baseFilename(const char* path);

    // 格式串与参数不匹配时退回原始格式串，日志调用本身不抛异常
    template<typename... Args>
    static std::string safeFormat(const std::string& fmt_str, Args&... args) {
        if constexpr (sizeof...(Args) == 0) {
            return fmt_str;
        } else {
            try {
                return fmt::vformat(fmt_str, fmt::make_format_args(args...));
            } catch (const fmt::format_error&) {
                return fmt_str;
            }
        }
    }

    std::mutex mutex_;
    std::atomic<Level> level_{Level::INFO};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> shutting_down_{false};
    bool console_ = true;
    bool console_color_ = false;

    std::string file_path_;
    std::ofstream file_;
    size_t file_size_ = 0;
    size_t max_file_size_ = 10 * 1024 * 1024;
    size_t max_files_ = 5;
};

#define TABEXPORT_LOG_AT(level, module, fmt, ...) \
    tabexport::Logger::getInstance().log(level, \
        tabexport::Logger::Origin{module, __FILE__, __LINE__, __func__}, fmt, ##__VA_ARGS__)

// 不带模块名的通用日志宏
#define TABEXPORT_LOG_TRACE(fmt, ...)    TABEXPORT_LOG_AT(tabexport::Logger::Level::TRACE, "", fmt, ##__VA_ARGS__)
#define TABEXPORT_LOG_DEBUG(fmt, ...)    TABEXPORT_LOG_AT(tabexport::Logger::Level::DEBUG, "", fmt, ##__VA_ARGS__)
#define TABEXPORT_LOG_INFO(fmt, ...)     TABEXPORT_LOG_AT(tabexport::Logger::Level::INFO, "", fmt, ##__VA_ARGS__)
#define TABEXPORT_LOG_WARN(fmt, ...)     TABEXPORT_LOG_AT(tabexport::Logger::Level::WARN, "", fmt, ##__VA_ARGS__)
#define TABEXPORT_LOG_ERROR(fmt, ...)    TABEXPORT_LOG_AT(tabexport::Logger::Level::ERROR, "", fmt, ##__VA_ARGS__)
#define TABEXPORT_LOG_CRITICAL(fmt, ...) TABEXPORT_LOG_AT(tabexport::Logger::Level::CRITICAL, "", fmt, ##__VA_ARGS__)

} // namespace tabexport
