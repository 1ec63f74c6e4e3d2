#include "Logger.hpp"
#include <filesystem>
#include <iostream>
#include <chrono>
#include <cstring>
#include <algorithm>
#include <fmt/chrono.h>
#include <unistd.h>

namespace tabexport {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_file_path,
                        Level level,
                        bool enable_console,
                        size_t max_file_size,
                        size_t max_files) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_.load() || shutting_down_.load()) {
        return;
    }

    level_.store(level);
    console_ = enable_console;
    console_color_ = enable_console && ::isatty(STDERR_FILENO) != 0;
    file_path_ = log_file_path;
    max_file_size_ = max_file_size;
    max_files_ = std::max<size_t>(max_files, 1);

    if (!file_path_.empty()) {
        std::error_code ec;
        std::filesystem::path dir = std::filesystem::path(file_path_).parent_path();
        if (!dir.empty()) {
            std::filesystem::create_directories(dir, ec);
        }
        file_.open(file_path_, std::ios::out | std::ios::app);
        if (file_.is_open()) {
            file_.seekp(0, std::ios::end);
            file_size_ = static_cast<size_t>(file_.tellp());
        } else {
            std::cerr << "Logger could not open log file: " << file_path_ << std::endl;
        }
    }

    initialized_.store(true);
}

void Logger::setLevel(Level level) {
    level_.store(level);
}

Logger::Level Logger::getLevel() const {
    return level_.load();
}

bool Logger::isEnabled(Level level) const {
    return level != Level::OFF &&
           static_cast<int>(level) >= static_cast<int>(level_.load()) &&
           !shutting_down_.load();
}

void Logger::write(Level level, const Origin& origin, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutting_down_.load()) return;

    std::string decorated = decorate(level, origin, message);
    if (console_) {
        writeConsole(level, level >= Level::INFO ? message : decorated);
    }
    writeFile(decorated);

    if (level >= Level::WARN && file_.is_open()) {
        file_.flush();
    }
}

void Logger::writeConsole(Level level, const std::string& line) {
    if (!console_color_) {
        std::cerr << line << '\n';
        return;
    }
    const char* color = "\033[0m";
    switch (level) {
        case Level::TRACE:    color = "\033[37m"; break;
        case Level::DEBUG:    color = "\033[36m"; break;
        case Level::WARN:     color = "\033[33m"; break;
        case Level::ERROR:    color = "\033[31m"; break;
        case Level::CRITICAL: color = "\033[35m"; break;
        default: break;
    }
    std::cerr << color << line << "\033[0m" << '\n';
}

void Logger::writeFile(const std::string& line) {
    if (!file_.is_open()) {
        return;
    }
    rotateIfNeeded();
    file_ << line << '\n';
    file_size_ += line.size() + 1;
}

void Logger::rotateIfNeeded() {
    if (file_size_ < max_file_size_) {
        return;
    }
    file_.close();

    // path.N-1 -> path.N, ..., path -> path.1
    std::error_code ec;
    for (size_t i = max_files_; i > 1; --i) {
        std::filesystem::rename(rotatedName(i - 1), rotatedName(i), ec);
    }
    std::filesystem::rename(file_path_, rotatedName(1), ec);

    file_.open(file_path_, std::ios::out | std::ios::trunc);
    file_size_ = 0;
}

std::string Logger::rotatedName(size_t index) const {
    return fmt::format("{}.{}", file_path_, index);
}

std::string Logger::decorate(Level level, const Origin& origin, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    std::string module = (origin.module && *origin.module) ? fmt::format("[{}] ", origin.module) : "";
    return fmt::format("[{:%Y-%m-%d %H:%M:%S}] [{}] {}[{}:{}:{}] {}",
                       now, levelName(level), module,
                       baseFilename(origin.file), origin.line, origin.func ? origin.func : "",
                       message);
}

const char* Logger::levelName(Level level) {
    switch (level) {
        case Level::TRACE:    return "TRACE";
        case Level::DEBUG:    return "DEBUG";
        case Level::INFO:     return "INFO ";
        case Level::WARN:     return "WARN ";
        case Level::ERROR:    return "ERROR";
        case Level::CRITICAL: return "CRIT ";
        default:              return "UNKN ";
    }
}

const char* Logger::baseFilename(const char* path) {
    if (!path) return "";
    const char* slash = std::strrchr(path, '/');
    const char* backslash = std::strrchr(path, '\\');
    const char* p = slash;
    if (backslash && (!p || backslash > p)) {
        p = backslash;
    }
    return p ? p + 1 : path;
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
    std::cerr.flush();
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    shutting_down_.store(true);
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
    initialized_.store(false);
}

Logger::~Logger() {
    shutdown();
}

} // namespace tabexport
