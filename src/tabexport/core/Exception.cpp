/**
 * @file Exception.cpp
 * @brief tabexport异常类实现
 */

#include "Exception.hpp"
#include <fmt/format.h>

namespace tabexport {
namespace core {

TabExportException::TabExportException(const std::string& message, 
                                       ErrorCode code,
                                       const char* file,
                                       int line)
    : std::runtime_error(message)
    , error_code_(code)
    , file_(file)
    , line_(line) {
}

std::string TabExportException::getDetailedMessage() const {
    if (file_ && line_ > 0) {
        return fmt::format("[{}] {} (at {}:{})", toString(error_code_), what(), file_, line_);
    }
    return fmt::format("[{}] {}", toString(error_code_), what());
}

// FileException 实现
FileException::FileException(const std::string& message, const std::string& filename,
                             ErrorCode code, const char* file, int line)
    : TabExportException(fmt::format("{} (file: {})", message, filename), code, file, line)
    , filename_(filename) {
}

// ParameterException 实现
ParameterException::ParameterException(const std::string& message,
                                       const std::string& parameter_name,
                                       const char* file, int line)
    : TabExportException(fmt::format("{} (parameter: {})", message, parameter_name), 
                         ErrorCode::InvalidArgument, file, line)
    , parameter_name_(parameter_name) {
}

// OperationException 实现
OperationException::OperationException(const std::string& message,
                                       const std::string& operation,
                                       ErrorCode code, const char* file, int line)
    : TabExportException(fmt::format("{} (operation: {})", message, operation), code, file, line)
    , operation_(operation) {
}

// WorksheetException 实现
WorksheetException::WorksheetException(const std::string& message,
                                       const std::string& worksheet_name,
                                       ErrorCode code, const char* file, int line)
    : TabExportException(fmt::format("{} (worksheet: {})", message, worksheet_name), code, file, line)
    , worksheet_name_(worksheet_name) {
}

// ResultOverflowException 实现
ResultOverflowException::ResultOverflowException(const std::string& message,
                                                 size_t capacity,
                                                 const char* file, int line)
    : TabExportException(fmt::format("{} (capacity: {})", message, capacity),
                         ErrorCode::ResultOverflow, file, line)
    , capacity_(capacity) {
}

// DatabaseException 实现
DatabaseException::DatabaseException(const std::string& message,
                                     const std::string& statement,
                                     ErrorCode code, const char* file, int line)
    : TabExportException(message, code, file, line)
    , statement_(statement) {
}

} // namespace core
} // namespace tabexport
