#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <fmt/format.h>

namespace tabexport {
namespace core {

/**
 * @brief tabexport统一错误码
 *
 * 按模块分组，便于从错误码快速定位出错环节
 */
enum class ErrorCode : uint8_t {
    // 成功
    Ok = 0,
    
    // 通用错误 (1-19)
    InvalidArgument = 1,
    InternalError = 3,
    
    // 文件操作错误 (20-39)
    FileNotFound = 20,
    FileAccessDenied = 21,
    FileWriteError = 23,
    FileReadError = 24,
    
    // 工作簿格式错误 (40-59)
    InvalidWorkbook = 40,
    InvalidWorksheet = 41,
    InvalidCellReference = 42,
    InvalidFormat = 43,
    DuplicateSheetName = 44,
    
    // XML处理错误 (60-79)
    XmlParseError = 61,
    XmlInvalidFormat = 62,
    
    // 结果集与渲染错误 (80-99)
    ResultOverflow = 80,
    ColumnCountMismatch = 81,
    RenderError = 82,
    
    // 数据库错误 (100-119)
    DatabaseOpenFailed = 100,
    StatementFailed = 101,
    DatabaseCloseFailed = 102
};

/**
 * @brief 可恢复错误的描述，配合 Expected 返回
 */
struct Error {
    ErrorCode code = ErrorCode::Ok;
    std::string message;
    std::string context;  // 出错的文件或语句

    Error() = default;
    Error(ErrorCode c, std::string msg, std::string ctx = "")
        : code(c), message(std::move(msg)), context(std::move(ctx)) {}

    std::string fullMessage() const {
        if (context.empty()) {
            return message;
        }
        return fmt::format("{} (Context: {})", message, context);
    }
};

/**
 * @brief 错误码转字符串
 */
const char* toString(ErrorCode code) noexcept;

inline Error makeError(ErrorCode code, const std::string& message, const std::string& context = "") {
    return Error(code, message, context);
}

}} // namespace tabexport::core
