/**
 * @file Exception.hpp
 * @brief tabexport异常类定义
 */

#ifndef TABEXPORT_EXCEPTION_HPP
#define TABEXPORT_EXCEPTION_HPP

#include <stdexcept>
#include <string>
#include <cstddef>
#include "ErrorCode.hpp"

namespace tabexport {
namespace core {

/**
 * @brief tabexport基础异常类
 */
class TabExportException : public std::runtime_error {
public:
    /**
     * @param message 错误消息
     * @param code 错误代码
     * @param file 抛出位置的源文件（由 TABEXPORT_THROW 填充）
     * @param line 抛出位置的行号
     */
    TabExportException(const std::string& message,
                       ErrorCode code = ErrorCode::InternalError,
                       const char* file = nullptr,
                       int line = 0);

    ErrorCode getErrorCode() const noexcept { return error_code_; }

    /**
     * @brief 带错误码和抛出位置的完整描述，用于调试日志
     */
    std::string getDetailedMessage() const;

private:
    ErrorCode error_code_;
    const char* file_;
    int line_;
};

/**
 * @brief 文件相关异常
 */
class FileException : public TabExportException {
public:
    FileException(const std::string& message, const std::string& filename,
                  ErrorCode code = ErrorCode::FileNotFound,
                  const char* file = nullptr, int line = 0);
    
    const std::string& getFilename() const { return filename_; }

private:
    std::string filename_;
};

/**
 * @brief 参数相关异常
 */
class ParameterException : public TabExportException {
public:
    ParameterException(const std::string& message,
                       const std::string& parameter_name = "",
                       const char* file = nullptr, int line = 0);
    
    const std::string& getParameterName() const { return parameter_name_; }

private:
    std::string parameter_name_;
};

/**
 * @brief 操作相关异常
 */
class OperationException : public TabExportException {
public:
    OperationException(const std::string& message,
                       const std::string& operation = "",
                       ErrorCode code = ErrorCode::InvalidArgument,
                       const char* file = nullptr, int line = 0);
    
    const std::string& getOperation() const { return operation_; }

private:
    std::string operation_;
};

/**
 * @brief 工作表相关异常
 */
class WorksheetException : public TabExportException {
public:
    WorksheetException(const std::string& message,
                       const std::string& worksheet_name = "",
                       ErrorCode code = ErrorCode::InvalidWorksheet,
                       const char* file = nullptr, int line = 0);
    
    const std::string& getWorksheetName() const { return worksheet_name_; }

private:
    std::string worksheet_name_;
};

/**
 * @brief 结果页溢出：当前页已缓存满上限行数
 */
class ResultOverflowException : public TabExportException {
public:
    ResultOverflowException(const std::string& message,
                            size_t capacity,
                            const char* file = nullptr, int line = 0);
    
    size_t getCapacity() const { return capacity_; }

private:
    size_t capacity_;
};

/**
 * @brief 数据库语句执行异常
 */
class DatabaseException : public TabExportException {
public:
    DatabaseException(const std::string& message,
                      const std::string& statement = "",
                      ErrorCode code = ErrorCode::StatementFailed,
                      const char* file = nullptr, int line = 0);
    
    const std::string& getStatement() const { return statement_; }

private:
    std::string statement_;
};

} // namespace core
} // namespace tabexport

// 便捷宏定义：message 之后的参数按异常类型的构造顺序传入，位置信息自动追加
#define TABEXPORT_THROW(ExceptionType, message, ...) \
    throw ExceptionType(message, ##__VA_ARGS__, __FILE__, __LINE__)

#define TABEXPORT_THROW_IF(condition, ExceptionType, message, ...) \
    do { if (condition) { TABEXPORT_THROW(ExceptionType, message, ##__VA_ARGS__); } } while(0)

#endif // TABEXPORT_EXCEPTION_HPP
