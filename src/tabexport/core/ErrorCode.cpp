#include "tabexport/core/ErrorCode.hpp"

namespace tabexport {
namespace core {

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:
            return "Success";
        
        // 通用错误
        case ErrorCode::InvalidArgument:
            return "Invalid argument";
        case ErrorCode::InternalError:
            return "Internal error";
        
        // 文件操作错误
        case ErrorCode::FileNotFound:
            return "File not found";
        case ErrorCode::FileAccessDenied:
            return "File access denied";
        case ErrorCode::FileWriteError:
            return "File write error";
        case ErrorCode::FileReadError:
            return "File read error";
        
        // 工作簿格式错误
        case ErrorCode::InvalidWorkbook:
            return "Invalid workbook";
        case ErrorCode::InvalidWorksheet:
            return "Invalid worksheet";
        case ErrorCode::InvalidCellReference:
            return "Invalid cell reference";
        case ErrorCode::InvalidFormat:
            return "Invalid format";
        case ErrorCode::DuplicateSheetName:
            return "Duplicate sheet name";
        
        // XML处理错误
        case ErrorCode::XmlParseError:
            return "XML parse error";
        case ErrorCode::XmlInvalidFormat:
            return "Invalid XML format";
        
        // 结果集与渲染错误
        case ErrorCode::ResultOverflow:
            return "Result page overflow";
        case ErrorCode::ColumnCountMismatch:
            return "Column count mismatch";
        case ErrorCode::RenderError:
            return "Render error";
        
        // 数据库错误
        case ErrorCode::DatabaseOpenFailed:
            return "Database open failed";
        case ErrorCode::StatementFailed:
            return "Statement failed";
        case ErrorCode::DatabaseCloseFailed:
            return "Database close failed";
        
        default:
            return "Unknown error";
    }
}

}} // namespace tabexport::core
