#pragma once

namespace tabexport {
namespace xml {

// 2003 XML 表格格式中用到的命名空间与名称常量，读写两端共用
struct SpreadsheetML {
    inline static constexpr char NS_SPREADSHEET[] = "urn:schemas-microsoft-com:office:spreadsheet";
    inline static constexpr char NS_OFFICE[] = "urn:schemas-microsoft-com:office:office";
    inline static constexpr char NS_EXCEL[] = "urn:schemas-microsoft-com:office:excel";
    inline static constexpr char NS_HTML[] = "http://www.w3.org/TR/REC-html40";
    
    inline static constexpr char PI_TARGET[] = "mso-application";
    inline static constexpr char PI_DATA[] = "progid=\"Excel.Sheet\"";
    
    inline static constexpr char DEFAULT_STYLE_ID[] = "Default";
    inline static constexpr char STYLE_ID_PREFIX[] = "s";
    
    inline static constexpr char TYPE_NUMBER[] = "Number";
    inline static constexpr char TYPE_STRING[] = "String";
};

}} // namespace tabexport::xml
