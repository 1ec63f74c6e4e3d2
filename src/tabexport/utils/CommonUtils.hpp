#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <cctype>

namespace tabexport {
namespace utils {

/**
 * @brief 通用工具类 - 提供常用的辅助函数
 */
class CommonUtils {
public:
    // ========== 单元格坐标 ==========
    
    /**
     * @brief 列号转换为字母表示（A, B, ..., Z, AA, AB, ...）
     * @param col 列号（0开始）
     */
    static std::string columnToLetter(int col) {
        std::string result;
        while (col >= 0) {
            result.insert(result.begin(), static_cast<char>('A' + (col % 26)));
            col = col / 26 - 1;
        }
        return result;
    }
    
    /**
     * @brief 生成单元格引用（如A1, B2等），用于日志和异常信息
     */
    static std::string cellReference(int row, int col) {
        return columnToLetter(col) + std::to_string(row + 1);
    }
    
    /**
     * @brief 验证单元格位置是否在 2003 版工作表范围内
     */
    static bool isValidCellPosition(int row, int col) {
        return row >= 0 && col >= 0 && row <= 65535 && col <= 255;
    }
    
    /**
     * @brief 验证工作表名称是否有效
     */
    static bool isValidSheetName(const std::string& name) {
        if (name.empty() || name.length() > 31) {
            return false;
        }
        const std::string invalid_chars = "[]*/\\?:";
        return name.find_first_of(invalid_chars) == std::string::npos;
    }
    
    // ========== 字符串工具 ==========
    
    static bool iequals(std::string_view a, std::string_view b) {
        if (a.size() != b.size()) {
            return false;
        }
        for (size_t i = 0; i < a.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(a[i])) !=
                std::tolower(static_cast<unsigned char>(b[i]))) {
                return false;
            }
        }
        return true;
    }
    
    static bool startsWith(std::string_view text, std::string_view prefix) {
        return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
    }
    
    static std::string trim(std::string_view text) {
        size_t start = text.find_first_not_of(" \t\r\n");
        if (start == std::string_view::npos) {
            return "";
        }
        size_t end = text.find_last_not_of(" \t\r\n");
        return std::string(text.substr(start, end - start + 1));
    }
    
    /**
     * @brief 按分隔字符集合切分，丢弃空片段
     * @param text 待切分文本
     * @param delimiters 任意一个字符都视为分隔符
     */
    static std::vector<std::string> splitAny(std::string_view text, std::string_view delimiters) {
        std::vector<std::string> parts;
        size_t pos = 0;
        while (pos < text.size()) {
            size_t start = text.find_first_not_of(delimiters, pos);
            if (start == std::string_view::npos) {
                break;
            }
            size_t end = text.find_first_of(delimiters, start);
            if (end == std::string_view::npos) {
                end = text.size();
            }
            parts.emplace_back(text.substr(start, end - start));
            pos = end;
        }
        return parts;
    }
    
    // ========== 数值工具 ==========
    
    /**
     * @brief 严格解析浮点数，整串必须是合法数字（允许首尾空白）
     */
    static std::optional<double> parseDouble(std::string_view text);
    
    /**
     * @brief 按工作簿数字格式生成显示文本（用于估算列宽）
     * @param value 数值
     * @param number_format 格式串，仅区分是否带千分位和小数位
     */
    static std::string formatNumber(double value, const std::string& number_format);
};

}} // namespace tabexport::utils
