#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>

namespace tabexport {
namespace core {

/**
 * @file ExportOptions.hpp
 * @brief 导出配置
 *
 * 由命令行（或测试）一次性构造，之后以 const 引用传给渲染器和会话对象。
 */

/**
 * @brief 输出格式
 */
enum class OutputFormat {
    Text,
    Csv,
    Html,
    Xls
};

/**
 * @brief 预配置的工作表：名称 + 标题指令
 */
struct TabSpec {
    std::string name;
    std::string title;
    
    bool operator==(const TabSpec& other) const {
        return name == other.name && title == other.title;
    }
};

/**
 * @brief 导出选项
 */
struct ExportOptions {
    OutputFormat format = OutputFormat::Text;
    bool headings = true;                     // 是否输出列头（以及页首）
    std::optional<std::string> title;         // 全局标题（已规范化的指令串）
    std::optional<std::string> css_file;      // HTML 样式表路径，缺省使用内置样式
    std::optional<std::string> output_file;   // 输出文件，缺省写到标准输出（工作簿必填）
    bool append = false;                      // 追加到已有工作簿
    bool increment_tab = false;               // 结果集序号跨语句累加
    std::vector<TabSpec> tabs;                // 预配置的工作表
    std::optional<std::string> pinned_sheet;  // 固定写入的工作表名
    bool results_only = false;                // 不输出 "Updated: N"
    bool quiet = false;                       // 不显示提示符，控制台只输出警告以上日志
    
    std::vector<std::string> tabNames() const;
    std::vector<std::string> tabTitles() const;
};

/**
 * @brief 解析输出格式名（不区分大小写）
 * @return 无法识别时返回 std::nullopt
 */
std::optional<OutputFormat> parseOutputFormat(std::string_view name);

const char* toString(OutputFormat format) noexcept;

/**
 * @brief 标题不以 '{' 开头时补上默认标题指令
 */
std::string normalizeTitle(const std::string& raw);

/**
 * @brief 解析工作表配置串 "[name|title][name2]..."
 *
 * 格式不合法（或为空）时返回空列表，不报错。
 */
std::vector<TabSpec> parseTabSpec(const std::string& spec);

}} // namespace tabexport::core
