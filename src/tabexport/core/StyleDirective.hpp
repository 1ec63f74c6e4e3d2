#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <cstddef>

namespace tabexport {
namespace core {

/**
 * @brief 行内样式指令 `{flags}text` 的解析结果
 *
 * 标志位（不区分大小写）：
 * - b 粗体, i 斜体, u 下划线, c 居中
 * - 1..4 标题级别（仅在合并模式之外有效）
 * - > 进入合并模式，其后的数字为向右合并的列数
 */
struct StyleDirective {
    static constexpr int kDefaultHeadingLevel = 5;

    bool has_directive = false;   // 输入是否以 '{' 开头
    bool bold = false;
    bool italic = false;
    bool underline = false;
    bool center = false;
    int heading_level = kDefaultHeadingLevel;
    std::optional<int> merge_span;
    std::string text;

    /**
     * @brief 样式缓存键：标题级别数字 + B/I/U
     * @note 居中和合并不参与缓存键
     */
    std::string styleKey() const;

    /**
     * @brief 字号 = 20 - 2 * 标题级别
     */
    double fontSize() const { return 20.0 - 2.0 * heading_level; }

    bool operator==(const StyleDirective& other) const;
};

/**
 * @brief 样式指令解析器
 *
 * 先把 `{...}` 内的字符切分为记号，再把记号折叠成 StyleDirective。
 * 缺少右花括号时文本为空。
 */
class StyleDirectiveParser {
public:
    enum class TokenKind {
        Bold,
        Italic,
        Underline,
        Center,
        HeadingDigit,
        MergeMarker,
        MergeDigit,
        Ignored
    };

    struct Token {
        TokenKind kind;
        char ch;
    };

    struct Tokenized {
        std::vector<Token> tokens;
        bool terminated = false;   // 是否遇到右花括号
        size_t text_offset = 0;    // 右花括号之后文本的起始位置
    };

    /**
     * @brief 切分指令体
     * @param value 以 '{' 开头的字符串
     */
    static Tokenized tokenize(std::string_view value);

    /**
     * @brief 解析任意字符串；不以 '{' 开头时整串作为文本
     */
    static StyleDirective parse(std::string_view value);

    /**
     * @brief 只取显示文本（用于纯文本类输出中的标题）
     */
    static std::string displayText(std::string_view value) {
        return parse(value).text;
    }
};

}} // namespace tabexport::core
