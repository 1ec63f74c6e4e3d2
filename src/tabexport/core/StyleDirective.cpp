#include "tabexport/core/StyleDirective.hpp"
#include <cctype>

namespace tabexport {
namespace core {

std::string StyleDirective::styleKey() const {
    std::string key;
    if (heading_level > 0) {
        key += static_cast<char>('0' + heading_level);
    }
    if (bold) key += 'B';
    if (italic) key += 'I';
    if (underline) key += 'U';
    return key;
}

bool StyleDirective::operator==(const StyleDirective& other) const {
    return has_directive == other.has_directive &&
           bold == other.bold &&
           italic == other.italic &&
           underline == other.underline &&
           center == other.center &&
           heading_level == other.heading_level &&
           merge_span == other.merge_span &&
           text == other.text;
}

StyleDirectiveParser::Tokenized StyleDirectiveParser::tokenize(std::string_view value) {
    Tokenized result;
    if (value.empty() || value.front() != '{') {
        return result;
    }

    bool merge_mode = false;
    size_t index = 1;
    for (; index < value.size(); ++index) {
        char c = value[index];
        if (c == '}') {
            result.terminated = true;
            break;
        }

        switch (std::tolower(static_cast<unsigned char>(c))) {
            case 'u':
                result.tokens.push_back({TokenKind::Underline, c});
                break;
            case 'b':
                result.tokens.push_back({TokenKind::Bold, c});
                break;
            case 'i':
                result.tokens.push_back({TokenKind::Italic, c});
                break;
            case 'c':
                result.tokens.push_back({TokenKind::Center, c});
                break;
            case '>':
                merge_mode = true;
                result.tokens.push_back({TokenKind::MergeMarker, c});
                break;
            default:
                if (merge_mode && c >= '0' && c <= '9') {
                    result.tokens.push_back({TokenKind::MergeDigit, c});
                } else if (!merge_mode && c >= '1' && c <= '4') {
                    result.tokens.push_back({TokenKind::HeadingDigit, c});
                } else {
                    result.tokens.push_back({TokenKind::Ignored, c});
                }
                break;
        }
    }

    result.text_offset = result.terminated ? index + 1 : value.size();
    return result;
}

StyleDirective StyleDirectiveParser::parse(std::string_view value) {
    StyleDirective directive;
    if (value.empty() || value.front() != '{') {
        directive.text = std::string(value);
        return directive;
    }

    directive.has_directive = true;
    Tokenized tokenized = tokenize(value);
    for (const auto& token : tokenized.tokens) {
        switch (token.kind) {
            case TokenKind::Bold:
                directive.bold = true;
                break;
            case TokenKind::Italic:
                directive.italic = true;
                break;
            case TokenKind::Underline:
                directive.underline = true;
                break;
            case TokenKind::Center:
                directive.center = true;
                break;
            case TokenKind::HeadingDigit:
                directive.heading_level = token.ch - '0';
                break;
            case TokenKind::MergeMarker:
                if (!directive.merge_span) {
                    directive.merge_span = 0;
                }
                break;
            case TokenKind::MergeDigit:
                directive.merge_span = token.ch - '0';
                break;
            case TokenKind::Ignored:
                break;
        }
    }

    // 未闭合的指令：文本为空
    if (tokenized.terminated && tokenized.text_offset < value.size()) {
        directive.text = std::string(value.substr(tokenized.text_offset));
    }
    return directive;
}

}} // namespace tabexport::core
