#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <functional>
#include <expat.h>
#include "tabexport/core/Constants.hpp"

namespace tabexport {
namespace xml {

// 解析错误枚举
enum class XMLParseError {
    Ok,                    // 解析成功
    ParserCreateFailed,    // 解析器创建失败
    ParseFailed,           // 解析失败
    IoError,               // I/O错误
    MemoryError,           // 内存错误
    CallbackError          // 回调函数错误
};

constexpr bool isSuccess(XMLParseError error) noexcept {
    return error == XMLParseError::Ok;
}

// XML属性，直接引用 expat 的缓冲区，只在回调期间有效
struct XMLAttribute {
    std::string_view name;
    std::string_view value;
    
    XMLAttribute(std::string_view n, std::string_view v) 
        : name(n), value(v) {}
};

/**
 * @brief 基于 libexpat 的流式XML解析器
 * 
 * SAX 风格：解析过程中依次触发开始元素、文本、结束元素回调。
 * 元素文本在结束标签处一次性交给文本回调。
 * 回调抛出的异常会中止解析并记为 CallbackError。
 */
class XMLStreamReader {
public:
    using StartElementCallback = std::function<void(std::string_view name, const std::vector<XMLAttribute>& attributes, int depth)>;
    using EndElementCallback = std::function<void(std::string_view name, int depth)>;
    using TextCallback = std::function<void(std::string_view text, int depth)>;

private:
    XML_Parser parser_ = nullptr;
    
    int current_depth_ = 0;
    XMLParseError last_error_ = XMLParseError::Ok;
    std::string last_error_message_;
    
    std::vector<XMLAttribute> attributes_;
    std::string current_text_;
    
    static constexpr size_t BUFFER_SIZE = core::Constants::kIOBufferSize;
    
    StartElementCallback start_element_callback_;
    EndElementCallback end_element_callback_;
    TextCallback text_callback_;
    
    bool trim_whitespace_ = true;
    
    size_t bytes_parsed_ = 0;
    size_t elements_parsed_ = 0;
    
    static void XMLCALL startElementHandler(void* userData, const XML_Char* name, const XML_Char** attrs);
    static void XMLCALL endElementHandler(void* userData, const XML_Char* name);
    static void XMLCALL characterDataHandler(void* userData, const XML_Char* data, int len);
    
    bool initializeParser();
    void cleanupParser();
    void resetState();
    std::string_view trimStringView(std::string_view str) const;
    void handleError(XMLParseError error, const std::string& message);
    XMLParseError finishChunk(int length, bool is_final);
    
    // 出错位置，写入错误消息
    int getCurrentLineNumber() const;
    int getCurrentColumnNumber() const;
    
public:
    XMLStreamReader();
    ~XMLStreamReader();
    
    XMLStreamReader(const XMLStreamReader&) = delete;
    XMLStreamReader& operator=(const XMLStreamReader&) = delete;
    
    void setStartElementCallback(StartElementCallback callback) { start_element_callback_ = std::move(callback); }
    void setEndElementCallback(EndElementCallback callback) { end_element_callback_ = std::move(callback); }
    void setTextCallback(TextCallback callback) { text_callback_ = std::move(callback); }
    
    /**
     * @brief 是否裁掉文本首尾空白（默认裁掉）
     */
    void setTrimWhitespace(bool trim) { trim_whitespace_ = trim; }
    
    XMLParseError parseFromFile(const std::string& filename);
    XMLParseError parseFromString(const std::string& xml_content);
    
    XMLParseError getLastError() const { return last_error_; }
    const std::string& getLastErrorMessage() const { return last_error_message_; }
    int getCurrentDepth() const { return current_depth_; }
    size_t getBytesParsed() const { return bytes_parsed_; }
    size_t getElementsParsed() const { return elements_parsed_; }
};

} // namespace xml
} // namespace tabexport
