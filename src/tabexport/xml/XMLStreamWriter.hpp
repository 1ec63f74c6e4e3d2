/**
 * @file XMLStreamWriter.hpp  
 * @brief XML流写入器
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <stack>
#include <memory>

#include "tabexport/utils/FileWrapper.hpp"
#include "tabexport/core/Constants.hpp"

namespace tabexport {
namespace xml {

/**
 * @brief XML流写入器
 * 
 * 支持两种输出：写入内存（toString() 取结果）或直接写文件。
 * 属性先暂存，在元素开始标签闭合时统一写出。
 */
class XMLStreamWriter {
public:
    enum class OutputMode {
        FILE_DIRECT,    // 直接文件输出
        MEMORY_BUFFER   // 内存缓冲输出
    };

private:
    static constexpr size_t DEFAULT_BUFFER_SIZE = core::Constants::kIOBufferSize;
    
    std::string buffer_;
    std::unique_ptr<utils::FileWrapper> file_wrapper_;
    OutputMode output_mode_ = OutputMode::MEMORY_BUFFER;
    
    std::stack<std::string> element_stack_;
    bool in_element_ = false;
    
    struct XMLAttribute {
        std::string key;
        std::string value;
        
        XMLAttribute(std::string k, std::string v) 
            : key(std::move(k)), value(std::move(v)) {}
    };
    std::vector<XMLAttribute> pending_attributes_;
    
    size_t bytes_written_ = 0;
    
    void flushIfNeeded();
    void writeAttributesToBuffer();
    void ensureElementClosed();
    
    // 转义并清理文本：非法 UTF-8、C0 控制字符和 U+FFFE/U+FFFF 替换为 U+FFFD
    void appendEscaped(std::string_view text, bool attribute);
    
    static constexpr const char* kReplacementChar = "\xEF\xBF\xBD";
    
public:
    /**
     * @brief 默认构造函数（内存缓冲模式）
     */
    XMLStreamWriter();
    
    /**
     * @brief 文件输出构造函数
     * @throws FileException 文件创建失败
     */
    explicit XMLStreamWriter(const std::string& filename);
    
    ~XMLStreamWriter() = default;
    
    XMLStreamWriter(const XMLStreamWriter&) = delete;
    XMLStreamWriter& operator=(const XMLStreamWriter&) = delete;
    
    /**
     * @brief 文档操作
     */
    void startDocument(const std::string& encoding = "UTF-8");
    void endDocument();
    
    /**
     * @brief 处理指令，如 <?mso-application progid="Excel.Sheet"?>
     */
    void writeProcessingInstruction(const std::string& target, const std::string& data);
    
    /**
     * @brief 元素操作
     */
    void startElement(const std::string& name);
    void endElement();
    void writeEmptyElement(const std::string& name);
    
    /**
     * @brief 属性操作，只能在 startElement 之后、写入内容之前调用
     * @throws OperationException 当前不在开始标签内
     */
    void writeAttribute(const std::string& name, const std::string& value);
    void writeAttribute(const std::string& name, const char* value);
    void writeAttribute(const std::string& name, int value);
    void writeAttribute(const std::string& name, double value);
    
    /**
     * @brief 文本内容操作
     */
    void writeText(const std::string& text);
    void writeText(double value);
    void writeRaw(const std::string& data);
    
    /**
     * @brief 把缓冲写到文件（内存模式下无操作）
     */
    void flush();
    
    /**
     * @brief 获取输出结果（仅内存模式）
     */
    std::string toString() const;
    
    OutputMode getOutputMode() const { return output_mode_; }
    size_t getBytesWritten() const { return bytes_written_; }
    size_t getDepth() const { return element_stack_.size(); }
};

} // namespace xml
} // namespace tabexport
