#include "tabexport/xml/XMLStreamWriter.hpp"
#include "tabexport/core/Exception.hpp"
#include "tabexport/utils/ModuleLoggers.hpp"
#include <fmt/format.h>
#include <utf8.h>
#include <iterator>

namespace tabexport {
namespace xml {

XMLStreamWriter::XMLStreamWriter() {
    buffer_.reserve(DEFAULT_BUFFER_SIZE);
}

XMLStreamWriter::XMLStreamWriter(const std::string& filename)
    : file_wrapper_(std::make_unique<utils::FileWrapper>(filename, "wb")),
      output_mode_(OutputMode::FILE_DIRECT) {
    buffer_.reserve(DEFAULT_BUFFER_SIZE * 2);
    XML_DEBUG("XMLStreamWriter opened {}", filename);
}

void XMLStreamWriter::flushIfNeeded() {
    if (output_mode_ == OutputMode::FILE_DIRECT && buffer_.size() >= DEFAULT_BUFFER_SIZE) {
        flush();
    }
}

void XMLStreamWriter::flush() {
    if (output_mode_ != OutputMode::FILE_DIRECT || buffer_.empty()) {
        return;
    }
    file_wrapper_->write(buffer_.data(), buffer_.size());
    bytes_written_ += buffer_.size();
    buffer_.clear();
}

void XMLStreamWriter::appendEscaped(std::string_view text, bool attribute) {
    // 非法 UTF-8 序列先整体替换为 U+FFFD
    std::string repaired;
    if (!utf8::is_valid(text.begin(), text.end())) {
        utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(repaired));
        XML_WARN("Invalid UTF-8 in XML text replaced with U+FFFD");
        text = repaired;
    }
    
    size_t replaced = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        switch (c) {
            case '&': buffer_.append("&amp;"); break;
            case '<': buffer_.append("&lt;"); break;
            case '>': buffer_.append("&gt;"); break;
            case '"': buffer_.append("&quot;"); break;
            case '\'': buffer_.append("&apos;"); break;
            // 解析器会把字面 \r 归一成 \n，属性值中的 \t \n 会被归一成空格
            case '\r': buffer_.append("&#13;"); break;
            case '\n':
                if (attribute) {
                    buffer_.append("&#10;");
                } else {
                    buffer_.push_back(c);
                }
                break;
            case '\t':
                if (attribute) {
                    buffer_.append("&#9;");
                } else {
                    buffer_.push_back(c);
                }
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    // XML 1.0 不允许的 C0 控制字符
                    buffer_.append(kReplacementChar);
                    ++replaced;
                } else if (c == '\xEF' && i + 2 < text.size() && text[i + 1] == '\xBF' &&
                           (text[i + 2] == '\xBE' || text[i + 2] == '\xBF')) {
                    // 非字符 U+FFFE / U+FFFF
                    buffer_.append(kReplacementChar);
                    i += 2;
                    ++replaced;
                } else {
                    buffer_.push_back(c);
                }
        }
    }
    if (replaced > 0) {
        XML_WARN("{} character(s) not allowed in XML replaced with U+FFFD", replaced);
    }
}

void XMLStreamWriter::writeAttributesToBuffer() {
    for (const auto& attr : pending_attributes_) {
        buffer_.push_back(' ');
        buffer_.append(attr.key);
        buffer_.append("=\"");
        appendEscaped(attr.value, true);
        buffer_.push_back('"');
    }
    pending_attributes_.clear();
}

void XMLStreamWriter::ensureElementClosed() {
    if (in_element_) {
        writeAttributesToBuffer();
        buffer_.push_back('>');
        in_element_ = false;
    }
}

void XMLStreamWriter::startDocument(const std::string& encoding) {
    buffer_.append("<?xml version=\"1.0\" encoding=\"");
    buffer_.append(encoding);
    buffer_.append("\"?>\n");
}

void XMLStreamWriter::endDocument() {
    while (!element_stack_.empty()) {
        endElement();
    }
    buffer_.push_back('\n');
    flush();
    if (file_wrapper_) {
        file_wrapper_->close();
    }
}

void XMLStreamWriter::writeProcessingInstruction(const std::string& target, const std::string& data) {
    ensureElementClosed();
    buffer_.append("<?");
    buffer_.append(target);
    if (!data.empty()) {
        buffer_.push_back(' ');
        buffer_.append(data);
    }
    buffer_.append("?>\n");
}

void XMLStreamWriter::startElement(const std::string& name) {
    TABEXPORT_THROW_IF(name.empty(), core::ParameterException, "Element name cannot be empty", "name");
    
    ensureElementClosed();
    flushIfNeeded();
    
    buffer_.push_back('<');
    buffer_.append(name);
    
    element_stack_.push(name);
    in_element_ = true;
}

void XMLStreamWriter::endElement() {
    if (element_stack_.empty()) {
        TABEXPORT_THROW(core::OperationException, "No element to close", "endElement",
                        core::ErrorCode::InvalidArgument);
    }
    
    std::string element_name = std::move(element_stack_.top());
    element_stack_.pop();
    
    if (in_element_) {
        // 自闭合元素
        writeAttributesToBuffer();
        buffer_.append("/>");
        in_element_ = false;
    } else {
        buffer_.append("</");
        buffer_.append(element_name);
        buffer_.push_back('>');
    }
}

void XMLStreamWriter::writeEmptyElement(const std::string& name) {
    startElement(name);
    endElement();
}

void XMLStreamWriter::writeAttribute(const std::string& name, const std::string& value) {
    if (!in_element_) {
        TABEXPORT_THROW(core::OperationException, "Cannot write attribute outside of element",
                        "writeAttribute", core::ErrorCode::InvalidArgument);
    }
    TABEXPORT_THROW_IF(name.empty(), core::ParameterException, "Attribute name cannot be empty", "name");
    pending_attributes_.emplace_back(name, value);
}

void XMLStreamWriter::writeAttribute(const std::string& name, const char* value) {
    writeAttribute(name, std::string(value ? value : ""));
}

void XMLStreamWriter::writeAttribute(const std::string& name, int value) {
    writeAttribute(name, fmt::format("{}", value));
}

void XMLStreamWriter::writeAttribute(const std::string& name, double value) {
    writeAttribute(name, fmt::format("{}", value));
}

void XMLStreamWriter::writeText(const std::string& text) {
    ensureElementClosed();
    appendEscaped(text, false);
    flushIfNeeded();
}

void XMLStreamWriter::writeText(double value) {
    ensureElementClosed();
    buffer_.append(fmt::format("{}", value));
}

void XMLStreamWriter::writeRaw(const std::string& data) {
    ensureElementClosed();
    buffer_.append(data);
}

std::string XMLStreamWriter::toString() const {
    if (output_mode_ != OutputMode::MEMORY_BUFFER) {
        XML_WARN("toString() called on a file-backed writer");
        return "";
    }
    return buffer_;
}

} // namespace xml
} // namespace tabexport
