#include "tabexport/xml/XMLStreamReader.hpp"
#include "tabexport/core/Exception.hpp"
#include "tabexport/utils/FileWrapper.hpp"
#include "tabexport/utils/ModuleLoggers.hpp"
#include <cstring>
#include <fmt/format.h>

namespace tabexport {
namespace xml {

XMLStreamReader::XMLStreamReader() {
    attributes_.reserve(16);
    resetState();
}

XMLStreamReader::~XMLStreamReader() {
    cleanupParser();
}

bool XMLStreamReader::initializeParser() {
    cleanupParser();
    
    parser_ = XML_ParserCreate("UTF-8");
    if (!parser_) {
        handleError(XMLParseError::ParserCreateFailed, "Failed to create XML parser");
        return false;
    }
    
    XML_SetUserData(parser_, this);
    XML_SetElementHandler(parser_, startElementHandler, endElementHandler);
    XML_SetCharacterDataHandler(parser_, characterDataHandler);
    return true;
}

void XMLStreamReader::cleanupParser() {
    if (parser_) {
        XML_ParserFree(parser_);
        parser_ = nullptr;
    }
}

void XMLStreamReader::resetState() {
    current_depth_ = 0;
    last_error_ = XMLParseError::Ok;
    last_error_message_.clear();
    attributes_.clear();
    current_text_.clear();
    bytes_parsed_ = 0;
    elements_parsed_ = 0;
}

XMLParseError XMLStreamReader::finishChunk(int length, bool is_final) {
    if (XML_ParseBuffer(parser_, length, is_final ? XML_TRUE : XML_FALSE) == XML_STATUS_ERROR) {
        // 回调出错时已经记录了错误
        if (last_error_ == XMLParseError::Ok) {
            handleError(XMLParseError::ParseFailed,
                        fmt::format("{} at line {}, column {}",
                                    XML_ErrorString(XML_GetErrorCode(parser_)),
                                    getCurrentLineNumber(), getCurrentColumnNumber()));
        }
        return last_error_;
    }
    return XMLParseError::Ok;
}

XMLParseError XMLStreamReader::parseFromFile(const std::string& filename) {
    resetState();
    
    std::unique_ptr<utils::FileWrapper> file;
    try {
        file = std::make_unique<utils::FileWrapper>(filename, "rb");
    } catch (const core::FileException& e) {
        handleError(XMLParseError::IoError, e.what());
        return XMLParseError::IoError;
    }
    
    if (!initializeParser()) {
        return last_error_;
    }
    
    while (true) {
        void* expat_buffer = XML_GetBuffer(parser_, static_cast<int>(BUFFER_SIZE));
        if (!expat_buffer) {
            handleError(XMLParseError::MemoryError, "Failed to get Expat buffer");
            return XMLParseError::MemoryError;
        }
        
        size_t bytes_read = 0;
        try {
            bytes_read = file->read(static_cast<char*>(expat_buffer), BUFFER_SIZE);
        } catch (const core::FileException& e) {
            handleError(XMLParseError::IoError, e.what());
            return XMLParseError::IoError;
        }
        bytes_parsed_ += bytes_read;
        
        bool is_final = bytes_read == 0;
        XMLParseError result = finishChunk(static_cast<int>(bytes_read), is_final);
        if (!isSuccess(result) || is_final) {
            return result;
        }
    }
}

XMLParseError XMLStreamReader::parseFromString(const std::string& xml_content) {
    resetState();
    if (!initializeParser()) {
        return last_error_;
    }
    
    bytes_parsed_ = xml_content.size();
    if (XML_Parse(parser_, xml_content.data(), static_cast<int>(xml_content.size()), XML_TRUE) == XML_STATUS_ERROR) {
        if (last_error_ == XMLParseError::Ok) {
            handleError(XMLParseError::ParseFailed,
                        fmt::format("{} at line {}, column {}",
                                    XML_ErrorString(XML_GetErrorCode(parser_)),
                                    getCurrentLineNumber(), getCurrentColumnNumber()));
        }
        return last_error_;
    }
    return XMLParseError::Ok;
}

void XMLCALL XMLStreamReader::startElementHandler(void* userData, const XML_Char* name, const XML_Char** attrs) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);
    std::string_view element_name{name, std::strlen(name)};
    
    reader->elements_parsed_++;
    
    reader->attributes_.clear();
    if (attrs) {
        for (int i = 0; attrs[i]; i += 2) {
            if (attrs[i + 1]) {
                reader->attributes_.emplace_back(
                    std::string_view{attrs[i], std::strlen(attrs[i])},
                    std::string_view{attrs[i + 1], std::strlen(attrs[i + 1])});
            }
        }
    }
    
    if (reader->start_element_callback_) {
        try {
            reader->start_element_callback_(element_name, reader->attributes_, reader->current_depth_);
        } catch (const std::exception& e) {
            reader->handleError(XMLParseError::CallbackError, "Start element callback error: " + std::string(e.what()));
        }
    }
    
    reader->current_depth_++;
    reader->current_text_.clear();
}

void XMLCALL XMLStreamReader::endElementHandler(void* userData, const XML_Char* name) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);
    
    reader->current_depth_--;
    std::string_view element_name{name, std::strlen(name)};
    
    if (!reader->current_text_.empty()) {
        std::string_view text_content = reader->trim_whitespace_ ?
            reader->trimStringView(reader->current_text_) : std::string_view{reader->current_text_};
        
        if (!text_content.empty() && reader->text_callback_) {
            try {
                reader->text_callback_(text_content, reader->current_depth_);
            } catch (const std::exception& e) {
                reader->handleError(XMLParseError::CallbackError, "Text callback error: " + std::string(e.what()));
            }
        }
        reader->current_text_.clear();
    }
    
    if (reader->end_element_callback_) {
        try {
            reader->end_element_callback_(element_name, reader->current_depth_);
        } catch (const std::exception& e) {
            reader->handleError(XMLParseError::CallbackError, "End element callback error: " + std::string(e.what()));
        }
    }
}

void XMLCALL XMLStreamReader::characterDataHandler(void* userData, const XML_Char* data, int len) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);
    if (len > 0) {
        reader->current_text_.append(data, static_cast<size_t>(len));
    }
}

std::string_view XMLStreamReader::trimStringView(std::string_view str) const {
    size_t start = str.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) {
        return {};
    }
    size_t end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

void XMLStreamReader::handleError(XMLParseError error, const std::string& message) {
    last_error_ = error;
    last_error_message_ = message;
    
    XML_ERROR("XML parse error: {}", message);
    
    // 回调出错时停止继续解析
    if (parser_ && error == XMLParseError::CallbackError) {
        XML_StopParser(parser_, XML_FALSE);
    }
}

int XMLStreamReader::getCurrentLineNumber() const {
    return parser_ ? static_cast<int>(XML_GetCurrentLineNumber(parser_)) : 0;
}

int XMLStreamReader::getCurrentColumnNumber() const {
    return parser_ ? static_cast<int>(XML_GetCurrentColumnNumber(parser_)) : 0;
}

} // namespace xml
} // namespace tabexport
