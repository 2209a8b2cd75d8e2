#include "styleverify/xml/XMLStreamReader.hpp"
#include "styleverify/utils/ModuleLoggers.hpp"
#include <climits>
#include <cstring>
#include <fmt/format.h>

namespace styleverify {
namespace xml {

XMLStreamReader::XMLStreamReader() {
    attributes_.reserve(32);
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
    error_line_ = -1;
    attributes_.clear();
    current_text_.clear();
    collecting_text_ = false;
    bytes_parsed_ = 0;
    elements_parsed_ = 0;
}

// 回调函数设置
void XMLStreamReader::setStartElementCallback(StartElementCallback callback) {
    start_element_callback_ = std::move(callback);
}

void XMLStreamReader::setEndElementCallback(EndElementCallback callback) {
    end_element_callback_ = std::move(callback);
}

void XMLStreamReader::setTextCallback(TextCallback callback) {
    text_callback_ = std::move(callback);
}

void XMLStreamReader::setErrorCallback(ErrorCallback callback) {
    error_callback_ = std::move(callback);
}

void XMLStreamReader::setTrimWhitespace(bool trim) {
    trim_whitespace_ = trim;
}

void XMLStreamReader::setCollectText(bool collect) {
    collect_text_ = collect;
}

XMLParseError XMLStreamReader::parseFromString(const std::string& xml_content) {
    return parseFromBuffer(xml_content.data(), xml_content.size());
}

XMLParseError XMLStreamReader::parseFromBuffer(const char* buffer, size_t size) {
    resetState();

    if (!buffer || size == 0) {
        handleError(XMLParseError::InvalidInput, "Invalid buffer or size");
        return XMLParseError::InvalidInput;
    }
    if (size > static_cast<size_t>(INT_MAX)) {
        handleError(XMLParseError::InvalidInput, fmt::format("XML buffer too large: {} bytes", size));
        return XMLParseError::InvalidInput;
    }

    if (!initializeParser()) {
        return last_error_;
    }

    bytes_parsed_ = size;

    // 使用ParseBuffer API
    void* expat_buffer = XML_GetBuffer(parser_, static_cast<int>(size));
    if (!expat_buffer) {
        handleError(XMLParseError::MemoryError, "Failed to get Expat buffer");
        return XMLParseError::MemoryError;
    }
    std::memcpy(expat_buffer, buffer, size);

    if (XML_ParseBuffer(parser_, static_cast<int>(size), 1) == XML_STATUS_ERROR) {
        // 回调异常导致的中止已经记录过错误
        if (last_error_ == XMLParseError::CallbackError) {
            return last_error_;
        }
        error_line_ = static_cast<int>(XML_GetCurrentLineNumber(parser_));
        std::string error_msg = fmt::format("Parse error at line {}, column {}: {}",
            XML_GetCurrentLineNumber(parser_),
            XML_GetCurrentColumnNumber(parser_),
            XML_ErrorString(XML_GetErrorCode(parser_)));
        handleError(XMLParseError::ParseFailed, error_msg);
        return XMLParseError::ParseFailed;
    }

    XML_DEBUG("Successfully parsed {} bytes, {} elements", bytes_parsed_, elements_parsed_);
    return XMLParseError::Ok;
}

// libexpat回调函数实现
void XMLCALL XMLStreamReader::startElementHandler(void* userData, const XML_Char* name, const XML_Char** attrs) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);

    std::string_view element_name{name, std::strlen(name)};
    reader->elements_parsed_++;
    reader->parseAttributes(attrs);

    if (reader->start_element_callback_) {
        try {
            reader->start_element_callback_(element_name, reader->attributes_, reader->current_depth_);
        } catch (const std::exception& e) {
            reader->failFromCallback("Start element", e);
            return;
        }
    }

    reader->current_depth_++;
    reader->current_text_.clear();
    reader->collecting_text_ = reader->collect_text_;
}

void XMLCALL XMLStreamReader::endElementHandler(void* userData, const XML_Char* name) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);

    reader->current_depth_--;
    std::string_view element_name{name, std::strlen(name)};

    // 处理累积的文本内容
    if (reader->collecting_text_ && !reader->current_text_.empty()) {
        std::string_view text_content = reader->trim_whitespace_ ?
            trimStringView(reader->current_text_) : std::string_view{reader->current_text_};

        if (!text_content.empty() && reader->text_callback_) {
            try {
                reader->text_callback_(text_content, reader->current_depth_);
            } catch (const std::exception& e) {
                reader->failFromCallback("Text", e);
                return;
            }
        }
    }

    if (reader->end_element_callback_) {
        try {
            reader->end_element_callback_(element_name, reader->current_depth_);
        } catch (const std::exception& e) {
            reader->failFromCallback("End element", e);
            return;
        }
    }

    reader->current_text_.clear();
    // 父元素的尾随文本不再收集，只有叶子元素产生文本事件
    reader->collecting_text_ = false;
}

void XMLCALL XMLStreamReader::characterDataHandler(void* userData, const XML_Char* data, int len) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);
    if (reader->collecting_text_ && len > 0) {
        reader->current_text_.append(data, static_cast<size_t>(len));
    }
}

void XMLStreamReader::parseAttributes(const XML_Char** attrs) {
    attributes_.clear();
    if (!attrs) {
        return;
    }
    for (int i = 0; attrs[i]; i += 2) {
        if (attrs[i + 1]) {
            attributes_.emplace_back(
                std::string_view{attrs[i], std::strlen(attrs[i])},
                std::string_view{attrs[i + 1], std::strlen(attrs[i + 1])});
        }
    }
}

std::string_view XMLStreamReader::trimStringView(std::string_view str) {
    size_t start = str.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) {
        return std::string_view{};
    }
    size_t end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

void XMLStreamReader::failFromCallback(const char* what, const std::exception& e) {
    error_line_ = parser_ ? static_cast<int>(XML_GetCurrentLineNumber(parser_)) : -1;
    handleError(XMLParseError::CallbackError, fmt::format("{} callback error: {}", what, e.what()));
    XML_StopParser(parser_, XML_FALSE);
}

void XMLStreamReader::handleError(XMLParseError error, const std::string& message) {
    last_error_ = error;
    last_error_message_ = message;

    XML_ERROR("XML parse error: {}", message);

    if (error_callback_) {
        const int column = parser_ ? static_cast<int>(XML_GetCurrentColumnNumber(parser_)) : -1;
        error_callback_(error, message, error_line_, column);
    }
}

}} // namespace styleverify::xml
