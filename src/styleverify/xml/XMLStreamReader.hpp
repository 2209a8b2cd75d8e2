#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <functional>
#include <expat.h>
#include "styleverify/core/Constants.hpp"

namespace styleverify {
namespace xml {

/**
 * @brief 流式XML解析器，基于libexpat
 *
 * - 基于libexpat的SAX解析，事件驱动的回调机制
 * - 元素名与属性以 string_view 直接引用 expat 缓冲区，仅在回调期间有效
 * - 文本在元素结束时一次性回调（只回调叶子元素中累积的文本）
 * - 回调抛出的异常会终止解析并以 CallbackError 返回
 */

// 解析错误枚举
enum class XMLParseError {
    Ok,                    // 解析成功
    InvalidInput,          // 无效输入
    ParserCreateFailed,    // 解析器创建失败
    ParseFailed,           // 解析失败
    MemoryError,           // 内存错误
    CallbackError          // 回调函数错误
};

constexpr bool isSuccess(XMLParseError error) noexcept {
    return error == XMLParseError::Ok;
}

constexpr bool isError(XMLParseError error) noexcept {
    return error != XMLParseError::Ok;
}

// XML属性（零拷贝）
struct XMLAttribute {
    std::string_view name;
    std::string_view value;

    XMLAttribute(std::string_view n, std::string_view v)
        : name(n), value(v) {}
};

class XMLStreamReader {
public:
    using StartElementCallback = std::function<void(std::string_view name, const std::vector<XMLAttribute>& attributes, int depth)>;
    using EndElementCallback = std::function<void(std::string_view name, int depth)>;
    using TextCallback = std::function<void(std::string_view text, int depth)>;
    using ErrorCallback = std::function<void(XMLParseError error, const std::string& message, int line, int column)>;

    XMLStreamReader();
    ~XMLStreamReader();

    XMLStreamReader(const XMLStreamReader&) = delete;
    XMLStreamReader& operator=(const XMLStreamReader&) = delete;

    // 回调函数设置
    void setStartElementCallback(StartElementCallback callback);
    void setEndElementCallback(EndElementCallback callback);
    void setTextCallback(TextCallback callback);
    void setErrorCallback(ErrorCallback callback);

    // 解析选项设置
    void setTrimWhitespace(bool trim);
    void setCollectText(bool collect);

    // 解析方法
    XMLParseError parseFromString(const std::string& xml_content);
    XMLParseError parseFromBuffer(const char* buffer, size_t size);

    // 状态查询
    XMLParseError getLastError() const { return last_error_; }
    const std::string& getLastErrorMessage() const { return last_error_message_; }
    int getErrorLine() const { return error_line_; }
    size_t getBytesParsed() const { return bytes_parsed_; }
    size_t getElementsParsed() const { return elements_parsed_; }

private:
    // libexpat回调函数（静态）
    static void XMLCALL startElementHandler(void* userData, const XML_Char* name, const XML_Char** attrs);
    static void XMLCALL endElementHandler(void* userData, const XML_Char* name);
    static void XMLCALL characterDataHandler(void* userData, const XML_Char* data, int len);

    bool initializeParser();
    void cleanupParser();
    void resetState();
    void parseAttributes(const XML_Char** attrs);
    static std::string_view trimStringView(std::string_view str);
    void handleError(XMLParseError error, const std::string& message);
    void failFromCallback(const char* what, const std::exception& e);

    XML_Parser parser_ = nullptr;

    int current_depth_ = 0;
    XMLParseError last_error_ = XMLParseError::Ok;
    std::string last_error_message_;
    int error_line_ = -1;

    // 属性缓存（避免重复分配）
    std::vector<XMLAttribute> attributes_;

    std::string current_text_;
    bool collecting_text_ = false;

    StartElementCallback start_element_callback_;
    EndElementCallback end_element_callback_;
    TextCallback text_callback_;
    ErrorCallback error_callback_;

    bool trim_whitespace_ = true;
    bool collect_text_ = true;

    size_t bytes_parsed_ = 0;
    size_t elements_parsed_ = 0;
};

}} // namespace styleverify::xml
