#pragma once

#include "styleverify/xml/XMLStreamReader.hpp"
#include "styleverify/utils/ModuleLoggers.hpp"
#include <fmt/format.h>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace styleverify {
namespace reader {

/**
 * @brief 通用SAX解析器基类 - 为 WordprocessingML 部件解析器提供统一的SAX解析能力
 *
 * - 基于XMLStreamReader的SAX事件驱动
 * - 元素名按本地名分发（去掉 "w:" 等前缀），属性同样按本地名查找
 * - 元素栈和解析状态跟踪
 */
class BaseSAXParser {
protected:
    // 通用解析状态
    struct ParseState {
        // 元素栈（本地名）
        std::vector<std::string> element_stack;

        int current_depth = 0;

        bool has_error = false;
        std::string error_message;

        void reset() {
            element_stack.clear();
            current_depth = 0;
            has_error = false;
            error_message.clear();
        }

        std::string getCurrentElement() const {
            return element_stack.empty() ? "" : element_stack.back();
        }

        // 检查是否在指定元素内
        bool isInElement(std::string_view element_name) const {
            for (auto it = element_stack.rbegin(); it != element_stack.rend(); ++it) {
                if (*it == element_name) return true;
            }
            return false;
        }
    };

    ParseState state_;

public:
    BaseSAXParser() = default;
    virtual ~BaseSAXParser() = default;

    BaseSAXParser(const BaseSAXParser&) = delete;
    BaseSAXParser& operator=(const BaseSAXParser&) = delete;

    /**
     * @brief 解析XML内容的统一入口
     * @param xml_content XML字符串内容
     * @return 是否解析成功
     */
    bool parseXML(const std::string& xml_content) {
        state_.reset();
        onReset();

        if (xml_content.empty()) {
            setError("Empty XML content");
            return false;
        }

        xml::XMLStreamReader reader;
        reader.setTrimWhitespace(false);

        reader.setStartElementCallback([this](std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int depth) {
            handleStartElement(localName(name), attributes, depth);
        });

        reader.setEndElementCallback([this](std::string_view name, int depth) {
            handleEndElement(localName(name), depth);
        });

        reader.setTextCallback([this](std::string_view text, int depth) {
            onText(text, depth);
        });

        reader.setErrorCallback([this](xml::XMLParseError, const std::string& message, int line, int column) {
            state_.has_error = true;
            state_.error_message = fmt::format("XML Parse Error at line {}, column {}: {}", line, column, message);
        });

        auto result = reader.parseFromString(xml_content);
        if (result != xml::XMLParseError::Ok) {
            if (!state_.has_error) {
                setError("XML parsing failed");
            } else {
                READER_ERROR("SAX Parser Error: {}", state_.error_message);
            }
            return false;
        }

        return !state_.has_error;
    }

    bool hasError() const { return state_.has_error; }
    const std::string& getErrorMessage() const { return state_.error_message; }

    /**
     * @brief 去掉命名空间前缀："w:pPr" -> "pPr"
     */
    static std::string_view localName(std::string_view name) {
        size_t colon = name.find(':');
        return colon == std::string_view::npos ? name : name.substr(colon + 1);
    }

protected:
    void handleStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int depth) {
        state_.element_stack.emplace_back(name);
        state_.current_depth = depth;
        onStartElement(name, attributes, depth);
    }

    void handleEndElement(std::string_view name, int depth) {
        if (!state_.element_stack.empty()) {
            state_.element_stack.pop_back();
        }
        state_.current_depth = depth;
        onEndElement(name, depth);
    }

    // 子类重写的虚函数
    virtual void onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int depth) = 0;
    virtual void onEndElement(std::string_view name, int depth) = 0;
    virtual void onText(std::string_view /*text*/, int /*depth*/) {}
    virtual void onReset() {}

    // ==================== 通用工具方法 ====================

    /**
     * @brief 按本地名查找属性（"w:val" 与 "val" 都能命中 "val"）
     */
    static std::optional<std::string> findAttribute(const std::vector<xml::XMLAttribute>& attributes, std::string_view name) {
        for (const auto& attr : attributes) {
            if (localName(attr.name) == name) {
                return std::string(attr.value);
            }
        }
        return std::nullopt;
    }

    static std::optional<double> findDoubleAttribute(const std::vector<xml::XMLAttribute>& attributes, std::string_view name) {
        auto val = findAttribute(attributes, name);
        if (!val || val->empty()) {
            return std::nullopt;
        }
        char* end = nullptr;
        double number = std::strtod(val->c_str(), &end);
        if (end == val->c_str() || *end != '\0') {
            return std::nullopt;
        }
        return number;
    }

    /**
     * @brief OOXML 开关属性：缺省 val 即为真，"0"/"false"/"off" 为假
     */
    static bool toggleValue(const std::vector<xml::XMLAttribute>& attributes) {
        auto val = findAttribute(attributes, "val");
        if (!val) {
            return true;
        }
        return !(*val == "0" || *val == "false" || *val == "off" || *val == "none");
    }

    std::string getAttributeOr(const std::vector<xml::XMLAttribute>& attributes, std::string_view name, const std::string& default_value) const {
        auto val = findAttribute(attributes, name);
        return val ? *val : default_value;
    }

    void setError(const std::string& message) {
        state_.has_error = true;
        state_.error_message = message;
        READER_ERROR("Parser Error: {}", message);
    }

    // ==================== 状态查询方法 ====================

    std::string getCurrentElement() const {
        return state_.getCurrentElement();
    }

    bool isInElement(std::string_view element_name) const {
        return state_.isInElement(element_name);
    }

    int getCurrentDepth() const {
        return state_.current_depth;
    }
};

}} // namespace styleverify::reader
