/**
 * @file Exception.cpp
 * @brief StyleVerify异常类实现
 */

#include "styleverify/core/Exception.hpp"
#include <fmt/format.h>

namespace styleverify {
namespace core {

// StyleVerifyException 实现
StyleVerifyException::StyleVerifyException(const std::string& message,
                                           ErrorCode code,
                                           const char* file,
                                           int line)
    : std::runtime_error(message)
    , error_code_(code)
    , file_(file)
    , line_(line) {
}

std::string StyleVerifyException::getDetailedMessage() const {
    std::string result = fmt::format("[{}] {}", getErrorCodeString(), what());

    if (file_ && line_ > 0) {
        result += fmt::format(" (at {}:{})", file_, line_);
    }

    if (!context_.empty()) {
        result += "\nContext:";
        for (const auto& ctx : context_) {
            result += "\n  - " + ctx;
        }
    }

    return result;
}

void StyleVerifyException::addContext(const std::string& context) {
    context_.push_back(context);
}

Error StyleVerifyException::toError() const {
    std::string ctx;
    for (const auto& c : context_) {
        if (!ctx.empty()) ctx += "; ";
        ctx += c;
    }
    return Error(error_code_, what(), ctx);
}

// FileException 实现
FileException::FileException(const std::string& message, const std::string& filename,
                             ErrorCode code, const char* file, int line)
    : StyleVerifyException(fmt::format("{} (file: {})", message, filename), code, file, line)
    , filename_(filename) {
}

// ParameterException 实现
ParameterException::ParameterException(const std::string& message,
                                       const std::string& parameter_name,
                                       const char* file, int line)
    : StyleVerifyException(parameter_name.empty() ? message
                               : fmt::format("{} (parameter: {})", message, parameter_name),
                           ErrorCode::InvalidArgument, file, line)
    , parameter_name_(parameter_name) {
}

// ExtractionException 实现
ExtractionException::ExtractionException(const std::string& message,
                                         const std::string& document,
                                         const char* file, int line)
    : StyleVerifyException(document.empty() ? message
                               : fmt::format("{} (document: {})", message, document),
                           ErrorCode::ExtractionFailed, file, line)
    , document_(document) {
}

// TemplateException 实现
TemplateException::TemplateException(const std::string& message,
                                     const std::string& template_name,
                                     ErrorCode code, const char* file, int line)
    : StyleVerifyException(template_name.empty() ? message
                               : fmt::format("{} (template: {})", message, template_name),
                           code, file, line)
    , template_name_(template_name) {
}

// ComparatorException 实现
ComparatorException::ComparatorException(const std::string& message,
                                         const std::string& comparator,
                                         const char* file, int line)
    : StyleVerifyException(comparator.empty() ? message
                               : fmt::format("{} (comparator: {})", message, comparator),
                           ErrorCode::ComparatorDefect, file, line)
    , comparator_(comparator) {
}

// StateException 实现
StateException::StateException(const std::string& message,
                               const std::string& operation,
                               const char* file, int line)
    : StyleVerifyException(operation.empty() ? message
                               : fmt::format("{} (operation: {})", message, operation),
                           ErrorCode::InvalidStateTransition, file, line)
    , operation_(operation) {
}

// XMLException 实现
XMLException::XMLException(const std::string& message,
                           const std::string& xml_path,
                           int xml_line,
                           const char* file, int line)
    : StyleVerifyException(xml_line >= 0
                               ? fmt::format("{} ({}:{})", message, xml_path, xml_line)
                               : message,
                           ErrorCode::XmlParseError, file, line)
    , xml_path_(xml_path)
    , xml_line_(xml_line) {
}

void throwError(const Error& error) {
    const std::string message = error.fullMessage();
    switch (error.code) {
        case ErrorCode::InvalidArgument:
            throw ParameterException(message);
        case ErrorCode::InvalidStateTransition:
            throw StateException(message);
        case ErrorCode::FileNotFound:
        case ErrorCode::FileReadError:
            throw FileException(message, error.context, error.code);
        case ErrorCode::ZipError:
        case ErrorCode::ExtractionFailed:
            throw ExtractionException(message);
        case ErrorCode::XmlParseError:
        case ErrorCode::XmlMissingElement:
            throw XMLException(message);
        case ErrorCode::TemplateNotFound:
        case ErrorCode::TemplateInactive:
        case ErrorCode::TemplateInUse:
        case ErrorCode::DuplicateTemplate:
            throw TemplateException(message, "", error.code);
        case ErrorCode::ComparatorDefect:
            throw ComparatorException(message);
        default:
            throw StyleVerifyException(message, error.code);
    }
}

}} // namespace styleverify::core
