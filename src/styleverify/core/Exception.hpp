/**
 * @file Exception.hpp
 * @brief StyleVerify异常类定义
 */

#ifndef STYLEVERIFY_EXCEPTION_HPP
#define STYLEVERIFY_EXCEPTION_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include "ErrorCode.hpp"

namespace styleverify {
namespace core {

/**
 * @brief StyleVerify基础异常类
 */
class StyleVerifyException : public std::runtime_error {
public:
    /**
     * @brief 构造函数
     * @param message 错误消息
     * @param code 错误代码
     * @param file 发生错误的文件名
     * @param line 发生错误的行号
     */
    StyleVerifyException(const std::string& message,
                         ErrorCode code = ErrorCode::InternalError,
                         const char* file = nullptr,
                         int line = 0);

    ErrorCode getErrorCode() const noexcept { return error_code_; }

    std::string getErrorCodeString() const { return errorCodeName(error_code_); }

    /**
     * @brief 获取详细错误信息（错误码、位置、上下文链）
     */
    std::string getDetailedMessage() const;

    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

    /**
     * @brief 添加上下文信息
     */
    void addContext(const std::string& context);

    const std::vector<std::string>& getContext() const { return context_; }

    /**
     * @brief 转换为 Error，便于跨越 Result 边界
     */
    Error toError() const;

private:
    ErrorCode error_code_;
    const char* file_;
    int line_;
    std::vector<std::string> context_;
};

/**
 * @brief 文件相关异常
 */
class FileException : public StyleVerifyException {
public:
    FileException(const std::string& message, const std::string& filename,
                  ErrorCode code = ErrorCode::FileNotFound,
                  const char* file = nullptr, int line = 0);

    const std::string& getFilename() const { return filename_; }

private:
    std::string filename_;
};

/**
 * @brief 参数相关异常
 */
class ParameterException : public StyleVerifyException {
public:
    ParameterException(const std::string& message,
                       const std::string& parameter_name = "",
                       const char* file = nullptr, int line = 0);

    const std::string& getParameterName() const { return parameter_name_; }

private:
    std::string parameter_name_;
};

/**
 * @brief 文档抽取失败（输入不可解析或为空）
 */
class ExtractionException : public StyleVerifyException {
public:
    ExtractionException(const std::string& message,
                        const std::string& document = "",
                        const char* file = nullptr, int line = 0);

    const std::string& getDocument() const { return document_; }

private:
    std::string document_;
};

/**
 * @brief 模板配置错误（不存在、未激活、被引用、重复）
 */
class TemplateException : public StyleVerifyException {
public:
    TemplateException(const std::string& message,
                      const std::string& template_name = "",
                      ErrorCode code = ErrorCode::TemplateNotFound,
                      const char* file = nullptr, int line = 0);

    const std::string& getTemplateName() const { return template_name_; }

private:
    std::string template_name_;
};

/**
 * @brief 比较器内部缺陷，致命，终止本次校验
 */
class ComparatorException : public StyleVerifyException {
public:
    ComparatorException(const std::string& message,
                        const std::string& comparator = "",
                        const char* file = nullptr, int line = 0);

    const std::string& getComparator() const { return comparator_; }

private:
    std::string comparator_;
};

/**
 * @brief 非法的状态机迁移或对已停止组件的操作
 */
class StateException : public StyleVerifyException {
public:
    StateException(const std::string& message,
                   const std::string& operation = "",
                   const char* file = nullptr, int line = 0);

    const std::string& getOperation() const { return operation_; }

private:
    std::string operation_;
};

/**
 * @brief XML解析异常
 */
class XMLException : public StyleVerifyException {
public:
    XMLException(const std::string& message,
                 const std::string& xml_path = "",
                 int xml_line = -1,
                 const char* file = nullptr, int line = 0);

    const std::string& getXMLPath() const { return xml_path_; }
    int getXMLLine() const { return xml_line_; }

private:
    std::string xml_path_;
    int xml_line_;
};

}} // namespace styleverify::core

// 便捷宏定义
#define STYLEVERIFY_THROW(ExceptionType, message) \
    throw ExceptionType(message, "", __FILE__, __LINE__)

#define STYLEVERIFY_THROW_IF(condition, ExceptionType, message) \
    do { if (condition) { STYLEVERIFY_THROW(ExceptionType, message); } } while(0)

#define STYLEVERIFY_THROW_STATE(operation, message) \
    throw styleverify::core::StateException(message, operation, __FILE__, __LINE__)

#define STYLEVERIFY_THROW_COMPARATOR(comparator, message) \
    throw styleverify::core::ComparatorException(message, comparator, __FILE__, __LINE__)

#endif // STYLEVERIFY_EXCEPTION_HPP
