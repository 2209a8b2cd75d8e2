#pragma once

#include <cstdint>
#include <string>
#include <fmt/format.h>

namespace styleverify {
namespace core {

/**
 * @brief StyleVerify统一错误码
 *
 * - 可恢复错误通过 Expected/Result 返回
 * - 程序缺陷通过异常上抛
 */
enum class ErrorCode : uint8_t {
    // 成功
    Ok = 0,

    // 通用错误 (1-19)
    InvalidArgument = 1,
    InternalError = 2,
    InvalidStateTransition = 3,
    Cancelled = 4,

    // 文件/归档错误 (20-39)
    FileNotFound = 20,
    FileReadError = 21,
    ZipError = 22,

    // 文档解析错误 (40-59)
    ExtractionFailed = 40,
    XmlParseError = 41,
    XmlMissingElement = 42,

    // 模板与结果存储 (60-79)
    TemplateNotFound = 60,
    TemplateInactive = 61,
    TemplateInUse = 62,
    DuplicateTemplate = 63,
    ResultNotFound = 64,

    // 比较引擎 (80-99)
    SignatureTruncated = 80,
    ComparatorDefect = 81
};

/**
 * @brief 错误信息结构
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;  // 额外上下文信息

    Error() : code(ErrorCode::Ok) {}

    explicit Error(ErrorCode c);

    Error(ErrorCode c, const std::string& msg) : code(c), message(msg) {}

    Error(ErrorCode c, const std::string& msg, const std::string& ctx)
        : code(c), message(msg), context(ctx) {}

    bool isOk() const noexcept { return code == ErrorCode::Ok; }
    bool isError() const noexcept { return code != ErrorCode::Ok; }

    std::string fullMessage() const {
        if (context.empty()) {
            return message;
        }
        return fmt::format("{} (Context: {})", message, context);
    }
};

/**
 * @brief 错误码转可读描述
 */
const char* toString(ErrorCode code) noexcept;

/**
 * @brief 错误码名称（枚举名），用于日志和持久化
 */
const char* errorCodeName(ErrorCode code) noexcept;

inline Error makeError(ErrorCode code) {
    return Error(code);
}

inline Error makeError(ErrorCode code, const std::string& message) {
    return Error(code, message);
}

inline Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    return Error(code, message, context);
}

/**
 * @brief 按错误码抛出对应类型的异常（定义在 Exception.cpp）
 */
[[noreturn]] void throwError(const Error& error);

}} // namespace styleverify::core
