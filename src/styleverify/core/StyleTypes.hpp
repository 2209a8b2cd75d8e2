#pragma once

#include <cstdint>
#include <string>
#include <optional>

namespace styleverify {
namespace core {

/**
 * @brief 样式类型
 */
enum class StyleType : uint8_t {
    Paragraph = 0,
    Character = 1,
    Table = 2,
    Numbering = 3,
    Unknown = 255
};

/**
 * @brief 段落水平对齐
 */
enum class TextAlignment : uint8_t {
    Left = 0,
    Center = 1,
    Right = 2,
    Justify = 3,
    Distributed = 4
};

/**
 * @brief 制表位对齐方式
 */
enum class TabAlignment : uint8_t {
    Left = 0,
    Center = 1,
    Right = 2,
    Decimal = 3,
    Bar = 4,
    Clear = 5
};

/**
 * @brief 制表位前导符
 */
enum class TabLeader : uint8_t {
    None = 0,
    Dot = 1,
    Hyphen = 2,
    Underscore = 3,
    Heavy = 4,
    MiddleDot = 5
};

/**
 * @brief 不一致项严重程度，数值越大越严重
 */
enum class Severity : uint8_t {
    Low = 1,
    Medium = 2,
    High = 3
};

enum class TemplateStatus : uint8_t {
    Active = 0,
    Inactive = 1,
    Archived = 2
};

/**
 * @brief 校验结果状态机: Pending -> Running -> {Completed | Failed}
 */
enum class VerificationStatus : uint8_t {
    Pending = 0,
    Running = 1,
    Completed = 2,
    Failed = 3
};

/**
 * @brief 不一致项类别
 */
enum class MismatchCategory : uint8_t {
    Style = 0,                 // 签名/字体/颜色/对齐
    DirectFormat = 1,
    TabStop = 2,
    MissingInDocument = 3,
    UnexpectedInDocument = 4
};

const char* toString(StyleType type) noexcept;
const char* toString(TextAlignment alignment) noexcept;
const char* toString(TabAlignment alignment) noexcept;
const char* toString(TabLeader leader) noexcept;
const char* toString(Severity severity) noexcept;
const char* toString(TemplateStatus status) noexcept;
const char* toString(VerificationStatus status) noexcept;
const char* toString(MismatchCategory category) noexcept;

// 解析函数均不区分大小写，并接受 WordprocessingML 的原始取值
// （如 jc="both"、tab leader="dot"）。无法识别时返回 std::nullopt。
std::optional<StyleType> parseStyleType(const std::string& text);
std::optional<TextAlignment> parseTextAlignment(const std::string& text);
std::optional<TabAlignment> parseTabAlignment(const std::string& text);
std::optional<TabLeader> parseTabLeader(const std::string& text);
std::optional<Severity> parseSeverity(const std::string& text);
std::optional<TemplateStatus> parseTemplateStatus(const std::string& text);

inline bool isTerminal(VerificationStatus status) noexcept {
    return status == VerificationStatus::Completed || status == VerificationStatus::Failed;
}

}} // namespace styleverify::core
