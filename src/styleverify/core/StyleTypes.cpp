#include "styleverify/core/StyleTypes.hpp"
#include "styleverify/utils/StringUtils.hpp"

namespace styleverify {
namespace core {

using utils::StringUtils;

const char* toString(StyleType type) noexcept {
    switch (type) {
        case StyleType::Paragraph: return "paragraph";
        case StyleType::Character: return "character";
        case StyleType::Table:     return "table";
        case StyleType::Numbering: return "numbering";
        default:                   return "unknown";
    }
}

const char* toString(TextAlignment alignment) noexcept {
    switch (alignment) {
        case TextAlignment::Left:        return "left";
        case TextAlignment::Center:      return "center";
        case TextAlignment::Right:       return "right";
        case TextAlignment::Justify:     return "justify";
        case TextAlignment::Distributed: return "distributed";
        default:                         return "left";
    }
}

const char* toString(TabAlignment alignment) noexcept {
    switch (alignment) {
        case TabAlignment::Left:    return "left";
        case TabAlignment::Center:  return "center";
        case TabAlignment::Right:   return "right";
        case TabAlignment::Decimal: return "decimal";
        case TabAlignment::Bar:     return "bar";
        case TabAlignment::Clear:   return "clear";
        default:                    return "left";
    }
}

const char* toString(TabLeader leader) noexcept {
    switch (leader) {
        case TabLeader::None:       return "none";
        case TabLeader::Dot:        return "dot";
        case TabLeader::Hyphen:     return "hyphen";
        case TabLeader::Underscore: return "underscore";
        case TabLeader::Heavy:      return "heavy";
        case TabLeader::MiddleDot:  return "middleDot";
        default:                    return "none";
    }
}

const char* toString(Severity severity) noexcept {
    switch (severity) {
        case Severity::Low:    return "Low";
        case Severity::Medium: return "Medium";
        case Severity::High:   return "High";
        default:               return "Medium";
    }
}

const char* toString(TemplateStatus status) noexcept {
    switch (status) {
        case TemplateStatus::Active:   return "Active";
        case TemplateStatus::Inactive: return "Inactive";
        case TemplateStatus::Archived: return "Archived";
        default:                       return "Inactive";
    }
}

const char* toString(VerificationStatus status) noexcept {
    switch (status) {
        case VerificationStatus::Pending:   return "Pending";
        case VerificationStatus::Running:   return "Running";
        case VerificationStatus::Completed: return "Completed";
        case VerificationStatus::Failed:    return "Failed";
        default:                            return "Pending";
    }
}

const char* toString(MismatchCategory category) noexcept {
    switch (category) {
        case MismatchCategory::Style:                return "Style";
        case MismatchCategory::DirectFormat:         return "DirectFormat";
        case MismatchCategory::TabStop:              return "TabStop";
        case MismatchCategory::MissingInDocument:    return "MissingInDocument";
        case MismatchCategory::UnexpectedInDocument: return "UnexpectedInDocument";
        default:                                     return "Style";
    }
}

std::optional<StyleType> parseStyleType(const std::string& text) {
    std::string v = StringUtils::toLower(StringUtils::trim(text));
    if (v == "paragraph") return StyleType::Paragraph;
    if (v == "character") return StyleType::Character;
    if (v == "table") return StyleType::Table;
    if (v == "numbering" || v == "list") return StyleType::Numbering;
    return std::nullopt;
}

std::optional<TextAlignment> parseTextAlignment(const std::string& text) {
    std::string v = StringUtils::toLower(StringUtils::trim(text));
    if (v == "left" || v == "start") return TextAlignment::Left;
    if (v == "center" || v == "centre") return TextAlignment::Center;
    if (v == "right" || v == "end") return TextAlignment::Right;
    if (v == "both" || v == "justify" || v == "justified") return TextAlignment::Justify;
    if (v == "distribute" || v == "distributed") return TextAlignment::Distributed;
    return std::nullopt;
}

std::optional<TabAlignment> parseTabAlignment(const std::string& text) {
    std::string v = StringUtils::toLower(StringUtils::trim(text));
    if (v == "left" || v == "start") return TabAlignment::Left;
    if (v == "center") return TabAlignment::Center;
    if (v == "right" || v == "end") return TabAlignment::Right;
    if (v == "decimal") return TabAlignment::Decimal;
    if (v == "bar") return TabAlignment::Bar;
    if (v == "clear") return TabAlignment::Clear;
    return std::nullopt;
}

std::optional<TabLeader> parseTabLeader(const std::string& text) {
    std::string v = StringUtils::toLower(StringUtils::trim(text));
    if (v.empty() || v == "none") return TabLeader::None;
    if (v == "dot" || v == "dots") return TabLeader::Dot;
    if (v == "hyphen" || v == "dash" || v == "dashes") return TabLeader::Hyphen;
    if (v == "underscore" || v == "lines") return TabLeader::Underscore;
    if (v == "heavy") return TabLeader::Heavy;
    if (v == "middledot") return TabLeader::MiddleDot;
    return std::nullopt;
}

std::optional<Severity> parseSeverity(const std::string& text) {
    std::string v = StringUtils::toLower(StringUtils::trim(text));
    if (v == "low") return Severity::Low;
    if (v == "medium") return Severity::Medium;
    if (v == "high") return Severity::High;
    return std::nullopt;
}

std::optional<TemplateStatus> parseTemplateStatus(const std::string& text) {
    std::string v = StringUtils::toLower(StringUtils::trim(text));
    if (v == "active") return TemplateStatus::Active;
    if (v == "inactive") return TemplateStatus::Inactive;
    if (v == "archived") return TemplateStatus::Archived;
    return std::nullopt;
}

}} // namespace styleverify::core
