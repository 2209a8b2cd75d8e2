#include "styleverify/core/StyleProperties.hpp"
#include "styleverify/core/Color.hpp"
#include "styleverify/core/StyleTypes.hpp"
#include "styleverify/utils/StringUtils.hpp"
#include <fmt/format.h>
#include <cmath>
#include <cstdlib>
#include <unordered_map>
#include <unordered_set>

namespace styleverify {
namespace core {

using utils::StringUtils;

namespace {

struct KeyTraits {
    PropertyKind kind;
    std::unordered_set<std::string> defaults;   // 规范化后视为缺省的取值
};

const std::unordered_map<std::string, KeyTraits>& keyTable() {
    static const std::unordered_map<std::string, KeyTraits> table = {
        {PropertyKey::FontFamily,       {PropertyKind::Caseless, {}}},
        {PropertyKey::FontSize,         {PropertyKind::Number, {"0"}}},
        {PropertyKey::Color,            {PropertyKind::ColorValue, {"000000"}}},
        {PropertyKey::Highlight,        {PropertyKind::Caseless, {"none"}}},
        {PropertyKey::Bold,             {PropertyKind::Boolean, {}}},
        {PropertyKey::Italic,           {PropertyKind::Boolean, {}}},
        {PropertyKey::Underline,        {PropertyKind::Caseless, {"none", "false", "0"}}},
        {PropertyKey::Strikethrough,    {PropertyKind::Boolean, {}}},
        {PropertyKey::DoubleStrike,     {PropertyKind::Boolean, {}}},
        {PropertyKey::AllCaps,          {PropertyKind::Boolean, {}}},
        {PropertyKey::SmallCaps,        {PropertyKind::Boolean, {}}},
        {PropertyKey::Hidden,           {PropertyKind::Boolean, {}}},
        {PropertyKey::VerticalAlign,    {PropertyKind::Caseless, {"baseline"}}},
        {PropertyKey::CharacterSpacing, {PropertyKind::Number, {"0"}}},
        {PropertyKey::Language,         {PropertyKind::Caseless, {}}},
        {PropertyKey::Alignment,        {PropertyKind::AlignmentValue, {"left"}}},
        {PropertyKey::SpacingBefore,    {PropertyKind::Number, {"0"}}},
        {PropertyKey::SpacingAfter,     {PropertyKind::Number, {"0"}}},
        {PropertyKey::LineSpacing,      {PropertyKind::Number, {"1"}}},
        {PropertyKey::IndentLeft,       {PropertyKind::Number, {"0"}}},
        {PropertyKey::IndentRight,      {PropertyKind::Number, {"0"}}},
        {PropertyKey::FirstLineIndent,  {PropertyKind::Number, {"0"}}},
        {PropertyKey::KeepWithNext,     {PropertyKind::Boolean, {}}},
        {PropertyKey::KeepTogether,     {PropertyKind::Boolean, {}}},
        {PropertyKey::OutlineLevel,     {PropertyKind::Text, {}}},
        {PropertyKey::StyleType,        {PropertyKind::Caseless, {}}},
    };
    return table;
}

std::optional<double> parseNumber(const std::string& text) {
    std::string trimmed = StringUtils::trim(text);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    // 容忍 "12pt" 这类带单位的写法
    if (trimmed.size() > 2 && StringUtils::toLower(trimmed.substr(trimmed.size() - 2)) == "pt") {
        trimmed = StringUtils::trim(trimmed.substr(0, trimmed.size() - 2));
    }
    char* end = nullptr;
    double value = std::strtod(trimmed.c_str(), &end);
    if (end == trimmed.c_str() || *end != '\0' || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::optional<bool> parseBool(const std::string& text) {
    std::string v = StringUtils::toLower(StringUtils::trim(text));
    if (v == "1" || v == "true" || v == "on" || v == "yes") return true;
    if (v.empty() || v == "0" || v == "false" || v == "off" || v == "no" || v == "none") return false;
    return std::nullopt;
}

} // anonymous namespace

void StyleProperties::setNumber(const std::string& key, double value) {
    values_[key] = formatNumber(value);
}

std::optional<std::string> StyleProperties::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string StyleProperties::getOr(const std::string& key, const std::string& default_value) const {
    auto it = values_.find(key);
    return it == values_.end() ? default_value : it->second;
}

std::optional<double> StyleProperties::getNumber(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return parseNumber(it->second);
}

bool StyleProperties::getBool(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return false;
    }
    return parseBool(it->second).value_or(false);
}

void StyleProperties::mergeFrom(const StyleProperties& overrides) {
    for (const auto& [key, value] : overrides.values_) {
        values_[key] = value;
    }
}

PropertyKind StyleProperties::kindOf(const std::string& key) {
    const auto& table = keyTable();
    auto it = table.find(key);
    return it == table.end() ? PropertyKind::Text : it->second.kind;
}

std::optional<double> StyleProperties::numericDefault(const std::string& key) {
    const auto& table = keyTable();
    auto it = table.find(key);
    if (it == table.end() || it->second.kind != PropertyKind::Number || it->second.defaults.empty()) {
        return std::nullopt;
    }
    return parseNumber(*it->second.defaults.begin());
}

std::optional<double> StyleProperties::parseNumeric(const std::string& text) {
    return parseNumber(text);
}

std::string StyleProperties::formatNumber(double value) {
    double rounded = std::round(value * 100.0) / 100.0;
    if (rounded == 0.0) {
        return "0";  // 避免 "-0"
    }
    std::string text = fmt::format("{:.2f}", rounded);
    while (!text.empty() && text.back() == '0') {
        text.pop_back();
    }
    if (!text.empty() && text.back() == '.') {
        text.pop_back();
    }
    return text;
}

std::optional<std::string> StyleProperties::canonicalValue(const std::string& key, const std::string& raw) {
    const auto& table = keyTable();
    auto it = table.find(key);
    const PropertyKind kind = it == table.end() ? PropertyKind::Text : it->second.kind;

    std::string value;
    switch (kind) {
        case PropertyKind::Text:
            value = StringUtils::trim(raw);
            break;
        case PropertyKind::Caseless:
            value = StringUtils::toLower(StringUtils::trim(raw));
            break;
        case PropertyKind::Number: {
            auto number = parseNumber(raw);
            value = number ? formatNumber(*number) : StringUtils::trim(raw);
            break;
        }
        case PropertyKind::Boolean: {
            auto flag = parseBool(raw);
            if (!flag) {
                value = StringUtils::toLower(StringUtils::trim(raw));
            } else if (!*flag) {
                return std::nullopt;
            } else {
                value = "1";
            }
            break;
        }
        case PropertyKind::ColorValue: {
            auto color = Color::parse(raw);
            if (color) {
                value = color->toHex();
            } else {
                value = StringUtils::toUpper(StringUtils::trim(raw));
            }
            break;
        }
        case PropertyKind::AlignmentValue: {
            auto alignment = parseTextAlignment(raw);
            value = alignment ? toString(*alignment) : StringUtils::toLower(StringUtils::trim(raw));
            break;
        }
    }

    if (value.empty()) {
        return std::nullopt;
    }
    if (it != table.end() && it->second.defaults.count(value)) {
        return std::nullopt;
    }
    return value;
}

StyleProperties StyleProperties::canonical() const {
    StyleProperties result;
    for (const auto& [key, raw] : values_) {
        auto value = canonicalValue(key, raw);
        if (value) {
            result.values_.emplace(key, std::move(*value));
        }
    }
    return result;
}

StyleProperties StyleProperties::canonicalOverrides() const {
    StyleProperties result;
    for (const auto& [key, raw] : values_) {
        auto value = canonicalValue(key, raw);
        result.values_.emplace(key, value ? std::move(*value) : std::string(kExplicitDefault));
    }
    return result;
}

}} // namespace styleverify::core
