#include "styleverify/reader/WordPartParser.hpp"
#include "styleverify/core/Constants.hpp"

namespace styleverify {
namespace reader {

using core::Constants;
namespace Key = core::PropertyKey;

std::optional<double> WordPartParser::twipsToPoints(const std::vector<xml::XMLAttribute>& attributes,
                                                    std::string_view name) {
    auto twips = findDoubleAttribute(attributes, name);
    if (!twips) {
        return std::nullopt;
    }
    return *twips / Constants::kTwipsPerPoint;
}

bool WordPartParser::applyRunProperty(std::string_view element,
                                      const std::vector<xml::XMLAttribute>& attributes,
                                      core::StyleProperties& properties) {
    if (element == "rFonts") {
        for (const char* attr : {"ascii", "hAnsi", "eastAsia", "cs"}) {
            auto font = findAttribute(attributes, attr);
            if (font && !font->empty()) {
                properties.setFontFamily(*font);
                break;
            }
        }
        return true;
    }
    if (element == "sz") {
        auto half_points = findDoubleAttribute(attributes, "val");
        if (half_points) {
            properties.setFontSize(*half_points / Constants::kHalfPointsPerPoint);
        }
        return true;
    }
    if (element == "color") {
        auto color = findAttribute(attributes, "val");
        if (color) properties.setColor(*color);
        return true;
    }
    if (element == "highlight") {
        auto value = findAttribute(attributes, "val");
        if (value) properties.set(Key::Highlight, *value);
        return true;
    }
    if (element == "u") {
        properties.set(Key::Underline, findAttribute(attributes, "val").value_or("single"));
        return true;
    }
    if (element == "vertAlign") {
        auto value = findAttribute(attributes, "val");
        if (value) properties.set(Key::VerticalAlign, *value);
        return true;
    }
    if (element == "spacing") {
        auto spacing = twipsToPoints(attributes, "val");
        if (spacing) properties.setNumber(Key::CharacterSpacing, *spacing);
        return true;
    }
    if (element == "lang") {
        auto value = findAttribute(attributes, "val");
        if (value) properties.set(Key::Language, *value);
        return true;
    }

    // 开关属性
    const char* toggle_key = nullptr;
    if (element == "b") toggle_key = Key::Bold;
    else if (element == "i") toggle_key = Key::Italic;
    else if (element == "strike") toggle_key = Key::Strikethrough;
    else if (element == "dstrike") toggle_key = Key::DoubleStrike;
    else if (element == "caps") toggle_key = Key::AllCaps;
    else if (element == "smallCaps") toggle_key = Key::SmallCaps;
    else if (element == "vanish") toggle_key = Key::Hidden;

    if (toggle_key) {
        properties.setBool(toggle_key, toggleValue(attributes));
        return true;
    }
    return false;
}

bool WordPartParser::applyParagraphProperty(std::string_view element,
                                            const std::vector<xml::XMLAttribute>& attributes,
                                            core::StyleProperties& properties) {
    if (element == "jc") {
        auto value = findAttribute(attributes, "val");
        if (value) properties.setAlignment(*value);
        return true;
    }
    if (element == "spacing") {
        if (auto before = twipsToPoints(attributes, "before")) {
            properties.setNumber(Key::SpacingBefore, *before);
        }
        if (auto after = twipsToPoints(attributes, "after")) {
            properties.setNumber(Key::SpacingAfter, *after);
        }
        if (auto line = findDoubleAttribute(attributes, "line")) {
            const std::string rule = findAttribute(attributes, "lineRule").value_or("auto");
            // auto 为倍数，exact/atLeast 为固定磅值
            properties.setNumber(Key::LineSpacing,
                rule == "auto" ? *line / Constants::kLineSpacingAutoUnit
                               : *line / Constants::kTwipsPerPoint);
        }
        return true;
    }
    if (element == "ind") {
        auto left = twipsToPoints(attributes, "left");
        if (!left) left = twipsToPoints(attributes, "start");
        if (left) properties.setNumber(Key::IndentLeft, *left);

        auto right = twipsToPoints(attributes, "right");
        if (!right) right = twipsToPoints(attributes, "end");
        if (right) properties.setNumber(Key::IndentRight, *right);

        if (auto first = twipsToPoints(attributes, "firstLine")) {
            properties.setNumber(Key::FirstLineIndent, *first);
        } else if (auto hanging = twipsToPoints(attributes, "hanging")) {
            properties.setNumber(Key::FirstLineIndent, -*hanging);
        }
        return true;
    }
    if (element == "keepNext") {
        properties.setBool(Key::KeepWithNext, toggleValue(attributes));
        return true;
    }
    if (element == "keepLines") {
        properties.setBool(Key::KeepTogether, toggleValue(attributes));
        return true;
    }
    if (element == "outlineLvl") {
        auto value = findAttribute(attributes, "val");
        if (value) properties.set(Key::OutlineLevel, *value);
        return true;
    }
    return false;
}

std::optional<core::TabStop> WordPartParser::parseTabStop(const std::vector<xml::XMLAttribute>& attributes) {
    auto position = twipsToPoints(attributes, "pos");
    auto alignment = core::parseTabAlignment(findAttribute(attributes, "val").value_or("left"));
    if (!position || !alignment) {
        return std::nullopt;
    }
    auto leader = core::parseTabLeader(findAttribute(attributes, "leader").value_or("none"));
    return core::TabStop(*position, *alignment, leader.value_or(core::TabLeader::None));
}

}} // namespace styleverify::reader
