#include "styleverify/reader/WordNumberingParser.hpp"
#include <algorithm>
#include <cstdlib>

namespace styleverify {
namespace reader {

std::optional<int> WordNumberingParser::findIntAttribute(const std::vector<xml::XMLAttribute>& attributes,
                                                         std::string_view name) {
    auto value = findAttribute(attributes, name);
    if (!value || value->empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    long number = std::strtol(value->c_str(), &end, 10);
    if (*end != '\0') {
        return std::nullopt;
    }
    return static_cast<int>(number);
}

void WordNumberingParser::onReset() {
    definitions_.clear();
    instances_.clear();
    current_ = core::NumberingDefinition();
    current_style_link_.clear();
    current_level_ = core::NumberingLevel();
    in_abstract_num_ = false;
    in_level_ = false;
    current_num_id_.reset();
}

void WordNumberingParser::onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int /*depth*/) {
    if (name == "abstractNum") {
        in_abstract_num_ = true;
        current_ = core::NumberingDefinition();
        current_.abstract_num_id = findIntAttribute(attributes, "abstractNumId").value_or(-1);
        current_style_link_.clear();
        return;
    }
    if (name == "num" && !in_abstract_num_) {
        current_num_id_ = findIntAttribute(attributes, "numId");
        return;
    }

    if (current_num_id_) {
        // lvlOverride 不影响抽象定义
        if (name == "abstractNumId" && !isInElement("lvlOverride")) {
            if (auto abstract_id = findIntAttribute(attributes, "val")) {
                instances_[*current_num_id_] = *abstract_id;
            }
        }
        return;
    }

    if (!in_abstract_num_) {
        return;
    }

    if (name == "lvl") {
        in_level_ = true;
        current_level_ = core::NumberingLevel();
        current_level_.level = findIntAttribute(attributes, "ilvl").value_or(0);
        return;
    }
    if (in_level_) {
        handleLevelElement(name, attributes);
        return;
    }

    if (name == "name") {
        current_.name = findAttribute(attributes, "val").value_or("");
    } else if (name == "styleLink") {
        current_style_link_ = findAttribute(attributes, "val").value_or("");
    }
}

void WordNumberingParser::handleLevelElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes) {
    if (name == "start") {
        current_level_.start_value = findIntAttribute(attributes, "val").value_or(1);
    } else if (name == "numFmt") {
        current_level_.number_format = findAttribute(attributes, "val").value_or("");
    } else if (name == "lvlText") {
        current_level_.level_text = findAttribute(attributes, "val").value_or("");
    } else if (name == "lvlJc") {
        current_level_.justification = findAttribute(attributes, "val").value_or("");
    } else if (name == "isLgl") {
        current_level_.is_legal = toggleValue(attributes);
    } else if (name == "tab" && isInElement("tabs")) {
        if (!current_level_.tab_stop_position) {
            current_level_.tab_stop_position = twipsToPoints(attributes, "pos");
        }
    } else if (isInElement("rPr")) {
        applyRunProperty(name, attributes, current_level_.properties);
    } else if (isInElement("pPr")) {
        if (name == "ind") {
            current_level_.indent_left = twipsToPoints(attributes, "left");
            if (!current_level_.indent_left) {
                current_level_.indent_left = twipsToPoints(attributes, "start");
            }
            current_level_.indent_hanging = twipsToPoints(attributes, "hanging");
        }
        applyParagraphProperty(name, attributes, current_level_.properties);
    }
}

void WordNumberingParser::onEndElement(std::string_view name, int /*depth*/) {
    if (name == "lvl" && in_level_) {
        in_level_ = false;
        current_.levels.push_back(std::move(current_level_));
        current_level_ = core::NumberingLevel();
    } else if (name == "abstractNum" && in_abstract_num_) {
        in_abstract_num_ = false;
        if (current_.abstract_num_id < 0) {
            READER_WARN("Skipping w:abstractNum without abstractNumId");
            return;
        }
        current_.type = core::numberingTypeFor(current_.levels.empty() ? "" : current_.levels.front().number_format);
        current_.name = core::numberingNameFor(current_.name, current_style_link_, current_.abstract_num_id);
        std::stable_sort(current_.levels.begin(), current_.levels.end(),
            [](const core::NumberingLevel& a, const core::NumberingLevel& b) { return a.level < b.level; });
        STYLEVERIFY_LOG_SAX_DEBUG("Numbering definition {} '{}' ({}, {} levels)",
                                  current_.abstract_num_id, current_.name, current_.type, current_.levels.size());
        definitions_[current_.abstract_num_id] = std::move(current_);
        current_ = core::NumberingDefinition();
    } else if (name == "num" && current_num_id_) {
        current_num_id_.reset();
    }
}

std::optional<int> WordNumberingParser::abstractNumFor(int num_id) const {
    auto it = instances_.find(num_id);
    if (it == instances_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<core::NumberingDefinition> WordNumberingParser::getDefinitions() const {
    std::vector<core::NumberingDefinition> definitions;
    definitions.reserve(definitions_.size());
    for (const auto& [abstract_id, definition] : definitions_) {
        definitions.push_back(definition);
        for (const auto& [num_id, referenced] : instances_) {
            if (referenced == abstract_id) {
                definitions.back().numbering_id = num_id;
                break;
            }
        }
    }
    return definitions;
}

}} // namespace styleverify::reader
