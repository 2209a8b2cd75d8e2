#include "styleverify/reader/WordStylesParser.hpp"
#include <algorithm>
#include <cmath>
#include <set>

namespace styleverify {
namespace reader {

void mergeTabStops(std::vector<core::TabStop>& base, const std::vector<core::TabStop>& overrides) {
    for (const auto& tab : overrides) {
        base.erase(std::remove_if(base.begin(), base.end(),
                       [&tab](const core::TabStop& existing) {
                           return std::fabs(existing.position - tab.position) < 0.01;
                       }),
                   base.end());
        if (tab.alignment != core::TabAlignment::Clear) {
            base.push_back(tab);
        }
    }
    std::stable_sort(base.begin(), base.end(),
        [](const core::TabStop& a, const core::TabStop& b) { return a.position < b.position; });
}

void WordStylesParser::onReset() {
    styles_.clear();
    style_order_.clear();
    doc_defaults_.clear();
    current_ = WordStyleDefinition();
    in_style_ = false;
    in_doc_defaults_ = false;
}

void WordStylesParser::onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int /*depth*/) {
    if (name == "docDefaults") {
        in_doc_defaults_ = true;
        return;
    }
    if (name == "style") {
        in_style_ = true;
        current_ = WordStyleDefinition();
        current_.style_id = findAttribute(attributes, "styleId").value_or("");
        current_.type = core::parseStyleType(findAttribute(attributes, "type").value_or("paragraph"))
                            .value_or(core::StyleType::Unknown);
        const std::string is_default = findAttribute(attributes, "default").value_or("0");
        current_.is_default = is_default == "1" || is_default == "true";
        const std::string is_custom = findAttribute(attributes, "customStyle").value_or("0");
        current_.is_custom = is_custom == "1" || is_custom == "true";
        return;
    }

    if (in_doc_defaults_) {
        if (isInElement("rPr")) {
            applyRunProperty(name, attributes, doc_defaults_);
        } else if (isInElement("pPr")) {
            applyParagraphProperty(name, attributes, doc_defaults_);
        }
        return;
    }

    if (!in_style_) {
        return;
    }

    if (name == "name") {
        current_.name = findAttribute(attributes, "val").value_or("");
    } else if (name == "basedOn") {
        current_.based_on = findAttribute(attributes, "val").value_or("");
    } else if (name == "next") {
        current_.next_style = findAttribute(attributes, "val").value_or("");
    } else if (name == "uiPriority") {
        if (auto priority = findDoubleAttribute(attributes, "val")) {
            current_.priority = static_cast<int>(*priority);
        }
    } else if ((name == "semiHidden" || name == "hidden") && !isInElement("rPr")) {
        current_.is_hidden = current_.is_hidden || toggleValue(attributes);
    } else if (name == "qFormat") {
        current_.is_quick_style = toggleValue(attributes);
    } else if (name == "tab" && isInElement("tabs")) {
        if (auto tab = parseTabStop(attributes)) {
            current_.tab_stops.push_back(*tab);
        }
    } else if (isInElement("rPr")) {
        applyRunProperty(name, attributes, current_.properties);
    } else if (isInElement("pPr")) {
        applyParagraphProperty(name, attributes, current_.properties);
    }
}

void WordStylesParser::onEndElement(std::string_view name, int /*depth*/) {
    if (name == "docDefaults") {
        in_doc_defaults_ = false;
    } else if (name == "style" && in_style_) {
        in_style_ = false;
        if (!current_.style_id.empty()) {
            STYLEVERIFY_LOG_SAX_DEBUG("Style '{}' ({}) with {} properties",
                                      current_.style_id, current_.name, current_.properties.size());
            if (styles_.count(current_.style_id) == 0) {
                style_order_.push_back(current_.style_id);
            }
            styles_[current_.style_id] = std::move(current_);
        }
        current_ = WordStyleDefinition();
    }
}

const WordStyleDefinition* WordStylesParser::findStyle(const std::string& style_id) const {
    auto it = styles_.find(style_id);
    return it == styles_.end() ? nullptr : &it->second;
}

std::string WordStylesParser::defaultParagraphStyleId() const {
    for (const auto& [id, style] : styles_) {
        if (style.is_default && style.type == core::StyleType::Paragraph) {
            return id;
        }
    }
    return "Normal";
}

std::vector<const WordStyleDefinition*> WordStylesParser::inheritanceChain(const std::string& style_id) const {
    std::vector<const WordStyleDefinition*> chain;
    std::set<std::string> visited;
    std::string current = style_id;
    while (!current.empty() && visited.insert(current).second) {
        const WordStyleDefinition* style = findStyle(current);
        if (!style) break;
        chain.push_back(style);
        current = style->based_on;
    }
    std::reverse(chain.begin(), chain.end());
    return chain;
}

core::StyleProperties WordStylesParser::resolveProperties(const std::string& style_id,
                                                          bool include_doc_defaults) const {
    core::StyleProperties properties;
    if (include_doc_defaults) {
        properties = doc_defaults_;
    }
    for (const auto* style : inheritanceChain(style_id)) {
        properties.mergeFrom(style->properties);
    }
    return properties;
}

std::vector<core::TabStop> WordStylesParser::resolveTabStops(const std::string& style_id) const {
    std::vector<core::TabStop> tabs;
    for (const auto* style : inheritanceChain(style_id)) {
        mergeTabStops(tabs, style->tab_stops);
    }
    return tabs;
}

std::string WordStylesParser::displayName(const std::string& style_id) const {
    const WordStyleDefinition* style = findStyle(style_id);
    return style && !style->name.empty() ? style->name : style_id;
}

}} // namespace styleverify::reader
