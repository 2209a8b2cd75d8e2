#pragma once

#include "styleverify/core/Template.hpp"
#include "styleverify/core/TextStyle.hpp"
#include <string>
#include <utility>

namespace styleverify {
namespace test {

// 构造一个带格式上下文的段落样式
inline core::TextStyle makeContext(int id,
                                   const std::string& name,
                                   const std::string& context_key,
                                   const std::string& role = "Body",
                                   core::StyleProperties properties = {}) {
    core::TextStyle style;
    style.id = id;
    style.name = name;
    style.style_type = core::StyleType::Paragraph;
    style.properties = std::move(properties);
    style.formatting_context.element_type = "Paragraph";
    style.formatting_context.context_key = context_key;
    style.formatting_context.structural_role = role;
    style.formatting_context.style_name = name;
    style.formatting_context.sample_text = "Sample " + context_key;
    return style;
}

inline core::Template makeTemplate(const std::string& name, std::vector<core::TextStyle> styles) {
    core::Template tmpl;
    tmpl.id = 1;
    tmpl.name = name;
    tmpl.file_name = name + ".docx";
    tmpl.status = core::TemplateStatus::Active;
    tmpl.version = 1;
    tmpl.text_styles = std::move(styles);
    return tmpl;
}

}} // namespace styleverify::test
