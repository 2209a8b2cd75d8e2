#pragma once

#include "styleverify/core/AuditInfo.hpp"
#include "styleverify/core/DirectFormatPattern.hpp"
#include "styleverify/core/FormattingContext.hpp"
#include "styleverify/core/StyleProperties.hpp"
#include "styleverify/core/StyleTypes.hpp"
#include "styleverify/core/TabStop.hpp"
#include <string>
#include <vector>

namespace styleverify {
namespace core {

/**
 * @brief 文本样式 - 一条格式规则及其适用的结构上下文
 *
 * 模板侧与文档侧使用同一类型：文档抽取器为每个结构位置产出一条
 * TextStyle（有效属性 + 直接格式 + 制表位 + 上下文）。
 */
struct TextStyle {
    int id = 0;
    int template_id = 0;
    std::string name;
    StyleType style_type = StyleType::Paragraph;
    std::string based_on;

    StyleProperties properties;
    std::vector<DirectFormatPattern> direct_format_patterns;
    std::vector<TabStop> tab_stops;
    FormattingContext formatting_context;

    // 由 StyleSignatureBuilder 派生
    std::string style_signature;
    bool signature_truncated = false;

    int version = 1;
    AuditInfo audit;

    const std::string& contextKey() const { return formatting_context.context_key; }
    const std::string& structuralRole() const { return formatting_context.structural_role; }
};

/**
 * @brief 文档侧抽取结果，按文档顺序排列
 */
using DocumentContexts = std::vector<TextStyle>;

}} // namespace styleverify::core
