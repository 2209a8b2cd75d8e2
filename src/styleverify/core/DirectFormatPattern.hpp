#pragma once

#include "styleverify/core/StyleProperties.hpp"
#include <string>

namespace styleverify {
namespace core {

/**
 * @brief 直接格式模式 - 样式之上的内联覆盖
 *
 * context 是观察到该覆盖的结构位置（相对于所属段落，如 "Run:2"），
 * 模板与文档之间按 context 对齐比较。
 */
struct DirectFormatPattern {
    std::string pattern_name;
    std::string context;
    StyleProperties properties;
    std::string sample_text;
    int occurrence_count = 1;
};

}} // namespace styleverify::core
