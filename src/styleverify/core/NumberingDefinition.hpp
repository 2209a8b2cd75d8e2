#pragma once

#include "styleverify/core/StyleProperties.hpp"
#include <optional>
#include <string>
#include <vector>

namespace styleverify {
namespace core {

/**
 * @brief 编号定义中的一个级别（w:lvl）
 *
 * 长度单位为磅。properties 合并了级别 rPr（编号符号的字符格式）
 * 与 pPr 中的缩进。
 */
struct NumberingLevel {
    int level = 0;                      // w:ilvl
    std::string number_format;          // w:numFmt，如 decimal / bullet
    std::string level_text;             // w:lvlText，如 "%1."
    std::string justification;          // w:lvlJc
    int start_value = 1;
    bool is_legal = false;              // w:isLgl

    StyleProperties properties;
    std::optional<double> indent_left;
    std::optional<double> indent_hanging;
    std::optional<double> tab_stop_position;    // pPr/tabs 中第一个制表位
};

/**
 * @brief 抽象编号定义（w:abstractNum）及引用它的第一个编号实例
 */
struct NumberingDefinition {
    int abstract_num_id = 0;
    int numbering_id = 0;               // 引用本定义的第一个 w:num，没有时为 0
    std::string name;
    std::string type;
    std::vector<NumberingLevel> levels; // 按 level 升序

    const NumberingLevel* findLevel(int level) const {
        for (const auto& entry : levels) {
            if (entry.level == level) return &entry;
        }
        return nullptr;
    }
};

/**
 * @brief 由首级别的 numFmt 得到编号类型
 *
 * bullet -> "Bullet"，decimal -> "Number"，其余格式首字母大写
 * （lowerRoman -> "LowerRoman"），没有级别或没有 numFmt 为 "Unknown"。
 */
std::string numberingTypeFor(const std::string& number_format);

/**
 * @brief 编号定义的显示名：w:name，其次 w:styleLink，否则 "Numbering_{id}"
 */
std::string numberingNameFor(const std::string& name, const std::string& style_link, int abstract_num_id);

}} // namespace styleverify::core
