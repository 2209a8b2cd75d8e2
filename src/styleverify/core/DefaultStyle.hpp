#pragma once

#include "styleverify/core/StyleProperties.hpp"
#include "styleverify/core/StyleTypes.hpp"
#include "styleverify/core/TabStop.hpp"
#include <string>
#include <vector>

namespace styleverify {
namespace core {

/**
 * @brief 模板 styles.xml 中声明的样式定义（样式目录条目）
 *
 * 与 TextStyle 不同，这里只记录样式本身声明的内容，不沿 basedOn 解析，
 * 也不参与校验比较，供模板样式明细查询使用。
 */
struct DefaultStyle {
    std::string style_id;
    std::string name;                   // 没有 w:name 时与 style_id 相同
    StyleType type = StyleType::Paragraph;
    std::string based_on;
    std::string next_style;
    bool is_default = false;
    bool is_custom = false;
    int priority = 0;                   // w:uiPriority，未声明为 0
    bool is_hidden = false;             // w:semiHidden 或 w:hidden
    bool is_quick_style = false;        // w:qFormat

    StyleProperties properties;
    std::vector<TabStop> tab_stops;
};

}} // namespace styleverify::core
