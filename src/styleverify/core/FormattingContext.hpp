#pragma once

#include <map>
#include <string>

namespace styleverify {
namespace core {

/**
 * @brief 结构上下文 - 样式在文档树中的位置
 *
 * 以值语义内嵌在 TextStyle 中。context_key 是模板与文档之间的匹配键。
 * 结构索引从0开始，-1 表示不适用。
 */
struct FormattingContext {
    std::string element_type;       // Paragraph / Run / TableCell ...
    std::string context_key;
    std::string structural_role;    // Heading1 / Body / Caption / ListItem ...
    std::string style_name;
    std::string parent_context;
    std::string sample_text;

    int section_index = -1;
    int table_index = -1;
    int row_index = -1;
    int cell_index = -1;
    int paragraph_index = -1;
    int run_index = -1;

    // 内容控件等扩展属性
    std::map<std::string, std::string> content_control_properties;

    /**
     * @brief 人类可读的位置，如 "Section 1, Table 2, Row 1, Cell 3, Paragraph 4"
     *
     * 没有任何结构索引时退化为 context_key（":" 替换为 " > "）。
     */
    std::string location() const;

    /**
     * @brief 结构角色是否为标题（以 "Heading" 开头，不区分大小写）
     */
    bool isHeading() const;
};

}} // namespace styleverify::core
