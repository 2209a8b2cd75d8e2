#pragma once

#include "styleverify/core/AuditInfo.hpp"
#include "styleverify/core/DefaultStyle.hpp"
#include "styleverify/core/NumberingDefinition.hpp"
#include "styleverify/core/StyleTypes.hpp"
#include "styleverify/core/TextStyle.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace styleverify {
namespace core {

/**
 * @brief 参考模板 - 校验基线
 *
 * 文件路径 + 文件哈希用于变更检测；哈希变化时版本号递增。
 * default_styles 与 numbering_definitions 是模板的样式目录，只供查询，不参与校验。
 */
struct Template {
    int id = 0;
    std::string name;
    std::string description;
    std::string file_name;
    std::string file_path;
    std::string file_hash;
    uint64_t file_size = 0;
    TemplateStatus status = TemplateStatus::Active;
    int version = 1;
    AuditInfo audit;

    std::vector<TextStyle> text_styles;
    std::vector<DefaultStyle> default_styles;
    std::vector<NumberingDefinition> numbering_definitions;

    bool isActive() const { return status == TemplateStatus::Active; }

    const TextStyle* findStyle(int style_id) const {
        for (const auto& style : text_styles) {
            if (style.id == style_id) return &style;
        }
        return nullptr;
    }
};

}} // namespace styleverify::core
