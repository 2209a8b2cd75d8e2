#pragma once

#include "styleverify/core/StyleTypes.hpp"
#include <string>
#include <vector>

namespace styleverify {
namespace verify {

/**
 * @brief 严重程度策略表
 *
 * 缺省值：结构缺失/多余 = Medium；签名/字体/颜色/对齐 = High；
 * 制表位与直接格式 = Medium，结构角色匹配 escalated_role_prefixes
 * （不区分大小写的前缀，缺省 "Heading"）时升级为 escalated。
 */
struct SeverityPolicy {
    core::Severity structural = core::Severity::Medium;
    core::Severity signature = core::Severity::High;
    core::Severity tab_stop = core::Severity::Medium;
    core::Severity direct_format = core::Severity::Medium;

    std::vector<std::string> escalated_role_prefixes = {"Heading"};
    core::Severity escalated = core::Severity::High;

    /**
     * @brief 某类别在给定结构角色下的严重程度
     */
    core::Severity resolve(core::MismatchCategory category, const std::string& structural_role) const;

    bool isEscalatedRole(const std::string& structural_role) const;
};

}} // namespace styleverify::verify
