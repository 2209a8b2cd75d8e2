#pragma once

#include "styleverify/core/StyleTypes.hpp"
#include "styleverify/core/TextStyle.hpp"
#include <cstddef>
#include <vector>

namespace styleverify {
namespace verify {

/**
 * @brief 匹配依据
 */
enum class MatchKind : uint8_t {
    ContextKey = 0,       // 上下文键完全相同
    StructuralRole = 1    // 元素类型 + 结构角色相同
};

/**
 * @brief 一对匹配上的模板样式与文档上下文
 *
 * 指针指向调用方持有的输入，生命周期不超过 match() 的输入。
 */
struct MatchedPair {
    const core::TextStyle* template_style = nullptr;
    const core::TextStyle* document_style = nullptr;
    MatchKind kind = MatchKind::ContextKey;
    size_t document_index = 0;
};

/**
 * @brief 匹配结果
 *
 * 每个参与匹配的模板样式恰好出现在 matched 或 missing_in_document 之一，
 * 每个参与匹配的文档上下文恰好出现在 matched 或 unexpected_in_document 之一。
 */
struct MatchResult {
    std::vector<MatchedPair> matched;                            // 按模板样式 id 升序
    std::vector<const core::TextStyle*> missing_in_document;     // 按模板样式 id 升序
    std::vector<const core::TextStyle*> unexpected_in_document;  // 按文档顺序
};

/**
 * @brief 上下文匹配器 - 贪心、稳定、确定性的一对一配对
 *
 * 1. 模板样式按 id 升序，依次认领上下文键完全相同、且尚未被认领的第一个文档上下文；
 * 2. 剩余模板样式再按 id 升序，认领元素类型与结构角色均相同的第一个未认领文档上下文。
 *
 * 精确键匹配先于角色匹配对所有模板样式完成，角色匹配不会抢走别的模板样式的精确匹配。
 * 平局按文档插入顺序打破。必须在扇出之前顺序执行。
 */
class ContextMatcher {
public:
    ContextMatcher() = default;
    explicit ContextMatcher(std::vector<core::StyleType> ignored_types);

    MatchResult match(const std::vector<core::TextStyle>& template_styles,
                      const core::DocumentContexts& document) const;

private:
    bool isIgnored(core::StyleType type) const;

    std::vector<core::StyleType> ignored_types_;
};

}} // namespace styleverify::verify
