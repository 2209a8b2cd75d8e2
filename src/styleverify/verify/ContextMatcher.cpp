#include "styleverify/verify/ContextMatcher.hpp"
#include "styleverify/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <unordered_map>

namespace styleverify {
namespace verify {

ContextMatcher::ContextMatcher(std::vector<core::StyleType> ignored_types)
    : ignored_types_(std::move(ignored_types)) {
}

bool ContextMatcher::isIgnored(core::StyleType type) const {
    return std::find(ignored_types_.begin(), ignored_types_.end(), type) != ignored_types_.end();
}

MatchResult ContextMatcher::match(const std::vector<core::TextStyle>& template_styles,
                                  const core::DocumentContexts& document) const {
    MatchResult result;

    std::vector<const core::TextStyle*> ordered;
    ordered.reserve(template_styles.size());
    for (const auto& style : template_styles) {
        if (!isIgnored(style.style_type)) {
            ordered.push_back(&style);
        }
    }
    std::stable_sort(ordered.begin(), ordered.end(),
        [](const core::TextStyle* a, const core::TextStyle* b) { return a->id < b->id; });

    std::vector<bool> eligible(document.size(), false);
    std::vector<bool> claimed(document.size(), false);

    // 上下文键 -> 按文档顺序的候选下标
    std::unordered_map<std::string, std::vector<size_t>> by_key;
    for (size_t i = 0; i < document.size(); ++i) {
        if (isIgnored(document[i].style_type)) {
            continue;
        }
        eligible[i] = true;
        if (!document[i].contextKey().empty()) {
            by_key[document[i].contextKey()].push_back(i);
        }
    }

    // 每个模板样式的配对，-1 表示尚未配对
    std::vector<long> pairing(ordered.size(), -1);
    std::vector<MatchKind> kinds(ordered.size(), MatchKind::ContextKey);

    // 第一轮：精确上下文键
    for (size_t t = 0; t < ordered.size(); ++t) {
        const std::string& key = ordered[t]->contextKey();
        if (key.empty()) continue;
        auto it = by_key.find(key);
        if (it == by_key.end()) continue;
        for (size_t candidate : it->second) {
            if (!claimed[candidate]) {
                claimed[candidate] = true;
                pairing[t] = static_cast<long>(candidate);
                kinds[t] = MatchKind::ContextKey;
                break;
            }
        }
    }

    // 第二轮：元素类型 + 结构角色
    for (size_t t = 0; t < ordered.size(); ++t) {
        if (pairing[t] >= 0) continue;
        const auto& ctx = ordered[t]->formatting_context;
        if (ctx.element_type.empty() || ctx.structural_role.empty()) continue;
        for (size_t i = 0; i < document.size(); ++i) {
            if (!eligible[i] || claimed[i]) continue;
            const auto& doc_ctx = document[i].formatting_context;
            if (doc_ctx.element_type == ctx.element_type &&
                doc_ctx.structural_role == ctx.structural_role) {
                claimed[i] = true;
                pairing[t] = static_cast<long>(i);
                kinds[t] = MatchKind::StructuralRole;
                break;
            }
        }
    }

    for (size_t t = 0; t < ordered.size(); ++t) {
        if (pairing[t] < 0) {
            result.missing_in_document.push_back(ordered[t]);
            continue;
        }
        MatchedPair pair;
        pair.template_style = ordered[t];
        pair.document_index = static_cast<size_t>(pairing[t]);
        pair.document_style = &document[pair.document_index];
        pair.kind = kinds[t];
        result.matched.push_back(pair);
    }

    for (size_t i = 0; i < document.size(); ++i) {
        if (eligible[i] && !claimed[i]) {
            result.unexpected_in_document.push_back(&document[i]);
        }
    }

    VERIFY_DEBUG("Context matching: {} matched, {} missing, {} unexpected",
                 result.matched.size(), result.missing_in_document.size(),
                 result.unexpected_in_document.size());
    return result;
}

}} // namespace styleverify::verify
