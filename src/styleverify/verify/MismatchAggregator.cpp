#include "styleverify/verify/MismatchAggregator.hpp"
#include "styleverify/utils/ModuleLoggers.hpp"
#include "styleverify/utils/StringUtils.hpp"
#include <algorithm>
#include <map>
#include <string_view>
#include <utility>

namespace styleverify {
namespace verify {

namespace {

std::string renderValues(const std::vector<FieldMismatch>& fields, bool expected) {
    std::vector<std::string> parts;
    parts.reserve(fields.size());
    for (const auto& field : fields) {
        parts.push_back(field.field + "=" + (expected ? field.expected : field.actual));
    }
    return utils::StringUtils::join(parts, "; ");
}

const char* const kValueSeparator = " | ";

// 按 " | " 切分后整项比较，"color=FF" 不能被 "color=FF0000" 吞掉
bool containsValue(const std::string& target, const std::string& text) {
    const std::string_view separator(kValueSeparator);
    size_t start = 0;
    while (true) {
        const size_t end = target.find(separator, start);
        const std::string_view token = std::string_view(target).substr(
            start, end == std::string::npos ? std::string::npos : end - start);
        if (token == text) return true;
        if (end == std::string::npos) return false;
        start = end + separator.size();
    }
}

void appendDistinct(std::string& target, const std::string& text) {
    if (text.empty()) return;
    if (target.empty()) {
        target = text;
    } else if (!containsValue(target, text)) {
        target += kValueSeparator + text;
    }
}

} // anonymous namespace

MismatchAggregator::MismatchAggregator(SeverityPolicy policy)
    : policy_(std::move(policy)) {
}

std::vector<core::Mismatch> MismatchAggregator::aggregate(
    const std::vector<RawDiscrepancy>& discrepancies,
    utils::TimeUtils::TimePoint created_on) const {

    std::vector<core::Mismatch> mismatches;
    std::map<std::pair<std::string, std::string>, size_t> seen;

    for (const auto& raw : discrepancies) {
        if (raw.fields.empty()) {
            continue;
        }

        std::vector<FieldMismatch> sorted_fields = raw.fields;
        std::stable_sort(sorted_fields.begin(), sorted_fields.end(),
            [](const FieldMismatch& a, const FieldMismatch& b) { return a.field < b.field; });

        std::vector<std::string> names;
        std::string scope;
        for (const auto& field : sorted_fields) {
            if (names.empty() || names.back() != field.field) {
                names.push_back(field.field);
            }
            if (scope.empty() && !field.scope.empty()) {
                scope = field.scope;
            }
        }

        const core::Severity severity = policy_.resolve(raw.category, raw.structural_role);
        const std::string expected = renderValues(sorted_fields, true);
        const std::string actual = renderValues(sorted_fields, false);
        auto key = std::make_pair(raw.context_key, utils::StringUtils::join(names, ","));

        auto it = seen.find(key);
        if (it != seen.end()) {
            core::Mismatch& existing = mismatches[it->second];
            if (static_cast<int>(severity) > static_cast<int>(existing.severity)) {
                existing.severity = severity;
                existing.category = raw.category;
            }
            appendDistinct(existing.expected, expected);
            appendDistinct(existing.actual, actual);
            continue;
        }

        core::Mismatch mismatch;
        mismatch.context_key = raw.context_key;
        mismatch.location = scope.empty() ? raw.location : raw.location + " > " + scope;
        mismatch.structural_role = raw.structural_role;
        mismatch.category = raw.category;
        mismatch.fields = std::move(names);
        mismatch.expected = expected;
        mismatch.actual = actual;
        mismatch.sample_text = raw.sample_text;
        mismatch.severity = severity;
        mismatch.created_on = created_on;

        seen.emplace(std::move(key), mismatches.size());
        mismatches.push_back(std::move(mismatch));
    }

    std::stable_sort(mismatches.begin(), mismatches.end(),
        [](const core::Mismatch& a, const core::Mismatch& b) {
            if (a.severity != b.severity) {
                return static_cast<int>(a.severity) > static_cast<int>(b.severity);
            }
            if (a.context_key != b.context_key) {
                return a.context_key < b.context_key;
            }
            return a.fields < b.fields;
        });

    for (auto& mismatch : mismatches) {
        mismatch.recommended_action = core::recommendedActionFor(mismatch.severity);
    }

    VERIFY_DEBUG("Aggregated {} raw discrepancies into {} mismatches",
                 discrepancies.size(), mismatches.size());
    return mismatches;
}

bool MismatchAggregator::isOrdered(const std::vector<core::Mismatch>& mismatches) {
    for (size_t i = 1; i < mismatches.size(); ++i) {
        const auto& prev = mismatches[i - 1];
        const auto& cur = mismatches[i];
        if (static_cast<int>(prev.severity) < static_cast<int>(cur.severity)) {
            return false;
        }
        if (prev.severity == cur.severity && cur.context_key < prev.context_key) {
            return false;
        }
    }
    return true;
}

}} // namespace styleverify::verify
