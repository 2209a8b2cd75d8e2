#include "styleverify/verify/DirectFormatComparator.hpp"
#include <map>

namespace styleverify {
namespace verify {

namespace {

const char* const kAbsent = "(absent)";

// context -> 该 context 下第一个模式
std::map<std::string, const core::DirectFormatPattern*> indexByContext(
    const std::vector<core::DirectFormatPattern>& patterns) {
    std::map<std::string, const core::DirectFormatPattern*> index;
    for (const auto& pattern : patterns) {
        index.emplace(pattern.context, &pattern);
    }
    return index;
}

} // anonymous namespace

DirectFormatComparator::DirectFormatComparator(bool report_unexpected)
    : report_unexpected_(report_unexpected) {
}

std::string DirectFormatComparator::describe(const core::StyleProperties& canonical) {
    if (canonical.empty()) {
        return "(none)";
    }
    std::string text;
    for (const auto& [key, value] : canonical) {
        if (!text.empty()) text.push_back(';');
        text += key;
        text.push_back('=');
        text += value;
    }
    return text;
}

std::vector<FieldMismatch> DirectFormatComparator::compare(const core::TextStyle& expected,
                                                           const core::TextStyle& actual) const {
    std::vector<FieldMismatch> mismatches;

    const auto expected_index = indexByContext(expected.direct_format_patterns);
    const auto actual_index = indexByContext(actual.direct_format_patterns);

    for (const auto& [context, pattern] : expected_index) {
        const core::StyleProperties wanted = pattern->properties.canonicalOverrides();
        auto it = actual_index.find(context);

        if (it == actual_index.end()) {
            mismatches.push_back({"DirectFormat:" + pattern->pattern_name,
                                  describe(wanted), kAbsent, context});
            continue;
        }

        const core::StyleProperties found = it->second->properties.canonicalOverrides();
        if (found != wanted) {
            mismatches.push_back({"DirectFormat:" + pattern->pattern_name,
                                  describe(wanted), describe(found), context});
        }
    }

    if (report_unexpected_) {
        for (const auto& [context, pattern] : actual_index) {
            if (expected_index.count(context) == 0) {
                mismatches.push_back({"UnexpectedDirectFormat:" + pattern->pattern_name,
                                      kAbsent, describe(pattern->properties.canonicalOverrides()), context});
            }
        }
    }

    return mismatches;
}

}} // namespace styleverify::verify
