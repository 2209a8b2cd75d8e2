#include "styleverify/verify/SignatureComparator.hpp"
#include "styleverify/utils/ModuleLoggers.hpp"
#include <cmath>
#include <set>

namespace styleverify {
namespace verify {

namespace {

const char* const kDefaultDisplay = "(default)";

} // anonymous namespace

SignatureComparator::SignatureComparator(const StyleSignatureBuilder& builder, double tolerance)
    : builder_(builder)
    , tolerance_(tolerance) {
}

bool SignatureComparator::numericallyEqual(const std::string& key,
                                           const std::optional<std::string>& expected,
                                           const std::optional<std::string>& actual) const {
    if (core::StyleProperties::kindOf(key) != core::PropertyKind::Number) {
        return false;
    }
    auto fallback = core::StyleProperties::numericDefault(key);
    auto a = expected ? core::StyleProperties::parseNumeric(*expected) : fallback;
    auto b = actual ? core::StyleProperties::parseNumeric(*actual) : fallback;
    if (!a || !b) {
        return false;
    }
    // 加一点余量，避免两位小数取整后恰好落在边界上
    return std::fabs(*a - *b) <= tolerance_ + 1e-9;
}

std::vector<FieldMismatch> SignatureComparator::compare(const core::TextStyle& expected,
                                                        const core::TextStyle& actual) const {
    std::vector<FieldMismatch> mismatches;

    const StyleSignature expected_signature = builder_.build(expected);
    const StyleSignature actual_signature = builder_.build(actual);
    if (expected_signature.value == actual_signature.value) {
        return mismatches;
    }

    // 签名包含直接格式，逐字段比较只看基础属性；直接格式的差异由 DirectFormatComparator 报告
    const core::StyleProperties lhs = StyleSignatureBuilder::baseProperties(expected).canonical();
    const core::StyleProperties rhs = StyleSignatureBuilder::baseProperties(actual).canonical();

    std::set<std::string> keys;
    for (const auto& entry : lhs) keys.insert(entry.first);
    for (const auto& entry : rhs) keys.insert(entry.first);

    for (const auto& key : keys) {
        auto a = lhs.get(key);
        auto b = rhs.get(key);
        if (a == b || numericallyEqual(key, a, b)) {
            continue;
        }
        FieldMismatch mismatch;
        mismatch.field = key;
        mismatch.expected = a.value_or(kDefaultDisplay);
        mismatch.actual = b.value_or(kDefaultDisplay);
        mismatches.push_back(std::move(mismatch));
    }

    STYLEVERIFY_LOG_PAIR_DEBUG("Signature differs for '{}': {} field(s)", expected.name, mismatches.size());
    return mismatches;
}

}} // namespace styleverify::verify
