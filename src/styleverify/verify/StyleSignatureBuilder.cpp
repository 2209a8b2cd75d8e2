#include "styleverify/verify/StyleSignatureBuilder.hpp"
#include "styleverify/core/Exception.hpp"
#include "styleverify/utils/StringUtils.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <vector>

namespace styleverify {
namespace verify {

namespace {

// "#" + 16 位十六进制摘要
constexpr size_t kDigestSuffixLength = 17;

} // anonymous namespace

StyleSignatureBuilder::StyleSignatureBuilder(size_t max_length)
    : max_length_(max_length) {
    if (max_length_ <= kDigestSuffixLength) {
        throw core::ParameterException(
            fmt::format("signature length {} leaves no room for the digest suffix", max_length),
            "max_length", __FILE__, __LINE__);
    }
}

StyleSignature StyleSignatureBuilder::build(const core::StyleProperties& properties) const {
    StyleSignature signature;
    std::string full = serialize(properties.canonical());

    if (full.size() <= max_length_) {
        signature.value = std::move(full);
        return signature;
    }

    const std::string suffix = fmt::format("#{:016x}", fnv1a(full));
    signature.value = utils::StringUtils::truncateUtf8(full, max_length_ - suffix.size());
    signature.value += suffix;
    signature.truncated = true;
    return signature;
}

StyleSignature StyleSignatureBuilder::build(const core::TextStyle& style) const {
    return build(effectiveProperties(style));
}

bool StyleSignatureBuilder::apply(core::TextStyle& style) const {
    StyleSignature signature = build(style);
    style.style_signature = std::move(signature.value);
    style.signature_truncated = signature.truncated;
    return signature.truncated;
}

core::StyleProperties StyleSignatureBuilder::baseProperties(const core::TextStyle& style) {
    core::StyleProperties base = style.properties;
    base.set(core::PropertyKey::StyleType, core::toString(style.style_type));
    return base;
}

core::StyleProperties StyleSignatureBuilder::effectiveProperties(const core::TextStyle& style) {
    core::StyleProperties effective = baseProperties(style);

    std::vector<const core::DirectFormatPattern*> patterns;
    patterns.reserve(style.direct_format_patterns.size());
    for (const auto& pattern : style.direct_format_patterns) {
        patterns.push_back(&pattern);
    }
    std::stable_sort(patterns.begin(), patterns.end(),
        [](const core::DirectFormatPattern* a, const core::DirectFormatPattern* b) {
            if (a->context != b->context) return a->context < b->context;
            return a->pattern_name < b->pattern_name;
        });

    for (const auto* pattern : patterns) {
        effective.mergeFrom(pattern->properties);
    }
    return effective;
}

std::string StyleSignatureBuilder::serialize(const core::StyleProperties& canonical) {
    std::string out;
    bool first = true;
    // StyleProperties 内部是有序映射，遍历即按键排序
    for (const auto& [key, value] : canonical) {
        if (!first) out.push_back(';');
        first = false;
        appendEscaped(out, key);
        out.push_back('=');
        appendEscaped(out, value);
    }
    return out;
}

uint64_t StyleSignatureBuilder::fnv1a(const std::string& text) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : text) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

void StyleSignatureBuilder::appendEscaped(std::string& out, const std::string& text) {
    for (char c : text) {
        if (c == '\\' || c == ';' || c == '=') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
}

}} // namespace styleverify::verify
