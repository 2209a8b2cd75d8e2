#include "styleverify/verify/VerificationEngine.hpp"
#include "styleverify/core/Exception.hpp"
#include "styleverify/verify/DirectFormatComparator.hpp"
#include "styleverify/verify/SignatureComparator.hpp"
#include "styleverify/verify/TabStopComparator.hpp"
#include "styleverify/utils/ModuleLoggers.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <exception>
#include <future>
#include <set>

namespace styleverify {
namespace verify {

namespace {

RawDiscrepancy structuralDiscrepancy(const core::TextStyle& style, core::MismatchCategory category) {
    const bool missing = category == core::MismatchCategory::MissingInDocument;
    RawDiscrepancy raw;
    raw.context_key = style.contextKey();
    raw.location = style.formatting_context.location();
    raw.structural_role = style.structuralRole();
    raw.sample_text = style.formatting_context.sample_text;
    raw.category = category;

    const std::string description = fmt::format("{} '{}'",
        style.formatting_context.element_type.empty() ? "style" : style.formatting_context.element_type,
        style.name);
    raw.fields.push_back({core::toString(category),
                          missing ? description : "(absent)",
                          missing ? "(absent)" : description,
                          ""});
    return raw;
}

} // anonymous namespace

VerificationEngine::VerificationEngine(VerificationOptions options)
    : options_(std::move(options))
    , signature_builder_()
    , matcher_(options_.ignore_style_types)
    , aggregator_(options_.severity_policy) {

    comparators_.push_back(std::make_unique<SignatureComparator>(signature_builder_, options_.tolerance()));
    comparators_.push_back(std::make_unique<DirectFormatComparator>(options_.report_unexpected_direct_formats));
    comparators_.push_back(std::make_unique<TabStopComparator>(options_.tolerance()));

    if (options_.parallel) {
        pool_ = std::make_unique<core::ThreadPool>(options_.worker_threads);
    }

    VERIFY_DEBUG("VerificationEngine created: strict={}, parallel={}, workers={}",
                 options_.strict_mode, options_.parallel, pool_ ? pool_->size() : 0);
}

VerificationEngine::~VerificationEngine() = default;

void VerificationEngine::addComparator(std::unique_ptr<IDimensionComparator> comparator) {
    if (!comparator) {
        throw core::ParameterException("comparator must not be null", "comparator", __FILE__, __LINE__);
    }
    comparators_.push_back(std::move(comparator));
}

core::VerificationResult VerificationEngine::verify(const core::Template& tmpl,
                                                    const core::DocumentContexts& document,
                                                    const CancellationToken& token) const {
    core::VerificationResult result;
    result.template_id = tmpl.id;
    result.template_version = tmpl.version;
    result.template_name = tmpl.name;
    verifyInto(result, tmpl, document, token);
    return result;
}

void VerificationEngine::verifyInto(core::VerificationResult& result,
                                    const core::Template& tmpl,
                                    const core::DocumentContexts& document,
                                    const CancellationToken& token) const {
    if (!tmpl.isActive()) {
        throw core::TemplateException(
            fmt::format("template is {}", core::toString(tmpl.status)),
            tmpl.name, core::ErrorCode::TemplateInactive, __FILE__, __LINE__);
    }

    result.start();
    VERIFY_INFO("Verifying '{}' against template '{}' v{} ({} styles, {} contexts)",
                result.document_name, tmpl.name, tmpl.version,
                tmpl.text_styles.size(), document.size());

    if (document.empty()) {
        VERIFY_WARN("Document '{}' produced no formatting contexts", result.document_name);
        result.fail(core::ErrorCode::ExtractionFailed, "document produced no formatting contexts");
        return;
    }

    if (token.isCancelled()) {
        result.fail(core::ErrorCode::Cancelled, "verification cancelled before matching");
        return;
    }

    const MatchResult matches = matcher_.match(tmpl.text_styles, document);
    collectSignatureWarnings(matches, result.warnings);

    // 汇合点：所有匹配对比较完成后才进入聚合
    std::vector<PairOutcome> outcomes = compareAll(matches.matched, token);

    if (token.isCancelled()) {
        VERIFY_WARN("Verification of '{}' cancelled", result.document_name);
        result.fail(core::ErrorCode::Cancelled, "verification cancelled");
        return;
    }

    std::vector<RawDiscrepancy> discrepancies;
    for (const auto* style : matches.missing_in_document) {
        discrepancies.push_back(structuralDiscrepancy(*style, core::MismatchCategory::MissingInDocument));
    }
    for (auto& outcome : outcomes) {
        for (auto& raw : outcome.discrepancies) {
            discrepancies.push_back(std::move(raw));
        }
    }
    for (const auto* style : matches.unexpected_in_document) {
        discrepancies.push_back(structuralDiscrepancy(*style, core::MismatchCategory::UnexpectedInDocument));
    }

    result.complete(aggregator_.aggregate(discrepancies, result.getVerificationDate()));

    VERIFY_INFO("Verification of '{}' completed: {} mismatches ({} pairs, {} missing, {} unexpected)",
                result.document_name, result.getTotalMismatches(), matches.matched.size(),
                matches.missing_in_document.size(), matches.unexpected_in_document.size());
}

std::vector<VerificationEngine::PairOutcome> VerificationEngine::compareAll(
    const std::vector<MatchedPair>& pairs, const CancellationToken& token) const {

    std::vector<PairOutcome> outcomes(pairs.size());

    if (!pool_ || pairs.size() < options_.parallel_threshold) {
        for (size_t i = 0; i < pairs.size(); ++i) {
            outcomes[i] = comparePair(pairs[i], token);
            if (outcomes[i].cancelled) break;
        }
        return outcomes;
    }

    std::vector<std::future<PairOutcome>> futures;
    futures.reserve(pairs.size());
    for (const auto& pair : pairs) {
        futures.push_back(pool_->enqueue([this, &pair, &token]() {
            return comparePair(pair, token);
        }));
    }

    // 必须等待全部任务结束后再抛出，任务持有对输入的引用
    std::exception_ptr first_failure;
    for (size_t i = 0; i < futures.size(); ++i) {
        try {
            outcomes[i] = futures[i].get();
        } catch (...) {
            if (!first_failure) {
                first_failure = std::current_exception();
            }
        }
    }
    if (first_failure) {
        std::rethrow_exception(first_failure);
    }
    return outcomes;
}

VerificationEngine::PairOutcome VerificationEngine::comparePair(const MatchedPair& pair,
                                                                const CancellationToken& token) const {
    PairOutcome outcome;
    if (token.isCancelled()) {
        outcome.cancelled = true;
        return outcome;
    }

    const core::TextStyle& expected = *pair.template_style;
    const core::TextStyle& actual = *pair.document_style;

    STYLEVERIFY_LOG_PAIR_DEBUG("Comparing '{}' with context '{}'", expected.name, actual.contextKey());

    for (const auto& comparator : comparators_) {
        std::vector<FieldMismatch> fields;
        try {
            fields = comparator->compare(expected, actual);
        } catch (const std::exception& e) {
            VERIFY_CRITICAL("Comparator {} failed on '{}' / '{}': {}",
                            comparator->name(), expected.name, actual.contextKey(), e.what());
            throw core::ComparatorException(
                fmt::format("comparator failed on context '{}': {}", actual.contextKey(), e.what()),
                comparator->name(), __FILE__, __LINE__);
        } catch (...) {
            VERIFY_CRITICAL("Comparator {} failed on '{}' / '{}' with a non-standard exception",
                            comparator->name(), expected.name, actual.contextKey());
            throw core::ComparatorException(
                fmt::format("comparator failed on context '{}': unknown exception", actual.contextKey()),
                comparator->name(), __FILE__, __LINE__);
        }
        if (fields.empty()) {
            continue;
        }

        // 同一比较器的差异按子位置分组，每组一条原始差异
        std::vector<std::string> scopes;
        for (const auto& field : fields) {
            if (std::find(scopes.begin(), scopes.end(), field.scope) == scopes.end()) {
                scopes.push_back(field.scope);
            }
        }
        for (const auto& scope : scopes) {
            RawDiscrepancy raw;
            raw.context_key = actual.contextKey();
            raw.location = actual.formatting_context.location();
            raw.structural_role = expected.structuralRole();
            raw.sample_text = actual.formatting_context.sample_text.empty()
                                  ? expected.formatting_context.sample_text
                                  : actual.formatting_context.sample_text;
            raw.category = comparator->category();
            for (const auto& field : fields) {
                if (field.scope == scope) {
                    raw.fields.push_back(field);
                }
            }
            outcome.discrepancies.push_back(std::move(raw));
        }
    }
    return outcome;
}

void VerificationEngine::collectSignatureWarnings(const MatchResult& matches,
                                                  std::vector<std::string>& warnings) const {
    std::set<const core::TextStyle*> reported;
    auto check = [&](const core::TextStyle* style, const char* side) {
        if (!reported.insert(style).second) return;
        if (signature_builder_.build(*style).truncated) {
            VERIFY_WARN("Signature truncated for {} style '{}' ({})", side, style->name, style->contextKey());
            warnings.push_back(fmt::format("{}: {} style '{}' at '{}'",
                core::errorCodeName(core::ErrorCode::SignatureTruncated),
                side, style->name, style->contextKey()));
        }
    };
    for (const auto& pair : matches.matched) {
        check(pair.template_style, "template");
        check(pair.document_style, "document");
    }
}

}} // namespace styleverify::verify
