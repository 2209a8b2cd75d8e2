#include "styleverify/service/VerificationService.hpp"
#include "styleverify/core/Exception.hpp"
#include "styleverify/utils/ModuleLoggers.hpp"

namespace styleverify {
namespace service {

using core::ErrorCode;

VerificationService::VerificationService(std::shared_ptr<repository::ITemplateRepository> repository,
                                         std::shared_ptr<reader::IContextExtractor> extractor,
                                         verify::VerificationOptions options)
    : repository_(std::move(repository))
    , extractor_(std::move(extractor))
    , engine_(std::move(options)) {
    if (!repository_) {
        throw core::ParameterException("repository must not be null", "repository", __FILE__, __LINE__);
    }
    if (!extractor_) {
        throw core::ParameterException("extractor must not be null", "extractor", __FILE__, __LINE__);
    }
}

core::Result<core::VerificationResult> VerificationService::verify(
    const std::string& template_name,
    const std::string& document_name,
    const std::vector<uint8_t>& document_bytes,
    const std::string& created_by,
    const verify::CancellationToken& token) {

    auto tmpl = repository_->loadActiveTemplate(template_name);
    if (!tmpl) {
        SERVICE_WARN("Cannot verify '{}': {}", document_name, tmpl.error().fullMessage());
        return tmpl.error();
    }

    core::VerificationResult result;
    result.template_id = tmpl->id;
    result.template_version = tmpl->version;
    result.template_name = tmpl->name;
    result.document_name = document_name;
    result.audit.created_by = created_by;
    result.audit.modified_by = created_by;

    auto contexts = extractor_->extractContexts(document_bytes, document_name);
    if (!contexts) {
        SERVICE_ERROR("Extraction failed for '{}': {}", document_name, contexts.error().fullMessage());
        result.start();
        result.fail(ErrorCode::ExtractionFailed, contexts.error().message);
        return persist(std::move(result));
    }

    try {
        engine_.verifyInto(result, *tmpl, *contexts, token);
    } catch (const core::ComparatorException& e) {
        SERVICE_CRITICAL("Verification of '{}' against '{}' aborted: {}",
                         document_name, template_name, e.what());
        throw;
    }

    SERVICE_INFO("Verified '{}' against '{}' v{}: {} ({} mismatches)",
                 document_name, template_name, tmpl->version,
                 core::toString(result.getStatus()), result.getTotalMismatches());
    return persist(std::move(result));
}

core::Result<core::VerificationResult> VerificationService::persist(core::VerificationResult result) {
    auto id = repository_->saveVerificationResult(std::move(result));
    if (!id) {
        SERVICE_ERROR("Failed to save verification result: {}", id.error().fullMessage());
        return id.error();
    }
    return repository_->getVerificationResult(*id);
}

core::Result<core::VerificationResult> VerificationService::getVerificationResult(int id) const {
    return repository_->getVerificationResult(id);
}

std::vector<core::VerificationResult> VerificationService::listResults(const repository::ResultFilter& filter) const {
    return repository_->listVerificationResults(filter);
}

core::VoidResult VerificationService::deleteResult(int id) {
    auto deleted = repository_->deleteVerificationResult(id);
    if (deleted) {
        SERVICE_DEBUG("Deleted verification result {}", id);
    }
    return deleted;
}

VerificationSummary VerificationService::summarize(std::optional<int> template_id) const {
    repository::ResultFilter filter;
    filter.template_id = template_id;

    VerificationSummary summary;
    for (const auto& result : repository_->listVerificationResults(filter)) {
        ++summary.total_results;
        ++summary.by_status[result.getStatus()];
        for (const auto& mismatch : result.getMismatches()) {
            ++summary.total_mismatches;
            ++summary.by_severity[mismatch.severity];
        }
    }
    return summary;
}

}} // namespace styleverify::service
