#include "styleverify/repository/InMemoryTemplateRepository.hpp"
#include "styleverify/utils/ModuleLoggers.hpp"
#include <fmt/format.h>
#include <mutex>

namespace styleverify {
namespace repository {

using core::ErrorCode;
using core::makeError;

const core::Template* InMemoryTemplateRepository::findByNameLocked(const std::string& name) const {
    for (const auto& [id, tmpl] : templates_) {
        if (tmpl.name == name) {
            return &tmpl;
        }
    }
    return nullptr;
}

void InMemoryTemplateRepository::assignStyleIdsLocked(core::Template& tmpl) {
    for (auto& style : tmpl.text_styles) {
        if (style.id <= 0) {
            style.id = next_style_id_++;
        } else if (style.id >= next_style_id_) {
            next_style_id_ = style.id + 1;
        }
        style.template_id = tmpl.id;
    }
}

core::Result<int> InMemoryTemplateRepository::addTemplate(core::Template tmpl) {
    if (tmpl.name.empty()) {
        return makeError(ErrorCode::InvalidArgument, "template name must not be empty");
    }

    std::unique_lock lock(mutex_);

    if (findByNameLocked(tmpl.name)) {
        return makeError(ErrorCode::DuplicateTemplate,
                         fmt::format("template '{}' already exists", tmpl.name));
    }
    if (!tmpl.file_hash.empty()) {
        for (const auto& [id, existing] : templates_) {
            if (existing.file_hash == tmpl.file_hash) {
                return makeError(ErrorCode::DuplicateTemplate,
                                 fmt::format("file already registered as template '{}'", existing.name));
            }
        }
    }

    tmpl.id = next_template_id_++;
    assignStyleIdsLocked(tmpl);

    const int id = tmpl.id;
    REPO_INFO("Template '{}' added with id {} ({} styles)", tmpl.name, id, tmpl.text_styles.size());
    templates_.emplace(id, std::move(tmpl));
    return id;
}

core::VoidResult InMemoryTemplateRepository::updateTemplate(core::Template tmpl) {
    std::unique_lock lock(mutex_);

    auto it = templates_.find(tmpl.id);
    if (it == templates_.end()) {
        return makeError(ErrorCode::TemplateNotFound, fmt::format("template id {} not found", tmpl.id));
    }
    const core::Template* same_name = findByNameLocked(tmpl.name);
    if (same_name && same_name->id != tmpl.id) {
        return makeError(ErrorCode::DuplicateTemplate,
                         fmt::format("template '{}' already exists", tmpl.name));
    }

    assignStyleIdsLocked(tmpl);
    REPO_DEBUG("Template {} updated to version {}", tmpl.id, tmpl.version);
    it->second = std::move(tmpl);
    return {};
}

core::Result<core::Template> InMemoryTemplateRepository::getTemplate(int id) const {
    std::shared_lock lock(mutex_);
    auto it = templates_.find(id);
    if (it == templates_.end()) {
        return makeError(ErrorCode::TemplateNotFound, fmt::format("template id {} not found", id));
    }
    return it->second;
}

core::Result<core::Template> InMemoryTemplateRepository::findTemplateByName(const std::string& name) const {
    std::shared_lock lock(mutex_);
    const core::Template* tmpl = findByNameLocked(name);
    if (!tmpl) {
        return makeError(ErrorCode::TemplateNotFound, fmt::format("template '{}' not found", name));
    }
    return *tmpl;
}

core::Result<core::Template> InMemoryTemplateRepository::loadActiveTemplate(const std::string& name) const {
    std::shared_lock lock(mutex_);
    const core::Template* tmpl = findByNameLocked(name);
    if (!tmpl) {
        return makeError(ErrorCode::TemplateNotFound, fmt::format("template '{}' not found", name));
    }
    if (!tmpl->isActive()) {
        return makeError(ErrorCode::TemplateInactive,
                         fmt::format("template '{}' is {}", name, core::toString(tmpl->status)));
    }
    return *tmpl;
}

std::vector<TemplateInfo> InMemoryTemplateRepository::listTemplates() const {
    std::shared_lock lock(mutex_);
    std::vector<TemplateInfo> infos;
    infos.reserve(templates_.size());
    for (const auto& [id, tmpl] : templates_) {
        TemplateInfo info;
        info.id = id;
        info.name = tmpl.name;
        info.file_name = tmpl.file_name;
        info.status = tmpl.status;
        info.version = tmpl.version;
        info.style_count = tmpl.text_styles.size();
        infos.push_back(std::move(info));
    }
    return infos;
}

core::Result<TemplateStyleDetails> InMemoryTemplateRepository::getTemplateStyleDetails(
    int id, std::optional<core::StyleType> style_type) const {
    std::shared_lock lock(mutex_);
    auto it = templates_.find(id);
    if (it == templates_.end()) {
        return makeError(ErrorCode::TemplateNotFound, fmt::format("template id {} not found", id));
    }
    const core::Template& tmpl = it->second;

    TemplateStyleDetails details;
    details.template_id = tmpl.id;
    details.template_name = tmpl.name;
    details.version = tmpl.version;
    for (const auto& style : tmpl.text_styles) {
        if (!style_type || style.style_type == *style_type) {
            details.text_styles.push_back(style);
        }
    }
    for (const auto& style : tmpl.default_styles) {
        if (!style_type || style.type == *style_type) {
            details.default_styles.push_back(style);
        }
    }
    details.numbering_definitions = tmpl.numbering_definitions;
    return details;
}

core::VoidResult InMemoryTemplateRepository::setTemplateStatus(int id, core::TemplateStatus status,
                                                               const std::string& modified_by) {
    std::unique_lock lock(mutex_);
    auto it = templates_.find(id);
    if (it == templates_.end()) {
        return makeError(ErrorCode::TemplateNotFound, fmt::format("template id {} not found", id));
    }
    it->second.status = status;
    it->second.audit.touch(modified_by);
    REPO_INFO("Template {} status set to {}", id, core::toString(status));
    return {};
}

core::VoidResult InMemoryTemplateRepository::deleteTemplate(int id) {
    std::unique_lock lock(mutex_);
    auto it = templates_.find(id);
    if (it == templates_.end()) {
        return makeError(ErrorCode::TemplateNotFound, fmt::format("template id {} not found", id));
    }
    size_t references = 0;
    for (const auto& [result_id, result] : results_) {
        if (result.template_id == id) ++references;
    }
    if (references > 0) {
        REPO_WARN("Refusing to delete template {}: referenced by {} result(s)", id, references);
        return makeError(ErrorCode::TemplateInUse,
                         fmt::format("template '{}' is referenced by {} verification result(s)",
                                     it->second.name, references));
    }
    REPO_INFO("Template {} ('{}') deleted", id, it->second.name);
    templates_.erase(it);
    return {};
}

core::Result<int> InMemoryTemplateRepository::saveVerificationResult(core::VerificationResult result) {
    if (!result.isTerminal()) {
        return makeError(ErrorCode::InvalidStateTransition,
                         fmt::format("only terminal results can be saved (status {})",
                                     core::toString(result.getStatus())));
    }

    std::unique_lock lock(mutex_);
    if (templates_.count(result.template_id) == 0) {
        return makeError(ErrorCode::TemplateNotFound,
                         fmt::format("template id {} not found", result.template_id));
    }

    result.id = next_result_id_++;
    result.assignMismatchIds(next_mismatch_id_);
    next_mismatch_id_ += static_cast<int>(result.getTotalMismatches());

    const int id = result.id;
    REPO_DEBUG("Verification result {} saved ({}, {} mismatches)",
               id, core::toString(result.getStatus()), result.getTotalMismatches());
    results_.emplace(id, std::move(result));
    return id;
}

core::Result<core::VerificationResult> InMemoryTemplateRepository::getVerificationResult(int id) const {
    std::shared_lock lock(mutex_);
    auto it = results_.find(id);
    if (it == results_.end()) {
        return makeError(ErrorCode::ResultNotFound, fmt::format("verification result {} not found", id));
    }
    return it->second;
}

std::vector<core::VerificationResult> InMemoryTemplateRepository::listVerificationResults(
    const ResultFilter& filter) const {
    std::shared_lock lock(mutex_);
    std::vector<core::VerificationResult> selected;
    size_t skipped = 0;
    for (const auto& [id, result] : results_) {
        if (filter.template_id && result.template_id != *filter.template_id) continue;
        if (filter.status && result.getStatus() != *filter.status) continue;
        if (filter.document_name && result.document_name != *filter.document_name) continue;
        if (skipped < filter.offset) {
            ++skipped;
            continue;
        }
        selected.push_back(result);
        if (filter.limit > 0 && selected.size() >= filter.limit) break;
    }
    return selected;
}

core::VoidResult InMemoryTemplateRepository::deleteVerificationResult(int id) {
    std::unique_lock lock(mutex_);
    if (results_.erase(id) == 0) {
        return makeError(ErrorCode::ResultNotFound, fmt::format("verification result {} not found", id));
    }
    REPO_DEBUG("Verification result {} deleted", id);
    return {};
}

}} // namespace styleverify::repository
