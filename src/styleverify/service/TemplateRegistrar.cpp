#include "styleverify/service/TemplateRegistrar.hpp"
#include "styleverify/core/Exception.hpp"
#include "styleverify/utils/ModuleLoggers.hpp"
#include "styleverify/utils/TimeUtils.hpp"
#include <fmt/format.h>
#include <zlib.h>
#include <algorithm>
#include <limits>

namespace styleverify {
namespace service {

using core::ErrorCode;
using core::makeError;

TemplateRegistrar::TemplateRegistrar(std::shared_ptr<repository::ITemplateRepository> repository,
                                     std::shared_ptr<reader::IContextExtractor> extractor)
    : repository_(std::move(repository))
    , extractor_(std::move(extractor)) {
    if (!repository_) {
        throw core::ParameterException("repository must not be null", "repository", __FILE__, __LINE__);
    }
    if (!extractor_) {
        throw core::ParameterException("extractor must not be null", "extractor", __FILE__, __LINE__);
    }
}

std::string TemplateRegistrar::computeFileHash(const std::vector<uint8_t>& file_bytes) {
    uLong crc = crc32(0L, Z_NULL, 0);
    size_t offset = 0;
    // crc32 的长度参数是 uInt，大文件分块计算
    while (offset < file_bytes.size()) {
        size_t chunk = std::min<size_t>(file_bytes.size() - offset, std::numeric_limits<uInt>::max());
        crc = crc32(crc, file_bytes.data() + offset, static_cast<uInt>(chunk));
        offset += chunk;
    }
    return fmt::format("{:08x}", static_cast<uint32_t>(crc));
}

core::Result<std::vector<core::TextStyle>> TemplateRegistrar::extractStyles(
    const std::string& file_name, const std::vector<uint8_t>& file_bytes) const {
    auto contexts = extractor_->extractContexts(file_bytes, file_name);
    if (!contexts) {
        return contexts.error();
    }
    if (contexts->empty()) {
        return makeError(ErrorCode::ExtractionFailed, "template produced no formatting contexts", file_name);
    }
    return std::move(contexts).value();
}

core::VoidResult TemplateRegistrar::extractInto(core::Template& tmpl,
                                                const std::vector<uint8_t>& file_bytes) const {
    auto styles = extractStyles(tmpl.file_name, file_bytes);
    if (!styles) {
        return styles.error();
    }
    auto catalog = extractor_->extractCatalog(file_bytes, tmpl.file_name);
    if (!catalog) {
        return catalog.error();
    }
    tmpl.text_styles = std::move(styles).value();
    tmpl.default_styles = std::move(catalog->default_styles);
    tmpl.numbering_definitions = std::move(catalog->numbering_definitions);
    return {};
}

core::Result<int> TemplateRegistrar::registerTemplate(const std::string& name,
                                                      const std::string& file_name,
                                                      const std::vector<uint8_t>& file_bytes,
                                                      const std::string& created_by,
                                                      const std::string& description) {
    core::Template tmpl;
    tmpl.name = name;
    tmpl.description = description;
    tmpl.file_name = file_name;
    tmpl.file_path = file_name;
    tmpl.file_hash = computeFileHash(file_bytes);
    tmpl.file_size = file_bytes.size();
    tmpl.status = core::TemplateStatus::Active;
    tmpl.version = 1;
    tmpl.audit.created_by = created_by;
    tmpl.audit.modified_by = created_by;

    auto extracted = extractInto(tmpl, file_bytes);
    if (!extracted) {
        SERVICE_ERROR("Cannot register template '{}': {}", name, extracted.error().fullMessage());
        return extracted.error();
    }

    const size_t style_count = tmpl.text_styles.size();
    const size_t catalog_count = tmpl.default_styles.size();
    const size_t numbering_count = tmpl.numbering_definitions.size();
    auto id = repository_->addTemplate(std::move(tmpl));
    if (id) {
        SERVICE_INFO("Registered template '{}' (id {}, {} styles, {} catalog styles, {} numbering definitions)",
                     name, *id, style_count, catalog_count, numbering_count);
    }
    return id;
}

core::Result<core::Template> TemplateRegistrar::refreshTemplate(const std::string& name,
                                                                const std::vector<uint8_t>& file_bytes,
                                                                const std::string& modified_by) {
    auto existing = repository_->findTemplateByName(name);
    if (!existing) {
        return existing.error();
    }

    core::Template tmpl = std::move(existing).value();
    const std::string hash = computeFileHash(file_bytes);
    if (hash == tmpl.file_hash) {
        SERVICE_DEBUG("Template '{}' unchanged (hash {})", name, hash);
        return tmpl;
    }

    auto extracted = extractInto(tmpl, file_bytes);
    if (!extracted) {
        SERVICE_ERROR("Cannot refresh template '{}': {}", name, extracted.error().fullMessage());
        return extracted.error();
    }

    tmpl.file_hash = hash;
    tmpl.file_size = file_bytes.size();
    tmpl.version += 1;
    for (auto& style : tmpl.text_styles) {
        style.version = tmpl.version;
    }
    tmpl.audit.touch(modified_by);

    auto updated = repository_->updateTemplate(tmpl);
    if (!updated) {
        return updated.error();
    }
    SERVICE_INFO("Template '{}' re-parsed, now version {}", name, tmpl.version);
    return repository_->getTemplate(tmpl.id);
}

}} // namespace styleverify::service
