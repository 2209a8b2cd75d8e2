#pragma once

#include "styleverify/repository/ITemplateRepository.hpp"
#include <map>
#include <shared_mutex>

namespace styleverify {
namespace repository {

/**
 * @brief 内存存储 - 线程安全的模板与校验结果仓储
 *
 * 读操作共享锁，写操作独占锁。编号从1开始单调递增，不复用。
 */
class InMemoryTemplateRepository : public ITemplateRepository {
public:
    InMemoryTemplateRepository() = default;
    ~InMemoryTemplateRepository() override = default;

    InMemoryTemplateRepository(const InMemoryTemplateRepository&) = delete;
    InMemoryTemplateRepository& operator=(const InMemoryTemplateRepository&) = delete;

    core::Result<int> addTemplate(core::Template tmpl) override;
    core::VoidResult updateTemplate(core::Template tmpl) override;
    core::Result<core::Template> getTemplate(int id) const override;
    core::Result<core::Template> findTemplateByName(const std::string& name) const override;
    core::Result<core::Template> loadActiveTemplate(const std::string& name) const override;
    std::vector<TemplateInfo> listTemplates() const override;
    core::Result<TemplateStyleDetails> getTemplateStyleDetails(
        int id, std::optional<core::StyleType> style_type = std::nullopt) const override;
    core::VoidResult setTemplateStatus(int id, core::TemplateStatus status,
                                       const std::string& modified_by) override;
    core::VoidResult deleteTemplate(int id) override;

    core::Result<int> saveVerificationResult(core::VerificationResult result) override;
    core::Result<core::VerificationResult> getVerificationResult(int id) const override;
    std::vector<core::VerificationResult> listVerificationResults(const ResultFilter& filter) const override;
    core::VoidResult deleteVerificationResult(int id) override;

    size_t getTemplateCount() const {
        std::shared_lock lock(mutex_);
        return templates_.size();
    }

    size_t getResultCount() const {
        std::shared_lock lock(mutex_);
        return results_.size();
    }

private:
    // 调用方需持有锁
    const core::Template* findByNameLocked(const std::string& name) const;
    void assignStyleIdsLocked(core::Template& tmpl);

    mutable std::shared_mutex mutex_;

    std::map<int, core::Template> templates_;
    std::map<int, core::VerificationResult> results_;

    int next_template_id_ = 1;
    int next_style_id_ = 1;
    int next_result_id_ = 1;
    int next_mismatch_id_ = 1;
};

}} // namespace styleverify::repository
