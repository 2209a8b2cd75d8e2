#pragma once

#include "styleverify/core/Expected.hpp"
#include "styleverify/core/StyleTypes.hpp"
#include "styleverify/core/VerificationResult.hpp"
#include "styleverify/reader/IContextExtractor.hpp"
#include "styleverify/repository/ITemplateRepository.hpp"
#include "styleverify/verify/VerificationEngine.hpp"
#include "styleverify/verify/VerificationOptions.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace styleverify {
namespace service {

/**
 * @brief 校验结果统计
 */
struct VerificationSummary {
    size_t total_results = 0;
    size_t total_mismatches = 0;
    std::map<core::VerificationStatus, size_t> by_status;
    std::map<core::Severity, size_t> by_severity;

    size_t countOf(core::VerificationStatus status) const {
        auto it = by_status.find(status);
        return it == by_status.end() ? 0 : it->second;
    }

    size_t countOf(core::Severity severity) const {
        auto it = by_severity.find(severity);
        return it == by_severity.end() ? 0 : it->second;
    }
};

/**
 * @brief 校验服务 - 按名称解析模板、抽取文档、执行比较并持久化结果
 *
 * 错误处理约定：
 * - 模板不存在或未激活：直接返回 Error，不创建也不保存结果
 * - 文档抽取失败：结果标记为 Failed 并保存，返回该结果
 * - 比较器内部缺陷：记录 critical 日志后 ComparatorException 继续向上抛出
 */
class VerificationService {
public:
    VerificationService(std::shared_ptr<repository::ITemplateRepository> repository,
                        std::shared_ptr<reader::IContextExtractor> extractor,
                        verify::VerificationOptions options = verify::VerificationOptions());

    VerificationService(const VerificationService&) = delete;
    VerificationService& operator=(const VerificationService&) = delete;

    /**
     * @brief 用指定名称的激活模板校验一份文档
     * @param template_name 模板名称
     * @param document_name 文档名称（记录在结果中）
     * @param document_bytes 文档内容
     * @param created_by 操作人
     * @param token 取消令牌
     * @return 已持久化的结果（含 id 与不匹配项 id）
     */
    core::Result<core::VerificationResult> verify(const std::string& template_name,
                                                  const std::string& document_name,
                                                  const std::vector<uint8_t>& document_bytes,
                                                  const std::string& created_by,
                                                  const verify::CancellationToken& token = verify::CancellationToken());

    core::Result<core::VerificationResult> getVerificationResult(int id) const;

    std::vector<core::VerificationResult> listResults(const repository::ResultFilter& filter = {}) const;

    core::VoidResult deleteResult(int id);

    /**
     * @brief 汇总已保存结果（可限定模板）
     */
    VerificationSummary summarize(std::optional<int> template_id = std::nullopt) const;

    verify::VerificationEngine& engine() { return engine_; }
    const verify::VerificationEngine& engine() const { return engine_; }

private:
    core::Result<core::VerificationResult> persist(core::VerificationResult result);

    std::shared_ptr<repository::ITemplateRepository> repository_;
    std::shared_ptr<reader::IContextExtractor> extractor_;
    verify::VerificationEngine engine_;
};

}} // namespace styleverify::service
