#pragma once

#include "styleverify/core/Template.hpp"
#include "styleverify/core/TextStyle.hpp"
#include "styleverify/core/ThreadPool.hpp"
#include "styleverify/core/VerificationResult.hpp"
#include "styleverify/verify/ContextMatcher.hpp"
#include "styleverify/verify/IDimensionComparator.hpp"
#include "styleverify/verify/MismatchAggregator.hpp"
#include "styleverify/verify/StyleSignatureBuilder.hpp"
#include "styleverify/verify/VerificationOptions.hpp"
#include <memory>
#include <vector>

namespace styleverify {
namespace verify {

/**
 * @brief 校验编排器 - 一个文档对一个模板的完整流水线
 *
 * 匹配（顺序）-> 各维度比较（按匹配对扇出到线程池）-> 汇合 -> 聚合 -> Completed。
 *
 * 每次 verify() 相互隔离，模板在比较期间只读，可对同一模板并发调用。
 * 结果只取决于输入，重复运行得到相同的不一致项列表。
 *
 * 使用示例：
 * @code
 * VerificationEngine engine(options);
 * core::VerificationResult result = engine.verify(tmpl, contexts);
 * for (const auto& m : result.getMismatches()) { ... }
 * @endcode
 */
class VerificationEngine {
public:
    explicit VerificationEngine(VerificationOptions options = VerificationOptions());
    ~VerificationEngine();

    VerificationEngine(const VerificationEngine&) = delete;
    VerificationEngine& operator=(const VerificationEngine&) = delete;

    /**
     * @brief 追加一个自定义维度比较器
     */
    void addComparator(std::unique_ptr<IDimensionComparator> comparator);

    /**
     * @brief 执行校验
     * @param tmpl 模板快照
     * @param document 文档上下文
     * @param token 取消令牌，在每个匹配对边界检查
     * @return 终态结果：Completed，或 Failed（ExtractionFailed / Cancelled）
     * @throws TemplateException 模板未激活，校验未开始
     * @throws ComparatorException 比较器内部缺陷，本次校验中止
     */
    core::VerificationResult verify(const core::Template& tmpl,
                                    const core::DocumentContexts& document,
                                    const CancellationToken& token = CancellationToken()) const;

    /**
     * @brief 在调用方准备好的结果对象上执行校验（结果需处于 Pending）
     */
    void verifyInto(core::VerificationResult& result,
                    const core::Template& tmpl,
                    const core::DocumentContexts& document,
                    const CancellationToken& token = CancellationToken()) const;

    const VerificationOptions& options() const { return options_; }
    size_t comparatorCount() const { return comparators_.size(); }

private:
    struct PairOutcome {
        std::vector<RawDiscrepancy> discrepancies;
        bool cancelled = false;
    };

    PairOutcome comparePair(const MatchedPair& pair, const CancellationToken& token) const;

    std::vector<PairOutcome> compareAll(const std::vector<MatchedPair>& pairs,
                                        const CancellationToken& token) const;

    void collectSignatureWarnings(const MatchResult& matches,
                                  std::vector<std::string>& warnings) const;

    VerificationOptions options_;
    StyleSignatureBuilder signature_builder_;
    ContextMatcher matcher_;
    MismatchAggregator aggregator_;
    std::vector<std::unique_ptr<IDimensionComparator>> comparators_;
    std::unique_ptr<core::ThreadPool> pool_;
};

}} // namespace styleverify::verify
