#pragma once

#include "styleverify/core/VerificationResult.hpp"
#include "styleverify/verify/IDimensionComparator.hpp"
#include "styleverify/verify/SeverityPolicy.hpp"
#include "styleverify/utils/TimeUtils.hpp"
#include <string>
#include <vector>

namespace styleverify {
namespace verify {

/**
 * @brief 聚合前的原始差异：一个比较器（或匹配器）对一个上下文给出的一组字段差异
 */
struct RawDiscrepancy {
    std::string context_key;
    std::string location;
    std::string structural_role;
    std::string sample_text;
    core::MismatchCategory category = core::MismatchCategory::Style;
    std::vector<FieldMismatch> fields;
};

/**
 * @brief 不一致项聚合器
 *
 * - 按 SeverityPolicy 给每条原始差异定级
 * - (context_key, 字段名集合) 相同的差异合并为一条，保留最高严重程度
 * - 按严重程度降序、context_key 升序、字段列表升序稳定排序
 *
 * 输出只取决于输入序列，相同输入得到逐字节相同的列表（created_on 除外，由调用方统一给出）。
 */
class MismatchAggregator {
public:
    explicit MismatchAggregator(SeverityPolicy policy = SeverityPolicy());

    std::vector<core::Mismatch> aggregate(const std::vector<RawDiscrepancy>& discrepancies,
                                          utils::TimeUtils::TimePoint created_on = utils::TimeUtils::now()) const;

    /**
     * @brief 是否满足排序约定：严重程度不增，同级内 context_key 不减
     */
    static bool isOrdered(const std::vector<core::Mismatch>& mismatches);

    const SeverityPolicy& policy() const { return policy_; }

private:
    SeverityPolicy policy_;
};

}} // namespace styleverify::verify
