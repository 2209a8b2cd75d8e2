#pragma once

#include "styleverify/core/Constants.hpp"
#include "styleverify/core/StyleTypes.hpp"
#include "styleverify/verify/SeverityPolicy.hpp"
#include <algorithm>
#include <atomic>
#include <memory>
#include <vector>

namespace styleverify {
namespace verify {

/**
 * @brief 校验选项
 */
struct VerificationOptions {
    // 严格模式下数值容差 0.1pt，否则 1.0pt
    bool strict_mode = true;

    // 这些类型的模板样式及文档上下文不参与匹配
    std::vector<core::StyleType> ignore_style_types;

    // 报告模板未声明上下文中的直接格式
    bool report_unexpected_direct_formats = true;

    // 并行比较匹配对
    bool parallel = true;
    size_t worker_threads = 0;      // 0 = 硬件并发数
    size_t parallel_threshold = core::Constants::kDefaultParallelThreshold;

    SeverityPolicy severity_policy;

    double tolerance() const {
        return strict_mode ? core::Constants::kStrictTolerance : core::Constants::kLenientTolerance;
    }

    bool isIgnored(core::StyleType type) const {
        return std::find(ignore_style_types.begin(), ignore_style_types.end(), type)
               != ignore_style_types.end();
    }
};

/**
 * @brief 协作式取消令牌
 *
 * 拷贝共享同一状态；校验在每个匹配对边界检查一次。
 */
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true); }
    bool isCancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

}} // namespace styleverify::verify
