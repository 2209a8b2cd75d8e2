#pragma once

#include "styleverify/verify/IDimensionComparator.hpp"

namespace styleverify {
namespace verify {

/**
 * @brief 制表位比较器
 *
 * 按位置逐个比较有序序列：长度不同报告 TabStopCountMismatch，
 * 公共前缀内位置（容差内）、对齐或前导符不同报告 TabStopMismatch[i]。
 */
class TabStopComparator : public IDimensionComparator {
public:
    explicit TabStopComparator(double tolerance);

    const char* name() const override { return "TabStopComparator"; }
    core::MismatchCategory category() const override { return core::MismatchCategory::TabStop; }

    std::vector<FieldMismatch> compare(const core::TextStyle& expected,
                                       const core::TextStyle& actual) const override;

private:
    double tolerance_;
};

}} // namespace styleverify::verify
