#pragma once

#include "styleverify/verify/IDimensionComparator.hpp"

namespace styleverify {
namespace verify {

/**
 * @brief 直接格式比较器
 *
 * 模板中的每个直接格式模式要求文档在同一 context 下声明规范化属性相同的模式，
 * 缺失或不同时报告 "DirectFormat:<pattern_name>"。
 * report_unexpected 打开时，文档在模板未声明的 context 中出现的模式报告为
 * "UnexpectedDirectFormat:<pattern_name>"。
 */
class DirectFormatComparator : public IDimensionComparator {
public:
    explicit DirectFormatComparator(bool report_unexpected = true);

    const char* name() const override { return "DirectFormatComparator"; }
    core::MismatchCategory category() const override { return core::MismatchCategory::DirectFormat; }

    std::vector<FieldMismatch> compare(const core::TextStyle& expected,
                                       const core::TextStyle& actual) const override;

    /**
     * @brief 规范化属性的紧凑描述 "bold=1;color=FF0000"
     */
    static std::string describe(const core::StyleProperties& canonical);

private:
    bool report_unexpected_;
};

}} // namespace styleverify::verify
