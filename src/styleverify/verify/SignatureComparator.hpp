#pragma once

#include "styleverify/verify/IDimensionComparator.hpp"
#include "styleverify/verify/StyleSignatureBuilder.hpp"

namespace styleverify {
namespace verify {

/**
 * @brief 签名比较器
 *
 * 签名逐字节相等即相等；否则重新推导两侧规范化属性并逐键比较，
 * 报告 color / fontFamily / alignment 等具体字段。数值在容差内视为相等。
 */
class SignatureComparator : public IDimensionComparator {
public:
    SignatureComparator(const StyleSignatureBuilder& builder, double tolerance);

    const char* name() const override { return "SignatureComparator"; }
    core::MismatchCategory category() const override { return core::MismatchCategory::Style; }

    std::vector<FieldMismatch> compare(const core::TextStyle& expected,
                                       const core::TextStyle& actual) const override;

    double tolerance() const { return tolerance_; }

private:
    bool numericallyEqual(const std::string& key,
                          const std::optional<std::string>& expected,
                          const std::optional<std::string>& actual) const;

    const StyleSignatureBuilder& builder_;
    double tolerance_;
};

}} // namespace styleverify::verify
