#include "styleverify/verify/SeverityPolicy.hpp"
#include "styleverify/utils/StringUtils.hpp"

namespace styleverify {
namespace verify {

bool SeverityPolicy::isEscalatedRole(const std::string& structural_role) const {
    for (const auto& prefix : escalated_role_prefixes) {
        if (!prefix.empty() && utils::StringUtils::startsWithIgnoreCase(structural_role, prefix)) {
            return true;
        }
    }
    return false;
}

core::Severity SeverityPolicy::resolve(core::MismatchCategory category,
                                       const std::string& structural_role) const {
    switch (category) {
        case core::MismatchCategory::MissingInDocument:
        case core::MismatchCategory::UnexpectedInDocument:
            return structural;
        case core::MismatchCategory::Style:
            return signature;
        case core::MismatchCategory::TabStop:
            return isEscalatedRole(structural_role) ? escalated : tab_stop;
        case core::MismatchCategory::DirectFormat:
            return isEscalatedRole(structural_role) ? escalated : direct_format;
    }
    return structural;
}

}} // namespace styleverify::verify
