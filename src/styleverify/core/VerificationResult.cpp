#include "styleverify/core/VerificationResult.hpp"
#include "styleverify/core/Exception.hpp"
#include "styleverify/utils/StringUtils.hpp"
#include <fmt/format.h>

namespace styleverify {
namespace core {

std::string Mismatch::mismatchFields() const {
    return utils::StringUtils::join(fields, ",");
}

void VerificationResult::start() {
    if (status_ != VerificationStatus::Pending) {
        STYLEVERIFY_THROW_STATE("start",
            fmt::format("cannot start verification in state {}", toString(status_)));
    }
    status_ = VerificationStatus::Running;
    verification_date_ = utils::TimeUtils::now();
}

void VerificationResult::complete(std::vector<Mismatch> mismatches) {
    if (status_ != VerificationStatus::Running) {
        STYLEVERIFY_THROW_STATE("complete",
            fmt::format("cannot complete verification in state {}", toString(status_)));
    }
    mismatches_ = std::move(mismatches);
    status_ = VerificationStatus::Completed;
}

void VerificationResult::fail(ErrorCode code, const std::string& message) {
    if (isTerminal()) {
        STYLEVERIFY_THROW_STATE("fail",
            fmt::format("cannot fail verification in state {}", toString(status_)));
    }
    mismatches_.clear();
    error_code_ = code;
    error_message_ = message;
    status_ = VerificationStatus::Failed;
}

void VerificationResult::assignMismatchIds(int first_id) {
    for (auto& mismatch : mismatches_) {
        mismatch.id = first_id++;
    }
}

std::string recommendedActionFor(Severity severity) {
    switch (severity) {
        case Severity::High:
            return "Should be corrected. These differences affect document consistency and compliance.";
        case Severity::Medium:
            return "Consider correcting. These differences are noticeable but may not significantly impact document quality.";
        case Severity::Low:
        default:
            return "Optional correction. These are minor styling differences with minimal impact.";
    }
}

}} // namespace styleverify::core
