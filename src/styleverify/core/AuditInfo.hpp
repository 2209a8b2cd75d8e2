#pragma once

#include "styleverify/utils/TimeUtils.hpp"
#include <string>

namespace styleverify {
namespace core {

/**
 * @brief 审计字段
 */
struct AuditInfo {
    std::string created_by;
    utils::TimeUtils::TimePoint created_on = utils::TimeUtils::now();
    std::string modified_by;
    utils::TimeUtils::TimePoint modified_on = utils::TimeUtils::now();

    void touch(const std::string& user) {
        modified_by = user;
        modified_on = utils::TimeUtils::now();
    }
};

}} // namespace styleverify::core
