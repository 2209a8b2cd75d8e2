#pragma once

#include <string>
#include <ctime>
#include <chrono>
#include <fmt/format.h>
#include <fmt/chrono.h>

namespace styleverify {
namespace utils {

/**
 * @brief 时间工具类 - 统一处理审计字段的时间戳
 */
class TimeUtils {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    static TimePoint now() {
        return std::chrono::system_clock::now();
    }

    /**
     * @brief 格式化为ISO 8601 UTC格式 (YYYY-MM-DDTHH:MM:SSZ)
     */
    static std::string formatISO8601(TimePoint time) {
        std::time_t t = std::chrono::system_clock::to_time_t(time);
        return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", fmt::gmtime(t));
    }
};

}} // namespace styleverify::utils
