#pragma once

#include "styleverify/core/StyleTypes.hpp"
#include "styleverify/core/StyleProperties.hpp"
#include <string>
#include <fmt/format.h>

namespace styleverify {
namespace core {

/**
 * @brief 制表位 - 位置(pt)、对齐方式、前导符
 *
 * 一个样式的制表位是有序序列，顺序本身有意义。
 */
struct TabStop {
    double position = 0.0;
    TabAlignment alignment = TabAlignment::Left;
    TabLeader leader = TabLeader::None;

    TabStop() = default;
    TabStop(double pos, TabAlignment align, TabLeader lead = TabLeader::None)
        : position(pos), alignment(align), leader(lead) {}

    /**
     * @brief 形如 "right/dot@72" 的描述，用于不一致项的期望值/实际值
     */
    std::string describe() const {
        return fmt::format("{}/{}@{}", toString(alignment), toString(leader),
                           StyleProperties::formatNumber(position));
    }
};

}} // namespace styleverify::core
