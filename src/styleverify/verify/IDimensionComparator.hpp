#pragma once

#include "styleverify/core/StyleTypes.hpp"
#include "styleverify/core/TextStyle.hpp"
#include <string>
#include <vector>

namespace styleverify {
namespace verify {

/**
 * @brief 字段级差异 (field, expected, actual)
 *
 * scope 为差异所在的子位置（如直接格式的 "Run:2"），为空表示整个样式。
 */
struct FieldMismatch {
    std::string field;
    std::string expected;
    std::string actual;
    std::string scope;
};

/**
 * @brief 维度比较器接口
 *
 * 对一对匹配上的模板样式/文档上下文给出零个或多个字段差异。
 * "取值不同"是正常输出，不得抛出；抛出即视为比较器缺陷，终止本次校验。
 * 实现必须无内部可变状态，可被多个工作线程同时调用。
 */
class IDimensionComparator {
public:
    virtual ~IDimensionComparator() = default;

    virtual const char* name() const = 0;

    /**
     * @brief 该比较器产出的不一致项类别，决定严重程度
     */
    virtual core::MismatchCategory category() const = 0;

    virtual std::vector<FieldMismatch> compare(const core::TextStyle& expected,
                                               const core::TextStyle& actual) const = 0;
};

}} // namespace styleverify::verify
