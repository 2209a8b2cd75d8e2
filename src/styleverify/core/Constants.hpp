#pragma once

#include <cstddef>

namespace styleverify {
namespace core {

// 通用常量集中定义，便于统一调整与复用
struct Constants {
    // I/O 缓冲区大小
    static constexpr size_t kIOBufferSize = 8192;

    // 样式签名最大长度（字符）
    static constexpr size_t kMaxSignatureLength = 500;

    // 数值属性比较容差（pt）
    static constexpr double kStrictTolerance = 0.1;
    static constexpr double kLenientTolerance = 1.0;

    // 默认的并行阈值：匹配对少于该值时在调用线程内顺序比较
    static constexpr size_t kDefaultParallelThreshold = 8;

    // 样例文本最大长度（字节）
    static constexpr size_t kMaxSampleTextLength = 200;

    // WordprocessingML 单位换算
    static constexpr double kTwipsPerPoint = 20.0;
    static constexpr double kHalfPointsPerPoint = 2.0;
    static constexpr double kLineSpacingAutoUnit = 240.0;
};

}} // namespace styleverify::core
