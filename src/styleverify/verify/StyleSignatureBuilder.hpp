#pragma once

#include "styleverify/core/Constants.hpp"
#include "styleverify/core/StyleProperties.hpp"
#include "styleverify/core/TextStyle.hpp"
#include <cstdint>
#include <string>

namespace styleverify {
namespace verify {

/**
 * @brief 样式签名
 */
struct StyleSignature {
    std::string value;
    bool truncated = false;

    bool operator==(const StyleSignature& other) const {
        return value == other.value && truncated == other.truncated;
    }
    bool operator!=(const StyleSignature& other) const { return !(*this == other); }
};

/**
 * @brief 样式签名构建器
 *
 * 把属性集合规范化为可比较的签名字符串：
 * - 键按字典序排列，与插入顺序无关
 * - 显式缺省值与省略等价（均不出现在签名中）
 * - 形如 "bold=1;color=FF0000;fontfamily=..."，值中的 \ ; = 转义
 * - 超过最大长度时保留前缀并追加 "#" + 完整文本的 FNV-1a 64 位摘要，设置 truncated
 *
 * 构建器无状态，可在多线程间共享。
 */
class StyleSignatureBuilder {
public:
    explicit StyleSignatureBuilder(size_t max_length = core::Constants::kMaxSignatureLength);

    /**
     * @brief 属性集合的签名
     */
    StyleSignature build(const core::StyleProperties& properties) const;

    /**
     * @brief 样式的签名（有效属性 = 基础属性 + 样式类型 + 直接格式覆盖）
     */
    StyleSignature build(const core::TextStyle& style) const;

    /**
     * @brief 计算签名并写回 style_signature / signature_truncated
     * @return 是否发生截断
     */
    bool apply(core::TextStyle& style) const;

    size_t maxLength() const { return max_length_; }

    /**
     * @brief 样式的有效属性
     *
     * 直接格式覆盖按 (context, pattern_name) 顺序叠加，结果与模式声明顺序无关。
     */
    static core::StyleProperties effectiveProperties(const core::TextStyle& style);

    /**
     * @brief 样式的基础属性（属性 + 样式类型），不含直接格式覆盖
     */
    static core::StyleProperties baseProperties(const core::TextStyle& style);

    /**
     * @brief 规范化属性的序列化（不截断）
     */
    static std::string serialize(const core::StyleProperties& canonical);

    static uint64_t fnv1a(const std::string& text);

private:
    static void appendEscaped(std::string& out, const std::string& text);

    size_t max_length_;
};

}} // namespace styleverify::verify
