#pragma once

#include <string>
#include <cstdint>
#include <optional>

namespace styleverify {
namespace core {

/**
 * @brief Color类 - 文本颜色
 *
 * WordprocessingML 的颜色只有两种形态：RGB十六进制或 "auto"。
 * 比较时一律转换为6位大写十六进制。
 */
class Color {
public:
    enum class Type : uint8_t {
        RGB = 0,
        Auto = 1
    };

private:
    Type type_;
    uint32_t value_;    // RGB值

public:
    /**
     * @brief 默认构造函数（黑色）
     */
    Color() : type_(Type::RGB), value_(0x000000) {}

    Color(uint8_t red, uint8_t green, uint8_t blue)
        : type_(Type::RGB), value_((static_cast<uint32_t>(red) << 16) |
                                   (static_cast<uint32_t>(green) << 8) |
                                   static_cast<uint32_t>(blue)) {}

    explicit Color(uint32_t rgb) : type_(Type::RGB), value_(rgb & 0xFFFFFF) {}

    static Color automatic() {
        Color color;
        color.type_ = Type::Auto;
        return color;
    }

    /**
     * @brief 解析颜色字符串
     *
     * 支持 "FF0000"、"#ff0000"、"#F00"、"80FF0000"(ARGB，忽略alpha)、
     * "auto" 以及少量颜色名。
     * @return 无法识别时返回 std::nullopt
     */
    static std::optional<Color> parse(const std::string& text);

    // 预定义颜色常量
    static const Color BLACK;
    static const Color WHITE;
    static const Color RED;
    static const Color GREEN;
    static const Color BLUE;
    static const Color YELLOW;

    Type getType() const { return type_; }
    bool isAuto() const { return type_ == Type::Auto; }

    /**
     * @brief 渲染用的RGB值（auto按黑色处理）
     */
    uint32_t getRGB() const { return type_ == Type::Auto ? 0x000000 : value_; }

    /**
     * @brief 6位大写十六进制
     * @param include_hash 是否带 # 前缀
     */
    std::string toHex(bool include_hash = false) const;

    bool operator==(const Color& other) const {
        return type_ == other.type_ && value_ == other.value_;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }
};

}} // namespace styleverify::core
