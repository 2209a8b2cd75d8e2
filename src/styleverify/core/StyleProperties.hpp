#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <optional>
#include <initializer_list>
#include <utility>

namespace styleverify {
namespace core {

/**
 * @brief 已知属性键
 *
 * 与 WordprocessingML 的 rPr/pPr 子元素对应，长度单位统一为磅(pt)。
 */
namespace PropertyKey {
    constexpr const char* FontFamily       = "fontFamily";
    constexpr const char* FontSize         = "fontSize";
    constexpr const char* Color            = "color";
    constexpr const char* Highlight        = "highlight";
    constexpr const char* Bold             = "bold";
    constexpr const char* Italic           = "italic";
    constexpr const char* Underline        = "underline";
    constexpr const char* Strikethrough    = "strikethrough";
    constexpr const char* DoubleStrike     = "doubleStrikethrough";
    constexpr const char* AllCaps          = "allCaps";
    constexpr const char* SmallCaps        = "smallCaps";
    constexpr const char* Hidden           = "hidden";
    constexpr const char* VerticalAlign    = "verticalAlign";
    constexpr const char* CharacterSpacing = "characterSpacing";
    constexpr const char* Language         = "language";
    constexpr const char* Alignment        = "alignment";
    constexpr const char* SpacingBefore    = "spacingBefore";
    constexpr const char* SpacingAfter     = "spacingAfter";
    constexpr const char* LineSpacing      = "lineSpacing";
    constexpr const char* IndentLeft       = "indentLeft";
    constexpr const char* IndentRight      = "indentRight";
    constexpr const char* FirstLineIndent  = "firstLineIndent";
    constexpr const char* KeepWithNext     = "keepWithNext";
    constexpr const char* KeepTogether     = "keepTogether";
    constexpr const char* OutlineLevel     = "outlineLevel";
    constexpr const char* StyleType        = "styleType";
} // namespace PropertyKey

/**
 * @brief 属性值的比较语义
 */
enum class PropertyKind : uint8_t {
    Text,           // 区分大小写的自由文本
    Caseless,       // 不区分大小写（字体名、枚举取值）
    Number,         // 数值（pt），按容差比较
    Boolean,        // 开关属性，false 即缺省
    ColorValue,     // 颜色，auto 与黑色等价
    AlignmentValue  // 段落对齐，start/left 等价
};

/**
 * @brief 样式属性集合 - 显式的字符串映射类型
 *
 * 保存上游给出的原始取值；规范化（缺省折叠、大小写、数值精度）
 * 由 canonical()/canonicalValue() 完成，签名和比较只使用规范化结果。
 * 键按字典序存储，遍历顺序与插入顺序无关。
 */
class StyleProperties {
public:
    using Map = std::map<std::string, std::string>;
    using const_iterator = Map::const_iterator;

    StyleProperties() = default;
    StyleProperties(std::initializer_list<std::pair<const std::string, std::string>> init)
        : values_(init) {}

    // ========== 通用访问 ==========

    void set(const std::string& key, const std::string& value) { values_[key] = value; }
    void setBool(const std::string& key, bool value) { values_[key] = value ? "1" : "0"; }
    void setNumber(const std::string& key, double value);

    std::optional<std::string> get(const std::string& key) const;
    std::string getOr(const std::string& key, const std::string& default_value) const;
    std::optional<double> getNumber(const std::string& key) const;
    bool getBool(const std::string& key) const;

    bool has(const std::string& key) const { return values_.count(key) != 0; }
    void remove(const std::string& key) { values_.erase(key); }
    void clear() { values_.clear(); }

    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }
    const_iterator begin() const { return values_.begin(); }
    const_iterator end() const { return values_.end(); }
    const Map& values() const { return values_; }

    // ========== 常用属性 ==========

    void setFontFamily(const std::string& family) { set(PropertyKey::FontFamily, family); }
    void setFontSize(double points) { setNumber(PropertyKey::FontSize, points); }
    void setColor(const std::string& color) { set(PropertyKey::Color, color); }
    void setAlignment(const std::string& alignment) { set(PropertyKey::Alignment, alignment); }
    void setBold(bool bold) { setBool(PropertyKey::Bold, bold); }
    void setItalic(bool italic) { setBool(PropertyKey::Italic, italic); }

    std::string getFontFamily() const { return getOr(PropertyKey::FontFamily, ""); }
    std::optional<double> getFontSize() const { return getNumber(PropertyKey::FontSize); }
    std::string getColor() const { return getOr(PropertyKey::Color, ""); }
    std::string getAlignment() const { return getOr(PropertyKey::Alignment, ""); }
    bool isBold() const { return getBool(PropertyKey::Bold); }
    bool isItalic() const { return getBool(PropertyKey::Italic); }

    /**
     * @brief 用 overrides 覆盖同名属性
     */
    void mergeFrom(const StyleProperties& overrides);

    // ========== 规范化 ==========

    /**
     * @brief 返回规范化后的副本：缺省值被移除，取值统一为规范形式
     */
    StyleProperties canonical() const;

    /**
     * @brief 覆盖集合的规范化副本
     *
     * 与 canonical() 不同，显式写出的缺省值不会被移除，而是记为 kExplicitDefault。
     * 用于直接格式：把加粗关掉（b=0）的覆盖和没有覆盖是两回事。
     */
    StyleProperties canonicalOverrides() const;

    static constexpr const char* kExplicitDefault = "default";

    /**
     * @brief 单个属性的规范形式
     * @return 等价于缺省值时返回 std::nullopt
     */
    static std::optional<std::string> canonicalValue(const std::string& key, const std::string& raw);

    static PropertyKind kindOf(const std::string& key);

    /**
     * @brief 数值属性省略时的取值（如 lineSpacing 为 1），非数值属性返回 std::nullopt
     */
    static std::optional<double> numericDefault(const std::string& key);

    /**
     * @brief 规范值的数值形式
     */
    static std::optional<double> parseNumeric(const std::string& text);

    /**
     * @brief 数值的规范文本：保留两位小数并去掉尾随零
     */
    static std::string formatNumber(double value);

    bool operator==(const StyleProperties& other) const { return values_ == other.values_; }
    bool operator!=(const StyleProperties& other) const { return values_ != other.values_; }

private:
    Map values_;
};

}} // namespace styleverify::core
