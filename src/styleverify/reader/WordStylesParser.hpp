#pragma once

#include "styleverify/reader/WordPartParser.hpp"
#include "styleverify/core/StyleTypes.hpp"
#include <map>
#include <string>
#include <vector>

namespace styleverify {
namespace reader {

/**
 * @brief styles.xml 中的一个样式定义
 */
struct WordStyleDefinition {
    std::string style_id;
    std::string name;
    core::StyleType type = core::StyleType::Paragraph;
    std::string based_on;
    std::string next_style;
    bool is_default = false;
    bool is_custom = false;
    int priority = 0;
    bool is_hidden = false;
    bool is_quick_style = false;
    core::StyleProperties properties;       // 只含本样式声明的属性
    std::vector<core::TabStop> tab_stops;   // 只含本样式声明的制表位（含 clear）
};

/**
 * @brief styles.xml 解析器
 *
 * 收集 docDefaults 与所有 w:style，提供沿 basedOn 链的属性解析。
 */
class WordStylesParser : public WordPartParser {
public:
    WordStylesParser() = default;

    const std::map<std::string, WordStyleDefinition>& getStyles() const { return styles_; }
    const core::StyleProperties& getDocDefaults() const { return doc_defaults_; }

    const WordStyleDefinition* findStyle(const std::string& style_id) const;

    /**
     * @brief 样式 id，按在 styles.xml 中出现的顺序（重复 id 只记第一次）
     */
    const std::vector<std::string>& getStyleOrder() const { return style_order_; }

    /**
     * @brief 缺省段落样式的 id（没有声明时为 "Normal"）
     */
    std::string defaultParagraphStyleId() const;

    /**
     * @brief 样式的有效属性：docDefaults <- 祖先 <- 本样式
     *
     * 未知样式返回 docDefaults；basedOn 成环时在重复处截断。
     * 字符样式叠加到段落上时传 include_doc_defaults = false。
     */
    core::StyleProperties resolveProperties(const std::string& style_id,
                                            bool include_doc_defaults = true) const;

    /**
     * @brief 样式的有效制表位，按位置排序，clear 项移除对应位置的继承制表位
     */
    std::vector<core::TabStop> resolveTabStops(const std::string& style_id) const;

    /**
     * @brief 显示名，未知样式返回 id 本身
     */
    std::string displayName(const std::string& style_id) const;

protected:
    void onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int depth) override;
    void onEndElement(std::string_view name, int depth) override;
    void onReset() override;

private:
    std::vector<const WordStyleDefinition*> inheritanceChain(const std::string& style_id) const;

    std::map<std::string, WordStyleDefinition> styles_;
    std::vector<std::string> style_order_;
    core::StyleProperties doc_defaults_;

    WordStyleDefinition current_;
    bool in_style_ = false;
    bool in_doc_defaults_ = false;
};

/**
 * @brief 把制表位声明叠加到已有序列上（clear 删除同一位置）并按位置排序
 */
void mergeTabStops(std::vector<core::TabStop>& base, const std::vector<core::TabStop>& overrides);

}} // namespace styleverify::reader
