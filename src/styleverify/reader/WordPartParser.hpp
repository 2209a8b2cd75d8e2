#pragma once

#include "styleverify/reader/BaseSAXParser.hpp"
#include "styleverify/core/StyleProperties.hpp"
#include "styleverify/core/TabStop.hpp"
#include <optional>
#include <string_view>
#include <vector>

namespace styleverify {
namespace reader {

/**
 * @brief WordprocessingML 部件解析器基类
 *
 * 把 rPr / pPr 子元素映射为 StyleProperties，长度统一换算为磅：
 * twips / 20，字号半磅 / 2，自动行距 line / 240 倍。
 */
class WordPartParser : public BaseSAXParser {
protected:
    /**
     * @brief 处理 rPr 的子元素
     * @return 是否识别
     */
    static bool applyRunProperty(std::string_view element,
                                 const std::vector<xml::XMLAttribute>& attributes,
                                 core::StyleProperties& properties);

    /**
     * @brief 处理 pPr 的子元素（tabs/numPr/pStyle 由子类处理）
     */
    static bool applyParagraphProperty(std::string_view element,
                                       const std::vector<xml::XMLAttribute>& attributes,
                                       core::StyleProperties& properties);

    /**
     * @brief 解析 tabs/tab 元素
     */
    static std::optional<core::TabStop> parseTabStop(const std::vector<xml::XMLAttribute>& attributes);

    static std::optional<double> twipsToPoints(const std::vector<xml::XMLAttribute>& attributes, std::string_view name);
};

}} // namespace styleverify::reader
