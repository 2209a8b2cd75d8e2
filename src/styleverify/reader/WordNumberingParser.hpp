#pragma once

#include "styleverify/reader/WordPartParser.hpp"
#include "styleverify/core/NumberingDefinition.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace styleverify {
namespace reader {

/**
 * @brief numbering.xml 解析器
 *
 * 收集 w:abstractNum（含各级别 w:lvl）与 w:num -> abstractNumId 的映射。
 * 编号实例可能出现在抽象定义之前，所以 numbering_id 在取结果时才关联。
 */
class WordNumberingParser : public WordPartParser {
public:
    WordNumberingParser() = default;

    /**
     * @brief 按 abstractNumId 升序的编号定义，numbering_id 已关联
     */
    std::vector<core::NumberingDefinition> getDefinitions() const;

    /**
     * @brief 编号实例引用的抽象定义 id
     */
    std::optional<int> abstractNumFor(int num_id) const;

    size_t getInstanceCount() const { return instances_.size(); }

protected:
    void onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int depth) override;
    void onEndElement(std::string_view name, int depth) override;
    void onReset() override;

private:
    static std::optional<int> findIntAttribute(const std::vector<xml::XMLAttribute>& attributes,
                                               std::string_view name);

    void handleLevelElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes);

    std::map<int, core::NumberingDefinition> definitions_;
    std::map<int, int> instances_;      // numId -> abstractNumId

    core::NumberingDefinition current_;
    std::string current_style_link_;
    core::NumberingLevel current_level_;
    bool in_abstract_num_ = false;
    bool in_level_ = false;
    std::optional<int> current_num_id_;
};

}} // namespace styleverify::reader
