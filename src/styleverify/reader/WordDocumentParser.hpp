#pragma once

#include "styleverify/reader/WordPartParser.hpp"
#include <string>
#include <vector>

namespace styleverify {
namespace reader {

/**
 * @brief document.xml 中的一个文本段（w:r）
 */
struct WordRun {
    std::string char_style_id;
    core::StyleProperties properties;   // 直接格式
    std::string text;
};

/**
 * @brief document.xml 中的一个段落
 *
 * 结构索引从0开始；不在表格中时 table/row/cell 为 -1。
 * paragraph_index 在正文中按正文段落计数，在单元格中按单元格内段落计数。
 */
struct WordParagraph {
    std::string style_id;
    core::StyleProperties properties;       // pPr 直接格式
    std::vector<core::TabStop> tab_stops;   // pPr 中声明的制表位（含 clear）
    bool numbered = false;
    std::vector<WordRun> runs;

    int section_index = 0;
    int table_index = -1;
    int row_index = -1;
    int cell_index = -1;
    int paragraph_index = 0;

    std::string text() const;
};

/**
 * @brief document.xml 解析器
 *
 * 收集正文与表格单元格中的段落及其文本段，记录节/表格/行/单元格位置。
 * 嵌套表格中的段落归属最内层单元格。
 */
class WordDocumentParser : public WordPartParser {
public:
    WordDocumentParser() = default;

    const std::vector<WordParagraph>& getParagraphs() const { return paragraphs_; }
    int getTableCount() const { return table_count_; }
    int getSectionCount() const { return section_index_ + 1; }

protected:
    void onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int depth) override;
    void onEndElement(std::string_view name, int depth) override;
    void onText(std::string_view text, int depth) override;
    void onReset() override;

private:
    // 表格位置栈的一层
    struct TableFrame {
        int table_index = 0;
        int row = -1;
        int cell = -1;
        int paragraphs_in_cell = 0;
    };

    std::vector<WordParagraph> paragraphs_;
    std::vector<TableFrame> tables_;

    WordParagraph current_paragraph_;
    WordRun current_run_;
    bool in_paragraph_ = false;
    bool in_run_ = false;
    bool in_text_ = false;
    bool section_ends_after_paragraph_ = false;
    int nested_depth_ = 0;

    int section_index_ = 0;
    int table_count_ = 0;
    int body_paragraphs_ = 0;
};

}} // namespace styleverify::reader
