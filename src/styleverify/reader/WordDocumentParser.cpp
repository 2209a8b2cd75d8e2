#include "styleverify/reader/WordDocumentParser.hpp"

namespace styleverify {
namespace reader {

std::string WordParagraph::text() const {
    std::string result;
    for (const auto& run : runs) {
        result += run.text;
    }
    return result;
}

void WordDocumentParser::onReset() {
    paragraphs_.clear();
    tables_.clear();
    current_paragraph_ = WordParagraph();
    current_run_ = WordRun();
    in_paragraph_ = false;
    in_run_ = false;
    in_text_ = false;
    section_ends_after_paragraph_ = false;
    nested_depth_ = 0;
    section_index_ = 0;
    table_count_ = 0;
    body_paragraphs_ = 0;
}

void WordDocumentParser::onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int /*depth*/) {
    // 文本框等嵌入在段落内的内容不单独计入
    if (nested_depth_ > 0 || (in_paragraph_ && name == "txbxContent")) {
        ++nested_depth_;
        return;
    }

    if (name == "tbl") {
        TableFrame frame;
        frame.table_index = table_count_++;
        tables_.push_back(frame);
        return;
    }
    if (name == "tr" && !tables_.empty()) {
        tables_.back().row++;
        tables_.back().cell = -1;
        return;
    }
    if (name == "tc" && !tables_.empty()) {
        tables_.back().cell++;
        tables_.back().paragraphs_in_cell = 0;
        return;
    }

    if (name == "p") {
        in_paragraph_ = true;
        section_ends_after_paragraph_ = false;
        current_paragraph_ = WordParagraph();
        current_paragraph_.section_index = section_index_;
        if (tables_.empty()) {
            current_paragraph_.paragraph_index = body_paragraphs_++;
        } else {
            TableFrame& frame = tables_.back();
            current_paragraph_.table_index = frame.table_index;
            current_paragraph_.row_index = frame.row;
            current_paragraph_.cell_index = frame.cell;
            current_paragraph_.paragraph_index = frame.paragraphs_in_cell++;
        }
        return;
    }

    if (!in_paragraph_) {
        return;
    }

    if (name == "r") {
        in_run_ = true;
        current_run_ = WordRun();
        return;
    }

    if (in_run_) {
        if (name == "t") {
            in_text_ = true;
        } else if (name == "tab" && !isInElement("rPr")) {
            current_run_.text += '\t';
        } else if ((name == "br" || name == "cr") && !isInElement("rPr")) {
            current_run_.text += '\n';
        } else if (name == "rStyle") {
            current_run_.char_style_id = findAttribute(attributes, "val").value_or("");
        } else if (isInElement("rPr")) {
            applyRunProperty(name, attributes, current_run_.properties);
        }
        return;
    }

    // 段落属性；pPr 中的 rPr 是段落标记格式，不参与比较
    if (!isInElement("pPr") || isInElement("rPr")) {
        return;
    }
    if (name == "pStyle") {
        current_paragraph_.style_id = findAttribute(attributes, "val").value_or("");
    } else if (name == "numPr") {
        current_paragraph_.numbered = true;
    } else if (name == "tab" && isInElement("tabs")) {
        if (auto tab = parseTabStop(attributes)) {
            current_paragraph_.tab_stops.push_back(*tab);
        }
    } else if (name == "sectPr") {
        section_ends_after_paragraph_ = true;
    } else {
        applyParagraphProperty(name, attributes, current_paragraph_.properties);
    }
}

void WordDocumentParser::onText(std::string_view text, int /*depth*/) {
    if (in_text_ && in_run_) {
        current_run_.text.append(text.data(), text.size());
    }
}

void WordDocumentParser::onEndElement(std::string_view name, int /*depth*/) {
    if (nested_depth_ > 0) {
        --nested_depth_;
        return;
    }

    if (name == "t") {
        in_text_ = false;
    } else if (name == "r" && in_run_) {
        in_run_ = false;
        current_paragraph_.runs.push_back(std::move(current_run_));
        current_run_ = WordRun();
    } else if (name == "p" && in_paragraph_) {
        in_paragraph_ = false;
        STYLEVERIFY_LOG_SAX_DEBUG("Paragraph {} ('{}'): {} runs",
                                  current_paragraph_.paragraph_index, current_paragraph_.style_id,
                                  current_paragraph_.runs.size());
        paragraphs_.push_back(std::move(current_paragraph_));
        current_paragraph_ = WordParagraph();
        if (section_ends_after_paragraph_) {
            ++section_index_;
            section_ends_after_paragraph_ = false;
        }
    } else if (name == "tbl" && !tables_.empty()) {
        tables_.pop_back();
    }
}

}} // namespace styleverify::reader
