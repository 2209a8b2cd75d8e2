#pragma once

#include "styleverify/reader/IContextExtractor.hpp"
#include "styleverify/archive/ZipReader.hpp"
#include "styleverify/reader/WordDocumentParser.hpp"
#include "styleverify/reader/WordNumberingParser.hpp"
#include "styleverify/reader/WordStylesParser.hpp"
#include <string>

namespace styleverify {
namespace reader {

/**
 * @brief .docx 抽取器
 *
 * 读取 word/styles.xml（可选）与 word/document.xml，每个含文本的段落产出一个上下文：
 * - 上下文键：正文 "Paragraph:{i}"，表格 "Table:{t}:Row:{r}:Cell:{c}:Paragraph:{p}"
 * - 属性：段落样式沿 basedOn 解析 + 段落直接格式 + 所有文本段共有的字符格式
 * - 各文本段与共有格式不同的部分记为直接格式模式，context 为 "Run:{r}"
 * - 结构角色由样式推导：Heading{n}、Title、Subtitle、Caption、Quote、TOC{n}，
 *   带编号的段落为 ListItem，其余为 Body
 */
class DocxContextExtractor : public IContextExtractor {
public:
    DocxContextExtractor() = default;

    core::Result<core::DocumentContexts> extractContexts(const std::vector<uint8_t>& document_bytes,
                                                         const std::string& document_name) const override;

    /**
     * @brief 样式目录：styles.xml 中的全部样式（文档顺序）与 numbering.xml 中的编号定义
     *
     * 两个部件都可缺省，缺省时对应列表为空；部件存在但无法解析时返回 ExtractionFailed。
     */
    core::Result<TemplateCatalog> extractCatalog(const std::vector<uint8_t>& document_bytes,
                                                 const std::string& document_name) const override;

    static core::DefaultStyle toDefaultStyle(const WordStyleDefinition& definition);

    /**
     * @brief 由样式 id / 显示名推导结构角色
     */
    static std::string structuralRoleFor(const std::string& style_id,
                                         const std::string& style_name,
                                         bool numbered);

    static std::string contextKeyFor(const WordParagraph& paragraph);

private:
    static core::VoidResult openPackage(archive::ZipReader& zip, const std::string& document_name);

    /**
     * @brief 读取并解析可选部件，部件不存在时返回 false
     */
    static core::Result<bool> parseOptionalPart(archive::ZipReader& zip, const char* part,
                                                BaseSAXParser& parser, const std::string& document_name);

    core::TextStyle buildContext(const WordParagraph& paragraph,
                                 const WordStylesParser& styles) const;
};

}} // namespace styleverify::reader
