#include "styleverify/reader/DocxContextExtractor.hpp"
#include "styleverify/archive/ZipReader.hpp"
#include "styleverify/core/Constants.hpp"
#include "styleverify/utils/ModuleLoggers.hpp"
#include "styleverify/verify/StyleSignatureBuilder.hpp"
#include "styleverify/utils/StringUtils.hpp"
#include <fmt/format.h>
#include <cctype>

namespace styleverify {
namespace reader {

using core::ErrorCode;
using core::makeError;
using utils::StringUtils;

namespace {

const char* const kDocumentPart = "word/document.xml";
const char* const kStylesPart = "word/styles.xml";
const char* const kNumberingPart = "word/numbering.xml";

// "heading 1" -> 1，非 "<prefix><数字>" 形式返回 -1
int numberedSuffix(const std::string& normalized, const std::string& prefix) {
    if (normalized.size() <= prefix.size() || normalized.compare(0, prefix.size(), prefix) != 0) {
        return -1;
    }
    int value = 0;
    for (size_t i = prefix.size(); i < normalized.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(normalized[i]))) {
            return -1;
        }
        value = value * 10 + (normalized[i] - '0');
    }
    return value;
}

std::string normalizeStyleName(const std::string& name) {
    std::string normalized;
    for (char c : StringUtils::toLower(name)) {
        if (c != ' ' && c != '_' && c != '-') {
            normalized.push_back(c);
        }
    }
    return normalized;
}

} // anonymous namespace

std::string DocxContextExtractor::structuralRoleFor(const std::string& style_id,
                                                    const std::string& style_name,
                                                    bool numbered) {
    for (const std::string& candidate : {style_name, style_id}) {
        const std::string normalized = normalizeStyleName(candidate);
        if (normalized.empty()) continue;

        if (int level = numberedSuffix(normalized, "heading"); level > 0) {
            return fmt::format("Heading{}", level);
        }
        if (int level = numberedSuffix(normalized, "toc"); level > 0) {
            return fmt::format("TOC{}", level);
        }
        if (normalized == "title") return "Title";
        if (normalized == "subtitle") return "Subtitle";
        if (normalized == "caption") return "Caption";
        if (normalized == "quote" || normalized == "intensequote") return "Quote";
        if (normalized == "listparagraph") return "ListItem";
    }
    return numbered ? "ListItem" : "Body";
}

std::string DocxContextExtractor::contextKeyFor(const WordParagraph& paragraph) {
    if (paragraph.table_index < 0) {
        return fmt::format("Paragraph:{}", paragraph.paragraph_index);
    }
    return fmt::format("Table:{}:Row:{}:Cell:{}:Paragraph:{}",
                       paragraph.table_index, paragraph.row_index,
                       paragraph.cell_index, paragraph.paragraph_index);
}

core::VoidResult DocxContextExtractor::openPackage(archive::ZipReader& zip, const std::string& document_name) {
    archive::ZipError zip_result = zip.open();
    if (archive::isError(zip_result)) {
        return makeError(ErrorCode::ExtractionFailed,
                         fmt::format("not a readable .docx package ({})", archive::toString(zip_result)),
                         document_name);
    }
    return {};
}

core::Result<bool> DocxContextExtractor::parseOptionalPart(archive::ZipReader& zip, const char* part,
                                                           BaseSAXParser& parser,
                                                           const std::string& document_name) {
    if (zip.fileExists(part) != archive::ZipError::Ok) {
        return false;
    }
    std::string xml;
    archive::ZipError zip_result = zip.extractFile(part, xml);
    if (archive::isError(zip_result)) {
        return makeError(ErrorCode::ExtractionFailed,
                         fmt::format("cannot read {} ({})", part, archive::toString(zip_result)),
                         document_name);
    }
    if (!parser.parseXML(xml)) {
        return makeError(ErrorCode::ExtractionFailed,
                         fmt::format("invalid {}: {}", part, parser.getErrorMessage()),
                         document_name);
    }
    return true;
}

core::Result<core::DocumentContexts> DocxContextExtractor::extractContexts(
    const std::vector<uint8_t>& document_bytes, const std::string& document_name) const {

    if (document_bytes.empty()) {
        return makeError(ErrorCode::ExtractionFailed, "document is empty", document_name);
    }

    archive::ZipReader zip = archive::ZipReader::fromMemory(document_bytes, document_name);
    if (auto opened = openPackage(zip, document_name); !opened) {
        return opened.error();
    }

    std::string document_xml;
    archive::ZipError zip_result = zip.extractFile(kDocumentPart, document_xml);
    if (archive::isError(zip_result)) {
        return makeError(ErrorCode::ExtractionFailed,
                         fmt::format("cannot read {} ({})", kDocumentPart, archive::toString(zip_result)),
                         document_name);
    }

    WordStylesParser styles;
    auto has_styles = parseOptionalPart(zip, kStylesPart, styles, document_name);
    if (!has_styles) {
        return has_styles.error();
    }
    if (!*has_styles) {
        READER_WARN("Document '{}' has no {}, using built-in defaults", document_name, kStylesPart);
    }

    WordDocumentParser document;
    if (!document.parseXML(document_xml)) {
        return makeError(ErrorCode::ExtractionFailed,
                         fmt::format("invalid {}: {}", kDocumentPart, document.getErrorMessage()),
                         document_name);
    }

    const verify::StyleSignatureBuilder signatures;
    core::DocumentContexts contexts;
    contexts.reserve(document.getParagraphs().size());
    for (const auto& paragraph : document.getParagraphs()) {
        if (StringUtils::trim(paragraph.text()).empty()) {
            continue;
        }
        core::TextStyle context = buildContext(paragraph, styles);
        signatures.apply(context);
        contexts.push_back(std::move(context));
    }

    READER_INFO("Extracted {} formatting contexts from '{}' ({} paragraphs, {} tables, {} styles)",
                contexts.size(), document_name, document.getParagraphs().size(),
                document.getTableCount(), styles.getStyles().size());
    return contexts;
}

core::DefaultStyle DocxContextExtractor::toDefaultStyle(const WordStyleDefinition& definition) {
    core::DefaultStyle style;
    style.style_id = definition.style_id;
    style.name = definition.name.empty() ? definition.style_id : definition.name;
    style.type = definition.type;
    style.based_on = definition.based_on;
    style.next_style = definition.next_style;
    style.is_default = definition.is_default;
    style.is_custom = definition.is_custom;
    style.priority = definition.priority;
    style.is_hidden = definition.is_hidden;
    style.is_quick_style = definition.is_quick_style;
    style.properties = definition.properties;
    style.tab_stops = definition.tab_stops;
    return style;
}

core::Result<TemplateCatalog> DocxContextExtractor::extractCatalog(
    const std::vector<uint8_t>& document_bytes, const std::string& document_name) const {

    if (document_bytes.empty()) {
        return makeError(ErrorCode::ExtractionFailed, "document is empty", document_name);
    }

    archive::ZipReader zip = archive::ZipReader::fromMemory(document_bytes, document_name);
    if (auto opened = openPackage(zip, document_name); !opened) {
        return opened.error();
    }

    TemplateCatalog catalog;

    WordStylesParser styles;
    auto has_styles = parseOptionalPart(zip, kStylesPart, styles, document_name);
    if (!has_styles) {
        return has_styles.error();
    }
    for (const auto& style_id : styles.getStyleOrder()) {
        if (const WordStyleDefinition* definition = styles.findStyle(style_id)) {
            catalog.default_styles.push_back(toDefaultStyle(*definition));
        }
    }

    WordNumberingParser numbering;
    auto has_numbering = parseOptionalPart(zip, kNumberingPart, numbering, document_name);
    if (!has_numbering) {
        return has_numbering.error();
    }
    if (*has_numbering) {
        catalog.numbering_definitions = numbering.getDefinitions();
    }

    READER_INFO("Catalog of '{}': {} styles, {} numbering definitions ({} instances)",
                document_name, catalog.default_styles.size(), catalog.numbering_definitions.size(),
                numbering.getInstanceCount());
    return catalog;
}

core::TextStyle DocxContextExtractor::buildContext(const WordParagraph& paragraph,
                                                   const WordStylesParser& styles) const {
    const std::string style_id = paragraph.style_id.empty()
                                     ? styles.defaultParagraphStyleId()
                                     : paragraph.style_id;
    const std::string style_name = styles.displayName(style_id);

    core::TextStyle context;
    context.name = style_name;
    context.style_type = core::StyleType::Paragraph;
    if (const WordStyleDefinition* definition = styles.findStyle(style_id)) {
        context.based_on = definition->based_on;
    }

    context.properties = styles.resolveProperties(style_id);
    context.properties.mergeFrom(paragraph.properties);

    // 每个文本段的字符格式：字符样式 <- 直接格式
    std::vector<size_t> text_runs;
    std::vector<core::StyleProperties> run_properties;
    for (size_t i = 0; i < paragraph.runs.size(); ++i) {
        const WordRun& run = paragraph.runs[i];
        core::StyleProperties props;
        if (!run.char_style_id.empty()) {
            props = styles.resolveProperties(run.char_style_id, false);
        }
        props.mergeFrom(run.properties);
        run_properties.push_back(std::move(props));
        if (!run.text.empty()) {
            text_runs.push_back(i);
        }
    }

    // 所有文本段共有的格式归入段落属性
    // 遍历原始键：显式写回缺省值（b=0、color=auto）也必须覆盖样式中的取值
    core::StyleProperties common;
    if (!text_runs.empty()) {
        const core::StyleProperties& first = run_properties[text_runs.front()];
        for (const auto& [key, raw] : first) {
            const auto value = core::StyleProperties::canonicalValue(key, raw);
            bool shared = true;
            for (size_t index : text_runs) {
                auto other = run_properties[index].get(key);
                if (!other || core::StyleProperties::canonicalValue(key, *other) != value) {
                    shared = false;
                    break;
                }
            }
            if (shared) {
                common.set(key, raw);
            }
        }
    }
    context.properties.mergeFrom(common);

    // 其余差异记为直接格式模式
    for (size_t index : text_runs) {
        core::StyleProperties overrides;
        std::vector<std::string> keys;
        for (const auto& [key, raw] : run_properties[index]) {
            if (!common.has(key)) {
                overrides.set(key, raw);
                keys.push_back(key);
            }
        }
        if (overrides.empty()) {
            continue;
        }
        core::DirectFormatPattern pattern;
        pattern.pattern_name = StringUtils::join(keys, "+");
        pattern.context = fmt::format("Run:{}", index);
        pattern.properties = std::move(overrides);
        pattern.sample_text = StringUtils::truncateUtf8(paragraph.runs[index].text,
                                                        core::Constants::kMaxSampleTextLength);
        context.direct_format_patterns.push_back(std::move(pattern));
    }

    context.tab_stops = styles.resolveTabStops(style_id);
    mergeTabStops(context.tab_stops, paragraph.tab_stops);

    const std::string text = paragraph.text();
    core::FormattingContext& fc = context.formatting_context;
    fc.element_type = paragraph.table_index < 0 ? "Paragraph" : "TableCell";
    fc.context_key = contextKeyFor(paragraph);
    fc.structural_role = structuralRoleFor(style_id, style_name, paragraph.numbered);
    fc.style_name = style_name;
    fc.sample_text = StringUtils::truncateUtf8(text, core::Constants::kMaxSampleTextLength);
    fc.section_index = paragraph.section_index;
    fc.table_index = paragraph.table_index;
    fc.row_index = paragraph.row_index;
    fc.cell_index = paragraph.cell_index;
    fc.paragraph_index = paragraph.paragraph_index;
    if (paragraph.table_index >= 0) {
        fc.parent_context = fmt::format("Table:{}:Row:{}:Cell:{}",
                                        paragraph.table_index, paragraph.row_index, paragraph.cell_index);
    }
    if (paragraph.numbered) {
        fc.content_control_properties["numbered"] = "1";
    }

    return context;
}

}} // namespace styleverify::reader
