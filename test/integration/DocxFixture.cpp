#include "DocxFixture.hpp"

#include <mz.h>
#include <mz_strm.h>
#include <mz_strm_mem.h>
#include <mz_zip.h>
#include <mz_zip_rw.h>
#include <ctime>
#include <stdexcept>
#include <string>

namespace styleverify {
namespace test {

namespace {

const char* const kContentTypesXml = R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>
<Types xmlns="http://schemas.openxmlformats.org/package/2006/content-types">
  <Default Extension="xml" ContentType="application/xml"/>
  <Override PartName="/word/document.xml" ContentType="application/vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml"/>
  <Override PartName="/word/styles.xml" ContentType="application/vnd.openxmlformats-officedocument.wordprocessingml.styles+xml"/>
  <Override PartName="/word/numbering.xml" ContentType="application/vnd.openxmlformats-officedocument.wordprocessingml.numbering+xml"/>
</Types>)";

std::string escapeText(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            default: out += c; break;
        }
    }
    return out;
}

// 流与写入器的 RAII 包装
struct MemoryZip {
    void* stream = nullptr;
    void* writer = nullptr;

    ~MemoryZip() {
        if (writer) mz_zip_writer_delete(&writer);
        if (stream) mz_stream_mem_delete(&stream);
    }
};

} // anonymous namespace

const std::string& defaultStylesXml() {
    static const std::string xml = R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>
<w:styles xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main">
  <w:docDefaults>
    <w:rPrDefault><w:rPr><w:rFonts w:ascii="Calibri" w:hAnsi="Calibri"/><w:sz w:val="22"/></w:rPr></w:rPrDefault>
  </w:docDefaults>
  <w:style w:type="paragraph" w:default="1" w:styleId="Normal">
    <w:name w:val="Normal"/>
  </w:style>
  <w:style w:type="paragraph" w:styleId="Heading1">
    <w:name w:val="heading 1"/>
    <w:basedOn w:val="Normal"/>
    <w:pPr><w:spacing w:before="240" w:after="0"/></w:pPr>
    <w:rPr><w:b/><w:color w:val="2F5496"/><w:sz w:val="32"/></w:rPr>
  </w:style>
  <w:style w:type="paragraph" w:styleId="Caption">
    <w:name w:val="caption"/>
    <w:basedOn w:val="Normal"/>
    <w:rPr><w:i/><w:sz w:val="18"/></w:rPr>
  </w:style>
</w:styles>)";
    return xml;
}

DocxFixture::DocxFixture() : styles_xml_(defaultStylesXml()) {}

DocxFixture& DocxFixture::addParagraph(const std::string& style_id, const std::string& text,
                                       const std::string& run_properties) {
    return addParagraph(style_id, std::vector<Run>{{text, run_properties}});
}

DocxFixture& DocxFixture::addParagraph(const std::string& style_id, std::vector<Run> runs) {
    paragraphs_.push_back({style_id, std::move(runs)});
    return *this;
}

DocxFixture& DocxFixture::setStylesXml(std::string xml) {
    styles_xml_ = std::move(xml);
    include_styles_ = true;
    return *this;
}

DocxFixture& DocxFixture::withoutStyles() {
    include_styles_ = false;
    return *this;
}

DocxFixture& DocxFixture::setNumberingXml(std::string xml) {
    numbering_xml_ = std::move(xml);
    return *this;
}

std::string DocxFixture::documentXml() const {
    std::string xml = R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
                      "\n<w:document xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\"><w:body>";
    for (const auto& p : paragraphs_) {
        xml += "<w:p>";
        if (!p.style_id.empty()) {
            xml += "<w:pPr><w:pStyle w:val=\"" + p.style_id + "\"/></w:pPr>";
        }
        for (const auto& run : p.runs) {
            xml += "<w:r>";
            if (!run.run_properties.empty()) {
                xml += "<w:rPr>" + run.run_properties + "</w:rPr>";
            }
            xml += "<w:t xml:space=\"preserve\">" + escapeText(run.text) + "</w:t></w:r>";
        }
        xml += "</w:p>";
    }
    xml += "</w:body></w:document>";
    return xml;
}

std::vector<uint8_t> DocxFixture::build() const {
    std::vector<std::pair<std::string, std::string>> entries;
    entries.emplace_back("[Content_Types].xml", kContentTypesXml);
    entries.emplace_back("word/document.xml", documentXml());
    if (include_styles_) {
        entries.emplace_back("word/styles.xml", styles_xml_);
    }
    if (!numbering_xml_.empty()) {
        entries.emplace_back("word/numbering.xml", numbering_xml_);
    }
    return buildArchive(entries);
}

std::vector<uint8_t> DocxFixture::buildArchive(const std::vector<std::pair<std::string, std::string>>& entries) {
    MemoryZip zip;
    zip.stream = mz_stream_mem_create();
    if (!zip.stream) {
        throw std::runtime_error("failed to create memory stream");
    }
    mz_stream_mem_set_grow_size(zip.stream, 64 * 1024);
    if (mz_stream_open(zip.stream, nullptr, MZ_OPEN_MODE_CREATE) != MZ_OK) {
        throw std::runtime_error("failed to open memory stream");
    }

    zip.writer = mz_zip_writer_create();
    if (!zip.writer) {
        throw std::runtime_error("failed to create zip writer");
    }
    mz_zip_writer_set_compress_method(zip.writer, MZ_COMPRESS_METHOD_DEFLATE);
    if (mz_zip_writer_open(zip.writer, zip.stream, 0) != MZ_OK) {
        throw std::runtime_error("failed to open zip writer");
    }

    for (const auto& [path, content] : entries) {
        mz_zip_file file_info = {};
        file_info.filename = path.c_str();
        file_info.modified_date = std::time(nullptr);
        file_info.version_madeby = MZ_VERSION_MADEBY;
        file_info.compression_method = MZ_COMPRESS_METHOD_DEFLATE;
        file_info.flag = MZ_ZIP_FLAG_UTF8;

        std::string copy = content;
        int32_t result = mz_zip_writer_add_buffer(zip.writer, copy.data(),
                                                  static_cast<int32_t>(copy.size()), &file_info);
        if (result != MZ_OK) {
            throw std::runtime_error("failed to add entry " + path + ", error " + std::to_string(result));
        }
    }

    if (mz_zip_writer_close(zip.writer) != MZ_OK) {
        throw std::runtime_error("failed to finalize zip archive");
    }

    const void* data = nullptr;
    int32_t length = 0;
    mz_stream_mem_get_buffer(zip.stream, &data);
    mz_stream_mem_get_buffer_length(zip.stream, &length);
    if (!data || length <= 0) {
        throw std::runtime_error("zip archive is empty");
    }
    const auto* begin = static_cast<const uint8_t*>(data);
    return std::vector<uint8_t>(begin, begin + length);
}

}} // namespace styleverify::test
