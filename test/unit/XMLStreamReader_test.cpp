#include "styleverify/xml/XMLStreamReader.hpp"

#include <gtest/gtest.h>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace styleverify {
namespace xml {

class XMLStreamReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        reader_ = std::make_unique<XMLStreamReader>();
    }

    void TearDown() override {
        reader_.reset();
    }

    std::unique_ptr<XMLStreamReader> reader_;

    const std::string simple_xml_ = R"(<?xml version="1.0" encoding="UTF-8"?>
<root>
    <element attr="value">Text content</element>
    <empty_element/>
    <parent>
        <child>Child text</child>
        <child>Another child</child>
    </parent>
</root>)";

    const std::string word_xml_ = R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>
<w:document xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main">
    <w:body>
        <w:p><w:pPr><w:pStyle w:val="Heading1"/></w:pPr><w:r><w:t xml:space="preserve"> Title </w:t></w:r></w:p>
    </w:body>
</w:document>)";
};

// 测试1: 基本解析功能
TEST_F(XMLStreamReaderTest, BasicParsing) {
    std::vector<std::string> elements;
    std::vector<std::string> texts;

    reader_->setStartElementCallback([&](std::string_view name, const std::vector<XMLAttribute>&, int) {
        elements.emplace_back(name);
    });
    reader_->setTextCallback([&](std::string_view text, int) {
        texts.emplace_back(text);
    });

    XMLParseError result = reader_->parseFromString(simple_xml_);
    EXPECT_EQ(result, XMLParseError::Ok);

    ASSERT_EQ(elements.size(), 6u);
    EXPECT_EQ(elements[0], "root");
    EXPECT_EQ(elements[5], "child");
    EXPECT_EQ(reader_->getElementsParsed(), 6u);

    // 只有叶子元素产生文本事件
    ASSERT_EQ(texts.size(), 3u);
    EXPECT_EQ(texts[0], "Text content");
    EXPECT_EQ(texts[2], "Another child");
}

// 测试2: 属性解析
TEST_F(XMLStreamReaderTest, AttributeParsing) {
    std::map<std::string, std::string> found;
    reader_->setStartElementCallback([&](std::string_view, const std::vector<XMLAttribute>& attributes, int) {
        for (const auto& attr : attributes) {
            found[std::string(attr.name)] = std::string(attr.value);
        }
    });

    EXPECT_EQ(reader_->parseFromString(word_xml_), XMLParseError::Ok);
    EXPECT_EQ(found["w:val"], "Heading1");
    EXPECT_EQ(found["xml:space"], "preserve");
}

// 测试3: 深度与结束事件
TEST_F(XMLStreamReaderTest, DepthTracking) {
    std::map<std::string, int> start_depth;
    std::vector<std::pair<std::string, int>> ends;

    reader_->setStartElementCallback([&](std::string_view name, const std::vector<XMLAttribute>&, int depth) {
        start_depth.emplace(std::string(name), depth);
    });
    reader_->setEndElementCallback([&](std::string_view name, int depth) {
        ends.emplace_back(std::string(name), depth);
    });

    ASSERT_EQ(reader_->parseFromString(word_xml_), XMLParseError::Ok);
    EXPECT_EQ(start_depth["w:document"], 0);
    EXPECT_EQ(start_depth["w:p"], 2);
    EXPECT_EQ(start_depth["w:t"], 4);
    ASSERT_FALSE(ends.empty());
    EXPECT_EQ(ends.back().first, "w:document");
    EXPECT_EQ(ends.back().second, 0);
}

// 测试4: 空白保留
TEST_F(XMLStreamReaderTest, WhitespaceTrimming) {
    std::string text;
    reader_->setTextCallback([&](std::string_view value, int) { text = std::string(value); });

    ASSERT_EQ(reader_->parseFromString(word_xml_), XMLParseError::Ok);
    EXPECT_EQ(text, "Title");

    reader_->setTrimWhitespace(false);
    ASSERT_EQ(reader_->parseFromString(word_xml_), XMLParseError::Ok);
    EXPECT_EQ(text, " Title ");
}

// 测试5: 错误处理
TEST_F(XMLStreamReaderTest, ErrorHandling) {
    int reported_line = 0;
    reader_->setErrorCallback([&](XMLParseError, const std::string&, int line, int) {
        reported_line = line;
    });

    XMLParseError result = reader_->parseFromString("<root>\n<unclosed>\n</root>");
    EXPECT_EQ(result, XMLParseError::ParseFailed);
    EXPECT_EQ(reader_->getLastError(), XMLParseError::ParseFailed);
    EXPECT_FALSE(reader_->getLastErrorMessage().empty());
    EXPECT_EQ(reader_->getErrorLine(), 3);
    EXPECT_EQ(reported_line, 3);

    EXPECT_EQ(reader_->parseFromString(""), XMLParseError::InvalidInput);
    EXPECT_EQ(reader_->parseFromBuffer(nullptr, 10), XMLParseError::InvalidInput);
}

// 测试6: 回调异常中止解析
TEST_F(XMLStreamReaderTest, CallbackExceptionStopsParsing) {
    int seen = 0;
    reader_->setStartElementCallback([&](std::string_view name, const std::vector<XMLAttribute>&, int) {
        ++seen;
        if (name == "parent") {
            throw std::runtime_error("handler failed");
        }
    });

    EXPECT_EQ(reader_->parseFromString(simple_xml_), XMLParseError::CallbackError);
    EXPECT_EQ(seen, 4);
    EXPECT_NE(reader_->getLastErrorMessage().find("handler failed"), std::string::npos);
}

// 测试7: 解析器可重复使用
TEST_F(XMLStreamReaderTest, ReaderIsReusable) {
    size_t count = 0;
    reader_->setStartElementCallback([&](std::string_view, const std::vector<XMLAttribute>&, int) { ++count; });

    ASSERT_EQ(reader_->parseFromString("<broken>"), XMLParseError::ParseFailed);
    count = 0;
    ASSERT_EQ(reader_->parseFromString(simple_xml_), XMLParseError::Ok);
    EXPECT_EQ(count, 6u);
    EXPECT_EQ(reader_->getLastError(), XMLParseError::Ok);
    EXPECT_EQ(reader_->getBytesParsed(), simple_xml_.size());
}

// 测试8: 较大文档
TEST_F(XMLStreamReaderTest, LargeDocument) {
    std::string xml = "<w:body xmlns:w=\"urn:test\">";
    for (int i = 0; i < 5000; ++i) {
        xml += "<w:p><w:r><w:t>Paragraph " + std::to_string(i) + "</w:t></w:r></w:p>";
    }
    xml += "</w:body>";

    size_t texts = 0;
    reader_->setTextCallback([&](std::string_view, int) { ++texts; });
    ASSERT_EQ(reader_->parseFromString(xml), XMLParseError::Ok);
    EXPECT_EQ(texts, 5000u);
    EXPECT_EQ(reader_->getElementsParsed(), 15001u);
}

}} // namespace styleverify::xml
