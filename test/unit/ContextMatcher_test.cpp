#include "styleverify/verify/ContextMatcher.hpp"
#include "StyleTestHelpers.hpp"
#include <gtest/gtest.h>
#include <set>

using namespace styleverify;
using namespace styleverify::core;
using styleverify::verify::ContextMatcher;
using styleverify::verify::MatchKind;
using styleverify::verify::MatchResult;

class ContextMatcherTest : public ::testing::Test {
protected:
    // 每个模板样式恰好出现一次（已匹配或缺失），每个文档上下文恰好出现一次（已匹配或多余）
    static void expectTotal(const MatchResult& result,
                            const std::vector<TextStyle>& tmpl,
                            const DocumentContexts& doc) {
        std::multiset<const TextStyle*> template_side;
        std::multiset<const TextStyle*> document_side;
        for (const auto& pair : result.matched) {
            template_side.insert(pair.template_style);
            document_side.insert(pair.document_style);
        }
        for (const auto* style : result.missing_in_document) template_side.insert(style);
        for (const auto* style : result.unexpected_in_document) document_side.insert(style);

        EXPECT_EQ(template_side.size(), tmpl.size());
        for (const auto& style : tmpl) EXPECT_EQ(template_side.count(&style), 1u);
        EXPECT_EQ(document_side.size(), doc.size());
        for (const auto& context : doc) EXPECT_EQ(document_side.count(&context), 1u);
    }

    ContextMatcher matcher_;
};

TEST_F(ContextMatcherTest, MatchesByContextKey) {
    std::vector<TextStyle> tmpl = {test::makeContext(1, "Heading 1", "p1", "Heading1"),
                                   test::makeContext(2, "Normal", "p2")};
    DocumentContexts doc = {test::makeContext(0, "Normal", "p2"),
                            test::makeContext(0, "Heading 1", "p1", "Heading1")};

    MatchResult result = matcher_.match(tmpl, doc);
    ASSERT_EQ(result.matched.size(), 2u);
    EXPECT_EQ(result.matched[0].template_style, &tmpl[0]);
    EXPECT_EQ(result.matched[0].document_style, &doc[1]);
    EXPECT_EQ(result.matched[0].kind, MatchKind::ContextKey);
    EXPECT_EQ(result.matched[1].document_index, 0u);
    EXPECT_TRUE(result.missing_in_document.empty());
    EXPECT_TRUE(result.unexpected_in_document.empty());
    expectTotal(result, tmpl, doc);
}

TEST_F(ContextMatcherTest, FallsBackToElementTypeAndRole) {
    std::vector<TextStyle> tmpl = {test::makeContext(1, "Title", "p1", "Title")};
    DocumentContexts doc = {test::makeContext(0, "Normal", "p1"),
                            test::makeContext(0, "Title", "p2", "Title")};

    MatchResult result = matcher_.match(tmpl, doc);
    ASSERT_EQ(result.matched.size(), 1u);
    // 键 p1 优先
    EXPECT_EQ(result.matched[0].document_style, &doc[0]);
    EXPECT_EQ(result.matched[0].kind, MatchKind::ContextKey);
    ASSERT_EQ(result.unexpected_in_document.size(), 1u);
    EXPECT_EQ(result.unexpected_in_document[0], &doc[1]);

    std::vector<TextStyle> keyless = {test::makeContext(1, "Title", "", "Title")};
    result = matcher_.match(keyless, doc);
    ASSERT_EQ(result.matched.size(), 1u);
    EXPECT_EQ(result.matched[0].document_style, &doc[1]);
    EXPECT_EQ(result.matched[0].kind, MatchKind::StructuralRole);
    expectTotal(result, keyless, doc);
}

TEST_F(ContextMatcherTest, TiesBrokenByDeclarationOrder) {
    std::vector<TextStyle> tmpl = {test::makeContext(2, "B", "", "Body"),
                                   test::makeContext(1, "A", "", "Body")};
    DocumentContexts doc = {test::makeContext(0, "X", "p1"),
                            test::makeContext(0, "Y", "p2")};

    MatchResult result = matcher_.match(tmpl, doc);
    ASSERT_EQ(result.matched.size(), 2u);
    // 模板按 id 排序，id 1 先选中文档中第一个候选
    EXPECT_EQ(result.matched[0].template_style->name, "A");
    EXPECT_EQ(result.matched[0].document_style, &doc[0]);
    EXPECT_EQ(result.matched[1].template_style->name, "B");
    EXPECT_EQ(result.matched[1].document_style, &doc[1]);
}

TEST_F(ContextMatcherTest, ReportsMissingAndUnexpected) {
    std::vector<TextStyle> tmpl = {test::makeContext(1, "Heading 1", "p1", "Heading1"),
                                   test::makeContext(2, "Caption", "p9", "Caption")};
    DocumentContexts doc = {test::makeContext(0, "Heading 1", "p1", "Heading1"),
                            test::makeContext(0, "Normal", "p5")};

    MatchResult result = matcher_.match(tmpl, doc);
    ASSERT_EQ(result.missing_in_document.size(), 1u);
    EXPECT_EQ(result.missing_in_document[0]->contextKey(), "p9");
    ASSERT_EQ(result.unexpected_in_document.size(), 1u);
    EXPECT_EQ(result.unexpected_in_document[0]->contextKey(), "p5");
    expectTotal(result, tmpl, doc);
}

TEST_F(ContextMatcherTest, IgnoredTypesExcludedFromBothSides) {
    std::vector<TextStyle> tmpl = {test::makeContext(1, "Normal", "p1"),
                                   test::makeContext(2, "Strong", "r1")};
    tmpl[1].style_type = StyleType::Character;
    DocumentContexts doc = {test::makeContext(0, "Normal", "p1"),
                            test::makeContext(0, "Emphasis", "r2")};
    doc[1].style_type = StyleType::Character;

    ContextMatcher matcher({StyleType::Character});
    MatchResult result = matcher.match(tmpl, doc);
    EXPECT_EQ(result.matched.size(), 1u);
    EXPECT_TRUE(result.missing_in_document.empty());
    EXPECT_TRUE(result.unexpected_in_document.empty());
}

TEST_F(ContextMatcherTest, TotalityOnLargerInput) {
    std::vector<TextStyle> tmpl;
    DocumentContexts doc;
    for (int i = 0; i < 30; ++i) {
        const std::string role = (i % 3 == 0) ? "Heading1" : "Body";
        tmpl.push_back(test::makeContext(i + 1, "T" + std::to_string(i),
                                         (i % 4 == 0) ? "" : "p" + std::to_string(i), role));
    }
    for (int i = 0; i < 25; ++i) {
        const std::string role = (i % 5 == 0) ? "Heading1" : "Body";
        doc.push_back(test::makeContext(0, "D" + std::to_string(i), "p" + std::to_string(i * 2), role));
    }

    MatchResult result = matcher_.match(tmpl, doc);
    expectTotal(result, tmpl, doc);
}
