#include "styleverify/verify/MismatchAggregator.hpp"
#include <gtest/gtest.h>
#include <random>

using namespace styleverify::core;
using namespace styleverify::verify;

class MismatchAggregatorTest : public ::testing::Test {
protected:
    static RawDiscrepancy raw(const std::string& key, MismatchCategory category,
                              std::vector<FieldMismatch> fields,
                              const std::string& role = "Body") {
        RawDiscrepancy d;
        d.context_key = key;
        d.location = "Paragraph " + key;
        d.structural_role = role;
        d.category = category;
        d.fields = std::move(fields);
        return d;
    }

    MismatchAggregator aggregator_;
};

TEST_F(MismatchAggregatorTest, SortsFieldsAndRendersValues) {
    auto mismatches = aggregator_.aggregate({
        raw("p1", MismatchCategory::Style,
            {{"fontSize", "12", "14", ""}, {"color", "(default)", "FF0000", ""}}),
    });
    ASSERT_EQ(mismatches.size(), 1u);
    EXPECT_EQ(mismatches[0].mismatchFields(), "color,fontSize");
    EXPECT_EQ(mismatches[0].expected, "color=(default); fontSize=12");
    EXPECT_EQ(mismatches[0].actual, "color=FF0000; fontSize=14");
    EXPECT_EQ(mismatches[0].severity, Severity::High);
    EXPECT_EQ(mismatches[0].recommended_action, recommendedActionFor(Severity::High));
}

TEST_F(MismatchAggregatorTest, ScopeExtendsLocation) {
    auto mismatches = aggregator_.aggregate({
        raw("p1", MismatchCategory::DirectFormat, {{"DirectFormat:bold", "bold=1", "(absent)", "Run:2"}}),
    });
    ASSERT_EQ(mismatches.size(), 1u);
    EXPECT_EQ(mismatches[0].location, "Paragraph p1 > Run:2");
}

TEST_F(MismatchAggregatorTest, DeduplicatesAndKeepsHighestSeverity) {
    auto mismatches = aggregator_.aggregate({
        raw("p1", MismatchCategory::TabStop, {{"x", "a", "b", ""}}),
        raw("p1", MismatchCategory::Style, {{"x", "a", "c", ""}}),
        raw("p1", MismatchCategory::TabStop, {{"x", "a", "b", ""}}),
    });
    ASSERT_EQ(mismatches.size(), 1u);
    EXPECT_EQ(mismatches[0].severity, Severity::High);
    EXPECT_EQ(mismatches[0].category, MismatchCategory::Style);
    EXPECT_EQ(mismatches[0].expected, "x=a");
    EXPECT_EQ(mismatches[0].actual, "x=b | x=c");
}

TEST_F(MismatchAggregatorTest, MergeKeepsValueThatIsPrefixOfAnother) {
    auto mismatches = aggregator_.aggregate({
        raw("p1", MismatchCategory::Style, {{"color", "000000", "FF0000", ""}}),
        raw("p1", MismatchCategory::Style, {{"color", "000000", "FF", ""}}),
        raw("p1", MismatchCategory::Style, {{"color", "000000", "FF0000", ""}}),
    });
    ASSERT_EQ(mismatches.size(), 1u);
    EXPECT_EQ(mismatches[0].expected, "color=000000");
    EXPECT_EQ(mismatches[0].actual, "color=FF0000 | color=FF");
}

TEST_F(MismatchAggregatorTest, HeadingEscalation) {
    auto mismatches = aggregator_.aggregate({
        raw("p1", MismatchCategory::TabStop, {{"TabStopCountMismatch", "2", "1", ""}}, "Heading2"),
        raw("p2", MismatchCategory::TabStop, {{"TabStopCountMismatch", "2", "1", ""}}, "Body"),
    });
    ASSERT_EQ(mismatches.size(), 2u);
    EXPECT_EQ(mismatches[0].context_key, "p1");
    EXPECT_EQ(mismatches[0].severity, Severity::High);
    EXPECT_EQ(mismatches[1].severity, Severity::Medium);

    SeverityPolicy flat;
    flat.escalated_role_prefixes.clear();
    auto unescalated = MismatchAggregator(flat).aggregate({
        raw("p1", MismatchCategory::TabStop, {{"TabStopCountMismatch", "2", "1", ""}}, "Heading2"),
    });
    EXPECT_EQ(unescalated[0].severity, Severity::Medium);
}

TEST_F(MismatchAggregatorTest, OrderingLaw) {
    const MismatchCategory categories[] = {MismatchCategory::Style, MismatchCategory::TabStop,
                                           MismatchCategory::DirectFormat,
                                           MismatchCategory::MissingInDocument};
    std::mt19937 rng(7);
    std::vector<RawDiscrepancy> input;
    for (int i = 0; i < 60; ++i) {
        const std::string key = "p" + std::to_string(rng() % 12);
        const std::string field = "f" + std::to_string(rng() % 5);
        input.push_back(raw(key, categories[rng() % 4], {{field, "e", "a", ""}},
                            (rng() % 3 == 0) ? "Heading1" : "Body"));
    }

    auto mismatches = aggregator_.aggregate(input);
    ASSERT_FALSE(mismatches.empty());
    EXPECT_TRUE(MismatchAggregator::isOrdered(mismatches));
    for (size_t i = 1; i < mismatches.size(); ++i) {
        const auto& prev = mismatches[i - 1];
        const auto& cur = mismatches[i];
        if (prev.severity == cur.severity && prev.context_key == cur.context_key) {
            EXPECT_LT(prev.fields, cur.fields);
        }
    }
}

TEST_F(MismatchAggregatorTest, EmptyFieldListsIgnored) {
    EXPECT_TRUE(aggregator_.aggregate({raw("p1", MismatchCategory::Style, {})}).empty());
}
