#include "styleverify/core/StyleProperties.hpp"
#include <gtest/gtest.h>

using namespace styleverify::core;

class StylePropertiesTest : public ::testing::Test {
protected:
    static std::optional<std::string> canon(const std::string& key, const std::string& raw) {
        return StyleProperties::canonicalValue(key, raw);
    }
};

TEST_F(StylePropertiesTest, NumbersAreRoundedAndUnitStripped) {
    EXPECT_EQ(canon(PropertyKey::FontSize, "12.0"), "12");
    EXPECT_EQ(canon(PropertyKey::FontSize, "12pt"), "12");
    EXPECT_EQ(canon(PropertyKey::FontSize, " 10.504 "), "10.5");
    EXPECT_EQ(canon(PropertyKey::SpacingAfter, "0"), std::nullopt);
    EXPECT_EQ(canon(PropertyKey::LineSpacing, "1.0"), std::nullopt);
}

TEST_F(StylePropertiesTest, BooleansDropFalse) {
    EXPECT_EQ(canon(PropertyKey::Bold, "true"), "1");
    EXPECT_EQ(canon(PropertyKey::Bold, "on"), "1");
    EXPECT_EQ(canon(PropertyKey::Bold, "0"), std::nullopt);
    EXPECT_EQ(canon(PropertyKey::Italic, "false"), std::nullopt);
}

TEST_F(StylePropertiesTest, ColorsAreNormalizedToUpperHex) {
    EXPECT_EQ(canon(PropertyKey::Color, "#ff0000"), "FF0000");
    EXPECT_EQ(canon(PropertyKey::Color, "FF0000"), "FF0000");
    EXPECT_EQ(canon(PropertyKey::Color, "#000000"), std::nullopt);
    EXPECT_EQ(canon(PropertyKey::Color, "auto"), std::nullopt);
}

TEST_F(StylePropertiesTest, AlignmentSynonyms) {
    EXPECT_EQ(canon(PropertyKey::Alignment, "both"), "justify");
    EXPECT_EQ(canon(PropertyKey::Alignment, "CENTER"), "center");
    EXPECT_EQ(canon(PropertyKey::Alignment, "start"), std::nullopt);
}

TEST_F(StylePropertiesTest, CaselessAndTextKinds) {
    EXPECT_EQ(canon(PropertyKey::FontFamily, " Times New Roman "), "times new roman");
    EXPECT_EQ(canon("customKey", " Value "), "Value");
    EXPECT_EQ(canon("customKey", "   "), std::nullopt);
}

TEST_F(StylePropertiesTest, CanonicalDropsDefaults) {
    StyleProperties props{{PropertyKey::Bold, "0"},
                          {PropertyKey::FontSize, "11.00"},
                          {PropertyKey::Color, "auto"},
                          {PropertyKey::Alignment, "center"}};
    StyleProperties canonical = props.canonical();
    EXPECT_EQ(canonical.size(), 2u);
    EXPECT_EQ(canonical.getOr(PropertyKey::FontSize, ""), "11");
    EXPECT_EQ(canonical.getOr(PropertyKey::Alignment, ""), "center");
}

TEST_F(StylePropertiesTest, MergeOverridesExistingKeys) {
    StyleProperties base{{PropertyKey::FontFamily, "Calibri"}, {PropertyKey::FontSize, "11"}};
    StyleProperties overrides{{PropertyKey::FontSize, "14"}, {PropertyKey::Bold, "1"}};
    base.mergeFrom(overrides);
    EXPECT_EQ(base.getFontFamily(), "Calibri");
    EXPECT_DOUBLE_EQ(base.getFontSize().value_or(0), 14.0);
    EXPECT_TRUE(base.isBold());
}

TEST_F(StylePropertiesTest, NumericDefaults) {
    EXPECT_EQ(StyleProperties::numericDefault(PropertyKey::LineSpacing), 1.0);
    EXPECT_EQ(StyleProperties::numericDefault(PropertyKey::FontSize), 0.0);
    EXPECT_EQ(StyleProperties::numericDefault(PropertyKey::Color), std::nullopt);
}
