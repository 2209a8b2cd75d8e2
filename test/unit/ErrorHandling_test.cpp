#include "styleverify/core/Exception.hpp"
#include "styleverify/core/Expected.hpp"
#include <gtest/gtest.h>
#include <string>

using namespace styleverify::core;

namespace {

Result<int> parsePositive(int value) {
    if (value <= 0) {
        return makeError(ErrorCode::InvalidArgument, "value must be positive", std::to_string(value));
    }
    return value;
}

} // anonymous namespace

TEST(ExpectedTest, CarriesValueOrError) {
    auto ok = parsePositive(5);
    ASSERT_TRUE(ok);
    EXPECT_EQ(*ok, 5);
    EXPECT_EQ(ok.valueOr(0), 5);

    auto bad = parsePositive(-1);
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(bad.error().fullMessage(), "value must be positive (Context: -1)");
    EXPECT_EQ(bad.valueOr(7), 7);
}

TEST(ExpectedTest, MapAndThenShortCircuitOnError) {
    auto doubled = parsePositive(4).map([](int v) { return v * 2; });
    ASSERT_TRUE(doubled);
    EXPECT_EQ(*doubled, 8);

    bool called = false;
    auto chained = parsePositive(0).andThen([&](int v) { called = true; return parsePositive(v); });
    EXPECT_FALSE(called);
    EXPECT_FALSE(chained);
}

TEST(ExpectedTest, ValueOrThrowMapsErrorCodeToException) {
    EXPECT_THROW(parsePositive(-3).valueOrThrow(), ParameterException);

    Result<int> missing = makeError(ErrorCode::TemplateInactive, "template 'report' is inactive");
    try {
        missing.valueOrThrow();
        FAIL() << "expected TemplateException";
    } catch (const TemplateException& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::TemplateInactive);
    }

    Result<int> file = makeError(ErrorCode::FileNotFound, "cannot open file", "a.docx");
    EXPECT_THROW(file.valueOrThrow(), FileException);

    Result<int> zip = makeError(ErrorCode::ExtractionFailed, "not a zip archive");
    EXPECT_THROW(zip.valueOrThrow(), ExtractionException);

    Result<int> xml = makeError(ErrorCode::XmlParseError, "mismatched tag");
    EXPECT_THROW(xml.valueOrThrow(), XMLException);

    Result<int> defect = makeError(ErrorCode::ComparatorDefect, "boom");
    EXPECT_THROW(defect.valueOrThrow(), ComparatorException);

    Result<int> other = makeError(ErrorCode::Cancelled, "cancelled");
    try {
        other.valueOrThrow();
        FAIL() << "expected StyleVerifyException";
    } catch (const StyleVerifyException& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::Cancelled);
    }
}

TEST(StyleVerifyExceptionTest, DetailedMessageIncludesContextChain) {
    StyleVerifyException e("comparison aborted", ErrorCode::ComparatorDefect, "Engine.cpp", 42);
    e.addContext("pair Paragraph:3");
    e.addContext("template report");

    const std::string detail = e.getDetailedMessage();
    EXPECT_NE(detail.find("[ComparatorDefect] comparison aborted"), std::string::npos);
    EXPECT_NE(detail.find("(at Engine.cpp:42)"), std::string::npos);
    EXPECT_NE(detail.find("  - pair Paragraph:3"), std::string::npos);

    Error error = e.toError();
    EXPECT_EQ(error.code, ErrorCode::ComparatorDefect);
    EXPECT_EQ(error.context, "pair Paragraph:3; template report");
}

TEST(ErrorCodeTest, NamesAreStable) {
    EXPECT_STREQ(errorCodeName(ErrorCode::ExtractionFailed), "ExtractionFailed");
    EXPECT_STREQ(errorCodeName(ErrorCode::TemplateInactive), "TemplateInactive");
    EXPECT_STREQ(toString(ErrorCode::TemplateInactive), "Template is not active");
}
