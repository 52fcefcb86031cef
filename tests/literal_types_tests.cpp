#include <gtest/gtest.h>

#include <owl_serialise/literal_types.hpp>

using owl_serialise::LiteralType;
using owl_serialise::infer_literal_type;
using owl_serialise::quote_literal;
using owl_serialise::typed_literal;

TEST(LiteralTypesTests, Integers)
{
    EXPECT_EQ(infer_literal_type("0"), LiteralType::Integer);
    EXPECT_EQ(infer_literal_type("1970"), LiteralType::Integer);
    EXPECT_EQ(infer_literal_type("-3"), LiteralType::String);
    EXPECT_EQ(infer_literal_type("3.5"), LiteralType::String);
    EXPECT_EQ(infer_literal_type(""), LiteralType::String);
}

TEST(LiteralTypesTests, Dates)
{
    EXPECT_EQ(infer_literal_type("1970-01-01"), LiteralType::Date);
    EXPECT_EQ(infer_literal_type("2000-02-29"), LiteralType::Date);
    EXPECT_EQ(infer_literal_type("1900-02-29"), LiteralType::String);
    EXPECT_EQ(infer_literal_type("1970-13-01"), LiteralType::String);
    EXPECT_EQ(infer_literal_type("1970-1-1"), LiteralType::String);
    EXPECT_EQ(infer_literal_type("1970-04-31"), LiteralType::String);
}

TEST(LiteralTypesTests, DateTimes)
{
    EXPECT_EQ(infer_literal_type("1970-01-01T12:30:00"), LiteralType::DateTime);
    EXPECT_EQ(infer_literal_type("1970-01-01T12:30:00Z"), LiteralType::DateTime);
    EXPECT_EQ(infer_literal_type("1970-01-01T12:30:00.250+01:00"), LiteralType::DateTime);
    EXPECT_EQ(infer_literal_type("1970-01-01T12:30:00-05:30"), LiteralType::DateTime);
    EXPECT_EQ(infer_literal_type("1970-01-01T24:00:00"), LiteralType::String);
    EXPECT_EQ(infer_literal_type("1970-01-01 12:30:00"), LiteralType::String);
    EXPECT_EQ(infer_literal_type("1970-01-01T12-30-00"), LiteralType::String);
}

TEST(LiteralTypesTests, TypedLiterals)
{
    EXPECT_EQ(typed_literal("42"), "\"42\"^^xsd:integer");
    EXPECT_EQ(typed_literal("1970-01-01"), "\"1970-01-01\"^^xsd:date");
    EXPECT_EQ(typed_literal("1970-01-01T00:00:00Z"), "\"1970-01-01T00:00:00Z\"^^xsd:dateTime");
    EXPECT_EQ(typed_literal("Oslo"), "\"Oslo\"");
}

TEST(LiteralTypesTests, QuotingEscapes)
{
    EXPECT_EQ(quote_literal("say \"hi\""), "\"say \\\"hi\\\"\"");
    EXPECT_EQ(quote_literal("C:\\data"), "\"C:\\\\data\"");
}
