#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "ConditionParser.hpp"
#include "QueryBuilder.hpp"

using namespace sqlquery;
using ::testing::ElementsAre;

class ConditionParserTest : public ::testing::Test {
protected:
    ConditionParser parser_;
};

// Comparison tests
TEST_F(ConditionParserTest, ParseEquals) {
    auto result = parser_.parse("status = active");

    EXPECT_EQ(result.type, ConditionType::Basic);
    EXPECT_EQ(result.column, "status");
    EXPECT_EQ(result.op, "=");
    EXPECT_THAT(result.values, ElementsAre(Value("active")));
}

TEST_F(ConditionParserTest, ParseTwoCharacterOperators) {
    EXPECT_EQ(parser_.parse("age >= 18").op, ">=");
    EXPECT_EQ(parser_.parse("age <= 65").op, "<=");
    EXPECT_EQ(parser_.parse("age <> 30").op, "<>");
    EXPECT_EQ(parser_.parse("age != 30").op, "!=");
}

TEST_F(ConditionParserTest, ParseWithoutSpaceAfterOperator) {
    auto result = parser_.parse("age >25");

    EXPECT_EQ(result.op, ">");
    EXPECT_THAT(result.values, ElementsAre(Value(25)));
}

TEST_F(ConditionParserTest, ParseQualifiedColumn) {
    auto result = parser_.parse("users.id < 100");

    EXPECT_EQ(result.column, "users.id");
    EXPECT_EQ(result.op, "<");
}

TEST_F(ConditionParserTest, ParseLikeKeywordsCaseInsensitive) {
    auto like = parser_.parse("name LIKE 'A%'");
    EXPECT_EQ(like.op, "LIKE");
    EXPECT_THAT(like.values, ElementsAre(Value("A%")));

    EXPECT_EQ(parser_.parse("name not like '%x'").op, "NOT LIKE");
    EXPECT_EQ(parser_.parse("name ILike bob%").op, "ILIKE");
}

TEST_F(ConditionParserTest, QuotedValueKeepsSpaces) {
    auto result = parser_.parse("title = 'hello world'");

    EXPECT_THAT(result.values, ElementsAre(Value("hello world")));
}

// List tests
TEST_F(ConditionParserTest, ParseIn) {
    auto result = parser_.parse("id in (1, 2, 3)");

    EXPECT_EQ(result.type, ConditionType::In);
    EXPECT_EQ(result.column, "id");
    EXPECT_THAT(result.values, ElementsAre(Value(1), Value(2), Value(3)));
}

TEST_F(ConditionParserTest, ParseNotInWithoutParentheses) {
    auto result = parser_.parse("status NOT IN banned,'on hold'");

    EXPECT_EQ(result.type, ConditionType::NotIn);
    EXPECT_THAT(result.values, ElementsAre(Value("banned"), Value("on hold")));
}

TEST_F(ConditionParserTest, EmptyListItemThrows) {
    EXPECT_THROW(parser_.parse("id in (1,,2)"), std::invalid_argument);
}

// Null tests
TEST_F(ConditionParserTest, ParseIsNull) {
    auto result = parser_.parse("deleted_at is null");

    EXPECT_EQ(result.type, ConditionType::Null);
    EXPECT_EQ(result.column, "deleted_at");
    EXPECT_TRUE(result.values.empty());
}

TEST_F(ConditionParserTest, ParseIsNotNullExtraSpaces) {
    auto result = parser_.parse("  email   IS   NOT   NULL ");

    EXPECT_EQ(result.type, ConditionType::NotNull);
    EXPECT_EQ(result.column, "email");
}

// Malformed input tests
TEST_F(ConditionParserTest, MissingOperatorThrows) {
    EXPECT_THROW(parser_.parse("status"), std::invalid_argument);
    EXPECT_THROW(parser_.parse(""), std::invalid_argument);
}

TEST_F(ConditionParserTest, MissingValueThrows) {
    EXPECT_THROW(parser_.parse("status ="), std::invalid_argument);
    EXPECT_THROW(parser_.parse("id in "), std::invalid_argument);
}

TEST_F(ConditionParserTest, UnknownOperatorThrows) {
    EXPECT_THROW(parser_.parse("status ~ x"), std::invalid_argument);
    EXPECT_THROW(parser_.parse("name likeness x"), std::invalid_argument);
}

// Literal tests
TEST_F(ConditionParserTest, LiteralKeywords) {
    EXPECT_TRUE(ConditionParser::parseLiteral("NULL").isNull());
    EXPECT_EQ(ConditionParser::parseLiteral("True"), Value(true));
    EXPECT_EQ(ConditionParser::parseLiteral("false"), Value(false));
}

TEST_F(ConditionParserTest, LiteralNumbers) {
    EXPECT_EQ(ConditionParser::parseLiteral("42"), Value(42));
    EXPECT_EQ(ConditionParser::parseLiteral("-7"), Value(-7));
    EXPECT_EQ(ConditionParser::parseLiteral("2.5"), Value(2.5));
    EXPECT_EQ(ConditionParser::parseLiteral(".5"), Value(0.5));
}

TEST_F(ConditionParserTest, LiteralTextStaysText) {
    EXPECT_EQ(ConditionParser::parseLiteral("12abc"), Value("12abc"));
    EXPECT_EQ(ConditionParser::parseLiteral("'42'"), Value("42"));
    EXPECT_EQ(ConditionParser::parseLiteral("\"null\""), Value("null"));
    EXPECT_EQ(ConditionParser::parseLiteral("'unbalanced"), Value("'unbalanced"));
}

// Builder integration tests
TEST_F(ConditionParserTest, ApplyToBuilder) {
    QueryBuilder builder(Grammar::forDriver("pgsql"), "users");

    parser_.parse("age > 25").applyTo(builder);
    parser_.parse("role in admin,staff").applyTo(builder);
    parser_.parse("deleted_at is null").applyTo(builder);
    parser_.parse("name like 'a%'").applyTo(builder, true);

    auto compiled = builder.toSql();
    EXPECT_EQ(compiled.sql,
              "SELECT * FROM \"users\" WHERE \"age\" > $1 AND \"role\" IN ($2, $3) "
              "AND \"deleted_at\" IS NULL OR \"name\" LIKE $4");
    EXPECT_THAT(compiled.bindings,
                ElementsAre(Value(25), Value("admin"), Value("staff"), Value("a%")));
}

TEST_F(ConditionParserTest, OrJoinRejectsListConditions) {
    QueryBuilder builder(Grammar::forDriver("sqlite"), "users");

    EXPECT_THROW(parser_.parse("id in 1,2").applyTo(builder, true), std::invalid_argument);
}
