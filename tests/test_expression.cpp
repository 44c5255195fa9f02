// EN: Unit tests for expression parsing
// FR: Tests unitaires du parsing d'expressions

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "taskgraph/expression.hpp"
#include "taskgraph/task_errors.hpp"

using namespace PHR::TaskGraph;

TEST(ExpressionTest, PlainTextIsOneLiteral) {
    Expression expr = parseExpression("rm -rf build");
    ASSERT_EQ(expr.segments.size(), 1u);
    EXPECT_TRUE(expr.isLiteral());
    EXPECT_EQ(std::get<LiteralSegment>(expr.segments[0]).text, "rm -rf build");
    EXPECT_TRUE(parseExpression("").empty());
}

TEST(ExpressionTest, BothReferenceSpellingsAreEquivalent) {
    Expression expr = parseExpression("${DOCKER_OWNER}/$(DOCKER_APP):x");
    ASSERT_EQ(expr.segments.size(), 4u);
    EXPECT_EQ(std::get<ReferenceSegment>(expr.segments[0]).name, "DOCKER_OWNER");
    EXPECT_EQ(std::get<LiteralSegment>(expr.segments[1]).text, "/");
    EXPECT_EQ(std::get<ReferenceSegment>(expr.segments[2]).name, "DOCKER_APP");
    EXPECT_EQ(expr.toString(), "$(DOCKER_OWNER)/$(DOCKER_APP):x");
}

TEST(ExpressionTest, ShellExtractionNestsAnExpression) {
    Expression expr = parseExpression("v$(shell cut -d \" \" -f 3 ${VERSION_FILE})");
    ASSERT_EQ(expr.segments.size(), 2u);
    const auto& extraction = std::get<ExtractionSegment>(expr.segments[1]);
    ASSERT_TRUE(extraction.command);
    EXPECT_EQ(extraction.command->toString(), "cut -d \" \" -f 3 $(VERSION_FILE)");
    EXPECT_EQ(expr.references(), std::vector<std::string>{"VERSION_FILE"});
    EXPECT_FALSE(expr.isLiteral());
}

TEST(ExpressionTest, DollarEscapes) {
    // EN: "$$" is one dollar; a dollar not followed by a bracket stays literal
    // FR: "$$" vaut un dollar ; un dollar non suivi d'une parenthèse reste littéral
    Expression expr = parseExpression("awk '{print $$1}' costs 5$ $HOME");
    ASSERT_TRUE(expr.isLiteral());
    EXPECT_EQ(std::get<LiteralSegment>(expr.segments[0]).text, "awk '{print $1}' costs 5$ $HOME");
    EXPECT_EQ(expr.toString(), "awk '{print $$1}' costs 5$$ $$HOME");
}

TEST(ExpressionTest, NestedParenthesesInsideExtraction) {
    Expression expr = parseExpression("$(shell echo $$((1 + 2)))");
    ASSERT_EQ(expr.segments.size(), 1u);
    const auto& extraction = std::get<ExtractionSegment>(expr.segments[0]);
    EXPECT_EQ(extraction.command->toString(), "echo $$((1 + 2))");
}

TEST(ExpressionTest, MalformedReferencesAreSyntaxErrors) {
    EXPECT_THROW(parseExpression("echo $(VERSION"), TaskfileSyntaxError);
    EXPECT_THROW(parseExpression("echo $()"), TaskfileSyntaxError);
    EXPECT_THROW(parseExpression("echo $($(NAME))"), TaskfileSyntaxError);
    EXPECT_THROW(parseExpression("$(wildcard *.c)"), TaskfileSyntaxError);

    try {
        parseExpression("echo ${OPEN");
        FAIL() << "Expected TaskfileSyntaxError";
    } catch (const TaskfileSyntaxError& e) {
        EXPECT_EQ(e.line(), 0u);
        EXPECT_THAT(e.detail(), ::testing::HasSubstr("unterminated"));
    }
}
