#include <gtest/gtest.h>

#include <string>

#include "ast.hpp"
#include "lexer.hpp"
#include "test_helpers.hpp"

using namespace jack::grammar;
using jack::error::ErrorKind;
using jack::test::failure_kind;
using jack::test::render;

namespace
{
// Eaters look at the current token, so the fixture advances onto the first
// one before handing the context out.
struct OnFirstToken
{
    explicit OnFirstToken(std::string_view text) : lexer(text), ctx(&lexer)
    {
        lexer.advance();
    }

    Lexer lexer;
    ParseContext ctx;
};
} // namespace

TEST(TerminalTest, KeywordOnSymbolIsNotFound)
{
    OnFirstToken on("{");
    auto res = eat_keyword(Keyword::CLASS)(&on.ctx);
    ASSERT_TRUE(std::holds_alternative<NotApplicable>(res));
    EXPECT_EQ(failure_kind(res), ErrorKind::KEYWORD_NOT_FOUND);
}

TEST(TerminalTest, KeywordWithOtherValueIsWrong)
{
    OnFirstToken on("method");
    auto res = eat_keyword(Keyword::CLASS)(&on.ctx);
    EXPECT_EQ(failure_kind(res), ErrorKind::WRONG_KEYWORD);
    const auto &failure = std::get<NotApplicable>(res).failure;
    EXPECT_EQ(failure.message(), "expected keyword 'class' but found keyword 'method'");
    EXPECT_EQ(failure.position, 0u);
}

TEST(TerminalTest, MatchingKeywordEmitsLeaf)
{
    OnFirstToken on("class");
    auto res = eat_keyword(Keyword::CLASS)(&on.ctx);
    EXPECT_EQ(render(res), "<keyword>class</keyword>");
}

TEST(TerminalTest, SymbolKinds)
{
    OnFirstToken absent("foo");
    EXPECT_EQ(failure_kind(eat_symbol(Symbol::SEMICN)(&absent.ctx)), ErrorKind::SYMBOL_NOT_FOUND);

    OnFirstToken wrong("}");
    EXPECT_EQ(failure_kind(eat_symbol(Symbol::SEMICN)(&wrong.ctx)), ErrorKind::WRONG_SYMBOL);

    OnFirstToken less("<");
    EXPECT_EQ(render(eat_symbol(Symbol::LSS)(&less.ctx)), "<symbol>&lt;</symbol>");
}

TEST(TerminalTest, IdentifierAndConstants)
{
    OnFirstToken keyword("int");
    EXPECT_EQ(failure_kind(eat_identifier()(&keyword.ctx)), ErrorKind::IDENTIFIER_NOT_FOUND);

    OnFirstToken name("counter");
    EXPECT_EQ(render(eat_identifier()(&name.ctx)), "<identifier>counter</identifier>");

    OnFirstToken number("42");
    EXPECT_EQ(render(eat_int_const()(&number.ctx)), "<integerConstant>42</integerConstant>");
    EXPECT_EQ(failure_kind(eat_string_const()(&number.ctx)), ErrorKind::STRING_CONST_NOT_FOUND);

    OnFirstToken text("\"hello\"");
    EXPECT_EQ(render(eat_string_const()(&text.ctx)), "<stringConstant>hello</stringConstant>");
    EXPECT_EQ(failure_kind(eat_int_const()(&text.ctx)), ErrorKind::INT_CONST_NOT_FOUND);
}

TEST(TerminalTest, TypeAcceptsPrimitivesAndClassNames)
{
    for (const char *type : {"int", "char", "boolean", "Point"})
    {
        OnFirstToken on(type);
        auto res = eat_type()(&on.ctx);
        EXPECT_TRUE(std::holds_alternative<Matched>(res)) << type;
    }
}

TEST(TerminalTest, TypeReportsLastFailure)
{
    OnFirstToken on("void");
    auto res = eat_type()(&on.ctx);
    EXPECT_EQ(failure_kind(res), ErrorKind::IDENTIFIER_NOT_FOUND);
    EXPECT_EQ(std::get<NotApplicable>(res).failure.expected, "type");
}

TEST(TerminalTest, EatersDoNotAdvance)
{
    OnFirstToken on("x y");
    EXPECT_EQ(render(eat_identifier()(&on.ctx)), "<identifier>x</identifier>");
    EXPECT_EQ(render(eat_identifier()(&on.ctx)), "<identifier>x</identifier>");
    EXPECT_EQ(on.ctx.position(), 1u);
}

TEST(TakeNextTokenTest, EmptyStreamIsNoMoreTokens)
{
    Lexer lexer("");
    ParseContext ctx(&lexer);
    auto res = take_next_token(eat_identifier())(&ctx);
    ASSERT_TRUE(std::holds_alternative<Malformed>(res));
    EXPECT_EQ(failure_kind(res), ErrorKind::NO_MORE_TOKENS);
}

TEST(TakeNextTokenTest, AdvancesThenValidates)
{
    Lexer lexer("Foo Bar");
    ParseContext ctx(&lexer);
    auto res = take_next_token(eat_identifier())(&ctx);
    EXPECT_EQ(render(res), "<identifier>Foo</identifier>");
    EXPECT_EQ(ctx.position(), 1u);
    EXPECT_FALSE(ctx.pending.has_value());
}

TEST(TakeNextTokenTest, PendingFailureBlocksFurtherConsumption)
{
    Lexer lexer("; x y");
    ParseContext ctx(&lexer);

    ctx.branch();
    auto first = take_next_token(eat_identifier())(&ctx);
    EXPECT_EQ(failure_kind(first), ErrorKind::IDENTIFIER_NOT_FOUND);
    ASSERT_TRUE(ctx.pending.has_value());
    EXPECT_EQ(ctx.position(), 1u);

    // no-op while the failure is pending
    auto second = take_next_token(eat_symbol(Symbol::SEMICN))(&ctx);
    EXPECT_EQ(failure_kind(second), ErrorKind::IDENTIFIER_NOT_FOUND);
    EXPECT_EQ(ctx.position(), 1u);

    ctx.rollback();
    EXPECT_FALSE(ctx.pending.has_value());
    EXPECT_EQ(ctx.position(), 0u);
    EXPECT_EQ(render(take_next_token(eat_symbol(Symbol::SEMICN))(&ctx)), "<symbol>;</symbol>");
}

TEST(TakeNextTokenTest, IllegalTokenIsFatal)
{
    Lexer lexer("$");
    ParseContext ctx(&lexer);
    auto res = take_next_token(eat_identifier())(&ctx);
    ASSERT_TRUE(std::holds_alternative<Malformed>(res));
    EXPECT_EQ(failure_kind(res), ErrorKind::ILLEGAL_TOKEN);
    EXPECT_EQ(std::get<Malformed>(res).failure.message(), "illegal token '$'");
}
