#ifndef JACK_LEXER_HPP
#define JACK_LEXER_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <stack>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "token.hpp"

namespace jack::token_matcher
{
    using TokenType = token_type::TokenType;
    using MatchResult = std::optional<std::pair<size_t, TokenType>>;

    class Matcher
    {
    public:
        static MatchResult try_match_reserved(std::string_view text);
        static MatchResult try_match_identifier(std::string_view text);
        static MatchResult try_match_int_const(std::string_view text);
        static MatchResult try_match_str_const(std::string_view text);
        static MatchResult try_match_delimiter(std::string_view text);
        static MatchResult try_match_illegal(std::string_view text);
    };

    inline const std::function<MatchResult(std::string_view)> matchers[] = {
        Matcher::try_match_reserved,
        Matcher::try_match_identifier,
        Matcher::try_match_int_const,
        Matcher::try_match_str_const,
        Matcher::try_match_delimiter,
    };

    inline MatchResult match_a_token(std::string_view text)
    {
        for (const auto &matcher : matchers)
        {
            if (auto result = matcher(text); result.has_value())
            {
                return result;
            }
        }
        return std::nullopt;
    }
} // namespace jack::token_matcher

namespace jack::lexer
{
    using namespace jack::token;

    // Forward-only token source over Jack source text. Tokens are scanned
    // lazily; branch() snapshots the cursor so a failed parse attempt can
    // rollback() to it, and commit() drops the snapshot once it succeeds.
    class Lexer
    {
    public:
        explicit Lexer(std::string_view text) : cur_loc(text), cur_line(1) {}

        [[nodiscard]] bool has_more_tokens();
        const Token &advance();

        // current token accessors, valid after advance()
        [[nodiscard]] const std::optional<Token> &current() const { return cur_token; }
        [[nodiscard]] TokenType token_type() const;
        [[nodiscard]] Keyword keyword() const;
        [[nodiscard]] Symbol symbol() const;
        [[nodiscard]] const std::string &identifier() const;
        [[nodiscard]] int32_t int_val() const;
        [[nodiscard]] const std::string &string_val() const;

        size_t get_line() const { return cur_line; }

        // number of tokens advanced over so far
        size_t position() const { return cur_pos; }

        // drains the remaining input, used for token listings
        std::vector<Token> tokenize();

        //parsing
        void branch();

        void rollback();

        void commit();

    private:
        std::optional<Token> next_token();
        bool skip_comment();
        bool skip_space();
        const Token &expect_current(TokenType type) const;

    private:
        struct Snapshot
        {
            std::string_view loc;
            size_t line;
            size_t pos;
            std::optional<Token> token;
        };

        std::string_view cur_loc;
        size_t cur_line;
        size_t cur_pos = 0;
        std::optional<Token> cur_token;

        std::stack<Snapshot> branches;
    };

} // namespace jack::lexer
#endif // JACK_LEXER_HPP
