#include "lexer.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace jack::token_matcher
{
namespace
{
const std::vector<std::pair<std::string, token_type::Keyword>> &reserved()
{
    static const auto keywords = token_type::RESERVED_KEYWORDS();
    return keywords;
}

const std::vector<std::pair<std::string, token_type::Symbol>> &delimiters()
{
    static const auto symbols = token_type::DELIMITER_KEYWORDS();
    return symbols;
}

bool is_word_char(char c)
{
    return c == '_' || std::isalnum(static_cast<unsigned char>(c));
}
} // namespace

MatchResult Matcher::try_match_reserved(std::string_view text)
{
    for (const auto &[kw, type] : reserved())
    {
        auto len = kw.size();
        if (len <= text.size() && text.substr(0, len) == kw
            && (len == text.size() || !is_word_char(text[len])))
        {
            return std::make_pair(len, TokenType::KEYWORD);
        }
    }
    return std::nullopt;
}

MatchResult Matcher::try_match_identifier(std::string_view text)
{
    if (text.empty() || (!std::isalpha(static_cast<unsigned char>(text[0])) && text[0] != '_'))
    {
        return std::nullopt;
    }
    size_t res_index = 1;
    while (res_index < text.size() && is_word_char(text[res_index]))
    {
        res_index++;
    }
    return std::make_pair(res_index, TokenType::IDENTIFIER);
}

MatchResult Matcher::try_match_str_const(std::string_view text)
{
    if (text.empty() || text[0] != '\"')
    {
        return std::nullopt;
    }
    size_t res_index = 1;
    while (res_index < text.size() && text[res_index] != '\"' && text[res_index] != '\n')
    {
        res_index++;
    }
    if (res_index == text.size() || text[res_index] == '\n')
    {
        // unterminated
        return std::make_pair(res_index, TokenType::ILLEGAL);
    }
    return std::make_pair(res_index + 1, TokenType::STRING_CONST);
}

MatchResult Matcher::try_match_int_const(std::string_view text)
{
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0])))
    {
        return std::nullopt;
    }
    size_t res_index = 1;
    while (res_index < text.size() && std::isdigit(static_cast<unsigned char>(text[res_index])))
    {
        res_index++;
    }
    return std::make_pair(res_index, TokenType::INT_CONST);
}

MatchResult Matcher::try_match_delimiter(std::string_view text)
{
    for (const auto &[del, type] : delimiters())
    {
        auto len = del.size();
        if (len <= text.size() && text.substr(0, len) == del)
        {
            return std::make_pair(len, TokenType::SYMBOL);
        }
    }
    return std::nullopt;
}

MatchResult Matcher::try_match_illegal(std::string_view text)
{
    if (text.empty())
    {
        return std::nullopt;
    }
    // an unclosed block comment swallows the rest of the input
    if (text.substr(0, 2) == "/*")
    {
        return std::make_pair(text.size(), TokenType::ILLEGAL);
    }
    return std::make_pair(size_t{1}, TokenType::ILLEGAL);
}

}

namespace jack::lexer
{
    using token_matcher::Matcher;

    namespace
    {
    Keyword to_keyword(std::string_view content)
    {
        for (const auto &[kw, type] : token_matcher::reserved())
        {
            if (kw == content)
            {
                return type;
            }
        }
        throw std::runtime_error("[Lexer] not a keyword: " + std::string(content));
    }

    Symbol to_symbol(std::string_view content)
    {
        for (const auto &[del, type] : token_matcher::delimiters())
        {
            if (del == content)
            {
                return type;
            }
        }
        throw std::runtime_error("[Lexer] not a symbol: " + std::string(content));
    }
    } // namespace

    std::optional<Token> Lexer::next_token()
    {
        //skip
        while (skip_space() || skip_comment())
        {
        }
        if (cur_loc.empty())
        {
            return std::nullopt;
        }

        auto result = cur_loc.substr(0, 2) == "/*"
                          ? Matcher::try_match_illegal(cur_loc)
                          : token_matcher::match_a_token(cur_loc);
        if (!result.has_value())
        {
            result = Matcher::try_match_illegal(cur_loc);
        }

        auto [len, type] = result.value();
        std::string content(cur_loc.substr(0, len));
        size_t line = cur_line;
        cur_line += std::count(content.cbegin(), content.cend(), '\n');
        cur_loc.remove_prefix(len);

        switch (type)
        {
        case TokenType::KEYWORD:
            return Token(to_keyword(content), line);
        case TokenType::SYMBOL:
            return Token(to_symbol(content), line);
        case TokenType::STRING_CONST:
            return Token(type, content.substr(1, content.size() - 2), line);
        case TokenType::INT_CONST:
            if (content.size() > 5 || std::stoi(content) > token_type::MAX_INT_CONST)
            {
                return Token(TokenType::ILLEGAL, content, line);
            }
            return Token(type, content, line);
        default:
            return Token(type, content, line);
        }
    }

    bool Lexer::has_more_tokens()
    {
        while (skip_space() || skip_comment())
        {
        }
        return !cur_loc.empty();
    }

    const Token &Lexer::advance()
    {
        auto token = next_token();
        if (!token.has_value())
        {
            throw std::runtime_error("[Lexer::advance] no more tokens");
        }
        cur_token = std::move(token);
        cur_pos++;
        return *cur_token;
    }

    const Token &Lexer::expect_current(TokenType type) const
    {
        if (!cur_token.has_value() || !cur_token->is_type(type))
        {
            throw std::runtime_error("[Lexer] current token has a different type");
        }
        return *cur_token;
    }

    TokenType Lexer::token_type() const
    {
        if (!cur_token.has_value())
        {
            throw std::runtime_error("[Lexer::token_type] advance() was never called");
        }
        return cur_token->get_type();
    }

    Keyword Lexer::keyword() const
    {
        return expect_current(TokenType::KEYWORD).get_keyword();
    }

    Symbol Lexer::symbol() const
    {
        return expect_current(TokenType::SYMBOL).get_symbol();
    }

    const std::string &Lexer::identifier() const
    {
        return expect_current(TokenType::IDENTIFIER).get_content();
    }

    int32_t Lexer::int_val() const
    {
        return expect_current(TokenType::INT_CONST).get_int();
    }

    const std::string &Lexer::string_val() const
    {
        return expect_current(TokenType::STRING_CONST).get_content();
    }

    std::vector<Token> Lexer::tokenize()
    {
        std::vector<Token> tokens;
        while (has_more_tokens())
        {
            tokens.push_back(advance());
        }
        return tokens;
    }

    bool Lexer::skip_space()
    {
        if (!cur_loc.empty() && std::isspace(static_cast<unsigned char>(cur_loc[0])))
        {
            if (cur_loc[0] == '\n')
            {
                cur_line++;
            }
            cur_loc.remove_prefix(1);
            return true;
        }
        return false;
    }

    bool Lexer::skip_comment()
    {
        if (cur_loc.empty() || cur_loc[0] != '/')
        {
            return false;
        }
        if (cur_loc.substr(0, 2) == "//")
        {
            auto const end_line_flag = cur_loc.find('\n');
            if (end_line_flag == std::string_view::npos)
            {
                cur_loc.remove_prefix(cur_loc.size());
            }
            else
            {
                cur_loc.remove_prefix(end_line_flag + 1);
                cur_line++;
            }
            return true;
        }
        else if (cur_loc.substr(0, 2) == "/*")
        {
            // also covers /** API comments */
            const auto end_index = cur_loc.find("*/", 2);
            if (end_index == std::string_view::npos)
            {
                // left for next_token to report
                return false;
            }
            auto const comment = cur_loc.substr(0, end_index);
            cur_line += std::count(comment.cbegin(), comment.cend(), '\n');
            cur_loc.remove_prefix(end_index + 2);
            return true;
        }
        return false;
    }

    void Lexer::branch()
    {
        branches.push({cur_loc, cur_line, cur_pos, cur_token});
    }

    void Lexer::rollback()
    {
        if (branches.empty())
        {
            throw std::runtime_error("[Lexer::rollback] no branch to roll back");
        }
        auto &snapshot = branches.top();
        cur_loc = snapshot.loc;
        cur_line = snapshot.line;
        cur_pos = snapshot.pos;
        cur_token = std::move(snapshot.token);
        branches.pop();
    }

    void Lexer::commit()
    {
        if (branches.empty())
        {
            throw std::runtime_error("[Lexer::commit] no branch to commit");
        }
        branches.pop();
    }
}
