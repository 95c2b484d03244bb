#ifndef JACK_TOKEN_HPP
#define JACK_TOKEN_HPP

#include <algorithm>
#include <cstdint>
#include <ostream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace jack::token_type
{

    enum class TokenType
    {
        KEYWORD,
        SYMBOL,
        IDENTIFIER,
        INT_CONST,
        STRING_CONST,

        // unclassifiable text, never accepted by the grammar
        ILLEGAL,
    };

    enum class Keyword
    {
        CLASS,
        CONSTRUCTOR,
        FUNCTION,
        METHOD,
        FIELD,
        STATIC,
        VAR,
        INT,
        CHAR,
        BOOLEAN,
        VOID,
        TRUE,
        FALSE,
        NULL_,
        THIS,
        LET,
        DO,
        IF,
        ELSE,
        WHILE,
        RETURN,
    };

    enum class Symbol
    {
        LBRACE,
        RBRACE,
        LPARENT,
        RPARENT,
        LBRACK,
        RBRACK,
        DOT,
        COMMA,
        SEMICN,
        PLUS,
        MINU,
        MULT,
        DIV,
        AND,
        OR,
        LSS,
        GRE,
        ASSIGN,
        TILDE,
    };

    // tag name used for leaves in the parse tree
    inline std::ostream &operator<<(std::ostream &os, const TokenType &type)
    {
        const static std::unordered_map<TokenType, std::string> tokenTypeNames = {
            {TokenType::KEYWORD, "keyword"},
            {TokenType::SYMBOL, "symbol"},
            {TokenType::IDENTIFIER, "identifier"},
            {TokenType::INT_CONST, "integerConstant"},
            {TokenType::STRING_CONST, "stringConstant"},
            {TokenType::ILLEGAL, "illegal"},
        };

        if (const auto it = tokenTypeNames.find(type); it != tokenTypeNames.end())
        {
            os << it->second;
            return os;
        }
        os << "UNKNOWN_TOKEN_TYPE";
        return os;
    }

    inline const std::unordered_map<Keyword, std::string> &keyword_spellings()
    {
        const static std::unordered_map<Keyword, std::string> spellings = {
            {Keyword::CLASS, "class"},
            {Keyword::CONSTRUCTOR, "constructor"},
            {Keyword::FUNCTION, "function"},
            {Keyword::METHOD, "method"},
            {Keyword::FIELD, "field"},
            {Keyword::STATIC, "static"},
            {Keyword::VAR, "var"},
            {Keyword::INT, "int"},
            {Keyword::CHAR, "char"},
            {Keyword::BOOLEAN, "boolean"},
            {Keyword::VOID, "void"},
            {Keyword::TRUE, "true"},
            {Keyword::FALSE, "false"},
            {Keyword::NULL_, "null"},
            {Keyword::THIS, "this"},
            {Keyword::LET, "let"},
            {Keyword::DO, "do"},
            {Keyword::IF, "if"},
            {Keyword::ELSE, "else"},
            {Keyword::WHILE, "while"},
            {Keyword::RETURN, "return"},
        };
        return spellings;
    }

    inline const std::unordered_map<Symbol, std::string> &symbol_spellings()
    {
        const static std::unordered_map<Symbol, std::string> spellings = {
            {Symbol::LBRACE, "{"},
            {Symbol::RBRACE, "}"},
            {Symbol::LPARENT, "("},
            {Symbol::RPARENT, ")"},
            {Symbol::LBRACK, "["},
            {Symbol::RBRACK, "]"},
            {Symbol::DOT, "."},
            {Symbol::COMMA, ","},
            {Symbol::SEMICN, ";"},
            {Symbol::PLUS, "+"},
            {Symbol::MINU, "-"},
            {Symbol::MULT, "*"},
            {Symbol::DIV, "/"},
            {Symbol::AND, "&"},
            {Symbol::OR, "|"},
            {Symbol::LSS, "<"},
            {Symbol::GRE, ">"},
            {Symbol::ASSIGN, "="},
            {Symbol::TILDE, "~"},
        };
        return spellings;
    }

    inline const std::string &spelling(Keyword keyword)
    {
        return keyword_spellings().at(keyword);
    }

    inline const std::string &spelling(Symbol symbol)
    {
        return symbol_spellings().at(symbol);
    }

    constexpr static auto RESERVED_KEYWORDS = []()
    {
        std::vector<std::pair<std::string, Keyword>> keywords;
        for (const auto &[kw, text] : keyword_spellings())
        {
            keywords.emplace_back(text, kw);
        }
        std::sort(keywords.begin(), keywords.end(), [](const auto &a, const auto &b)
                  { return a.first.size() > b.first.size(); });

        return keywords;
    };

    constexpr static auto DELIMITER_KEYWORDS = []()
    {
        std::vector<std::pair<std::string, Symbol>> symbols;
        for (const auto &[sym, text] : symbol_spellings())
        {
            symbols.emplace_back(text, sym);
        }
        return symbols;
    };

    constexpr int32_t MAX_INT_CONST = 32767;
} // namespace jack::token_type

namespace jack::token
{
    using TokenType = token_type::TokenType;
    using Keyword = token_type::Keyword;
    using Symbol = token_type::Symbol;

    class Token
    {
    public:
        explicit Token(TokenType type, std::string content, size_t line)
            : type(type), content(std::move(content)), line(line) {}

        Token(Keyword keyword, size_t line)
            : type(TokenType::KEYWORD), content(token_type::spelling(keyword)), line(line), kw(keyword) {}

        Token(Symbol symbol, size_t line)
            : type(TokenType::SYMBOL), content(token_type::spelling(symbol)), line(line), sym(symbol) {}

        [[nodiscard]] inline bool is_type(const TokenType &t) const { return type == t; }
        [[nodiscard]] inline TokenType get_type() const { return type; }
        [[nodiscard]] inline const std::string &get_content() const { return content; }
        [[nodiscard]] inline size_t get_line() const { return line; }
        [[nodiscard]] inline bool is_illegal() const { return type == TokenType::ILLEGAL; }

        // valid only for KEYWORD tokens
        [[nodiscard]] inline Keyword get_keyword() const { return kw; }
        // valid only for SYMBOL tokens
        [[nodiscard]] inline Symbol get_symbol() const { return sym; }
        // valid only for INT_CONST tokens
        [[nodiscard]] inline int32_t get_int() const { return std::stoi(content); }

        friend std::ostream &operator<<(std::ostream &os, const Token &token);

    private:
        TokenType type;
        std::string content;
        size_t line;
        Keyword kw = Keyword::CLASS;
        Symbol sym = Symbol::LBRACE;
    };

    // leaf text escaped for markup output
    inline std::string escape(const std::string &text)
    {
        std::string res;
        res.reserve(text.size());
        for (char c : text)
        {
            switch (c)
            {
            case '<':
                res += "&lt;";
                break;
            case '>':
                res += "&gt;";
                break;
            case '&':
                res += "&amp;";
                break;
            case '"':
                res += "&quot;";
                break;
            default:
                res += c;
            }
        }
        return res;
    }

    inline std::ostream &operator<<(std::ostream &os, const Token &token)
    {
        os << "<" << token.type << ">" << escape(token.content) << "</" << token.type << ">";
        return os;
    }
}

#endif
