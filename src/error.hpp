#ifndef JACK_ERROR_HPP
#define JACK_ERROR_HPP

#include <cstddef>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace jack::error
{
    enum class ErrorKind
    {
        // the expected alternative is absent here
        KEYWORD_NOT_FOUND,
        SYMBOL_NOT_FOUND,
        IDENTIFIER_NOT_FOUND,
        INT_CONST_NOT_FOUND,
        STRING_CONST_NOT_FOUND,

        // right kind of token, wrong value
        WRONG_KEYWORD,
        WRONG_SYMBOL,

        // malformed or exhausted input
        NO_MORE_TOKENS,
        ILLEGAL_TOKEN,
        TRAILING_TOKENS,
        NESTING_TOO_DEEP,
    };

    inline std::ostream &operator<<(std::ostream &os, const ErrorKind &kind)
    {
        switch (kind)
        {
        case ErrorKind::KEYWORD_NOT_FOUND:
            return os << "KeywordNotFound";
        case ErrorKind::SYMBOL_NOT_FOUND:
            return os << "SymbolNotFound";
        case ErrorKind::IDENTIFIER_NOT_FOUND:
            return os << "IdentifierNotFound";
        case ErrorKind::INT_CONST_NOT_FOUND:
            return os << "IntegerConstantNotFound";
        case ErrorKind::STRING_CONST_NOT_FOUND:
            return os << "StringConstantNotFound";
        case ErrorKind::WRONG_KEYWORD:
            return os << "WrongKeyword";
        case ErrorKind::WRONG_SYMBOL:
            return os << "WrongSymbol";
        case ErrorKind::NO_MORE_TOKENS:
            return os << "NoMoreTokens";
        case ErrorKind::ILLEGAL_TOKEN:
            return os << "IllegalToken";
        case ErrorKind::TRAILING_TOKENS:
            return os << "TrailingTokens";
        case ErrorKind::NESTING_TOO_DEEP:
            return os << "NestingTooDeep";
        }
        return os;
    }

    inline bool is_not_found(ErrorKind kind)
    {
        switch (kind)
        {
        case ErrorKind::KEYWORD_NOT_FOUND:
        case ErrorKind::SYMBOL_NOT_FOUND:
        case ErrorKind::IDENTIFIER_NOT_FOUND:
        case ErrorKind::INT_CONST_NOT_FOUND:
        case ErrorKind::STRING_CONST_NOT_FOUND:
            return true;
        default:
            return false;
        }
    }

    // One unmet expectation. `position` is the index of the offending token
    // in the stream (for NO_MORE_TOKENS, the index the missing token would
    // have had).
    struct Failure
    {
        ErrorKind kind;
        size_t position;
        size_t line;
        std::string expected;
        std::string found;

        [[nodiscard]] std::string message() const
        {
            switch (kind)
            {
            case ErrorKind::NO_MORE_TOKENS:
                return "unexpected end of input";
            case ErrorKind::ILLEGAL_TOKEN:
                return "illegal token '" + found + "'";
            case ErrorKind::TRAILING_TOKENS:
                return "unexpected " + found + " after end of class";
            case ErrorKind::NESTING_TOO_DEEP:
                return "nesting deeper than " + expected;
            default:
                return "expected " + expected + " but found " + found;
            }
        }
    };

    // Outcome shapes of a grammar attempt besides a match.
    struct NotApplicable
    {
        Failure failure;
    };

    struct Malformed
    {
        Failure failure;
    };

    class ParseError : public std::runtime_error
    {
    public:
        explicit ParseError(Failure failure)
            : std::runtime_error(failure.message()), failure(std::move(failure)) {}

        [[nodiscard]] ErrorKind kind() const { return failure.kind; }
        [[nodiscard]] size_t line() const { return failure.line; }

    private:
        Failure failure;
    };
} // namespace jack::error

#endif // JACK_ERROR_HPP
