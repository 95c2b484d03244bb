#ifndef JACK_PARSER_HPP
#define JACK_PARSER_HPP

#include "ast.hpp"
#include "error.hpp"
#include "lexer.hpp"

namespace jack::parser
{
using namespace jack::grammar;
using Lexer = jack::lexer::Lexer;
using error::ParseError;

// Drives one production over the whole token source. A Parser is bound to
// one Lexer and runs exactly one entry production; a second call throws.
// Every entry returns the rule's node or throws ParseError.
class Parser {
public:
    explicit Parser(Lexer *lexer) : lexer(lexer), ctx(lexer) {}

    // the whole input must be one class
    ASTNodePtr compile_class();

    // single rules, parsed from the start of the input; tokens after the
    // rule are left unconsumed
    ASTNodePtr compile_class_var_dec();
    ASTNodePtr compile_subroutine_dec();
    ASTNodePtr compile_parameter_list();
    ASTNodePtr compile_subroutine_body();
    ASTNodePtr compile_var_dec();
    ASTNodePtr compile_statements();
    ASTNodePtr compile_let();
    ASTNodePtr compile_if();
    ASTNodePtr compile_while();
    ASTNodePtr compile_do();
    ASTNodePtr compile_return();
    ASTNodePtr compile_expression();
    ASTNodePtr compile_term();
    ASTNodePtr compile_expression_list();

private:
    ASTNodePtr run(const GrammarNodeCollector &rule, bool whole_input);

    Lexer *lexer;
    ParseContext ctx;
    bool used = false;
};

}  // namespace jack::parser

#endif // JACK_PARSER_HPP
