#include "ast.hpp"
#include "token.hpp"

#include <iterator>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace jack::grammar
{
    constexpr auto OPTION = CollectorOperator::OPTION;
    constexpr auto SEVERAL = CollectorOperator::SEVERAL;

#define NODE(type) node_collector<NodeType::type>()
#define KEYWORD(kw) take_next_token(eat_keyword(Keyword::kw))
#define SYMBOL(sym) take_next_token(eat_symbol(Symbol::sym))
#define IDENT take_next_token(eat_identifier())
#define TYPE take_next_token(eat_type())

    namespace
    {
    // statement : letStatement | ifStatement | whileStatement | doStatement | returnStatement
    const GrammarNodeCollector STATEMENT = one_of({NODE(LET_STATEMENT),
                                                   NODE(IF_STATEMENT),
                                                   NODE(WHILE_STATEMENT),
                                                   NODE(DO_STATEMENT),
                                                   NODE(RETURN_STATEMENT)});

    // subroutineCall : Ident '(' ExpressionList ')' | Ident '.' Ident '(' ExpressionList ')'
    const GrammarNodeCollector SUBROUTINE_CALL = IDENT +
                                                 ((SYMBOL(LPARENT) + NODE(EXPRESSION_LIST) + SYMBOL(RPARENT)) |
                                                  (SYMBOL(DOT) + IDENT +
                                                   SYMBOL(LPARENT) + NODE(EXPRESSION_LIST) + SYMBOL(RPARENT)));

    // op : '+' | '-' | '*' | '/' | '&' | '|' | '<' | '>' | '='
    const GrammarNodeCollector OP = one_of({SYMBOL(PLUS), SYMBOL(MINU), SYMBOL(MULT),
                                            SYMBOL(DIV), SYMBOL(AND), SYMBOL(OR),
                                            SYMBOL(LSS), SYMBOL(GRE), SYMBOL(ASSIGN)});

    // unaryOp : '-' | '~'
    const GrammarNodeCollector UNARY_OP = SYMBOL(MINU) | SYMBOL(TILDE);

    // keywordConstant : 'true' | 'false' | 'null' | 'this'
    const GrammarNodeCollector KEYWORD_CONSTANT = one_of({KEYWORD(TRUE), KEYWORD(FALSE),
                                                          KEYWORD(NULL_), KEYWORD(THIS)});
    } // namespace

    const std::unordered_map<NodeType, GrammarNodeCollector> Collectors = {
        // Class -> 'class' Ident '{' {ClassVarDec} {SubroutineDec} '}'
        {NodeType::CLASS, KEYWORD(CLASS) +
                              IDENT +
                              SYMBOL(LBRACE) +
                              NODE(CLASS_VAR_DEC) * SEVERAL +
                              NODE(SUBROUTINE_DEC) * SEVERAL +
                              SYMBOL(RBRACE)},

        // ClassVarDec -> ('static' | 'field') Type Ident {',' Ident} ';'
        {NodeType::CLASS_VAR_DEC, (KEYWORD(STATIC) | KEYWORD(FIELD)) +
                                      TYPE +
                                      IDENT +
                                      (SYMBOL(COMMA) + IDENT) * SEVERAL +
                                      SYMBOL(SEMICN)},

        // SubroutineDec -> ('constructor' | 'function' | 'method') ('void' | Type) Ident
        //                  '(' ParameterList ')' SubroutineBody
        {NodeType::SUBROUTINE_DEC, one_of({KEYWORD(CONSTRUCTOR), KEYWORD(FUNCTION), KEYWORD(METHOD)}) +
                                       (KEYWORD(VOID) | TYPE) +
                                       IDENT +
                                       SYMBOL(LPARENT) +
                                       NODE(PARAMETER_LIST) +
                                       SYMBOL(RPARENT) +
                                       NODE(SUBROUTINE_BODY)},

        // ParameterList -> [Type Ident {',' Type Ident}]
        {NodeType::PARAMETER_LIST, (TYPE + IDENT + (SYMBOL(COMMA) + TYPE + IDENT) * SEVERAL) * OPTION},

        // SubroutineBody -> '{' {VarDec} Statements '}'
        {NodeType::SUBROUTINE_BODY, SYMBOL(LBRACE) +
                                        NODE(VAR_DEC) * SEVERAL +
                                        NODE(STATEMENTS) +
                                        SYMBOL(RBRACE)},

        // VarDec -> 'var' Type Ident {',' Ident} ';'
        {NodeType::VAR_DEC, KEYWORD(VAR) +
                                TYPE +
                                IDENT +
                                (SYMBOL(COMMA) + IDENT) * SEVERAL +
                                SYMBOL(SEMICN)},

        // Statements -> {Statement}
        {NodeType::STATEMENTS, STATEMENT * SEVERAL},

        // LetStatement -> 'let' Ident ['[' Expression ']'] '=' Expression ';'
        {NodeType::LET_STATEMENT, KEYWORD(LET) +
                                      IDENT +
                                      (SYMBOL(LBRACK) + NODE(EXPRESSION) + SYMBOL(RBRACK)) * OPTION +
                                      SYMBOL(ASSIGN) +
                                      NODE(EXPRESSION) +
                                      SYMBOL(SEMICN)},

        // IfStatement -> 'if' '(' Expression ')' '{' Statements '}' ['else' '{' Statements '}']
        {NodeType::IF_STATEMENT, KEYWORD(IF) +
                                     SYMBOL(LPARENT) + NODE(EXPRESSION) + SYMBOL(RPARENT) +
                                     SYMBOL(LBRACE) + NODE(STATEMENTS) + SYMBOL(RBRACE) +
                                     (KEYWORD(ELSE) + SYMBOL(LBRACE) + NODE(STATEMENTS) + SYMBOL(RBRACE)) * OPTION},

        // WhileStatement -> 'while' '(' Expression ')' '{' Statements '}'
        {NodeType::WHILE_STATEMENT, KEYWORD(WHILE) +
                                        SYMBOL(LPARENT) + NODE(EXPRESSION) + SYMBOL(RPARENT) +
                                        SYMBOL(LBRACE) + NODE(STATEMENTS) + SYMBOL(RBRACE)},

        // DoStatement -> 'do' SubroutineCall ';'
        {NodeType::DO_STATEMENT, KEYWORD(DO) + SUBROUTINE_CALL + SYMBOL(SEMICN)},

        // ReturnStatement -> 'return' [Expression] ';'
        {NodeType::RETURN_STATEMENT, KEYWORD(RETURN) + NODE(EXPRESSION) * OPTION + SYMBOL(SEMICN)},

        // Expression -> Term {Op Term}, evaluated left to right
        {NodeType::EXPRESSION, NODE(TERM) + (OP + NODE(TERM)) * SEVERAL},

        // Term -> IntConst | StrConst | KeywordConstant | '(' Expression ')' | UnaryOp Term
        //       | Ident ['[' Expression ']' | '(' ExpressionList ')' | '.' Ident '(' ExpressionList ')']
        {NodeType::TERM, one_of({take_next_token(eat_int_const()),
                                 take_next_token(eat_string_const()),
                                 KEYWORD_CONSTANT,
                                 SYMBOL(LPARENT) + NODE(EXPRESSION) + SYMBOL(RPARENT),
                                 UNARY_OP + NODE(TERM),
                                 IDENT +
                                     one_of({SYMBOL(LBRACK) + NODE(EXPRESSION) + SYMBOL(RBRACK),
                                             SYMBOL(LPARENT) + NODE(EXPRESSION_LIST) + SYMBOL(RPARENT),
                                             SYMBOL(DOT) + IDENT +
                                                 SYMBOL(LPARENT) + NODE(EXPRESSION_LIST) + SYMBOL(RPARENT)}) *
                                         OPTION})},

        // ExpressionList -> [Expression {',' Expression}]
        {NodeType::EXPRESSION_LIST, (NODE(EXPRESSION) + (SYMBOL(COMMA) + NODE(EXPRESSION)) * SEVERAL) * OPTION},
    };

#undef NODE
#undef KEYWORD
#undef SYMBOL
#undef IDENT
#undef TYPE

    namespace
    {
    // A failure ends an optional/repeated/alternative attempt without
    // aborting the parse when the expected thing is simply absent, or when
    // the attempt was rejected on its very first token.
    bool recoverable(const Failure &failure, size_t start)
    {
        if (error::is_not_found(failure.kind))
        {
            return true;
        }
        switch (failure.kind)
        {
        case ErrorKind::WRONG_KEYWORD:
        case ErrorKind::WRONG_SYMBOL:
            return failure.position == start;
        default:
            return false;
        }
    }

    std::string describe(const Token &token)
    {
        std::ostringstream os;
        os << token.get_type() << " '" << token.get_content() << "'";
        return os.str();
    }

    ParseResult leaf(const Token &token)
    {
        Matched res;
        res.emplace_back(std::make_unique<Token>(token));
        return res;
    }

    void append(Matched &into, Matched &&from)
    {
        into.insert(into.end(),
                    std::make_move_iterator(from.begin()),
                    std::make_move_iterator(from.end()));
    }
    } // namespace

    const Token &ParseContext::current() const
    {
        const auto &token = lexer->current();
        if (!token.has_value())
        {
            throw std::runtime_error("[ParseContext::current] no token consumed yet");
        }
        return *token;
    }

    Failure ParseContext::failure_at_current(ErrorKind kind, std::string expected) const
    {
        const auto &token = current();
        return Failure{kind, position() - 1, token.get_line(), std::move(expected), describe(token)};
    }

    void ParseContext::branch()
    {
        lexer->branch();
        pending_branches.push(pending);
    }

    void ParseContext::rollback()
    {
        lexer->rollback();
        if (!pending_branches.empty())
        {
            pending = pending_branches.top();
            pending_branches.pop();
        }
    }

    void ParseContext::commit()
    {
        lexer->commit();
        pending_branches.pop();
    }

    Failure ParseContext::nesting_failure() const
    {
        return Failure{ErrorKind::NESTING_TOO_DEEP, position(), lexer->get_line(),
                       std::to_string(MAX_NESTING) + " rules", ""};
    }

    void ParseContext::note(const Failure &failure)
    {
        if (!furthest.has_value() || failure.position >= furthest->position)
        {
            furthest = failure;
        }
    }

    TerminalEater eat_keyword(Keyword expected)
    {
        return [expected](ParseContext *ctx) -> ParseResult
        {
            const auto &token = ctx->current();
            std::string want = "keyword '" + token_type::spelling(expected) + "'";
            if (!token.is_type(token_type::TokenType::KEYWORD))
            {
                return NotApplicable{ctx->failure_at_current(ErrorKind::KEYWORD_NOT_FOUND, want)};
            }
            if (token.get_keyword() != expected)
            {
                return NotApplicable{ctx->failure_at_current(ErrorKind::WRONG_KEYWORD, want)};
            }
            return leaf(token);
        };
    }

    TerminalEater eat_symbol(Symbol expected)
    {
        return [expected](ParseContext *ctx) -> ParseResult
        {
            const auto &token = ctx->current();
            std::string want = "symbol '" + token_type::spelling(expected) + "'";
            if (!token.is_type(token_type::TokenType::SYMBOL))
            {
                return NotApplicable{ctx->failure_at_current(ErrorKind::SYMBOL_NOT_FOUND, want)};
            }
            if (token.get_symbol() != expected)
            {
                return NotApplicable{ctx->failure_at_current(ErrorKind::WRONG_SYMBOL, want)};
            }
            return leaf(token);
        };
    }

    TerminalEater eat_identifier()
    {
        return [](ParseContext *ctx) -> ParseResult
        {
            const auto &token = ctx->current();
            if (!token.is_type(token_type::TokenType::IDENTIFIER))
            {
                return NotApplicable{ctx->failure_at_current(ErrorKind::IDENTIFIER_NOT_FOUND, "identifier")};
            }
            return leaf(token);
        };
    }

    TerminalEater eat_int_const()
    {
        return [](ParseContext *ctx) -> ParseResult
        {
            const auto &token = ctx->current();
            if (!token.is_type(token_type::TokenType::INT_CONST))
            {
                return NotApplicable{ctx->failure_at_current(ErrorKind::INT_CONST_NOT_FOUND, "integer constant")};
            }
            return leaf(token);
        };
    }

    TerminalEater eat_string_const()
    {
        return [](ParseContext *ctx) -> ParseResult
        {
            const auto &token = ctx->current();
            if (!token.is_type(token_type::TokenType::STRING_CONST))
            {
                return NotApplicable{ctx->failure_at_current(ErrorKind::STRING_CONST_NOT_FOUND, "string constant")};
            }
            return leaf(token);
        };
    }

    // Type -> 'int' | 'char' | 'boolean' | Ident
    TerminalEater eat_type()
    {
        const std::vector<TerminalEater> eaters = {eat_keyword(Keyword::INT),
                                                   eat_keyword(Keyword::CHAR),
                                                   eat_keyword(Keyword::BOOLEAN),
                                                   eat_identifier()};
        return [eaters](ParseContext *ctx) -> ParseResult
        {
            ParseResult res = Matched{};
            for (const auto &eat : eaters)
            {
                res = eat(ctx);
                if (std::holds_alternative<Matched>(res))
                {
                    return res;
                }
            }
            std::get<NotApplicable>(res).failure.expected = "type";
            return res;
        };
    }

    GrammarNodeCollector take_next_token(TerminalEater eat)
    {
        return [eat](ParseContext *ctx) -> ParseResult
        {
            if (ctx->pending.has_value())
            {
                return NotApplicable{*ctx->pending};
            }
            auto *lexer = ctx->get_lexer();
            if (!lexer->has_more_tokens())
            {
                Failure failure{ErrorKind::NO_MORE_TOKENS, ctx->position(), lexer->get_line(), "", "end of input"};
                ctx->note(failure);
                return Malformed{failure};
            }
            const auto &token = lexer->advance();
            if (token.is_illegal())
            {
                auto failure = ctx->failure_at_current(ErrorKind::ILLEGAL_TOKEN, "");
                failure.found = token.get_content();
                ctx->note(failure);
                return Malformed{failure};
            }
            auto res = eat(ctx);
            if (auto *absent = std::get_if<NotApplicable>(&res))
            {
                ctx->pending = absent->failure;
                ctx->note(absent->failure);
            }
            return res;
        };
    }

    GrammarNodeCollector zero_or_more(GrammarNodeCollector rule)
    {
        return [rule](ParseContext *ctx) -> ParseResult
        {
            Matched res;
            while (true)
            {
                size_t start = ctx->position();
                ctx->branch();
                auto attempt = rule(ctx);
                if (auto *nodes = std::get_if<Matched>(&attempt))
                {
                    ctx->commit();
                    append(res, std::move(*nodes));
                    if (ctx->position() == start)
                    {
                        break;
                    }
                    continue;
                }
                ctx->rollback();
                if (std::holds_alternative<Malformed>(attempt))
                {
                    return attempt;
                }
                const auto &failure = std::get<NotApplicable>(attempt).failure;
                if (!recoverable(failure, start))
                {
                    return Malformed{failure};
                }
                break;
            }
            return res;
        };
    }

    GrammarNodeCollector zero_or_one(GrammarNodeCollector rule)
    {
        // a single guarded attempt, never a second one
        return [rule](ParseContext *ctx) -> ParseResult
        {
            size_t start = ctx->position();
            ctx->branch();
            auto attempt = rule(ctx);
            if (std::holds_alternative<Matched>(attempt))
            {
                ctx->commit();
                return attempt;
            }
            ctx->rollback();
            if (std::holds_alternative<Malformed>(attempt))
            {
                return attempt;
            }
            const auto &failure = std::get<NotApplicable>(attempt).failure;
            if (!recoverable(failure, start))
            {
                return Malformed{failure};
            }
            return Matched{};
        };
    }

    GrammarNodeCollector one_of(std::vector<GrammarNodeCollector> alternatives)
    {
        if (alternatives.empty())
        {
            throw std::runtime_error("[grammar::one_of] no alternatives");
        }
        return [alternatives](ParseContext *ctx) -> ParseResult
        {
            std::optional<Failure> last;
            for (const auto &alternative : alternatives)
            {
                size_t start = ctx->position();
                ctx->branch();
                auto attempt = alternative(ctx);
                if (std::holds_alternative<Matched>(attempt))
                {
                    ctx->commit();
                    return attempt;
                }
                ctx->rollback();
                if (std::holds_alternative<Malformed>(attempt))
                {
                    return attempt;
                }
                const auto &failure = std::get<NotApplicable>(attempt).failure;
                if (!recoverable(failure, start))
                {
                    return Malformed{failure};
                }
                last = failure;
            }
            return NotApplicable{*last};
        };
    }

    GrammarNodeCollector operator+(const GrammarNodeCollector &lhs, const GrammarNodeCollector &rhs)
    {
        return [lhs, rhs](ParseContext *ctx) -> ParseResult
        {
            auto left_res = lhs(ctx);
            auto *left = std::get_if<Matched>(&left_res);
            if (left == nullptr)
            {
                return left_res;
            }
            auto right_res = rhs(ctx);
            auto *right = std::get_if<Matched>(&right_res);
            if (right == nullptr)
            {
                return right_res;
            }

            append(*left, std::move(*right));
            return left_res;
        };
    }

    GrammarNodeCollector operator|(const GrammarNodeCollector &lhs, const GrammarNodeCollector &rhs)
    {
        return one_of({lhs, rhs});
    }

    GrammarNodeCollector operator*(const GrammarNodeCollector &gen, const CollectorOperator &op)
    {
        switch (op)
        {
        case CollectorOperator::OPTION:
            return zero_or_one(gen);
        case CollectorOperator::SEVERAL:
            return zero_or_more(gen);
        }
        throw std::runtime_error("[grammar] unknown collector operator");
    }
}

namespace jack::ast
{
    std::vector<const Token *> ASTNode::leaves() const
    {
        std::vector<const Token *> res;
        for_each_child([&res](const GrammarNode &g)
                       {
            if (auto child_node = std::get_if<ASTNodePtr>(&g))
            {
                auto below = (*child_node)->leaves();
                res.insert(res.end(), below.begin(), below.end());
            }
            else if (auto token_ptr = std::get_if<TokenPtr>(&g))
            {
                res.push_back(token_ptr->get());
            } });
        return res;
    }

    void ASTNode::print_tree(std::ostream &os, size_t indent) const
    {
        const std::string pad(indent * 2, ' ');
        os << pad << "<" << type << ">" << std::endl;
        for_each_child([&os, indent](const GrammarNode &g)
                       {
            if (auto child_node = std::get_if<ASTNodePtr>(&g))
            {
                (*child_node)->print_tree(os, indent + 1);
            }
            else if (auto token_ptr = std::get_if<TokenPtr>(&g))
            {
                os << std::string((indent + 1) * 2, ' ') << **token_ptr << std::endl;
            } });
        os << pad << "</" << type << ">" << std::endl;
    }

    std::string to_xml(const ASTNode &node)
    {
        std::ostringstream os;
        std::function<void(const ASTNode &)> dfs;
        dfs = [&](const ASTNode &n)
        {
            os << "<" << n.get_type() << ">";
            n.for_each_child([&](const GrammarNode &g)
                             {
                if (auto child_node = std::get_if<ASTNodePtr>(&g))
                {
                    dfs(**child_node);
                }
                else if (auto token_ptr = std::get_if<TokenPtr>(&g))
                {
                    os << **token_ptr;
                } });
            os << "</" << n.get_type() << ">";
        };
        dfs(node);
        return os.str();
    }
}
