#ifndef JACK_FRONTEND_AST_HPP
#define JACK_FRONTEND_AST_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <stack>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "error.hpp"
#include "lexer.hpp"
#include "token.hpp"

namespace jack::ast_type
{
    // clang-format off
enum class NodeType {
    CLASS, CLASS_VAR_DEC, SUBROUTINE_DEC, PARAMETER_LIST, SUBROUTINE_BODY, VAR_DEC,
    STATEMENTS, LET_STATEMENT, IF_STATEMENT, WHILE_STATEMENT, DO_STATEMENT, RETURN_STATEMENT,
    EXPRESSION, TERM, EXPRESSION_LIST,
};
    // clang-format on
    inline std::ostream &operator<<(std::ostream &os, const NodeType &type)
    {
        const static std::unordered_map<NodeType, std::string> nodeTypeNames = {
            {NodeType::CLASS, "class"},
            {NodeType::CLASS_VAR_DEC, "classVarDec"},
            {NodeType::SUBROUTINE_DEC, "subroutineDec"},
            {NodeType::PARAMETER_LIST, "parameterList"},
            {NodeType::SUBROUTINE_BODY, "subroutineBody"},
            {NodeType::VAR_DEC, "varDec"},
            {NodeType::STATEMENTS, "statements"},
            {NodeType::LET_STATEMENT, "letStatement"},
            {NodeType::IF_STATEMENT, "ifStatement"},
            {NodeType::WHILE_STATEMENT, "whileStatement"},
            {NodeType::DO_STATEMENT, "doStatement"},
            {NodeType::RETURN_STATEMENT, "returnStatement"},
            {NodeType::EXPRESSION, "expression"},
            {NodeType::TERM, "term"},
            {NodeType::EXPRESSION_LIST, "expressionList"},
        };
        if (const auto it = nodeTypeNames.find(type); it != nodeTypeNames.end())
        {
            os << it->second;
            return os;
        }
        os << "UNKNOWN_NODE_TYPE";
        return os;
    }

} // namespace jack::ast_type

namespace jack::ast
{
    class ASTNode;
    using NodeType = ast_type::NodeType;
    using Token = token::Token;
    using ASTNodePtr = std::unique_ptr<ASTNode>;
    using TokenPtr = std::unique_ptr<Token>;
    using GrammarNode = std::variant<ASTNodePtr, TokenPtr>;

    class ASTNode
    {
    public:
        explicit ASTNode(NodeType type) : type(type) {}
        inline NodeType get_type() const { return type; }
        inline bool is_type(const NodeType &t) const { return type == t; }
        inline void set_children(std::vector<GrammarNode> &&children)
        {
            this->children = std::move(children);
        }

        template <typename Father>
        void for_each_child(Father &&father, size_t from = 0) const
        {
            for (size_t i = from; i < children.size(); ++i)
            {
                std::invoke(std::forward<Father>(father), children[i]);
            }
        }

        const std::vector<GrammarNode> &get_children() const
        {
            return children;
        }

        // terminals in source order
        std::vector<const Token *> leaves() const;

        // one tag per line, nested tags indented by two spaces
        void print_tree(std::ostream &os, size_t indent = 0) const;

    private:
        NodeType type;
        std::vector<GrammarNode> children;
    };

    // compact rendering without whitespace between tags
    std::string to_xml(const ASTNode &node);
} // namespace jack::ast

namespace jack::grammar
{
    using namespace ast;
    using namespace lexer;
    using error::ErrorKind;
    using error::Failure;
    using error::Malformed;
    using error::NotApplicable;
    using Keyword = token_type::Keyword;
    using Symbol = token_type::Symbol;

    using Matched = std::vector<GrammarNode>;
    using ParseResult = std::variant<Matched, NotApplicable, Malformed>;

    // Cursor state of one parse: the token source, its snapshot stack and
    // the pending-failure flag. A rollback restores both the token source
    // and the flag.
    class ParseContext
    {
    public:
        explicit ParseContext(Lexer *lexer) : lexer(lexer) {}

        Lexer *get_lexer() const { return lexer; }
        size_t position() const { return lexer->position(); }

        const Token &current() const;
        Failure failure_at_current(ErrorKind kind, std::string expected) const;

        void branch();
        void rollback();
        void commit();

        // set while a consumed token failed validation and no enclosing
        // combinator has restored the cursor yet
        std::optional<Failure> pending;

        void note(const Failure &failure);
        const std::optional<Failure> &furthest_failure() const { return furthest; }

        // rule activations currently open; bounded so deeply nested input
        // fails with NESTING_TOO_DEEP instead of exhausting the stack
        static constexpr size_t MAX_NESTING = 1024;
        size_t nesting() const { return open_rules; }
        Failure nesting_failure() const;
        void enter() { ++open_rules; }
        void leave() { --open_rules; }

    private:
        Lexer *lexer;
        size_t open_rules = 0;
        std::optional<Failure> furthest;
        std::stack<std::optional<Failure>> pending_branches;
    };

    // Both signatures are the same; an eater inspects the current token
    // only, a collector may advance.
    using TerminalEater = std::function<ParseResult(ParseContext *)>;
    using GrammarNodeCollector = std::function<ParseResult(ParseContext *)>;

    extern const std::unordered_map<NodeType, GrammarNodeCollector> Collectors;

    enum class CollectorOperator
    {
        SEVERAL,
        OPTION
    };

    // terminal eaters
    TerminalEater eat_keyword(Keyword expected);
    TerminalEater eat_symbol(Symbol expected);
    TerminalEater eat_identifier();
    TerminalEater eat_int_const();
    TerminalEater eat_string_const();
    TerminalEater eat_type();

    // combinators
    GrammarNodeCollector take_next_token(TerminalEater eat);
    GrammarNodeCollector zero_or_more(GrammarNodeCollector rule);
    GrammarNodeCollector zero_or_one(GrammarNodeCollector rule);
    GrammarNodeCollector one_of(std::vector<GrammarNodeCollector> alternatives);

    GrammarNodeCollector operator+(const GrammarNodeCollector &lhs, const GrammarNodeCollector &rhs);
    GrammarNodeCollector operator|(const GrammarNodeCollector &lhs, const GrammarNodeCollector &rhs);
    GrammarNodeCollector operator*(const GrammarNodeCollector &gen, const CollectorOperator &op);

    template <NodeType type>
    GrammarNodeCollector node_collector()
    {
        return [](ParseContext *ctx) -> ParseResult
        {
            auto it = Collectors.find(type);
            if (it == Collectors.end())
            {
                throw std::runtime_error("[grammar] no production registered for rule");
            }
            if (ctx->nesting() >= ParseContext::MAX_NESTING)
            {
                return Malformed{ctx->nesting_failure()};
            }
            ctx->enter();
            auto res = it->second(ctx);
            ctx->leave();
            auto *children = std::get_if<Matched>(&res);
            if (children == nullptr)
            {
                return res;
            }
            auto node = std::make_unique<ASTNode>(type);
            node->set_children(std::move(*children));
            Matched matched;
            matched.emplace_back(std::move(node));
            return matched;
        };
    }
} // namespace jack::grammar

#endif
