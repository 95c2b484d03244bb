#include "parser.hpp"

#include <stdexcept>
#include <variant>

#include "util.hpp"

namespace jack::parser {
ASTNodePtr Parser::run(const GrammarNodeCollector &rule, bool whole_input) {
    if (used) {
        throw std::runtime_error("[Parser] a parser runs a single entry production");
    }
    used = true;

    auto res = rule(&ctx);
    return std::visit(overloaded{
                          [&](Matched &nodes) -> ASTNodePtr {
                              if (whole_input && lexer->has_more_tokens()) {
                                  const auto &extra = lexer->advance();
                                  if (extra.is_illegal()) {
                                      auto failure = ctx.failure_at_current(ErrorKind::ILLEGAL_TOKEN, "");
                                      failure.found = extra.get_content();
                                      throw ParseError(failure);
                                  }
                                  throw ParseError(ctx.failure_at_current(ErrorKind::TRAILING_TOKENS, "end of input"));
                              }
                              return std::move(std::get<ASTNodePtr>(nodes.front()));
                          },
                          [&](NotApplicable &absent) -> ASTNodePtr {
                              // report where the input stopped making sense, not where the
                              // outermost rule gave up
                              throw ParseError(ctx.furthest_failure().value_or(absent.failure));
                          },
                          [](Malformed &bad) -> ASTNodePtr {
                              throw ParseError(bad.failure);
                          },
                      },
                      res);
}

ASTNodePtr Parser::compile_class() {
    return run(node_collector<NodeType::CLASS>(), true);
}

ASTNodePtr Parser::compile_class_var_dec() {
    return run(node_collector<NodeType::CLASS_VAR_DEC>(), false);
}

ASTNodePtr Parser::compile_subroutine_dec() {
    return run(node_collector<NodeType::SUBROUTINE_DEC>(), false);
}

ASTNodePtr Parser::compile_parameter_list() {
    return run(node_collector<NodeType::PARAMETER_LIST>(), false);
}

ASTNodePtr Parser::compile_subroutine_body() {
    return run(node_collector<NodeType::SUBROUTINE_BODY>(), false);
}

ASTNodePtr Parser::compile_var_dec() {
    return run(node_collector<NodeType::VAR_DEC>(), false);
}

ASTNodePtr Parser::compile_statements() {
    return run(node_collector<NodeType::STATEMENTS>(), false);
}

ASTNodePtr Parser::compile_let() {
    return run(node_collector<NodeType::LET_STATEMENT>(), false);
}

ASTNodePtr Parser::compile_if() {
    return run(node_collector<NodeType::IF_STATEMENT>(), false);
}

ASTNodePtr Parser::compile_while() {
    return run(node_collector<NodeType::WHILE_STATEMENT>(), false);
}

ASTNodePtr Parser::compile_do() {
    return run(node_collector<NodeType::DO_STATEMENT>(), false);
}

ASTNodePtr Parser::compile_return() {
    return run(node_collector<NodeType::RETURN_STATEMENT>(), false);
}

ASTNodePtr Parser::compile_expression() {
    return run(node_collector<NodeType::EXPRESSION>(), false);
}

ASTNodePtr Parser::compile_term() {
    return run(node_collector<NodeType::TERM>(), false);
}

ASTNodePtr Parser::compile_expression_list() {
    return run(node_collector<NodeType::EXPRESSION_LIST>(), false);
}
}  // namespace jack::parser
