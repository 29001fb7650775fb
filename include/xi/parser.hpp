// ============================================================================
// xi/parser.hpp — Recursive-descent parser for expressions
// ============================================================================
//
// Grammar (informal, with precedence already encoded):
//
//   expr        ::= or_expr
//   or_expr     ::= and_expr  ( '|' and_expr )*        (left-assoc)
//   and_expr    ::= unary     ( '&' unary )*           (left-assoc)
//   unary       ::= '!' unary
//                  | primary
//   primary     ::= IDENTIFIER
//                  | '(' expr ')'
//
// Precedence (highest → lowest):
//   1. !    (unary prefix)
//   2. &    (left-assoc)
//   3. |    (left-assoc)
//
// The parser builds RAW structure through ExpressionFactory::make_*; it
// never canonicalizes.  Identifiers go through Predicate construction, so
// an invalid name raises InvalidPredicateError.
//
// ============================================================================

#ifndef XI_PARSER_HPP
#define XI_PARSER_HPP

#include "xi/ast.hpp"
#include "xi/lexer.hpp"

#include <string>

namespace xi {

// ── Parser ──────────────────────────────────────────────────────────────────
// Parses exactly one expression and returns its ExprId.  Throws
// std::runtime_error on syntax errors with the format:
//   <line>: ERROR: <msg> at column <n>

class Parser {
public:
    Parser(Lexer& lexer, ExpressionFactory& factory);

    /// Parse a complete expression (expects Eof after).
    ExprId parse();

private:
    ExprId parse_or();
    ExprId parse_and();
    ExprId parse_unary();
    ExprId parse_primary();

    Token expect(TokenKind kind, const std::string& context);
    [[noreturn]] void error(const Token& tok, const std::string& msg);

    Lexer&             lex_;
    ExpressionFactory& fac_;
};

// ── Convenience free function ───────────────────────────────────────────────

ExprId parse_expression(const std::string& input, ExpressionFactory& factory,
                        std::uint32_t line = 1);

}  // namespace xi

#endif  // XI_PARSER_HPP
