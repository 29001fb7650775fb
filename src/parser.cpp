// ============================================================================
// parser.cpp — Recursive-descent expression parser
// ============================================================================
//
//   parse()           calls parse_or() and then expects Eof.
//   parse_or()        handles  |   (left-associative).
//   parse_and()       handles  &   (left-associative).
//   parse_unary()     handles  !   (prefix).
//   parse_primary()   handles  identifiers and parentheses.
//
// ============================================================================

#include "xi/parser.hpp"

#include <stdexcept>

namespace xi {

Parser::Parser(Lexer& lexer, ExpressionFactory& factory)
    : lex_(lexer), fac_(factory) {}

// ── Error helpers ───────────────────────────────────────────────────────────

void Parser::error(const Token& tok, const std::string& msg) {
    throw std::runtime_error(
        std::to_string(tok.pos.line) + ": ERROR: " + msg +
        " at column " + std::to_string(tok.pos.column));
}

Token Parser::expect(TokenKind kind, const std::string& context) {
    Token t = lex_.next();
    if (t.kind != kind) {
        error(t, "expected " + std::string(token_kind_name(kind)) +
                 " " + context + ", got '" + t.text + "'");
    }
    return t;
}

// ── parse ───────────────────────────────────────────────────────────────────

ExprId Parser::parse() {
    ExprId e = parse_or();
    const Token& t = lex_.peek();
    if (t.kind != TokenKind::Eof) {
        error(t, "unexpected token '" + t.text + "' after expression");
    }
    return e;
}

// ── parse_or ────────────────────────────────────────────────────────────────

ExprId Parser::parse_or() {
    ExprId lhs = parse_and();
    while (lex_.peek().kind == TokenKind::Pipe) {
        lex_.next();  // consume '|'
        ExprId rhs = parse_and();
        lhs = fac_.make_or(lhs, rhs);
    }
    return lhs;
}

// ── parse_and ───────────────────────────────────────────────────────────────

ExprId Parser::parse_and() {
    ExprId lhs = parse_unary();
    while (lex_.peek().kind == TokenKind::Amp) {
        lex_.next();  // consume '&'
        ExprId rhs = parse_unary();
        lhs = fac_.make_and(lhs, rhs);
    }
    return lhs;
}

// ── parse_unary ─────────────────────────────────────────────────────────────

ExprId Parser::parse_unary() {
    if (lex_.peek().kind == TokenKind::Bang) {
        lex_.next();
        return fac_.make_not(parse_unary());
    }
    return parse_primary();
}

// ── parse_primary ───────────────────────────────────────────────────────────

ExprId Parser::parse_primary() {
    Token t = lex_.next();

    switch (t.kind) {
        case TokenKind::Identifier:
            return fac_.make_atom(Predicate(t.text));

        case TokenKind::LParen: {
            ExprId inner = parse_or();
            expect(TokenKind::RParen, "to close '('");
            return inner;
        }

        case TokenKind::Eof:
            error(t, "unexpected end of input");

        default:
            error(t, "unexpected token '" + t.text + "'");
    }
}

// ── Free function convenience ───────────────────────────────────────────────

ExprId parse_expression(const std::string& input, ExpressionFactory& factory,
                        std::uint32_t line) {
    Lexer lex(input, line);
    Parser parser(lex, factory);
    return parser.parse();
}

}  // namespace xi
