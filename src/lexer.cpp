// ============================================================================
// lexer.cpp — Expression tokeniser implementation
// ============================================================================

#include "xi/lexer.hpp"

#include <cctype>
#include <stdexcept>

namespace xi {

// ── token_kind_name ─────────────────────────────────────────────────────────

const char* token_kind_name(TokenKind k) noexcept {
    switch (k) {
        case TokenKind::Identifier: return "identifier";
        case TokenKind::Bang:       return "!";
        case TokenKind::Amp:        return "&";
        case TokenKind::Pipe:       return "|";
        case TokenKind::LParen:     return "(";
        case TokenKind::RParen:     return ")";
        case TokenKind::Eof:        return "EOF";
    }
    return "?";
}

// ── Lexer ───────────────────────────────────────────────────────────────────

Lexer::Lexer(std::string_view source, std::uint32_t line)
    : src_(source), pos_{line, 1} {}

Token Lexer::make_token(TokenKind kind, std::string text, SourcePos pos) {
    return Token{kind, std::move(text), pos};
}

void Lexer::error(const std::string& msg) const {
    // Format: <line>: ERROR: <message> at column <n>
    throw std::runtime_error(
        std::to_string(pos_.line) + ": ERROR: " + msg +
        " at column " + std::to_string(pos_.column));
}

// ── skip_whitespace_and_comments ────────────────────────────────────────────

void Lexer::skip_whitespace_and_comments() {
    while (idx_ < src_.size()) {
        char c = src_[idx_];
        if (c == '#') {
            while (idx_ < src_.size() && src_[idx_] != '\n') {
                ++idx_;
                ++pos_.column;
            }
        } else if (c == '\n') {
            ++idx_;
            pos_.line++;
            pos_.column = 1;
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            ++idx_;
            ++pos_.column;
        } else {
            break;
        }
    }
}

// ── read_identifier ─────────────────────────────────────────────────────────
// Read [A-Za-z_][A-Za-z0-9_]*.  Reserved words are rejected later, by
// Predicate construction, so that the error names the predicate rule.

Token Lexer::read_identifier() {
    SourcePos start = pos_;
    std::size_t begin = idx_;

    while (idx_ < src_.size() &&
           (std::isalnum(static_cast<unsigned char>(src_[idx_])) ||
            src_[idx_] == '_')) {
        ++idx_;
        ++pos_.column;
    }

    return make_token(TokenKind::Identifier,
                      std::string(src_.substr(begin, idx_ - begin)), start);
}

// ── next ────────────────────────────────────────────────────────────────────

Token Lexer::next() {
    if (has_peeked_) {
        has_peeked_ = false;
        return std::move(peeked_);
    }

    skip_whitespace_and_comments();

    if (idx_ >= src_.size()) {
        return make_token(TokenKind::Eof, "", pos_);
    }

    SourcePos start = pos_;
    char c = src_[idx_];

    if (c == '!') { ++idx_; ++pos_.column; return make_token(TokenKind::Bang,   "!", start); }
    if (c == '&') { ++idx_; ++pos_.column; return make_token(TokenKind::Amp,    "&", start); }
    if (c == '|') { ++idx_; ++pos_.column; return make_token(TokenKind::Pipe,   "|", start); }
    if (c == '(') { ++idx_; ++pos_.column; return make_token(TokenKind::LParen, "(", start); }
    if (c == ')') { ++idx_; ++pos_.column; return make_token(TokenKind::RParen, ")", start); }

    if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
        return read_identifier();
    }

    error(std::string("unexpected character '") + c + "'");
}

// ── peek ────────────────────────────────────────────────────────────────────

const Token& Lexer::peek() {
    if (!has_peeked_) {
        peeked_ = next();
        has_peeked_ = true;
    }
    return peeked_;
}

// ── tokenise (convenience) ──────────────────────────────────────────────────

std::vector<Token> tokenise(std::string_view source, std::uint32_t line) {
    Lexer lex(source, line);
    std::vector<Token> toks;
    for (;;) {
        Token t = lex.next();
        toks.push_back(t);
        if (t.kind == TokenKind::Eof) break;
    }
    return toks;
}

}  // namespace xi
