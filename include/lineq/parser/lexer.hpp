#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace lineq::parser {

/// Token types of the query expression language.
enum class TokenKind : std::uint8_t {
    // Literals
    IntLiteral,
    FloatLiteral,
    StringLiteral,

    // Identifiers
    Identifier,

    // Keywords
    KeywordIf,
    KeywordElse,
    KeywordAnd,
    KeywordOr,
    KeywordNot,
    KeywordIn,
    KeywordTrue,
    KeywordFalse,
    KeywordNone,

    // Comparison operators
    EqEq,    // ==
    BangEq,  // !=
    Lt,      // <
    Le,      // <=
    Gt,      // >
    Ge,      // >=

    // Arithmetic operators
    Plus,        // +
    Minus,       // -
    Star,        // *
    StarStar,    // **
    Slash,       // /
    SlashSlash,  // //
    Percent,     // %

    // Delimiters
    LParen,    // (
    RParen,    // )
    LBracket,  // [
    RBracket,  // ]
    LBrace,    // {
    RBrace,    // }
    Comma,     // ,
    Colon,     // :
    Dot,       // .

    // Special
    Eof,
    Error,
};

/// A single token with source location.
struct Token {
    TokenKind kind = TokenKind::Error;
    std::string_view lexeme;
    std::size_t line = 0;
    std::size_t column = 0;
};

/// Tokenize a query expression.
[[nodiscard]] auto tokenize(std::string_view source) -> std::vector<Token>;

}  // namespace lineq::parser
