#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace parity::query {

/// Token types for the pipeline-language lexer.
enum class TokenKind : std::uint8_t {
    // Literals
    IntLiteral,
    FloatLiteral,
    StringLiteral,
    BoolLiteral,
    DurationLiteral,
    TimeLiteral,  // time"2018-05-22T19:53:26Z"

    Identifier,

    // Keywords
    KeywordAnd,
    KeywordOr,
    KeywordNot,

    // Comparison operators
    EqEq,    // ==
    BangEq,  // !=
    Lt,      // <
    Le,      // <=
    Gt,      // >
    Ge,      // >=

    PipeForward,  // |>
    Minus,        // -

    // Delimiters
    LParen,     // (
    RParen,     // )
    LBracket,   // [
    RBracket,   // ]
    Comma,      // ,
    Semicolon,  // ;
    Colon,      // :

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

/// Tokenize a pipeline-language source string.
[[nodiscard]] auto tokenize(std::string_view source) -> std::vector<Token>;

}  // namespace parity::query
