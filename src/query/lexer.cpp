#include <parity/query/lexer.hpp>

#include <cctype>
#include <unordered_map>

namespace parity::query {

auto tokenize(std::string_view source) -> std::vector<Token> {
    std::vector<Token> tokens;

    const auto add_token = [&](TokenKind kind, std::size_t start, std::size_t length,
                               std::size_t line, std::size_t column) {
        tokens.push_back(Token{
            .kind = kind,
            .lexeme = source.substr(start, length),
            .line = line,
            .column = column,
        });
    };

    const std::unordered_map<std::string_view, TokenKind> keywords = {
        {"and", TokenKind::KeywordAnd},
        {"or", TokenKind::KeywordOr},
        {"not", TokenKind::KeywordNot},
    };

    const auto is_ident_start = [](unsigned char ch) -> bool {
        return std::isalpha(ch) != 0 || ch == '_';
    };

    const auto is_ident_cont = [](unsigned char ch) -> bool {
        return std::isalnum(ch) != 0 || ch == '_';
    };

    const auto is_digit = [](char ch) -> bool {
        return std::isdigit(static_cast<unsigned char>(ch)) != 0;
    };

    std::size_t i = 0;
    std::size_t line = 1;
    std::size_t column = 1;

    const auto at_end = [&]() -> bool {
        return i >= source.size();
    };
    const auto peek = [&](std::size_t offset = 0) -> char {
        if (i + offset >= source.size()) {
            return '\0';
        }
        return source[i + offset];
    };
    const auto advance = [&]() -> char {
        if (at_end()) {
            return '\0';
        }
        char ch = source[i++];
        if (ch == '\n') {
            line += 1;
            column = 1;
        } else {
            column += 1;
        }
        return ch;
    };

    const auto match = [&](char expected) -> bool {
        if (peek() != expected) {
            return false;
        }
        advance();
        return true;
    };

    const auto skip_whitespace_and_comments = [&]() {
        while (!at_end()) {
            char ch = peek();
            if (ch == ' ' || ch == '\r' || ch == '\t' || ch == '\n') {
                advance();
                continue;
            }
            if (ch == '/' && peek(1) == '/') {
                while (!at_end() && peek() != '\n') {
                    advance();
                }
                continue;
            }
            break;
        }
    };

    // Consumes the rest of a string literal after its opening quote.
    const auto scan_string = [&]() -> bool {
        while (!at_end() && peek() != '"') {
            if (peek() == '\\' && peek(1) != '\0') {
                advance();
            }
            advance();
        }
        if (at_end()) {
            return false;
        }
        advance();
        return true;
    };

    const auto is_duration_unit = [](std::string_view unit) -> bool {
        return unit == "ns" || unit == "us" || unit == "ms" || unit == "s" || unit == "m" ||
               unit == "h" || unit == "d" || unit == "w";
    };

    while (!at_end()) {
        skip_whitespace_and_comments();
        if (at_end()) {
            break;
        }

        std::size_t token_start = i;
        std::size_t token_line = line;
        std::size_t token_column = column;
        char ch = advance();

        if (is_ident_start(static_cast<unsigned char>(ch))) {
            while (is_ident_cont(static_cast<unsigned char>(peek()))) {
                advance();
            }
            std::string_view text = source.substr(token_start, i - token_start);
            if (text == "time" && peek() == '"') {
                advance();
                bool closed = scan_string();
                add_token(closed ? TokenKind::TimeLiteral : TokenKind::Error, token_start,
                          i - token_start, token_line, token_column);
                continue;
            }
            if (text == "true" || text == "false") {
                add_token(TokenKind::BoolLiteral, token_start, i - token_start, token_line,
                          token_column);
                continue;
            }
            if (auto it = keywords.find(text); it != keywords.end()) {
                add_token(it->second, token_start, i - token_start, token_line, token_column);
                continue;
            }
            add_token(TokenKind::Identifier, token_start, i - token_start, token_line,
                      token_column);
            continue;
        }

        if (is_digit(ch)) {
            while (is_digit(peek())) {
                advance();
            }
            bool is_float = false;
            if (peek() == '.' && is_digit(peek(1))) {
                is_float = true;
                advance();
                while (is_digit(peek())) {
                    advance();
                }
                if (peek() == 'e' || peek() == 'E') {
                    advance();
                    if (peek() == '+' || peek() == '-') {
                        advance();
                    }
                    while (is_digit(peek())) {
                        advance();
                    }
                }
            }

            if (!is_float && is_ident_start(static_cast<unsigned char>(peek()))) {
                // Duration: one or more <digits><unit> groups, e.g. 1h30m.
                bool valid = true;
                while (true) {
                    std::size_t unit_start = i;
                    while (std::isalpha(static_cast<unsigned char>(peek())) != 0) {
                        advance();
                    }
                    if (!is_duration_unit(source.substr(unit_start, i - unit_start))) {
                        valid = false;
                    }
                    if (!is_digit(peek())) {
                        break;
                    }
                    while (is_digit(peek())) {
                        advance();
                    }
                }
                while (is_ident_cont(static_cast<unsigned char>(peek()))) {
                    valid = false;
                    advance();
                }
                add_token(valid ? TokenKind::DurationLiteral : TokenKind::Error, token_start,
                          i - token_start, token_line, token_column);
                continue;
            }

            add_token(is_float ? TokenKind::FloatLiteral : TokenKind::IntLiteral, token_start,
                      i - token_start, token_line, token_column);
            continue;
        }

        switch (ch) {
            case '"': {
                bool closed = scan_string();
                add_token(closed ? TokenKind::StringLiteral : TokenKind::Error, token_start,
                          i - token_start, token_line, token_column);
                continue;
            }
            case '-':
                add_token(TokenKind::Minus, token_start, 1, token_line, token_column);
                continue;
            case '|':
                if (match('>')) {
                    add_token(TokenKind::PipeForward, token_start, 2, token_line, token_column);
                } else {
                    add_token(TokenKind::Error, token_start, 1, token_line, token_column);
                }
                continue;
            case '!':
                if (match('=')) {
                    add_token(TokenKind::BangEq, token_start, 2, token_line, token_column);
                } else {
                    add_token(TokenKind::Error, token_start, 1, token_line, token_column);
                }
                continue;
            case '=':
                if (match('=')) {
                    add_token(TokenKind::EqEq, token_start, 2, token_line, token_column);
                } else {
                    add_token(TokenKind::Error, token_start, 1, token_line, token_column);
                }
                continue;
            case '<':
                if (match('=')) {
                    add_token(TokenKind::Le, token_start, 2, token_line, token_column);
                } else {
                    add_token(TokenKind::Lt, token_start, 1, token_line, token_column);
                }
                continue;
            case '>':
                if (match('=')) {
                    add_token(TokenKind::Ge, token_start, 2, token_line, token_column);
                } else {
                    add_token(TokenKind::Gt, token_start, 1, token_line, token_column);
                }
                continue;
            case '(':
                add_token(TokenKind::LParen, token_start, 1, token_line, token_column);
                continue;
            case ')':
                add_token(TokenKind::RParen, token_start, 1, token_line, token_column);
                continue;
            case '[':
                add_token(TokenKind::LBracket, token_start, 1, token_line, token_column);
                continue;
            case ']':
                add_token(TokenKind::RBracket, token_start, 1, token_line, token_column);
                continue;
            case ',':
                add_token(TokenKind::Comma, token_start, 1, token_line, token_column);
                continue;
            case ';':
                add_token(TokenKind::Semicolon, token_start, 1, token_line, token_column);
                continue;
            case ':':
                add_token(TokenKind::Colon, token_start, 1, token_line, token_column);
                continue;
            default:
                add_token(TokenKind::Error, token_start, 1, token_line, token_column);
                continue;
        }
    }

    tokens.push_back(Token{
        .kind = TokenKind::Eof,
        .lexeme = source.substr(source.size(), 0),
        .line = line,
        .column = column,
    });
    return tokens;
}

}  // namespace parity::query
