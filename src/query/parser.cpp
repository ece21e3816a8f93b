#include <parity/query/lexer.hpp>
#include <parity/query/parser.hpp>

#include <fmt/core.h>

#include <charconv>
#include <cstdlib>
#include <optional>
#include <string>
#include <utility>

namespace parity::query {

namespace {

class Parser {
   public:
    explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    auto parse_program() -> std::expected<Program, ParseError> {
        Program program;
        while (!is_at_end()) {
            if (match(TokenKind::Semicolon)) {
                continue;
            }
            auto pipeline = parse_pipeline();
            if (!pipeline.has_value()) {
                return std::unexpected(error_);
            }
            program.pipelines.push_back(std::move(*pipeline));
            if (!is_at_end() && !check(TokenKind::Semicolon)) {
                return std::unexpected(
                    make_error(peek(), fmt::format("expected '|>' or ';' before {}",
                                                   format_token(peek()))));
            }
        }
        if (program.pipelines.empty()) {
            return std::unexpected(make_error(peek(), "query contains no pipelines"));
        }
        return program;
    }

   private:
    auto parse_pipeline() -> std::optional<PipelineStmt> {
        PipelineStmt pipeline;
        do {
            auto call = parse_call();
            if (!call.has_value()) {
                return std::nullopt;
            }
            pipeline.calls.push_back(std::move(*call));
        } while (match(TokenKind::PipeForward));
        return pipeline;
    }

    auto parse_call() -> std::optional<Call> {
        if (peek().kind == TokenKind::Error) {
            error_ = make_error(peek(), fmt::format("invalid token {}", format_token(peek())));
            return std::nullopt;
        }
        const Token& start = peek();
        auto name = consume_identifier("expected function name");
        if (!name.has_value()) {
            return std::nullopt;
        }
        Call call{.name = std::move(*name), .args = {}, .line = start.line,
                  .column = start.column};
        if (!consume(TokenKind::LParen, "expected '(' after function name")) {
            return std::nullopt;
        }
        if (!check(TokenKind::RParen)) {
            do {
                auto arg = parse_argument();
                if (!arg.has_value()) {
                    return std::nullopt;
                }
                call.args.push_back(std::move(*arg));
            } while (match(TokenKind::Comma));
        }
        if (!consume(TokenKind::RParen, "expected ')' after arguments")) {
            return std::nullopt;
        }
        return call;
    }

    auto parse_argument() -> std::optional<Argument> {
        Argument arg;
        if (check(TokenKind::Identifier) && peek_next().kind == TokenKind::Colon) {
            arg.name = std::string(advance().lexeme);
            advance();
        }
        arg.value = parse_expr();
        if (!arg.value) {
            return std::nullopt;
        }
        return arg;
    }

    auto parse_expr() -> ExprPtr { return parse_or(); }

    auto parse_or() -> ExprPtr {
        auto expr = parse_and();
        while (expr && match(TokenKind::KeywordOr)) {
            const Token& op = previous();
            auto right = parse_and();
            if (!right) {
                return nullptr;
            }
            expr = make_binary(op, BinaryOp::Or, std::move(expr), std::move(right));
        }
        return expr;
    }

    auto parse_and() -> ExprPtr {
        auto expr = parse_not();
        while (expr && match(TokenKind::KeywordAnd)) {
            const Token& op = previous();
            auto right = parse_not();
            if (!right) {
                return nullptr;
            }
            expr = make_binary(op, BinaryOp::And, std::move(expr), std::move(right));
        }
        return expr;
    }

    auto parse_not() -> ExprPtr {
        if (match(TokenKind::KeywordNot)) {
            const Token& op = previous();
            auto operand = parse_not();
            if (!operand) {
                return nullptr;
            }
            auto expr = std::make_unique<Expr>();
            expr->node = NotExpr{.operand = std::move(operand)};
            expr->line = op.line;
            expr->column = op.column;
            return expr;
        }
        return parse_comparison();
    }

    auto parse_comparison() -> ExprPtr {
        auto expr = parse_primary();
        if (!expr) {
            return nullptr;
        }
        std::optional<BinaryOp> op;
        switch (peek().kind) {
            case TokenKind::EqEq:
                op = BinaryOp::Eq;
                break;
            case TokenKind::BangEq:
                op = BinaryOp::Ne;
                break;
            case TokenKind::Lt:
                op = BinaryOp::Lt;
                break;
            case TokenKind::Le:
                op = BinaryOp::Le;
                break;
            case TokenKind::Gt:
                op = BinaryOp::Gt;
                break;
            case TokenKind::Ge:
                op = BinaryOp::Ge;
                break;
            default:
                return expr;
        }
        const Token& token = advance();
        auto right = parse_primary();
        if (!right) {
            return nullptr;
        }
        return make_binary(token, *op, std::move(expr), std::move(right));
    }

    auto parse_primary() -> ExprPtr {
        const Token& token = peek();
        switch (token.kind) {
            case TokenKind::IntLiteral: {
                advance();
                auto value = parse_int(token.lexeme, false);
                if (!value.has_value()) {
                    return fail_expr(token, fmt::format("integer literal {} out of range",
                                                        format_token(token)));
                }
                return make_literal(token, Value{*value});
            }
            case TokenKind::FloatLiteral: {
                advance();
                return make_literal(token, Value{parse_double(token.lexeme)});
            }
            case TokenKind::StringLiteral:
                advance();
                return make_literal(token, Value{unescape_string(token.lexeme)});
            case TokenKind::BoolLiteral:
                advance();
                return make_literal(token, Value{token.lexeme == "true"});
            case TokenKind::DurationLiteral: {
                advance();
                auto duration = parse_duration(token.lexeme);
                if (!duration.has_value()) {
                    return fail_expr(token, fmt::format("invalid duration {}", format_token(token)));
                }
                return make_literal(token, Value{*duration});
            }
            case TokenKind::TimeLiteral: {
                advance();
                std::string text = unescape_string(token.lexeme.substr(4));
                auto ts = parse_rfc3339(text);
                if (!ts.has_value()) {
                    return fail_expr(token, fmt::format("invalid time literal \"{}\"", text));
                }
                return make_literal(token, Value{*ts});
            }
            case TokenKind::Minus:
                return parse_negative();
            case TokenKind::Identifier: {
                advance();
                auto expr = std::make_unique<Expr>();
                expr->node = IdentifierExpr{.name = std::string(token.lexeme)};
                expr->line = token.line;
                expr->column = token.column;
                return expr;
            }
            case TokenKind::LBracket:
                return parse_array();
            case TokenKind::LParen: {
                advance();
                auto expr = parse_expr();
                if (!expr) {
                    return nullptr;
                }
                if (!consume(TokenKind::RParen, "expected ')' after expression")) {
                    return nullptr;
                }
                return expr;
            }
            case TokenKind::Error:
                return fail_expr(token, fmt::format("invalid token {}", format_token(token)));
            default:
                return fail_expr(token,
                                 fmt::format("expected expression, found {}", format_token(token)));
        }
    }

    auto parse_negative() -> ExprPtr {
        const Token& minus = advance();
        const Token& token = peek();
        switch (token.kind) {
            case TokenKind::IntLiteral: {
                advance();
                auto value = parse_int(token.lexeme, true);
                if (!value.has_value()) {
                    return fail_expr(token, fmt::format("integer literal -{} out of range",
                                                        std::string(token.lexeme)));
                }
                return make_literal(minus, Value{*value});
            }
            case TokenKind::FloatLiteral:
                advance();
                return make_literal(minus, Value{-parse_double(token.lexeme)});
            case TokenKind::DurationLiteral: {
                advance();
                auto duration = parse_duration(token.lexeme);
                if (!duration.has_value()) {
                    return fail_expr(token, fmt::format("invalid duration {}", format_token(token)));
                }
                return make_literal(minus, Value{Duration{-duration->nanos}});
            }
            default:
                return fail_expr(token, "expected a number or duration after '-'");
        }
    }

    auto parse_array() -> ExprPtr {
        const Token& open = advance();
        ArrayExpr array;
        if (!check(TokenKind::RBracket)) {
            do {
                auto element = parse_expr();
                if (!element) {
                    return nullptr;
                }
                array.elements.push_back(std::move(element));
            } while (match(TokenKind::Comma));
        }
        if (!consume(TokenKind::RBracket, "expected ']' after array elements")) {
            return nullptr;
        }
        auto expr = std::make_unique<Expr>();
        expr->node = std::move(array);
        expr->line = open.line;
        expr->column = open.column;
        return expr;
    }

    auto consume(TokenKind kind, std::string_view message) -> bool {
        if (check(kind)) {
            advance();
            return true;
        }
        error_ = make_error(peek(), message);
        return false;
    }

    auto consume_identifier(std::string_view message) -> std::optional<std::string> {
        if (match(TokenKind::Identifier)) {
            return std::string(previous().lexeme);
        }
        error_ = make_error(peek(), message);
        return std::nullopt;
    }

    auto check(TokenKind kind) const -> bool {
        if (is_at_end()) {
            return kind == TokenKind::Eof;
        }
        return peek().kind == kind;
    }

    auto match(TokenKind kind) -> bool {
        if (!check(kind)) {
            return false;
        }
        advance();
        return true;
    }

    auto advance() -> const Token& {
        if (!is_at_end()) {
            current_ += 1;
        }
        return previous();
    }

    auto is_at_end() const -> bool { return peek().kind == TokenKind::Eof; }

    auto peek() const -> const Token& { return tokens_[current_]; }

    auto peek_next() const -> const Token& {
        return current_ + 1 < tokens_.size() ? tokens_[current_ + 1] : tokens_.back();
    }

    auto previous() const -> const Token& { return tokens_[current_ - 1]; }

    static auto make_error(const Token& token, std::string_view message) -> ParseError {
        return ParseError{
            .message = std::string(message),
            .line = token.line,
            .column = token.column,
        };
    }

    static auto format_token(const Token& token) -> std::string {
        if (token.kind == TokenKind::Eof || token.lexeme.empty()) {
            return "'<eof>'";
        }
        return fmt::format("'{}'", std::string(token.lexeme));
    }

    auto fail_expr(const Token& token, std::string_view message) -> ExprPtr {
        error_ = make_error(token, message);
        return nullptr;
    }

    static auto parse_int(std::string_view text, bool negative) -> std::optional<std::int64_t> {
        std::string digits = negative ? fmt::format("-{}", text) : std::string(text);
        std::int64_t value = 0;
        auto result = std::from_chars(digits.data(), digits.data() + digits.size(), value);
        if (result.ec != std::errc() || result.ptr != digits.data() + digits.size()) {
            return std::nullopt;
        }
        return value;
    }

    static auto parse_double(std::string_view text) -> double {
        std::string tmp(text);
        return std::strtod(tmp.c_str(), nullptr);
    }

    static auto unescape_string(std::string_view text) -> std::string {
        if (text.size() < 2) {
            return std::string(text);
        }
        std::string result;
        result.reserve(text.size() - 2);
        for (std::size_t idx = 1; idx + 1 < text.size(); ++idx) {
            char ch = text[idx];
            if (ch == '\\' && idx + 1 < text.size() - 1) {
                char next = text[idx + 1];
                switch (next) {
                    case 'n':
                        result.push_back('\n');
                        break;
                    case 't':
                        result.push_back('\t');
                        break;
                    default:
                        result.push_back(next);
                        break;
                }
                ++idx;
                continue;
            }
            result.push_back(ch);
        }
        return result;
    }

    static auto make_literal(const Token& token, Value value) -> ExprPtr {
        auto expr = std::make_unique<Expr>();
        expr->node = LiteralExpr{.value = std::move(value)};
        expr->line = token.line;
        expr->column = token.column;
        return expr;
    }

    static auto make_binary(const Token& token, BinaryOp op, ExprPtr left, ExprPtr right)
        -> ExprPtr {
        auto node = std::make_unique<Expr>();
        node->node = BinaryExpr{
            .op = op,
            .left = std::move(left),
            .right = std::move(right),
        };
        node->line = token.line;
        node->column = token.column;
        return node;
    }

    std::vector<Token> tokens_;
    std::size_t current_ = 0;
    ParseError error_{};
};

}  // namespace

auto ParseError::format() const -> std::string {
    return fmt::format("{}:{}: {}", line, column, message);
}

auto parse(std::string_view source) -> ParseResult {
    Parser parser(tokenize(source));
    return parser.parse_program();
}

}  // namespace parity::query
