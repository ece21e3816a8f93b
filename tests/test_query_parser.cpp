#include <parity/query/lexer.hpp>
#include <parity/query/parser.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <limits>
#include <string>
#include <variant>

namespace {

using namespace parity::query;

const Expr& require_expr(const ExprPtr& expr) {
    REQUIRE(expr != nullptr);
    return *expr;
}

const BinaryExpr& require_binary(const Expr& expr, BinaryOp op) {
    const auto* node = std::get_if<BinaryExpr>(&expr.node);
    REQUIRE(node != nullptr);
    REQUIRE(node->op == op);
    return *node;
}

const LiteralExpr& require_literal(const Expr& expr) {
    const auto* node = std::get_if<LiteralExpr>(&expr.node);
    REQUIRE(node != nullptr);
    return *node;
}

const IdentifierExpr& require_identifier(const Expr& expr) {
    const auto* node = std::get_if<IdentifierExpr>(&expr.node);
    REQUIRE(node != nullptr);
    return *node;
}

const ArrayExpr& require_array(const Expr& expr) {
    const auto* node = std::get_if<ArrayExpr>(&expr.node);
    REQUIRE(node != nullptr);
    return *node;
}

auto kinds(std::string_view source) -> std::vector<TokenKind> {
    std::vector<TokenKind> out;
    for (const auto& token : tokenize(source)) {
        out.push_back(token.kind);
    }
    return out;
}

}  // namespace

TEST_CASE("Tokenize pipeline operators and literals", "[query][lexer]") {
    REQUIRE(kinds(R"(from(bucket: "db/rp") |> range(start: -1h30m) // trailing)") ==
            std::vector<TokenKind>{TokenKind::Identifier, TokenKind::LParen, TokenKind::Identifier,
                                   TokenKind::Colon, TokenKind::StringLiteral, TokenKind::RParen,
                                   TokenKind::PipeForward, TokenKind::Identifier,
                                   TokenKind::LParen, TokenKind::Identifier, TokenKind::Colon,
                                   TokenKind::Minus, TokenKind::DurationLiteral,
                                   TokenKind::RParen, TokenKind::Eof});

    REQUIRE(kinds(R"(1 2.5 true time"2018-05-22T19:53:26Z" <= != and not)") ==
            std::vector<TokenKind>{TokenKind::IntLiteral, TokenKind::FloatLiteral,
                                   TokenKind::BoolLiteral, TokenKind::TimeLiteral, TokenKind::Le,
                                   TokenKind::BangEq, TokenKind::KeywordAnd, TokenKind::KeywordNot,
                                   TokenKind::Eof});

    SECTION("malformed tokens") {
        REQUIRE(kinds("5parsecs")[0] == TokenKind::Error);
        REQUIRE(kinds("\"open")[0] == TokenKind::Error);
        REQUIRE(kinds("a = b")[1] == TokenKind::Error);
    }

    SECTION("locations") {
        auto tokens = tokenize("from()\n  |> count()");
        REQUIRE(tokens[3].kind == TokenKind::PipeForward);
        REQUIRE(tokens[3].line == 2);
        REQUIRE(tokens[3].column == 3);
    }
}

TEST_CASE("Parse a pipeline of calls", "[query][parser]") {
    auto result = parse(R"(from(bucket: "db0/autogen")
        |> filter(fn: _measurement == "cpu" and host != "b")
        |> group(columns: ["_measurement", "host"])
        |> count(column: "value"))");
    REQUIRE(result.has_value());
    REQUIRE(result->pipelines.size() == 1);

    const auto& calls = result->pipelines.front().calls;
    REQUIRE(calls.size() == 4);
    REQUIRE(calls[0].name == "from");
    REQUIRE(calls[0].args.size() == 1);
    REQUIRE(calls[0].args[0].name == "bucket");
    REQUIRE(std::get<std::string>(require_literal(require_expr(calls[0].args[0].value)).value) ==
            "db0/autogen");

    const auto& filter = require_binary(require_expr(calls[1].args[0].value), BinaryOp::And);
    const auto& lhs = require_binary(require_expr(filter.left), BinaryOp::Eq);
    REQUIRE(require_identifier(require_expr(lhs.left)).name == "_measurement");
    require_binary(require_expr(filter.right), BinaryOp::Ne);

    const auto& columns = require_array(require_expr(calls[2].args[0].value));
    REQUIRE(columns.elements.size() == 2);

    REQUIRE(calls[3].line == 4);
    REQUIRE(calls[3].column == 12);
}

TEST_CASE("Operator precedence", "[query][parser]") {
    auto result = parse("filter(fn: not a == 1 or b < 2 and c >= 3)");
    REQUIRE(result.has_value());
    const auto& expr = require_expr(result->pipelines[0].calls[0].args[0].value);
    const auto& top = require_binary(expr, BinaryOp::Or);
    REQUIRE(std::holds_alternative<NotExpr>(require_expr(top.left).node));
    const auto& right = require_binary(require_expr(top.right), BinaryOp::And);
    require_binary(require_expr(right.left), BinaryOp::Lt);
    require_binary(require_expr(right.right), BinaryOp::Ge);
}

TEST_CASE("Parse literal values", "[query][parser]") {
    auto literal = [](std::string_view text) -> parity::Value {
        auto result = parse("limit(n: " + std::string(text) + ")");
        REQUIRE(result.has_value());
        return require_literal(require_expr(result->pipelines[0].calls[0].args[0].value)).value;
    };

    REQUIRE(std::get<std::int64_t>(literal("-42")) == -42);
    REQUIRE(std::get<std::int64_t>(literal("-9223372036854775808")) ==
            std::numeric_limits<std::int64_t>::min());
    REQUIRE(std::get<double>(literal("2.5e2")) == 250.0);
    REQUIRE(std::get<bool>(literal("false")) == false);
    REQUIRE(std::get<std::string>(literal(R"("a\"b\n")")) == "a\"b\n");
    REQUIRE(std::get<parity::Duration>(literal("-5m")).nanos == -300'000'000'000LL);
    REQUIRE(std::get<parity::Timestamp>(literal(R"(time"2018-05-22T19:53:26Z")")).nanos ==
            1527018806LL * 1'000'000'000);
}

TEST_CASE("Statements are separated by semicolons", "[query][parser]") {
    auto result = parse("from(bucket: \"a\") |> count();\n;from(bucket: \"b\");");
    REQUIRE(result.has_value());
    REQUIRE(result->pipelines.size() == 2);
    REQUIRE(result->pipelines[1].calls.size() == 1);
}

TEST_CASE("Parse errors carry a location", "[query][parser][error]") {
    SECTION("empty query") {
        auto result = parse("  // nothing\n");
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().message == "query contains no pipelines");
    }

    SECTION("missing pipe") {
        auto result = parse("from(bucket: \"a\") count()");
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().format() == "1:19: expected '|>' or ';' before 'count'");
    }

    SECTION("unclosed call") {
        auto result = parse("from(bucket: \"a\"");
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().message == "expected ')' after arguments");
    }

    SECTION("integer out of range") {
        auto result = parse("limit(n: 9223372036854775808)");
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().message == "integer literal '9223372036854775808' out of range");
        REQUIRE(result.error().column == 10);
    }

    SECTION("invalid token") {
        auto result = parse("filter(fn: = 1)");
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().message == "invalid token '='");
        REQUIRE(result.error().column == 12);
    }

    SECTION("missing expression") {
        auto result = parse("limit(n: )");
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().message == "expected expression, found ')'");
    }
}
