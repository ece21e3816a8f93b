#include <parity/legacy/parser.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>

namespace parity::legacy {

namespace {

enum class Tok : std::uint8_t {
    Ident,
    QuotedIdent,
    String,
    Int,
    Float,
    Duration,
    Op,
    Comma,
    Dot,
    LParen,
    RParen,
    Semicolon,
    Star,
    Minus,
    Eof,
    Error,
};

struct Token {
    Tok kind = Tok::Error;
    std::string text;
    std::size_t line = 0;
    std::size_t column = 0;
};

auto lex(std::string_view source) -> std::vector<Token> {
    std::vector<Token> tokens;
    std::size_t i = 0;
    std::size_t line = 1;
    std::size_t column = 1;

    const auto peek = [&](std::size_t offset = 0) -> char {
        return i + offset < source.size() ? source[i + offset] : '\0';
    };
    const auto advance = [&]() -> char {
        char ch = source[i++];
        if (ch == '\n') {
            line += 1;
            column = 1;
        } else {
            column += 1;
        }
        return ch;
    };
    const auto is_digit = [](char ch) { return std::isdigit(static_cast<unsigned char>(ch)) != 0; };
    const auto is_word = [](char ch) {
        return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
    };

    while (i < source.size()) {
        char ch = peek();
        if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
            advance();
            continue;
        }
        if (ch == '-' && peek(1) == '-') {
            while (i < source.size() && peek() != '\n') {
                advance();
            }
            continue;
        }
        Token token{.kind = Tok::Error, .text = {}, .line = line, .column = column};
        if (std::isalpha(static_cast<unsigned char>(ch)) != 0 || ch == '_') {
            while (is_word(peek())) {
                token.text.push_back(advance());
            }
            token.kind = Tok::Ident;
        } else if (is_digit(ch)) {
            while (is_digit(peek())) {
                token.text.push_back(advance());
            }
            token.kind = Tok::Int;
            if (peek() == '.' && is_digit(peek(1))) {
                token.text.push_back(advance());
                while (is_digit(peek())) {
                    token.text.push_back(advance());
                }
                token.kind = Tok::Float;
            } else if (std::isalpha(static_cast<unsigned char>(peek())) != 0) {
                while (is_word(peek())) {
                    token.text.push_back(advance());
                }
                token.kind = Tok::Duration;
            }
        } else if (ch == '\'' || ch == '"') {
            char quote = advance();
            bool closed = false;
            while (i < source.size()) {
                char c = advance();
                if (c == '\\' && i < source.size()) {
                    token.text.push_back(advance());
                    continue;
                }
                if (c == quote) {
                    closed = true;
                    break;
                }
                token.text.push_back(c);
            }
            token.kind = !closed ? Tok::Error : (quote == '\'' ? Tok::String : Tok::QuotedIdent);
        } else {
            token.text.push_back(advance());
            switch (ch) {
                case ',':
                    token.kind = Tok::Comma;
                    break;
                case '.':
                    token.kind = Tok::Dot;
                    break;
                case '(':
                    token.kind = Tok::LParen;
                    break;
                case ')':
                    token.kind = Tok::RParen;
                    break;
                case ';':
                    token.kind = Tok::Semicolon;
                    break;
                case '*':
                    token.kind = Tok::Star;
                    break;
                case '-':
                    token.kind = Tok::Minus;
                    break;
                case '=':
                    token.kind = Tok::Op;
                    break;
                case '!':
                    if (peek() == '=') {
                        token.text.push_back(advance());
                        token.kind = Tok::Op;
                    }
                    break;
                case '<':
                case '>':
                    if (peek() == '=' || (ch == '<' && peek() == '>')) {
                        token.text.push_back(advance());
                    }
                    token.kind = Tok::Op;
                    break;
                default:
                    break;
            }
        }
        tokens.push_back(std::move(token));
    }
    tokens.push_back(Token{.kind = Tok::Eof, .text = {}, .line = line, .column = column});
    return tokens;
}

auto iequals(std::string_view lhs, std::string_view rhs) -> bool {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) ==
                      std::tolower(static_cast<unsigned char>(b));
           });
}

auto to_lower(std::string_view text) -> std::string {
    std::string out(text);
    std::ranges::transform(out, out.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

class Parser {
   public:
    explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    auto parse_query() -> std::expected<Query, ParseError> {
        Query query;
        while (!check(Tok::Eof)) {
            if (match(Tok::Semicolon)) {
                continue;
            }
            auto stmt = parse_select();
            if (!stmt.has_value()) {
                return std::unexpected(error_);
            }
            query.statements.push_back(std::move(*stmt));
            if (!check(Tok::Eof) && !check(Tok::Semicolon)) {
                return std::unexpected(
                    make_error(peek(), fmt::format("unexpected {}", describe(peek()))));
            }
        }
        if (query.statements.empty()) {
            return std::unexpected(make_error(peek(), "query contains no statements"));
        }
        return query;
    }

   private:
    auto parse_select() -> std::optional<SelectStatement> {
        SelectStatement stmt;
        stmt.line = peek().line;
        stmt.column = peek().column;
        if (!expect_keyword("SELECT")) {
            return std::nullopt;
        }
        do {
            auto field = parse_field();
            if (!field.has_value()) {
                return std::nullopt;
            }
            stmt.fields.push_back(std::move(*field));
        } while (match(Tok::Comma));

        if (!expect_keyword("FROM")) {
            return std::nullopt;
        }
        auto from = parse_measurement();
        if (!from.has_value()) {
            return std::nullopt;
        }
        stmt.from = std::move(*from);

        if (match_keyword("WHERE")) {
            stmt.where = parse_or();
            if (!stmt.where) {
                return std::nullopt;
            }
        }
        if (match_keyword("GROUP")) {
            if (!expect_keyword("BY") || !parse_group_by(stmt)) {
                return std::nullopt;
            }
        }
        if (match_keyword("ORDER")) {
            if (!expect_keyword("BY")) {
                return std::nullopt;
            }
            auto column = parse_identifier("expected column after ORDER BY");
            if (!column.has_value()) {
                return std::nullopt;
            }
            if (*column != "time") {
                error_ = make_error(previous(), "only ORDER BY time is supported");
                return std::nullopt;
            }
            if (match_keyword("DESC")) {
                stmt.descending = true;
            } else {
                static_cast<void>(match_keyword("ASC"));
            }
        }
        if (match_keyword("LIMIT")) {
            auto limit = parse_count("LIMIT");
            if (!limit.has_value()) {
                return std::nullopt;
            }
            stmt.limit = *limit;
        }
        if (match_keyword("OFFSET")) {
            auto offset = parse_count("OFFSET");
            if (!offset.has_value()) {
                return std::nullopt;
            }
            stmt.offset = *offset;
        }
        return stmt;
    }

    auto parse_field() -> std::optional<SelectField> {
        if (match(Tok::Star)) {
            return SelectField{.column = "*", .func = std::nullopt, .alias = {}};
        }
        auto name = parse_identifier("expected field name");
        if (!name.has_value()) {
            return std::nullopt;
        }
        SelectField field;
        if (match(Tok::LParen)) {
            const Token& func_token = previous_at(2);
            auto func = ir::parse_agg_func(to_lower(*name));
            if (!func.has_value()) {
                error_ = make_error(func_token, fmt::format("unknown function '{}'", *name));
                return std::nullopt;
            }
            auto column = match(Tok::Star)
                              ? std::optional<std::string>{"*"}
                              : parse_identifier("expected field name inside aggregate");
            if (!column.has_value()) {
                return std::nullopt;
            }
            if (!consume(Tok::RParen, "expected ')' after aggregate argument")) {
                return std::nullopt;
            }
            field.func = func;
            field.column = std::move(*column);
            field.alias = std::string(ir::agg_func_name(*func));
        } else {
            field.column = std::move(*name);
        }
        if (match_keyword("AS")) {
            if (!field.func.has_value()) {
                error_ = make_error(previous(), "AS is only supported on aggregates");
                return std::nullopt;
            }
            auto alias = parse_identifier("expected alias after AS");
            if (!alias.has_value()) {
                return std::nullopt;
            }
            field.alias = std::move(*alias);
        }
        return field;
    }

    auto parse_measurement() -> std::optional<MeasurementRef> {
        std::vector<std::string> parts;
        auto first = parse_identifier("expected measurement after FROM");
        if (!first.has_value()) {
            return std::nullopt;
        }
        parts.push_back(std::move(*first));
        while (match(Tok::Dot)) {
            if (check(Tok::Dot)) {
                parts.emplace_back();
                continue;
            }
            auto part = parse_identifier("expected name after '.'");
            if (!part.has_value()) {
                return std::nullopt;
            }
            parts.push_back(std::move(*part));
        }
        if (parts.size() > 3) {
            error_ = make_error(previous(), "measurement has too many qualifiers");
            return std::nullopt;
        }
        MeasurementRef ref;
        ref.name = parts.back();
        if (parts.size() == 3) {
            ref.database = parts[0];
            ref.retention_policy = parts[1];
        } else if (parts.size() == 2) {
            ref.retention_policy = parts[0];
        }
        if (ref.name.empty()) {
            error_ = make_error(previous(), "measurement name is empty");
            return std::nullopt;
        }
        return ref;
    }

    auto parse_group_by(SelectStatement& stmt) -> bool {
        do {
            auto name = parse_identifier("expected tag or time() after GROUP BY");
            if (!name.has_value()) {
                return false;
            }
            if (iequals(*name, "time") && match(Tok::LParen)) {
                if (!check(Tok::Duration)) {
                    error_ = make_error(peek(), "expected duration inside time()");
                    return false;
                }
                const Token& token = advance();
                auto every = parse_duration(token.text);
                if (!every.has_value() || every->nanos <= 0) {
                    error_ = make_error(token, fmt::format("invalid duration '{}'", token.text));
                    return false;
                }
                if (stmt.group_time.has_value()) {
                    error_ = make_error(token, "time() appears more than once in GROUP BY");
                    return false;
                }
                stmt.group_time = *every;
                if (!consume(Tok::RParen, "expected ')' after duration")) {
                    return false;
                }
                continue;
            }
            stmt.group_tags.push_back(std::move(*name));
        } while (match(Tok::Comma));
        return true;
    }

    auto parse_or() -> ConditionPtr {
        auto left = parse_and();
        while (left && match_keyword("OR")) {
            auto right = parse_and();
            if (!right) {
                return nullptr;
            }
            left = make_logical(false, std::move(left), std::move(right));
        }
        return left;
    }

    auto parse_and() -> ConditionPtr {
        auto left = parse_term();
        while (left && match_keyword("AND")) {
            auto right = parse_term();
            if (!right) {
                return nullptr;
            }
            left = make_logical(true, std::move(left), std::move(right));
        }
        return left;
    }

    auto parse_term() -> ConditionPtr {
        if (match(Tok::LParen)) {
            auto inner = parse_or();
            if (!inner) {
                return nullptr;
            }
            if (!consume(Tok::RParen, "expected ')' after condition")) {
                return nullptr;
            }
            return inner;
        }
        auto left = parse_operand();
        if (!left.has_value()) {
            return nullptr;
        }
        if (!check(Tok::Op)) {
            error_ = make_error(peek(), fmt::format("expected comparison operator, found {}",
                                                    describe(peek())));
            return nullptr;
        }
        const Token& op_token = advance();
        auto op = compare_op(op_token.text);
        if (!op.has_value()) {
            error_ = make_error(op_token, fmt::format("invalid operator '{}'", op_token.text));
            return nullptr;
        }
        auto right = parse_operand();
        if (!right.has_value()) {
            return nullptr;
        }
        auto cond = std::make_unique<Condition>();
        cond->node = Comparison{.op = *op, .left = std::move(*left), .right = std::move(*right)};
        return cond;
    }

    auto parse_operand() -> std::optional<Operand> {
        const Token& token = peek();
        switch (token.kind) {
            case Tok::Ident:
                advance();
                if (iequals(token.text, "true") || iequals(token.text, "false")) {
                    return Operand{Value{iequals(token.text, "true")}};
                }
                return Operand{FieldRef{.name = token.text}};
            case Tok::QuotedIdent:
                advance();
                return Operand{FieldRef{.name = token.text}};
            case Tok::String:
                advance();
                return Operand{Value{token.text}};
            case Tok::Int:
            case Tok::Float:
                advance();
                return number(token, false);
            case Tok::Minus: {
                advance();
                const Token& next = peek();
                if (next.kind != Tok::Int && next.kind != Tok::Float) {
                    error_ = make_error(next, "expected number after '-'");
                    return std::nullopt;
                }
                advance();
                return number(next, true);
            }
            default:
                error_ = make_error(token, fmt::format("expected operand, found {}",
                                                       describe(token)));
                return std::nullopt;
        }
    }

    auto number(const Token& token, bool negative) -> std::optional<Operand> {
        std::string text = negative ? "-" + token.text : token.text;
        if (token.kind == Tok::Float) {
            return Operand{Value{std::strtod(text.c_str(), nullptr)}};
        }
        std::int64_t value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc() || ptr != text.data() + text.size()) {
            error_ = make_error(token, fmt::format("integer {} out of range", text));
            return std::nullopt;
        }
        return Operand{Value{value}};
    }

    auto parse_count(std::string_view clause) -> std::optional<std::int64_t> {
        if (!check(Tok::Int)) {
            error_ = make_error(peek(), fmt::format("expected integer after {}", clause));
            return std::nullopt;
        }
        const Token& token = advance();
        std::int64_t value = 0;
        auto [ptr, ec] = std::from_chars(token.text.data(), token.text.data() + token.text.size(),
                                         value);
        if (ec != std::errc() || ptr != token.text.data() + token.text.size()) {
            error_ = make_error(token, fmt::format("{} value {} out of range", clause, token.text));
            return std::nullopt;
        }
        return value;
    }

    static auto compare_op(std::string_view text) -> std::optional<ir::CompareOp> {
        if (text == "=") {
            return ir::CompareOp::Eq;
        }
        if (text == "!=" || text == "<>") {
            return ir::CompareOp::Ne;
        }
        if (text == "<") {
            return ir::CompareOp::Lt;
        }
        if (text == "<=") {
            return ir::CompareOp::Le;
        }
        if (text == ">") {
            return ir::CompareOp::Gt;
        }
        if (text == ">=") {
            return ir::CompareOp::Ge;
        }
        return std::nullopt;
    }

    static auto make_logical(bool conjunction, ConditionPtr left, ConditionPtr right)
        -> ConditionPtr {
        auto cond = std::make_unique<Condition>();
        cond->node = Logical{
            .conjunction = conjunction, .left = std::move(left), .right = std::move(right)};
        return cond;
    }

    auto parse_identifier(std::string_view message) -> std::optional<std::string> {
        if (match(Tok::Ident) || match(Tok::QuotedIdent)) {
            return previous().text;
        }
        error_ = make_error(peek(), message);
        return std::nullopt;
    }

    auto is_keyword(const Token& token, std::string_view keyword) const -> bool {
        return token.kind == Tok::Ident && iequals(token.text, keyword);
    }

    auto match_keyword(std::string_view keyword) -> bool {
        if (!is_keyword(peek(), keyword)) {
            return false;
        }
        advance();
        return true;
    }

    auto expect_keyword(std::string_view keyword) -> bool {
        if (match_keyword(keyword)) {
            return true;
        }
        error_ = make_error(peek(), fmt::format("expected {}, found {}", keyword, describe(peek())));
        return false;
    }

    auto consume(Tok kind, std::string_view message) -> bool {
        if (match(kind)) {
            return true;
        }
        error_ = make_error(peek(), message);
        return false;
    }

    auto check(Tok kind) const -> bool { return peek().kind == kind; }

    auto match(Tok kind) -> bool {
        if (!check(kind)) {
            return false;
        }
        advance();
        return true;
    }

    auto advance() -> const Token& {
        if (!check(Tok::Eof)) {
            current_ += 1;
        }
        return previous();
    }

    auto peek() const -> const Token& { return tokens_[current_]; }
    auto previous() const -> const Token& { return tokens_[current_ - 1]; }
    auto previous_at(std::size_t back) const -> const Token& { return tokens_[current_ - back]; }

    static auto describe(const Token& token) -> std::string {
        if (token.kind == Tok::Eof) {
            return "end of query";
        }
        return fmt::format("'{}'", token.text);
    }

    static auto make_error(const Token& token, std::string_view message) -> ParseError {
        return ParseError{
            .message = std::string(message),
            .line = token.line,
            .column = token.column,
        };
    }

    std::vector<Token> tokens_;
    std::size_t current_ = 0;
    ParseError error_{};
};

}  // namespace

auto parse(std::string_view source) -> std::expected<Query, ParseError> {
    Parser parser(lex(source));
    return parser.parse_query();
}

}  // namespace parity::legacy
