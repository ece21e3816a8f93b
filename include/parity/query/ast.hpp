#pragma once

#include <parity/core/value.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace parity::query {

struct Expr;
using ExprPtr = std::unique_ptr<Expr>;

struct LiteralExpr {
    Value value;
};

struct IdentifierExpr {
    std::string name;
};

struct ArrayExpr {
    std::vector<ExprPtr> elements;
};

enum class BinaryOp : std::uint8_t {
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge,
    And,
    Or,
};

struct BinaryExpr {
    BinaryOp op = BinaryOp::Eq;
    ExprPtr left;
    ExprPtr right;
};

struct NotExpr {
    ExprPtr operand;
};

struct Expr {
    std::variant<LiteralExpr, IdentifierExpr, ArrayExpr, BinaryExpr, NotExpr> node;
    std::size_t line = 0;
    std::size_t column = 0;
};

/// `name: value`, or a positional argument when `name` is empty.
struct Argument {
    std::string name;
    ExprPtr value;
};

/// One pipeline stage, e.g. `filter(host == "a")`.
struct Call {
    std::string name;
    std::vector<Argument> args;
    std::size_t line = 0;
    std::size_t column = 0;
};

/// Stages joined by `|>`.
struct PipelineStmt {
    std::vector<Call> calls;
};

struct Program {
    std::vector<PipelineStmt> pipelines;
};

}  // namespace parity::query
