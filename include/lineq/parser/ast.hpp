#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace lineq::parser {

struct Expr;
using ExprPtr = std::unique_ptr<Expr>;

struct NoneLiteral {};

struct IdentifierExpr {
    std::string name;
};

struct LiteralExpr {
    std::variant<NoneLiteral, bool, std::int64_t, double, std::string> value;
};

enum class UnaryOp : std::uint8_t {
    Negate,
    Plus,
    Not,
};

enum class BinaryOp : std::uint8_t {
    Add,
    Sub,
    Mul,
    Div,
    FloorDiv,
    Mod,
    Pow,
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge,
    In,
    NotIn,
    And,
    Or,
};

struct UnaryExpr {
    UnaryOp op = UnaryOp::Negate;
    ExprPtr expr;
};

struct BinaryExpr {
    BinaryOp op = BinaryOp::Add;
    ExprPtr left;
    ExprPtr right;
};

/// `a < b <= c`: two or more comparisons sharing their middle operands.
/// Evaluates as `a < b and b <= c` with `b` computed once.
struct ComparisonChainExpr {
    std::vector<ExprPtr> operands;
    std::vector<BinaryOp> ops;
};

/// `body if condition else alternative`. A null alternative means the
/// `else` branch was omitted in the source.
struct ConditionalExpr {
    ExprPtr body;
    ExprPtr condition;
    ExprPtr alternative;
};

struct TupleExpr {
    std::vector<ExprPtr> items;
};

struct ListExpr {
    std::vector<ExprPtr> items;
};

struct ObjectExpr {
    std::vector<std::pair<ExprPtr, ExprPtr>> entries;
};

/// `object.name`
struct AttributeExpr {
    ExprPtr object;
    std::string name;
};

/// `object[index]`
struct IndexExpr {
    ExprPtr object;
    ExprPtr index;
};

/// `object[start:stop]`; either bound may be null.
struct SliceExpr {
    ExprPtr object;
    ExprPtr start;
    ExprPtr stop;
};

struct CallExpr {
    std::string callee;
    std::vector<ExprPtr> args;
};

struct Expr {
    std::variant<IdentifierExpr, LiteralExpr, UnaryExpr, BinaryExpr, ComparisonChainExpr,
                 ConditionalExpr, TupleExpr, ListExpr, ObjectExpr, AttributeExpr, IndexExpr,
                 SliceExpr, CallExpr>
        node;
};

}  // namespace lineq::parser
