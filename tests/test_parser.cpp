#include <lineq/parser/lexer.hpp>
#include <lineq/parser/parser.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace {

using namespace lineq::parser;

const Expr& require_expr(const ParseResult& result) {
    REQUIRE(result.has_value());
    REQUIRE(*result != nullptr);
    return **result;
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

}  // namespace

TEST_CASE("Tokenize numbers, strings and operators") {
    auto tokens = tokenize("a.b >= 1.5e3 // 'x' ** .5");
    REQUIRE(tokens.size() == 10);
    REQUIRE(tokens[0].kind == TokenKind::Identifier);
    REQUIRE(tokens[1].kind == TokenKind::Dot);
    REQUIRE(tokens[2].kind == TokenKind::Identifier);
    REQUIRE(tokens[3].kind == TokenKind::Ge);
    REQUIRE(tokens[4].kind == TokenKind::FloatLiteral);
    REQUIRE(tokens[4].lexeme == "1.5e3");
    REQUIRE(tokens[5].kind == TokenKind::SlashSlash);
    REQUIRE(tokens[6].kind == TokenKind::StringLiteral);
    REQUIRE(tokens[7].kind == TokenKind::StarStar);
    REQUIRE(tokens[8].kind == TokenKind::FloatLiteral);
    REQUIRE(tokens[9].kind == TokenKind::Eof);
}

TEST_CASE("Tokenize keywords and track columns") {
    auto tokens = tokenize("x if not y else None");
    REQUIRE(tokens.back().kind == TokenKind::Eof);
    REQUIRE(tokens[1].kind == TokenKind::KeywordIf);
    REQUIRE(tokens[1].column == 3);
    REQUIRE(tokens[2].kind == TokenKind::KeywordNot);
    REQUIRE(tokens[4].kind == TokenKind::KeywordElse);
    REQUIRE(tokens[5].kind == TokenKind::KeywordNone);
}

TEST_CASE("Number glued to a name is an error token") {
    auto tokens = tokenize("12abc");
    REQUIRE(tokens.front().kind == TokenKind::Error);
}

TEST_CASE("Parse operator precedence") {
    auto result = parse("1 + 2 * 3");
    const auto& add = require_binary(require_expr(result), BinaryOp::Add);
    REQUIRE(std::get<std::int64_t>(require_literal(*add.left).value) == 1);
    require_binary(*add.right, BinaryOp::Mul);
}

TEST_CASE("Power is right associative and binds tighter than unary minus") {
    auto result = parse("2 ** 3 ** 2");
    const auto& outer = require_binary(require_expr(result), BinaryOp::Pow);
    require_binary(*outer.right, BinaryOp::Pow);

    auto negated = parse("-2 ** 2");
    const auto* unary = std::get_if<UnaryExpr>(&require_expr(negated).node);
    REQUIRE(unary != nullptr);
    REQUIRE(unary->op == UnaryOp::Negate);
    require_binary(*unary->expr, BinaryOp::Pow);
}

TEST_CASE("Top-level comma list is a tuple") {
    auto result = parse("a, 1");
    const auto* tuple = std::get_if<TupleExpr>(&require_expr(result).node);
    REQUIRE(tuple != nullptr);
    REQUIRE(tuple->items.size() == 2);
    REQUIRE(require_identifier(*tuple->items[0]).name == "a");
}

TEST_CASE("Parenthesized forms") {
    SECTION("empty parentheses are the empty tuple") {
        auto result = parse("()");
        const auto* tuple = std::get_if<TupleExpr>(&require_expr(result).node);
        REQUIRE(tuple != nullptr);
        REQUIRE(tuple->items.empty());
    }
    SECTION("a single expression is a group") {
        auto result = parse("(x)");
        REQUIRE(require_identifier(require_expr(result)).name == "x");
    }
    SECTION("a trailing comma makes a one-element tuple") {
        auto result = parse("(x,)");
        const auto* tuple = std::get_if<TupleExpr>(&require_expr(result).node);
        REQUIRE(tuple != nullptr);
        REQUIRE(tuple->items.size() == 1);
    }
}

TEST_CASE("Parse conditional with and without alternative") {
    auto full = parse("a if a > 1 else b");
    const auto* cond = std::get_if<ConditionalExpr>(&require_expr(full).node);
    REQUIRE(cond != nullptr);
    REQUIRE(require_identifier(*cond->body).name == "a");
    require_binary(*cond->condition, BinaryOp::Gt);
    REQUIRE(cond->alternative != nullptr);

    auto guard = parse("a if a > 1");
    const auto* filter = std::get_if<ConditionalExpr>(&require_expr(guard).node);
    REQUIRE(filter != nullptr);
    REQUIRE(filter->alternative == nullptr);
}

TEST_CASE("Chained comparisons keep every operand") {
    auto result = parse("1 < x <= 3 != y");
    const auto* chain = std::get_if<ComparisonChainExpr>(&require_expr(result).node);
    REQUIRE(chain != nullptr);
    REQUIRE(chain->operands.size() == 4);
    REQUIRE(chain->ops == std::vector<BinaryOp>{BinaryOp::Lt, BinaryOp::Le, BinaryOp::Ne});
    REQUIRE(require_identifier(*chain->operands[1]).name == "x");

    // A single comparison stays a plain binary node.
    require_binary(require_expr(parse("x < 3")), BinaryOp::Lt);
}

TEST_CASE("Number literal forms") {
    auto trailing_dot = parse("1.");
    REQUIRE(std::get<double>(require_literal(require_expr(trailing_dot)).value) == 1.0);
    REQUIRE(std::get<std::int64_t>(require_literal(require_expr(parse("000"))).value) == 0);

    auto padded = parse("007");
    REQUIRE_FALSE(padded.has_value());
    REQUIRE(padded.error().message.find("leading zeros") != std::string::npos);
}

TEST_CASE("Parse not in") {
    auto result = parse("'x' not in tags");
    require_binary(require_expr(result), BinaryOp::NotIn);
}

TEST_CASE("Parse postfix chains") {
    auto result = parse("_.user.tags[0][1:]");
    const auto* slice = std::get_if<SliceExpr>(&require_expr(result).node);
    REQUIRE(slice != nullptr);
    REQUIRE(slice->start != nullptr);
    REQUIRE(slice->stop == nullptr);
    const auto* index = std::get_if<IndexExpr>(&slice->object->node);
    REQUIRE(index != nullptr);
    const auto* attr = std::get_if<AttributeExpr>(&index->object->node);
    REQUIRE(attr != nullptr);
    REQUIRE(attr->name == "tags");
}

TEST_CASE("Parse calls and displays") {
    auto result = parse("percentile([1, 2, 3], 0.5)");
    const auto* call = std::get_if<CallExpr>(&require_expr(result).node);
    REQUIRE(call != nullptr);
    REQUIRE(call->callee == "percentile");
    REQUIRE(call->args.size() == 2);
    REQUIRE(std::holds_alternative<ListExpr>(call->args[0]->node));

    auto object = parse("{'a': 1, 'b': [x]}");
    const auto* display = std::get_if<ObjectExpr>(&require_expr(object).node);
    REQUIRE(display != nullptr);
    REQUIRE(display->entries.size() == 2);
}

TEST_CASE("Parse errors carry a location") {
    SECTION("unbalanced parenthesis") {
        auto result = parse("(a, b");
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().line == 1);
        REQUIRE(result.error().column > 0);
    }
    SECTION("trailing garbage") {
        auto result = parse("a b");
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().format().starts_with("1:"));
    }
    SECTION("empty source") {
        REQUIRE_FALSE(parse("").has_value());
    }
}
