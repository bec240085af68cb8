#include <lineq/parser/lexer.hpp>
#include <lineq/parser/parser.hpp>

#include <fmt/core.h>

#include <charconv>
#include <cstdlib>
#include <optional>
#include <string>
#include <utility>

namespace lineq::parser {

namespace {

class Parser {
   public:
    explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    auto parse_query() -> std::expected<ExprPtr, ParseError> {
        if (is_at_end()) {
            return std::unexpected(make_error(peek(), "empty expression"));
        }
        auto expr = parse_expression_list();
        if (!expr) {
            return std::unexpected(error_);
        }
        if (!is_at_end()) {
            return std::unexpected(make_error(
                peek(), fmt::format("unexpected token {} after expression", format_token(peek()))));
        }
        return expr;
    }

   private:
    // expr (',' expr)* [','] -- more than one item, or a trailing comma, makes a tuple.
    auto parse_expression_list() -> ExprPtr {
        auto first = parse_expression();
        if (!first) {
            return nullptr;
        }
        if (!check(TokenKind::Comma)) {
            return first;
        }
        std::vector<ExprPtr> items;
        items.push_back(std::move(first));
        while (match(TokenKind::Comma)) {
            if (is_at_end()) {
                break;
            }
            auto item = parse_expression();
            if (!item) {
                return nullptr;
            }
            items.push_back(std::move(item));
        }
        auto tuple = std::make_unique<Expr>();
        tuple->node = TupleExpr{.items = std::move(items)};
        return tuple;
    }

    auto parse_expression() -> ExprPtr { return parse_conditional(); }

    auto parse_conditional() -> ExprPtr {
        auto body = parse_or();
        if (!body) {
            return nullptr;
        }
        if (!match(TokenKind::KeywordIf)) {
            return body;
        }
        auto condition = parse_or();
        if (!condition) {
            return nullptr;
        }
        ExprPtr alternative;
        if (match(TokenKind::KeywordElse)) {
            alternative = parse_conditional();
            if (!alternative) {
                return nullptr;
            }
        }
        auto expr = std::make_unique<Expr>();
        expr->node = ConditionalExpr{
            .body = std::move(body),
            .condition = std::move(condition),
            .alternative = std::move(alternative),
        };
        return expr;
    }

    auto parse_or() -> ExprPtr {
        auto expr = parse_and();
        while (expr && match(TokenKind::KeywordOr)) {
            auto right = parse_and();
            if (!right) {
                return nullptr;
            }
            expr = make_binary(BinaryOp::Or, std::move(expr), std::move(right));
        }
        return expr;
    }

    auto parse_and() -> ExprPtr {
        auto expr = parse_not();
        while (expr && match(TokenKind::KeywordAnd)) {
            auto right = parse_not();
            if (!right) {
                return nullptr;
            }
            expr = make_binary(BinaryOp::And, std::move(expr), std::move(right));
        }
        return expr;
    }

    auto parse_not() -> ExprPtr {
        if (match(TokenKind::KeywordNot)) {
            auto expr = parse_not();
            if (!expr) {
                return nullptr;
            }
            return make_unary(UnaryOp::Not, std::move(expr));
        }
        return parse_comparison();
    }

    auto parse_comparison() -> ExprPtr {
        auto expr = parse_term();
        if (!expr) {
            return nullptr;
        }
        ComparisonChainExpr chain;
        chain.operands.push_back(std::move(expr));
        while (true) {
            std::optional<BinaryOp> op;
            if (match(TokenKind::EqEq)) {
                op = BinaryOp::Eq;
            } else if (match(TokenKind::BangEq)) {
                op = BinaryOp::Ne;
            } else if (match(TokenKind::Lt)) {
                op = BinaryOp::Lt;
            } else if (match(TokenKind::Le)) {
                op = BinaryOp::Le;
            } else if (match(TokenKind::Gt)) {
                op = BinaryOp::Gt;
            } else if (match(TokenKind::Ge)) {
                op = BinaryOp::Ge;
            } else if (match(TokenKind::KeywordIn)) {
                op = BinaryOp::In;
            } else if (check(TokenKind::KeywordNot) && check_next(TokenKind::KeywordIn)) {
                advance();
                advance();
                op = BinaryOp::NotIn;
            } else {
                break;
            }
            auto right = parse_term();
            if (!right) {
                return nullptr;
            }
            chain.ops.push_back(*op);
            chain.operands.push_back(std::move(right));
        }
        if (chain.ops.empty()) {
            return std::move(chain.operands.front());
        }
        if (chain.ops.size() == 1) {
            return make_binary(chain.ops.front(), std::move(chain.operands[0]),
                               std::move(chain.operands[1]));
        }
        auto result = std::make_unique<Expr>();
        result->node = std::move(chain);
        return result;
    }

    auto parse_term() -> ExprPtr {
        auto expr = parse_factor();
        while (expr) {
            BinaryOp op;
            if (match(TokenKind::Plus)) {
                op = BinaryOp::Add;
            } else if (match(TokenKind::Minus)) {
                op = BinaryOp::Sub;
            } else {
                break;
            }
            auto right = parse_factor();
            if (!right) {
                return nullptr;
            }
            expr = make_binary(op, std::move(expr), std::move(right));
        }
        return expr;
    }

    auto parse_factor() -> ExprPtr {
        auto expr = parse_unary();
        while (expr) {
            BinaryOp op;
            if (match(TokenKind::Star)) {
                op = BinaryOp::Mul;
            } else if (match(TokenKind::Slash)) {
                op = BinaryOp::Div;
            } else if (match(TokenKind::SlashSlash)) {
                op = BinaryOp::FloorDiv;
            } else if (match(TokenKind::Percent)) {
                op = BinaryOp::Mod;
            } else {
                break;
            }
            auto right = parse_unary();
            if (!right) {
                return nullptr;
            }
            expr = make_binary(op, std::move(expr), std::move(right));
        }
        return expr;
    }

    auto parse_unary() -> ExprPtr {
        if (match(TokenKind::Minus)) {
            auto expr = parse_unary();
            if (!expr) {
                return nullptr;
            }
            return make_unary(UnaryOp::Negate, std::move(expr));
        }
        if (match(TokenKind::Plus)) {
            auto expr = parse_unary();
            if (!expr) {
                return nullptr;
            }
            return make_unary(UnaryOp::Plus, std::move(expr));
        }
        return parse_power();
    }

    // `**` binds tighter than unary minus on its left and is right associative.
    auto parse_power() -> ExprPtr {
        auto expr = parse_postfix();
        if (!expr) {
            return nullptr;
        }
        if (match(TokenKind::StarStar)) {
            auto exponent = parse_unary();
            if (!exponent) {
                return nullptr;
            }
            return make_binary(BinaryOp::Pow, std::move(expr), std::move(exponent));
        }
        return expr;
    }

    auto parse_postfix() -> ExprPtr {
        auto expr = parse_primary();
        while (expr) {
            if (match(TokenKind::Dot)) {
                auto name = consume_identifier("expected attribute name after '.'");
                if (!name.has_value()) {
                    return nullptr;
                }
                auto attribute = std::make_unique<Expr>();
                attribute->node =
                    AttributeExpr{.object = std::move(expr), .name = std::move(*name)};
                expr = std::move(attribute);
                continue;
            }
            if (match(TokenKind::LBracket)) {
                expr = parse_subscript(std::move(expr));
                continue;
            }
            break;
        }
        return expr;
    }

    auto parse_subscript(ExprPtr object) -> ExprPtr {
        ExprPtr start;
        if (!check(TokenKind::Colon)) {
            start = parse_expression();
            if (!start) {
                return nullptr;
            }
        }
        if (match(TokenKind::Colon)) {
            ExprPtr stop;
            if (!check(TokenKind::RBracket)) {
                stop = parse_expression();
                if (!stop) {
                    return nullptr;
                }
            }
            if (!consume(TokenKind::RBracket, "expected ']' after slice")) {
                return nullptr;
            }
            auto slice = std::make_unique<Expr>();
            slice->node = SliceExpr{
                .object = std::move(object),
                .start = std::move(start),
                .stop = std::move(stop),
            };
            return slice;
        }
        if (!consume(TokenKind::RBracket, "expected ']' after index")) {
            return nullptr;
        }
        auto index = std::make_unique<Expr>();
        index->node = IndexExpr{.object = std::move(object), .index = std::move(start)};
        return index;
    }

    auto parse_primary() -> ExprPtr {
        if (match(TokenKind::Identifier)) {
            std::string name(previous().lexeme);
            if (match(TokenKind::LParen)) {
                auto args = parse_items(TokenKind::RParen, "expected ')' after argument list");
                if (!args.has_value()) {
                    return nullptr;
                }
                auto expr = std::make_unique<Expr>();
                expr->node = CallExpr{.callee = std::move(name), .args = std::move(args->first)};
                return expr;
            }
            auto expr = std::make_unique<Expr>();
            expr->node = IdentifierExpr{.name = std::move(name)};
            return expr;
        }
        if (match(TokenKind::IntLiteral)) {
            std::string_view digits = previous().lexeme;
            if (digits.size() > 1 && digits.front() == '0' &&
                digits.find_first_not_of('0') != std::string_view::npos) {
                return fail_expr(previous(),
                                 "leading zeros in decimal integer literals are not permitted");
            }
            auto value = parse_int(digits);
            if (!value.has_value()) {
                return fail_expr(previous(), "invalid integer literal");
            }
            return make_literal(*value);
        }
        if (match(TokenKind::FloatLiteral)) {
            auto value = parse_double(previous().lexeme);
            if (!value.has_value()) {
                return fail_expr(previous(), "invalid float literal");
            }
            return make_literal(*value);
        }
        if (match(TokenKind::StringLiteral)) {
            return make_literal(unescape_string(previous().lexeme));
        }
        if (match(TokenKind::KeywordTrue)) {
            return make_literal(true);
        }
        if (match(TokenKind::KeywordFalse)) {
            return make_literal(false);
        }
        if (match(TokenKind::KeywordNone)) {
            auto expr = std::make_unique<Expr>();
            expr->node = LiteralExpr{.value = NoneLiteral{}};
            return expr;
        }
        if (match(TokenKind::LParen)) {
            return parse_parenthesized();
        }
        if (match(TokenKind::LBracket)) {
            auto items = parse_items(TokenKind::RBracket, "expected ']' after list items");
            if (!items.has_value()) {
                return nullptr;
            }
            auto expr = std::make_unique<Expr>();
            expr->node = ListExpr{.items = std::move(items->first)};
            return expr;
        }
        if (match(TokenKind::LBrace)) {
            return parse_object();
        }
        if (peek().kind == TokenKind::Error) {
            return fail_expr(peek(), fmt::format("invalid token {}", format_token(peek())));
        }
        return fail_expr(peek(), "expected expression");
    }

    // After '(': `()` is the empty tuple, `(e)` a group, `(e,)` and `(a, b)` tuples.
    auto parse_parenthesized() -> ExprPtr {
        auto items = parse_items(TokenKind::RParen, "expected ')' after expression");
        if (!items.has_value()) {
            return nullptr;
        }
        auto& [exprs, saw_comma] = *items;
        if (exprs.size() == 1 && !saw_comma) {
            return std::move(exprs.front());
        }
        auto tuple = std::make_unique<Expr>();
        tuple->node = TupleExpr{.items = std::move(exprs)};
        return tuple;
    }

    auto parse_object() -> ExprPtr {
        std::vector<std::pair<ExprPtr, ExprPtr>> entries;
        if (!check(TokenKind::RBrace)) {
            do {
                if (check(TokenKind::RBrace)) {
                    break;
                }
                auto key = parse_expression();
                if (!key) {
                    return nullptr;
                }
                if (!consume(TokenKind::Colon, "expected ':' after object key")) {
                    return nullptr;
                }
                auto value = parse_expression();
                if (!value) {
                    return nullptr;
                }
                entries.emplace_back(std::move(key), std::move(value));
            } while (match(TokenKind::Comma));
        }
        if (!consume(TokenKind::RBrace, "expected '}' after object entries")) {
            return nullptr;
        }
        auto expr = std::make_unique<Expr>();
        expr->node = ObjectExpr{.entries = std::move(entries)};
        return expr;
    }

    /// Comma separated expressions up to `close`; a trailing comma is allowed.
    /// The flag reports whether any comma was seen.
    auto parse_items(TokenKind close, std::string_view message)
        -> std::optional<std::pair<std::vector<ExprPtr>, bool>> {
        std::vector<ExprPtr> items;
        bool saw_comma = false;
        while (!check(close)) {
            auto item = parse_expression();
            if (!item) {
                return std::nullopt;
            }
            items.push_back(std::move(item));
            if (!match(TokenKind::Comma)) {
                break;
            }
            saw_comma = true;
        }
        if (!consume(close, message)) {
            return std::nullopt;
        }
        return std::make_pair(std::move(items), saw_comma);
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

    auto check_next(TokenKind kind) const -> bool {
        if (current_ + 1 >= tokens_.size()) {
            return false;
        }
        return tokens_[current_ + 1].kind == kind;
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

    static auto parse_int(std::string_view text) -> std::optional<std::int64_t> {
        std::int64_t value = 0;
        auto result = std::from_chars(text.data(), text.data() + text.size(), value);
        if (result.ec != std::errc() || result.ptr != text.data() + text.size()) {
            return std::nullopt;
        }
        return value;
    }

    static auto parse_double(std::string_view text) -> std::optional<double> {
        std::string tmp(text);
        char* end = nullptr;
        double value = std::strtod(tmp.c_str(), &end);
        if (end == tmp.c_str()) {
            return std::nullopt;
        }
        return value;
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
                    case 'r':
                        result.push_back('\r');
                        break;
                    case 't':
                        result.push_back('\t');
                        break;
                    case '0':
                        result.push_back('\0');
                        break;
                    default:
                        result.push_back(next);
                        break;
                }
                idx += 1;
                continue;
            }
            result.push_back(ch);
        }
        return result;
    }

    static auto make_literal(std::int64_t value) -> ExprPtr {
        auto expr = std::make_unique<Expr>();
        expr->node = LiteralExpr{.value = value};
        return expr;
    }

    static auto make_literal(double value) -> ExprPtr {
        auto expr = std::make_unique<Expr>();
        expr->node = LiteralExpr{.value = value};
        return expr;
    }

    static auto make_literal(bool value) -> ExprPtr {
        auto expr = std::make_unique<Expr>();
        expr->node = LiteralExpr{.value = value};
        return expr;
    }

    static auto make_literal(std::string value) -> ExprPtr {
        auto expr = std::make_unique<Expr>();
        expr->node = LiteralExpr{.value = std::move(value)};
        return expr;
    }

    static auto make_unary(UnaryOp op, ExprPtr expr) -> ExprPtr {
        auto node = std::make_unique<Expr>();
        node->node = UnaryExpr{.op = op, .expr = std::move(expr)};
        return node;
    }

    static auto make_binary(BinaryOp op, ExprPtr left, ExprPtr right) -> ExprPtr {
        auto node = std::make_unique<Expr>();
        node->node = BinaryExpr{
            .op = op,
            .left = std::move(left),
            .right = std::move(right),
        };
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
    return parser.parse_query();
}

}  // namespace lineq::parser
