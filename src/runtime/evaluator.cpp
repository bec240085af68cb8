#include <lineq/parser/parser.hpp>
#include <lineq/runtime/evaluator.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <type_traits>

namespace lineq::runtime {

namespace {

using parser::BinaryOp;
using parser::UnaryOp;

auto binary_symbol(BinaryOp op) -> std::string_view {
    switch (op) {
        case BinaryOp::Add:
            return "+";
        case BinaryOp::Sub:
            return "-";
        case BinaryOp::Mul:
            return "*";
        case BinaryOp::Div:
            return "/";
        case BinaryOp::FloorDiv:
            return "//";
        case BinaryOp::Mod:
            return "%";
        case BinaryOp::Pow:
            return "**";
        case BinaryOp::Eq:
            return "==";
        case BinaryOp::Ne:
            return "!=";
        case BinaryOp::Lt:
            return "<";
        case BinaryOp::Le:
            return "<=";
        case BinaryOp::Gt:
            return ">";
        case BinaryOp::Ge:
            return ">=";
        case BinaryOp::In:
            return "in";
        case BinaryOp::NotIn:
            return "not in";
        case BinaryOp::And:
            return "and";
        case BinaryOp::Or:
            return "or";
    }
    return "?";
}

auto unsupported(BinaryOp op, const Value& lhs, const Value& rhs) -> std::unexpected<Error> {
    return make_error(ErrorKind::Evaluation,
                      fmt::format("unsupported operand type(s) for {}: '{}' and '{}'",
                                  binary_symbol(op), type_name(lhs), type_name(rhs)));
}

auto overflow(BinaryOp op) -> std::unexpected<Error> {
    return make_error(ErrorKind::Evaluation,
                      fmt::format("integer overflow in '{}'", binary_symbol(op)));
}

// Bools behave as 0/1 in arithmetic; an operation stays integral while
// neither side is a float.
auto is_integral(const Value& value) -> bool {
    return value.is<std::int64_t>() || value.is<bool>();
}

auto to_int(const Value& value) -> std::int64_t {
    if (const auto* b = value.get_if<bool>()) {
        return *b ? 1 : 0;
    }
    return *value.get_if<std::int64_t>();
}

auto int_pow(std::int64_t base, std::int64_t exponent) -> std::optional<std::int64_t> {
    std::int64_t result = 1;
    while (exponent > 0) {
        if ((exponent & 1) != 0 && __builtin_mul_overflow(result, base, &result)) {
            return std::nullopt;
        }
        exponent >>= 1;
        if (exponent > 0 && __builtin_mul_overflow(base, base, &base)) {
            return std::nullopt;
        }
    }
    return result;
}

auto arithmetic(BinaryOp op, const Value& lhs, const Value& rhs) -> Result<Value> {
    if (is_integral(lhs) && is_integral(rhs) && op != BinaryOp::Div) {
        std::int64_t l = to_int(lhs);
        std::int64_t r = to_int(rhs);
        std::int64_t out = 0;
        switch (op) {
            case BinaryOp::Add:
                if (__builtin_add_overflow(l, r, &out)) {
                    return overflow(op);
                }
                return out;
            case BinaryOp::Sub:
                if (__builtin_sub_overflow(l, r, &out)) {
                    return overflow(op);
                }
                return out;
            case BinaryOp::Mul:
                if (__builtin_mul_overflow(l, r, &out)) {
                    return overflow(op);
                }
                return out;
            case BinaryOp::FloorDiv:
            case BinaryOp::Mod: {
                if (r == 0) {
                    return make_error(ErrorKind::Evaluation, "integer division or modulo by zero");
                }
                if (l == std::numeric_limits<std::int64_t>::min() && r == -1) {
                    if (op == BinaryOp::Mod) {
                        return std::int64_t{0};
                    }
                    return overflow(op);
                }
                std::int64_t quotient = l / r;
                std::int64_t remainder = l % r;
                if (remainder != 0 && ((remainder < 0) != (r < 0))) {
                    quotient -= 1;
                    remainder += r;
                }
                return op == BinaryOp::FloorDiv ? quotient : remainder;
            }
            case BinaryOp::Pow: {
                if (r < 0) {
                    if (l == 0) {
                        return make_error(ErrorKind::Evaluation,
                                          "0 cannot be raised to a negative power");
                    }
                    return std::pow(static_cast<double>(l), static_cast<double>(r));
                }
                auto powered = int_pow(l, r);
                if (!powered.has_value()) {
                    return overflow(op);
                }
                return *powered;
            }
            default:
                break;
        }
        return unsupported(op, lhs, rhs);
    }

    double l = as_double(lhs);
    double r = as_double(rhs);
    switch (op) {
        case BinaryOp::Add:
            return l + r;
        case BinaryOp::Sub:
            return l - r;
        case BinaryOp::Mul:
            return l * r;
        case BinaryOp::Div:
            if (r == 0.0) {
                return make_error(ErrorKind::Evaluation, "division by zero");
            }
            return l / r;
        case BinaryOp::FloorDiv:
            if (r == 0.0) {
                return make_error(ErrorKind::Evaluation, "float floor division by zero");
            }
            return std::floor(l / r);
        case BinaryOp::Mod: {
            if (r == 0.0) {
                return make_error(ErrorKind::Evaluation, "float modulo by zero");
            }
            double remainder = std::fmod(l, r);
            if (remainder != 0.0 && ((remainder < 0.0) != (r < 0.0))) {
                remainder += r;
            }
            return remainder;
        }
        case BinaryOp::Pow: {
            if (l == 0.0 && r < 0.0) {
                return make_error(ErrorKind::Evaluation,
                                  "0.0 cannot be raised to a negative power");
            }
            if (l < 0.0 && std::trunc(r) != r) {
                return make_error(ErrorKind::Evaluation,
                                  "negative number cannot be raised to a fractional power");
            }
            return std::pow(l, r);
        }
        default:
            break;
    }
    return unsupported(op, lhs, rhs);
}

template <typename Seq>
auto repeat(const Seq& seq, std::int64_t times) -> Seq {
    Seq out;
    for (std::int64_t i = 0; i < times; ++i) {
        if constexpr (std::is_same_v<Seq, std::string>) {
            out.append(seq);
        } else {
            out.items.insert(out.items.end(), seq.items.begin(), seq.items.end());
        }
    }
    return out;
}

auto repeat_value(const Value& seq, std::int64_t times) -> std::optional<Value> {
    if (const auto* text = seq.get_if<std::string>()) {
        return Value{repeat(*text, times)};
    }
    if (const auto* tuple = seq.get_if<Tuple>()) {
        return Value{repeat(*tuple, times)};
    }
    if (const auto* list = seq.get_if<List>()) {
        return Value{repeat(*list, times)};
    }
    return std::nullopt;
}

auto concatenate(const Value& lhs, const Value& rhs) -> std::optional<Value> {
    if (lhs.is<std::string>() && rhs.is<std::string>()) {
        return Value{*lhs.get_if<std::string>() + *rhs.get_if<std::string>()};
    }
    if (lhs.is<Tuple>() && rhs.is<Tuple>()) {
        Tuple out = *lhs.get_if<Tuple>();
        const auto& tail = rhs.get_if<Tuple>()->items;
        out.items.insert(out.items.end(), tail.begin(), tail.end());
        return Value{std::move(out)};
    }
    if (lhs.is<List>() && rhs.is<List>()) {
        List out = *lhs.get_if<List>();
        const auto& tail = rhs.get_if<List>()->items;
        out.items.insert(out.items.end(), tail.begin(), tail.end());
        return Value{std::move(out)};
    }
    return std::nullopt;
}

auto contains(const Value& container, const Value& needle) -> Result<bool> {
    if (const auto* items = sequence_items(container)) {
        return std::find(items->begin(), items->end(), needle) != items->end();
    }
    if (const auto* text = container.get_if<std::string>()) {
        const auto* sub = needle.get_if<std::string>();
        if (sub == nullptr) {
            return make_error(ErrorKind::Evaluation,
                              fmt::format("'in <string>' requires string as left operand, not {}",
                                          type_name(needle)));
        }
        return text->find(*sub) != std::string::npos;
    }
    if (const auto* object = container.get_if<Object>()) {
        const auto* key = needle.get_if<std::string>();
        return key != nullptr && object->find(*key) != nullptr;
    }
    return make_error(ErrorKind::Evaluation,
                      fmt::format("argument of type '{}' is not iterable", type_name(container)));
}

// Python slice bounds: negative values count from the end, everything clamps.
auto clamp_bound(const Value* bound, std::int64_t size, std::int64_t fallback)
    -> Result<std::int64_t> {
    if (bound == nullptr || bound->is<None>()) {
        return fallback;
    }
    if (!is_integral(*bound)) {
        return make_error(ErrorKind::Evaluation, "slice indices must be integers or None");
    }
    std::int64_t value = to_int(*bound);
    if (value < 0) {
        value += size;
    }
    return std::clamp<std::int64_t>(value, 0, size);
}

auto find_attribute(const Object& object, const std::string& name) -> const Value* {
    if (const Value* exact = object.find(name)) {
        return exact;
    }
    for (const auto& [key, value] : object.fields) {
        if (sanitize_key(key) == name) {
            return &value;
        }
    }
    return nullptr;
}

class ExprEvaluator {
   public:
    ExprEvaluator(const Scope& scope, const FunctionRegistry& functions)
        : scope_(scope), functions_(functions) {}

    auto eval(const parser::Expr& expr) -> Result<Value> {
        return std::visit([this](const auto& node) -> Result<Value> { return eval_node(node); },
                          expr.node);
    }

   private:
    auto eval_node(const parser::IdentifierExpr& node) -> Result<Value> {
        if (auto it = scope_.find(node.name); it != scope_.end()) {
            return it->second;
        }
        return make_error(ErrorKind::Evaluation,
                          fmt::format("name '{}' is not defined", node.name));
    }

    auto eval_node(const parser::LiteralExpr& node) -> Result<Value> {
        return std::visit(
            [](const auto& literal) -> Value {
                using T = std::decay_t<decltype(literal)>;
                if constexpr (std::is_same_v<T, parser::NoneLiteral>) {
                    return None{};
                } else {
                    return literal;
                }
            },
            node.value);
    }

    auto eval_node(const parser::UnaryExpr& node) -> Result<Value> {
        auto operand = eval(*node.expr);
        if (!operand) {
            return operand;
        }
        if (node.op == UnaryOp::Not) {
            return !is_truthy(*operand);
        }
        if (!is_numeric(*operand)) {
            return make_error(ErrorKind::Evaluation,
                              fmt::format("bad operand type for unary {}: '{}'",
                                          node.op == UnaryOp::Negate ? "-" : "+",
                                          type_name(*operand)));
        }
        if (const auto* d = operand->get_if<double>()) {
            return node.op == UnaryOp::Negate ? -*d : *d;
        }
        std::int64_t value = to_int(*operand);
        if (node.op == UnaryOp::Plus) {
            return value;
        }
        if (value == std::numeric_limits<std::int64_t>::min()) {
            return make_error(ErrorKind::Evaluation, "integer overflow in unary '-'");
        }
        return -value;
    }

    auto eval_node(const parser::BinaryExpr& node) -> Result<Value> {
        auto lhs = eval(*node.left);
        if (!lhs) {
            return lhs;
        }
        if (node.op == BinaryOp::And) {
            return is_truthy(*lhs) ? eval(*node.right) : lhs;
        }
        if (node.op == BinaryOp::Or) {
            return is_truthy(*lhs) ? lhs : eval(*node.right);
        }
        auto rhs = eval(*node.right);
        if (!rhs) {
            return rhs;
        }
        return apply_binary(node.op, *lhs, *rhs);
    }

    auto eval_node(const parser::ComparisonChainExpr& node) -> Result<Value> {
        auto lhs = eval(*node.operands.front());
        if (!lhs) {
            return lhs;
        }
        for (std::size_t i = 0; i < node.ops.size(); ++i) {
            auto rhs = eval(*node.operands[i + 1]);
            if (!rhs) {
                return rhs;
            }
            auto result = apply_binary(node.ops[i], *lhs, *rhs);
            if (!result || !is_truthy(*result) || i + 1 == node.ops.size()) {
                return result;
            }
            lhs = std::move(rhs);
        }
        return lhs;
    }

    auto eval_node(const parser::ConditionalExpr& node) -> Result<Value> {
        auto condition = eval(*node.condition);
        if (!condition) {
            return condition;
        }
        if (is_truthy(*condition)) {
            return eval(*node.body);
        }
        if (!node.alternative) {
            return List{};
        }
        return eval(*node.alternative);
    }

    auto eval_node(const parser::TupleExpr& node) -> Result<Value> {
        auto items = eval_items(node.items);
        if (!items) {
            return std::unexpected(std::move(items.error()));
        }
        return Tuple{.items = std::move(*items)};
    }

    auto eval_node(const parser::ListExpr& node) -> Result<Value> {
        auto items = eval_items(node.items);
        if (!items) {
            return std::unexpected(std::move(items.error()));
        }
        return List{.items = std::move(*items)};
    }

    auto eval_node(const parser::ObjectExpr& node) -> Result<Value> {
        Object object;
        for (const auto& [key_expr, value_expr] : node.entries) {
            auto key = eval(*key_expr);
            if (!key) {
                return key;
            }
            auto* name = key->get_if<std::string>();
            if (name == nullptr) {
                return make_error(ErrorKind::Evaluation,
                                  fmt::format("object keys must be str, not {}", type_name(*key)));
            }
            auto value = eval(*value_expr);
            if (!value) {
                return value;
            }
            object.set(std::move(*name), std::move(*value));
        }
        return object;
    }

    auto eval_node(const parser::AttributeExpr& node) -> Result<Value> {
        auto object = eval(*node.object);
        if (!object) {
            return object;
        }
        const auto* fields = object->get_if<Object>();
        if (fields == nullptr) {
            return make_error(ErrorKind::Evaluation,
                              fmt::format("'{}' object has no attribute '{}'", type_name(*object),
                                          node.name));
        }
        if (const Value* found = find_attribute(*fields, node.name)) {
            return *found;
        }
        return make_error(ErrorKind::Evaluation,
                          fmt::format("object has no attribute '{}'", node.name));
    }

    auto eval_node(const parser::IndexExpr& node) -> Result<Value> {
        auto object = eval(*node.object);
        if (!object) {
            return object;
        }
        auto index = eval(*node.index);
        if (!index) {
            return index;
        }
        if (const auto* fields = object->get_if<Object>()) {
            const auto* key = index->get_if<std::string>();
            const Value* found = key != nullptr ? fields->find(*key) : nullptr;
            if (found == nullptr) {
                return make_error(ErrorKind::Evaluation,
                                  fmt::format("key {} not found", to_repr(*index)));
            }
            return *found;
        }
        if (!is_integral(*index)) {
            return make_error(ErrorKind::Evaluation,
                              fmt::format("{} indices must be integers, not {}",
                                          type_name(*object), type_name(*index)));
        }
        return item_at(*object, to_int(*index));
    }

    auto eval_node(const parser::SliceExpr& node) -> Result<Value> {
        auto object = eval(*node.object);
        if (!object) {
            return object;
        }
        std::optional<Value> start;
        std::optional<Value> stop;
        if (node.start) {
            auto value = eval(*node.start);
            if (!value) {
                return value;
            }
            start = std::move(*value);
        }
        if (node.stop) {
            auto value = eval(*node.stop);
            if (!value) {
                return value;
            }
            stop = std::move(*value);
        }

        std::int64_t size = 0;
        if (const auto* items = sequence_items(*object)) {
            size = static_cast<std::int64_t>(items->size());
        } else if (const auto* text = object->get_if<std::string>()) {
            size = code_point_count(*text);
        } else {
            return make_error(ErrorKind::Evaluation,
                              fmt::format("'{}' object is not subscriptable", type_name(*object)));
        }
        auto begin = clamp_bound(start ? &*start : nullptr, size, 0);
        if (!begin) {
            return std::unexpected(std::move(begin.error()));
        }
        auto end = clamp_bound(stop ? &*stop : nullptr, size, size);
        if (!end) {
            return std::unexpected(std::move(end.error()));
        }
        const auto from = static_cast<std::size_t>(*begin);
        const auto to = static_cast<std::size_t>(std::max(*begin, *end));

        if (const auto* text = object->get_if<std::string>()) {
            return code_point_substr(*text, *begin, std::max(*begin, *end));
        }
        const auto& items = *sequence_items(*object);
        std::vector<Value> part(items.begin() + static_cast<std::ptrdiff_t>(from),
                                items.begin() + static_cast<std::ptrdiff_t>(to));
        if (object->is<Tuple>()) {
            return Tuple{.items = std::move(part)};
        }
        return List{.items = std::move(part)};
    }

    auto eval_node(const parser::CallExpr& node) -> Result<Value> {
        const Function* func = functions_.find(node.callee);
        if (func == nullptr) {
            return make_error(ErrorKind::Evaluation,
                              fmt::format("name '{}' is not defined", node.callee));
        }
        auto args = eval_items(node.args);
        if (!args) {
            return std::unexpected(std::move(args.error()));
        }
        return (*func)(*args);
    }

    auto eval_items(const std::vector<parser::ExprPtr>& exprs) -> Result<std::vector<Value>> {
        std::vector<Value> items;
        items.reserve(exprs.size());
        for (const auto& expr : exprs) {
            auto value = eval(*expr);
            if (!value) {
                return std::unexpected(std::move(value.error()));
            }
            items.push_back(std::move(*value));
        }
        return items;
    }

    const Scope& scope_;
    const FunctionRegistry& functions_;
};

auto make_empty_list() -> parser::ExprPtr {
    auto expr = std::make_unique<parser::Expr>();
    expr->node = parser::ListExpr{};
    return expr;
}

void fill_implicit_alternatives(parser::Expr& expr);

void fill_all(std::vector<parser::ExprPtr>& exprs) {
    for (auto& expr : exprs) {
        fill_implicit_alternatives(*expr);
    }
}

void fill_implicit_alternatives(parser::Expr& expr) {
    std::visit(
        [](auto& node) {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, parser::UnaryExpr>) {
                fill_implicit_alternatives(*node.expr);
            } else if constexpr (std::is_same_v<T, parser::BinaryExpr>) {
                fill_implicit_alternatives(*node.left);
                fill_implicit_alternatives(*node.right);
            } else if constexpr (std::is_same_v<T, parser::ComparisonChainExpr>) {
                fill_all(node.operands);
            } else if constexpr (std::is_same_v<T, parser::ConditionalExpr>) {
                fill_implicit_alternatives(*node.body);
                fill_implicit_alternatives(*node.condition);
                if (!node.alternative) {
                    node.alternative = make_empty_list();
                } else {
                    fill_implicit_alternatives(*node.alternative);
                }
            } else if constexpr (std::is_same_v<T, parser::TupleExpr> ||
                                 std::is_same_v<T, parser::ListExpr>) {
                fill_all(node.items);
            } else if constexpr (std::is_same_v<T, parser::ObjectExpr>) {
                for (auto& [key, value] : node.entries) {
                    fill_implicit_alternatives(*key);
                    fill_implicit_alternatives(*value);
                }
            } else if constexpr (std::is_same_v<T, parser::AttributeExpr>) {
                fill_implicit_alternatives(*node.object);
            } else if constexpr (std::is_same_v<T, parser::IndexExpr>) {
                fill_implicit_alternatives(*node.object);
                fill_implicit_alternatives(*node.index);
            } else if constexpr (std::is_same_v<T, parser::SliceExpr>) {
                fill_implicit_alternatives(*node.object);
                if (node.start) {
                    fill_implicit_alternatives(*node.start);
                }
                if (node.stop) {
                    fill_implicit_alternatives(*node.stop);
                }
            } else if constexpr (std::is_same_v<T, parser::CallExpr>) {
                fill_all(node.args);
            }
        },
        expr.node);
}

}  // namespace

auto is_literal(const parser::Expr& expr) -> bool {
    return std::visit(
        [](const auto& node) -> bool {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, parser::LiteralExpr>) {
                return true;
            } else if constexpr (std::is_same_v<T, parser::UnaryExpr>) {
                if (node.op == UnaryOp::Not) {
                    return false;
                }
                const auto* literal = std::get_if<parser::LiteralExpr>(&node.expr->node);
                return literal != nullptr &&
                       (std::holds_alternative<std::int64_t>(literal->value) ||
                        std::holds_alternative<double>(literal->value));
            } else if constexpr (std::is_same_v<T, parser::TupleExpr> ||
                                 std::is_same_v<T, parser::ListExpr>) {
                return std::all_of(node.items.begin(), node.items.end(),
                                   [](const auto& item) { return is_literal(*item); });
            } else if constexpr (std::is_same_v<T, parser::ObjectExpr>) {
                return std::all_of(node.entries.begin(), node.entries.end(), [](const auto& e) {
                    return is_literal(*e.first) && is_literal(*e.second);
                });
            } else {
                return false;
            }
        },
        expr.node);
}

auto compile_query(std::string_view source) -> Result<CompiledQuery> {
    auto parsed = parser::parse(source);
    if (!parsed) {
        return make_error(ErrorKind::Syntax, fmt::format("invalid query \"{}\": {}", source,
                                                         parsed.error().format()));
    }
    fill_implicit_alternatives(**parsed);
    return CompiledQuery{.source = std::string(source), .root = std::move(*parsed)};
}

auto evaluate(const parser::Expr& expr, const Scope& scope, const FunctionRegistry& functions)
    -> Result<Value> {
    ExprEvaluator evaluator(scope, functions);
    return evaluator.eval(expr);
}

auto evaluate(const CompiledQuery& query, const Scope& scope, const FunctionRegistry& functions)
    -> Result<Value> {
    return evaluate(*query.root, scope, functions);
}

auto apply_binary(BinaryOp op, const Value& lhs, const Value& rhs) -> Result<Value> {
    switch (op) {
        case BinaryOp::Eq:
            return lhs == rhs;
        case BinaryOp::Ne:
            return !(lhs == rhs);
        case BinaryOp::Lt:
        case BinaryOp::Le:
        case BinaryOp::Gt:
        case BinaryOp::Ge: {
            auto ordered = compare(lhs, rhs);
            if (!ordered) {
                return std::unexpected(std::move(ordered.error()));
            }
            int c = *ordered;
            if (op == BinaryOp::Lt) {
                return c < 0;
            }
            if (op == BinaryOp::Le) {
                return c <= 0;
            }
            if (op == BinaryOp::Gt) {
                return c > 0;
            }
            return c >= 0;
        }
        case BinaryOp::In:
        case BinaryOp::NotIn: {
            auto found = contains(rhs, lhs);
            if (!found) {
                return std::unexpected(std::move(found.error()));
            }
            return op == BinaryOp::In ? *found : !*found;
        }
        case BinaryOp::And:
            return is_truthy(lhs) ? rhs : lhs;
        case BinaryOp::Or:
            return is_truthy(lhs) ? lhs : rhs;
        default:
            break;
    }

    if (is_numeric(lhs) && is_numeric(rhs)) {
        return arithmetic(op, lhs, rhs);
    }
    if (op == BinaryOp::Add) {
        if (auto joined = concatenate(lhs, rhs)) {
            return std::move(*joined);
        }
    }
    if (op == BinaryOp::Mul) {
        if (is_integral(rhs)) {
            if (auto repeated = repeat_value(lhs, to_int(rhs))) {
                return std::move(*repeated);
            }
        }
        if (is_integral(lhs)) {
            if (auto repeated = repeat_value(rhs, to_int(lhs))) {
                return std::move(*repeated);
            }
        }
    }
    return unsupported(op, lhs, rhs);
}

auto literal_value(std::string_view text) -> std::optional<Value> {
    static const FunctionRegistry kNoFunctions;
    static const Scope kNoNames;

    const auto begin = text.find_first_not_of(" \t");
    if (begin == std::string_view::npos) {
        return std::nullopt;
    }
    const auto end = text.find_last_not_of(" \t");
    auto parsed = parser::parse(text.substr(begin, end - begin + 1));
    if (!parsed || !is_literal(**parsed)) {
        return std::nullopt;
    }
    auto value = evaluate(**parsed, kNoNames, kNoFunctions);
    if (!value) {
        return std::nullopt;
    }
    return std::move(*value);
}

}  // namespace lineq::runtime
