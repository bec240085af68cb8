#include <lineq/runtime/builtins.hpp>
#include <lineq/runtime/evaluator.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>

namespace lineq::runtime {

namespace {

auto arity_error(std::string_view name, std::string_view expected, std::size_t got)
    -> std::unexpected<Error> {
    return make_error(ErrorKind::Evaluation,
                      fmt::format("{}() expects {} argument(s), got {}", name, expected, got));
}

/// Elements of the sequence argument of a reduction function.
auto sequence_arg(std::string_view name, const Value& arg) -> Result<const std::vector<Value>*> {
    if (const auto* items = sequence_items(arg)) {
        return items;
    }
    return make_error(ErrorKind::Evaluation,
                      fmt::format("{}() argument must be a sequence, not '{}'", name,
                                  type_name(arg)));
}

/// Fails unless every element can be ordered against every other one.
auto check_comparable(const std::vector<Value>& values) -> Result<void> {
    for (std::size_t i = 1; i < values.size(); ++i) {
        auto ordered = compare(values[0], values[i]);
        if (!ordered) {
            return std::unexpected(std::move(ordered.error()));
        }
    }
    return {};
}

auto builtin_len(const FunctionArgs& args) -> Result<Value> {
    if (args.size() != 1) {
        return arity_error("len", "1", args.size());
    }
    const Value& arg = args.front();
    if (const auto* items = sequence_items(arg)) {
        return static_cast<std::int64_t>(items->size());
    }
    if (const auto* text = arg.get_if<std::string>()) {
        return code_point_count(*text);
    }
    if (const auto* object = arg.get_if<Object>()) {
        return static_cast<std::int64_t>(object->size());
    }
    return make_error(ErrorKind::Evaluation,
                      fmt::format("object of type '{}' has no len()", type_name(arg)));
}

auto builtin_sum(const FunctionArgs& args) -> Result<Value> {
    if (args.empty() || args.size() > 2) {
        return arity_error("sum", "1 or 2", args.size());
    }
    auto items = sequence_arg("sum", args[0]);
    if (!items) {
        return std::unexpected(std::move(items.error()));
    }
    Value total = args.size() == 2 ? args[1] : Value{std::int64_t{0}};
    for (const auto& item : **items) {
        auto next = apply_binary(parser::BinaryOp::Add, total, item);
        if (!next) {
            return next;
        }
        total = std::move(*next);
    }
    return total;
}

auto extreme(std::string_view name, const FunctionArgs& args, bool want_max) -> Result<Value> {
    if (args.empty()) {
        return arity_error(name, "at least 1", 0);
    }
    const std::vector<Value>* values = &args;
    if (args.size() == 1) {
        auto items = sequence_arg(name, args[0]);
        if (!items) {
            return std::unexpected(std::move(items.error()));
        }
        values = *items;
    }
    if (values->empty()) {
        return make_error(ErrorKind::Evaluation,
                          fmt::format("{}() arg is an empty sequence", name));
    }
    const Value* best = &values->front();
    for (std::size_t i = 1; i < values->size(); ++i) {
        auto ordered = compare((*values)[i], *best);
        if (!ordered) {
            return std::unexpected(std::move(ordered.error()));
        }
        if (want_max ? *ordered > 0 : *ordered < 0) {
            best = &(*values)[i];
        }
    }
    return *best;
}

auto builtin_mean(const FunctionArgs& args) -> Result<Value> {
    if (args.size() != 1) {
        return arity_error("mean", "1", args.size());
    }
    auto items = sequence_arg("mean", args[0]);
    if (!items) {
        return std::unexpected(std::move(items.error()));
    }
    return mean(**items);
}

auto builtin_percentile(const FunctionArgs& args) -> Result<Value> {
    if (args.size() != 2) {
        return arity_error("percentile", "2", args.size());
    }
    auto items = sequence_arg("percentile", args[0]);
    if (!items) {
        return std::unexpected(std::move(items.error()));
    }
    if (!is_numeric(args[1])) {
        return make_error(ErrorKind::Evaluation,
                          fmt::format("percentile() fraction must be a number, not '{}'",
                                      type_name(args[1])));
    }
    return percentile(**items, as_double(args[1]));
}

auto builtin_abs(const FunctionArgs& args) -> Result<Value> {
    if (args.size() != 1) {
        return arity_error("abs", "1", args.size());
    }
    const Value& arg = args.front();
    if (const auto* d = arg.get_if<double>()) {
        return std::fabs(*d);
    }
    if (!is_numeric(arg)) {
        return make_error(ErrorKind::Evaluation,
                          fmt::format("bad operand type for abs(): '{}'", type_name(arg)));
    }
    std::int64_t value =
        arg.is<bool>() ? (*arg.get_if<bool>() ? 1 : 0) : *arg.get_if<std::int64_t>();
    if (value == std::numeric_limits<std::int64_t>::min()) {
        return make_error(ErrorKind::Evaluation, "integer overflow in abs()");
    }
    return value < 0 ? -value : value;
}

// Rounds half to even, like the default floating point rounding mode.
auto builtin_round(const FunctionArgs& args) -> Result<Value> {
    if (args.empty() || args.size() > 2) {
        return arity_error("round", "1 or 2", args.size());
    }
    if (!is_numeric(args[0])) {
        return make_error(ErrorKind::Evaluation,
                          fmt::format("type {} doesn't define __round__", type_name(args[0])));
    }
    if (args.size() == 1) {
        if (!args[0].is<double>()) {
            return args[0].is<bool>() ? Value{*args[0].get_if<bool>() ? 1 : 0} : args[0];
        }
        double rounded = std::nearbyint(*args[0].get_if<double>());
        if (!std::isfinite(rounded) ||
            std::fabs(rounded) >= static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
            return make_error(ErrorKind::Evaluation, "cannot convert float to integer");
        }
        return static_cast<std::int64_t>(rounded);
    }
    if (!args[1].is<std::int64_t>()) {
        return make_error(ErrorKind::Evaluation, "round() digits must be an integer");
    }
    const double scale = std::pow(10.0, static_cast<double>(*args[1].get_if<std::int64_t>()));
    return std::nearbyint(as_double(args[0]) * scale) / scale;
}

auto builtin_int(const FunctionArgs& args) -> Result<Value> {
    if (args.size() != 1) {
        return arity_error("int", "1", args.size());
    }
    const Value& arg = args.front();
    if (const auto* b = arg.get_if<bool>()) {
        return std::int64_t{*b ? 1 : 0};
    }
    if (arg.is<std::int64_t>()) {
        return arg;
    }
    if (const auto* d = arg.get_if<double>()) {
        if (!std::isfinite(*d) ||
            std::fabs(*d) >= static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
            return make_error(ErrorKind::Evaluation, "cannot convert float to integer");
        }
        return static_cast<std::int64_t>(std::trunc(*d));
    }
    if (const auto* text = arg.get_if<std::string>()) {
        auto trimmed = std::string_view(*text);
        while (!trimmed.empty() && (trimmed.front() == ' ' || trimmed.front() == '\t')) {
            trimmed.remove_prefix(1);
        }
        while (!trimmed.empty() && (trimmed.back() == ' ' || trimmed.back() == '\t')) {
            trimmed.remove_suffix(1);
        }
        if (!trimmed.empty() && trimmed.front() == '+') {
            trimmed.remove_prefix(1);
        }
        std::int64_t value = 0;
        auto result = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), value);
        if (result.ec == std::errc() && result.ptr == trimmed.data() + trimmed.size() &&
            !trimmed.empty()) {
            return value;
        }
    }
    return make_error(ErrorKind::Evaluation,
                      fmt::format("invalid literal for int(): {}", to_repr(arg)));
}

auto builtin_float(const FunctionArgs& args) -> Result<Value> {
    if (args.size() != 1) {
        return arity_error("float", "1", args.size());
    }
    const Value& arg = args.front();
    if (is_numeric(arg)) {
        return as_double(arg);
    }
    if (const auto* text = arg.get_if<std::string>()) {
        char* end = nullptr;
        double value = std::strtod(text->c_str(), &end);
        while (end != nullptr && (*end == ' ' || *end == '\t')) {
            ++end;
        }
        if (end != text->c_str() && *end == '\0') {
            return value;
        }
    }
    return make_error(ErrorKind::Evaluation,
                      fmt::format("could not convert to float: {}", to_repr(arg)));
}

auto builtin_sorted(const FunctionArgs& args) -> Result<Value> {
    if (args.size() != 1) {
        return arity_error("sorted", "1", args.size());
    }
    auto items = sequence_arg("sorted", args[0]);
    if (!items) {
        return std::unexpected(std::move(items.error()));
    }
    if (auto comparable = check_comparable(**items); !comparable) {
        return std::unexpected(std::move(comparable.error()));
    }
    List sorted{.items = **items};
    std::stable_sort(sorted.items.begin(), sorted.items.end(), total_less);
    return sorted;
}

auto string_case(std::string_view name, const FunctionArgs& args, bool upper) -> Result<Value> {
    if (args.size() != 1) {
        return arity_error(name, "1", args.size());
    }
    const auto* text = args.front().get_if<std::string>();
    if (text == nullptr) {
        return make_error(ErrorKind::Evaluation,
                          fmt::format("{}() argument must be str, not '{}'", name,
                                      type_name(args.front())));
    }
    std::string out = *text;
    std::transform(out.begin(), out.end(), out.begin(), [upper](unsigned char ch) {
        return static_cast<char>(upper ? std::toupper(ch) : std::tolower(ch));
    });
    return out;
}

}  // namespace

auto percentile(const std::vector<Value>& values, double p) -> Result<Value> {
    if (!(p >= 0.0 && p < 1.0)) {
        return make_error(ErrorKind::Evaluation,
                          fmt::format("percentile fraction must be in [0, 1), got {}", p));
    }
    if (values.empty()) {
        return make_error(ErrorKind::Index, "percentile of an empty sequence");
    }
    if (auto comparable = check_comparable(values); !comparable) {
        return std::unexpected(std::move(comparable.error()));
    }
    std::vector<Value> scratch = values;
    const auto k = static_cast<std::size_t>(std::floor(p * static_cast<double>(scratch.size())));
    std::nth_element(scratch.begin(), scratch.begin() + static_cast<std::ptrdiff_t>(k),
                     scratch.end(), total_less);
    return scratch[k];
}

auto mean(const std::vector<Value>& values) -> Result<Value> {
    if (values.empty()) {
        return 0.0;
    }
    double total = 0.0;
    for (const auto& value : values) {
        if (!is_numeric(value)) {
            return make_error(ErrorKind::Evaluation,
                              fmt::format("mean() requires numbers, got '{}'", type_name(value)));
        }
        total += as_double(value);
    }
    return total / static_cast<double>(values.size());
}

void register_builtins(FunctionRegistry& registry) {
    registry.register_function("len", builtin_len);
    registry.register_function("count", builtin_len);
    registry.register_function("sum", builtin_sum);
    registry.register_function(
        "max", [](const FunctionArgs& args) { return extreme("max", args, /*want_max=*/true); });
    registry.register_function(
        "min", [](const FunctionArgs& args) { return extreme("min", args, /*want_max=*/false); });
    registry.register_function("avg", builtin_mean);
    registry.register_function("mean", builtin_mean);
    registry.register_function("percentile", builtin_percentile);
    registry.register_function("abs", builtin_abs);
    registry.register_function("round", builtin_round);
    registry.register_function("int", builtin_int);
    registry.register_function("float", builtin_float);
    registry.register_function("str", [](const FunctionArgs& args) -> Result<Value> {
        if (args.size() != 1) {
            return arity_error("str", "1", args.size());
        }
        return to_str(args.front());
    });
    registry.register_function("bool", [](const FunctionArgs& args) -> Result<Value> {
        if (args.size() != 1) {
            return arity_error("bool", "1", args.size());
        }
        return is_truthy(args.front());
    });
    registry.register_function("tuple", [](const FunctionArgs& args) -> Result<Value> {
        if (args.size() != 1) {
            return arity_error("tuple", "1", args.size());
        }
        auto items = sequence_arg("tuple", args.front());
        if (!items) {
            return std::unexpected(std::move(items.error()));
        }
        return Tuple{.items = **items};
    });
    registry.register_function("list", [](const FunctionArgs& args) -> Result<Value> {
        if (args.size() != 1) {
            return arity_error("list", "1", args.size());
        }
        auto items = sequence_arg("list", args.front());
        if (!items) {
            return std::unexpected(std::move(items.error()));
        }
        return List{.items = **items};
    });
    registry.register_function("sorted", builtin_sorted);
    registry.register_function(
        "lower", [](const FunctionArgs& args) { return string_case("lower", args, false); });
    registry.register_function(
        "upper", [](const FunctionArgs& args) { return string_case("upper", args, true); });
}

auto builtin_registry() -> FunctionRegistry {
    FunctionRegistry registry;
    register_builtins(registry);
    return registry;
}

}  // namespace lineq::runtime
