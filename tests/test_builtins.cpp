#include <lineq/runtime/builtins.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

using namespace lineq;
using namespace lineq::runtime;

namespace {

auto call(const std::string& name, FunctionArgs args) -> Result<Value> {
    static const FunctionRegistry registry = builtin_registry();
    const Function* func = registry.find(name);
    REQUIRE(func != nullptr);
    return (*func)(args);
}

auto values(std::initializer_list<Value> items) -> std::vector<Value> {
    return std::vector<Value>(items);
}

}  // namespace

TEST_CASE("Registry holds the reduction functions") {
    auto registry = builtin_registry();
    for (const char* name : {"len", "count", "sum", "max", "min", "avg", "mean", "percentile"}) {
        REQUIRE(registry.contains(name));
    }
    REQUIRE_FALSE(registry.contains("eval"));
    REQUIRE(registry.find("open") == nullptr);
}

TEST_CASE("NaN sorts last and keeps percentile well defined") {
    auto nan = call("float", {Value("nan")});
    REQUIRE(nan.has_value());

    auto sorted = call("sorted", {make_list({3, *nan, 1, 2})});
    REQUIRE(sorted.has_value());
    const auto& items = sorted->get_if<List>()->items;
    REQUIRE(items.size() == 4);
    REQUIRE(items[0] == Value(1));
    REQUIRE(items[1] == Value(2));
    REQUIRE(items[2] == Value(3));
    REQUIRE(std::isnan(*items[3].get_if<double>()));

    REQUIRE(*percentile(values({3, *nan, 1, 2}), 0.5) == Value(3));
    REQUIRE(*percentile(values({*nan, 5, 4}), 0.0) == Value(4));
}

TEST_CASE("len, indexing and slicing agree on non-ASCII text") {
    const std::string text = "na\u00efve";
    REQUIRE(*call("len", {Value(text)}) == Value(5));
    REQUIRE(*item_at(Value(text), 4) == Value("e"));
    REQUIRE(*item_at(Value(text), 2) == Value("\u00ef"));
}

TEST_CASE("Percentile selects the floor-indexed order statistic") {
    auto three = values({3, 1, 2});
    REQUIRE(*percentile(three, 0.5) == Value(2));
    REQUIRE(*percentile(three, 0.0) == Value(1));
    REQUIRE(*percentile(three, 0.99) == Value(3));

    auto ten = values({10, 9, 8, 7, 6, 5, 4, 3, 2, 1});
    REQUIRE(*percentile(ten, 0.25) == Value(3));
    REQUIRE(*percentile(ten, 0.9) == Value(10));
}

TEST_CASE("Percentile leaves its input untouched") {
    auto input = values({5, 4, 3, 2, 1});
    auto before = input;
    REQUIRE(*percentile(input, 0.5) == Value(3));
    REQUIRE(input == before);
}

TEST_CASE("Percentile rejects bad input") {
    SECTION("fraction out of range") {
        REQUIRE(percentile(values({1}), 1.0).error().kind == ErrorKind::Evaluation);
        REQUIRE(percentile(values({1}), -0.1).error().kind == ErrorKind::Evaluation);
    }
    SECTION("empty sequence") {
        REQUIRE(percentile({}, 0.5).error().kind == ErrorKind::Index);
    }
    SECTION("incomparable elements") {
        REQUIRE_FALSE(percentile(values({1, "a"}), 0.5).has_value());
    }
}

TEST_CASE("Mean is a float and zero for an empty list") {
    REQUIRE(*mean({}) == Value(0.0));
    REQUIRE(mean({})->is<double>());
    auto avg = mean(values({1, 2}));
    REQUIRE(avg->is<double>());
    REQUIRE(*avg == Value(1.5));
    REQUIRE_FALSE(mean(values({1, "x"})).has_value());
    REQUIRE(*call("avg", {make_list({2, 4})}) == Value(3.0));
}

TEST_CASE("Sum keeps integers integral") {
    auto ints = call("sum", {make_list({1, 2, 3})});
    REQUIRE(ints->is<std::int64_t>());
    REQUIRE(*ints == Value(6));

    auto mixed = call("sum", {make_list({1, 0.5})});
    REQUIRE(mixed->is<double>());
    REQUIRE(*mixed == Value(1.5));

    REQUIRE(*call("sum", {make_list({})}) == Value(0));
    REQUIRE(*call("sum", {make_list({1}), 10}) == Value(11));
    REQUIRE_FALSE(call("sum", {make_list({1, "a"})}).has_value());
}

TEST_CASE("len and count") {
    REQUIRE(*call("len", {make_list({1, 2, 3})}) == Value(3));
    REQUIRE(*call("count", {make_tuple({1})}) == Value(1));
    REQUIRE(*call("len", {Value("héllo")}) == Value(5));
    REQUIRE_FALSE(call("len", {Value(3)}).has_value());
}

TEST_CASE("min and max") {
    REQUIRE(*call("max", {make_list({3, 7, 5})}) == Value(7));
    REQUIRE(*call("min", {make_list({3, 7, 5})}) == Value(3));
    REQUIRE(*call("max", {1, 9, 4}) == Value(9));
    REQUIRE(*call("min", {make_list({"b", "a"})}) == Value("a"));

    auto empty = call("max", {make_list({})});
    REQUIRE_FALSE(empty.has_value());
    REQUIRE(empty.error().kind == ErrorKind::Evaluation);
}

TEST_CASE("Conversions") {
    REQUIRE(*call("int", {Value("42")}) == Value(42));
    REQUIRE(*call("int", {Value(-2.7)}) == Value(-2));
    REQUIRE_FALSE(call("int", {Value("4x")}).has_value());
    REQUIRE(*call("float", {Value("2.5")}) == Value(2.5));
    REQUIRE(*call("str", {Value(3)}) == Value("3"));
    REQUIRE(*call("bool", {Value("")}) == Value(false));
    REQUIRE(*call("round", {Value(2.5)}) == Value(2));
    REQUIRE(*call("round", {Value(3.5)}) == Value(4));
    REQUIRE(*call("abs", {Value(-4)}) == Value(4));
}

TEST_CASE("Sequence helpers") {
    REQUIRE(*call("sorted", {make_tuple({3, 1, 2})}) == make_list({1, 2, 3}));
    REQUIRE(*call("tuple", {make_list({1, 2})}) == make_tuple({1, 2}));
    REQUIRE(*call("list", {make_tuple({1, 2})}) == make_list({1, 2}));
    REQUIRE(*call("upper", {Value("abc")}) == Value("ABC"));
    REQUIRE(*call("lower", {Value("AbC")}) == Value("abc"));
}
