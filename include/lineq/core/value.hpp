#pragma once

#include <lineq/core/error.hpp>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace lineq {

struct Value;

/// Fixed-arity record. Tuples are what queries usually emit and what the
/// stream operators index into by position.
struct Tuple {
    std::vector<Value> items;
};

/// Sequence value. A query result of this kind is flattened into zero or
/// more output records.
struct List {
    std::vector<Value> items;
};

/// Insertion-ordered mapping from string keys to values (a JSON object).
struct Object {
    std::vector<std::pair<std::string, Value>> fields;

    [[nodiscard]] auto find(std::string_view key) const -> const Value*;
    /// Replace the value under `key`, or append it when the key is new.
    void set(std::string key, Value value);
    [[nodiscard]] auto size() const noexcept -> std::size_t { return fields.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return fields.empty(); }
};

struct None {};

enum class ValueKind : std::uint8_t {
    None,
    Bool,
    Int,
    Float,
    String,
    Tuple,
    List,
    Object,
};

/// Dynamically typed value produced by the reader and the evaluator.
///
/// Alternative order matches ValueKind.
struct Value {
    std::variant<None, bool, std::int64_t, double, std::string, Tuple, List, Object> data;

    Value() = default;
    Value(None) {}
    Value(bool value) : data(value) {}
    Value(int value) : data(static_cast<std::int64_t>(value)) {}
    Value(std::int64_t value) : data(value) {}
    Value(double value) : data(value) {}
    Value(const char* value) : data(std::string(value)) {}
    Value(std::string value) : data(std::move(value)) {}
    Value(std::string_view value) : data(std::string(value)) {}
    Value(Tuple value) : data(std::move(value)) {}
    Value(List value) : data(std::move(value)) {}
    Value(Object value) : data(std::move(value)) {}

    [[nodiscard]] auto kind() const noexcept -> ValueKind {
        return static_cast<ValueKind>(data.index());
    }

    template <typename T>
    [[nodiscard]] auto is() const noexcept -> bool {
        return std::holds_alternative<T>(data);
    }

    template <typename T>
    [[nodiscard]] auto get_if() const noexcept -> const T* {
        return std::get_if<T>(&data);
    }

    template <typename T>
    [[nodiscard]] auto get_if() noexcept -> T* {
        return std::get_if<T>(&data);
    }
};

[[nodiscard]] auto make_tuple(std::initializer_list<Value> items) -> Value;
[[nodiscard]] auto make_list(std::initializer_list<Value> items) -> Value;

/// Type name as shown in error messages ("int", "str", "tuple", ...).
[[nodiscard]] auto type_name(const Value& value) -> std::string_view;

/// Int, Float and Bool all take part in arithmetic and numeric comparison.
[[nodiscard]] auto is_numeric(const Value& value) noexcept -> bool;
[[nodiscard]] auto as_double(const Value& value) noexcept -> double;

[[nodiscard]] auto is_truthy(const Value& value) noexcept -> bool;

/// Elements of a Tuple or List, nullptr for every other kind.
[[nodiscard]] auto sequence_items(const Value& value) noexcept -> const std::vector<Value>*;

/// Full value equality. Numbers compare by value across Int/Float/Bool;
/// Tuple and List never compare equal to each other; Objects ignore key order.
[[nodiscard]] auto operator==(const Value& lhs, const Value& rhs) -> bool;

/// Three-way ordering: negative, zero or positive. Fails for pairs that have
/// no natural order (e.g. str and int, anything involving None).
[[nodiscard]] auto compare(const Value& lhs, const Value& rhs) -> Result<int>;

/// Total order over all values (kind first, then content). NaN sorts after
/// every other number; elsewhere it agrees with compare() wherever compare()
/// succeeds.
[[nodiscard]] auto total_less(const Value& lhs, const Value& rhs) -> bool;

/// Strings are measured, indexed and sliced in UTF-8 code points.
[[nodiscard]] auto code_point_count(std::string_view text) noexcept -> std::int64_t;

/// Code points [from, to) of `text`; bounds must already be clamped.
[[nodiscard]] auto code_point_substr(std::string_view text, std::int64_t from, std::int64_t to)
    -> std::string;

/// Positional access with Python index rules (negative counts from the end).
/// Works on Tuple, List and String.
[[nodiscard]] auto item_at(const Value& container, std::int64_t index) -> Result<Value>;

/// Plain string form ("1", "x", "None", "(1, 'x')").
[[nodiscard]] auto to_str(const Value& value) -> std::string;

/// Representation form; identical to to_str except strings are quoted.
[[nodiscard]] auto to_repr(const Value& value) -> std::string;

/// Turn an arbitrary object key into an identifier: every run of characters
/// other than [A-Za-z0-9_] becomes '_', and a leading digit gets a '_' prefix.
[[nodiscard]] auto sanitize_key(std::string_view key) -> std::string;

struct ValueHash {
    auto operator()(const Value& value) const -> std::size_t;
};

struct ValueEq {
    auto operator()(const Value& lhs, const Value& rhs) const -> bool { return lhs == rhs; }
};

}  // namespace lineq
