#pragma once

#include <lineq/core/error.hpp>
#include <lineq/core/value.hpp>
#include <lineq/parser/ast.hpp>
#include <lineq/runtime/builtins.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace lineq::runtime {

/// Name under which every record is bound in its evaluation context.
inline constexpr std::string_view kRecordAlias = "_";

/// Names visible to a query while it is evaluated against one record.
using Scope = std::unordered_map<std::string, Value>;

/// A query parsed once and evaluated against every record of a stream.
///
/// Every `x if cond` without an `else` branch has been given an alternative
/// that yields an empty list, so records failing the guard produce no output.
struct CompiledQuery {
    std::string source;
    parser::ExprPtr root;
};

/// Parse and prepare `source`. Fails with ErrorKind::Syntax.
[[nodiscard]] auto compile_query(std::string_view source) -> Result<CompiledQuery>;

/// Evaluate an expression tree against `scope`. Only functions found in
/// `functions` can be called.
[[nodiscard]] auto evaluate(const parser::Expr& expr, const Scope& scope,
                            const FunctionRegistry& functions) -> Result<Value>;

[[nodiscard]] auto evaluate(const CompiledQuery& query, const Scope& scope,
                            const FunctionRegistry& functions) -> Result<Value>;

/// Apply a non short-circuiting binary operator (everything except and/or).
[[nodiscard]] auto apply_binary(parser::BinaryOp op, const Value& lhs, const Value& rhs)
    -> Result<Value>;

/// True for literal displays: constants, signed numbers and tuple, list or
/// object displays built only from literals.
[[nodiscard]] auto is_literal(const parser::Expr& expr) -> bool;

/// Interpret `text` as a literal: numbers, strings, True/False/None and
/// tuple, list or object displays built from them. Returns nullopt for
/// anything else, including bare words.
[[nodiscard]] auto literal_value(std::string_view text) -> std::optional<Value>;

}  // namespace lineq::runtime
