#pragma once

#include <lineq/parser/ast.hpp>

#include <expected>
#include <string>
#include <string_view>

namespace lineq::parser {

/// Parse error with location information.
struct ParseError {
    std::string message;
    std::size_t line = 0;
    std::size_t column = 0;

    [[nodiscard]] auto format() const -> std::string;
};

/// Result type for parse operations.
using ParseResult = std::expected<ExprPtr, ParseError>;

/// Parse a query expression. A top-level comma list (`a, b`) yields a tuple.
[[nodiscard]] auto parse(std::string_view source) -> ParseResult;

}  // namespace lineq::parser
