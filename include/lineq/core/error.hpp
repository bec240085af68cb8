#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace lineq {

/// Classes of failure a pipeline run can end with. Every one of them is fatal.
enum class ErrorKind : std::uint8_t {
    Configuration,
    Syntax,
    Parse,
    Evaluation,
    Index,
};

struct Error {
    ErrorKind kind = ErrorKind::Evaluation;
    std::string message;
    /// Offending input line, verbatim. Only set for ErrorKind::Parse.
    std::string line;

    [[nodiscard]] auto format() const -> std::string;
};

template <typename T>
using Result = std::expected<T, Error>;

[[nodiscard]] auto kind_name(ErrorKind kind) -> std::string_view;

[[nodiscard]] auto make_error(ErrorKind kind, std::string message) -> std::unexpected<Error>;

}  // namespace lineq
