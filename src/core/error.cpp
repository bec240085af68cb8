#include <lineq/core/error.hpp>

#include <fmt/core.h>

namespace lineq {

auto kind_name(ErrorKind kind) -> std::string_view {
    switch (kind) {
        case ErrorKind::Configuration:
            return "configuration";
        case ErrorKind::Syntax:
            return "syntax";
        case ErrorKind::Parse:
            return "parse";
        case ErrorKind::Evaluation:
            return "evaluation";
        case ErrorKind::Index:
            return "index";
    }
    return "unknown";
}

auto Error::format() const -> std::string {
    return fmt::format("{} error: {}", kind_name(kind), message);
}

auto make_error(ErrorKind kind, std::string message) -> std::unexpected<Error> {
    return std::unexpected(Error{.kind = kind, .message = std::move(message), .line = {}});
}

}  // namespace lineq
