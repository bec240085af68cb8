#pragma once

#include <lineq/core/value.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace lineq {

using Json = nlohmann::ordered_json;

/// Convert a parsed JSON document into a Value. Arrays become Lists and
/// objects keep their key order.
[[nodiscard]] auto from_json(const Json& json) -> Value;

/// Convert a Value into JSON. Tuples and Lists both become arrays.
[[nodiscard]] auto to_json(const Value& value) -> Json;

/// Parse `text` as a JSON object. Returns nullopt when the text is not valid
/// JSON or is valid JSON of another kind.
[[nodiscard]] auto parse_json_object(std::string_view text) -> std::optional<Object>;

/// Serialize `value` as JSON, indented by two spaces unless `compact`.
[[nodiscard]] auto dump_json(const Value& value, bool compact) -> std::string;

}  // namespace lineq
