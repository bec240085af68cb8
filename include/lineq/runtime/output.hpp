#pragma once

#include <lineq/core/value.hpp>

#include <ostream>
#include <string>

namespace lineq::runtime {

/// Render one output record as a single printed entry.
///
/// Objects are serialized as JSON (indented by two spaces, or on one line
/// when `compact` is set). Tuples print their elements' str forms joined by
/// commas. Anything else prints its str form.
[[nodiscard]] auto format_record(const Value& record, bool compact) -> std::string;

/// Write format_record(record) followed by a newline.
void print_record(std::ostream& out, const Value& record, bool compact);

}  // namespace lineq::runtime
