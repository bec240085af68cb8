#pragma once

#include <lineq/core/error.hpp>
#include <lineq/core/value.hpp>
#include <lineq/runtime/evaluator.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lineq::runtime {

/// One input line turned into a value plus the names a query can see.
struct Record {
    Value value;
    Scope context;
};

enum class ReaderMode : std::uint8_t {
    TryingJson,
    CommittedCsv,
};

/// Adaptive line reader.
///
/// Starts out parsing JSON objects. The first line that is not a JSON object
/// switches the reader to CSV for good; from then on every line is read as a
/// CSV row and JSON is never attempted again.
class RecordReader {
   public:
    RecordReader() = default;
    explicit RecordReader(Object defaults) : defaults_(std::move(defaults)) {}

    /// Parse one line. Fails with ErrorKind::Parse, carrying the line, when it
    /// is neither a JSON object nor a CSV row.
    [[nodiscard]] auto get_record(std::string_view line) -> Result<Record>;

    [[nodiscard]] auto mode() const noexcept -> ReaderMode { return mode_; }

   private:
    [[nodiscard]] auto read_json(std::string_view line) const -> std::optional<Record>;
    [[nodiscard]] static auto read_csv(std::string_view line) -> std::optional<Record>;

    Object defaults_;
    ReaderMode mode_ = ReaderMode::TryingJson;
    std::size_t lines_read_ = 0;
};

/// Split one line as an RFC 4180 row. Returns nullopt for an empty line or an
/// unterminated quoted field.
[[nodiscard]] auto split_csv_row(std::string_view line) -> std::optional<std::vector<std::string>>;

/// Type a CSV field: the most specific literal it spells, else the field text.
[[nodiscard]] auto convert_field(const std::string& field) -> Value;

}  // namespace lineq::runtime
