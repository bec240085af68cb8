#include <lineq/core/json.hpp>
#include <lineq/runtime/reader.hpp>

#include <fmt/core.h>
#include <rapidcsv.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <sstream>
#include <string>

namespace lineq::runtime {

auto split_csv_row(std::string_view line) -> std::optional<std::vector<std::string>> {
    if (line.empty()) {
        return std::nullopt;
    }
    // rapidcsv silently accepts a dangling quote; reject it up front.
    if (std::count(line.begin(), line.end(), '"') % 2 != 0) {
        return std::nullopt;
    }
    try {
        std::istringstream stream{std::string(line)};
        rapidcsv::Document doc(stream,
                               rapidcsv::LabelParams(-1, -1),  // no header row, no row labels
                               rapidcsv::SeparatorParams(',', /*pTrim=*/false,
                                                         rapidcsv::sPlatformHasCR,
                                                         /*pQuotedLinebreaks=*/false,
                                                         /*pAutoQuote=*/true));
        if (doc.GetRowCount() != 1) {
            return std::nullopt;
        }
        return doc.GetRow<std::string>(0);
    } catch (const std::exception& e) {
        spdlog::debug("csv: rapidcsv rejected line: {}", e.what());
        return std::nullopt;
    }
}

auto convert_field(const std::string& field) -> Value {
    if (auto literal = literal_value(field)) {
        return std::move(*literal);
    }
    return field;
}

auto RecordReader::get_record(std::string_view line) -> Result<Record> {
    lines_read_ += 1;
    if (mode_ == ReaderMode::TryingJson) {
        if (auto record = read_json(line)) {
            return std::move(*record);
        }
        mode_ = ReaderMode::CommittedCsv;
        spdlog::debug("reader: line {} is not a JSON object, switching to CSV", lines_read_);
    }
    if (auto record = read_csv(line)) {
        return std::move(*record);
    }
    return std::unexpected(Error{
        .kind = ErrorKind::Parse,
        .message = fmt::format("line {} is neither a JSON object nor a CSV row", lines_read_),
        .line = std::string(line),
    });
}

auto RecordReader::read_json(std::string_view line) const -> std::optional<Record> {
    auto parsed = parse_json_object(line);
    if (!parsed.has_value()) {
        return std::nullopt;
    }
    Object merged = defaults_;
    for (auto& [key, value] : parsed->fields) {
        merged.set(std::move(key), std::move(value));
    }

    Record record;
    record.context.reserve(merged.size() + 1);
    for (const auto& [key, value] : merged.fields) {
        record.context.insert_or_assign(sanitize_key(key), value);
    }
    record.value = std::move(merged);
    record.context.insert_or_assign(std::string(kRecordAlias), record.value);
    return record;
}

auto RecordReader::read_csv(std::string_view line) -> std::optional<Record> {
    auto fields = split_csv_row(line);
    if (!fields.has_value()) {
        return std::nullopt;
    }
    Tuple row;
    row.items.reserve(fields->size());
    for (const auto& field : *fields) {
        row.items.push_back(convert_field(field));
    }
    Record record;
    record.value = std::move(row);
    record.context.emplace(std::string(kRecordAlias), record.value);
    return record;
}

}  // namespace lineq::runtime
