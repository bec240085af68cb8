#include <lineq/core/json.hpp>
#include <lineq/runtime/output.hpp>

#include <fmt/ranges.h>

#include <vector>

namespace lineq::runtime {

auto format_record(const Value& record, bool compact) -> std::string {
    if (record.is<Object>()) {
        return dump_json(record, compact);
    }
    if (const auto* tuple = record.get_if<Tuple>()) {
        std::vector<std::string> fields;
        fields.reserve(tuple->items.size());
        for (const auto& item : tuple->items) {
            fields.push_back(to_str(item));
        }
        return fmt::format("{}", fmt::join(fields, ","));
    }
    return to_str(record);
}

void print_record(std::ostream& out, const Value& record, bool compact) {
    out << format_record(record, compact) << '\n';
}

}  // namespace lineq::runtime
