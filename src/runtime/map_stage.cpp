#include <lineq/runtime/map_stage.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <string>

namespace lineq::runtime {

namespace {

auto is_blank(const std::string& line) -> bool {
    return line.find_first_not_of(" \t") == std::string::npos;
}

}  // namespace

MapOperator::MapOperator(std::istream& input, CompiledQuery query,
                         const FunctionRegistry& functions, MapOptions options)
    : input_(input),
      query_(std::move(query)),
      functions_(functions),
      options_(std::move(options)),
      reader_(options_.defaults) {}

auto MapOperator::next() -> NextResult {
    std::string line;
    while (pending_.empty()) {
        if (!std::getline(input_, line)) {
            spdlog::debug("map: {} exhausted after {} line(s)", options_.source_name,
                          line_number_);
            return std::nullopt;
        }
        line_number_ += 1;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line_number_ == 1 && options_.skip_header) {
            continue;
        }
        if (is_blank(line)) {
            continue;
        }

        auto record = reader_.get_record(line);
        if (!record) {
            Error error = std::move(record.error());
            error.message = fmt::format("{}:{}: {}", options_.source_name, line_number_,
                                        error.message);
            return std::unexpected(std::move(error));
        }
        auto result = evaluate(query_, record->context, functions_);
        if (!result) {
            Error error = std::move(result.error());
            error.message = fmt::format("{}:{}: {}", options_.source_name, line_number_,
                                        error.message);
            return std::unexpected(std::move(error));
        }
        if (auto* list = result->get_if<List>()) {
            for (auto& item : list->items) {
                pending_.push_back(std::move(item));
            }
            continue;
        }
        return std::move(*result);
    }
    Value front = std::move(pending_.front());
    pending_.pop_front();
    return front;
}

}  // namespace lineq::runtime
