#include <lineq/lineq.hpp>

#include <fmt/core.h>

#include <sstream>

auto main() -> int {
    // Trades as JSON lines.
    std::istringstream trades(
        "{\"symbol\": \"ACME\", \"price\": 100.5}\n"
        "{\"symbol\": \"INIT\", \"price\": 20.0}\n"
        "{\"symbol\": \"ACME\", \"price\": 175.8}\n");

    fmt::print("=== Expressions ===\n");
    lineq::runtime::RecordReader reader;
    auto record = reader.get_record("{\"symbol\": \"ACME\", \"price\": 100.5}");
    auto query = lineq::runtime::compile_query("(symbol, price * 100) if price > 100");
    if (!record || !query) {
        fmt::print("setup failed\n");
        return 1;
    }
    const auto functions = lineq::runtime::builtin_registry();
    auto value = lineq::runtime::evaluate(*query, record->context, functions);
    if (!value) {
        fmt::print("{}\n", value.error().format());
        return 1;
    }
    fmt::print("bps: {}\n", lineq::to_str(*value));

    fmt::print("\n=== Pipeline ===\n");
    lineq::runtime::PipelineConfig config;
    config.queries = {"(symbol, price)"};
    config.agg_funcs = {"count", "avg", "max"};
    config.key_columns = {0};
    config.value_column = 1;

    auto pipeline = lineq::runtime::build_pipeline(
        config, {{.stream = &trades, .name = "trades"}}, functions);
    if (!pipeline) {
        fmt::print("{}\n", pipeline.error().format());
        return 1;
    }
    while (true) {
        auto row = (*pipeline)->next();
        if (!row) {
            fmt::print("{}\n", row.error().format());
            return 1;
        }
        if (!row->has_value()) {
            break;
        }
        fmt::print("{}\n", lineq::runtime::format_record(**row, false));
    }
    return 0;
}
