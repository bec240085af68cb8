#include <lineq/core/json.hpp>
#include <lineq/runtime/builtins.hpp>
#include <lineq/runtime/evaluator.hpp>
#include <lineq/runtime/output.hpp>
#include <lineq/runtime/pipeline.hpp>

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

constexpr int kExitRuntimeError = 1;
constexpr int kExitConfigError = 2;

auto report(const lineq::Error& error) -> int {
    fmt::print(stderr, "lineq: {}\n", error.format());
    if (error.kind == lineq::ErrorKind::Parse && !error.line.empty()) {
        fmt::print(stderr, "{}\n", error.line);
    }
    return error.kind == lineq::ErrorKind::Configuration ? kExitConfigError : kExitRuntimeError;
}

void configure_logging(bool verbose) {
    // Records go to stdout; keep log output out of the way.
    spdlog::set_default_logger(spdlog::stderr_color_mt("lineq"));
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
        return;
    }
    spdlog::set_level(spdlog::level::warn);
    const char* env = std::getenv("LINEQ_LOG_LEVEL");
    if (env == nullptr) {
        return;
    }
    std::string name(env);
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        spdlog::warn("ignoring unknown LINEQ_LOG_LEVEL '{}'", name);
        return;
    }
    spdlog::set_level(level);
}

}  // namespace

auto main(int argc, char** argv) -> int {
    CLI::App app{"lineq: query JSON-lines and CSV records"};
    app.set_version_flag("--version", "lineq 0.1.0");

    lineq::runtime::PipelineConfig config;
    std::vector<std::string> files;
    std::string defaults_json;
    bool compact = false;
    bool verbose = false;

    app.add_option("-q,--queries", config.queries,
                   "One expression per input (default: _ for each input)");
    app.add_option("-f,--files", files, "One or two inputs, - for stdin (default: stdin)");
    app.add_flag("-c,--compact", compact, "Print objects as single-line JSON");
    app.add_flag("-s,--skip_header", config.skip_header, "Ignore the first line of each input");
    app.add_option("-i,--default", defaults_json,
                   "JSON object of default fields merged under every JSON record");
    app.add_flag("-d,--distinct", config.distinct, "Drop duplicate records");
    app.add_option("-a,--agg_funcs", config.agg_funcs,
                   "Reduction functions, e.g. sum or 'percentile(0.9)'; enables aggregation");
    app.add_option("-k,--key_columns", config.key_columns, "Aggregate grouping positions");
    app.add_option("-v,--value_column", config.value_column,
                   "Aggregate value position (default: 0)");
    app.add_option("-o,--order_by_columns", config.order_by_columns,
                   "Sort positions; enables ordering");
    app.add_flag("-r,--reverse", config.reverse, "Sort descending");
    app.add_option("-l,--limit", config.limit, "Maximum number of records (0: unlimited)");
    app.add_flag("--verbose", verbose, "Enable debug logging");

    CLI11_PARSE(app, argc, argv);

    configure_logging(verbose);

    if (files.empty()) {
        files.emplace_back("-");
    }
    if (config.queries.empty()) {
        config.queries.assign(files.size(), std::string(lineq::runtime::kRecordAlias));
    }
    if (auto valid = lineq::runtime::validate_config(config, files.size()); !valid) {
        return report(valid.error());
    }

    if (!defaults_json.empty()) {
        auto defaults = lineq::parse_json_object(defaults_json);
        if (!defaults) {
            return report(lineq::Error{
                .kind = lineq::ErrorKind::Configuration,
                .message = fmt::format("--default is not a JSON object: {}", defaults_json),
            });
        }
        config.defaults = std::move(*defaults);
    }

    std::vector<std::unique_ptr<std::ifstream>> open_files;
    std::vector<lineq::runtime::InputSource> inputs;
    for (const auto& path : files) {
        if (path == "-") {
            inputs.push_back({.stream = &std::cin, .name = "<stdin>"});
            continue;
        }
        auto stream = std::make_unique<std::ifstream>(path);
        if (!*stream) {
            fmt::print(stderr, "lineq: cannot open '{}'\n", path);
            return kExitConfigError;
        }
        inputs.push_back({.stream = stream.get(), .name = path});
        open_files.push_back(std::move(stream));
    }

    const auto functions = lineq::runtime::builtin_registry();
    auto pipeline = lineq::runtime::build_pipeline(config, inputs, functions);
    if (!pipeline) {
        return report(pipeline.error());
    }

    while (true) {
        auto record = (*pipeline)->next();
        if (!record) {
            std::cout.flush();
            return report(record.error());
        }
        if (!record->has_value()) {
            break;
        }
        lineq::runtime::print_record(std::cout, **record, compact);
    }
    std::cout.flush();
    return 0;
}
