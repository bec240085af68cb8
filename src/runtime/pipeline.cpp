#include <lineq/runtime/evaluator.hpp>
#include <lineq/runtime/map_stage.hpp>
#include <lineq/runtime/ops.hpp>
#include <lineq/runtime/pipeline.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace lineq::runtime {

auto validate_config(const PipelineConfig& config, std::size_t input_count) -> Result<void> {
    if (input_count == 0) {
        return make_error(ErrorKind::Configuration, "at least one input is required");
    }
    if (input_count > kMaxInputs) {
        return make_error(ErrorKind::Configuration,
                          fmt::format("at most {} inputs are supported, got {}", kMaxInputs,
                                      input_count));
    }
    if (config.queries.size() != input_count) {
        return make_error(ErrorKind::Configuration,
                          fmt::format("expected one query per input: {} quer{} for {} input{}",
                                      config.queries.size(),
                                      config.queries.size() == 1 ? "y" : "ies", input_count,
                                      input_count == 1 ? "" : "s"));
    }
    return {};
}

auto build_pipeline(const PipelineConfig& config, const std::vector<InputSource>& inputs,
                    const FunctionRegistry& functions) -> Result<OperatorPtr> {
    if (auto valid = validate_config(config, inputs.size()); !valid) {
        return std::unexpected(std::move(valid.error()));
    }

    // Queries and reductions are compiled before any line is read.
    std::vector<CompiledQuery> queries;
    queries.reserve(config.queries.size());
    for (const auto& source : config.queries) {
        auto compiled = compile_query(source);
        if (!compiled) {
            return std::unexpected(std::move(compiled.error()));
        }
        queries.push_back(std::move(*compiled));
    }

    AggregateSpec aggregate;
    for (const auto& text : config.agg_funcs) {
        auto reduction = parse_reduction(text, functions);
        if (!reduction) {
            return std::unexpected(std::move(reduction.error()));
        }
        aggregate.reductions.push_back(std::move(*reduction));
    }

    std::vector<OperatorPtr> maps;
    maps.reserve(inputs.size());
    for (std::size_t i = 0; i < inputs.size(); ++i) {
        if (inputs[i].stream == nullptr) {
            return make_error(ErrorKind::Configuration,
                              fmt::format("input '{}' is not open", inputs[i].name));
        }
        MapOptions options{
            .skip_header = config.skip_header,
            .defaults = config.defaults,
            .source_name = inputs[i].name,
        };
        spdlog::debug("pipeline: map {} over {}", queries[i].source, inputs[i].name);
        maps.push_back(std::make_unique<MapOperator>(*inputs[i].stream, std::move(queries[i]),
                                                     functions, std::move(options)));
    }

    OperatorPtr root = std::move(maps[0]);
    if (maps.size() == 2) {
        spdlog::debug("pipeline: join");
        root = std::make_unique<JoinOperator>(std::move(root), std::move(maps[1]));
    }
    if (!aggregate.reductions.empty()) {
        spdlog::debug("pipeline: aggregate with {} function(s)", aggregate.reductions.size());
        aggregate.key_columns = config.key_columns;
        aggregate.value_column = config.value_column;
        root = std::make_unique<AggregateOperator>(std::move(root), std::move(aggregate),
                                                   functions);
    }
    if (config.distinct) {
        spdlog::debug("pipeline: distinct");
        root = std::make_unique<DistinctOperator>(std::move(root));
    }
    if (!config.order_by_columns.empty()) {
        spdlog::debug("pipeline: order by {} column(s){}", config.order_by_columns.size(),
                      config.reverse ? ", reversed" : "");
        root = std::make_unique<OrderByOperator>(
            std::move(root),
            OrderBySpec{.columns = config.order_by_columns, .reverse = config.reverse});
    }
    if (config.limit > 0) {
        spdlog::debug("pipeline: limit {}", config.limit);
        root = std::make_unique<LimitOperator>(std::move(root), config.limit);
    }
    return root;
}

}  // namespace lineq::runtime
