#pragma once

#include <lineq/core/error.hpp>
#include <lineq/core/value.hpp>
#include <lineq/runtime/builtins.hpp>
#include <lineq/runtime/operator.hpp>

#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace lineq::runtime {

/// Everything needed to run one query, as collected from the command line.
struct PipelineConfig {
    std::vector<std::string> queries;
    bool skip_header = false;
    /// Fields merged under every JSON record.
    Object defaults;
    bool distinct = false;
    /// Non-empty enables the aggregate stage.
    std::vector<std::string> agg_funcs;
    std::vector<std::int64_t> key_columns;
    std::int64_t value_column = 0;
    /// Non-empty enables the order-by stage.
    std::vector<std::int64_t> order_by_columns;
    bool reverse = false;
    /// 0 means unlimited.
    std::size_t limit = 0;
};

/// One input stream and the name used for it in messages.
struct InputSource {
    std::istream* stream = nullptr;
    std::string name;
};

inline constexpr std::size_t kMaxInputs = 2;

/// Check the query/input counts before anything is read.
[[nodiscard]] auto validate_config(const PipelineConfig& config, std::size_t input_count)
    -> Result<void>;

/// Wire map stage(s), then join, aggregate, distinct, order-by and limit in
/// that fixed order. Stages that are not requested are left out. The inputs
/// and `functions` must outlive the returned operator.
[[nodiscard]] auto build_pipeline(const PipelineConfig& config,
                                  const std::vector<InputSource>& inputs,
                                  const FunctionRegistry& functions) -> Result<OperatorPtr>;

}  // namespace lineq::runtime
