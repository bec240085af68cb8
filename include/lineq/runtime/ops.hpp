#pragma once

#include <lineq/core/value.hpp>
#include <lineq/runtime/builtins.hpp>
#include <lineq/runtime/operator.hpp>

#include <robin_hood.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace lineq::runtime {

// ─── Specs ────────────────────────────────────────────────────────────────────

/// One reduction applied to every group: `name` or `name(arg, ...)`. The
/// group's values are passed first, followed by `extra_args`.
struct ReductionSpec {
    std::string text;
    std::string function;
    std::vector<Value> extra_args;
};

struct AggregateSpec {
    std::vector<ReductionSpec> reductions;
    /// Empty means one group for the whole stream.
    std::vector<std::int64_t> key_columns;
    std::int64_t value_column = 0;
};

struct OrderBySpec {
    std::vector<std::int64_t> columns;
    bool reverse = false;
};

/// Parse a reduction spec such as `sum` or `percentile(0.9)`. The function
/// must be registered and arguments must be literals.
[[nodiscard]] auto parse_reduction(std::string_view text, const FunctionRegistry& functions)
    -> Result<ReductionSpec>;

// ─── Operators ────────────────────────────────────────────────────────────────

/// Inner equijoin on the first column.
///
/// The build side is drained into a hash table on the first pull; the probe
/// side stays streamed. Each probe record `b` yields `a ++ b[1:]` for every
/// build record `a` with the same key, in build arrival order.
class JoinOperator final : public Operator {
   public:
    JoinOperator(OperatorPtr build, OperatorPtr probe)
        : build_(std::move(build)), probe_(std::move(probe)) {}

    [[nodiscard]] auto next() -> NextResult override;

   private:
    [[nodiscard]] auto materialize_build_side() -> Result<void>;

    OperatorPtr build_;
    OperatorPtr probe_;
    robin_hood::unordered_node_map<Value, std::vector<Value>, ValueHash, ValueEq> table_;
    bool built_ = false;
    const std::vector<Value>* matches_ = nullptr;
    std::size_t match_index_ = 0;
    std::vector<Value> probe_tail_;
};

/// Groups records by their key columns and reduces the value column of each
/// group. Groups are emitted in first-seen order as `key ++ (r1, ..., rn)`.
class AggregateOperator final : public Operator {
   public:
    AggregateOperator(OperatorPtr input, AggregateSpec spec, const FunctionRegistry& functions)
        : input_(std::move(input)), spec_(std::move(spec)), functions_(functions) {}

    [[nodiscard]] auto next() -> NextResult override;

   private:
    struct Group {
        Tuple key;
        std::vector<Value> values;
    };

    [[nodiscard]] auto materialize() -> Result<void>;
    [[nodiscard]] auto reduce(const Group& group) const -> Result<Value>;

    OperatorPtr input_;
    AggregateSpec spec_;
    const FunctionRegistry& functions_;
    std::vector<Group> groups_;
    bool materialized_ = false;
    std::size_t emitted_ = 0;
};

/// Drops records equal to one seen before.
class DistinctOperator final : public Operator {
   public:
    explicit DistinctOperator(OperatorPtr input) : input_(std::move(input)) {}

    [[nodiscard]] auto next() -> NextResult override;

   private:
    OperatorPtr input_;
    robin_hood::unordered_node_set<Value, ValueHash, ValueEq> seen_;
};

/// Stable sort on the tuple of the configured columns. `reverse` sorts
/// descending while keeping equal keys in arrival order.
class OrderByOperator final : public Operator {
   public:
    OrderByOperator(OperatorPtr input, OrderBySpec spec)
        : input_(std::move(input)), spec_(std::move(spec)) {}

    [[nodiscard]] auto next() -> NextResult override;

   private:
    [[nodiscard]] auto materialize() -> Result<void>;

    OperatorPtr input_;
    OrderBySpec spec_;
    std::vector<Value> sorted_;
    bool materialized_ = false;
    std::size_t emitted_ = 0;
};

/// Passes through at most `limit` records, then stops pulling upstream.
class LimitOperator final : public Operator {
   public:
    LimitOperator(OperatorPtr input, std::size_t limit)
        : input_(std::move(input)), limit_(limit) {}

    [[nodiscard]] auto next() -> NextResult override;

   private:
    OperatorPtr input_;
    std::size_t limit_;
    std::size_t emitted_ = 0;
};

}  // namespace lineq::runtime
