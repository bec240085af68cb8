#include <lineq/parser/parser.hpp>
#include <lineq/runtime/evaluator.hpp>
#include <lineq/runtime/ops.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>
#include <utility>

namespace lineq::runtime {

namespace {

auto record_items(const Value& record, std::string_view stage)
    -> Result<const std::vector<Value>*> {
    const auto* items = sequence_items(record);
    if (items == nullptr) {
        return make_error(ErrorKind::Evaluation,
                          fmt::format("{}: expected a tuple or list record, got '{}'", stage,
                                      type_name(record)));
    }
    return items;
}

/// Build the tuple of values at `columns`.
auto project(const Value& record, const std::vector<std::int64_t>& columns) -> Result<Tuple> {
    Tuple key;
    key.items.reserve(columns.size());
    for (auto column : columns) {
        auto item = item_at(record, column);
        if (!item) {
            return std::unexpected(std::move(item.error()));
        }
        key.items.push_back(std::move(*item));
    }
    return key;
}

}  // namespace

auto collect(Operator& op) -> Result<std::vector<Value>> {
    std::vector<Value> out;
    while (true) {
        auto item = op.next();
        if (!item) {
            return std::unexpected(std::move(item.error()));
        }
        if (!item->has_value()) {
            return out;
        }
        out.push_back(std::move(**item));
    }
}

// ─── Reduction specs ──────────────────────────────────────────────────────────

auto parse_reduction(std::string_view text, const FunctionRegistry& functions)
    -> Result<ReductionSpec> {
    auto parsed = parser::parse(text);
    if (!parsed) {
        return make_error(ErrorKind::Configuration,
                          fmt::format("invalid aggregate function \"{}\": {}", text,
                                      parsed.error().format()));
    }
    ReductionSpec spec{.text = std::string(text)};
    const parser::Expr& root = **parsed;
    if (const auto* name = std::get_if<parser::IdentifierExpr>(&root.node)) {
        spec.function = name->name;
    } else if (const auto* call = std::get_if<parser::CallExpr>(&root.node)) {
        spec.function = call->callee;
        static const FunctionRegistry kNoFunctions;
        static const Scope kNoNames;
        for (const auto& arg : call->args) {
            if (!is_literal(*arg)) {
                return make_error(ErrorKind::Configuration,
                                  fmt::format("aggregate function \"{}\": arguments must be "
                                              "literals",
                                              text));
            }
            auto value = evaluate(*arg, kNoNames, kNoFunctions);
            if (!value) {
                return make_error(ErrorKind::Configuration,
                                  fmt::format("aggregate function \"{}\": {}", text,
                                              value.error().message));
            }
            spec.extra_args.push_back(std::move(*value));
        }
    } else {
        return make_error(ErrorKind::Configuration,
                          fmt::format("invalid aggregate function \"{}\": expected a function "
                                      "name or call",
                                      text));
    }
    if (!functions.contains(spec.function)) {
        return make_error(ErrorKind::Configuration,
                          fmt::format("unknown aggregate function '{}'", spec.function));
    }
    return spec;
}

// ─── Join ─────────────────────────────────────────────────────────────────────

auto JoinOperator::materialize_build_side() -> Result<void> {
    std::size_t rows = 0;
    while (true) {
        auto item = build_->next();
        if (!item) {
            return std::unexpected(std::move(item.error()));
        }
        if (!item->has_value()) {
            break;
        }
        auto key = item_at(**item, 0);
        if (!key) {
            return std::unexpected(std::move(key.error()));
        }
        if (auto items = record_items(**item, "join"); !items) {
            return std::unexpected(std::move(items.error()));
        }
        table_[std::move(*key)].push_back(std::move(**item));
        rows += 1;
    }
    built_ = true;
    spdlog::debug("join: build side has {} row(s) under {} key(s)", rows, table_.size());
    return {};
}

auto JoinOperator::next() -> NextResult {
    if (!built_) {
        if (auto built = materialize_build_side(); !built) {
            return std::unexpected(std::move(built.error()));
        }
    }
    while (matches_ == nullptr || match_index_ >= matches_->size()) {
        matches_ = nullptr;
        auto item = probe_->next();
        if (!item) {
            return std::unexpected(std::move(item.error()));
        }
        if (!item->has_value()) {
            return std::nullopt;
        }
        auto key = item_at(**item, 0);
        if (!key) {
            return std::unexpected(std::move(key.error()));
        }
        auto items = record_items(**item, "join");
        if (!items) {
            return std::unexpected(std::move(items.error()));
        }
        auto it = table_.find(*key);
        if (it == table_.end()) {
            continue;
        }
        probe_tail_.assign((*items)->begin() + 1, (*items)->end());
        matches_ = &it->second;
        match_index_ = 0;
    }

    const Value& build_row = (*matches_)[match_index_++];
    const auto* build_items = sequence_items(build_row);
    Tuple joined;
    joined.items.reserve(build_items->size() + probe_tail_.size());
    joined.items.insert(joined.items.end(), build_items->begin(), build_items->end());
    joined.items.insert(joined.items.end(), probe_tail_.begin(), probe_tail_.end());
    return Value(std::move(joined));
}

// ─── Aggregate ────────────────────────────────────────────────────────────────

auto AggregateOperator::materialize() -> Result<void> {
    robin_hood::unordered_flat_map<Value, std::size_t, ValueHash, ValueEq> index;
    std::size_t rows = 0;
    while (true) {
        auto item = input_->next();
        if (!item) {
            return std::unexpected(std::move(item.error()));
        }
        if (!item->has_value()) {
            break;
        }
        auto key = project(**item, spec_.key_columns);
        if (!key) {
            return std::unexpected(std::move(key.error()));
        }
        auto value = item_at(**item, spec_.value_column);
        if (!value) {
            return std::unexpected(std::move(value.error()));
        }
        Value lookup(*key);
        auto it = index.find(lookup);
        if (it == index.end()) {
            it = index.emplace(std::move(lookup), groups_.size()).first;
            groups_.push_back(Group{.key = std::move(*key), .values = {}});
        }
        groups_[it->second].values.push_back(std::move(*value));
        rows += 1;
    }
    materialized_ = true;
    spdlog::debug("aggregate: {} row(s) in {} group(s)", rows, groups_.size());
    return {};
}

auto AggregateOperator::reduce(const Group& group) const -> Result<Value> {
    Tuple row = group.key;
    row.items.reserve(row.items.size() + spec_.reductions.size());
    for (const auto& reduction : spec_.reductions) {
        const Function* function = functions_.find(reduction.function);
        if (function == nullptr) {
            return make_error(ErrorKind::Configuration,
                              fmt::format("unknown aggregate function '{}'", reduction.function));
        }
        // Every reduction receives its own copy of the group's values.
        FunctionArgs args;
        args.reserve(1 + reduction.extra_args.size());
        args.emplace_back(List{group.values});
        args.insert(args.end(), reduction.extra_args.begin(), reduction.extra_args.end());
        auto result = (*function)(args);
        if (!result) {
            Error error = std::move(result.error());
            error.message = fmt::format("{}: {}", reduction.text, error.message);
            return std::unexpected(std::move(error));
        }
        row.items.push_back(std::move(*result));
    }
    return Value(std::move(row));
}

auto AggregateOperator::next() -> NextResult {
    if (!materialized_) {
        if (auto done = materialize(); !done) {
            return std::unexpected(std::move(done.error()));
        }
    }
    if (emitted_ >= groups_.size()) {
        return std::nullopt;
    }
    auto row = reduce(groups_[emitted_]);
    emitted_ += 1;
    if (!row) {
        return std::unexpected(std::move(row.error()));
    }
    return std::move(*row);
}

// ─── Distinct ─────────────────────────────────────────────────────────────────

auto DistinctOperator::next() -> NextResult {
    while (true) {
        auto item = input_->next();
        if (!item || !item->has_value()) {
            return item;
        }
        if (seen_.insert(**item).second) {
            return item;
        }
    }
}

// ─── OrderBy / Limit ──────────────────────────────────────────────────────────

auto OrderByOperator::materialize() -> Result<void> {
    auto rows = collect(*input_);
    if (!rows) {
        return std::unexpected(std::move(rows.error()));
    }

    std::vector<std::pair<Value, std::size_t>> keyed;
    keyed.reserve(rows->size());
    for (std::size_t i = 0; i < rows->size(); ++i) {
        auto key = project((*rows)[i], spec_.columns);
        if (!key) {
            return std::unexpected(std::move(key.error()));
        }
        keyed.emplace_back(Value(std::move(*key)), i);
    }
    // Keys of mixed incomparable types cannot be ordered.
    for (std::size_t i = 1; i < keyed.size(); ++i) {
        if (auto cmp = compare(keyed[i - 1].first, keyed[i].first); !cmp) {
            return std::unexpected(std::move(cmp.error()));
        }
    }

    if (spec_.reverse) {
        std::stable_sort(keyed.begin(), keyed.end(), [](const auto& lhs, const auto& rhs) {
            return total_less(rhs.first, lhs.first);
        });
    } else {
        std::stable_sort(keyed.begin(), keyed.end(), [](const auto& lhs, const auto& rhs) {
            return total_less(lhs.first, rhs.first);
        });
    }

    sorted_.reserve(keyed.size());
    for (const auto& [key, position] : keyed) {
        sorted_.push_back(std::move((*rows)[position]));
    }
    materialized_ = true;
    spdlog::debug("orderby: sorted {} row(s)", sorted_.size());
    return {};
}

auto OrderByOperator::next() -> NextResult {
    if (!materialized_) {
        if (auto done = materialize(); !done) {
            return std::unexpected(std::move(done.error()));
        }
    }
    if (emitted_ >= sorted_.size()) {
        return std::nullopt;
    }
    return std::move(sorted_[emitted_++]);
}

auto LimitOperator::next() -> NextResult {
    if (emitted_ >= limit_) {
        return std::nullopt;
    }
    auto item = input_->next();
    if (item && item->has_value()) {
        emitted_ += 1;
    }
    return item;
}

}  // namespace lineq::runtime
