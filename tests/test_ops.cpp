#include <lineq/runtime/builtins.hpp>
#include <lineq/runtime/ops.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <vector>

using namespace lineq;
using namespace lineq::runtime;

namespace {

const FunctionRegistry& functions() {
    static const FunctionRegistry registry = builtin_registry();
    return registry;
}

auto source(std::vector<Value> rows) -> OperatorPtr {
    return std::make_unique<VectorSource>(std::move(rows));
}

auto drain(Operator& op) -> std::vector<Value> {
    auto rows = collect(op);
    REQUIRE(rows.has_value());
    return *rows;
}

auto reductions(std::initializer_list<const char*> texts) -> std::vector<ReductionSpec> {
    std::vector<ReductionSpec> out;
    for (const char* text : texts) {
        auto spec = parse_reduction(text, functions());
        REQUIRE(spec.has_value());
        out.push_back(std::move(*spec));
    }
    return out;
}

/// Pulls from a vector and counts how many records were requested.
class CountingSource final : public Operator {
   public:
    CountingSource(std::vector<Value> rows, std::size_t& pulls)
        : rows_(std::move(rows)), pulls_(pulls) {}

    auto next() -> NextResult override {
        pulls_ += 1;
        if (position_ >= rows_.size()) {
            return std::nullopt;
        }
        return rows_[position_++];
    }

   private:
    std::vector<Value> rows_;
    std::size_t& pulls_;
    std::size_t position_ = 0;
};

}  // namespace

// ─── Join ─────────────────────────────────────────────────────────────────────

TEST_CASE("Join emits build row plus probe tail") {
    JoinOperator join(source({make_tuple({1, "a"}), make_tuple({2, "b"})}),
                      source({make_tuple({2, "x", true}), make_tuple({3, "y", false})}));
    auto rows = drain(join);
    REQUIRE(rows.size() == 1);
    REQUIRE(rows[0] == make_tuple({2, "b", "x", true}));
}

TEST_CASE("Join cardinality is the sum of matches per probe row") {
    std::vector<Value> build = {make_tuple({1, "a1"}), make_tuple({1, "a2"}),
                                make_tuple({2, "b"}), make_tuple({4, "d"})};
    std::vector<Value> probe = {make_tuple({1, 10}), make_tuple({2, 20}), make_tuple({1, 11}),
                                make_tuple({3, 30})};

    std::size_t expected = 0;
    for (const auto& b : probe) {
        expected += static_cast<std::size_t>(std::count_if(build.begin(), build.end(),
                                                           [&](const Value& a) {
            return *item_at(a, 0) == *item_at(b, 0);
        }));
    }

    JoinOperator join(source(build), source(probe));
    auto rows = drain(join);
    REQUIRE(rows.size() == expected);
    REQUIRE(rows.size() == 5);
    // Matches come in build arrival order for each probe row.
    REQUIRE(rows[0] == make_tuple({1, "a1", 10}));
    REQUIRE(rows[1] == make_tuple({1, "a2", 10}));
    REQUIRE(rows[2] == make_tuple({2, "b", 20}));
    REQUIRE(rows[3] == make_tuple({1, "a1", 11}));
    REQUIRE(rows[4] == make_tuple({1, "a2", 11}));
}

TEST_CASE("Join keys compare across numeric kinds") {
    JoinOperator join(source({make_tuple({1, "int"})}), source({make_tuple({1.0, "float"})}));
    auto rows = drain(join);
    REQUIRE(rows.size() == 1);
    REQUIRE(rows[0] == make_tuple({1, "int", "float"}));
}

TEST_CASE("Join rejects records without a first column") {
    SECTION("empty tuple on the build side") {
        JoinOperator join(source({make_tuple({})}), source({make_tuple({1})}));
        auto result = join.next();
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == ErrorKind::Index);
    }
    SECTION("scalar on the probe side") {
        JoinOperator join(source({make_tuple({1})}), source({Value(1)}));
        auto result = join.next();
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == ErrorKind::Evaluation);
    }
    SECTION("string on the probe side fails whether or not it matches") {
        JoinOperator unmatched(source({make_tuple({"a", 1})}), source({Value("zz")}));
        auto miss = unmatched.next();
        REQUIRE_FALSE(miss.has_value());
        REQUIRE(miss.error().kind == ErrorKind::Evaluation);

        JoinOperator matched(source({make_tuple({"a", 1})}), source({Value("ab")}));
        auto hit = matched.next();
        REQUIRE_FALSE(hit.has_value());
        REQUIRE(hit.error().kind == ErrorKind::Evaluation);
    }
}

// ─── Aggregate ────────────────────────────────────────────────────────────────

TEST_CASE("Parse reduction specs") {
    auto plain = parse_reduction("sum", functions());
    REQUIRE(plain.has_value());
    REQUIRE(plain->function == "sum");
    REQUIRE(plain->extra_args.empty());

    auto call = parse_reduction("percentile(0.9)", functions());
    REQUIRE(call.has_value());
    REQUIRE(call->function == "percentile");
    REQUIRE(call->extra_args.size() == 1);
    REQUIRE(call->extra_args[0] == Value(0.9));

    REQUIRE(parse_reduction("median", functions()).error().kind == ErrorKind::Configuration);
    REQUIRE(parse_reduction("percentile(x)", functions()).error().kind ==
            ErrorKind::Configuration);
    REQUIRE(parse_reduction("sum +", functions()).error().kind == ErrorKind::Configuration);
    REQUIRE(parse_reduction("1 + 2", functions()).error().kind == ErrorKind::Configuration);
}

TEST_CASE("Aggregate groups in first-seen order") {
    std::vector<Value> rows = {make_tuple({"b", 1}), make_tuple({"a", 2}), make_tuple({"b", 3}),
                               make_tuple({"a", 4}), make_tuple({"c", 5})};
    AggregateOperator agg(source(rows),
                          AggregateSpec{.reductions = reductions({"sum", "count", "max"}),
                                        .key_columns = {0},
                                        .value_column = 1},
                          functions());
    auto out = drain(agg);
    REQUIRE(out.size() == 3);
    REQUIRE(out[0] == make_tuple({"b", 4, 2, 3}));
    REQUIRE(out[1] == make_tuple({"a", 6, 2, 4}));
    REQUIRE(out[2] == make_tuple({"c", 5, 1, 5}));
}

TEST_CASE("Aggregate counts add up to the input size") {
    std::vector<Value> rows;
    for (int i = 0; i < 17; ++i) {
        rows.push_back(make_tuple({i % 3, i % 2, i}));
    }
    AggregateOperator agg(source(rows),
                          AggregateSpec{.reductions = reductions({"count"}),
                                        .key_columns = {0, 1},
                                        .value_column = 2},
                          functions());
    auto out = drain(agg);
    REQUIRE(out.size() == 6);
    std::int64_t total = 0;
    for (const auto& row : out) {
        total += *item_at(row, 2)->get_if<std::int64_t>();
    }
    REQUIRE(total == 17);
}

TEST_CASE("Aggregate without key columns forms one group") {
    AggregateOperator agg(source({make_tuple({3}), make_tuple({1}), make_tuple({2})}),
                          AggregateSpec{.reductions = reductions({"percentile(0.5)", "avg"}),
                                        .key_columns = {},
                                        .value_column = 0},
                          functions());
    auto out = drain(agg);
    REQUIRE(out.size() == 1);
    REQUIRE(out[0] == make_tuple({2, 2.0}));
}

TEST_CASE("Every reduction sees the group values unchanged") {
    // percentile runs first; the following reductions must still see arrival order.
    AggregateOperator agg(source({make_tuple({5}), make_tuple({1}), make_tuple({3})}),
                          AggregateSpec{.reductions = reductions({"percentile(0.0)", "list"}),
                                        .key_columns = {},
                                        .value_column = 0},
                          functions());
    auto out = drain(agg);
    REQUIRE(out.size() == 1);
    REQUIRE(out[0] == make_tuple({1, make_list({5, 1, 3})}));
}

TEST_CASE("Aggregate over an empty stream emits nothing") {
    AggregateOperator agg(source({}),
                          AggregateSpec{.reductions = reductions({"sum"}),
                                        .key_columns = {},
                                        .value_column = 0},
                          functions());
    REQUIRE(drain(agg).empty());
}

TEST_CASE("Aggregate column out of range is an index error") {
    AggregateOperator agg(source({make_tuple({1, 2})}),
                          AggregateSpec{.reductions = reductions({"sum"}),
                                        .key_columns = {0},
                                        .value_column = 5},
                          functions());
    auto result = agg.next();
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == ErrorKind::Index);
}

// ─── Distinct ─────────────────────────────────────────────────────────────────

TEST_CASE("Distinct output is the input set") {
    std::vector<Value> rows = {make_tuple({1, "a"}), make_tuple({2, "b"}), make_tuple({1, "a"}),
                               make_tuple({1.0, "a"}), make_tuple({3, "c"}), make_tuple({2, "b"})};
    DistinctOperator distinct(source(rows));
    auto out = drain(distinct);
    REQUIRE(out.size() == 3);
    for (const auto& row : out) {
        REQUIRE(std::count(out.begin(), out.end(), row) == 1);
    }
    for (const auto& row : rows) {
        REQUIRE(std::find(out.begin(), out.end(), row) != out.end());
    }
}

// ─── OrderBy / Limit ──────────────────────────────────────────────────────────

TEST_CASE("OrderBy sorts on the selected columns") {
    std::vector<Value> rows = {make_tuple({3}), make_tuple({1}), make_tuple({2})};

    SECTION("ascending") {
        OrderByOperator order(source(rows), OrderBySpec{.columns = {0}, .reverse = false});
        auto out = drain(order);
        REQUIRE(out == std::vector<Value>{make_tuple({1}), make_tuple({2}), make_tuple({3})});
    }
    SECTION("reverse") {
        OrderByOperator order(source(rows), OrderBySpec{.columns = {0}, .reverse = true});
        auto out = drain(order);
        REQUIRE(out == std::vector<Value>{make_tuple({3}), make_tuple({2}), make_tuple({1})});
    }
}

TEST_CASE("OrderBy is stable") {
    std::vector<Value> rows = {make_tuple({1, "first"}), make_tuple({0, "x"}),
                               make_tuple({1, "second"}), make_tuple({1, "third"})};
    OrderByOperator order(source(rows), OrderBySpec{.columns = {0}, .reverse = true});
    auto out = drain(order);
    REQUIRE(out[0] == make_tuple({1, "first"}));
    REQUIRE(out[1] == make_tuple({1, "second"}));
    REQUIRE(out[2] == make_tuple({1, "third"}));
    REQUIRE(out[3] == make_tuple({0, "x"}));
}

TEST_CASE("OrderBy on several columns") {
    std::vector<Value> rows = {make_tuple({"b", 2, "p"}), make_tuple({"a", 9, "q"}),
                               make_tuple({"b", 1, "r"})};
    OrderByOperator order(source(rows), OrderBySpec{.columns = {0, 1}, .reverse = false});
    auto out = drain(order);
    REQUIRE(out[0] == make_tuple({"a", 9, "q"}));
    REQUIRE(out[1] == make_tuple({"b", 1, "r"}));
    REQUIRE(out[2] == make_tuple({"b", 2, "p"}));
}

TEST_CASE("OrderBy rejects incomparable keys") {
    OrderByOperator order(source({make_tuple({1}), make_tuple({"a"})}),
                          OrderBySpec{.columns = {0}, .reverse = false});
    auto result = order.next();
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == ErrorKind::Evaluation);
}

TEST_CASE("Limit keeps the first items and stops pulling") {
    std::size_t pulls = 0;
    std::vector<Value> rows = {1, 2, 3, 4, 5};
    LimitOperator limit(std::make_unique<CountingSource>(rows, pulls), 2);
    auto out = drain(limit);
    REQUIRE(out == std::vector<Value>{1, 2});
    REQUIRE(pulls == 2);
}

TEST_CASE("Limit larger than the input passes everything") {
    LimitOperator limit(source({1, 2, 3}), 10);
    REQUIRE(drain(limit).size() == 3);
}
