#pragma once

#include <lineq/core/error.hpp>
#include <lineq/core/value.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace lineq::runtime {

/// nullopt signals the end of the stream.
using NextResult = Result<std::optional<Value>>;

/// A pull-based stage of the record pipeline.
///
/// Downstream stages call next() until it yields nullopt or an error. An
/// error is terminal: callers must not pull again afterwards.
class Operator {
   public:
    virtual ~Operator() = default;

    [[nodiscard]] virtual auto next() -> NextResult = 0;
};

using OperatorPtr = std::unique_ptr<Operator>;

/// Replays records held in memory.
class VectorSource final : public Operator {
   public:
    explicit VectorSource(std::vector<Value> records) : records_(std::move(records)) {}

    [[nodiscard]] auto next() -> NextResult override {
        if (position_ >= records_.size()) {
            return std::nullopt;
        }
        return std::move(records_[position_++]);
    }

   private:
    std::vector<Value> records_;
    std::size_t position_ = 0;
};

/// Drain `op` into a vector.
[[nodiscard]] auto collect(Operator& op) -> Result<std::vector<Value>>;

}  // namespace lineq::runtime
