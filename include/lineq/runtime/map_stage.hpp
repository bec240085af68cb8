#pragma once

#include <lineq/runtime/builtins.hpp>
#include <lineq/runtime/evaluator.hpp>
#include <lineq/runtime/operator.hpp>
#include <lineq/runtime/reader.hpp>

#include <cstddef>
#include <deque>
#include <istream>
#include <string>

namespace lineq::runtime {

struct MapOptions {
    /// Ignore the first line of the input.
    bool skip_header = false;
    /// Fields merged under every JSON record.
    Object defaults;
    /// Input name used in error messages.
    std::string source_name = "<stdin>";
};

/// Evaluates a compiled query against every line of one input stream.
///
/// A list result is flattened into zero or more output records; any other
/// result is a single record. Output order follows input order. Blank lines
/// are skipped without reaching the reader.
class MapOperator final : public Operator {
   public:
    MapOperator(std::istream& input, CompiledQuery query, const FunctionRegistry& functions,
                MapOptions options = {});

    [[nodiscard]] auto next() -> NextResult override;

    [[nodiscard]] auto reader_mode() const noexcept -> ReaderMode { return reader_.mode(); }

   private:
    std::istream& input_;
    CompiledQuery query_;
    const FunctionRegistry& functions_;
    MapOptions options_;
    RecordReader reader_;
    std::deque<Value> pending_;
    std::size_t line_number_ = 0;
};

}  // namespace lineq::runtime
