#pragma once

#include <lineq/core/error.hpp>
#include <lineq/core/value.hpp>

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lineq::runtime {

/// Type-erased built-in function.
///
/// Queries may only call functions registered by name; there is no way to
/// reach anything else from an expression.
using FunctionArgs = std::vector<Value>;
using Function = std::function<Result<Value>(const FunctionArgs&)>;

class FunctionRegistry {
   public:
    FunctionRegistry() = default;

    /// Register (or replace) a function.
    void register_function(std::string name, Function func) {
        registry_.insert_or_assign(std::move(name), std::move(func));
    }

    /// Look up a registered function by name.
    [[nodiscard]] auto find(const std::string& name) const -> const Function* {
        if (auto it = registry_.find(name); it != registry_.end()) {
            return &it->second;
        }
        return nullptr;
    }

    /// Check whether a function is registered.
    [[nodiscard]] auto contains(const std::string& name) const -> bool {
        return registry_.contains(name);
    }

    /// Number of registered functions.
    [[nodiscard]] auto size() const noexcept -> std::size_t { return registry_.size(); }

   private:
    std::unordered_map<std::string, Function> registry_;
};

/// Register the built-in allow-list: len, count, sum, min, max, avg, mean,
/// percentile, abs, round, int, float, str, bool, tuple, list, sorted,
/// lower, upper.
void register_builtins(FunctionRegistry& registry);

/// A registry holding exactly the built-ins.
[[nodiscard]] auto builtin_registry() -> FunctionRegistry;

/// Element at position floor(p * N) of the sorted values, found by
/// order-statistic selection over a private copy. `p` must lie in [0, 1).
[[nodiscard]] auto percentile(const std::vector<Value>& values, double p) -> Result<Value>;

/// Arithmetic mean as a float; 0.0 for an empty sequence.
[[nodiscard]] auto mean(const std::vector<Value>& values) -> Result<Value>;

}  // namespace lineq::runtime
