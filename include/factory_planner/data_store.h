#pragma once
/*
===============================================================================
DATA STORE — String-keyed record of solver parameters and solve statistics
===============================================================================

OVERVIEW
--------
The Gurobi model builder records what it did in a DataStore so callers and
tests can inspect it after a solve without touching Gurobi attributes:

    "param:TimeLimit"   double   applied time limit
    "param:Threads"     int      applied thread count
    "param:OutputFlag"  int      1 if the solver log was printed
    "param:LogFile"     string   solver log file
    "stat:Status"       string   final status name (OPTIMAL, INFEASIBLE, ...)
    "stat:Runtime"      double   seconds spent in optimize()
    "stat:IterCount"    double   simplex iterations
    "stat:Summary"      string   "12 vars, 20 constrs"

KEY COMPONENTS
--------------
• Value: type-erased wrapper around std::any with checked access
• DataStore: std::unordered_map<std::string, Value>

EXCEPTION SAFETY
----------------
• get<T>(): throws std::bad_any_cast on type mismatch
• get_or<T>(), try_get<T>(): never throw

===============================================================================
*/

#include <any>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <unordered_map>
#include <utility>

namespace planner {

    /**
     * @class Value
     * @brief Type-erased value with safe access methods
     *
     * @example
     *     Value v = 2.5;
     *     double d = v.get<double>();      // 2.5
     *     int i = v.get_or<int>(0);        // 0 (type mismatch)
     */
    class Value
    {
        std::any storage;

    public:
        Value() = default;

        template <typename T>
            requires (!std::is_same_v<std::decay_t<T>, Value>)
        Value(T&& v)
            : storage(std::forward<T>(v))
        {
        }

        template <typename T>
            requires (!std::is_same_v<std::decay_t<T>, Value>)
        Value& operator=(T&& v)
        {
            storage = std::forward<T>(v);
            return *this;
        }

        bool has_value() const noexcept
        {
            return storage.has_value();
        }

        /// @brief Exact type match; false when empty
        template <typename T>
        bool is() const noexcept
        {
            return storage.type() == typeid(T);
        }

        template <typename T>
        std::optional<std::reference_wrapper<const T>> try_get() const noexcept
        {
            if (!is<T>())
                return std::nullopt;

            return std::cref(std::any_cast<const T&>(storage));
        }

        /// @throws std::bad_any_cast if the stored type is not T
        template <typename T>
        const T& get() const
        {
            return std::any_cast<const T&>(storage);
        }

        template <typename T>
        T get_or(const T& default_value) const
        {
            if (is<T>())
                return get<T>();
            return default_value;
        }

        void reset() noexcept
        {
            storage.reset();
        }
    };

    /// @brief String-keyed Value map; not thread-safe
    using DataStore = std::unordered_map<std::string, Value>;

} // namespace planner
