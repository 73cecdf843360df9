#pragma once
/*
===============================================================================
DATA STORE - String-keyed typed values for settings and run metadata
===============================================================================

OVERVIEW
--------
A DataStore is an unordered map from string keys to type-erased Values. The
planning core uses it in two places:

• ModelBuilder::store() records the solver parameters applied to a model
  ("param:TimeLimit", "param:Threads", ...).
• PlanningConfig::fromStore() reads caller settings given as key/value pairs
  ("mix.strategy" = "exact", "schedule.time_limit" = 10.0, ...), which is the
  shape in which the outer API layer hands configuration over.

ACCESS PATTERNS
---------------
    DataStore s;
    s["mix.strategy"] = std::string("exact");
    s["mix.time_limit"] = 5.0;

    double limit = s["mix.time_limit"].get_or(30.0);          // 5.0
    int threads  = s["threads"].get_or(1);                    // 1 (absent)
    if (auto v = s["mix.strategy"].try_get<std::string>()) { ... }

THREAD SAFETY
-------------
• Not synchronized. A store belongs to one builder or one config parse.

EXCEPTION SAFETY
----------------
• get<T>() throws std::bad_any_cast on type mismatch
• get_or<T>() and try_get<T>() never throw on mismatch

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

namespace linemind {

    /**
     * @class Value
     * @brief std::any wrapper with typed accessors
     */
    class Value {
        std::any storage_;

    public:
        Value() = default;

        template<typename T>
            requires (!std::is_same_v<std::remove_cvref_t<T>, Value>)
        Value(T&& v)
            : storage_(std::forward<T>(v))
        {
        }

        template<typename T>
            requires (!std::is_same_v<std::remove_cvref_t<T>, Value>)
        Value& operator=(T&& v)
        {
            storage_ = std::forward<T>(v);
            return *this;
        }

        [[nodiscard]] bool has_value() const noexcept { return storage_.has_value(); }

        [[nodiscard]] const std::type_info& type() const noexcept { return storage_.type(); }

        /// @brief Exact type match (no conversions)
        template<typename T>
        [[nodiscard]] bool is() const noexcept { return storage_.type() == typeid(T); }

        template<typename T>
        std::optional<std::reference_wrapper<const T>> try_get() const noexcept
        {
            if (!is<T>())
                return std::nullopt;
            return std::cref(*std::any_cast<T>(&storage_));
        }

        /// @throws std::bad_any_cast if the stored type is not T
        template<typename T>
        T& get() { return std::any_cast<T&>(storage_); }

        /// @throws std::bad_any_cast if the stored type is not T
        template<typename T>
        const T& get() const { return std::any_cast<const T&>(storage_); }

        /// @brief Stored value if it is a T, otherwise fallback
        template<typename T>
        T get_or(const T& fallback) const
        {
            if (is<T>())
                return get<T>();
            return fallback;
        }

        /// @brief Numeric read that accepts int or double storage
        [[nodiscard]] std::optional<double> as_number() const noexcept
        {
            if (is<double>())
                return *std::any_cast<double>(&storage_);
            if (is<int>())
                return static_cast<double>(*std::any_cast<int>(&storage_));
            return std::nullopt;
        }

        void reset() noexcept { storage_.reset(); }
    };

    using DataStore = std::unordered_map<std::string, Value>;

    /// @brief Read-only lookup that does not insert missing keys
    inline const Value* find_value(const DataStore& store, const std::string& key)
    {
        auto it = store.find(key);
        return it == store.end() ? nullptr : &it->second;
    }

} // namespace linemind
