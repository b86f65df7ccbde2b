#pragma once

#include "core/result_row.hpp"
#include "mapper/value_coercion.hpp"

#include <any>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>

namespace rowmap {

/**
 * @brief Reads one column of a row as a value of a specific C++ type
 *
 * Returns a std::any holding exactly the type the converter is registered
 * for, or an empty std::any for SQL NULL. Throws on values it cannot
 * convert; the materializer attributes the failure to the property.
 */
using Converter = std::function<std::any(const IResultRow& row, size_t column)>;

/**
 * @brief Source of typed column converters
 */
class IConverterRegistry {
public:
    virtual ~IConverterRegistry() = default;

    [[nodiscard]] virtual std::optional<Converter> find_converter(std::type_index type) const = 0;

    // Unique per registry instance for the life of the process; never reused
    [[nodiscard]] uint64_t registry_id() const { return id_; }

protected:
    IConverterRegistry() : id_(next_id()) {}
    IConverterRegistry(const IConverterRegistry&) : id_(next_id()) {}
    IConverterRegistry& operator=(const IConverterRegistry&) { return *this; }

private:
    static uint64_t next_id() {
        static std::atomic<uint64_t> counter{0};
        return counter.fetch_add(1, std::memory_order_relaxed) + 1;
    }

    uint64_t id_;
};

/**
 * @brief Converter used when no typed converter exists
 *
 * Hands the raw SqlValue to the property writer, which coerces it on
 * assignment.
 */
[[nodiscard]] inline Converter passthrough_converter() {
    return [](const IResultRow& row, size_t column) -> std::any {
        return row.value(column);
    };
}

/**
 * @brief Default converter registry
 *
 * Pre-populated with converters for bool, int16/32/64, float, double,
 * std::string, Uuid and std::optional<> of each. Registering a converter
 * for an already-known type replaces it.
 *
 * Thread-safety: lookups take a shared lock; registration is exclusive.
 * Register custom converters before resolving plans; plans capture the
 * converter they were resolved with.
 */
class ConverterRegistry : public IConverterRegistry {
public:
    ConverterRegistry();

    [[nodiscard]] std::optional<Converter> find_converter(std::type_index type) const override;

    void register_converter(std::type_index type, Converter converter);

    /**
     * @brief Register a converter for T from a column-reading function
     * @param fn Callable (const IResultRow&, size_t column) -> T
     */
    template<typename T, typename Fn>
    void register_column_converter(Fn fn) {
        register_converter(std::type_index(typeid(T)),
            [fn = std::move(fn)](const IResultRow& row, size_t column) -> std::any {
                return T(fn(row, column));
            });
    }

    /**
     * @brief Register a converter for T from a non-NULL raw value
     *
     * NULL columns yield an empty result without calling fn. Also registers
     * the matching std::optional<T> converter.
     */
    template<typename T, typename Fn>
    void register_value_converter(Fn fn) {
        register_converter(std::type_index(typeid(T)),
            [fn](const IResultRow& row, size_t column) -> std::any {
                const auto& raw = row.value(column);
                if (is_null(raw)) return {};
                return T(fn(raw));
            });
        register_converter(std::type_index(typeid(std::optional<T>)),
            [fn](const IResultRow& row, size_t column) -> std::any {
                const auto& raw = row.value(column);
                if (is_null(raw)) return std::optional<T>{};
                return std::optional<T>(fn(raw));
            });
    }

    [[nodiscard]] size_t size() const;

private:
    template<typename T>
    void register_builtin() {
        register_value_converter<T>([](const SqlValue& raw) { return coerce_or_throw<T>(raw); });
    }

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::type_index, Converter> converters_;
};

} // namespace rowmap
