#pragma once

#include "core/types.hpp"
#include "transaction/transaction_handle.hpp"

#include <any>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>

namespace rowmap {

// A dispatchable call that runs against a session's handle
using Handler = std::function<std::any(ITransactionHandle&)>;

/**
 * @brief Wraps calls so they run inside a transaction at a declared level
 *
 * On invocation:
 * - no open transaction: begin one at the declared level (engine default
 *   when UNSPECIFIED), run the call, commit on return, roll back on throw
 * - open transaction and the declared level is UNSPECIFIED or equal to the
 *   current one: run the call directly inside the outer transaction
 * - open transaction at another level: TransactionIsolationConflictError,
 *   before the call runs
 *
 * Holds no state of its own; the transaction frame lives on the handle.
 */
class TransactionDecorator {
public:
    explicit TransactionDecorator(IsolationLevel declared = IsolationLevel::UNSPECIFIED)
        : declared_(declared) {}

    [[nodiscard]] IsolationLevel declared_level() const { return declared_; }

    // Decorated version of the handler
    [[nodiscard]] Handler decorate(Handler handler) const;

    std::any invoke(ITransactionHandle& handle, const Handler& handler) const;

    [[nodiscard]] static Handler decorate(IsolationLevel declared, Handler handler) {
        return TransactionDecorator(declared).decorate(std::move(handler));
    }

private:
    IsolationLevel declared_;
};

/**
 * @brief Run fn(handle) under TransactionDecorator semantics
 *
 * Returns whatever fn returns; fn may return void. Non-void results must be
 * copy constructible.
 */
template<typename Fn>
auto in_transaction(ITransactionHandle& handle, IsolationLevel level, Fn&& fn)
    -> std::invoke_result_t<Fn&, ITransactionHandle&> {
    using R = std::invoke_result_t<Fn&, ITransactionHandle&>;
    const TransactionDecorator decorator(level);

    if constexpr (std::is_void_v<R>) {
        decorator.invoke(handle, [&fn](ITransactionHandle& h) -> std::any {
            fn(h);
            return {};
        });
    } else {
        std::any result = decorator.invoke(handle, [&fn](ITransactionHandle& h) -> std::any {
            return std::any(fn(h));
        });
        return std::any_cast<R>(std::move(result));
    }
}

/**
 * @brief Named call sites with their declared isolation
 *
 * Decoration happens once, when a method is defined; invoke() only looks
 * up and runs the prepared handler.
 */
class HandlerTable {
public:
    /**
     * @brief Define a method that runs without transaction handling
     * @throws std::invalid_argument if the name is already defined
     */
    void define(const std::string& name, Handler handler);

    /**
     * @brief Define a method that runs through a TransactionDecorator
     * @throws std::invalid_argument if the name is already defined
     */
    void define_transactional(const std::string& name, IsolationLevel level, Handler handler);

    /**
     * @throws std::invalid_argument for unknown methods
     */
    std::any invoke(const std::string& name, ITransactionHandle& handle) const;

    [[nodiscard]] bool contains(const std::string& name) const;

    // Declared level, or nullopt for non-transactional/unknown methods
    [[nodiscard]] std::optional<IsolationLevel> declared_isolation(const std::string& name) const;

    [[nodiscard]] size_t size() const { return methods_.size(); }

private:
    struct Method {
        std::optional<IsolationLevel> isolation;
        Handler handler;
    };

    void add(const std::string& name, Method method);

    std::unordered_map<std::string, Method> methods_;
};

} // namespace rowmap
