#include "transaction/transaction_decorator.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <stdexcept>

namespace rowmap {

// ============================================================================
// TransactionDecorator
// ============================================================================

Handler TransactionDecorator::decorate(Handler handler) const {
    return [declared = declared_, handler = std::move(handler)](ITransactionHandle& handle) {
        return TransactionDecorator(declared).invoke(handle, handler);
    };
}

std::any TransactionDecorator::invoke(ITransactionHandle& handle, const Handler& handler) const {
    if (handle.is_in_transaction()) {
        const IsolationLevel current = handle.current_isolation_level();
        if (declared_ != IsolationLevel::UNSPECIFIED && declared_ != current) {
            throw TransactionIsolationConflictError(declared_, current);
        }
        utils::log::debug(std::string("Joining outer transaction at ") +
                          isolation_level_to_string(current));
        return handler(handle);
    }

    return handle.run_in_transaction(declared_, handler);
}

// ============================================================================
// HandlerTable
// ============================================================================

void HandlerTable::add(const std::string& name, Method method) {
    if (!method.handler) {
        throw std::invalid_argument("Handler for '" + name + "' is empty");
    }
    const auto [it, inserted] = methods_.try_emplace(name, std::move(method));
    if (!inserted) {
        throw std::invalid_argument("Handler '" + name + "' is already defined");
    }
}

void HandlerTable::define(const std::string& name, Handler handler) {
    add(name, Method{std::nullopt, std::move(handler)});
}

void HandlerTable::define_transactional(const std::string& name, IsolationLevel level,
                                        Handler handler) {
    if (!handler) {
        throw std::invalid_argument("Handler for '" + name + "' is empty");
    }
    add(name, Method{level, TransactionDecorator::decorate(level, std::move(handler))});
}

std::any HandlerTable::invoke(const std::string& name, ITransactionHandle& handle) const {
    const auto it = methods_.find(name);
    if (it == methods_.end()) {
        throw std::invalid_argument("No handler defined for '" + name + "'");
    }
    return it->second.handler(handle);
}

bool HandlerTable::contains(const std::string& name) const {
    return methods_.contains(name);
}

std::optional<IsolationLevel> HandlerTable::declared_isolation(const std::string& name) const {
    const auto it = methods_.find(name);
    if (it == methods_.end()) return std::nullopt;
    return it->second.isolation;
}

} // namespace rowmap
