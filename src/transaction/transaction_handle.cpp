#include "transaction/transaction_handle.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

namespace rowmap {

// ============================================================================
// Construction
// ============================================================================

Handle::Handle(std::shared_ptr<IDbConnection> connection)
    : Handle(std::move(connection), Config{}) {}

Handle::Handle(std::shared_ptr<IDbConnection> connection, Config config)
    : connection_(std::move(connection)), config_(config) {
    if (!connection_) {
        throw TransactionError("Handle requires a connection");
    }
}

Handle::~Handle() {
    if (state_ != TxnState::ACTIVE) return;
    try {
        rollback();
    } catch (const TransactionError& e) {
        utils::log::error(std::string("Rollback of abandoned transaction failed: ") + e.what());
    }
}

// ============================================================================
// State Validation
// ============================================================================

bool Handle::is_valid_transition(TxnState from, TxnState to) {
    switch (from) {
        case TxnState::IDLE:
        case TxnState::COMMITTED:
        case TxnState::ROLLED_BACK:
            return to == TxnState::ACTIVE;
        case TxnState::ACTIVE:
            return to == TxnState::COMMITTED || to == TxnState::ROLLED_BACK;
        default:
            return false;
    }
}

void Handle::transition(TxnState to) {
    if (!is_valid_transition(state_, to)) {
        throw TransactionError(std::string("Invalid transaction state transition ") +
                               txn_state_to_string(state_) + " -> " + txn_state_to_string(to));
    }
    state_ = to;
}

// ============================================================================
// Isolation
// ============================================================================

IsolationLevel Handle::current_isolation_level() const {
    return state_ == TxnState::ACTIVE ? active_level_ : IsolationLevel::UNSPECIFIED;
}

IsolationLevel Handle::effective_default_isolation() const {
    if (config_.default_isolation != IsolationLevel::UNSPECIFIED) {
        return config_.default_isolation;
    }
    return default_isolation_for(config_.dialect);
}

std::vector<std::string> Handle::begin_statements(IsolationLevel level) const {
    if (level == IsolationLevel::UNSPECIFIED) {
        level = config_.default_isolation;
    }

    const bool mysql = config_.dialect == DatabaseType::MYSQL;
    if (level == IsolationLevel::UNSPECIFIED) {
        return {mysql ? "START TRANSACTION" : "BEGIN"};
    }

    const std::string sql_level = isolation_level_to_sql(level);
    if (mysql) {
        return {"SET TRANSACTION ISOLATION LEVEL " + sql_level, "START TRANSACTION"};
    }
    return {"BEGIN ISOLATION LEVEL " + sql_level};
}

// ============================================================================
// Lifecycle
// ============================================================================

void Handle::run_control(const std::string& sql) {
    const auto result = connection_->execute(sql);
    if (!result.success) {
        throw TransactionError("'" + sql + "' failed: " + result.error_message);
    }
}

void Handle::begin(IsolationLevel level) {
    if (state_ == TxnState::ACTIVE) {
        throw TransactionError(std::string("Transaction already active at ") +
                               isolation_level_to_string(active_level_));
    }

    for (const auto& sql : begin_statements(level)) {
        run_control(sql);
    }

    transition(TxnState::ACTIVE);
    active_level_ = level == IsolationLevel::UNSPECIFIED ? effective_default_isolation() : level;
    started_.fetch_add(1, std::memory_order_relaxed);

    utils::log::debug(std::string("Transaction begun at ") +
                      isolation_level_to_string(active_level_));
}

void Handle::commit() {
    if (state_ != TxnState::ACTIVE) {
        throw TransactionError(std::string("Cannot commit in state ") +
                               txn_state_to_string(state_));
    }
    run_control("COMMIT");
    transition(TxnState::COMMITTED);
    active_level_ = IsolationLevel::UNSPECIFIED;
    committed_.fetch_add(1, std::memory_order_relaxed);
    utils::log::debug("Transaction committed");
}

void Handle::rollback() {
    if (state_ != TxnState::ACTIVE) {
        throw TransactionError(std::string("Cannot roll back in state ") +
                               txn_state_to_string(state_));
    }
    // The frame is closed even if the server refuses; the session is unusable otherwise
    transition(TxnState::ROLLED_BACK);
    active_level_ = IsolationLevel::UNSPECIFIED;
    rolled_back_.fetch_add(1, std::memory_order_relaxed);
    run_control("ROLLBACK");
    utils::log::debug("Transaction rolled back");
}

std::any Handle::run_in_transaction(IsolationLevel level, const TransactionCallback& callback) {
    begin(level);

    std::any result;
    try {
        result = callback(*this);
    } catch (...) {
        if (state_ == TxnState::ACTIVE) {
            try {
                rollback();
            } catch (const TransactionError& rollback_error) {
                utils::log::error(std::string("Rollback after failure failed: ") +
                                  rollback_error.what());
            }
        }
        throw;
    }

    if (state_ == TxnState::ACTIVE) {
        try {
            commit();
        } catch (const TransactionError&) {
            if (state_ == TxnState::ACTIVE) {
                try {
                    rollback();
                } catch (const TransactionError& rollback_error) {
                    utils::log::error(std::string("Rollback after failed commit failed: ") +
                                      rollback_error.what());
                }
            }
            throw;
        }
    }
    return result;
}

ResultSet Handle::execute(const std::string& sql) {
    auto result = connection_->execute(sql);
    if (!result.success) {
        throw TransactionError("Statement failed: " + result.error_message);
    }
    return result;
}

// ============================================================================
// Stats
// ============================================================================

Handle::Stats Handle::get_stats() const {
    return {
        started_.load(std::memory_order_relaxed),
        committed_.load(std::memory_order_relaxed),
        rolled_back_.load(std::memory_order_relaxed)
    };
}

} // namespace rowmap
