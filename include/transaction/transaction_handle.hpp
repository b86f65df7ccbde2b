#pragma once

#include "core/database_type.hpp"
#include "core/types.hpp"
#include "db/idb_connection.hpp"

#include <any>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace rowmap {

class ITransactionHandle;

// Work run inside a transaction; the returned value is handed back to the caller
using TransactionCallback = std::function<std::any(ITransactionHandle&)>;

/**
 * @brief Transaction primitive of one logical session
 *
 * Not thread-safe: a handle belongs to a single session, and so does the
 * transaction frame it reports.
 */
class ITransactionHandle {
public:
    virtual ~ITransactionHandle() = default;

    [[nodiscard]] virtual bool is_in_transaction() const = 0;

    // Level of the open transaction; UNSPECIFIED when none is open
    [[nodiscard]] virtual IsolationLevel current_isolation_level() const = 0;

    /**
     * @brief Begin a transaction, run the callback, commit or roll back
     *
     * Commits when the callback returns normally. Rolls back and rethrows
     * when it throws.
     *
     * @param level Requested level; UNSPECIFIED uses the engine default
     * @throws TransactionError if a transaction is already open or the
     *         engine refuses BEGIN/COMMIT
     */
    virtual std::any run_in_transaction(IsolationLevel level,
                                        const TransactionCallback& callback) = 0;
};

// Transaction states (explicit state machine)
enum class TxnState : uint8_t {
    IDLE,
    ACTIVE,
    COMMITTED,
    ROLLED_BACK
};

[[nodiscard]] inline const char* txn_state_to_string(TxnState s) {
    switch (s) {
        case TxnState::IDLE:        return "IDLE";
        case TxnState::ACTIVE:      return "ACTIVE";
        case TxnState::COMMITTED:   return "COMMITTED";
        case TxnState::ROLLED_BACK: return "ROLLED_BACK";
        default:                    return "UNKNOWN";
    }
}

/**
 * @brief ITransactionHandle over a single database connection
 *
 * State machine: IDLE → ACTIVE → COMMITTED | ROLLED_BACK → ACTIVE → ...
 *
 * Issues dialect-specific transaction control statements:
 * - PostgreSQL: BEGIN [ISOLATION LEVEL ...], COMMIT, ROLLBACK
 * - MySQL: [SET TRANSACTION ISOLATION LEVEL ...;] START TRANSACTION, COMMIT, ROLLBACK
 */
class Handle : public ITransactionHandle {
public:
    struct Config {
        DatabaseType dialect = DatabaseType::POSTGRESQL;
        // Level used for UNSPECIFIED requests; UNSPECIFIED defers to the server
        IsolationLevel default_isolation = IsolationLevel::UNSPECIFIED;
    };

    explicit Handle(std::shared_ptr<IDbConnection> connection);
    Handle(std::shared_ptr<IDbConnection> connection, Config config);

    // Rolls back a transaction still open at destruction
    ~Handle() override;

    Handle(const Handle&) = delete;
    Handle& operator=(const Handle&) = delete;

    [[nodiscard]] bool is_in_transaction() const override { return state_ == TxnState::ACTIVE; }
    [[nodiscard]] IsolationLevel current_isolation_level() const override;

    std::any run_in_transaction(IsolationLevel level,
                                const TransactionCallback& callback) override;

    // Explicit lifecycle (each throws TransactionError on failure)
    void begin(IsolationLevel level = IsolationLevel::UNSPECIFIED);
    void commit();
    void rollback();

    /**
     * @brief Run a statement on the underlying connection
     * @throws TransactionError if the statement fails
     */
    ResultSet execute(const std::string& sql);

    [[nodiscard]] TxnState state() const { return state_; }
    [[nodiscard]] const Config& config() const { return config_; }

    // Level an UNSPECIFIED request resolves to on this handle
    [[nodiscard]] IsolationLevel effective_default_isolation() const;

    // SQL statements that open a transaction at the given level
    [[nodiscard]] std::vector<std::string> begin_statements(IsolationLevel level) const;

    [[nodiscard]] static bool is_valid_transition(TxnState from, TxnState to);

    struct Stats {
        uint64_t transactions_started = 0;
        uint64_t transactions_committed = 0;
        uint64_t transactions_rolled_back = 0;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    void transition(TxnState to);
    void run_control(const std::string& sql);

    std::shared_ptr<IDbConnection> connection_;
    Config config_;

    TxnState state_ = TxnState::IDLE;
    IsolationLevel active_level_ = IsolationLevel::UNSPECIFIED;

    std::atomic<uint64_t> started_{0};
    std::atomic<uint64_t> committed_{0};
    std::atomic<uint64_t> rolled_back_{0};
};

} // namespace rowmap
