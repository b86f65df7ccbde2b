#include <catch2/catch_test_macros.hpp>
#include "core/error.hpp"
#include "mocks/mock_connection.hpp"
#include "transaction/transaction_decorator.hpp"

#include <stdexcept>

using namespace rowmap;
using rowmap::testing::MockConnection;

namespace {

size_t count_of(const std::vector<std::string>& statements, const std::string& prefix) {
    size_t n = 0;
    for (const auto& s : statements) {
        if (s.rfind(prefix, 0) == 0) ++n;
    }
    return n;
}

} // anonymous namespace

TEST_CASE("TransactionDecorator", "[transaction_decorator]") {
    auto conn = std::make_shared<MockConnection>();
    Handle handle(conn);

    SECTION("Outermost call opens and commits a transaction") {
        auto result = in_transaction(handle, IsolationLevel::SERIALIZABLE,
            [](ITransactionHandle& h) {
                REQUIRE(h.current_isolation_level() == IsolationLevel::SERIALIZABLE);
                return std::string("done");
            });
        REQUIRE(result == "done");
        REQUIRE(conn->statements() ==
                std::vector<std::string>{"BEGIN ISOLATION LEVEL SERIALIZABLE", "COMMIT"});
    }

    SECTION("Unspecified level uses the engine default") {
        in_transaction(handle, IsolationLevel::UNSPECIFIED, [](ITransactionHandle& h) {
            REQUIRE(h.current_isolation_level() == IsolationLevel::READ_COMMITTED);
        });
        REQUIRE(conn->statements().front() == "BEGIN");
    }

    SECTION("Same level joins the outer transaction") {
        in_transaction(handle, IsolationLevel::REPEATABLE_READ, [](ITransactionHandle& outer) {
            const int inner = in_transaction(outer, IsolationLevel::REPEATABLE_READ,
                [](ITransactionHandle& h) {
                    REQUIRE(h.is_in_transaction());
                    return 7;
                });
            REQUIRE(inner == 7);
        });
        REQUIRE(count_of(conn->statements(), "BEGIN") == 1);
        REQUIRE(count_of(conn->statements(), "COMMIT") == 1);
        REQUIRE(handle.get_stats().transactions_started == 1);
    }

    SECTION("Unspecified level joins any transaction") {
        in_transaction(handle, IsolationLevel::SERIALIZABLE, [](ITransactionHandle& outer) {
            in_transaction(outer, IsolationLevel::UNSPECIFIED, [](ITransactionHandle& h) {
                REQUIRE(h.current_isolation_level() == IsolationLevel::SERIALIZABLE);
            });
        });
        REQUIRE(count_of(conn->statements(), "BEGIN") == 1);
    }

    SECTION("Different level conflicts before the call runs") {
        bool inner_ran = false;
        REQUIRE_THROWS_AS(
            in_transaction(handle, IsolationLevel::READ_COMMITTED, [&](ITransactionHandle& outer) {
                in_transaction(outer, IsolationLevel::SERIALIZABLE, [&](ITransactionHandle&) {
                    inner_ran = true;
                });
            }),
            TransactionIsolationConflictError);
        REQUIRE_FALSE(inner_ran);
        REQUIRE(conn->statements().back() == "ROLLBACK");
    }

    SECTION("Conflict names both levels") {
        handle.begin(IsolationLevel::READ_COMMITTED);
        try {
            in_transaction(handle, IsolationLevel::SERIALIZABLE, [](ITransactionHandle&) {});
            FAIL("expected TransactionIsolationConflictError");
        } catch (const TransactionIsolationConflictError& e) {
            REQUIRE(e.requested() == IsolationLevel::SERIALIZABLE);
            REQUIRE(e.current() == IsolationLevel::READ_COMMITTED);
            const std::string message = e.what();
            REQUIRE(message.find("SERIALIZABLE") != std::string::npos);
            REQUIRE(message.find("READ_COMMITTED") != std::string::npos);
        }
        REQUIRE(handle.is_in_transaction());
    }

    SECTION("Outer failure rolls back") {
        REQUIRE_THROWS_AS(
            in_transaction(handle, IsolationLevel::UNSPECIFIED, [](ITransactionHandle&) {
                throw std::runtime_error("boom");
            }),
            std::runtime_error);
        REQUIRE(conn->statements() == std::vector<std::string>{"BEGIN", "ROLLBACK"});
        REQUIRE_FALSE(handle.is_in_transaction());
    }

    SECTION("Inner failure propagates; the outer call decides the outcome") {
        in_transaction(handle, IsolationLevel::UNSPECIFIED, [](ITransactionHandle& outer) {
            try {
                in_transaction(outer, IsolationLevel::UNSPECIFIED, [](ITransactionHandle&) {
                    throw std::runtime_error("inner");
                });
            } catch (const std::runtime_error&) {
                // handled by the outer call
            }
        });
        REQUIRE(conn->statements() == std::vector<std::string>{"BEGIN", "COMMIT"});
    }

    SECTION("decorate wraps a handler once") {
        int calls = 0;
        Handler decorated = TransactionDecorator::decorate(IsolationLevel::SERIALIZABLE,
            [&calls](ITransactionHandle&) -> std::any {
                ++calls;
                return {};
            });
        decorated(handle);
        decorated(handle);
        REQUIRE(calls == 2);
        REQUIRE(handle.get_stats().transactions_committed == 2);
    }
}

TEST_CASE("HandlerTable", "[transaction_decorator]") {
    auto conn = std::make_shared<MockConnection>();
    Handle handle(conn);
    HandlerTable table;

    table.define("ping", [](ITransactionHandle& h) -> std::any {
        return h.is_in_transaction();
    });
    table.define_transactional("transfer", IsolationLevel::SERIALIZABLE,
        [](ITransactionHandle& h) -> std::any {
            return h.current_isolation_level();
        });
    table.define_transactional("audit", IsolationLevel::UNSPECIFIED,
        [](ITransactionHandle& h) -> std::any {
            return h.is_in_transaction();
        });

    SECTION("Declared isolation is recorded") {
        REQUIRE(table.size() == 3);
        REQUIRE_FALSE(table.declared_isolation("ping").has_value());
        REQUIRE(table.declared_isolation("transfer") == IsolationLevel::SERIALIZABLE);
        REQUIRE(table.declared_isolation("audit") == IsolationLevel::UNSPECIFIED);
        REQUIRE_FALSE(table.declared_isolation("missing").has_value());
    }

    SECTION("Plain methods run without a transaction") {
        REQUIRE_FALSE(std::any_cast<bool>(table.invoke("ping", handle)));
        REQUIRE(conn->statements().empty());
    }

    SECTION("Transactional methods run inside one") {
        auto level = std::any_cast<IsolationLevel>(table.invoke("transfer", handle));
        REQUIRE(level == IsolationLevel::SERIALIZABLE);
        REQUIRE(std::any_cast<bool>(table.invoke("audit", handle)));
        REQUIRE(handle.get_stats().transactions_committed == 2);
    }

    SECTION("Nested dispatch follows the declared levels") {
        handle.begin(IsolationLevel::SERIALIZABLE);
        REQUIRE(std::any_cast<IsolationLevel>(table.invoke("transfer", handle)) ==
                IsolationLevel::SERIALIZABLE);
        REQUIRE(std::any_cast<bool>(table.invoke("audit", handle)));
        handle.commit();

        handle.begin(IsolationLevel::READ_COMMITTED);
        REQUIRE_THROWS_AS(table.invoke("transfer", handle), TransactionIsolationConflictError);
        handle.rollback();
    }

    SECTION("Unknown and duplicate methods") {
        REQUIRE_THROWS_AS(table.invoke("missing", handle), std::invalid_argument);
        REQUIRE_THROWS_AS(table.define("ping", [](ITransactionHandle&) -> std::any { return {}; }),
                          std::invalid_argument);
    }
}
