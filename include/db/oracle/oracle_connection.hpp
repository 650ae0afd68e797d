#pragma once

#include "core/dynamic_value.hpp"
#include "core/error.hpp"
#include "db/inative_client.hpp"
#include "db/oracle/connect_options.hpp"
#include "db/oracle/oracle_row.hpp"
#include "executor/blocking_worker_pool.hpp"
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace orabridge {

namespace sql_keys {
    inline constexpr std::string_view BEGIN = "begin";
    inline constexpr std::string_view COMMIT = "commit";
    inline constexpr std::string_view ROLLBACK = "rollback";
}

enum class TxState {
    AUTOCOMMIT,
    IN_TRANSACTION,
};

/**
 * @brief Transaction flag shared by every clone of a connection
 *
 * Every read and write happens under the mutex. The lock never spans a
 * native call, so two autocommit executions racing on one session can both
 * commit (including each other's work).
 */
class TransactionState {
public:
    [[nodiscard]] TxState get() const {
        std::lock_guard lock(mutex_);
        return state_;
    }

    void set(TxState state) {
        std::lock_guard lock(mutex_);
        state_ = state;
    }

private:
    mutable std::mutex mutex_;
    TxState state_ = TxState::AUTOCOMMIT;
};

struct ExecResult {
    uint64_t rows_affected = 0;
    DynamicValue last_insert_id;  // Oracle reports none; always null
};

/**
 * @brief Non-blocking facade over one blocking Oracle session
 *
 * Copies share the native handle, the transaction flag and the worker
 * pool; a copy is a new reference to the same physical session, never a
 * new session. Every operation returns immediately with a future; the
 * native work runs on the BlockingWorkerPool. Use join() to collect.
 *
 * Reserved statement texts (exact, case-sensitive) drive the state machine:
 *   "begin"    -> no native call, flag = IN_TRANSACTION
 *   "commit"   -> native commit,   flag = AUTOCOMMIT
 *   "rollback" -> native rollback, flag = AUTOCOMMIT
 * Any other exec() commits after executing unless the flag is set.
 */
class OracleConnection {
public:
    OracleConnection(std::shared_ptr<INativeConnection> native,
                     std::shared_ptr<BlockingWorkerPool> pool);

    /**
     * @brief Open a session on the worker pool
     * @param options Copied before dispatch
     */
    [[nodiscard]] static std::future<Result<OracleConnection>> establish(
        const ConnectOptions& options,
        std::shared_ptr<INativeConnector> connector,
        std::shared_ptr<BlockingWorkerPool> pool);

    /// Run a query and assemble its rows (never commits)
    [[nodiscard]] std::future<Result<std::vector<ResultRow>>> query(
        const std::string& sql, std::vector<DynamicValue> params = {});

    /// Execute a statement, or drive the transaction state machine
    [[nodiscard]] std::future<Result<ExecResult>> exec(
        const std::string& sql, std::vector<DynamicValue> params = {});

    [[nodiscard]] std::future<Status> ping();

    /**
     * @brief Best-effort commit, then native close
     *
     * Commit failure is logged and ignored; close failure is returned.
     */
    [[nodiscard]] std::future<Status> close();

    [[nodiscard]] TxState transaction_state() const { return tx_->get(); }

private:
    static Result<std::vector<ResultRow>> execute_query(
        INativeConnection& native, const std::string& sql, const std::vector<DynamicValue>& params);

    static Result<ExecResult> execute_statement(
        INativeConnection& native, TransactionState& tx,
        const std::string& sql, const std::vector<DynamicValue>& params);

    std::future<Result<ExecResult>> end_transaction(bool commit);

    std::shared_ptr<INativeConnection> native_;
    std::shared_ptr<TransactionState> tx_;
    std::shared_ptr<BlockingWorkerPool> pool_;
};

} // namespace orabridge
