#include "db/oracle/oracle_connection.hpp"
#include "db/oracle/placeholder.hpp"
#include "db/oracle/result_assembler.hpp"
#include "db/oracle/statement_binder.hpp"
#include "core/utils.hpp"

#include <format>

namespace orabridge {

namespace {

template<typename T>
std::future<Result<T>> ready(Result<T> result) {
    std::promise<Result<T>> promise;
    promise.set_value(std::move(result));
    return promise.get_future();
}

template<typename T>
std::future<Result<T>> dispatch(const std::shared_ptr<BlockingWorkerPool>& pool,
                                std::function<Result<T>()> task) {
    if (!pool) {
        return ready(Result<T>::error(ErrorCategory::CONCURRENCY_ERROR, "no blocking worker pool"));
    }
    return pool->submit<T>(std::move(task));
}

/// Re-tag a native failure with the category of the operation that raised it
template<typename T>
Result<T> native_error(const Result<T>& result, ErrorCategory category) {
    return Result<T>::error(category, result.error_message());
}

} // anonymous namespace

OracleConnection::OracleConnection(std::shared_ptr<INativeConnection> native,
                                   std::shared_ptr<BlockingWorkerPool> pool)
    : native_(std::move(native)),
      tx_(std::make_shared<TransactionState>()),
      pool_(std::move(pool)) {}

// ============================================================================
// Establish
// ============================================================================

std::future<Result<OracleConnection>> OracleConnection::establish(
    const ConnectOptions& options,
    std::shared_ptr<INativeConnector> connector,
    std::shared_ptr<BlockingWorkerPool> pool) {

    if (!connector) {
        return ready(Result<OracleConnection>::error(ErrorCategory::CONNECTION_ERROR, "no native connector"));
    }

    // The unit must not own the pool it runs on
    return dispatch<OracleConnection>(pool,
        [opt = options, connector, weak_pool = std::weak_ptr<BlockingWorkerPool>(pool)]()
            -> Result<OracleConnection> {
            auto native = connector->connect(opt);
            if (native.is_error()) {
                utils::log::error(std::format("Oracle connect to '{}' as '{}' failed: {}",
                    opt.connect_string, opt.username, native.error_message()));
                return Result<OracleConnection>::error(
                    ErrorCategory::CONNECTION_ERROR, native.error_message());
            }
            auto live_pool = weak_pool.lock();
            if (!live_pool) {
                utils::log::warn("Worker pool released during connect, dropping the session");
                if (auto closed = native.value()->close(); closed.is_error()) {
                    utils::log::warn(std::format("Close of orphaned session failed: {}",
                        closed.error_message()));
                }
                return Result<OracleConnection>::error(
                    ErrorCategory::CONCURRENCY_ERROR, "blocking worker pool released");
            }
            utils::log::info(std::format("Connected to Oracle at '{}' as '{}'",
                opt.connect_string, opt.username));
            return Result<OracleConnection>::ok(OracleConnection(std::move(native.value()), std::move(live_pool)));
        });
}

// ============================================================================
// Query / Exec
// ============================================================================

std::future<Result<std::vector<ResultRow>>> OracleConnection::query(
    const std::string& sql, std::vector<DynamicValue> params) {

    return dispatch<std::vector<ResultRow>>(pool_,
        [native = native_, sql = translate_placeholders(sql), params = std::move(params)]() {
            return execute_query(*native, sql, params);
        });
}

std::future<Result<ExecResult>> OracleConnection::exec(
    const std::string& sql, std::vector<DynamicValue> params) {

    if (sql == sql_keys::BEGIN) {
        tx_->set(TxState::IN_TRANSACTION);
        utils::log::debug("Transaction begin");
        return ready(Result<ExecResult>::ok(ExecResult{}));
    }
    if (sql == sql_keys::COMMIT) {
        return end_transaction(true);
    }
    if (sql == sql_keys::ROLLBACK) {
        return end_transaction(false);
    }

    return dispatch<ExecResult>(pool_,
        [native = native_, tx = tx_, sql = translate_placeholders(sql), params = std::move(params)]() {
            return execute_statement(*native, *tx, sql, params);
        });
}

std::future<Result<ExecResult>> OracleConnection::end_transaction(bool commit) {
    return dispatch<ExecResult>(pool_, [native = native_, tx = tx_, commit]() -> Result<ExecResult> {
        auto st = commit ? native->commit() : native->rollback();
        if (st.is_error()) {
            return Result<ExecResult>::error(ErrorCategory::STATEMENT_ERROR, st.error_message());
        }
        // Flag only clears once the native call succeeded
        tx->set(TxState::AUTOCOMMIT);
        utils::log::debug(commit ? "Transaction commit" : "Transaction rollback");
        return Result<ExecResult>::ok(ExecResult{});
    });
}

Result<std::vector<ResultRow>> OracleConnection::execute_query(
    INativeConnection& native, const std::string& sql, const std::vector<DynamicValue>& params) {

    using R = Result<std::vector<ResultRow>>;

    auto stmt = native.prepare(sql);
    if (stmt.is_error()) {
        return native_error(R::from_error(stmt), ErrorCategory::STATEMENT_ERROR);
    }

    auto bound = StatementBinder::bind_all(params, *stmt.value());
    if (bound.is_error()) {
        return R::from_error(bound);
    }

    auto cursor = stmt.value()->query();
    if (cursor.is_error()) {
        return native_error(R::from_error(cursor), ErrorCategory::STATEMENT_ERROR);
    }

    auto rows = ResultAssembler::assemble(*cursor.value());
    if (rows.is_error()) {
        return native_error(rows, ErrorCategory::STATEMENT_ERROR);
    }
    return rows;
}

Result<ExecResult> OracleConnection::execute_statement(
    INativeConnection& native, TransactionState& tx,
    const std::string& sql, const std::vector<DynamicValue>& params) {

    using R = Result<ExecResult>;
    const utils::Timer timer;

    auto stmt = native.prepare(sql);
    if (stmt.is_error()) {
        return R::error(ErrorCategory::STATEMENT_ERROR, stmt.error_message());
    }

    auto bound = StatementBinder::bind_all(params, *stmt.value());
    if (bound.is_error()) {
        return R::from_error(bound);
    }

    auto executed = stmt.value()->execute();
    if (executed.is_error()) {
        return R::error(ErrorCategory::STATEMENT_ERROR, executed.error_message());
    }

    // Flag is read under its own lock, released before the commit call
    if (tx.get() == TxState::AUTOCOMMIT) {
        auto committed = native.commit();
        if (committed.is_error()) {
            return R::error(ErrorCategory::STATEMENT_ERROR, committed.error_message());
        }
    }

    auto count = stmt.value()->row_count();
    if (count.is_error()) {
        return R::error(ErrorCategory::STATEMENT_ERROR, count.error_message());
    }

    utils::log::debug(std::format("exec: {} row(s) in {}us", count.value(), timer.elapsed_us().count()));

    ExecResult result;
    result.rows_affected = count.value();
    return R::ok(std::move(result));
}

// ============================================================================
// Ping / Close
// ============================================================================

std::future<Status> OracleConnection::ping() {
    return dispatch<void>(pool_, [native = native_]() -> Status {
        auto st = native->ping();
        if (st.is_error()) {
            return Status::error(ErrorCategory::CONNECTION_ERROR, st.error_message());
        }
        return Status::ok();
    });
}

std::future<Status> OracleConnection::close() {
    return dispatch<void>(pool_, [native = native_, tx = tx_]() -> Status {
        // Never leak an open transaction on disposal
        auto committed = native->commit();
        if (committed.is_error()) {
            utils::log::warn(std::format("Commit before close failed (ignored): {}",
                committed.error_message()));
        }

        auto closed = native->close();
        if (closed.is_error()) {
            return Status::error(ErrorCategory::CONNECTION_ERROR, closed.error_message());
        }
        tx->set(TxState::AUTOCOMMIT);
        utils::log::info("Oracle connection closed");
        return Status::ok();
    });
}

} // namespace orabridge
