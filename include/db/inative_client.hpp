#pragma once

#include "core/dynamic_value.hpp"
#include "core/error.hpp"
#include "db/oracle/connect_options.hpp"
#include "db/oracle/oracle_type.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace orabridge {

/**
 * @brief Column metadata as reported by the native client
 */
struct NativeColumnInfo {
    std::string name;
    OracleType type;
};

/**
 * @brief Forward-only cursor over the rows of an executed query
 *
 * Owned by the caller; must not outlive the INativeStatement that
 * produced it. Column indexes are 0-based.
 */
class INativeCursor {
public:
    virtual ~INativeCursor() = default;

    [[nodiscard]] virtual const std::vector<NativeColumnInfo>& columns() const = 0;

    /**
     * @brief Advance to the next row
     * @return true if a row is positioned, false at end of results
     */
    [[nodiscard]] virtual Result<bool> fetch() = 0;

    [[nodiscard]] virtual Result<bool> is_null(size_t column) const = 0;
    [[nodiscard]] virtual Result<OracleType> value_type(size_t column) const = 0;

    /// Textual rendering of the current value (numbers arrive exact)
    [[nodiscard]] virtual Result<std::string> get_string(size_t column) = 0;

    /// Raw bytes of the current value (RAW / BLOB)
    [[nodiscard]] virtual Result<Bytes> get_bytes(size_t column) = 0;
};

/**
 * @brief Prepared statement with 1-based positional binds
 */
class INativeStatement {
public:
    virtual ~INativeStatement() = default;

    [[nodiscard]] virtual Status bind_null(uint32_t position) = 0;
    [[nodiscard]] virtual Status bind_string(uint32_t position, std::string_view value) = 0;
    [[nodiscard]] virtual Status bind_int64(uint32_t position, int64_t value) = 0;
    [[nodiscard]] virtual Status bind_uint64(uint32_t position, uint64_t value) = 0;
    [[nodiscard]] virtual Status bind_float(uint32_t position, float value) = 0;
    [[nodiscard]] virtual Status bind_double(uint32_t position, double value) = 0;
    [[nodiscard]] virtual Status bind_bytes(uint32_t position, const Bytes& value) = 0;

    /// Execute as a query and open a cursor over its rows
    [[nodiscard]] virtual Result<std::unique_ptr<INativeCursor>> query() = 0;

    /// Execute as DML/DDL (no commit)
    [[nodiscard]] virtual Status execute() = 0;

    /// Rows affected by the last execute()
    [[nodiscard]] virtual Result<uint64_t> row_count() const = 0;
};

/**
 * @brief One physical session with the database
 *
 * Blocking. Implementations serialize concurrent calls on the same handle
 * themselves; callers may share one instance across threads.
 */
class INativeConnection {
public:
    virtual ~INativeConnection() = default;

    [[nodiscard]] virtual Result<std::unique_ptr<INativeStatement>> prepare(const std::string& sql) = 0;
    [[nodiscard]] virtual Status commit() = 0;
    [[nodiscard]] virtual Status rollback() = 0;
    [[nodiscard]] virtual Status ping() = 0;
    [[nodiscard]] virtual Status close() = 0;
};

/**
 * @brief Factory for native sessions (wraps the client's connect call)
 */
class INativeConnector {
public:
    virtual ~INativeConnector() = default;

    /**
     * @brief Open a new session
     * @return New connection, or CONNECTION_ERROR with the client's message
     */
    [[nodiscard]] virtual Result<std::shared_ptr<INativeConnection>> connect(
        const ConnectOptions& options) = 0;
};

} // namespace orabridge
