#pragma once

#include "db/inative_client.hpp"
#include <dpi.h>
#include <memory>
#include <string>
#include <vector>

namespace orabridge {

using OdpiContextPtr = std::shared_ptr<dpiContext>;

/**
 * @brief Oracle session over ODPI-C implementing INativeConnection
 *
 * Wraps dpiConn*. Created in threaded mode, so OCI serializes concurrent
 * calls on the handle. All dpiConn_* calls are encapsulated here.
 */
class OdpiConnection : public INativeConnection {
public:
    OdpiConnection(OdpiContextPtr context, dpiConn* conn);
    ~OdpiConnection() override;

    OdpiConnection(const OdpiConnection&) = delete;
    OdpiConnection& operator=(const OdpiConnection&) = delete;

    Result<std::unique_ptr<INativeStatement>> prepare(const std::string& sql) override;
    Status commit() override;
    Status rollback() override;
    Status ping() override;
    Status close() override;

private:
    Status check(int rc, ErrorCategory category) const;

    OdpiContextPtr context_;
    dpiConn* conn_;
};

/**
 * @brief Prepared dpiStmt* with positional binds
 *
 * NUMBER columns are defined as text on query() so values arrive exact.
 * Binary parameters go through an explicit RAW (or LONG RAW) variable.
 */
class OdpiStatement : public INativeStatement {
public:
    OdpiStatement(OdpiContextPtr context, dpiConn* conn, dpiStmt* stmt);
    ~OdpiStatement() override;

    OdpiStatement(const OdpiStatement&) = delete;
    OdpiStatement& operator=(const OdpiStatement&) = delete;

    Status bind_null(uint32_t position) override;
    Status bind_string(uint32_t position, std::string_view value) override;
    Status bind_int64(uint32_t position, int64_t value) override;
    Status bind_uint64(uint32_t position, uint64_t value) override;
    Status bind_float(uint32_t position, float value) override;
    Status bind_double(uint32_t position, double value) override;
    Status bind_bytes(uint32_t position, const Bytes& value) override;

    Result<std::unique_ptr<INativeCursor>> query() override;
    Status execute() override;
    Result<uint64_t> row_count() const override;

private:
    Status bind_value(uint32_t position, dpiNativeTypeNum native_type, dpiData& data);
    Status check(int rc) const;

    OdpiContextPtr context_;
    dpiConn* conn_;
    dpiStmt* stmt_;
    std::vector<dpiVar*> vars_;
};

/**
 * @brief Cursor over an executed dpiStmt* (holds its own reference)
 */
class OdpiCursor : public INativeCursor {
public:
    OdpiCursor(OdpiContextPtr context, dpiStmt* stmt, std::vector<NativeColumnInfo> columns);
    ~OdpiCursor() override;

    OdpiCursor(const OdpiCursor&) = delete;
    OdpiCursor& operator=(const OdpiCursor&) = delete;

    const std::vector<NativeColumnInfo>& columns() const override { return columns_; }
    Result<bool> fetch() override;
    Result<bool> is_null(size_t column) const override;
    Result<OracleType> value_type(size_t column) const override;
    Result<std::string> get_string(size_t column) override;
    Result<Bytes> get_bytes(size_t column) override;

private:
    struct Cell {
        dpiNativeTypeNum native_type = 0;
        dpiData* data = nullptr;
    };

    Result<Cell> cell(size_t column) const;
    Result<Bytes> read_lob(dpiLob* lob) const;

    OdpiContextPtr context_;
    dpiStmt* stmt_;
    std::vector<NativeColumnInfo> columns_;
    bool positioned_ = false;
};

/**
 * @brief ODPI-C connection factory
 *
 * Owns the dpiContext shared by every session it opens.
 */
class OdpiConnector : public INativeConnector {
public:
    /**
     * @brief Initialize ODPI-C (loads the Oracle Client libraries)
     * @return CONNECTION_ERROR if the client libraries cannot be loaded
     */
    [[nodiscard]] static Result<std::shared_ptr<OdpiConnector>> create();

    Result<std::shared_ptr<INativeConnection>> connect(const ConnectOptions& options) override;

    explicit OdpiConnector(OdpiContextPtr context) : context_(std::move(context)) {}

    /// Map ODPI-C query metadata to OracleType
    [[nodiscard]] static OracleType map_type(const dpiDataTypeInfo& info);

private:
    OdpiContextPtr context_;
};

} // namespace orabridge
