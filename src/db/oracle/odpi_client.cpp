#include "db/oracle/odpi_client.hpp"
#include "core/datetime.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <format>

namespace orabridge {

namespace {

// RAW binds are limited to this many bytes; larger payloads use LONG RAW
constexpr uint32_t MAX_RAW_BIND = 32767;

std::string last_error(const dpiContext* context) {
    dpiErrorInfo info{};
    dpiContext_getError(context, &info);
    if (info.message == nullptr) {
        return "unknown ODPI-C error";
    }
    return std::string(info.message, info.messageLength);
}

datetime::TimestampFields timestamp_fields(const dpiTimestamp& ts, OracleTypeKind kind) {
    datetime::TimestampFields fields;
    fields.year = ts.year;
    fields.month = ts.month;
    fields.day = ts.day;
    fields.hour = ts.hour;
    fields.minute = ts.minute;
    fields.second = ts.second;
    fields.fsecond = ts.fsecond;
    if (kind == OracleTypeKind::TIMESTAMP_TZ || kind == OracleTypeKind::TIMESTAMP_LTZ) {
        // Both offsets carry the sign of the zone
        fields.tz_offset_minutes = ts.tzHourOffset * 60 + ts.tzMinuteOffset;
    }
    return fields;
}

} // anonymous namespace

// ============================================================================
// OdpiConnector
// ============================================================================

Result<std::shared_ptr<OdpiConnector>> OdpiConnector::create() {
    dpiContext* raw = nullptr;
    dpiErrorInfo info{};
    if (dpiContext_createWithParams(DPI_MAJOR_VERSION, DPI_MINOR_VERSION,
                                    nullptr, &raw, &info) != DPI_SUCCESS) {
        const std::string message = info.message
            ? std::string(info.message, info.messageLength)
            : std::string("failed to initialize ODPI-C");
        utils::log::error(std::format("Oracle client init failed: {}", message));
        return Result<std::shared_ptr<OdpiConnector>>::error(
            ErrorCategory::CONNECTION_ERROR, message);
    }

    OdpiContextPtr context(raw, [](dpiContext* ctx) { dpiContext_destroy(ctx); });
    return Result<std::shared_ptr<OdpiConnector>>::ok(
        std::make_shared<OdpiConnector>(std::move(context)));
}

Result<std::shared_ptr<INativeConnection>> OdpiConnector::connect(const ConnectOptions& options) {
    dpiCommonCreateParams common{};
    if (dpiContext_initCommonCreateParams(context_.get(), &common) != DPI_SUCCESS) {
        return Result<std::shared_ptr<INativeConnection>>::error(
            ErrorCategory::CONNECTION_ERROR, last_error(context_.get()));
    }
    common.createMode = DPI_MODE_CREATE_THREADED;
    common.encoding = "UTF-8";
    common.nencoding = "UTF-8";

    dpiConn* conn = nullptr;
    const int rc = dpiConn_create(context_.get(),
        options.username.data(), static_cast<uint32_t>(options.username.size()),
        options.password.data(), static_cast<uint32_t>(options.password.size()),
        options.connect_string.data(), static_cast<uint32_t>(options.connect_string.size()),
        &common, nullptr, &conn);
    if (rc != DPI_SUCCESS) {
        return Result<std::shared_ptr<INativeConnection>>::error(
            ErrorCategory::CONNECTION_ERROR, last_error(context_.get()));
    }

    return Result<std::shared_ptr<INativeConnection>>::ok(
        std::make_shared<OdpiConnection>(context_, conn));
}

OracleType OdpiConnector::map_type(const dpiDataTypeInfo& info) {
    switch (info.oracleTypeNum) {
        case DPI_ORACLE_TYPE_NUMBER:
            // FLOAT(p) is reported as NUMBER with the -127 scale sentinel
            if (info.scale == OracleType::UNCONSTRAINED_SCALE &&
                info.precision != OracleType::UNCONSTRAINED_PRECISION) {
                return OracleType::float_type(info.precision);
            }
            return OracleType::number(info.precision, info.scale);
        case DPI_ORACLE_TYPE_NATIVE_INT:    return OracleType::of(OracleTypeKind::INT64);
        case DPI_ORACLE_TYPE_NATIVE_FLOAT:  return OracleType::of(OracleTypeKind::BINARY_FLOAT);
        case DPI_ORACLE_TYPE_NATIVE_DOUBLE: return OracleType::of(OracleTypeKind::BINARY_DOUBLE);
        case DPI_ORACLE_TYPE_DATE:          return OracleType::of(OracleTypeKind::DATE);
        case DPI_ORACLE_TYPE_TIMESTAMP:     return OracleType::of(OracleTypeKind::TIMESTAMP, info.fsPrecision);
        case DPI_ORACLE_TYPE_TIMESTAMP_TZ:  return OracleType::of(OracleTypeKind::TIMESTAMP_TZ, info.fsPrecision);
        case DPI_ORACLE_TYPE_TIMESTAMP_LTZ: return OracleType::of(OracleTypeKind::TIMESTAMP_LTZ, info.fsPrecision);
        case DPI_ORACLE_TYPE_INTERVAL_DS:   return OracleType::of(OracleTypeKind::INTERVAL_DS);
        case DPI_ORACLE_TYPE_INTERVAL_YM:   return OracleType::of(OracleTypeKind::INTERVAL_YM);
        case DPI_ORACLE_TYPE_VARCHAR:       return OracleType::of(OracleTypeKind::VARCHAR2, info.sizeInChars);
        case DPI_ORACLE_TYPE_NVARCHAR:      return OracleType::of(OracleTypeKind::NVARCHAR2, info.sizeInChars);
        case DPI_ORACLE_TYPE_CHAR:          return OracleType::of(OracleTypeKind::CHAR, info.sizeInChars);
        case DPI_ORACLE_TYPE_NCHAR:         return OracleType::of(OracleTypeKind::NCHAR, info.sizeInChars);
        case DPI_ORACLE_TYPE_LONG_VARCHAR:  return OracleType::of(OracleTypeKind::LONG);
        case DPI_ORACLE_TYPE_RAW:           return OracleType::of(OracleTypeKind::RAW, info.dbSizeInBytes);
        case DPI_ORACLE_TYPE_LONG_RAW:      return OracleType::of(OracleTypeKind::LONG_RAW);
        case DPI_ORACLE_TYPE_CLOB:          return OracleType::of(OracleTypeKind::CLOB);
        case DPI_ORACLE_TYPE_NCLOB:         return OracleType::of(OracleTypeKind::NCLOB);
        case DPI_ORACLE_TYPE_BLOB:          return OracleType::of(OracleTypeKind::BLOB);
        case DPI_ORACLE_TYPE_BFILE:         return OracleType::of(OracleTypeKind::BFILE);
        case DPI_ORACLE_TYPE_ROWID:         return OracleType::of(OracleTypeKind::ROWID);
        case DPI_ORACLE_TYPE_BOOLEAN:       return OracleType::of(OracleTypeKind::BOOLEAN);
        case DPI_ORACLE_TYPE_JSON:          return OracleType::of(OracleTypeKind::JSON);
        case DPI_ORACLE_TYPE_OBJECT:        return OracleType::of(OracleTypeKind::OBJECT);
        default:                            return OracleType::of(OracleTypeKind::UNKNOWN);
    }
}

// ============================================================================
// OdpiConnection
// ============================================================================

OdpiConnection::OdpiConnection(OdpiContextPtr context, dpiConn* conn)
    : context_(std::move(context)), conn_(conn) {}

OdpiConnection::~OdpiConnection() {
    if (conn_) {
        dpiConn_release(conn_);
    }
}

Status OdpiConnection::check(int rc, ErrorCategory category) const {
    if (rc != DPI_SUCCESS) {
        return Status::error(category, last_error(context_.get()));
    }
    return Status::ok();
}

Result<std::unique_ptr<INativeStatement>> OdpiConnection::prepare(const std::string& sql) {
    dpiStmt* stmt = nullptr;
    if (dpiConn_prepareStmt(conn_, 0, sql.data(), static_cast<uint32_t>(sql.size()),
                            nullptr, 0, &stmt) != DPI_SUCCESS) {
        return Result<std::unique_ptr<INativeStatement>>::error(
            ErrorCategory::STATEMENT_ERROR, last_error(context_.get()));
    }
    return Result<std::unique_ptr<INativeStatement>>::ok(
        std::make_unique<OdpiStatement>(context_, conn_, stmt));
}

Status OdpiConnection::commit() {
    return check(dpiConn_commit(conn_), ErrorCategory::STATEMENT_ERROR);
}

Status OdpiConnection::rollback() {
    return check(dpiConn_rollback(conn_), ErrorCategory::STATEMENT_ERROR);
}

Status OdpiConnection::ping() {
    return check(dpiConn_ping(conn_), ErrorCategory::CONNECTION_ERROR);
}

Status OdpiConnection::close() {
    return check(dpiConn_close(conn_, DPI_MODE_CONN_CLOSE_DEFAULT, nullptr, 0),
                 ErrorCategory::CONNECTION_ERROR);
}

// ============================================================================
// OdpiStatement
// ============================================================================

OdpiStatement::OdpiStatement(OdpiContextPtr context, dpiConn* conn, dpiStmt* stmt)
    : context_(std::move(context)), conn_(conn), stmt_(stmt) {}

OdpiStatement::~OdpiStatement() {
    for (dpiVar* var : vars_) {
        dpiVar_release(var);
    }
    if (stmt_) {
        dpiStmt_release(stmt_);
    }
}

Status OdpiStatement::check(int rc) const {
    if (rc != DPI_SUCCESS) {
        return Status::error(ErrorCategory::STATEMENT_ERROR, last_error(context_.get()));
    }
    return Status::ok();
}

Status OdpiStatement::bind_value(uint32_t position, dpiNativeTypeNum native_type, dpiData& data) {
    return check(dpiStmt_bindValueByPos(stmt_, position, native_type, &data));
}

Status OdpiStatement::bind_null(uint32_t position) {
    dpiData data{};
    data.isNull = 1;
    return bind_value(position, DPI_NATIVE_TYPE_BYTES, data);
}

Status OdpiStatement::bind_string(uint32_t position, std::string_view value) {
    dpiData data{};
    // bindValueByPos copies the value into its own variable
    dpiData_setBytes(&data, const_cast<char*>(value.data()), static_cast<uint32_t>(value.size()));
    return bind_value(position, DPI_NATIVE_TYPE_BYTES, data);
}

Status OdpiStatement::bind_int64(uint32_t position, int64_t value) {
    dpiData data{};
    dpiData_setInt64(&data, value);
    return bind_value(position, DPI_NATIVE_TYPE_INT64, data);
}

Status OdpiStatement::bind_uint64(uint32_t position, uint64_t value) {
    dpiData data{};
    dpiData_setUint64(&data, value);
    return bind_value(position, DPI_NATIVE_TYPE_UINT64, data);
}

Status OdpiStatement::bind_float(uint32_t position, float value) {
    dpiData data{};
    dpiData_setFloat(&data, value);
    return bind_value(position, DPI_NATIVE_TYPE_FLOAT, data);
}

Status OdpiStatement::bind_double(uint32_t position, double value) {
    dpiData data{};
    dpiData_setDouble(&data, value);
    return bind_value(position, DPI_NATIVE_TYPE_DOUBLE, data);
}

Status OdpiStatement::bind_bytes(uint32_t position, const Bytes& value) {
    const auto length = static_cast<uint32_t>(value.size());
    const dpiOracleTypeNum oracle_type =
        length > MAX_RAW_BIND ? DPI_ORACLE_TYPE_LONG_RAW : DPI_ORACLE_TYPE_RAW;

    dpiVar* var = nullptr;
    dpiData* data = nullptr;
    if (dpiConn_newVar(conn_, oracle_type, DPI_NATIVE_TYPE_BYTES, 1,
                       std::max<uint32_t>(length, 1), 1, 0, nullptr, &var, &data) != DPI_SUCCESS) {
        return Status::error(ErrorCategory::STATEMENT_ERROR, last_error(context_.get()));
    }
    vars_.push_back(var);

    const char* ptr = reinterpret_cast<const char*>(value.data());
    if (auto s = check(dpiVar_setFromBytes(var, 0, ptr, length)); s.is_error()) {
        return s;
    }
    return check(dpiStmt_bindByPos(stmt_, position, var));
}

Result<std::unique_ptr<INativeCursor>> OdpiStatement::query() {
    uint32_t num_columns = 0;
    if (dpiStmt_execute(stmt_, DPI_MODE_EXEC_DEFAULT, &num_columns) != DPI_SUCCESS) {
        return Result<std::unique_ptr<INativeCursor>>::error(
            ErrorCategory::STATEMENT_ERROR, last_error(context_.get()));
    }

    std::vector<NativeColumnInfo> columns;
    columns.reserve(num_columns);
    for (uint32_t pos = 1; pos <= num_columns; ++pos) {
        dpiQueryInfo info{};
        if (dpiStmt_getQueryInfo(stmt_, pos, &info) != DPI_SUCCESS) {
            return Result<std::unique_ptr<INativeCursor>>::error(
                ErrorCategory::STATEMENT_ERROR, last_error(context_.get()));
        }

        // Fetch NUMBER as text so no precision is lost on the way out
        if (info.typeInfo.oracleTypeNum == DPI_ORACLE_TYPE_NUMBER &&
            dpiStmt_defineValue(stmt_, pos, DPI_ORACLE_TYPE_NUMBER, DPI_NATIVE_TYPE_BYTES,
                                0, 0, nullptr) != DPI_SUCCESS) {
            return Result<std::unique_ptr<INativeCursor>>::error(
                ErrorCategory::STATEMENT_ERROR, last_error(context_.get()));
        }

        columns.push_back(NativeColumnInfo{
            std::string(info.name, info.nameLength),
            OdpiConnector::map_type(info.typeInfo)});
    }

    return Result<std::unique_ptr<INativeCursor>>::ok(
        std::make_unique<OdpiCursor>(context_, stmt_, std::move(columns)));
}

Status OdpiStatement::execute() {
    uint32_t num_columns = 0;
    return check(dpiStmt_execute(stmt_, DPI_MODE_EXEC_DEFAULT, &num_columns));
}

Result<uint64_t> OdpiStatement::row_count() const {
    uint64_t count = 0;
    if (dpiStmt_getRowCount(stmt_, &count) != DPI_SUCCESS) {
        return Result<uint64_t>::error(ErrorCategory::STATEMENT_ERROR, last_error(context_.get()));
    }
    return Result<uint64_t>::ok(count);
}

// ============================================================================
// OdpiCursor
// ============================================================================

OdpiCursor::OdpiCursor(OdpiContextPtr context, dpiStmt* stmt, std::vector<NativeColumnInfo> columns)
    : context_(std::move(context)), stmt_(stmt), columns_(std::move(columns)) {
    dpiStmt_addRef(stmt_);
}

OdpiCursor::~OdpiCursor() {
    dpiStmt_release(stmt_);
}

Result<bool> OdpiCursor::fetch() {
    int found = 0;
    uint32_t buffer_row_index = 0;
    if (dpiStmt_fetch(stmt_, &found, &buffer_row_index) != DPI_SUCCESS) {
        return Result<bool>::error(ErrorCategory::STATEMENT_ERROR, last_error(context_.get()));
    }
    positioned_ = found != 0;
    return Result<bool>::ok(positioned_);
}

Result<OdpiCursor::Cell> OdpiCursor::cell(size_t column) const {
    if (!positioned_) {
        return Result<Cell>::error(ErrorCategory::STATEMENT_ERROR, "cursor is not positioned on a row");
    }
    if (column >= columns_.size()) {
        return Result<Cell>::error(ErrorCategory::CONVERSION_ERROR, "Index out of bounds");
    }

    Cell out;
    if (dpiStmt_getQueryValue(stmt_, static_cast<uint32_t>(column + 1),
                              &out.native_type, &out.data) != DPI_SUCCESS) {
        return Result<Cell>::error(ErrorCategory::STATEMENT_ERROR, last_error(context_.get()));
    }
    return Result<Cell>::ok(out);
}

Result<bool> OdpiCursor::is_null(size_t column) const {
    auto c = cell(column);
    if (c.is_error()) {
        return Result<bool>::from_error(c);
    }
    return Result<bool>::ok(c.value().data->isNull != 0);
}

Result<OracleType> OdpiCursor::value_type(size_t column) const {
    if (column >= columns_.size()) {
        return Result<OracleType>::error(ErrorCategory::CONVERSION_ERROR, "Index out of bounds");
    }
    return Result<OracleType>::ok(columns_[column].type);
}

Result<Bytes> OdpiCursor::read_lob(dpiLob* lob) const {
    uint64_t size = 0;
    if (dpiLob_getSize(lob, &size) != DPI_SUCCESS) {
        return Result<Bytes>::error(ErrorCategory::STATEMENT_ERROR, last_error(context_.get()));
    }

    // getSize reports characters for CLOB/NCLOB; ask for a byte-sized buffer
    uint64_t buffer_size = 0;
    if (dpiLob_getBufferSize(lob, size, &buffer_size) != DPI_SUCCESS) {
        return Result<Bytes>::error(ErrorCategory::STATEMENT_ERROR, last_error(context_.get()));
    }

    Bytes buffer(static_cast<size_t>(buffer_size));
    if (size == 0) {
        return Result<Bytes>::ok(std::move(buffer));
    }

    uint64_t read = buffer_size;
    if (dpiLob_readBytes(lob, 1, size, reinterpret_cast<char*>(buffer.data()), &read) != DPI_SUCCESS) {
        return Result<Bytes>::error(ErrorCategory::STATEMENT_ERROR, last_error(context_.get()));
    }
    buffer.resize(static_cast<size_t>(read));
    return Result<Bytes>::ok(std::move(buffer));
}

Result<std::string> OdpiCursor::get_string(size_t column) {
    auto c = cell(column);
    if (c.is_error()) {
        return Result<std::string>::from_error(c);
    }
    dpiData* data = c.value().data;
    if (data->isNull) {
        return Result<std::string>::error(ErrorCategory::CONVERSION_ERROR, "value is null");
    }

    switch (c.value().native_type) {
        case DPI_NATIVE_TYPE_BYTES: {
            const dpiBytes* bytes = dpiData_getBytes(data);
            return Result<std::string>::ok(std::string(bytes->ptr, bytes->length));
        }
        case DPI_NATIVE_TYPE_INT64:
            return Result<std::string>::ok(std::to_string(dpiData_getInt64(data)));
        case DPI_NATIVE_TYPE_UINT64:
            return Result<std::string>::ok(std::to_string(dpiData_getUint64(data)));
        case DPI_NATIVE_TYPE_FLOAT:
            return Result<std::string>::ok(std::format("{}", dpiData_getFloat(data)));
        case DPI_NATIVE_TYPE_DOUBLE:
            return Result<std::string>::ok(std::format("{}", dpiData_getDouble(data)));
        case DPI_NATIVE_TYPE_BOOLEAN:
            return Result<std::string>::ok(utils::booltostr(dpiData_getBool(data) != 0));
        case DPI_NATIVE_TYPE_TIMESTAMP:
            return Result<std::string>::ok(datetime::format_timestamp(
                timestamp_fields(*dpiData_getTimestamp(data), columns_[column].type.kind)));
        case DPI_NATIVE_TYPE_INTERVAL_DS: {
            const dpiIntervalDS* iv = dpiData_getIntervalDS(data);
            return Result<std::string>::ok(std::format("{} {:02}:{:02}:{:02}.{:09}",
                iv->days, std::abs(iv->hours), std::abs(iv->minutes),
                std::abs(iv->seconds), std::abs(iv->fseconds)));
        }
        case DPI_NATIVE_TYPE_INTERVAL_YM: {
            const dpiIntervalYM* iv = dpiData_getIntervalYM(data);
            return Result<std::string>::ok(std::format("{}-{:02}", iv->years, std::abs(iv->months)));
        }
        case DPI_NATIVE_TYPE_ROWID: {
            const char* text = nullptr;
            uint32_t length = 0;
            if (dpiRowid_getStringValue(dpiData_getRowid(data), &text, &length) != DPI_SUCCESS) {
                return Result<std::string>::error(ErrorCategory::STATEMENT_ERROR, last_error(context_.get()));
            }
            return Result<std::string>::ok(std::string(text, length));
        }
        case DPI_NATIVE_TYPE_LOB: {
            auto bytes = read_lob(dpiData_getLOB(data));
            if (bytes.is_error()) {
                return Result<std::string>::from_error(bytes);
            }
            const auto& b = bytes.value();
            return Result<std::string>::ok(std::string(b.begin(), b.end()));
        }
        default:
            return Result<std::string>::error(ErrorCategory::CONVERSION_ERROR,
                std::format("no text rendering for {}", columns_[column].type.to_string()));
    }
}

Result<Bytes> OdpiCursor::get_bytes(size_t column) {
    auto c = cell(column);
    if (c.is_error()) {
        return Result<Bytes>::from_error(c);
    }
    dpiData* data = c.value().data;
    if (data->isNull) {
        return Result<Bytes>::error(ErrorCategory::CONVERSION_ERROR, "value is null");
    }

    switch (c.value().native_type) {
        case DPI_NATIVE_TYPE_BYTES: {
            const dpiBytes* bytes = dpiData_getBytes(data);
            const auto* begin = reinterpret_cast<const uint8_t*>(bytes->ptr);
            return Result<Bytes>::ok(Bytes(begin, begin + bytes->length));
        }
        case DPI_NATIVE_TYPE_LOB:
            return read_lob(dpiData_getLOB(data));
        default:
            return Result<Bytes>::error(ErrorCategory::CONVERSION_ERROR,
                std::format("no binary rendering for {}", columns_[column].type.to_string()));
    }
}

} // namespace orabridge
