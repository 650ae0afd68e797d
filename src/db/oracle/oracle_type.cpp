#include "db/oracle/oracle_type.hpp"
#include <format>

namespace orabridge {

const char* oracle_type_kind_to_string(OracleTypeKind kind) {
    switch (kind) {
        case OracleTypeKind::UNKNOWN: return "UNKNOWN";
        case OracleTypeKind::NUMBER: return "NUMBER";
        case OracleTypeKind::FLOAT: return "FLOAT";
        case OracleTypeKind::BINARY_FLOAT: return "BINARY_FLOAT";
        case OracleTypeKind::BINARY_DOUBLE: return "BINARY_DOUBLE";
        case OracleTypeKind::INT64: return "INT64";
        case OracleTypeKind::DATE: return "DATE";
        case OracleTypeKind::TIMESTAMP: return "TIMESTAMP";
        case OracleTypeKind::TIMESTAMP_TZ: return "TIMESTAMP WITH TIME ZONE";
        case OracleTypeKind::TIMESTAMP_LTZ: return "TIMESTAMP WITH LOCAL TIME ZONE";
        case OracleTypeKind::INTERVAL_DS: return "INTERVAL DAY TO SECOND";
        case OracleTypeKind::INTERVAL_YM: return "INTERVAL YEAR TO MONTH";
        case OracleTypeKind::VARCHAR2: return "VARCHAR2";
        case OracleTypeKind::NVARCHAR2: return "NVARCHAR2";
        case OracleTypeKind::CHAR: return "CHAR";
        case OracleTypeKind::NCHAR: return "NCHAR";
        case OracleTypeKind::LONG: return "LONG";
        case OracleTypeKind::RAW: return "RAW";
        case OracleTypeKind::LONG_RAW: return "LONG RAW";
        case OracleTypeKind::CLOB: return "CLOB";
        case OracleTypeKind::NCLOB: return "NCLOB";
        case OracleTypeKind::BLOB: return "BLOB";
        case OracleTypeKind::BFILE: return "BFILE";
        case OracleTypeKind::ROWID: return "ROWID";
        case OracleTypeKind::BOOLEAN: return "BOOLEAN";
        case OracleTypeKind::JSON: return "JSON";
        case OracleTypeKind::OBJECT: return "OBJECT";
        default: return "UNKNOWN";
    }
}

std::string OracleType::to_string() const {
    const char* name = oracle_type_kind_to_string(kind);
    switch (kind) {
        case OracleTypeKind::NUMBER:
            if (is_unconstrained_number()) return name;
            if (scale == 0) return std::format("{}({})", name, precision);
            return std::format("{}({},{})", name, precision, scale);
        case OracleTypeKind::FLOAT:
            return std::format("{}({})", name, precision);
        case OracleTypeKind::VARCHAR2:
        case OracleTypeKind::NVARCHAR2:
        case OracleTypeKind::CHAR:
        case OracleTypeKind::NCHAR:
        case OracleTypeKind::RAW:
            return size > 0 ? std::format("{}({})", name, size) : std::string(name);
        case OracleTypeKind::TIMESTAMP:
            return std::format("{}({})", name, size);
        default:
            return name;
    }
}

} // namespace orabridge
