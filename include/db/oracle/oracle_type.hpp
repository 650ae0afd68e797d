#pragma once

#include <cstdint>
#include <string>

namespace orabridge {

/**
 * @brief Oracle column type families as reported by the native client
 */
enum class OracleTypeKind : uint16_t {
    UNKNOWN = 0,

    // Numeric
    NUMBER,          // NUMBER(precision, scale)
    FLOAT,           // FLOAT(binary precision)
    BINARY_FLOAT,
    BINARY_DOUBLE,
    INT64,           // native 64-bit integer (PLS_INTEGER / client-side int)

    // Date/Time
    DATE,
    TIMESTAMP,
    TIMESTAMP_TZ,
    TIMESTAMP_LTZ,
    INTERVAL_DS,
    INTERVAL_YM,

    // Character
    VARCHAR2,
    NVARCHAR2,
    CHAR,
    NCHAR,
    LONG,

    // Binary
    RAW,
    LONG_RAW,

    // Large objects
    CLOB,
    NCLOB,
    BLOB,
    BFILE,

    // Other
    ROWID,
    BOOLEAN,
    JSON,
    OBJECT,
};

/**
 * @brief Declared native type of a column or value
 *
 * precision/scale only matter for NUMBER (scale -127 with precision 0 is the
 * unconstrained "NUMBER" sentinel) and FLOAT (binary precision). size carries
 * the declared length for character/raw types and the fractional-second
 * precision for timestamps.
 */
struct OracleType {
    static constexpr int16_t UNCONSTRAINED_PRECISION = 0;
    static constexpr int16_t UNCONSTRAINED_SCALE = -127;

    OracleTypeKind kind = OracleTypeKind::UNKNOWN;
    int16_t precision = 0;
    int16_t scale = 0;
    uint32_t size = 0;

    static OracleType number(int16_t precision, int16_t scale) {
        return {OracleTypeKind::NUMBER, precision, scale, 0};
    }
    static OracleType unconstrained_number() {
        return number(UNCONSTRAINED_PRECISION, UNCONSTRAINED_SCALE);
    }
    static OracleType float_type(int16_t binary_precision) {
        return {OracleTypeKind::FLOAT, binary_precision, 0, 0};
    }
    static OracleType of(OracleTypeKind kind, uint32_t size = 0) {
        return {kind, 0, 0, size};
    }

    [[nodiscard]] bool is_unconstrained_number() const {
        return kind == OracleTypeKind::NUMBER &&
               precision == UNCONSTRAINED_PRECISION &&
               scale == UNCONSTRAINED_SCALE;
    }

    /// DDL-style rendering: "NUMBER(10,2)", "FLOAT(126)", "VARCHAR2(30)", "BLOB"
    [[nodiscard]] std::string to_string() const;

    bool operator==(const OracleType&) const = default;
};

[[nodiscard]] const char* oracle_type_kind_to_string(OracleTypeKind kind);

} // namespace orabridge
