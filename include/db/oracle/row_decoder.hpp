#pragma once

#include "core/dynamic_value.hpp"
#include "core/error.hpp"
#include "db/oracle/oracle_row.hpp"

namespace orabridge {

/**
 * @brief Native cell -> DynamicValue (pure, no I/O)
 *
 * Rules, first match wins:
 *   null flag                   -> null (declared type never inspected)
 *   NUMBER unconstrained/scale>0 -> Decimal; whole unconstrained values widen
 *                                  by digit count (<=9 i32, <=18 i64)
 *   NUMBER(p, s<=0)              -> by precision (<=9 i32, <=18 i64, else Decimal)
 *   INT64                        -> i64
 *   FLOAT(p)                     -> p >= 24 ? f64 : f32
 *   BINARY_FLOAT / BINARY_DOUBLE -> f32 / f64
 *   DATE                         -> Ext(DateTime)
 *   BLOB                         -> binary, or null when no payload
 *   CLOB / NCLOB / LONG          -> string (text required)
 *   anything else                -> text if present
 *
 * Missing or malformed payloads are CONVERSION_ERROR.
 */
class RowDecoder {
public:
    [[nodiscard]] static Result<DynamicValue> decode(const RawColumnValue& raw);

private:
    static Result<DynamicValue> decode_number(const RawColumnValue& raw, const std::string& text);
};

} // namespace orabridge
