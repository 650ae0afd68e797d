#include "db/oracle/row_decoder.hpp"
#include "core/datetime.hpp"
#include "core/decimal.hpp"
#include "core/utils.hpp"

#include <format>

namespace orabridge {

namespace {

constexpr const char* MISSING_STRING_VALUE = "Missing string value";

// Digit counts that still fit the fixed-width integers
constexpr size_t MAX_I32_DIGITS = 9;
constexpr size_t MAX_I64_DIGITS = 18;

Result<DynamicValue> conversion_error(std::string message) {
    return Result<DynamicValue>::error(ErrorCategory::CONVERSION_ERROR, std::move(message));
}

Result<DynamicValue> decimal_value(const Decimal& dec) {
    return Result<DynamicValue>::ok(DynamicValue::extended(ExtTag::DECIMAL, dec.to_string()));
}

Result<DynamicValue> parse_i32(std::string_view text) {
    if (const auto v = utils::try_parse_int<int32_t>(text)) {
        return Result<DynamicValue>::ok(DynamicValue::i32(*v));
    }
    return conversion_error(std::format("cannot parse '{}' as a 32-bit integer", text));
}

Result<DynamicValue> parse_i64(std::string_view text) {
    if (const auto v = utils::try_parse_int<int64_t>(text)) {
        return Result<DynamicValue>::ok(DynamicValue::i64(*v));
    }
    return conversion_error(std::format("cannot parse '{}' as a 64-bit integer", text));
}

/// Width by digit count: i32, i64, or Decimal when wider
Result<DynamicValue> widen_by_digits(size_t digits, std::string_view integer_text, const Decimal* dec) {
    if (digits >= 1 && digits <= MAX_I32_DIGITS) {
        return parse_i32(integer_text);
    }
    if (digits > MAX_I32_DIGITS && digits <= MAX_I64_DIGITS) {
        return parse_i64(integer_text);
    }
    if (dec) {
        return decimal_value(*dec);
    }
    auto parsed = Decimal::parse(integer_text);
    if (parsed.is_error()) {
        return Result<DynamicValue>::from_error(parsed);
    }
    return decimal_value(parsed.value());
}

} // anonymous namespace

Result<DynamicValue> RowDecoder::decode(const RawColumnValue& raw) {
    if (raw.is_null) {
        return Result<DynamicValue>::ok(DynamicValue::null());
    }

    const auto& type = raw.type;

    switch (type.kind) {
        case OracleTypeKind::NUMBER: {
            if (!raw.text) return conversion_error(MISSING_STRING_VALUE);
            return decode_number(raw, *raw.text);
        }

        case OracleTypeKind::INT64: {
            if (!raw.text) return conversion_error(MISSING_STRING_VALUE);
            return parse_i64(*raw.text);
        }

        case OracleTypeKind::FLOAT:
        case OracleTypeKind::BINARY_FLOAT:
        case OracleTypeKind::BINARY_DOUBLE: {
            if (!raw.text) return conversion_error(MISSING_STRING_VALUE);
            const bool wide = (type.kind == OracleTypeKind::BINARY_DOUBLE) ||
                              (type.kind == OracleTypeKind::FLOAT && type.precision >= 24);
            if (wide) {
                if (const auto v = utils::try_parse_float<double>(*raw.text)) {
                    return Result<DynamicValue>::ok(DynamicValue::f64(*v));
                }
            } else {
                if (const auto v = utils::try_parse_float<float>(*raw.text)) {
                    return Result<DynamicValue>::ok(DynamicValue::f32(*v));
                }
            }
            return conversion_error(std::format("cannot parse '{}' as a floating point number", *raw.text));
        }

        case OracleTypeKind::DATE: {
            if (!raw.text) return conversion_error(MISSING_STRING_VALUE);
            auto parsed = datetime::parse_native_datetime(*raw.text);
            if (parsed.is_error()) {
                return Result<DynamicValue>::from_error(parsed);
            }
            return Result<DynamicValue>::ok(
                DynamicValue::extended(ExtTag::DATETIME, std::move(parsed.value())));
        }

        case OracleTypeKind::BLOB:
            // Binary path only; a failed retrieval degrades to null
            if (raw.binary) {
                return Result<DynamicValue>::ok(DynamicValue::binary(*raw.binary));
            }
            return Result<DynamicValue>::ok(DynamicValue::null());

        case OracleTypeKind::LONG:
        case OracleTypeKind::CLOB:
        case OracleTypeKind::NCLOB:
            if (!raw.text) return conversion_error(MISSING_STRING_VALUE);
            return Result<DynamicValue>::ok(DynamicValue::string(*raw.text));

        default:
            if (raw.text) {
                return Result<DynamicValue>::ok(DynamicValue::string(*raw.text));
            }
            return conversion_error(std::format("unimplemented conversion for {}", type.to_string()));
    }
}

Result<DynamicValue> RowDecoder::decode_number(const RawColumnValue& raw, const std::string& text) {
    const auto& type = raw.type;
    const bool unconstrained = type.is_unconstrained_number();

    if (unconstrained || type.scale > 0) {
        auto parsed = Decimal::parse(text);
        if (parsed.is_error()) {
            return Result<DynamicValue>::from_error(parsed);
        }
        const Decimal& dec = parsed.value();

        if (unconstrained && dec.is_integer()) {
            const std::string whole = dec.to_integer_string();
            const size_t digits = whole.size() - (dec.is_negative() ? 1 : 0);
            return widen_by_digits(digits, whole, &dec);
        }
        // Genuinely fractional: never widened to a float
        return decimal_value(dec);
    }

    // scale <= 0 with a known precision: width decided by precision alone
    return widen_by_digits(static_cast<size_t>(type.precision > 0 ? type.precision : 0), text, nullptr);
}

} // namespace orabridge
