#include <catch2/catch_test_macros.hpp>
#include "db/oracle/oracle_row.hpp"
#include "db/oracle/row_decoder.hpp"

#include <stdexcept>

using namespace orabridge;

namespace {

DynamicValue decode_ok(const RawColumnValue& raw) {
    auto r = RowDecoder::decode(raw);
    INFO(r.error_message());
    REQUIRE(r.is_ok());
    return r.value();
}

DynamicValue decimal(const std::string& text) {
    return DynamicValue::extended(ExtTag::DECIMAL, text);
}

} // namespace

TEST_CASE("RowDecoder: null cell decodes to null for every type", "[decoder]") {
    for (auto type : {OracleType::unconstrained_number(), OracleType::of(OracleTypeKind::BLOB),
                      OracleType::of(OracleTypeKind::DATE), OracleType::of(OracleTypeKind::VARCHAR2, 10)}) {
        CHECK(decode_ok(RawColumnValue::null_of(type)).is_null());
    }
}

TEST_CASE("RowDecoder: unconstrained NUMBER widens integers by digit count", "[decoder][number]") {
    const auto type = OracleType::unconstrained_number();
    CHECK(decode_ok(RawColumnValue::text_of(type, "42")) == DynamicValue::i32(42));
    CHECK(decode_ok(RawColumnValue::text_of(type, "-7")) == DynamicValue::i32(-7));
    CHECK(decode_ok(RawColumnValue::text_of(type, "999999999")) == DynamicValue::i32(999999999));
    CHECK(decode_ok(RawColumnValue::text_of(type, "1000000000")) == DynamicValue::i64(1000000000));
    CHECK(decode_ok(RawColumnValue::text_of(type, "12345678901")) == DynamicValue::i64(12345678901));
    CHECK(decode_ok(RawColumnValue::text_of(type, "1234567890123456789012")) ==
          decimal("1234567890123456789012"));
}

TEST_CASE("RowDecoder: unconstrained NUMBER with a fraction stays decimal", "[decoder][number]") {
    const auto type = OracleType::unconstrained_number();
    CHECK(decode_ok(RawColumnValue::text_of(type, "12345678.90")) == decimal("12345678.90"));
    CHECK(decode_ok(RawColumnValue::text_of(type, "-0.5")) == decimal("-0.5"));
}

TEST_CASE("RowDecoder: NUMBER with positive scale is always decimal", "[decoder][number]") {
    const auto type = OracleType::number(10, 2);
    CHECK(decode_ok(RawColumnValue::text_of(type, "3.5")) == decimal("3.5"));
    CHECK(decode_ok(RawColumnValue::text_of(type, "3")) == decimal("3"));
}

TEST_CASE("RowDecoder: NUMBER(p,0) width is decided by precision", "[decoder][number]") {
    CHECK(decode_ok(RawColumnValue::text_of(OracleType::number(5, 0), "12345")) == DynamicValue::i32(12345));
    CHECK(decode_ok(RawColumnValue::text_of(OracleType::number(9, 0), "5")) == DynamicValue::i32(5));
    CHECK(decode_ok(RawColumnValue::text_of(OracleType::number(10, 0), "5")) == DynamicValue::i64(5));
    CHECK(decode_ok(RawColumnValue::text_of(OracleType::number(18, 0), "5")) == DynamicValue::i64(5));
    CHECK(decode_ok(RawColumnValue::text_of(OracleType::number(38, 0), "5")) == decimal("5"));
}

TEST_CASE("RowDecoder: unparsable integer text is a conversion error", "[decoder][number]") {
    auto r = RowDecoder::decode(RawColumnValue::text_of(OracleType::number(9, 0), "abc"));
    REQUIRE(r.is_error());
    CHECK(r.error_category() == ErrorCategory::CONVERSION_ERROR);
    CHECK(r.error_message().find("abc") != std::string::npos);
}

TEST_CASE("RowDecoder: floating point widths", "[decoder][float]") {
    CHECK(decode_ok(RawColumnValue::text_of(OracleType::float_type(126), "1.5")) == DynamicValue::f64(1.5));
    CHECK(decode_ok(RawColumnValue::text_of(OracleType::float_type(10), "2.5")) == DynamicValue::f32(2.5f));
    CHECK(decode_ok(RawColumnValue::text_of(OracleType::of(OracleTypeKind::BINARY_DOUBLE), "0.25")) ==
          DynamicValue::f64(0.25));
    CHECK(decode_ok(RawColumnValue::text_of(OracleType::of(OracleTypeKind::BINARY_FLOAT), "0.25")) ==
          DynamicValue::f32(0.25f));
    CHECK(RowDecoder::decode(RawColumnValue::text_of(OracleType::float_type(126), "x")).is_error());
}

TEST_CASE("RowDecoder: native 64-bit integer", "[decoder]") {
    CHECK(decode_ok(RawColumnValue::text_of(OracleType::of(OracleTypeKind::INT64), "9000000000")) ==
          DynamicValue::i64(9000000000));
}

TEST_CASE("RowDecoder: DATE becomes an extended DateTime", "[decoder][date]") {
    const auto type = OracleType::of(OracleTypeKind::DATE);
    CHECK(decode_ok(RawColumnValue::text_of(type, "2024-03-01 12:00:00")) ==
          DynamicValue::extended(ExtTag::DATETIME, std::string("2024-03-01T12:00:00")));
    CHECK(RowDecoder::decode(RawColumnValue::text_of(type, "not a date")).is_error());
}

TEST_CASE("RowDecoder: BLOB uses the binary path and degrades to null", "[decoder][blob]") {
    const auto type = OracleType::of(OracleTypeKind::BLOB);
    CHECK(decode_ok(RawColumnValue::binary_of(type, {0xde, 0xad})) == DynamicValue::binary({0xde, 0xad}));
    CHECK(decode_ok(RawColumnValue::binary_of(type, {})) == DynamicValue::binary({}));
    CHECK(decode_ok(RawColumnValue::empty_of(type)).is_null());
}

TEST_CASE("RowDecoder: character LOBs require text", "[decoder][clob]") {
    const auto clob = OracleType::of(OracleTypeKind::CLOB);
    CHECK(decode_ok(RawColumnValue::text_of(clob, "long text")) == DynamicValue::string("long text"));

    auto missing = RowDecoder::decode(RawColumnValue::empty_of(clob));
    REQUIRE(missing.is_error());
    CHECK(missing.error_message() == "Missing string value");

    CHECK(RowDecoder::decode(RawColumnValue::empty_of(OracleType::unconstrained_number())).is_error());
}

TEST_CASE("RowDecoder: other types fall back to text", "[decoder]") {
    CHECK(decode_ok(RawColumnValue::text_of(OracleType::of(OracleTypeKind::VARCHAR2, 30), "hello")) ==
          DynamicValue::string("hello"));
    CHECK(decode_ok(RawColumnValue::text_of(OracleType::of(OracleTypeKind::TIMESTAMP, 6), "2024-01-01 00:00:00")) ==
          DynamicValue::string("2024-01-01 00:00:00"));
    CHECK(decode_ok(RawColumnValue::text_of(OracleType::of(OracleTypeKind::TIMESTAMP_TZ, 6),
                                            "2024-01-01 00:00:00 -08:00")) ==
          DynamicValue::string("2024-01-01 00:00:00 -08:00"));

    auto r = RowDecoder::decode(RawColumnValue::empty_of(OracleType::of(OracleTypeKind::RAW, 16)));
    REQUIRE(r.is_error());
    CHECK(r.error_message() == "unimplemented conversion for RAW(16)");
}

TEST_CASE("ResultRow: accessors and out-of-range get", "[decoder][row]") {
    auto columns = std::make_shared<const std::vector<ColumnDescriptor>>(std::vector<ColumnDescriptor>{
        {"id", OracleType::number(10, 0)},
        {"name", OracleType::of(OracleTypeKind::VARCHAR2, 30)},
    });
    ResultRow row(columns, {
        RawColumnValue::text_of(OracleType::number(10, 0), "7"),
        RawColumnValue::text_of(OracleType::of(OracleTypeKind::VARCHAR2, 30), "alice"),
    });

    CHECK(row.column_len() == 2);
    CHECK(row.column_name(1) == "name");
    CHECK(row.column_type(0) == "NUMBER(10)");
    CHECK(row.column_type(1) == "VARCHAR2(30)");

    auto id = row.get(0);
    REQUIRE(id.is_ok());
    CHECK(id.value() == DynamicValue::i64(7));

    auto oob = row.get(2);
    REQUIRE(oob.is_error());
    CHECK(oob.error_category() == ErrorCategory::CONVERSION_ERROR);
    CHECK(oob.error_message() == "Index out of bounds");

    CHECK_THROWS_AS(row.column_name(2), std::out_of_range);
    CHECK_THROWS_AS(row.column_type(2), std::out_of_range);
}
