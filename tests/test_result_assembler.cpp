#include <catch2/catch_test_macros.hpp>
#include "db/oracle/result_assembler.hpp"
#include "mocks/mock_native_client.hpp"

using namespace orabridge;
using namespace orabridge::testing;

namespace {

MockResultSet people() {
    MockResultSet rs;
    rs.columns = {
        {"ID", OracleType::number(10, 0)},
        {"Name", OracleType::of(OracleTypeKind::VARCHAR2, 30)},
        {"PHOTO", OracleType::of(OracleTypeKind::BLOB)},
    };
    rs.rows = {
        {MockCell::of("1"), MockCell::of("alice"), MockCell::blob({0x01, 0x02})},
        {MockCell::of("2"), MockCell::null(), MockCell::null()},
    };
    return rs;
}

} // namespace

TEST_CASE("ResultAssembler: column names are lower-cased", "[assembler]") {
    MockCursor cursor(people());
    auto rows = ResultAssembler::assemble(cursor);
    REQUIRE(rows.is_ok());
    REQUIRE(rows.value().size() == 2);

    const auto& row = rows.value()[0];
    CHECK(row.column_name(0) == "id");
    CHECK(row.column_name(1) == "name");
    CHECK(row.column_name(2) == "photo");
}

TEST_CASE("ResultAssembler: every row shares one column schema", "[assembler]") {
    MockCursor cursor(people());
    auto rows = ResultAssembler::assemble(cursor);
    REQUIRE(rows.is_ok());
    REQUIRE(rows.value().size() == 2);
    CHECK(rows.value()[0].columns().get() == rows.value()[1].columns().get());
}

TEST_CASE("ResultAssembler: cells carry text, bytes or null", "[assembler]") {
    MockCursor cursor(people());
    auto rows = ResultAssembler::assemble(cursor);
    REQUIRE(rows.is_ok());

    const auto& first = rows.value()[0].values();
    REQUIRE(first[0].text.has_value());
    CHECK(*first[0].text == "1");
    CHECK_FALSE(first[2].text.has_value());
    REQUIRE(first[2].binary.has_value());
    CHECK(*first[2].binary == Bytes{0x01, 0x02});

    const auto& second = rows.value()[1].values();
    CHECK(second[1].is_null);
    CHECK(second[2].is_null);

    auto photo = rows.value()[0].get(2);
    REQUIRE(photo.is_ok());
    CHECK(photo.value() == DynamicValue::binary({0x01, 0x02}));
}

TEST_CASE("ResultAssembler: getter failure leaves an empty cell", "[assembler]") {
    MockResultSet rs;
    rs.columns = {
        {"N", OracleType::unconstrained_number()},
        {"B", OracleType::of(OracleTypeKind::BLOB)},
    };
    rs.rows = {{MockCell::broken(), MockCell::broken()}};

    MockCursor cursor(std::move(rs));
    auto rows = ResultAssembler::assemble(cursor);
    REQUIRE(rows.is_ok());
    const auto& row = rows.value()[0];

    CHECK_FALSE(row.values()[0].is_null);
    CHECK_FALSE(row.values()[0].text.has_value());

    // NUMBER without text fails on decode; BLOB without bytes reads as null
    auto n = row.get(0);
    REQUIRE(n.is_error());
    CHECK(n.error_message() == "Missing string value");
    auto b = row.get(1);
    REQUIRE(b.is_ok());
    CHECK(b.value().is_null());
}

TEST_CASE("ResultAssembler: per-value type wins over the declared type", "[assembler]") {
    MockResultSet rs;
    rs.columns = {{"X", OracleType::unconstrained_number()}};
    MockCell cell = MockCell::of("0.5");
    cell.value_type = OracleType::of(OracleTypeKind::BINARY_DOUBLE);
    rs.rows = {{cell}};

    MockCursor cursor(std::move(rs));
    auto rows = ResultAssembler::assemble(cursor);
    REQUIRE(rows.is_ok());
    CHECK(rows.value()[0].values()[0].type.kind == OracleTypeKind::BINARY_DOUBLE);
    auto v = rows.value()[0].get(0);
    REQUIRE(v.is_ok());
    CHECK(v.value() == DynamicValue::f64(0.5));
}

TEST_CASE("ResultAssembler: declared type is used when no per-value type exists", "[assembler]") {
    MockResultSet rs = people();
    rs.fail_value_type = true;

    MockCursor cursor(std::move(rs));
    auto rows = ResultAssembler::assemble(cursor);
    REQUIRE(rows.is_ok());
    CHECK(rows.value()[0].values()[0].type == OracleType::number(10, 0));
    CHECK(rows.value()[0].values()[2].binary.has_value());
}

TEST_CASE("ResultAssembler: fetch failure fails the whole query", "[assembler]") {
    MockResultSet rs = people();
    rs.fail_fetch_at = 1;

    MockCursor cursor(std::move(rs));
    auto rows = ResultAssembler::assemble(cursor);
    REQUIRE(rows.is_error());
    CHECK(rows.error_category() == ErrorCategory::STATEMENT_ERROR);
}

TEST_CASE("ResultAssembler: empty result has no rows", "[assembler]") {
    MockResultSet rs = people();
    rs.rows.clear();

    MockCursor cursor(std::move(rs));
    auto rows = ResultAssembler::assemble(cursor);
    REQUIRE(rows.is_ok());
    CHECK(rows.value().empty());
}
