#include <catch2/catch_test_macros.hpp>
#include "core/dynamic_value.hpp"

using namespace orabridge;

TEST_CASE("DynamicValue: default value is null", "[value]") {
    DynamicValue v;
    CHECK(v.is_null());
    CHECK(v.kind() == ValueKind::NULL_VALUE);
    CHECK(v == DynamicValue::null());
}

TEST_CASE("DynamicValue: kinds follow the factory used", "[value]") {
    CHECK(DynamicValue::boolean(true).kind() == ValueKind::BOOL);
    CHECK(DynamicValue::i32(1).kind() == ValueKind::I32);
    CHECK(DynamicValue::i64(1).kind() == ValueKind::I64);
    CHECK(DynamicValue::u32(1).kind() == ValueKind::U32);
    CHECK(DynamicValue::u64(1).kind() == ValueKind::U64);
    CHECK(DynamicValue::f32(1.0f).kind() == ValueKind::F32);
    CHECK(DynamicValue::f64(1.0).kind() == ValueKind::F64);
    CHECK(DynamicValue::string("x").kind() == ValueKind::STRING);
    CHECK(DynamicValue::binary({1, 2}).kind() == ValueKind::BINARY);
    CHECK(DynamicValue::array({}).kind() == ValueKind::ARRAY);
    CHECK(DynamicValue::extended(ExtTag::UUID, std::string("u")).kind() == ValueKind::EXTENDED);

    CHECK(*DynamicValue::i64(-9).get_if<int64_t>() == -9);
    CHECK(DynamicValue::i64(-9).get_if<int32_t>() == nullptr);
}

TEST_CASE("DynamicValue: i32 and i64 of the same number are different values", "[value]") {
    CHECK(DynamicValue::i32(5) != DynamicValue::i64(5));
    CHECK(DynamicValue::i32(5) == DynamicValue::i32(5));
}

TEST_CASE("DynamicValue: extended tags resolve by name", "[value]") {
    auto dec = DynamicValue::extended("Decimal", std::string("1.50"));
    REQUIRE(dec.is_ok());
    const auto* ext = dec.value().get_if<ExtendedValue>();
    REQUIRE(ext != nullptr);
    CHECK(ext->tag == ExtTag::DECIMAL);
    CHECK(std::get<std::string>(ext->payload) == "1.50");

    auto ts = DynamicValue::extended("Timestamp", uint64_t{1700000000000});
    REQUIRE(ts.is_ok());
    CHECK(ts.value().get_if<ExtendedValue>()->tag == ExtTag::TIMESTAMP);
}

TEST_CASE("DynamicValue: unknown extended tag is a conversion error", "[value]") {
    auto r = DynamicValue::extended("Money", std::string("12.00"));
    REQUIRE(r.is_error());
    CHECK(r.error_category() == ErrorCategory::CONVERSION_ERROR);
    CHECK(r.error_message() == "Unknown extended type: Money");

    // Tag names are case-sensitive
    CHECK(parse_ext_tag("decimal").is_error());
}

TEST_CASE("DynamicValue: tag names round trip", "[value]") {
    for (auto tag : {ExtTag::DATE, ExtTag::DATETIME, ExtTag::TIME, ExtTag::DECIMAL,
                     ExtTag::TIMESTAMP, ExtTag::UUID, ExtTag::JSON}) {
        auto parsed = parse_ext_tag(ext_tag_to_string(tag));
        REQUIRE(parsed.is_ok());
        CHECK(parsed.value() == tag);
    }
}

TEST_CASE("DynamicValue: JSON rendering", "[value][json]") {
    const auto arr = DynamicValue::array({
        DynamicValue::i32(1),
        DynamicValue::string("a"),
        DynamicValue::null(),
        DynamicValue::boolean(true),
    });
    CHECK(arr.to_json() == R"([1,"a",null,true])");

    CHECK(DynamicValue::binary({1, 255}).to_json() == "[1,255]");
    CHECK(DynamicValue::extended(ExtTag::DECIMAL, std::string("1.5")).to_json() == R"("1.5")");
    CHECK(DynamicValue::extended(ExtTag::TIMESTAMP, uint64_t{42}).to_json() == "42");

    const auto nested = DynamicValue::array({DynamicValue::array({DynamicValue::u64(7)})});
    CHECK(nested.to_json() == "[[7]]");
}

TEST_CASE("DynamicValue: kind names", "[value]") {
    CHECK(value_kind_to_string(ValueKind::NULL_VALUE) == "Null");
    CHECK(value_kind_to_string(ValueKind::EXTENDED) == "Ext");
    CHECK(value_kind_to_string(ValueKind::BINARY) == "Binary");
}
