#pragma once

#include "core/error.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace orabridge {

using Bytes = std::vector<uint8_t>;

/**
 * @brief Closed set of extension tags exchanged with the host framework
 */
enum class ExtTag : uint8_t {
    DATE,
    DATETIME,
    TIME,
    DECIMAL,
    TIMESTAMP,
    UUID,
    JSON,
};

[[nodiscard]] std::string_view ext_tag_to_string(ExtTag tag);

/**
 * @brief Resolve a host-framework tag name ("Date", "Decimal", ...)
 *
 * Case-sensitive. Unknown names are a CONVERSION_ERROR.
 */
[[nodiscard]] Result<ExtTag> parse_ext_tag(std::string_view name);

using ExtPayload = std::variant<std::string, uint64_t>;

struct ExtendedValue {
    ExtTag tag = ExtTag::DECIMAL;
    ExtPayload payload;

    bool operator==(const ExtendedValue&) const = default;
};

enum class ValueKind : uint8_t {
    NULL_VALUE,
    BOOL,
    I32,
    I64,
    U32,
    U64,
    F32,
    F64,
    STRING,
    BINARY,
    ARRAY,
    EXTENDED,
};

[[nodiscard]] std::string_view value_kind_to_string(ValueKind kind);

class DynamicValue;
using Array = std::vector<DynamicValue>;

/**
 * @brief Generic dynamic value exchanged with the query framework
 *
 * Default-constructed value is null. Alternatives are ordered to match
 * ValueKind.
 */
class DynamicValue {
public:
    using Storage = std::variant<
        std::monostate,
        bool,
        int32_t,
        int64_t,
        uint32_t,
        uint64_t,
        float,
        double,
        std::string,
        Bytes,
        Array,
        ExtendedValue>;

    DynamicValue() = default;

    static DynamicValue null() { return DynamicValue(); }
    static DynamicValue boolean(bool v) { return DynamicValue(Storage(std::in_place_type<bool>, v)); }
    static DynamicValue i32(int32_t v) { return DynamicValue(Storage(std::in_place_type<int32_t>, v)); }
    static DynamicValue i64(int64_t v) { return DynamicValue(Storage(std::in_place_type<int64_t>, v)); }
    static DynamicValue u32(uint32_t v) { return DynamicValue(Storage(std::in_place_type<uint32_t>, v)); }
    static DynamicValue u64(uint64_t v) { return DynamicValue(Storage(std::in_place_type<uint64_t>, v)); }
    static DynamicValue f32(float v) { return DynamicValue(Storage(std::in_place_type<float>, v)); }
    static DynamicValue f64(double v) { return DynamicValue(Storage(std::in_place_type<double>, v)); }
    static DynamicValue string(std::string v) {
        return DynamicValue(Storage(std::in_place_type<std::string>, std::move(v)));
    }
    static DynamicValue binary(Bytes v) {
        return DynamicValue(Storage(std::in_place_type<Bytes>, std::move(v)));
    }
    static DynamicValue array(Array v) {
        return DynamicValue(Storage(std::in_place_type<Array>, std::move(v)));
    }
    static DynamicValue extended(ExtTag tag, ExtPayload payload) {
        return DynamicValue(Storage(std::in_place_type<ExtendedValue>,
                                    ExtendedValue{tag, std::move(payload)}));
    }

    /**
     * @brief Build an extended value from a host-framework tag name
     * @return CONVERSION_ERROR for a name outside the closed tag set
     */
    [[nodiscard]] static Result<DynamicValue> extended(std::string_view tag, ExtPayload payload);

    [[nodiscard]] ValueKind kind() const { return static_cast<ValueKind>(data_.index()); }
    [[nodiscard]] bool is_null() const { return kind() == ValueKind::NULL_VALUE; }

    template<typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data_); }

    [[nodiscard]] const Storage& storage() const { return data_; }

    /// JSON text of the whole value (used where no native type exists)
    [[nodiscard]] std::string to_json() const;

    bool operator==(const DynamicValue&) const = default;

private:
    explicit DynamicValue(Storage data) : data_(std::move(data)) {}

    Storage data_;
};

} // namespace orabridge
