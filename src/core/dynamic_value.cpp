#include "core/dynamic_value.hpp"

#include <nlohmann/json.hpp>

#include <format>
#include <unordered_map>

namespace orabridge {

namespace keys {
    inline constexpr std::string_view DATE = "Date";
    inline constexpr std::string_view DATETIME = "DateTime";
    inline constexpr std::string_view TIME = "Time";
    inline constexpr std::string_view DECIMAL = "Decimal";
    inline constexpr std::string_view TIMESTAMP = "Timestamp";
    inline constexpr std::string_view UUID = "Uuid";
    inline constexpr std::string_view JSON = "Json";
}

std::string_view ext_tag_to_string(ExtTag tag) {
    switch (tag) {
        case ExtTag::DATE:      return keys::DATE;
        case ExtTag::DATETIME:  return keys::DATETIME;
        case ExtTag::TIME:      return keys::TIME;
        case ExtTag::DECIMAL:   return keys::DECIMAL;
        case ExtTag::TIMESTAMP: return keys::TIMESTAMP;
        case ExtTag::UUID:      return keys::UUID;
        case ExtTag::JSON:      return keys::JSON;
        default:                return "Unknown";
    }
}

Result<ExtTag> parse_ext_tag(std::string_view name) {
    static const std::unordered_map<std::string_view, ExtTag> lookup = {
        {keys::DATE,      ExtTag::DATE},
        {keys::DATETIME,  ExtTag::DATETIME},
        {keys::TIME,      ExtTag::TIME},
        {keys::DECIMAL,   ExtTag::DECIMAL},
        {keys::TIMESTAMP, ExtTag::TIMESTAMP},
        {keys::UUID,      ExtTag::UUID},
        {keys::JSON,      ExtTag::JSON},
    };

    if (const auto it = lookup.find(name); it != lookup.end()) {
        return Result<ExtTag>::ok(it->second);
    }
    return Result<ExtTag>::error(ErrorCategory::CONVERSION_ERROR,
        std::format("Unknown extended type: {}", name));
}

std::string_view value_kind_to_string(ValueKind kind) {
    switch (kind) {
        case ValueKind::NULL_VALUE: return "Null";
        case ValueKind::BOOL:       return "Bool";
        case ValueKind::I32:        return "I32";
        case ValueKind::I64:        return "I64";
        case ValueKind::U32:        return "U32";
        case ValueKind::U64:        return "U64";
        case ValueKind::F32:        return "F32";
        case ValueKind::F64:        return "F64";
        case ValueKind::STRING:     return "String";
        case ValueKind::BINARY:     return "Binary";
        case ValueKind::ARRAY:      return "Array";
        case ValueKind::EXTENDED:   return "Ext";
        default:                    return "Unknown";
    }
}

Result<DynamicValue> DynamicValue::extended(std::string_view tag, ExtPayload payload) {
    auto parsed = parse_ext_tag(tag);
    if (parsed.is_error()) {
        return Result<DynamicValue>::from_error(parsed);
    }
    return Result<DynamicValue>::ok(extended(parsed.value(), std::move(payload)));
}

namespace {

nlohmann::json to_json_node(const DynamicValue& value) {
    return std::visit([](const auto& v) -> nlohmann::json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return nullptr;
        } else if constexpr (std::is_same_v<T, Bytes>) {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto b : v) arr.push_back(b);
            return arr;
        } else if constexpr (std::is_same_v<T, Array>) {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& elem : v) arr.push_back(to_json_node(elem));
            return arr;
        } else if constexpr (std::is_same_v<T, ExtendedValue>) {
            // Extended values render as their payload
            return std::visit([](const auto& p) -> nlohmann::json { return p; }, v.payload);
        } else {
            return v;
        }
    }, value.storage());
}

} // anonymous namespace

std::string DynamicValue::to_json() const {
    return to_json_node(*this).dump();
}

} // namespace orabridge
