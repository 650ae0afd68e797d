#include "db/oracle/statement_binder.hpp"
#include "core/datetime.hpp"
#include "core/decimal.hpp"
#include "core/utils.hpp"

#include <format>

namespace orabridge {

namespace {

Status conversion_error(std::string message) {
    return Status::error(ErrorCategory::CONVERSION_ERROR, std::move(message));
}

/// String payload, or "" when the payload is numeric
std::string payload_string(const ExtPayload& payload) {
    if (const auto* s = std::get_if<std::string>(&payload)) {
        return *s;
    }
    return {};
}

/// Bind a textual payload after it has been normalized by parse_fn
template<typename ParseFn>
Status bind_parsed(const ExtPayload& payload, uint32_t position, INativeStatement& stmt, ParseFn parse_fn) {
    auto parsed = parse_fn(payload_string(payload));
    if (parsed.is_error()) {
        return Status::from_error(parsed);
    }
    return stmt.bind_string(position, parsed.value());
}

} // anonymous namespace

Status StatementBinder::bind(const DynamicValue& value, size_t index, INativeStatement& stmt) {
    const auto position = static_cast<uint32_t>(index + 1);

    switch (value.kind()) {
        case ValueKind::NULL_VALUE:
            return stmt.bind_null(position);
        case ValueKind::BOOL:
            return stmt.bind_int64(position, *value.get_if<bool>() ? 1 : 0);
        case ValueKind::I32:
            return stmt.bind_int64(position, *value.get_if<int32_t>());
        case ValueKind::I64:
            return stmt.bind_int64(position, *value.get_if<int64_t>());
        case ValueKind::U32:
            return stmt.bind_uint64(position, *value.get_if<uint32_t>());
        case ValueKind::U64:
            return stmt.bind_uint64(position, *value.get_if<uint64_t>());
        case ValueKind::F32:
            return stmt.bind_float(position, *value.get_if<float>());
        case ValueKind::F64:
            return stmt.bind_double(position, *value.get_if<double>());
        case ValueKind::STRING:
            return stmt.bind_string(position, *value.get_if<std::string>());
        case ValueKind::BINARY:
            return stmt.bind_bytes(position, *value.get_if<Bytes>());
        case ValueKind::ARRAY:
            // No native collection binding; the whole value goes in as text
            return stmt.bind_string(position, value.to_json());
        case ValueKind::EXTENDED:
            return bind_extended(*value.get_if<ExtendedValue>(), position, stmt);
        default:
            return conversion_error(std::format("unsupported value kind at parameter {}", position));
    }
}

Status StatementBinder::bind_extended(const ExtendedValue& ext, uint32_t position, INativeStatement& stmt) {
    switch (ext.tag) {
        case ExtTag::DATE:
            return bind_parsed(ext.payload, position, stmt, datetime::normalize_date);

        case ExtTag::DATETIME:
            return bind_parsed(ext.payload, position, stmt, datetime::normalize_datetime);

        case ExtTag::DECIMAL:
            return bind_parsed(ext.payload, position, stmt, [](const std::string& text) {
                auto dec = Decimal::parse(text);
                if (dec.is_error()) {
                    return Result<std::string>::from_error(dec);
                }
                return Result<std::string>::ok(dec.value().to_string());
            });

        case ExtTag::TIMESTAMP: {
            uint64_t millis = 0;
            if (const auto* n = std::get_if<uint64_t>(&ext.payload)) {
                millis = *n;
            } else if (const auto parsed = utils::try_parse_int<uint64_t>(payload_string(ext.payload))) {
                millis = *parsed;
            } else {
                return conversion_error(std::format(
                    "Timestamp payload '{}' is not an unsigned integer", payload_string(ext.payload)));
            }
            return stmt.bind_int64(position, static_cast<int64_t>(millis));
        }

        case ExtTag::TIME:
        case ExtTag::UUID:
            return stmt.bind_string(position, payload_string(ext.payload));

        case ExtTag::JSON:
            return conversion_error("JSON type not implemented");

        default:
            return conversion_error(std::format("Unknown extended type (tag {})",
                static_cast<unsigned>(ext.tag)));
    }
}

Status StatementBinder::bind_all(const std::vector<DynamicValue>& params, INativeStatement& stmt) {
    for (size_t i = 0; i < params.size(); ++i) {
        auto st = bind(params[i], i, stmt);
        if (st.is_error()) {
            return st;
        }
    }
    return Status::ok();
}

} // namespace orabridge
