#include "db/oracle/result_assembler.hpp"
#include "core/utils.hpp"

#include <format>

namespace orabridge {

ColumnSet ResultAssembler::build_columns(const std::vector<NativeColumnInfo>& infos) {
    std::vector<ColumnDescriptor> columns;
    columns.reserve(infos.size());
    for (const auto& info : infos) {
        columns.push_back(ColumnDescriptor{utils::to_lower(info.name), info.type});
    }
    return std::make_shared<const std::vector<ColumnDescriptor>>(std::move(columns));
}

RawColumnValue ResultAssembler::read_cell(INativeCursor& cursor, size_t column, const OracleType& declared) {
    // Per-value type when the client reports one, else the declared column type
    const auto value_type = cursor.value_type(column);
    const OracleType type = value_type.is_ok() ? value_type.value() : declared;

    const auto null_check = cursor.is_null(column);
    if (null_check.is_ok() && null_check.value()) {
        return RawColumnValue::null_of(type);
    }

    if (type.kind == OracleTypeKind::BLOB) {
        auto bytes = cursor.get_bytes(column);
        if (bytes.is_error()) {
            utils::log::debug(std::format("BLOB read failed on column {}: {}", column, bytes.error_message()));
            return RawColumnValue::empty_of(type);
        }
        return RawColumnValue::binary_of(type, std::move(bytes.value()));
    }

    auto text = cursor.get_string(column);
    if (text.is_error()) {
        utils::log::debug(std::format("text read failed on column {}: {}", column, text.error_message()));
        return RawColumnValue::empty_of(type);
    }
    return RawColumnValue::text_of(type, std::move(text.value()));
}

Result<std::vector<ResultRow>> ResultAssembler::assemble(INativeCursor& cursor) {
    const auto& infos = cursor.columns();
    const ColumnSet columns = build_columns(infos);
    const size_t col_count = columns->size();

    std::vector<ResultRow> rows;
    while (true) {
        auto fetched = cursor.fetch();
        if (fetched.is_error()) {
            return Result<std::vector<ResultRow>>::from_error(fetched);
        }
        if (!fetched.value()) {
            break;
        }

        std::vector<RawColumnValue> values;
        values.reserve(col_count);
        for (size_t i = 0; i < col_count; ++i) {
            values.push_back(read_cell(cursor, i, (*columns)[i].type));
        }
        rows.emplace_back(columns, std::move(values));
    }

    return Result<std::vector<ResultRow>>::ok(std::move(rows));
}

} // namespace orabridge
