#pragma once

#include "core/error.hpp"
#include "db/inative_client.hpp"
#include "db/oracle/oracle_row.hpp"
#include <vector>

namespace orabridge {

/**
 * @brief Drains a native cursor into ResultRows
 *
 * The column schema is built exactly once per cursor and the same
 * ColumnSet handle is attached to every row.
 */
class ResultAssembler {
public:
    /// Lower-cased names + declared types, wrapped once for sharing
    [[nodiscard]] static ColumnSet build_columns(const std::vector<NativeColumnInfo>& infos);

    /**
     * @brief Fetch all rows
     * @return STATEMENT_ERROR if a fetch fails
     */
    [[nodiscard]] static Result<std::vector<ResultRow>> assemble(INativeCursor& cursor);

    /**
     * @brief Read the current cell of a positioned cursor
     *
     * Getter failures degrade to an empty value rather than failing the row.
     */
    [[nodiscard]] static RawColumnValue read_cell(INativeCursor& cursor, size_t column, const OracleType& declared);
};

} // namespace orabridge
