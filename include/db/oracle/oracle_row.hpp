#pragma once

#include "core/dynamic_value.hpp"
#include "core/error.hpp"
#include "db/oracle/oracle_type.hpp"
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace orabridge {

/**
 * @brief Result column: lower-cased name plus declared native type
 */
struct ColumnDescriptor {
    std::string name;
    OracleType type;
};

/**
 * @brief Column schema of one executed statement
 *
 * Built once per statement and shared read-only by every row it produced.
 */
using ColumnSet = std::shared_ptr<const std::vector<ColumnDescriptor>>;

/**
 * @brief One undecoded cell as fetched from the native client
 *
 * When not null, at most one of text/binary is populated. BLOB cells
 * never populate text. Both empty on a non-null cell means the native
 * getter failed and the payload could not be retrieved.
 */
struct RawColumnValue {
    std::optional<std::string> text;
    std::optional<Bytes> binary;
    OracleType type;
    bool is_null = false;

    static RawColumnValue null_of(OracleType type) {
        RawColumnValue v;
        v.type = type;
        v.is_null = true;
        return v;
    }
    static RawColumnValue text_of(OracleType type, std::string text) {
        RawColumnValue v;
        v.type = type;
        v.text = std::move(text);
        return v;
    }
    static RawColumnValue binary_of(OracleType type, Bytes bytes) {
        RawColumnValue v;
        v.type = type;
        v.binary = std::move(bytes);
        return v;
    }
    static RawColumnValue empty_of(OracleType type) {
        RawColumnValue v;
        v.type = type;
        return v;
    }
};

/**
 * @brief One fetched row; values decode lazily on get()
 */
class ResultRow {
public:
    ResultRow(ColumnSet columns, std::vector<RawColumnValue> values)
        : columns_(std::move(columns)), values_(std::move(values)) {}

    [[nodiscard]] size_t column_len() const { return columns_->size(); }
    /// Throws std::out_of_range past column_len()
    [[nodiscard]] const std::string& column_name(size_t i) const { return columns_->at(i).name; }
    [[nodiscard]] std::string column_type(size_t i) const { return columns_->at(i).type.to_string(); }

    [[nodiscard]] const ColumnSet& columns() const { return columns_; }
    [[nodiscard]] const std::vector<RawColumnValue>& values() const { return values_; }

    /**
     * @brief Decode column i into a dynamic value
     * @return CONVERSION_ERROR on an out-of-range index or a failed decode
     */
    [[nodiscard]] Result<DynamicValue> get(size_t i) const;

private:
    ColumnSet columns_;
    std::vector<RawColumnValue> values_;
};

} // namespace orabridge
