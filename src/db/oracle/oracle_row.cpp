#include "db/oracle/oracle_row.hpp"
#include "db/oracle/row_decoder.hpp"

namespace orabridge {

Result<DynamicValue> ResultRow::get(size_t i) const {
    if (i >= values_.size()) {
        return Result<DynamicValue>::error(ErrorCategory::CONVERSION_ERROR, "Index out of bounds");
    }
    return RowDecoder::decode(values_[i]);
}

} // namespace orabridge
