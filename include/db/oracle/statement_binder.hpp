#pragma once

#include "core/dynamic_value.hpp"
#include "core/error.hpp"
#include "db/inative_client.hpp"
#include <cstddef>
#include <vector>

namespace orabridge {

/**
 * @brief DynamicValue -> native positional bind
 *
 * Index is 0-based on input and bound at index + 1. Booleans bind as
 * 0/1 integers, arrays as their JSON text, and extended values are parsed
 * per tag before binding (Json and unknown tags are rejected).
 */
class StatementBinder {
public:
    /**
     * @brief Bind one value
     * @return CONVERSION_ERROR if the value cannot be transcoded,
     *         STATEMENT_ERROR if the native bind fails
     */
    [[nodiscard]] static Status bind(const DynamicValue& value, size_t index, INativeStatement& stmt);

    /// Bind params in order; stops at the first failure
    [[nodiscard]] static Status bind_all(const std::vector<DynamicValue>& params, INativeStatement& stmt);

private:
    static Status bind_extended(const ExtendedValue& ext, uint32_t position, INativeStatement& stmt);
};

} // namespace orabridge
