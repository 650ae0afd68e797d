#pragma once

#include "db/oracle/connect_options.hpp"
#include "executor/blocking_worker_pool.hpp"

#include <string>

namespace orabridge {

// ============================================================================
// Configuration Types
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

/**
 * @brief Complete parsed bridge configuration
 *
 * oracle_url keeps the URL form when one was given; oracle always holds the
 * resolved credentials.
 */
struct BridgeConfig {
    ConnectOptions oracle;
    std::string oracle_url;
    WorkerPoolConfig workers;
    LoggingConfig logging;
};

} // namespace orabridge
