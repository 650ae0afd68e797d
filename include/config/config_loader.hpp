#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"

#include <toml.hpp>

#include <string>
#include <vector>

namespace orabridge {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads BridgeConfig from TOML
 *
 * String values support ${VAR} environment substitution. A top-level
 * `include` (string or array of paths, relative to the including file) is
 * deep-merged underneath the including file. All failures are CONFIG_ERROR.
 */
class ConfigLoader {
public:
    using LoadResult = Result<BridgeConfig>;

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to bridge.toml
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string (includes are not resolved)
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Apply the [logging] section to utils::log
     */
    static void apply_logging(const LoggingConfig& logging);

private:
    static LoadResult extract_all_sections(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static WorkerPoolConfig extract_workers(const toml::table& root);
    static Result<BridgeConfig> extract_oracle(const toml::table& root, BridgeConfig config);

    static std::vector<std::string> validate_config(const BridgeConfig& config);
};

} // namespace orabridge
