#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "db/oracle/odpi_client.hpp"
#include "db/oracle/oracle_driver.hpp"
#include "executor/blocking_worker_pool.hpp"

#include <cstdlib>
#include <format>
#include <iostream>
#include <memory>

using namespace orabridge;

// Usage: oraclebridge [config.toml] [sql]
// Connects, pings, optionally runs one statement and prints the rows as JSON.
int main(int argc, char* argv[]) {
    try {
        std::string config_file = "config/bridge.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        utils::log::info(std::format("[1/4] Loading configuration from {}", config_file));
        auto config_result = ConfigLoader::load_from_file(config_file);
        if (config_result.is_error()) {
            utils::log::error(config_result.error_message());
            return EXIT_FAILURE;
        }
        const auto& cfg = config_result.value();
        ConfigLoader::apply_logging(cfg.logging);

        utils::log::info("[2/4] Initializing Oracle client");
        auto connector = OdpiConnector::create();
        if (connector.is_error()) {
            return EXIT_FAILURE;
        }
        auto pool = std::make_shared<BlockingWorkerPool>(cfg.workers);
        OracleDriver driver(connector.value(), pool);

        utils::log::info(std::format("[3/4] Connecting to {}", cfg.oracle.connect_string));
        auto conn_result = join(driver.connect(cfg.oracle));
        if (conn_result.is_error()) {
            return EXIT_FAILURE;
        }
        auto& conn = conn_result.value();

        if (auto ping = join(conn.ping()); ping.is_error()) {
            utils::log::error(std::format("Ping failed: {}", ping.error_message()));
            return EXIT_FAILURE;
        }

        int exit_code = EXIT_SUCCESS;
        if (argc > 2) {
            utils::log::info("[4/4] Running statement");
            auto rows = join(conn.query(argv[2]));
            if (rows.is_error()) {
                utils::log::error(std::format("{}: {}",
                    error_category_to_string(rows.error_category()), rows.error_message()));
                exit_code = EXIT_FAILURE;
            } else {
                for (const auto& row : rows.value()) {
                    std::string line = "[";
                    for (size_t i = 0; i < row.column_len(); ++i) {
                        auto cell = row.get(i);
                        if (i > 0) line += ",";
                        line += cell.is_ok() ? cell.value().to_json() : "null";
                    }
                    std::cout << line << "]\n";
                }
            }
        } else {
            utils::log::info("[4/4] Ping OK");
        }

        if (auto closed = join(conn.close()); closed.is_error()) {
            utils::log::warn(std::format("Close failed: {}", closed.error_message()));
        }
        pool->shutdown();
        return exit_code;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return EXIT_FAILURE;
    }
}
