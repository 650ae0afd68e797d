#pragma once

#include <string>

namespace orabridge {

/**
 * @brief Credentials and Easy Connect string for one Oracle session
 *
 * connect_string is "//host:port/service" (or "//host:port").
 */
struct ConnectOptions {
    std::string username;
    std::string password;
    std::string connect_string;

    ConnectOptions() = default;
    ConnectOptions(std::string user, std::string pass, std::string connect)
        : username(std::move(user)), password(std::move(pass)), connect_string(std::move(connect)) {}
};

} // namespace orabridge
