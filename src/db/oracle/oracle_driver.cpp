#include "db/oracle/oracle_driver.hpp"
#include "db/oracle/placeholder.hpp"
#include "core/utils.hpp"

#include <format>
#include <optional>

namespace orabridge {

namespace {

constexpr std::string_view SCHEME_PREFIX = "oracle://";

Result<ConnectOptions> url_error(std::string message) {
    return Result<ConnectOptions>::error(ErrorCategory::CONFIG_ERROR, std::move(message));
}

} // anonymous namespace

OracleDriver::OracleDriver(std::shared_ptr<INativeConnector> connector,
                           std::shared_ptr<BlockingWorkerPool> pool)
    : connector_(std::move(connector)), pool_(std::move(pool)) {}

Result<ConnectOptions> OracleDriver::parse_url(std::string_view url) {
    std::string_view sv(url);

    const size_t scheme_end = sv.find("://");
    if (scheme_end == std::string_view::npos) {
        return url_error(std::format("Invalid URL: '{}'", url));
    }
    if (utils::to_lower(sv.substr(0, scheme_end)) + "://" != SCHEME_PREFIX) {
        return url_error("URL scheme must be 'oracle'");
    }
    sv.remove_prefix(scheme_end + 3);

    // Split authority from the service path
    std::string_view authority = sv;
    std::string_view service;
    const size_t slash_pos = sv.find('/');
    if (slash_pos != std::string_view::npos) {
        authority = sv.substr(0, slash_pos);
        service = sv.substr(slash_pos + 1);
    }
    while (!service.empty() && service.front() == '/') {
        service.remove_prefix(1);
    }

    // user:password@host:port
    std::string username;
    std::optional<std::string> password;
    std::string_view host_port = authority;
    const size_t at_pos = authority.rfind('@');
    if (at_pos != std::string_view::npos) {
        const std::string_view creds = authority.substr(0, at_pos);
        host_port = authority.substr(at_pos + 1);

        const size_t colon_pos = creds.find(':');
        if (colon_pos != std::string_view::npos) {
            username = std::string(creds.substr(0, colon_pos));
            password = std::string(creds.substr(colon_pos + 1));
        } else {
            username = std::string(creds);
        }
    }

    if (!password) {
        return url_error("Password is required");
    }

    std::string_view host = host_port;
    uint16_t port = DEFAULT_PORT;
    const size_t colon_pos = host_port.rfind(':');
    if (colon_pos != std::string_view::npos) {
        host = host_port.substr(0, colon_pos);
        const auto parsed = utils::try_parse_int<uint16_t>(host_port.substr(colon_pos + 1));
        if (!parsed) {
            return url_error(std::format("Invalid port in URL: '{}'", host_port.substr(colon_pos + 1)));
        }
        port = *parsed;
    }

    if (host.empty()) {
        return url_error("Host is required");
    }

    std::string connect_string = service.empty()
        ? std::format("//{}:{}", host, port)
        : std::format("//{}:{}/{}", host, port, service);

    return Result<ConnectOptions>::ok(
        ConnectOptions(std::move(username), std::move(*password), std::move(connect_string)));
}

std::future<Result<OracleConnection>> OracleDriver::connect(std::string_view url) const {
    auto options = parse_url(url);
    if (options.is_error()) {
        std::promise<Result<OracleConnection>> promise;
        promise.set_value(Result<OracleConnection>::from_error(options));
        return promise.get_future();
    }
    return connect(options.value());
}

std::future<Result<OracleConnection>> OracleDriver::connect(const ConnectOptions& options) const {
    return OracleConnection::establish(options, connector_, pool_);
}

std::string OracleDriver::exchange(std::string sql) {
    return translate_placeholders(std::move(sql));
}

} // namespace orabridge
