#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "db/oracle/oracle_driver.hpp"

#include <array>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <string_view>
#include <unordered_set>
#include <vector>

using namespace std::string_literals;

namespace orabridge {

// ============================================================================
// TOML Helpers (env expansion, includes)
// ============================================================================

namespace {

constexpr int MAX_INCLUDE_DEPTH = 10;

// Every section is a flat table of scalars
constexpr std::array<std::string_view, 3> SECTIONS = {"oracle", "workers", "logging"};

/// Replace each ${NAME} with the environment value; unset names become empty
std::string expand_env(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    size_t pos = 0;
    while (true) {
        const size_t open = input.find("${", pos);
        if (open == std::string_view::npos) {
            out.append(input.substr(pos));
            return out;
        }
        const size_t close = input.find('}', open + 2);
        if (close == std::string_view::npos) {
            throw std::runtime_error(
                std::format("Unclosed env var substitution at position {}", open));
        }
        out.append(input.substr(pos, open - pos));
        const std::string name(input.substr(open + 2, close - open - 2));
        if (const char* value = std::getenv(name.c_str())) {
            out += value;
        }
        pos = close + 1;
    }
}

void expand_sections(toml::table& root) {
    for (const auto section : SECTIONS) {
        auto* table = root[section].as_table();
        if (!table) continue;
        for (auto& [key, value] : *table) {
            if (auto* text = value.as_string()) {
                *text = expand_env(text->get());
            }
        }
    }
}

/// Keys of `top` replace those of `base`, one section at a time
void overlay_sections(toml::table& base, const toml::table& top) {
    for (const auto& [key, value] : top) {
        auto* base_section = base[key.str()].as_table();
        const auto* top_section = value.as_table();
        if (base_section && top_section) {
            for (const auto& [name, entry] : *top_section) {
                base_section->insert_or_assign(name, entry);
            }
        } else {
            base.insert_or_assign(key, value);
        }
    }
}

/// Remove the `include` directive (string or array) and return its paths
std::vector<std::string> take_includes(toml::table& root) {
    std::vector<std::string> paths;
    if (const auto* single = root["include"].as_string()) {
        paths.push_back(single->get());
    } else if (const auto* list = root["include"].as_array()) {
        for (const auto& item : *list) {
            if (const auto* path = item.as_string()) {
                paths.push_back(path->get());
            }
        }
    }
    root.erase("include");
    return paths;
}

/// Parse a file with its includes layered underneath; later layers win
toml::table parse_layered(const std::filesystem::path& file,
                          std::unordered_set<std::string>& visited, int depth) {
    if (depth > MAX_INCLUDE_DEPTH) {
        throw std::runtime_error(
            std::format("Config include depth exceeds {}", MAX_INCLUDE_DEPTH));
    }
    const auto path = std::filesystem::canonical(file);
    if (!visited.insert(path.string()).second) {
        throw std::runtime_error(
            std::format("Circular config include detected: {}", path.string()));
    }

    auto own = toml::parse_file(path.string());
    toml::table merged;
    for (const auto& relative : take_includes(own)) {
        overlay_sections(merged, parse_layered(path.parent_path() / relative, visited, depth + 1));
    }
    overlay_sections(merged, own);
    return merged;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

WorkerPoolConfig ConfigLoader::extract_workers(const toml::table& root) {
    WorkerPoolConfig cfg;
    const auto* workers = root["workers"].as_table();
    if (!workers) return cfg;
    const auto& w = *workers;

    // Negative values collapse to 0 and are rejected by validation
    const int64_t threads = w["threads"].value_or(static_cast<int64_t>(cfg.threads));
    const int64_t capacity = w["queue_capacity"].value_or(static_cast<int64_t>(cfg.queue_capacity));
    cfg.threads = threads > 0 ? static_cast<size_t>(threads) : 0;
    cfg.queue_capacity = capacity > 0 ? static_cast<size_t>(capacity) : 0;
    return cfg;
}

Result<BridgeConfig> ConfigLoader::extract_oracle(const toml::table& root, BridgeConfig config) {
    const auto* oracle = root["oracle"].as_table();
    if (!oracle) {
        return Result<BridgeConfig>::error(ErrorCategory::CONFIG_ERROR,
            "Missing [oracle] section");
    }
    const auto& o = *oracle;

    if (const auto* url = o["url"].as_string()) {
        auto parsed = OracleDriver::parse_url(url->get());
        if (parsed.is_error()) {
            return Result<BridgeConfig>::from_error(parsed);
        }
        config.oracle_url = url->get();
        config.oracle = std::move(parsed.value());
        return Result<BridgeConfig>::ok(std::move(config));
    }

    config.oracle.username = o["username"].value_or(""s);
    config.oracle.password = o["password"].value_or(""s);
    config.oracle.connect_string = o["connect_string"].value_or(""s);
    return Result<BridgeConfig>::ok(std::move(config));
}

ConfigLoader::LoadResult ConfigLoader::extract_all_sections(const toml::table& root) {
    BridgeConfig config;
    config.logging = extract_logging(root);
    config.workers = extract_workers(root);

    auto with_oracle = extract_oracle(root, std::move(config));
    if (with_oracle.is_error()) {
        return with_oracle;
    }

    const auto errors = validate_config(with_oracle.value());
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(ErrorCategory::CONFIG_ERROR, std::move(combined));
    }
    return with_oracle;
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        std::unordered_set<std::string> visited;
        auto tbl = parse_layered(config_path, visited, 0);
        expand_sections(tbl);
        return extract_all_sections(tbl);
    } catch (const std::exception& e) {
        return LoadResult::error(ErrorCategory::CONFIG_ERROR,
            std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto tbl = toml::parse(toml_content);
        expand_sections(tbl);
        return extract_all_sections(tbl);
    } catch (const std::exception& e) {
        return LoadResult::error(ErrorCategory::CONFIG_ERROR,
            std::format("Failed to parse config: {}", e.what()));
    }
}

void ConfigLoader::apply_logging(const LoggingConfig& logging) {
    if (const auto level = utils::log::parse_level(logging.level)) {
        utils::log::set_level(*level);
    } else {
        utils::log::warn(std::format("Unknown log level '{}', keeping current", logging.level));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const BridgeConfig& config) {
    std::vector<std::string> errors;

    if (config.oracle.username.empty()) {
        errors.emplace_back("oracle.username must not be empty");
    }
    if (config.oracle.password.empty()) {
        errors.emplace_back("oracle.password must not be empty");
    }
    if (config.oracle.connect_string.empty()) {
        errors.emplace_back("oracle.connect_string must not be empty");
    }
    if (config.workers.threads == 0) {
        errors.emplace_back("workers.threads must be > 0");
    }
    if (config.workers.queue_capacity == 0) {
        errors.emplace_back("workers.queue_capacity must be > 0");
    }
    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level '{}' is not one of debug, info, warn, error",
            config.logging.level));
    }

    return errors;
}

} // namespace orabridge
