#include "config.hpp"
#include "error.hpp"
#include <fstream>

namespace assetlock {

using json = nlohmann::json;

namespace {
AssetLockError config_error(const std::string& message) {
    return AssetLockError(AssetLockError::ErrorType::ConfigError, message);
}
} // namespace

Config Config::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw config_error("Failed to open config file " + path.string());
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw config_error("Failed to parse config file " + path.string() + ": " + e.what());
    }
    return parse(j);
}

// Only private_key is required; every other key falls back to the member
// default
Config Config::parse(const json& j) {
    if (!j.is_object()) {
        throw config_error("Config must be a JSON object");
    }

    Config config;
    try {
        if (j.contains("network")) {
            config.network = network_from_string(j["network"].get<std::string>());
        }
        if (!j.contains("private_key")) {
            throw config_error("Config is missing private_key");
        }
        config.private_key = j["private_key"].get<std::string>();
        if (j.contains("state_dir")) {
            config.state_dir = j["state_dir"].get<std::string>();
        }
        config.core_cli = j.value("core_cli", config.core_cli);
        config.core_cli_args = j.value("core_cli_args", config.core_cli_args);
        config.fallback_core_cli_args = j.value("fallback_core_cli_args", config.fallback_core_cli_args);
        config.fee = j.value("fee", config.fee);
        config.proof_timeout = std::chrono::seconds(j.value("proof_timeout_seconds", config.proof_timeout.count()));
        config.poll_interval = std::chrono::milliseconds(j.value("poll_interval_ms", config.poll_interval.count()));
        config.log_level = j.value("log_level", config.log_level);
    } catch (const json::exception& e) {
        throw config_error(std::string("Invalid config value: ") + e.what());
    }

    if (config.proof_timeout.count() <= 0) {
        throw config_error("proof_timeout_seconds must be positive");
    }
    if (config.poll_interval.count() <= 0) {
        throw config_error("poll_interval_ms must be positive");
    }
    return config;
}

} // namespace assetlock
