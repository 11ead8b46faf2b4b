#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "consts.hpp"
#include "keys.hpp"

namespace assetlock {

struct Config {
    Network network = Network::Testnet;
    std::string private_key;                 // 64 hex characters or WIF
    std::filesystem::path state_dir = "state";
    std::string core_cli = "dash-cli";
    std::vector<std::string> core_cli_args;
    std::vector<std::string> fallback_core_cli_args;  // second node for refresh; empty for none
    uint64_t fee = DEFAULT_FEE;
    std::chrono::seconds proof_timeout{300};
    std::chrono::milliseconds poll_interval{1000};
    std::string log_level = "info";

    // Throws AssetLockError(ConfigError) when the file cannot be read, is not
    // valid JSON, or holds a value of the wrong type
    static Config load(const std::filesystem::path& path);
    static Config parse(const nlohmann::json& j);
};

} // namespace assetlock
