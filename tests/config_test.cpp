#include "gtest/gtest.h"
#include "config.hpp"
#include "error.hpp"
#include "logging.hpp"

#include <filesystem>
#include <fstream>
#include <functional>

using namespace assetlock;
using json = nlohmann::json;

namespace {

const std::string kKey = "1e99423a4ed27608a15a2616a2b0e9e52ced330ac530edcc32c8ffc6a526aedd";

AssetLockError::ErrorType failure_of(const std::function<void()>& f) {
    try {
        f();
    } catch (const AssetLockError& e) {
        return e.type();
    }
    ADD_FAILURE() << "no AssetLockError thrown";
    return AssetLockError::ErrorType::Cancelled;
}

TEST(config_test, defaults) {
    Config config = Config::parse(json{{"private_key", kKey}});
    ASSERT_EQ(config.network, Network::Testnet);
    ASSERT_EQ(config.private_key, kKey);
    ASSERT_EQ(config.state_dir, std::filesystem::path("state"));
    ASSERT_EQ(config.core_cli, "dash-cli");
    ASSERT_TRUE(config.core_cli_args.empty());
    ASSERT_TRUE(config.fallback_core_cli_args.empty());
    ASSERT_EQ(config.fee, DEFAULT_FEE);
    ASSERT_EQ(config.proof_timeout, std::chrono::seconds(300));
    ASSERT_EQ(config.poll_interval, std::chrono::milliseconds(1000));
    ASSERT_EQ(config.log_level, "info");
}

TEST(config_test, every_key) {
    Config config = Config::parse(json{
        {"network", "mainnet"},
        {"private_key", kKey},
        {"state_dir", "/var/lib/assetlock"},
        {"core_cli", "/opt/dash/bin/dash-cli"},
        {"core_cli_args", json::array({"-testnet", "-rpcport=19998"})},
        {"fallback_core_cli_args", json::array({"-testnet", "-rpcconnect=10.0.0.2"})},
        {"fee", 1000},
        {"proof_timeout_seconds", 30},
        {"poll_interval_ms", 250},
        {"log_level", "debug"}
    });
    ASSERT_EQ(config.network, Network::Mainnet);
    ASSERT_EQ(config.state_dir, std::filesystem::path("/var/lib/assetlock"));
    ASSERT_EQ(config.core_cli, "/opt/dash/bin/dash-cli");
    ASSERT_EQ(config.core_cli_args, (std::vector<std::string>{"-testnet", "-rpcport=19998"}));
    ASSERT_EQ(config.fallback_core_cli_args.size(), 2u);
    ASSERT_EQ(config.fee, 1000u);
    ASSERT_EQ(config.proof_timeout, std::chrono::seconds(30));
    ASSERT_EQ(config.poll_interval, std::chrono::milliseconds(250));
    ASSERT_EQ(config.log_level, "debug");
}

TEST(config_test, devnet_uses_testnet_encoding) {
    Config config = Config::parse(json{{"network", "devnet"}, {"private_key", kKey}});
    ASSERT_EQ(config.network, Network::Testnet);
}

TEST(config_test, invalid_values) {
    ASSERT_EQ(failure_of([] { Config::parse(json::array()); }), AssetLockError::ErrorType::ConfigError);
    ASSERT_EQ(failure_of([] { Config::parse(json{{"network", "testnet"}}); }),
              AssetLockError::ErrorType::ConfigError);
    ASSERT_EQ(failure_of([] { Config::parse(json{{"private_key", kKey}, {"network", "moonnet"}}); }),
              AssetLockError::ErrorType::ConfigError);
    ASSERT_EQ(failure_of([] { Config::parse(json{{"private_key", kKey}, {"fee", "cheap"}}); }),
              AssetLockError::ErrorType::ConfigError);
    ASSERT_EQ(failure_of([] { Config::parse(json{{"private_key", kKey}, {"proof_timeout_seconds", 0}}); }),
              AssetLockError::ErrorType::ConfigError);
    ASSERT_EQ(failure_of([] { Config::parse(json{{"private_key", kKey}, {"poll_interval_ms", -5}}); }),
              AssetLockError::ErrorType::ConfigError);
}

TEST(config_test, load_from_file) {
    auto dir = std::filesystem::temp_directory_path() / "assetlock_config_test";
    std::filesystem::create_directories(dir);
    auto path = dir / "config.json";
    {
        std::ofstream file(path);
        file << R"({"private_key": ")" << kKey << R"(", "fee": 5000})";
    }
    Config config = Config::load(path);
    ASSERT_EQ(config.fee, 5000u);

    {
        std::ofstream file(path);
        file << "{ not json";
    }
    ASSERT_EQ(failure_of([&] { Config::load(path); }), AssetLockError::ErrorType::ConfigError);
    ASSERT_EQ(failure_of([&] { Config::load(dir / "missing.json"); }), AssetLockError::ErrorType::ConfigError);

    std::filesystem::remove_all(dir);
}

TEST(logging_test, set_level_accepts_spdlog_names) {
    logging::set_level("debug");
    logging::set_level("off");
    ASSERT_EQ(failure_of([] { logging::set_level("chatty"); }), AssetLockError::ErrorType::ConfigError);
    logging::set_level("info");
}

}  // namespace
