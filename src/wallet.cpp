#include "wallet.hpp"
#include "consts.hpp"
#include "error.hpp"
#include "logging.hpp"
#include "script.hpp"
#include <iomanip>
#include <sstream>

namespace assetlock {

using json = nlohmann::json;

namespace {
logging::Logger& logger() {
    static logging::Logger l = logging::get_logger("assetlock.core");
    return l;
}
} // namespace

Wallet::Wallet(PrivateKey key, Network network, std::vector<UnspentOutput> outputs)
    : key_(std::move(key))
    , network_(network)
    , public_key_(key_.public_key())
    , script_pubkey_(Script::p2pkh_for_key(public_key_))
    , address_(Script::address_for_key(public_key_, network))
    , ledger_(std::move(outputs))
{}

// Convert the smallest unit to whole coins with fixed-point notation and
// 8 decimal places
std::string Wallet::format_balance() const {
    double coins = static_cast<double>(balance()) / static_cast<double>(COIN);
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(8) << coins;
    return ss.str();
}

void Wallet::refresh(UtxoSource& source, const ReservedOutpoints& reserved) {
    LOG_INFO(logger(), "Refreshing " << address_ << " from " << source.name());
    auto outputs = source.fetch(address_);
    if (!reserved) {
        ledger_.refresh(std::move(outputs));
        return;
    }

    ledger_.transact([&](UtxoLedger::Locked& ledger) {
        std::set<Outpoint> held = reserved();
        size_t dropped = std::erase_if(outputs, [&held](const UnspentOutput& output) {
            return held.contains(output.outpoint);
        });
        if (dropped > 0) {
            LOG_INFO(logger(), "Keeping " << dropped << " outputs spent by pending locks out of the ledger");
        }
        ledger.reset(std::move(outputs));
    });
}

// The record holds the wallet key and its outputs only. One-time lock keys
// belong to continuation slots and are never written here.
json Wallet::to_json() const {
    return json{
        {"network", network_name(network_)},
        {"private_key", key_.to_wif(network_)},
        {"address", address_},
        {"utxos", ledger_.outputs()}
    };
}

std::unique_ptr<Wallet> Wallet::from_json(const json& j) {
    try {
        Network network = network_from_string(j.at("network").get<std::string>());
        PrivateKey key = PrivateKey::from_wif(j.at("private_key").get<std::string>(), network);
        auto outputs = j.at("utxos").get<std::vector<UnspentOutput>>();
        return std::make_unique<Wallet>(std::move(key), network, std::move(outputs));
    } catch (const json::exception& e) {
        throw AssetLockError(AssetLockError::ErrorType::PersistenceError,
            std::string("Corrupt wallet record: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw AssetLockError(AssetLockError::ErrorType::PersistenceError,
            std::string("Corrupt wallet record: ") + e.what());
    }
}

std::string FallbackUtxoSource::name() const {
    return primary_.name() + " (fallback " + secondary_.name() + ")";
}

std::vector<UnspentOutput> FallbackUtxoSource::fetch(const std::string& address) {
    try {
        return primary_.fetch(address);
    } catch (const std::exception& first) {
        LOG_WARN(logger(), primary_.name() << " failed, trying " << secondary_.name() << ": " << first.what());
        try {
            return secondary_.fetch(address);
        } catch (const std::exception& second) {
            throw AssetLockError(AssetLockError::ErrorType::NetworkError,
                "First error from " + primary_.name() + ": " + first.what() +
                ", second error from " + secondary_.name() + ": " + second.what());
        }
    }
}

} // namespace assetlock
