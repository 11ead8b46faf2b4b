#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "keys.hpp"
#include "services.hpp"
#include "utxo_ledger.hpp"

namespace assetlock {

// Single-key wallet: one signing key, the P2PKH address derived from it
// (used both to receive and for change), and the outputs paying that address
class Wallet {
public:
    Wallet(PrivateKey key, Network network, std::vector<UnspentOutput> outputs = {});

    Wallet(const Wallet&) = delete;
    Wallet& operator=(const Wallet&) = delete;

    const PrivateKey& private_key() const { return key_; }
    const std::vector<uint8_t>& public_key() const { return public_key_; }
    const std::string& address() const { return address_; }
    const std::vector<uint8_t>& script_pubkey() const { return script_pubkey_; }
    Network network() const { return network_; }

    UtxoLedger& ledger() { return ledger_; }
    const UtxoLedger& ledger() const { return ledger_; }

    uint64_t balance() const { return ledger_.balance(); }

    // Balance in whole coins with 8 decimals, for display only
    std::string format_balance() const;

    using ReservedOutpoints = std::function<std::set<Outpoint>()>;

    // Replaces the ledger with what the source reports as unspent, minus the
    // outpoints returned by reserved. reserved runs under the ledger lock.
    void refresh(UtxoSource& source, const ReservedOutpoints& reserved = {});

    nlohmann::json to_json() const;
    static std::unique_ptr<Wallet> from_json(const nlohmann::json& j);

private:
    PrivateKey key_;
    Network network_;
    std::vector<uint8_t> public_key_;
    std::vector<uint8_t> script_pubkey_;
    std::string address_;
    UtxoLedger ledger_;
};

// Asks the primary source first and the secondary one only if the primary
// fails. When both fail the error names both causes.
class FallbackUtxoSource : public UtxoSource {
public:
    FallbackUtxoSource(UtxoSource& primary, UtxoSource& secondary)
        : primary_(primary), secondary_(secondary) {}

    std::string name() const override;
    std::vector<UnspentOutput> fetch(const std::string& address) override;

private:
    UtxoSource& primary_;
    UtxoSource& secondary_;
};

} // namespace assetlock
