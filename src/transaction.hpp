#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "consts.hpp"
#include "hash_utils.hpp"
#include "utxo.hpp"

namespace assetlock {

struct TxIn {
    Outpoint prevout;
    std::vector<uint8_t> script_sig;
    uint32_t sequence = SEQUENCE_NO_LOCKTIME;

    bool operator==(const TxIn&) const = default;
};

struct TxOut {
    uint64_t value = 0;
    std::vector<uint8_t> script_pubkey;

    bool operator==(const TxOut&) const = default;
};

// Extra payload of an asset-lock transaction: the outputs the platform will
// credit once the lock is proven
struct AssetLockPayload {
    uint8_t version = ASSET_LOCK_PAYLOAD_VERSION;
    std::vector<TxOut> credit_outputs;

    std::vector<uint8_t> serialize() const;

    bool operator==(const AssetLockPayload&) const = default;
};

// A base ledger transaction, either a classic one or a special transaction
// carrying an extra payload (asset lock)
struct Transaction {
    uint16_t version = TX_VERSION_CLASSIC;
    uint16_t type = TX_TYPE_NORMAL;
    std::vector<TxIn> inputs;
    std::vector<TxOut> outputs;
    uint32_t lock_time = 0;
    std::optional<AssetLockPayload> payload;

    bool is_asset_lock() const { return type == TX_TYPE_ASSET_LOCK && payload.has_value(); }

    std::vector<uint8_t> serialize() const;

    // Throws std::invalid_argument when the bytes are not one complete transaction
    static Transaction deserialize(std::span<const uint8_t> bytes);

    // Double SHA256 of the serialization, internal byte order
    Txid txid() const;

    // Display (reversed) hex of the transaction id
    std::string txid_hex() const;

    // Legacy signature hash for one input
    Hash256 signature_hash(size_t input_index,
                           std::span<const uint8_t> prev_script_pubkey,
                           uint32_t hash_type = SIGHASH_ALL) const;

    uint64_t output_total() const;

    bool operator==(const Transaction&) const = default;
};

// Checks every input's unlocking script against the output it spends:
// the public key must hash to the P2PKH target and the signature must
// verify over the recomputed signature hash. spent[i] is the output
// consumed by input i. An unlocking script that does not parse fails the
// check.
bool verify_input_signatures(const Transaction& tx, const std::vector<UnspentOutput>& spent);

// Persisted as the raw hex so the stored form re-serializes byte for byte
void to_json(nlohmann::json& j, const Transaction& tx);
void from_json(const nlohmann::json& j, Transaction& tx);

} // namespace assetlock
