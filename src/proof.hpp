#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "hex_utils.hpp"
#include "utxo.hpp"

namespace assetlock {

enum class ProofKind {
    Instant,  // the lock transaction is covered by an instant-send lock
    Chain     // the lock transaction is in a chain-locked block
};

// Attestation that a specific asset-lock output exists. The platform treats
// the bytes as opaque; this subsystem only carries them from the attestation
// stream to the mint or top-up request.
struct AssetLockProof {
    ProofKind kind = ProofKind::Instant;
    Outpoint outpoint;                     // lock transaction and the output the proof binds to
    std::vector<uint8_t> instant_lock;     // serialized instant-send lock (Instant only)
    std::vector<uint8_t> transaction;      // raw lock transaction (Instant only)
    uint32_t core_chain_locked_height = 0; // height of the chain-locked block (Chain only)

    bool operator==(const AssetLockProof&) const = default;
};

inline const char* proof_kind_name(ProofKind kind) {
    return kind == ProofKind::Instant ? "instant" : "chain";
}

inline void to_json(nlohmann::json& j, const AssetLockProof& p) {
    j = nlohmann::json{
        {"kind", proof_kind_name(p.kind)},
        {"outpoint", p.outpoint}
    };
    if (p.kind == ProofKind::Instant) {
        j["instant_lock"] = HexUtils::encode(p.instant_lock);
        j["transaction"] = HexUtils::encode(p.transaction);
    } else {
        j["core_chain_locked_height"] = p.core_chain_locked_height;
    }
}

inline void from_json(const nlohmann::json& j, AssetLockProof& p) {
    auto kind = j.at("kind").get<std::string>();
    if (kind == "instant") {
        p.kind = ProofKind::Instant;
        p.instant_lock = HexUtils::decode(j.at("instant_lock").get<std::string>());
        p.transaction = HexUtils::decode(j.at("transaction").get<std::string>());
    } else if (kind == "chain") {
        p.kind = ProofKind::Chain;
        j.at("core_chain_locked_height").get_to(p.core_chain_locked_height);
    } else {
        throw std::invalid_argument("Unknown proof kind: " + kind);
    }
    j.at("outpoint").get_to(p.outpoint);
}

} // namespace assetlock
