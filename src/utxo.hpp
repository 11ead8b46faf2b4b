#pragma once

#include <algorithm>
#include <array>
#include <compare>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "hex_utils.hpp"

namespace assetlock {

using Txid = std::array<uint8_t, 32>;

struct Outpoint {
    Txid txid{};        // Transaction ID as bytes in internal (little-endian) order
    uint32_t index = 0; // Output index in transaction

    // "<display txid>:<index>"
    std::string to_string() const {
        return HexUtils::encode_reversed(txid) + ":" + std::to_string(index);
    }

    auto operator<=>(const Outpoint&) const = default;
};

struct UnspentOutput {
    Outpoint outpoint;
    uint64_t value = 0;                 // Amount in the smallest unit
    std::vector<uint8_t> script_pubkey; // Locking script

    bool operator==(const UnspentOutput&) const = default;
};

// Txids are persisted in display order so state files can be compared with
// node and explorer output
inline void to_json(nlohmann::json& j, const Outpoint& o) {
    j = nlohmann::json{{"txid", HexUtils::encode_reversed(o.txid)}, {"index", o.index}};
}

inline void from_json(const nlohmann::json& j, Outpoint& o) {
    auto bytes = HexUtils::decode_reversed(j.at("txid").get<std::string>());
    if (bytes.size() != o.txid.size()) {
        throw std::invalid_argument("Outpoint txid must be 32 bytes");
    }
    std::copy(bytes.begin(), bytes.end(), o.txid.begin());
    j.at("index").get_to(o.index);
}

inline void to_json(nlohmann::json& j, const UnspentOutput& u) {
    j = nlohmann::json{
        {"outpoint", u.outpoint},
        {"value", u.value},
        {"script_pubkey", HexUtils::encode(u.script_pubkey)}
    };
}

inline void from_json(const nlohmann::json& j, UnspentOutput& u) {
    j.at("outpoint").get_to(u.outpoint);
    j.at("value").get_to(u.value);
    u.script_pubkey = HexUtils::decode(j.at("script_pubkey").get<std::string>());
}

} // namespace assetlock
