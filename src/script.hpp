#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>
#include "hash_utils.hpp"
#include "keys.hpp"

namespace assetlock {

// Unlocking script split into its two pushes
struct ScriptSigParts {
    std::vector<uint8_t> signature;   // DER signature followed by the sighash type byte
    std::vector<uint8_t> public_key;  // compressed public key
};

class Script {
public:
    // OP_DUP OP_HASH160 <20 bytes> OP_EQUALVERIFY OP_CHECKSIG
    static std::vector<uint8_t> p2pkh(const Hash160& pubkey_hash);

    // P2PKH locking script for a compressed public key
    static std::vector<uint8_t> p2pkh_for_key(std::span<const uint8_t> public_key);

    // OP_RETURN followed by an optional data push
    static std::vector<uint8_t> op_return(std::span<const uint8_t> data = {});

    // Returns the public key hash when the script is standard P2PKH
    static std::optional<Hash160> extract_p2pkh_hash(std::span<const uint8_t> script);

    // <len> <der signature || hash type> <len> <compressed public key>
    static std::vector<uint8_t> script_sig(std::span<const uint8_t> der_signature,
                                           uint8_t hash_type,
                                           std::span<const uint8_t> public_key);

    // Throws AssetLockError(MalformedScript) when the script is not two pushes
    static ScriptSigParts parse_script_sig(std::span<const uint8_t> script);

    // Base58Check P2PKH address
    static std::string address(const Hash160& pubkey_hash, Network network);
    static std::string address_for_key(std::span<const uint8_t> public_key, Network network);

    // Inverse of address(); throws AssetLockError(Base58DecodeError) on a bad
    // checksum or a version byte from another network
    static Hash160 decode_address(const std::string& address, Network network);

    // Address paid by a P2PKH script, or nullopt for any other script
    static std::optional<std::string> address_for_script(std::span<const uint8_t> script,
                                                         Network network);
};

} // namespace assetlock
