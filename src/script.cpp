#include "script.hpp"
#include "base58.hpp"
#include "consts.hpp"
#include "error.hpp"
#include <algorithm>

namespace assetlock {

// Pay-to-Public-Key-Hash locking script
//
// P2PKH structure (25 bytes total):
// - 0x76     : OP_DUP
// - 0xA9     : OP_HASH160
// - 0x14     : Push 20 bytes
// - [20 bytes]: HASH160 of the compressed public key
// - 0x88     : OP_EQUALVERIFY
// - 0xAC     : OP_CHECKSIG
std::vector<uint8_t> Script::p2pkh(const Hash160& pubkey_hash) {
    std::vector<uint8_t> script;
    script.reserve(P2PKH_SCRIPT_SIZE);
    script.push_back(OP_DUP);
    script.push_back(OP_HASH160);
    script.push_back(PUBKEY_HASH_SIZE);
    script.insert(script.end(), pubkey_hash.begin(), pubkey_hash.end());
    script.push_back(OP_EQUALVERIFY);
    script.push_back(OP_CHECKSIG);
    return script;
}

std::vector<uint8_t> Script::p2pkh_for_key(std::span<const uint8_t> public_key) {
    return p2pkh(HashUtils::hash160(public_key));
}

// The lock output is provably unspendable: OP_RETURN with no data. Its value
// is what the platform later credits.
std::vector<uint8_t> Script::op_return(std::span<const uint8_t> data) {
    if (data.size() > 75) {
        throw AssetLockError(AssetLockError::ErrorType::MalformedScript,
            "OP_RETURN data too long");
    }

    std::vector<uint8_t> script;
    script.push_back(OP_RETURN);
    if (!data.empty()) {
        script.push_back(static_cast<uint8_t>(data.size()));
        script.insert(script.end(), data.begin(), data.end());
    }
    return script;
}

std::optional<Hash160> Script::extract_p2pkh_hash(std::span<const uint8_t> script) {
    if (script.size() != P2PKH_SCRIPT_SIZE ||
        script[0] != OP_DUP ||
        script[1] != OP_HASH160 ||
        script[2] != PUBKEY_HASH_SIZE ||
        script[23] != OP_EQUALVERIFY ||
        script[24] != OP_CHECKSIG) {
        return std::nullopt;
    }

    Hash160 hash;
    std::copy_n(script.begin() + 3, hash.size(), hash.begin());
    return hash;
}

// Legacy unlocking script for a P2PKH input
//
// - [1 byte]  : Length of signature + 1
// - [variable]: DER signature
// - [1 byte]  : Sighash type
// - [1 byte]  : Length of the public key (0x21)
// - [33 bytes]: Compressed public key
std::vector<uint8_t> Script::script_sig(std::span<const uint8_t> der_signature,
                                        uint8_t hash_type,
                                        std::span<const uint8_t> public_key) {
    if (der_signature.size() + 1 > 75 || public_key.size() != COMPRESSED_PUBKEY_SIZE) {
        throw AssetLockError(AssetLockError::ErrorType::MalformedScript,
            "Unexpected signature or public key size");
    }

    std::vector<uint8_t> script;
    script.push_back(static_cast<uint8_t>(der_signature.size() + 1));
    script.insert(script.end(), der_signature.begin(), der_signature.end());
    script.push_back(hash_type);
    script.push_back(static_cast<uint8_t>(public_key.size()));
    script.insert(script.end(), public_key.begin(), public_key.end());
    return script;
}

ScriptSigParts Script::parse_script_sig(std::span<const uint8_t> script) {
    auto malformed = [] {
        return AssetLockError(AssetLockError::ErrorType::MalformedScript,
            "Unlocking script is not <signature> <public key>");
    };

    if (script.empty()) {
        throw malformed();
    }
    size_t sig_len = script[0];
    if (sig_len == 0 || sig_len > 75 || script.size() < 1 + sig_len + 1) {
        throw malformed();
    }
    size_t key_len = script[1 + sig_len];
    if (key_len != COMPRESSED_PUBKEY_SIZE || script.size() != 2 + sig_len + key_len) {
        throw malformed();
    }

    ScriptSigParts parts;
    parts.signature.assign(script.begin() + 1, script.begin() + 1 + sig_len);
    parts.public_key.assign(script.begin() + 2 + sig_len, script.end());
    return parts;
}

std::string Script::address(const Hash160& pubkey_hash, Network network) {
    return Base58::encode_check(
        network == Network::Mainnet ? PUBKEY_ADDRESS_MAINNET : PUBKEY_ADDRESS_TESTNET,
        pubkey_hash);
}

std::string Script::address_for_key(std::span<const uint8_t> public_key, Network network) {
    return address(HashUtils::hash160(public_key), network);
}

Hash160 Script::decode_address(const std::string& address, Network network) {
    auto data = Base58::decode_check(address);
    const uint8_t expected =
        network == Network::Mainnet ? PUBKEY_ADDRESS_MAINNET : PUBKEY_ADDRESS_TESTNET;
    if (data.size() != 1 + PUBKEY_HASH_SIZE || data[0] != expected) {
        throw AssetLockError(AssetLockError::ErrorType::Base58DecodeError,
            "Address " + address + " is not a " + network_name(network) + " P2PKH address");
    }

    Hash160 hash;
    std::copy(data.begin() + 1, data.end(), hash.begin());
    return hash;
}

std::optional<std::string> Script::address_for_script(std::span<const uint8_t> script,
                                                      Network network) {
    auto hash = extract_p2pkh_hash(script);
    if (!hash) {
        return std::nullopt;
    }
    return address(*hash, network);
}

} // namespace assetlock
