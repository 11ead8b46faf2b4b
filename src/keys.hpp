#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>
#include "secure_memory.hpp"

namespace assetlock {

enum class Network {
    Mainnet,
    Testnet
};

Network network_from_string(const std::string& name);
const char* network_name(Network network);

// A secp256k1 private key scalar held in locked memory.
//
// The wallet holds exactly one of these; every asset lock additionally
// generates a one-time key which is owned by the continuation slot of the
// operation and never by the wallet.
class PrivateKey {
public:
    // Throws AssetLockError(InvalidKeyFormat) unless the 32 bytes are a
    // valid scalar (non-zero and below the curve order)
    explicit PrivateKey(std::span<const uint8_t> secret);

    PrivateKey(const PrivateKey& other);
    PrivateKey& operator=(const PrivateKey& other);
    PrivateKey(PrivateKey&&) noexcept = default;
    PrivateKey& operator=(PrivateKey&&) noexcept = default;

    // Draws a fresh key from the OpenSSL CSPRNG
    static PrivateKey generate();

    // Accepts 64 hex characters or a WIF string (51 or 52 characters)
    static PrivateKey parse(const std::string& text, Network network);
    static PrivateKey from_hex(const std::string& hex);
    static PrivateKey from_wif(const std::string& wif, Network network);

    // Compressed WIF encoding
    std::string to_wif(Network network) const;
    std::string to_hex() const;

    std::span<const uint8_t> secret() const { return secret_->bytes(); }

    // 33-byte compressed public key
    std::vector<uint8_t> public_key() const;

    // DER-encoded ECDSA signature over a 32-byte digest, with low-S
    // normalisation. The sighash type byte is not appended.
    std::vector<uint8_t> sign(std::span<const uint8_t> digest) const;

    bool operator==(const PrivateKey& other) const;

private:
    std::unique_ptr<SecureMemory> secret_;
};

// Verifies a DER signature over a 32-byte digest against a compressed
// public key
bool verify_signature(std::span<const uint8_t> public_key,
                      std::span<const uint8_t> digest,
                      std::span<const uint8_t> der_signature);

} // namespace assetlock
