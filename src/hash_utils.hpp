#pragma once

#include <array>
#include <vector>
#include <span>
#include <cstdint>
#include <openssl/sha.h>
#include <openssl/ripemd.h>

namespace assetlock {

using Hash256 = std::array<uint8_t, SHA256_DIGEST_LENGTH>;
using Hash160 = std::array<uint8_t, RIPEMD160_DIGEST_LENGTH>;

// HashUtils groups the digests used by the base ledger: transaction ids,
// signature hashes, address checksums and public key hashes
class HashUtils {
public:
    // Returns a 32-byte SHA256 hash of the input data
    static Hash256 sha256(std::span<const uint8_t> data);

    // Returns SHA256(SHA256(data))
    static Hash256 double_sha256(std::span<const uint8_t> data);

    // Returns a 20-byte RIPEMD160 hash of the input data
    static Hash160 ripemd160(std::span<const uint8_t> data);

    // Returns RIPEMD160(SHA256(data))
    static Hash160 hash160(std::span<const uint8_t> data);

    // First four bytes of double SHA256, used by Base58Check
    static std::array<uint8_t, 4> checksum(std::span<const uint8_t> data);

private:
    HashUtils() = delete;
};

} // namespace assetlock
