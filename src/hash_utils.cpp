#include "hash_utils.hpp"

namespace assetlock {

// SHA256 produces a fixed-size 32-byte output regardless of the input size.
// On the base ledger it underlies transaction ids, signature hashes and the
// Base58Check checksum.
Hash256 HashUtils::sha256(std::span<const uint8_t> data) {
    Hash256 hash;
    SHA256_CTX sha256;
    SHA256_Init(&sha256);
    SHA256_Update(&sha256, data.data(), data.size());
    SHA256_Final(hash.data(), &sha256);
    return hash;
}

// Double SHA256 is used for transaction ids and for the legacy signature hash.
Hash256 HashUtils::double_sha256(std::span<const uint8_t> data) {
    auto first_hash = sha256(data);
    return sha256(std::span<const uint8_t>(first_hash.data(), first_hash.size()));
}

Hash160 HashUtils::ripemd160(std::span<const uint8_t> data) {
    Hash160 hash;
    RIPEMD160_CTX ripemd160;
    RIPEMD160_Init(&ripemd160);
    RIPEMD160_Update(&ripemd160, data.data(), data.size());
    RIPEMD160_Final(hash.data(), &ripemd160);
    return hash;
}

// HASH160 shortens a compressed public key to the 20 bytes carried by a
// pay-to-public-key-hash locking script and by addresses.
Hash160 HashUtils::hash160(std::span<const uint8_t> data) {
    auto sha256_result = sha256(data);
    return ripemd160(std::span<const uint8_t>(sha256_result.data(), sha256_result.size()));
}

std::array<uint8_t, 4> HashUtils::checksum(std::span<const uint8_t> data) {
    auto hash = double_sha256(data);
    return {hash[0], hash[1], hash[2], hash[3]};
}

} // namespace assetlock
