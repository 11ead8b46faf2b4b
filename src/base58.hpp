#pragma once

#include <string>
#include <vector>
#include <span>
#include <cstdint>

namespace assetlock {

// Base58 is a utility class for Base58Check encoding and decoding.
//
// Base58 uses a 58-character alphabet that leaves out easily confused
// characters (0, O, I, l). Base58Check appends a 4-byte double-SHA256
// checksum before encoding; addresses and WIF private keys use it.
class Base58 {
public:
    // Encodes version byte + payload + checksum
    static std::string encode_check(uint8_t version, std::span<const uint8_t> payload);

    // Decodes a Base58Check string, verifies and strips the checksum.
    // The returned bytes still start with the version byte.
    static std::vector<uint8_t> decode_check(const std::string& encoded);

    static std::string encode(std::span<const uint8_t> data);
    static std::vector<uint8_t> decode(const std::string& encoded);

private:
    Base58() = delete;
};

} // namespace assetlock
