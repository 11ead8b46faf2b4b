#include "base58.hpp"
#include "error.hpp"
#include "hash_utils.hpp"
#include <algorithm>

namespace assetlock {

namespace {
const std::string BASE58_CHARS =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
}

// Encodes bytes as Base58.
//
// The encoding treats the input as one big-endian number and repeatedly
// divides it by 58. Each leading zero byte is written as a leading '1'.
std::string Base58::encode(std::span<const uint8_t> data) {
    std::vector<uint8_t> digits;
    for (uint8_t byte : data) {
        size_t carry = byte;
        for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
            carry += static_cast<size_t>(*it) << 8;
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        while (carry > 0) {
            digits.insert(digits.begin(), static_cast<uint8_t>(carry % 58));
            carry /= 58;
        }
    }

    std::string result;
    for (uint8_t byte : data) {
        if (byte != 0) break;
        result.push_back('1');
    }
    for (uint8_t digit : digits) {
        result.push_back(BASE58_CHARS[digit]);
    }
    return result;
}

// Decodes a Base58 string into bytes.
//
// The decoding process:
// 1. Converts each Base58 character to its corresponding value
// 2. Builds the result by multiplying existing value by 58 and adding new digits
// 3. Handles leading '1' characters (which represent leading zeros)
//
// Throws:
//   AssetLockError(Base58DecodeError) if the input contains a character
//   outside the alphabet
std::vector<uint8_t> Base58::decode(const std::string& encoded) {
    std::vector<uint8_t> result;
    for (char c : encoded) {
        auto digit = BASE58_CHARS.find(c);
        if (digit == std::string::npos) {
            throw AssetLockError(AssetLockError::ErrorType::Base58DecodeError);
        }

        // Multiply existing result by 58 and add new digit
        size_t carry = digit;
        for (auto it = result.rbegin(); it != result.rend(); ++it) {
            carry += static_cast<size_t>(*it) * 58;
            *it = static_cast<uint8_t>(carry & 0xff);
            carry >>= 8;
        }

        while (carry > 0) {
            result.insert(result.begin(), static_cast<uint8_t>(carry & 0xff));
            carry >>= 8;
        }
    }

    for (char c : encoded) {
        if (c != '1') break;
        result.insert(result.begin(), 0);
    }

    return result;
}

std::string Base58::encode_check(uint8_t version, std::span<const uint8_t> payload) {
    std::vector<uint8_t> data;
    data.reserve(payload.size() + 5);
    data.push_back(version);
    data.insert(data.end(), payload.begin(), payload.end());
    auto check = HashUtils::checksum(data);
    data.insert(data.end(), check.begin(), check.end());
    return encode(data);
}

std::vector<uint8_t> Base58::decode_check(const std::string& encoded) {
    auto data = decode(encoded);
    if (data.size() < 5) {
        throw AssetLockError(AssetLockError::ErrorType::Base58DecodeError);
    }

    std::span<const uint8_t> body(data.data(), data.size() - 4);
    auto expected = HashUtils::checksum(body);
    if (!std::equal(expected.begin(), expected.end(), data.end() - 4)) {
        throw AssetLockError(AssetLockError::ErrorType::Base58DecodeError,
            "Base58Check checksum mismatch");
    }

    data.resize(data.size() - 4);
    return data;
}

} // namespace assetlock
