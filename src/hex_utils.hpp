#pragma once

#include <algorithm>
#include <cstdint>
#include <span>
#include <string>
#include <vector>
#include <stdexcept>

namespace assetlock {

class HexUtils {
public:
    // Convert a hexadecimal string to a byte vector
    static std::vector<uint8_t> decode(const std::string& hex) {
        if (hex.length() % 2 != 0) {
            throw std::invalid_argument("Invalid hex string length");
        }

        std::vector<uint8_t> bytes;
        bytes.reserve(hex.length() / 2);

        for (size_t i = 0; i < hex.length(); i += 2) {
            int high = nibble(hex[i]);
            int low = nibble(hex[i + 1]);
            if (high < 0 || low < 0) {
                throw std::invalid_argument("Invalid hex character");
            }
            bytes.push_back(static_cast<uint8_t>((high << 4) | low));
        }

        return bytes;
    }

    // Convert a byte sequence to a hexadecimal string
    static std::string encode(std::span<const uint8_t> data) {
        std::string result;
        result.reserve(data.size() * 2);

        static const char hex_chars[] = "0123456789abcdef";
        for (uint8_t byte : data) {
            result.push_back(hex_chars[byte >> 4]);
            result.push_back(hex_chars[byte & 0x0F]);
        }

        return result;
    }

    // Hashes are stored in internal byte order but displayed reversed
    static std::string encode_reversed(std::span<const uint8_t> data) {
        std::vector<uint8_t> reversed(data.rbegin(), data.rend());
        return encode(reversed);
    }

    static std::vector<uint8_t> decode_reversed(const std::string& hex) {
        auto bytes = decode(hex);
        std::reverse(bytes.begin(), bytes.end());
        return bytes;
    }

private:
    static int nibble(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
};

} // namespace assetlock
