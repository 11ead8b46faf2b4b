#pragma once

#include <cstddef>
#include <cstdint>

namespace assetlock {

    // Script Operation Codes
    constexpr uint8_t OP_0 = 0x00;
    constexpr uint8_t OP_DUP = 0x76;
    constexpr uint8_t OP_HASH160 = 0xA9;
    constexpr uint8_t OP_EQUALVERIFY = 0x88;
    constexpr uint8_t OP_CHECKSIG = 0xAC;
    constexpr uint8_t OP_RETURN = 0x6a;

    // Common script-related constants
    constexpr uint8_t COMPRESSED_PUBKEY_SIZE = 0x21; // 33 bytes
    constexpr uint8_t PUBKEY_HASH_SIZE = 0x14; // 20 bytes
    constexpr uint8_t P2PKH_SCRIPT_SIZE = 0x19; // 25 bytes
    constexpr size_t PRIVATE_KEY_SIZE = 32;

    // Transaction-related constants
    constexpr uint32_t SEQUENCE_NO_LOCKTIME = 0xFFFFFFFF;
    constexpr uint32_t SIGHASH_ALL = 0x01;
    constexpr uint16_t TX_VERSION_SPECIAL = 0x0003;
    constexpr uint16_t TX_VERSION_CLASSIC = 0x0001;
    constexpr uint16_t TX_TYPE_NORMAL = 0x0000;
    constexpr uint16_t TX_TYPE_ASSET_LOCK = 0x0008;
    constexpr uint8_t ASSET_LOCK_PAYLOAD_VERSION = 0x01;
    constexpr uint32_t LOCK_OUTPUT_INDEX = 0;

    // Wallet policy
    constexpr uint64_t DEFAULT_FEE = 30'000;
    constexpr uint64_t COIN = 100'000'000;
    constexpr size_t MAX_OUTPUTS_PER_SPLIT_TX = 24;
    constexpr uint64_t SPLIT_RESERVE = 1'000'000;
    constexpr uint64_t SPLIT_DUST_THRESHOLD = 20'000;

    // Base58Check version bytes
    constexpr uint8_t PUBKEY_ADDRESS_MAINNET = 0x4c;
    constexpr uint8_t PUBKEY_ADDRESS_TESTNET = 0x8c;
    constexpr uint8_t SECRET_KEY_MAINNET = 0xcc;
    constexpr uint8_t SECRET_KEY_TESTNET = 0xef;

    // Node RPC error codes
    constexpr int RPC_VERIFY_ALREADY_IN_CHAIN = -27;

} // namespace assetlock
