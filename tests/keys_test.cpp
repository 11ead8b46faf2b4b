#include "gtest/gtest.h"
#include "base58.hpp"
#include "error.hpp"
#include "hash_utils.hpp"
#include "hex_utils.hpp"
#include "keys.hpp"
#include "script.hpp"
#include "test_fakes.hpp"
#include "wallet.hpp"

#include <functional>
#include <string>
#include <vector>

using namespace assetlock;
using assetlock::test::make_wallet;
using assetlock::test::wallet_key;

namespace {

std::vector<uint8_t> bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

AssetLockError::ErrorType failure_of(const std::function<void()>& f) {
    try {
        f();
    } catch (const AssetLockError& e) {
        return e.type();
    }
    ADD_FAILURE() << "no AssetLockError thrown";
    return AssetLockError::ErrorType::Cancelled;
}

TEST(hash_utils_test, known_digests) {
    ASSERT_EQ(HexUtils::encode(HashUtils::sha256(bytes("abc"))),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    ASSERT_EQ(HexUtils::encode(HashUtils::double_sha256(std::vector<uint8_t>{})),
              "5df6e0e2761359d30a8275058e299fcc0381534545f55cf43e41983f5d4c9456");
    ASSERT_EQ(HexUtils::encode(HashUtils::ripemd160(std::vector<uint8_t>{})),
              "9c1185a5c5e9fc54612808977ee8f548b2258d31");
}

TEST(hex_utils_test, decode_and_reverse) {
    ASSERT_EQ(HexUtils::decode("00ff10"), (std::vector<uint8_t>{0x00, 0xff, 0x10}));
    ASSERT_EQ(HexUtils::encode_reversed(std::vector<uint8_t>{0x01, 0x02}), "0201");
    ASSERT_THROW(HexUtils::decode("abc"), std::invalid_argument);
    ASSERT_THROW(HexUtils::decode("zz"), std::invalid_argument);
}

TEST(base58_test, leading_zeros_and_checksum) {
    ASSERT_EQ(Base58::encode(std::vector<uint8_t>{0x00, 0x00, 0x01}), "112");
    ASSERT_EQ(Base58::decode("112"), (std::vector<uint8_t>{0x00, 0x00, 0x01}));

    std::vector<uint8_t> payload = {0xde, 0xad, 0xbe, 0xef};
    std::string encoded = Base58::encode_check(0x8c, payload);
    std::vector<uint8_t> decoded = Base58::decode_check(encoded);
    ASSERT_EQ(decoded.front(), 0x8c);
    ASSERT_EQ(std::vector<uint8_t>(decoded.begin() + 1, decoded.end()), payload);

    // a changed character breaks the checksum
    std::string corrupted = encoded;
    corrupted.back() = corrupted.back() == 'z' ? 'y' : 'z';
    ASSERT_EQ(failure_of([&] { Base58::decode_check(corrupted); }),
              AssetLockError::ErrorType::Base58DecodeError);
    ASSERT_EQ(failure_of([&] { Base58::decode("0OIl"); }), AssetLockError::ErrorType::Base58DecodeError);
}

TEST(private_key_test, public_key_is_compressed) {
    auto pub = wallet_key().public_key();
    ASSERT_EQ(pub.size(), 33u);
    ASSERT_TRUE(pub[0] == 0x02 || pub[0] == 0x03);
}

TEST(private_key_test, wif_round_trip) {
    PrivateKey key = wallet_key();
    for (Network network : {Network::Testnet, Network::Mainnet}) {
        std::string wif = key.to_wif(network);
        ASSERT_EQ(wif.size(), 52u);
        ASSERT_TRUE(PrivateKey::from_wif(wif, network) == key);
        ASSERT_TRUE(PrivateKey::parse(wif, network) == key);
    }
    ASSERT_EQ(key.to_hex(), "1e99423a4ed27608a15a2616a2b0e9e52ced330ac530edcc32c8ffc6a526aedd");
    ASSERT_TRUE(PrivateKey::parse(key.to_hex(), Network::Mainnet) == key);
}

TEST(private_key_test, wif_for_another_network_is_rejected) {
    std::string wif = wallet_key().to_wif(Network::Mainnet);
    ASSERT_EQ(failure_of([&] { PrivateKey::from_wif(wif, Network::Testnet); }),
              AssetLockError::ErrorType::InvalidKeyFormat);
}

TEST(private_key_test, invalid_scalars_are_rejected) {
    ASSERT_EQ(failure_of([] { PrivateKey::from_hex(std::string(64, '0')); }),
              AssetLockError::ErrorType::InvalidKeyFormat);
    // the curve order itself
    ASSERT_EQ(failure_of([] {
                  PrivateKey::from_hex("fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141");
              }),
              AssetLockError::ErrorType::InvalidKeyFormat);
    ASSERT_EQ(failure_of([] { PrivateKey::parse("too short", Network::Testnet); }),
              AssetLockError::ErrorType::InvalidKeyFormat);
}

TEST(private_key_test, generated_keys_differ) {
    PrivateKey a = PrivateKey::generate();
    PrivateKey b = PrivateKey::generate();
    ASSERT_FALSE(a == b);
}

TEST(private_key_test, sign_and_verify) {
    PrivateKey key = wallet_key();
    Hash256 digest = HashUtils::double_sha256(bytes("asset lock"));

    auto signature = key.sign(digest);
    ASSERT_EQ(signature[0], 0x30);
    ASSERT_TRUE(verify_signature(key.public_key(), digest, signature));

    Hash256 other = HashUtils::double_sha256(bytes("asset unlock"));
    ASSERT_FALSE(verify_signature(key.public_key(), other, signature));
    ASSERT_FALSE(verify_signature(PrivateKey::generate().public_key(), digest, signature));
}

TEST(script_test, p2pkh_address_round_trip) {
    PrivateKey key = wallet_key();
    Hash160 hash = HashUtils::hash160(key.public_key());

    std::string testnet = Script::address(hash, Network::Testnet);
    std::string mainnet = Script::address(hash, Network::Mainnet);
    ASSERT_EQ(testnet.front(), 'y');
    ASSERT_EQ(mainnet.front(), 'X');

    ASSERT_EQ(Script::decode_address(testnet, Network::Testnet), hash);
    ASSERT_EQ(failure_of([&] { Script::decode_address(mainnet, Network::Testnet); }),
              AssetLockError::ErrorType::Base58DecodeError);

    auto script = Script::p2pkh(hash);
    ASSERT_EQ(script.size(), static_cast<size_t>(P2PKH_SCRIPT_SIZE));
    ASSERT_EQ(Script::extract_p2pkh_hash(script), std::optional<Hash160>(hash));
    ASSERT_EQ(Script::address_for_script(script, Network::Testnet), std::optional<std::string>(testnet));
    ASSERT_FALSE(Script::address_for_script(Script::op_return(), Network::Testnet).has_value());
    ASSERT_EQ(Script::op_return(), std::vector<uint8_t>{OP_RETURN});
}

TEST(script_test, script_sig_parts) {
    PrivateKey key = wallet_key();
    auto der = key.sign(HashUtils::sha256(bytes("x")));
    auto script = Script::script_sig(der, 0x01, key.public_key());

    ScriptSigParts parts = Script::parse_script_sig(script);
    ASSERT_EQ(parts.public_key, key.public_key());
    ASSERT_EQ(parts.signature.size(), der.size() + 1);
    ASSERT_EQ(parts.signature.back(), 0x01);

    std::vector<uint8_t> truncated(script.begin(), script.end() - 1);
    ASSERT_EQ(failure_of([&] { Script::parse_script_sig(truncated); }),
              AssetLockError::ErrorType::MalformedScript);
}

TEST(wallet_test, record_round_trip) {
    auto wallet = make_wallet({5, 6, 7});
    nlohmann::json j = wallet->to_json();
    ASSERT_EQ(j["network"], "testnet");
    ASSERT_EQ(j["address"], wallet->address());

    auto restored = Wallet::from_json(j);
    ASSERT_TRUE(restored->private_key() == wallet->private_key());
    ASSERT_EQ(restored->address(), wallet->address());
    ASSERT_EQ(restored->ledger().outputs(), wallet->ledger().outputs());

    j.erase("utxos");
    ASSERT_EQ(failure_of([&] { Wallet::from_json(j); }), AssetLockError::ErrorType::PersistenceError);
}

TEST(wallet_test, format_balance) {
    ASSERT_EQ(make_wallet({150'000'000})->format_balance(), "1.50000000");
    ASSERT_EQ(make_wallet({1})->format_balance(), "0.00000001");
}

}  // namespace
