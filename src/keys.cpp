#include "keys.hpp"
#include "base58.hpp"
#include "consts.hpp"
#include "error.hpp"
#include "hex_utils.hpp"
#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/obj_mac.h>
#include <openssl/rand.h>
#include <array>

namespace assetlock {

namespace {

using BnPtr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using EcKeyPtr = std::unique_ptr<EC_KEY, decltype(&EC_KEY_free)>;
using EcGroupPtr = std::unique_ptr<EC_GROUP, decltype(&EC_GROUP_free)>;
using EcPointPtr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;
using EcdsaSigPtr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;

AssetLockError signing_failure(const char* what) {
    return AssetLockError(AssetLockError::ErrorType::SigningFailure, what);
}

// A private key must be a non-zero scalar strictly below the curve order n
bool is_valid_scalar(std::span<const uint8_t> secret) {
    if (secret.size() != PRIVATE_KEY_SIZE) {
        return false;
    }

    EcGroupPtr group(EC_GROUP_new_by_curve_name(NID_secp256k1), EC_GROUP_free);
    BnPtr order(BN_new(), BN_free);
    BnPtr value(BN_bin2bn(secret.data(), static_cast<int>(secret.size()), nullptr), BN_free);
    if (!group || !order || !value || !EC_GROUP_get_order(group.get(), order.get(), nullptr)) {
        throw signing_failure("Failed to load secp256k1 parameters");
    }

    return !BN_is_zero(value.get()) && BN_cmp(value.get(), order.get()) < 0;
}

// Builds an EC_KEY holding both the private scalar and the public point
// public = private * G
EcKeyPtr make_ec_key(std::span<const uint8_t> secret) {
    EcKeyPtr eckey(EC_KEY_new_by_curve_name(NID_secp256k1), EC_KEY_free);
    BnPtr priv(BN_bin2bn(secret.data(), static_cast<int>(secret.size()), nullptr), BN_free);
    if (!eckey || !priv || !EC_KEY_set_private_key(eckey.get(), priv.get())) {
        throw signing_failure("Failed to load private key");
    }

    const EC_GROUP* group = EC_KEY_get0_group(eckey.get());
    EcPointPtr pub(EC_POINT_new(group), EC_POINT_free);
    if (!pub ||
        !EC_POINT_mul(group, pub.get(), priv.get(), nullptr, nullptr, nullptr) ||
        !EC_KEY_set_public_key(eckey.get(), pub.get())) {
        throw signing_failure("Failed to derive public key");
    }

    return eckey;
}

} // namespace

Network network_from_string(const std::string& name) {
    if (name == "mainnet") {
        return Network::Mainnet;
    }
    // devnets and local networks share the testnet version bytes
    if (name == "testnet" || name == "devnet" || name == "regtest" || name == "local") {
        return Network::Testnet;
    }
    throw AssetLockError(AssetLockError::ErrorType::ConfigError, "Unknown network: " + name);
}

const char* network_name(Network network) {
    return network == Network::Mainnet ? "mainnet" : "testnet";
}

PrivateKey::PrivateKey(std::span<const uint8_t> secret) {
    if (!is_valid_scalar(secret)) {
        throw AssetLockError(AssetLockError::ErrorType::InvalidKeyFormat,
            "Private key is not a valid secp256k1 scalar");
    }
    secret_ = std::make_unique<SecureMemory>(secret);
}

PrivateKey::PrivateKey(const PrivateKey& other)
    : secret_(std::make_unique<SecureMemory>(other.secret())) {}

PrivateKey& PrivateKey::operator=(const PrivateKey& other) {
    if (this != &other) {
        secret_ = std::make_unique<SecureMemory>(other.secret());
    }
    return *this;
}

PrivateKey PrivateKey::generate() {
    std::array<uint8_t, PRIVATE_KEY_SIZE> buffer;
    for (;;) {
        if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
            throw signing_failure("Random number generator failure");
        }
        if (is_valid_scalar(buffer)) {
            PrivateKey key(buffer);
            OPENSSL_cleanse(buffer.data(), buffer.size());
            return key;
        }
    }
}

PrivateKey PrivateKey::parse(const std::string& text, Network network) {
    switch (text.size()) {
        case 64:
            return from_hex(text);
        case 51:
        case 52:
            return from_wif(text, network);
        default:
            throw AssetLockError(AssetLockError::ErrorType::InvalidKeyFormat,
                "Private key must be 64 hex characters or a WIF string");
    }
}

PrivateKey PrivateKey::from_hex(const std::string& hex) {
    std::vector<uint8_t> bytes;
    try {
        bytes = HexUtils::decode(hex);
    } catch (const std::invalid_argument& e) {
        throw AssetLockError(AssetLockError::ErrorType::InvalidKeyFormat,
            std::string("Failed to decode hex private key: ") + e.what());
    }
    PrivateKey key(bytes);
    OPENSSL_cleanse(bytes.data(), bytes.size());
    return key;
}

// Wallet Import Format:
// - [1 byte]  : secret key version (network dependent)
// - [32 bytes]: private key scalar
// - [1 byte]  : optional 0x01 marking a compressed public key
// - [4 bytes] : checksum (stripped by decode_check)
PrivateKey PrivateKey::from_wif(const std::string& wif, Network network) {
    auto data = Base58::decode_check(wif);
    const uint8_t expected_version =
        network == Network::Mainnet ? SECRET_KEY_MAINNET : SECRET_KEY_TESTNET;

    bool compressed_ok = data.size() == 34 && data[33] == 0x01;
    if (data.empty() || data[0] != expected_version || (data.size() != 33 && !compressed_ok)) {
        OPENSSL_cleanse(data.data(), data.size());
        throw AssetLockError(AssetLockError::ErrorType::InvalidKeyFormat,
            "WIF key does not match the configured network");
    }

    PrivateKey key(std::span<const uint8_t>(data.data() + 1, PRIVATE_KEY_SIZE));
    OPENSSL_cleanse(data.data(), data.size());
    return key;
}

std::string PrivateKey::to_wif(Network network) const {
    std::vector<uint8_t> payload(secret().begin(), secret().end());
    payload.push_back(0x01);
    auto wif = Base58::encode_check(
        network == Network::Mainnet ? SECRET_KEY_MAINNET : SECRET_KEY_TESTNET, payload);
    OPENSSL_cleanse(payload.data(), payload.size());
    return wif;
}

std::string PrivateKey::to_hex() const {
    return HexUtils::encode(secret());
}

// Compressed public key format:
// - First byte: 0x02 if y-coordinate is even, 0x03 if y-coordinate is odd
// - Remaining 32 bytes: x-coordinate
std::vector<uint8_t> PrivateKey::public_key() const {
    auto eckey = make_ec_key(secret());
    const EC_GROUP* group = EC_KEY_get0_group(eckey.get());

    std::vector<uint8_t> result(COMPRESSED_PUBKEY_SIZE);
    size_t size = EC_POINT_point2oct(
        group, EC_KEY_get0_public_key(eckey.get()), POINT_CONVERSION_COMPRESSED,
        result.data(), result.size(), nullptr);
    if (size != COMPRESSED_PUBKEY_SIZE) {
        throw signing_failure("Failed to serialize public key");
    }
    return result;
}

// Sign a digest with ECDSA on secp256k1, normalising S to the lower half of
// the curve order.
//
// For any valid signature (r, s) the pair (r, n - s) is also valid. Nodes
// only relay the low-S form, so a high S is replaced with n - S before DER
// encoding. Otherwise a third party could flip S and change the transaction
// id of a broadcast transaction.
std::vector<uint8_t> PrivateKey::sign(std::span<const uint8_t> digest) const {
    if (digest.size() != 32) {
        throw signing_failure("Signature digest must be 32 bytes");
    }

    auto eckey = make_ec_key(secret());

    EcdsaSigPtr sig(ECDSA_do_sign(digest.data(), static_cast<int>(digest.size()), eckey.get()),
                    ECDSA_SIG_free);
    if (!sig) {
        throw signing_failure("ECDSA signing failed");
    }

    const BIGNUM* r;
    const BIGNUM* s;
    ECDSA_SIG_get0(sig.get(), &r, &s);

    BnPtr order(BN_new(), BN_free);
    BnPtr half_order(BN_new(), BN_free);
    if (!order || !half_order ||
        !EC_GROUP_get_order(EC_KEY_get0_group(eckey.get()), order.get(), nullptr) ||
        !BN_rshift1(half_order.get(), order.get())) {
        throw signing_failure("Failed to compute curve order");
    }

    // If S > n/2, replace S with n - S
    if (BN_cmp(s, half_order.get()) > 0) {
        BnPtr new_s(BN_new(), BN_free);
        BnPtr new_r(BN_dup(r), BN_free);
        if (!new_s || !new_r || !BN_sub(new_s.get(), order.get(), s)) {
            throw signing_failure("Failed to normalise signature");
        }
        // ECDSA_SIG_set0 takes ownership of both numbers
        if (ECDSA_SIG_set0(sig.get(), new_r.get(), new_s.get()) != 1) {
            throw signing_failure("Failed to normalise signature");
        }
        new_r.release();
        new_s.release();
    }

    unsigned char* der = nullptr;
    int der_len = i2d_ECDSA_SIG(sig.get(), &der);
    if (der_len <= 0) {
        throw signing_failure("Failed to DER-encode signature");
    }

    std::vector<uint8_t> signature(der, der + der_len);
    OPENSSL_free(der);
    return signature;
}

bool PrivateKey::operator==(const PrivateKey& other) const {
    return secret().size() == other.secret().size() &&
           CRYPTO_memcmp(secret().data(), other.secret().data(), secret().size()) == 0;
}

bool verify_signature(std::span<const uint8_t> public_key,
                      std::span<const uint8_t> digest,
                      std::span<const uint8_t> der_signature) {
    EcKeyPtr eckey(EC_KEY_new_by_curve_name(NID_secp256k1), EC_KEY_free);
    if (!eckey) {
        return false;
    }

    const EC_GROUP* group = EC_KEY_get0_group(eckey.get());
    EcPointPtr point(EC_POINT_new(group), EC_POINT_free);
    if (!point ||
        !EC_POINT_oct2point(group, point.get(), public_key.data(), public_key.size(), nullptr) ||
        !EC_KEY_set_public_key(eckey.get(), point.get())) {
        return false;
    }

    const unsigned char* p = der_signature.data();
    EcdsaSigPtr sig(d2i_ECDSA_SIG(nullptr, &p, static_cast<long>(der_signature.size())),
                    ECDSA_SIG_free);
    if (!sig) {
        return false;
    }

    return ECDSA_do_verify(digest.data(), static_cast<int>(digest.size()),
                           sig.get(), eckey.get()) == 1;
}

} // namespace assetlock
