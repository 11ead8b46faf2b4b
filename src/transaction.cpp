#include "transaction.hpp"
#include "error.hpp"
#include "hex_utils.hpp"
#include "keys.hpp"
#include "script.hpp"
#include <algorithm>
#include <stdexcept>

namespace assetlock {

namespace {

template <typename T>
void write_le(std::vector<uint8_t>& out, T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
        out.push_back(static_cast<uint8_t>(static_cast<uint64_t>(value) >> (8 * i)));
    }
}

// CompactSize: one byte below 0xfd, otherwise a marker byte followed by a
// 2, 4 or 8 byte little-endian length
void write_compact_size(std::vector<uint8_t>& out, uint64_t size) {
    if (size < 0xfd) {
        out.push_back(static_cast<uint8_t>(size));
    } else if (size <= 0xffff) {
        out.push_back(0xfd);
        write_le<uint16_t>(out, static_cast<uint16_t>(size));
    } else if (size <= 0xffffffff) {
        out.push_back(0xfe);
        write_le<uint32_t>(out, static_cast<uint32_t>(size));
    } else {
        out.push_back(0xff);
        write_le<uint64_t>(out, size);
    }
}

void write_bytes(std::vector<uint8_t>& out, std::span<const uint8_t> bytes) {
    write_compact_size(out, bytes.size());
    out.insert(out.end(), bytes.begin(), bytes.end());
}

void write_output(std::vector<uint8_t>& out, const TxOut& output) {
    write_le<uint64_t>(out, output.value);
    write_bytes(out, output.script_pubkey);
}

class ByteReader {
public:
    explicit ByteReader(std::span<const uint8_t> data) : data_(data) {}

    template <typename T>
    T read_le() {
        require(sizeof(T));
        uint64_t value = 0;
        for (size_t i = 0; i < sizeof(T); ++i) {
            value |= static_cast<uint64_t>(data_[pos_ + i]) << (8 * i);
        }
        pos_ += sizeof(T);
        return static_cast<T>(value);
    }

    uint64_t read_compact_size() {
        uint8_t marker = read_le<uint8_t>();
        switch (marker) {
            case 0xfd: return read_le<uint16_t>();
            case 0xfe: return read_le<uint32_t>();
            case 0xff: return read_le<uint64_t>();
            default: return marker;
        }
    }

    std::vector<uint8_t> read_bytes(uint64_t count) {
        require(count);
        std::vector<uint8_t> bytes(data_.begin() + pos_, data_.begin() + pos_ + count);
        pos_ += count;
        return bytes;
    }

    std::vector<uint8_t> read_var_bytes() {
        return read_bytes(read_compact_size());
    }

    TxOut read_output() {
        TxOut output;
        output.value = read_le<uint64_t>();
        output.script_pubkey = read_var_bytes();
        return output;
    }

    bool at_end() const { return pos_ == data_.size(); }

private:
    void require(uint64_t count) const {
        if (count > data_.size() - pos_) {
            throw std::invalid_argument("Truncated transaction data");
        }
    }

    std::span<const uint8_t> data_;
    size_t pos_ = 0;
};

AssetLockPayload parse_payload(std::span<const uint8_t> bytes) {
    ByteReader reader(bytes);
    AssetLockPayload payload;
    payload.version = reader.read_le<uint8_t>();
    uint64_t count = reader.read_compact_size();
    for (uint64_t i = 0; i < count; ++i) {
        payload.credit_outputs.push_back(reader.read_output());
    }
    if (!reader.at_end()) {
        throw std::invalid_argument("Trailing bytes after asset lock payload");
    }
    return payload;
}

} // namespace

std::vector<uint8_t> AssetLockPayload::serialize() const {
    std::vector<uint8_t> out;
    out.push_back(version);
    write_compact_size(out, credit_outputs.size());
    for (const auto& output : credit_outputs) {
        write_output(out, output);
    }
    return out;
}

// Transaction layout:
// - [4 bytes]: version in the low 16 bits, special transaction type in the
//   high 16 bits (little-endian)
// - inputs: CompactSize count, then per input the 36-byte outpoint, the
//   length-prefixed unlocking script and the 4-byte sequence
// - outputs: CompactSize count, then per output the 8-byte value and the
//   length-prefixed locking script
// - [4 bytes]: lock time
// - special transactions only: the length-prefixed extra payload
std::vector<uint8_t> Transaction::serialize() const {
    std::vector<uint8_t> out;

    uint32_t version_field = static_cast<uint32_t>(version) | (static_cast<uint32_t>(type) << 16);
    write_le<uint32_t>(out, version_field);

    write_compact_size(out, inputs.size());
    for (const auto& input : inputs) {
        out.insert(out.end(), input.prevout.txid.begin(), input.prevout.txid.end());
        write_le<uint32_t>(out, input.prevout.index);
        write_bytes(out, input.script_sig);
        write_le<uint32_t>(out, input.sequence);
    }

    write_compact_size(out, outputs.size());
    for (const auto& output : outputs) {
        write_output(out, output);
    }

    write_le<uint32_t>(out, lock_time);

    if (version >= TX_VERSION_SPECIAL && type != TX_TYPE_NORMAL) {
        std::vector<uint8_t> extra = payload ? payload->serialize() : std::vector<uint8_t>{};
        write_bytes(out, extra);
    }

    return out;
}

Transaction Transaction::deserialize(std::span<const uint8_t> bytes) {
    ByteReader reader(bytes);
    Transaction tx;

    uint32_t version_field = reader.read_le<uint32_t>();
    tx.version = static_cast<uint16_t>(version_field & 0xffff);
    tx.type = static_cast<uint16_t>(version_field >> 16);

    uint64_t input_count = reader.read_compact_size();
    for (uint64_t i = 0; i < input_count; ++i) {
        TxIn input;
        auto txid = reader.read_bytes(input.prevout.txid.size());
        std::copy(txid.begin(), txid.end(), input.prevout.txid.begin());
        input.prevout.index = reader.read_le<uint32_t>();
        input.script_sig = reader.read_var_bytes();
        input.sequence = reader.read_le<uint32_t>();
        tx.inputs.push_back(std::move(input));
    }

    uint64_t output_count = reader.read_compact_size();
    for (uint64_t i = 0; i < output_count; ++i) {
        tx.outputs.push_back(reader.read_output());
    }

    tx.lock_time = reader.read_le<uint32_t>();

    if (tx.version >= TX_VERSION_SPECIAL && tx.type != TX_TYPE_NORMAL) {
        if (tx.type != TX_TYPE_ASSET_LOCK) {
            throw std::invalid_argument("Unsupported special transaction type " + std::to_string(tx.type));
        }
        tx.payload = parse_payload(reader.read_var_bytes());
    }

    if (!reader.at_end()) {
        throw std::invalid_argument("Trailing bytes after transaction");
    }
    return tx;
}

Txid Transaction::txid() const {
    return HashUtils::double_sha256(serialize());
}

std::string Transaction::txid_hex() const {
    return HexUtils::encode_reversed(txid());
}

// Legacy (pre-segwit) signature hash.
//
// The signed message is the whole transaction with every unlocking script
// emptied except the one of the input being signed, which is replaced by the
// locking script of the output it spends. The extra payload stays in place,
// so the signature commits to the credit outputs as well. The 4-byte hash
// type is appended before hashing.
Hash256 Transaction::signature_hash(size_t input_index,
                                    std::span<const uint8_t> prev_script_pubkey,
                                    uint32_t hash_type) const {
    if (input_index >= inputs.size()) {
        throw std::out_of_range("Input index " + std::to_string(input_index) + " out of range");
    }

    Transaction skeleton = *this;
    for (size_t i = 0; i < skeleton.inputs.size(); ++i) {
        if (i == input_index) {
            skeleton.inputs[i].script_sig.assign(prev_script_pubkey.begin(), prev_script_pubkey.end());
        } else {
            skeleton.inputs[i].script_sig.clear();
        }
    }

    auto message = skeleton.serialize();
    write_le<uint32_t>(message, hash_type);
    return HashUtils::double_sha256(message);
}

uint64_t Transaction::output_total() const {
    uint64_t total = 0;
    for (const auto& output : outputs) {
        total += output.value;
    }
    return total;
}

bool verify_input_signatures(const Transaction& tx, const std::vector<UnspentOutput>& spent) {
    if (spent.size() != tx.inputs.size()) {
        return false;
    }

    for (size_t i = 0; i < tx.inputs.size(); ++i) {
        if (tx.inputs[i].prevout != spent[i].outpoint) {
            return false;
        }

        auto expected_hash = Script::extract_p2pkh_hash(spent[i].script_pubkey);
        if (!expected_hash) {
            return false;
        }

        ScriptSigParts parts;
        try {
            parts = Script::parse_script_sig(tx.inputs[i].script_sig);
        } catch (const AssetLockError& e) {
            if (e.type() != AssetLockError::ErrorType::MalformedScript) {
                throw;
            }
            return false;
        }
        if (parts.signature.empty() || HashUtils::hash160(parts.public_key) != *expected_hash) {
            return false;
        }

        uint8_t hash_type = parts.signature.back();
        std::span<const uint8_t> der(parts.signature.data(), parts.signature.size() - 1);
        auto sighash = tx.signature_hash(i, spent[i].script_pubkey, hash_type);
        if (!verify_signature(parts.public_key, sighash, der)) {
            return false;
        }
    }
    return true;
}

void to_json(nlohmann::json& j, const Transaction& tx) {
    j = nlohmann::json{{"txid", tx.txid_hex()}, {"hex", HexUtils::encode(tx.serialize())}};
}

void from_json(const nlohmann::json& j, Transaction& tx) {
    tx = Transaction::deserialize(HexUtils::decode(j.at("hex").get<std::string>()));
}

} // namespace assetlock
