#pragma once

// Scripted collaborators shared by the tests

#include <deque>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include "error.hpp"
#include "hex_utils.hpp"
#include "keys.hpp"
#include "script.hpp"
#include "services.hpp"
#include "transaction.hpp"
#include "wallet.hpp"

namespace assetlock::test {

inline PrivateKey wallet_key() {
    return PrivateKey::from_hex("1e99423a4ed27608a15a2616a2b0e9e52ced330ac530edcc32c8ffc6a526aedd");
}

// An output with a txid made of tag bytes
inline UnspentOutput make_output(uint64_t value, const std::vector<uint8_t>& script, uint8_t tag,
                                 uint32_t index = 0) {
    UnspentOutput output;
    output.outpoint.txid.fill(tag);
    output.outpoint.index = index;
    output.value = value;
    output.script_pubkey = script;
    return output;
}

// Wallet holding one output per value, in the given order
inline std::unique_ptr<Wallet> make_wallet(std::initializer_list<uint64_t> values) {
    PrivateKey key = wallet_key();
    auto script = Script::p2pkh_for_key(key.public_key());
    std::vector<UnspentOutput> outputs;
    uint8_t tag = 1;
    for (uint64_t value : values) {
        outputs.push_back(make_output(value, script, tag++));
    }
    return std::make_unique<Wallet>(std::move(key), Network::Testnet, std::move(outputs));
}

inline AssetLockProof make_proof(const Transaction& tx) {
    AssetLockProof proof;
    proof.kind = ProofKind::Instant;
    proof.outpoint = Outpoint{tx.txid(), LOCK_OUTPUT_INDEX};
    proof.instant_lock = {0x01, 0xaa, 0xbb};
    proof.transaction = tx.serialize();
    return proof;
}

class FakeStore : public DurableStore {
public:
    std::optional<std::string> read(const std::string& key) override {
        auto it = records.find(key);
        if (it == records.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void write(const std::string& key, const std::string& data) override {
        if (fail_writes) {
            throw AssetLockError(AssetLockError::ErrorType::PersistenceError, "disk full");
        }
        ++writes;
        records[key] = data;
    }

    void erase(const std::string& key) override {
        if (fail_writes) {
            throw AssetLockError(AssetLockError::ErrorType::PersistenceError, "disk full");
        }
        records.erase(key);
    }

    std::map<std::string, std::string> records;
    bool fail_writes = false;
    int writes = 0;
};

// Ordered record of collaborator calls
using CallLog = std::vector<std::string>;

// Reports a fixed set of unspent outputs for any address
class FakeUtxoSource : public UtxoSource {
public:
    std::string name() const override { return "fake"; }
    std::vector<UnspentOutput> fetch(const std::string&) override { return outputs; }

    std::vector<UnspentOutput> outputs;
};

class FakeChain : public ChainStatusService {
public:
    explicit FakeChain(CallLog& log) : log_(log) {}

    BlockHash get_tip() override {
        log_.push_back("tip");
        return tip;
    }

    TransactionStatus get_transaction(const Txid& txid) override {
        log_.push_back("lookup");
        auto it = transactions.find(txid);
        if (it == transactions.end()) {
            throw AssetLockError(AssetLockError::ErrorType::NetworkError, "No such transaction");
        }
        return it->second;
    }

    BlockHash tip = "tip";
    std::map<Txid, TransactionStatus> transactions;

private:
    CallLog& log_;
};

class FakeSubmission : public SubmissionService {
public:
    explicit FakeSubmission(CallLog& log) : log_(log) {}

    SubmitResult submit(std::span<const uint8_t> raw_transaction) override {
        log_.push_back("submit");
        submitted.emplace_back(raw_transaction.begin(), raw_transaction.end());
        if (results.empty()) {
            return SubmitResult{SubmitStatus::Accepted, ""};
        }
        SubmitResult result = results.front();
        results.pop_front();
        return result;
    }

    std::deque<SubmitResult> results;  // Accepted once exhausted
    std::vector<std::vector<uint8_t>> submitted;

private:
    CallLog& log_;
};

// Attests the most recently submitted transaction on streams anchored at one
// of attesting_anchors. Streams at other anchors stay silent, which the
// protocol sees as a timeout.
class FakeAttestation : public AttestationService {
public:
    FakeAttestation(CallLog& log, FakeSubmission& submission) : log_(log), submission_(submission) {}

    std::unique_ptr<AttestationStream> subscribe(const BlockHash& anchor,
                                                 const std::string& recipient_address) override {
        log_.push_back("subscribe:" + anchor);
        anchors.push_back(anchor);
        recipients.push_back(recipient_address);
        return std::make_unique<Stream>(*this, anchor);
    }

    std::set<BlockHash> attesting_anchors{"tip"};
    std::vector<AttestationEvent> unrelated;  // delivered before the real attestation
    std::vector<BlockHash> anchors;
    std::vector<std::string> recipients;

private:
    class Stream : public AttestationStream {
    public:
        Stream(FakeAttestation& service, BlockHash anchor) : service_(service), anchor_(std::move(anchor)) {}

        std::optional<AttestationEvent> next(std::chrono::steady_clock::time_point,
                                             std::stop_token stop) override {
            if (stop.stop_requested()) {
                return std::nullopt;
            }
            if (unrelated_sent_ < service_.unrelated.size()) {
                return service_.unrelated[unrelated_sent_++];
            }
            if (delivered_ || !service_.attesting_anchors.contains(anchor_) ||
                service_.submission_.submitted.empty()) {
                return std::nullopt;
            }
            delivered_ = true;
            Transaction tx = Transaction::deserialize(service_.submission_.submitted.back());
            return AttestationEvent{tx.txid(), make_proof(tx)};
        }

    private:
        FakeAttestation& service_;
        BlockHash anchor_;
        size_t unrelated_sent_ = 0;
        bool delivered_ = false;
    };

    CallLog& log_;
    FakeSubmission& submission_;
};

class FakePlatform : public PlatformService {
public:
    struct Call {
        std::string kind;
        Txid txid;
        AssetLockProof proof;
        Hash256 identity_id;
        size_t identity_keys;
    };

    void register_identity(const Transaction& lock_transaction, const AssetLockProof& proof,
                           const PrivateKey&, const OperationPayload& payload) override {
        record("register", lock_transaction, proof, payload);
    }

    void top_up(const Transaction& lock_transaction, const AssetLockProof& proof,
                const PrivateKey&, const OperationPayload& payload) override {
        record("topup", lock_transaction, proof, payload);
    }

    std::vector<Call> calls;
    int failures_left = 0;

private:
    void record(const std::string& kind, const Transaction& tx, const AssetLockProof& proof,
                const OperationPayload& payload) {
        calls.push_back(Call{kind, tx.txid(), proof, payload.identity_id, payload.identity_keys.size()});
        if (failures_left > 0) {
            --failures_left;
            throw AssetLockError(AssetLockError::ErrorType::PlatformError, "platform unavailable");
        }
    }
};

} // namespace assetlock::test
