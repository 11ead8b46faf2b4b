#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <variant>
#include "keys.hpp"
#include "proof.hpp"
#include "services.hpp"
#include "transaction.hpp"
#include "transaction_builder.hpp"

namespace assetlock {

enum class OperationKind {
    Registration,
    TopUp
};

const char* operation_kind_name(OperationKind kind);

namespace slot {

// The lock transaction and the key its credit output pays to
struct LockRecord {
    Transaction transaction;
    PrivateKey one_time_key;
};

struct Empty {};

// Built and persisted, not yet known to the network
struct Locked {
    LockRecord lock;
};

// Accepted by the network (or found already submitted); waiting for a proof
struct Broadcast {
    LockRecord lock;
};

struct ProofReady {
    LockRecord lock;
    AssetLockProof proof;
};

// Everything the platform request needs has been generated
struct PayloadReady {
    LockRecord lock;
    AssetLockProof proof;
    OperationPayload payload;
};

} // namespace slot

using ContinuationState = std::variant<slot::Empty, slot::Locked, slot::Broadcast,
                                       slot::ProofReady, slot::PayloadReady>;

const char* state_name(const ContinuationState& state);

// The lock record of a non-empty state, or nullptr
const slot::LockRecord* lock_record(const ContinuationState& state);

// The proof of a ProofReady or PayloadReady state, or nullptr
const AssetLockProof* proof_of(const ContinuationState& state);

// Durable record of the in-flight operation of one kind.
//
// Every mutation is written to the store before the in-memory state changes;
// a failed write throws AssetLockError(PersistenceError) and leaves the slot
// as it was.
class ContinuationSlot {
public:
    using Builder = std::function<BuiltAssetLock(uint64_t amount)>;

    ContinuationSlot(OperationKind kind, DurableStore& store);

    ContinuationSlot(const ContinuationSlot&) = delete;
    ContinuationSlot& operator=(const ContinuationSlot&) = delete;

    OperationKind kind() const { return kind_; }
    std::string key() const;

    // Reads the persisted record, if any. Throws PersistenceError when the
    // record cannot be read or parsed.
    void load();

    ContinuationState state() const;
    bool empty() const;

    // Returns the persisted state unchanged when there is one (resume);
    // otherwise calls build, persists the result as Locked and returns it
    ContinuationState get_or_create(uint64_t amount, const Builder& build);

    void record_broadcast();
    void record_proof(const AssetLockProof& proof);

    // Throws AssetLockError(InvalidState) unless a proof has been recorded
    void record_payload(const OperationPayload& payload);

    void clear();

private:
    void persist(ContinuationState next);

    OperationKind kind_;
    DurableStore& store_;
    mutable std::mutex mutex_;
    ContinuationState state_;
};

std::string serialize_state(OperationKind kind, const ContinuationState& state);
ContinuationState deserialize_state(const std::string& data);

} // namespace assetlock
