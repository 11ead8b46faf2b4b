#pragma once

// Interfaces of the collaborators the asset-lock subsystem talks to. The
// node-backed implementations live in core_services.hpp and file_store.hpp;
// tests substitute scripted fakes.

#include <chrono>
#include <memory>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <vector>
#include "keys.hpp"
#include "proof.hpp"
#include "transaction.hpp"
#include "utxo.hpp"

namespace assetlock {

using BlockHash = std::string;  // display hex

struct TransactionStatus {
    std::optional<BlockHash> confirming_block;  // empty while unconfirmed
};

class ChainStatusService {
public:
    virtual ~ChainStatusService() = default;

    virtual BlockHash get_tip() = 0;

    // Throws AssetLockError(NetworkError) when the node does not know the
    // transaction
    virtual TransactionStatus get_transaction(const Txid& txid) = 0;
};

enum class SubmitStatus {
    Accepted,
    AlreadySubmitted,  // the same transaction is already in the chain
    Rejected
};

struct SubmitResult {
    SubmitStatus status = SubmitStatus::Accepted;
    std::string message;
};

class SubmissionService {
public:
    virtual ~SubmissionService() = default;
    virtual SubmitResult submit(std::span<const uint8_t> raw_transaction) = 0;
};

struct AttestationEvent {
    Txid txid{};
    AssetLockProof proof;
};

class AttestationStream {
public:
    virtual ~AttestationStream() = default;

    // Blocks until the next event, the deadline, or a stop request. Returns
    // nullopt in the latter two cases; throws AssetLockError(NetworkError)
    // when the stream breaks.
    virtual std::optional<AttestationEvent> next(std::chrono::steady_clock::time_point deadline,
                                                 std::stop_token stop) = 0;
};

class AttestationService {
public:
    virtual ~AttestationService() = default;

    // Opens a stream of attestations for lock transactions crediting
    // recipient_address, starting from anchor
    virtual std::unique_ptr<AttestationStream> subscribe(const BlockHash& anchor,
                                                         const std::string& recipient_address) = 0;
};

class UtxoSource {
public:
    virtual ~UtxoSource() = default;
    virtual std::string name() const = 0;
    virtual std::vector<UnspentOutput> fetch(const std::string& address) = 0;
};

// Key/value persistence. Every method throws AssetLockError(PersistenceError)
// on an I/O failure.
class DurableStore {
public:
    virtual ~DurableStore() = default;
    virtual std::optional<std::string> read(const std::string& key) = 0;
    virtual void write(const std::string& key, const std::string& data) = 0;
    virtual void erase(const std::string& key) = 0;
};

// What a registration or top-up hands to the platform besides the proof
struct OperationPayload {
    Hash256 identity_id{};
    std::vector<PrivateKey> identity_keys;  // registration only
};

// Mint and top-up on the platform side. Implementations throw
// AssetLockError(PlatformError) when the platform refuses the request.
class PlatformService {
public:
    virtual ~PlatformService() = default;

    virtual void register_identity(const Transaction& lock_transaction,
                                   const AssetLockProof& proof,
                                   const PrivateKey& one_time_key,
                                   const OperationPayload& payload) = 0;

    virtual void top_up(const Transaction& lock_transaction,
                        const AssetLockProof& proof,
                        const PrivateKey& one_time_key,
                        const OperationPayload& payload) = 0;
};

} // namespace assetlock
