#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <stop_token>
#include <string>
#include "proof.hpp"
#include "services.hpp"
#include "transaction.hpp"

namespace assetlock {

enum class BroadcastState {
    Built,
    Broadcasting,
    StreamOpen,
    ProofObtained,
    Failed
};

const char* broadcast_state_name(BroadcastState state);

// Turns a signed asset-lock transaction into a lock proof.
//
// The attestation subscription is opened before the transaction is submitted
// so an attestation that arrives right after submission cannot be missed.
// A transaction the network already has is not an error: the subscription is
// re-anchored at the block that confirmed it. The transaction is never
// rebuilt or re-signed, so calling run() again with the same transaction
// after a timeout or cancellation is safe.
class BroadcastProtocol {
public:
    BroadcastProtocol(ChainStatusService& chain,
                      SubmissionService& submission,
                      AttestationService& attestation,
                      std::chrono::milliseconds timeout);

    // Throws AssetLockError with NetworkError, ProofTimeout or Cancelled.
    // on_submitted runs once the network holds the transaction, before the
    // wait for the proof starts; what it throws propagates unchanged.
    AssetLockProof run(const Transaction& tx,
                       const std::string& recipient_address,
                       std::stop_token stop = {},
                       const std::function<void()>& on_submitted = {});

    BroadcastState state() const { return state_.load(); }

private:
    void transition(BroadcastState next);
    std::unique_ptr<AttestationStream> submit(const Transaction& tx, const std::string& recipient_address);
    AssetLockProof wait_for_proof(AttestationStream& stream, const Txid& txid, std::stop_token stop);

    ChainStatusService& chain_;
    SubmissionService& submission_;
    AttestationService& attestation_;
    std::chrono::milliseconds timeout_;
    std::atomic<BroadcastState> state_{BroadcastState::Built};
};

} // namespace assetlock
