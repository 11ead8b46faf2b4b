#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <stop_token>
#include "continuation.hpp"
#include "services.hpp"
#include "wallet.hpp"

namespace assetlock {

struct FlowResult {
    slot::LockRecord lock;
    AssetLockProof proof;
    OperationPayload payload;
    bool submitted = false;  // the platform confirmed the request and the slot was cleared
};

// Lock-and-register and lock-and-top-up.
//
// Each operation resumes from whatever its continuation slot holds: a slot
// with a transaction is never rebuilt, a slot with a proof is never
// re-broadcast, a slot with a payload only needs the platform request. When
// no platform service is given the flow stops once the payload is recorded
// and the slot is kept for hand-off.
class AssetLockFlow {
public:
    static constexpr size_t IDENTITY_KEY_COUNT = 2;

    AssetLockFlow(Wallet& wallet,
                  DurableStore& store,
                  ChainStatusService& chain,
                  SubmissionService& submission,
                  AttestationService& attestation,
                  PlatformService* platform,
                  uint64_t fee,
                  std::chrono::milliseconds proof_timeout);

    // Reads both slots from the store
    void load();

    ContinuationSlot& slot(OperationKind kind);

    FlowResult register_identity(uint64_t amount, std::stop_token stop = {});
    FlowResult top_up(const Hash256& identity_id, uint64_t amount, std::stop_token stop = {});

    // Reloads the wallet from source and saves it. Inputs of the locks held
    // in either slot are left out, since the node keeps listing them until
    // the lock confirms.
    void refresh(UtxoSource& source);

    // Writes the wallet record; called after every ledger mutation
    void save_wallet();

    // Identity ids are the double SHA256 of the lock outpoint
    static Hash256 identity_id_for(const Outpoint& outpoint);

    static constexpr const char* WALLET_KEY = "wallet";

private:
    using PayloadFactory = std::function<OperationPayload(const slot::ProofReady&)>;

    FlowResult run(OperationKind kind, uint64_t amount, const PayloadFactory& make_payload, std::stop_token stop);
    ContinuationState lock_funds(ContinuationSlot& slot, uint64_t amount);

    Wallet& wallet_;
    DurableStore& store_;
    ChainStatusService& chain_;
    SubmissionService& submission_;
    AttestationService& attestation_;
    PlatformService* platform_;
    uint64_t fee_;
    std::chrono::milliseconds proof_timeout_;
    ContinuationSlot registration_;
    ContinuationSlot top_up_;
};

} // namespace assetlock
