#include "asset_lock_flow.hpp"
#include "broadcast_protocol.hpp"
#include "error.hpp"
#include "hex_utils.hpp"
#include "logging.hpp"
#include "script.hpp"
#include "transaction_builder.hpp"
#include <optional>
#include <set>

namespace assetlock {

namespace {
logging::Logger& logger() {
    static logging::Logger l = logging::get_logger("assetlock.flow");
    return l;
}
} // namespace

AssetLockFlow::AssetLockFlow(Wallet& wallet,
                             DurableStore& store,
                             ChainStatusService& chain,
                             SubmissionService& submission,
                             AttestationService& attestation,
                             PlatformService* platform,
                             uint64_t fee,
                             std::chrono::milliseconds proof_timeout)
    : wallet_(wallet)
    , store_(store)
    , chain_(chain)
    , submission_(submission)
    , attestation_(attestation)
    , platform_(platform)
    , fee_(fee)
    , proof_timeout_(proof_timeout)
    , registration_(OperationKind::Registration, store)
    , top_up_(OperationKind::TopUp, store)
{}

void AssetLockFlow::load() {
    registration_.load();
    top_up_.load();
}

ContinuationSlot& AssetLockFlow::slot(OperationKind kind) {
    return kind == OperationKind::Registration ? registration_ : top_up_;
}

FlowResult AssetLockFlow::register_identity(uint64_t amount, std::stop_token stop) {
    return run(OperationKind::Registration, amount, [](const slot::ProofReady& ready) {
        OperationPayload payload;
        payload.identity_id = identity_id_for(ready.proof.outpoint);
        for (size_t i = 0; i < IDENTITY_KEY_COUNT; ++i) {
            payload.identity_keys.push_back(PrivateKey::generate());
        }
        return payload;
    }, stop);
}

FlowResult AssetLockFlow::top_up(const Hash256& identity_id, uint64_t amount, std::stop_token stop) {
    return run(OperationKind::TopUp, amount, [&identity_id](const slot::ProofReady&) {
        OperationPayload payload;
        payload.identity_id = identity_id;
        return payload;
    }, stop);
}

void AssetLockFlow::refresh(UtxoSource& source) {
    wallet_.refresh(source, [this] {
        std::set<Outpoint> held;
        for (ContinuationSlot* current : {&registration_, &top_up_}) {
            ContinuationState state = current->state();
            if (const slot::LockRecord* lock = lock_record(state)) {
                for (const auto& input : lock->transaction.inputs) {
                    held.insert(input.prevout);
                }
            }
        }
        return held;
    });
    save_wallet();
}

void AssetLockFlow::save_wallet() {
    store_.write(WALLET_KEY, wallet_.to_json().dump(4));
}

Hash256 AssetLockFlow::identity_id_for(const Outpoint& outpoint) {
    std::vector<uint8_t> data(outpoint.txid.begin(), outpoint.txid.end());
    for (size_t i = 0; i < sizeof(outpoint.index); ++i) {
        data.push_back(static_cast<uint8_t>(outpoint.index >> (8 * i)));
    }
    return HashUtils::double_sha256(data);
}

FlowResult AssetLockFlow::run(OperationKind kind, uint64_t amount, const PayloadFactory& make_payload,
                              std::stop_token stop) {
    ContinuationSlot& current = slot(kind);
    ContinuationState state = lock_funds(current, amount);

    if (proof_of(state) == nullptr) {
        const slot::LockRecord& lock = *lock_record(state);
        std::string recipient = Script::address_for_key(lock.one_time_key.public_key(), wallet_.network());

        BroadcastProtocol protocol(chain_, submission_, attestation_, proof_timeout_);
        AssetLockProof proof = protocol.run(lock.transaction, recipient, stop,
                                            [&current] { current.record_broadcast(); });
        current.record_proof(proof);
        state = current.state();
    }

    if (const auto* ready = std::get_if<slot::ProofReady>(&state)) {
        current.record_payload(make_payload(*ready));
        state = current.state();
    }

    const auto& done = std::get<slot::PayloadReady>(state);
    FlowResult result{done.lock, done.proof, done.payload, false};

    if (platform_ == nullptr) {
        LOG_INFO(logger(), operation_kind_name(kind) << " ready for the platform: "
                 << done.proof.outpoint.to_string());
        return result;
    }

    if (kind == OperationKind::Registration) {
        platform_->register_identity(done.lock.transaction, done.proof, done.lock.one_time_key, done.payload);
    } else {
        platform_->top_up(done.lock.transaction, done.proof, done.lock.one_time_key, done.payload);
    }
    LOG_INFO(logger(), operation_kind_name(kind) << " accepted for identity "
             << HexUtils::encode(done.payload.identity_id));

    current.clear();
    result.submitted = true;
    return result;
}

// Build under the ledger lock so no other operation can select the same
// outputs. If the new slot cannot be persisted the selected outputs go back
// to the ledger; the transaction was never broadcast.
ContinuationState AssetLockFlow::lock_funds(ContinuationSlot& current, uint64_t amount) {
    std::optional<std::vector<UnspentOutput>> spent;
    ContinuationState state = wallet_.ledger().transact([&](UtxoLedger::Locked& ledger) {
        try {
            return current.get_or_create(amount, [&](uint64_t requested) {
                BuiltAssetLock built = TransactionBuilder::build_asset_lock(ledger, wallet_, requested, fee_);
                spent = built.spent;
                return built;
            });
        } catch (const AssetLockError& e) {
            if (spent && e.type() == AssetLockError::ErrorType::PersistenceError) {
                ledger.restore(*spent);
            }
            throw;
        }
    });

    if (spent) {
        save_wallet();
    }
    return state;
}

} // namespace assetlock
