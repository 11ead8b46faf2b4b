#include "broadcast_protocol.hpp"
#include "error.hpp"
#include "hex_utils.hpp"
#include "logging.hpp"

namespace assetlock {

namespace {
logging::Logger& logger() {
    static logging::Logger l = logging::get_logger("assetlock.broadcast");
    return l;
}
} // namespace

const char* broadcast_state_name(BroadcastState state) {
    switch (state) {
        case BroadcastState::Built: return "Built";
        case BroadcastState::Broadcasting: return "Broadcasting";
        case BroadcastState::StreamOpen: return "StreamOpen";
        case BroadcastState::ProofObtained: return "ProofObtained";
        case BroadcastState::Failed: return "Failed";
    }
    return "Unknown";
}

BroadcastProtocol::BroadcastProtocol(ChainStatusService& chain,
                                     SubmissionService& submission,
                                     AttestationService& attestation,
                                     std::chrono::milliseconds timeout)
    : chain_(chain), submission_(submission), attestation_(attestation), timeout_(timeout) {}

AssetLockProof BroadcastProtocol::run(const Transaction& tx,
                                      const std::string& recipient_address,
                                      std::stop_token stop,
                                      const std::function<void()>& on_submitted) {
    state_ = BroadcastState::Built;
    try {
        transition(BroadcastState::Broadcasting);
        auto stream = submit(tx, recipient_address);
        if (on_submitted) {
            on_submitted();
        }
        transition(BroadcastState::StreamOpen);

        AssetLockProof proof = wait_for_proof(*stream, tx.txid(), stop);
        transition(BroadcastState::ProofObtained);
        return proof;
    } catch (const AssetLockError& e) {
        LOG_WARN(logger(), "Broadcast of " << tx.txid_hex() << " failed: " << e.what());
        transition(BroadcastState::Failed);
        // a node answer that cannot be parsed is a failure of the network side
        if (e.type() == AssetLockError::ErrorType::RPCError) {
            throw AssetLockError(AssetLockError::ErrorType::NetworkError, e.what());
        }
        throw;
    } catch (const std::exception& e) {
        LOG_ERROR(logger(), "Broadcast of " << tx.txid_hex() << " failed: " << e.what());
        transition(BroadcastState::Failed);
        throw AssetLockError(AssetLockError::ErrorType::NetworkError, e.what());
    }
}

void BroadcastProtocol::transition(BroadcastState next) {
    LOG_INFO(logger(), broadcast_state_name(state_.load()) << " -> " << broadcast_state_name(next));
    state_ = next;
}

// Subscribe at the tip, then submit. When the node reports the transaction
// as already in the chain, the first subscription started too late to see
// its attestation, so it is replaced by one anchored at the confirming block
// (or at the current tip while the transaction is still unconfirmed).
std::unique_ptr<AttestationStream> BroadcastProtocol::submit(const Transaction& tx,
                                                             const std::string& recipient_address) {
    BlockHash tip = chain_.get_tip();
    auto stream = attestation_.subscribe(tip, recipient_address);
    LOG_DEBUG(logger(), "Subscribed for " << recipient_address << " at " << tip);

    SubmitResult result = submission_.submit(tx.serialize());
    switch (result.status) {
        case SubmitStatus::Accepted:
            LOG_INFO(logger(), "Submitted " << tx.txid_hex());
            return stream;

        case SubmitStatus::AlreadySubmitted: {
            TransactionStatus status = chain_.get_transaction(tx.txid());
            BlockHash anchor = status.confirming_block ? *status.confirming_block : chain_.get_tip();
            LOG_INFO(logger(), tx.txid_hex() << " already submitted, re-anchoring at " << anchor);
            stream.reset();
            return attestation_.subscribe(anchor, recipient_address);
        }

        case SubmitStatus::Rejected:
            break;
    }
    throw AssetLockError(AssetLockError::ErrorType::NetworkError,
        "Transaction " + tx.txid_hex() + " rejected: " + result.message);
}

AssetLockProof BroadcastProtocol::wait_for_proof(AttestationStream& stream, const Txid& txid,
                                                 std::stop_token stop) {
    const auto deadline = std::chrono::steady_clock::now() + timeout_;
    while (true) {
        auto event = stream.next(deadline, stop);
        if (!event) {
            if (stop.stop_requested()) {
                throw AssetLockError(AssetLockError::ErrorType::Cancelled,
                    "Stopped waiting for the proof of " + HexUtils::encode_reversed(txid));
            }
            throw AssetLockError(AssetLockError::ErrorType::ProofTimeout,
                "No proof for " + HexUtils::encode_reversed(txid) + " within " +
                std::to_string(timeout_.count()) + " ms");
        }
        if (event->txid == txid) {
            LOG_INFO(logger(), "Got " << proof_kind_name(event->proof.kind) << " proof for "
                     << event->proof.outpoint.to_string());
            return std::move(event->proof);
        }
        LOG_DEBUG(logger(), "Ignoring attestation for " << HexUtils::encode_reversed(event->txid));
    }
}

} // namespace assetlock
