#include "core_services.hpp"
#include "consts.hpp"
#include "error.hpp"
#include "hash_utils.hpp"
#include "hex_utils.hpp"
#include "logging.hpp"
#include "script.hpp"
#include "transaction.hpp"
#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <mutex>

namespace assetlock {

using json = nlohmann::json;

namespace {
logging::Logger& logger() {
    static logging::Logger l = logging::get_logger("assetlock.core");
    return l;
}

Txid txid_from_hex(const std::string& hex) {
    auto bytes = HexUtils::decode_reversed(hex);
    if (bytes.size() != Txid{}.size()) {
        throw AssetLockError(AssetLockError::ErrorType::RPCError, "Malformed txid: " + hex);
    }
    Txid txid;
    std::copy(bytes.begin(), bytes.end(), txid.begin());
    return txid;
}
} // namespace

BlockHash CoreChainStatus::get_tip() {
    std::string hash = cli_.call({"getbestblockhash"});
    if (hash.empty()) {
        throw AssetLockError(AssetLockError::ErrorType::RPCError, "Empty response from getbestblockhash");
    }
    return hash;
}

TransactionStatus CoreChainStatus::get_transaction(const Txid& txid) {
    json tx = cli_.call_json({"getrawtransaction", HexUtils::encode_reversed(txid), "1"});
    TransactionStatus status;
    if (tx.contains("blockhash") && tx["blockhash"].is_string()) {
        status.confirming_block = tx["blockhash"].get<std::string>();
    }
    return status;
}

// The node answers a resubmission of a confirmed transaction with
// RPC_VERIFY_ALREADY_IN_CHAIN only while one of its outputs is unspent. The
// lock output is never a coin, so a confirmed lock without a live change
// output comes back as missing inputs instead. Any refusal is therefore
// checked against the node's own copy of the transaction. A transaction
// still in the mempool is simply accepted again.
SubmitResult CoreSubmission::submit(std::span<const uint8_t> raw_transaction) {
    CliResult result = cli_.run({"sendrawtransaction", HexUtils::encode(raw_transaction)});
    if (result.ok()) {
        return SubmitResult{SubmitStatus::Accepted, result.output};
    }
    if (result.rpc_error_code == RPC_VERIFY_ALREADY_IN_CHAIN) {
        return SubmitResult{SubmitStatus::AlreadySubmitted, result.output};
    }

    std::string txid = HexUtils::encode_reversed(HashUtils::double_sha256(raw_transaction));
    CliResult known = cli_.run({"getrawtransaction", txid, "1"});
    if (known.ok()) {
        LOG_INFO(logger(), "Node refused " << txid << " but already holds it: " << result.output);
        return SubmitResult{SubmitStatus::AlreadySubmitted, result.output};
    }
    return SubmitResult{SubmitStatus::Rejected, result.output};
}

std::vector<UnspentOutput> CoreUtxoSource::fetch(const std::string& address) {
    json unspent = cli_.call_json({"listunspent", "1", "9999999", json::array({address}).dump()});
    if (!unspent.is_array()) {
        throw AssetLockError(AssetLockError::ErrorType::RPCError, "listunspent did not return an array");
    }

    std::vector<UnspentOutput> outputs;
    try {
        for (const auto& entry : unspent) {
            if (entry.contains("address") && entry["address"].get<std::string>() != address) {
                continue;
            }
            UnspentOutput output;
            output.outpoint.txid = txid_from_hex(entry.at("txid").get<std::string>());
            output.outpoint.index = entry.at("vout").get<uint32_t>();
            if (entry.contains("satoshis")) {
                output.value = entry["satoshis"].get<uint64_t>();
            } else {
                output.value = static_cast<uint64_t>(std::llround(entry.at("amount").get<double>() * COIN));
            }
            output.script_pubkey = HexUtils::decode(entry.at("scriptPubKey").get<std::string>());
            outputs.push_back(std::move(output));
        }
    } catch (const json::exception& e) {
        throw AssetLockError(AssetLockError::ErrorType::RPCError,
            std::string("Failed to parse listunspent response: ") + e.what());
    }
    LOG_DEBUG(logger(), "listunspent returned " << outputs.size() << " outputs for " << address);
    return outputs;
}

CoreAttestationStream::CoreAttestationStream(CommandRunner& cli, Network network, BlockHash anchor,
                                             std::string recipient_address,
                                             std::chrono::milliseconds poll_interval)
    : cli_(cli)
    , recipient_(std::move(recipient_address))
    , recipient_hash_(Script::decode_address(recipient_, network))
    , poll_interval_(poll_interval)
    , cursor_(std::move(anchor))
{}

std::optional<AttestationEvent> CoreAttestationStream::next(std::chrono::steady_clock::time_point deadline,
                                                            std::stop_token stop) {
    while (true) {
        if (!pending_.empty()) {
            AttestationEvent event = std::move(pending_.front());
            pending_.pop_front();
            return event;
        }

        poll();
        if (!pending_.empty()) {
            continue;
        }

        auto now = std::chrono::steady_clock::now();
        if (stop.stop_requested() || now >= deadline) {
            return std::nullopt;
        }

        // Sleep until the next poll; a stop request wakes the wait early
        auto wake = std::min(deadline, now + poll_interval_);
        std::mutex m;
        std::condition_variable_any cv;
        std::unique_lock<std::mutex> lock(m);
        cv.wait_until(lock, stop, wake, [] { return false; });
    }
}

void CoreAttestationStream::poll() {
    try {
        scan_chain();
        scan_mempool();

        for (auto it = candidates_.begin(); it != candidates_.end();) {
            auto proof = proof_for(*it);
            if (!proof) {
                ++it;
                continue;
            }
            if (reported_.insert(*it).second) {
                pending_.push_back(AttestationEvent{proof->outpoint.txid, std::move(*proof)});
            }
            it = candidates_.erase(it);
        }
    } catch (const json::exception& e) {
        throw AssetLockError(AssetLockError::ErrorType::RPCError,
            std::string("Unexpected node response: ") + e.what());
    }
}

// Walk forward from the cursor using nextblockhash. The cursor stays on the
// last block seen so the next poll resumes there without rescanning it.
void CoreAttestationStream::scan_chain() {
    while (true) {
        json block = cli_.call_json({"getblock", cursor_, "2"});
        if (!cursor_scanned_) {
            if (block.contains("tx") && block["tx"].is_array()) {
                for (const auto& tx : block["tx"]) {
                    consider(tx);
                }
            }
            cursor_scanned_ = true;
        }
        if (!block.contains("nextblockhash") || !block["nextblockhash"].is_string()) {
            break;
        }
        cursor_ = block["nextblockhash"].get<std::string>();
        cursor_scanned_ = false;
    }
}

void CoreAttestationStream::scan_mempool() {
    json txids = cli_.call_json({"getrawmempool"});
    for (const auto& entry : txids) {
        std::string txid = entry.get<std::string>();
        if (examined_.contains(txid)) {
            continue;
        }
        // The transaction may leave the mempool between the two calls
        CliResult result = cli_.run({"getrawtransaction", txid, "1"});
        if (!result.ok()) {
            LOG_DEBUG(logger(), "Skipping mempool transaction " << txid << ": " << result.output);
            continue;
        }
        consider(json::parse(result.output));
    }
}

void CoreAttestationStream::consider(const json& tx) {
    if (!tx.contains("txid") || !tx["txid"].is_string()) {
        return;
    }
    std::string txid = tx["txid"].get<std::string>();
    if (!examined_.insert(txid).second) {
        return;
    }
    if (credits_recipient(tx)) {
        LOG_DEBUG(logger(), "Asset lock " << txid << " credits " << recipient_);
        candidates_.insert(txid);
    }
}

bool CoreAttestationStream::credits_recipient(const json& tx) const {
    if (tx.value("type", 0) != TX_TYPE_ASSET_LOCK || !tx.contains("hex")) {
        return false;
    }

    Transaction decoded;
    try {
        decoded = Transaction::deserialize(HexUtils::decode(tx["hex"].get<std::string>()));
    } catch (const std::invalid_argument& e) {
        LOG_WARN(logger(), "Cannot decode asset lock " << tx["txid"].get<std::string>() << ": " << e.what());
        return false;
    }

    if (!decoded.payload) {
        return false;
    }
    return std::any_of(decoded.payload->credit_outputs.begin(), decoded.payload->credit_outputs.end(),
        [this](const TxOut& output) {
            return Script::extract_p2pkh_hash(output.script_pubkey) == recipient_hash_;
        });
}

// An instant-send lock makes the proof available right away; otherwise wait
// for the block holding the transaction to be chain-locked
std::optional<AssetLockProof> CoreAttestationStream::proof_for(const std::string& txid) {
    CliResult result = cli_.run({"getrawtransaction", txid, "1"});
    if (!result.ok()) {
        LOG_DEBUG(logger(), "Lock status of " << txid << " unavailable: " << result.output);
        return std::nullopt;
    }
    json tx = json::parse(result.output);

    AssetLockProof proof;
    proof.outpoint = Outpoint{txid_from_hex(txid), LOCK_OUTPUT_INDEX};

    if (tx.value("instantlock", false)) {
        json islocks = cli_.call_json({"getislocks", json::array({txid}).dump()});
        if (islocks.is_array() && !islocks.empty() && islocks[0].is_object() && islocks[0].contains("hex")) {
            proof.kind = ProofKind::Instant;
            proof.instant_lock = HexUtils::decode(islocks[0]["hex"].get<std::string>());
            proof.transaction = HexUtils::decode(tx.at("hex").get<std::string>());
            return proof;
        }
    }

    if (tx.value("chainlock", false) && tx.contains("height")) {
        proof.kind = ProofKind::Chain;
        proof.core_chain_locked_height = tx["height"].get<uint32_t>();
        return proof;
    }
    return std::nullopt;
}

std::unique_ptr<AttestationStream> CoreAttestationService::subscribe(const BlockHash& anchor,
                                                                     const std::string& recipient_address) {
    LOG_DEBUG(logger(), "Opening attestation stream at " << anchor);
    return std::make_unique<CoreAttestationStream>(cli_, network_, anchor, recipient_address, poll_interval_);
}

} // namespace assetlock
