#include "continuation.hpp"
#include "error.hpp"
#include "hex_utils.hpp"
#include "logging.hpp"
#include <nlohmann/json.hpp>

namespace assetlock {

using json = nlohmann::json;

namespace {
logging::Logger& logger() {
    static logging::Logger l = logging::get_logger("assetlock.continuation");
    return l;
}

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

AssetLockError invalid_state(const std::string& message) {
    return AssetLockError(AssetLockError::ErrorType::InvalidState, message);
}

json lock_to_json(const slot::LockRecord& lock) {
    return json{
        {"transaction", lock.transaction},
        {"one_time_key", lock.one_time_key.to_hex()}
    };
}

slot::LockRecord lock_from_json(const json& j) {
    return slot::LockRecord{
        .transaction = j.at("transaction").get<Transaction>(),
        .one_time_key = PrivateKey::from_hex(j.at("one_time_key").get<std::string>())
    };
}

json payload_to_json(const OperationPayload& payload) {
    json keys = json::array();
    for (const auto& key : payload.identity_keys) {
        keys.push_back(key.to_hex());
    }
    return json{
        {"identity_id", HexUtils::encode(payload.identity_id)},
        {"identity_keys", keys}
    };
}

OperationPayload payload_from_json(const json& j) {
    OperationPayload payload;
    auto id = HexUtils::decode(j.at("identity_id").get<std::string>());
    if (id.size() != payload.identity_id.size()) {
        throw std::invalid_argument("Identity id must be 32 bytes");
    }
    std::copy(id.begin(), id.end(), payload.identity_id.begin());
    for (const auto& key : j.at("identity_keys")) {
        payload.identity_keys.push_back(PrivateKey::from_hex(key.get<std::string>()));
    }
    return payload;
}
} // namespace

const char* operation_kind_name(OperationKind kind) {
    return kind == OperationKind::Registration ? "registration" : "topup";
}

const char* state_name(const ContinuationState& state) {
    return std::visit(overloaded{
        [](const slot::Empty&) { return "empty"; },
        [](const slot::Locked&) { return "locked"; },
        [](const slot::Broadcast&) { return "broadcast"; },
        [](const slot::ProofReady&) { return "proof_ready"; },
        [](const slot::PayloadReady&) { return "payload_ready"; }
    }, state);
}

const slot::LockRecord* lock_record(const ContinuationState& state) {
    return std::visit(overloaded{
        [](const slot::Empty&) -> const slot::LockRecord* { return nullptr; },
        [](const auto& s) -> const slot::LockRecord* { return &s.lock; }
    }, state);
}

const AssetLockProof* proof_of(const ContinuationState& state) {
    if (auto* s = std::get_if<slot::ProofReady>(&state)) {
        return &s->proof;
    }
    if (auto* s = std::get_if<slot::PayloadReady>(&state)) {
        return &s->proof;
    }
    return nullptr;
}

// Record layout:
// {"kind": "registration" | "topup",
//  "state": "locked" | "broadcast" | "proof_ready" | "payload_ready",
//  "transaction": {...}, "one_time_key": "<hex>",
//  "proof": {...}, "payload": {...}}
// An empty slot has no record at all.
std::string serialize_state(OperationKind kind, const ContinuationState& state) {
    json j = {{"kind", operation_kind_name(kind)}, {"state", state_name(state)}};
    if (const auto* lock = lock_record(state)) {
        j.update(lock_to_json(*lock));
    }
    if (const auto* proof = proof_of(state)) {
        j["proof"] = *proof;
    }
    if (const auto* s = std::get_if<slot::PayloadReady>(&state)) {
        j["payload"] = payload_to_json(s->payload);
    }
    return j.dump(4);
}

ContinuationState deserialize_state(const std::string& data) {
    try {
        json j = json::parse(data);
        auto name = j.at("state").get<std::string>();
        if (name == "empty") {
            return slot::Empty{};
        }
        auto lock = lock_from_json(j);
        if (name == "locked") {
            return slot::Locked{std::move(lock)};
        }
        if (name == "broadcast") {
            return slot::Broadcast{std::move(lock)};
        }
        auto proof = j.at("proof").get<AssetLockProof>();
        if (name == "proof_ready") {
            return slot::ProofReady{std::move(lock), std::move(proof)};
        }
        if (name == "payload_ready") {
            return slot::PayloadReady{std::move(lock), std::move(proof), payload_from_json(j.at("payload"))};
        }
        throw std::invalid_argument("Unknown continuation state: " + name);
    } catch (const json::exception& e) {
        throw AssetLockError(AssetLockError::ErrorType::PersistenceError,
            std::string("Corrupt continuation record: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw AssetLockError(AssetLockError::ErrorType::PersistenceError,
            std::string("Corrupt continuation record: ") + e.what());
    }
}

ContinuationSlot::ContinuationSlot(OperationKind kind, DurableStore& store)
    : kind_(kind), store_(store) {}

std::string ContinuationSlot::key() const {
    return std::string("continuation.") + operation_kind_name(kind_);
}

void ContinuationSlot::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto data = store_.read(key());
    state_ = data ? deserialize_state(*data) : ContinuationState{slot::Empty{}};
    LOG_INFO(logger(), "Loaded " << operation_kind_name(kind_) << " slot: " << state_name(state_));
}

ContinuationState ContinuationSlot::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool ContinuationSlot::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::holds_alternative<slot::Empty>(state_);
}

ContinuationState ContinuationSlot::get_or_create(uint64_t amount, const Builder& build) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!std::holds_alternative<slot::Empty>(state_)) {
        const auto* record = lock_record(state_);
        LOG_INFO(logger(), "Resuming " << operation_kind_name(kind_) << " with "
                 << record->transaction.txid_hex() << " in state " << state_name(state_));
        return state_;
    }

    BuiltAssetLock built = build(amount);
    LOG_INFO(logger(), "New " << operation_kind_name(kind_) << " lock " << built.transaction.txid_hex()
             << " for " << amount);
    persist(slot::Locked{slot::LockRecord{std::move(built.transaction), std::move(built.one_time_key)}});
    return state_;
}

void ContinuationSlot::record_broadcast() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::holds_alternative<slot::Broadcast>(state_)) {
        return;
    }
    auto* locked = std::get_if<slot::Locked>(&state_);
    if (locked == nullptr) {
        throw invalid_state(std::string("Cannot record broadcast in state ") + state_name(state_));
    }
    persist(slot::Broadcast{locked->lock});
}

void ContinuationSlot::record_proof(const AssetLockProof& proof) {
    std::lock_guard<std::mutex> lock(mutex_);
    const slot::LockRecord* record = nullptr;
    if (auto* s = std::get_if<slot::Locked>(&state_)) {
        record = &s->lock;
    } else if (auto* s = std::get_if<slot::Broadcast>(&state_)) {
        record = &s->lock;
    } else {
        throw invalid_state(std::string("Cannot record proof in state ") + state_name(state_));
    }

    if (proof.outpoint.txid != record->transaction.txid()) {
        throw invalid_state("Proof is for " + proof.outpoint.to_string() + ", not the slot transaction");
    }
    persist(slot::ProofReady{*record, proof});
}

void ContinuationSlot::record_payload(const OperationPayload& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* ready = std::get_if<slot::ProofReady>(&state_);
    if (ready == nullptr) {
        throw invalid_state(std::string("Cannot record payload in state ") + state_name(state_));
    }
    persist(slot::PayloadReady{ready->lock, ready->proof, payload});
}

void ContinuationSlot::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    store_.erase(key());
    state_ = slot::Empty{};
    LOG_INFO(logger(), "Cleared " << operation_kind_name(kind_) << " slot");
}

// Caller holds mutex_
void ContinuationSlot::persist(ContinuationState next) {
    store_.write(key(), serialize_state(kind_, next));
    LOG_DEBUG(logger(), operation_kind_name(kind_) << " slot: " << state_name(state_)
              << " -> " << state_name(next));
    state_ = std::move(next);
}

} // namespace assetlock
