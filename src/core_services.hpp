#pragma once

#include <chrono>
#include <deque>
#include <set>
#include <string>
#include <nlohmann/json.hpp>
#include "core_cli.hpp"
#include "hash_utils.hpp"
#include "keys.hpp"
#include "services.hpp"

namespace assetlock {

class CoreChainStatus : public ChainStatusService {
public:
    explicit CoreChainStatus(CommandRunner& cli) : cli_(cli) {}

    BlockHash get_tip() override;
    TransactionStatus get_transaction(const Txid& txid) override;

private:
    CommandRunner& cli_;
};

class CoreSubmission : public SubmissionService {
public:
    explicit CoreSubmission(CommandRunner& cli) : cli_(cli) {}

    SubmitResult submit(std::span<const uint8_t> raw_transaction) override;

private:
    CommandRunner& cli_;
};

class CoreUtxoSource : public UtxoSource {
public:
    explicit CoreUtxoSource(CommandRunner& cli) : cli_(cli) {}

    std::string name() const override { return "core"; }
    std::vector<UnspentOutput> fetch(const std::string& address) override;

private:
    CommandRunner& cli_;
};

// Attestation stream built by polling the node. Each poll walks the chain
// forward from the anchor block and looks at the mempool for asset-lock
// transactions crediting the recipient. A matching transaction yields an
// instant-send proof as soon as it is instant-locked, or a chain proof once
// its block is chain-locked. Each transaction is reported at most once.
// Throws AssetLockError(Base58DecodeError) when the recipient is not a P2PKH
// address of the network.
class CoreAttestationStream : public AttestationStream {
public:
    CoreAttestationStream(CommandRunner& cli, Network network, BlockHash anchor,
                          std::string recipient_address, std::chrono::milliseconds poll_interval);

    std::optional<AttestationEvent> next(std::chrono::steady_clock::time_point deadline,
                                         std::stop_token stop) override;

private:
    void poll();
    void scan_chain();
    void scan_mempool();
    void consider(const nlohmann::json& tx);
    bool credits_recipient(const nlohmann::json& tx) const;
    std::optional<AssetLockProof> proof_for(const std::string& txid);

    CommandRunner& cli_;
    std::string recipient_;
    Hash160 recipient_hash_;
    std::chrono::milliseconds poll_interval_;

    BlockHash cursor_;
    bool cursor_scanned_ = false;
    std::set<std::string> examined_;   // txids already checked against the recipient
    std::set<std::string> candidates_; // matching txids waiting for a lock
    std::set<std::string> reported_;
    std::deque<AttestationEvent> pending_;
};

class CoreAttestationService : public AttestationService {
public:
    CoreAttestationService(CommandRunner& cli, Network network, std::chrono::milliseconds poll_interval)
        : cli_(cli), network_(network), poll_interval_(poll_interval) {}

    std::unique_ptr<AttestationStream> subscribe(const BlockHash& anchor,
                                                 const std::string& recipient_address) override;

private:
    CommandRunner& cli_;
    Network network_;
    std::chrono::milliseconds poll_interval_;
};

} // namespace assetlock
