#include "gtest/gtest.h"
#include "broadcast_protocol.hpp"
#include "error.hpp"
#include "test_fakes.hpp"
#include "transaction_builder.hpp"

#include <chrono>
#include <stop_token>

using namespace assetlock;
using namespace assetlock::test;

namespace {

const std::string kRecipient = "yRecipient";

class broadcast_protocol_test : public ::testing::Test {
protected:
    broadcast_protocol_test()
        : chain(log),
          submission(log),
          attestation(log, submission),
          protocol(chain, submission, attestation, std::chrono::milliseconds(50)) {
        auto wallet = make_wallet({50'000, 70'000});
        lock = TransactionBuilder::build_asset_lock(*wallet, 100'000, 3'000).transaction;
    }

    AssetLockError::ErrorType run_failure(std::stop_token stop = {}) {
        try {
            protocol.run(lock, kRecipient, stop);
        } catch (const AssetLockError& e) {
            return e.type();
        }
        ADD_FAILURE() << "run() did not fail";
        return AssetLockError::ErrorType::InvalidState;
    }

    CallLog log;
    FakeChain chain;
    FakeSubmission submission;
    FakeAttestation attestation;
    BroadcastProtocol protocol;
    Transaction lock;
};

TEST_F(broadcast_protocol_test, subscribes_before_submitting) {
    AssetLockProof proof = protocol.run(lock, kRecipient);

    ASSERT_EQ(log, (CallLog{"tip", "subscribe:tip", "submit"}));
    ASSERT_EQ(attestation.recipients, std::vector<std::string>{kRecipient});
    ASSERT_EQ(protocol.state(), BroadcastState::ProofObtained);

    ASSERT_EQ(proof.outpoint.txid, lock.txid());
    ASSERT_EQ(proof.outpoint.index, LOCK_OUTPUT_INDEX);
    ASSERT_EQ(submission.submitted.size(), 1u);
    ASSERT_EQ(submission.submitted[0], lock.serialize());
}

TEST_F(broadcast_protocol_test, on_submitted_runs_before_the_wait) {
    bool called = false;
    BroadcastState seen = BroadcastState::Built;
    protocol.run(lock, kRecipient, {}, [&] {
        called = true;
        seen = protocol.state();
    });
    ASSERT_TRUE(called);
    ASSERT_EQ(seen, BroadcastState::Broadcasting);
}

TEST_F(broadcast_protocol_test, already_submitted_reanchors_at_confirming_block) {
    submission.results = {SubmitResult{SubmitStatus::AlreadySubmitted, "already in chain"}};
    chain.transactions[lock.txid()] = TransactionStatus{BlockHash("B")};
    attestation.attesting_anchors = {"B"};

    AssetLockProof proof = protocol.run(lock, kRecipient);

    ASSERT_EQ(proof.outpoint.txid, lock.txid());
    ASSERT_EQ(attestation.anchors, (std::vector<BlockHash>{"tip", "B"}));
    ASSERT_EQ(log, (CallLog{"tip", "subscribe:tip", "submit", "lookup", "subscribe:B"}));
}

TEST_F(broadcast_protocol_test, already_submitted_unconfirmed_reanchors_at_tip) {
    submission.results = {SubmitResult{SubmitStatus::AlreadySubmitted, ""}};
    chain.transactions[lock.txid()] = TransactionStatus{};

    protocol.run(lock, kRecipient);
    ASSERT_EQ(log, (CallLog{"tip", "subscribe:tip", "submit", "lookup", "tip", "subscribe:tip"}));
}

TEST_F(broadcast_protocol_test, rejection_is_a_network_error) {
    submission.results = {SubmitResult{SubmitStatus::Rejected, "bad-txns-inputs-missingorspent"}};

    ASSERT_EQ(run_failure(), AssetLockError::ErrorType::NetworkError);
    ASSERT_EQ(protocol.state(), BroadcastState::Failed);
}

TEST_F(broadcast_protocol_test, missing_attestation_times_out) {
    attestation.attesting_anchors.clear();

    ASSERT_EQ(run_failure(), AssetLockError::ErrorType::ProofTimeout);
    ASSERT_EQ(protocol.state(), BroadcastState::Failed);
}

TEST_F(broadcast_protocol_test, stop_request_cancels) {
    std::stop_source source;
    source.request_stop();

    ASSERT_EQ(run_failure(source.get_token()), AssetLockError::ErrorType::Cancelled);
    ASSERT_EQ(protocol.state(), BroadcastState::Failed);
}

TEST_F(broadcast_protocol_test, unrelated_attestations_are_skipped) {
    auto other_wallet = make_wallet({9'000'000});
    Transaction other = TransactionBuilder::build_asset_lock(*other_wallet, 1'000'000, 3'000).transaction;
    attestation.unrelated = {AttestationEvent{other.txid(), make_proof(other)},
                             AttestationEvent{other.txid(), make_proof(other)}};

    AssetLockProof proof = protocol.run(lock, kRecipient);
    ASSERT_EQ(proof.outpoint.txid, lock.txid());
}

TEST_F(broadcast_protocol_test, retry_after_timeout_resubmits_same_bytes) {
    attestation.attesting_anchors.clear();
    ASSERT_EQ(run_failure(), AssetLockError::ErrorType::ProofTimeout);

    submission.results = {SubmitResult{SubmitStatus::AlreadySubmitted, ""}};
    chain.transactions[lock.txid()] = TransactionStatus{BlockHash("B")};
    attestation.attesting_anchors = {"B"};

    AssetLockProof proof = protocol.run(lock, kRecipient);
    ASSERT_EQ(proof.outpoint.txid, lock.txid());
    ASSERT_EQ(submission.submitted.size(), 2u);
    ASSERT_EQ(submission.submitted[0], submission.submitted[1]);
}

TEST_F(broadcast_protocol_test, unknown_transaction_after_duplicate_is_a_network_error) {
    submission.results = {SubmitResult{SubmitStatus::AlreadySubmitted, ""}};

    ASSERT_EQ(run_failure(), AssetLockError::ErrorType::NetworkError);
}

TEST(broadcast_state_test, names) {
    ASSERT_STREQ(broadcast_state_name(BroadcastState::Built), "Built");
    ASSERT_STREQ(broadcast_state_name(BroadcastState::StreamOpen), "StreamOpen");
    ASSERT_STREQ(broadcast_state_name(BroadcastState::ProofObtained), "ProofObtained");
}

}  // namespace
