#include "transaction_builder.hpp"
#include "consts.hpp"
#include "error.hpp"
#include "hex_utils.hpp"
#include "logging.hpp"
#include "script.hpp"
#include <algorithm>

namespace assetlock {

namespace {
logging::Logger& logger() {
    static logging::Logger l = logging::get_logger("assetlock.builder");
    return l;
}

AssetLockError insufficient(const std::string& message) {
    return AssetLockError(AssetLockError::ErrorType::InsufficientFunds, message);
}

std::vector<TxIn> inputs_for(const std::vector<UnspentOutput>& spent) {
    std::vector<TxIn> inputs;
    inputs.reserve(spent.size());
    for (const auto& output : spent) {
        inputs.push_back(TxIn{.prevout = output.outpoint});
    }
    return inputs;
}
} // namespace

BuiltAssetLock TransactionBuilder::build_asset_lock(Wallet& wallet, uint64_t amount, uint64_t fee) {
    return wallet.ledger().transact([&](UtxoLedger::Locked& ledger) {
        return build_asset_lock(ledger, wallet, amount, fee);
    });
}

// Build an asset-lock transaction.
//
// Outputs:
// - output 0: OP_RETURN carrying the locked value. This is the output the
//   lock proof binds to.
// - output 1: change back to the wallet address, present when the leftover
//   after the fee is non-zero.
//
// The extra payload lists a single credit output paying the locked value to
// a fresh one-time key. The platform credits whoever can sign for that key,
// so the key is returned to the caller and never touches the wallet.
//
// Every input spends a wallet output and is signed with the wallet key.
BuiltAssetLock TransactionBuilder::build_asset_lock(UtxoLedger::Locked& ledger, const Wallet& wallet,
                                                    uint64_t amount, uint64_t fee) {
    if (amount == 0) {
        throw AssetLockError(AssetLockError::ErrorType::InvalidState, "Lock amount must be positive");
    }

    PrivateKey one_time_key = PrivateKey::generate();
    Hash160 one_time_hash = HashUtils::hash160(one_time_key.public_key());

    Selection selection = ledger.select_for(amount);
    if (selection.change < fee) {
        ledger.restore(selection.selected);
        throw insufficient("Change " + std::to_string(selection.change) +
                           " does not cover fee " + std::to_string(fee));
    }

    Transaction tx;
    tx.version = TX_VERSION_SPECIAL;
    tx.type = TX_TYPE_ASSET_LOCK;
    tx.inputs = inputs_for(selection.selected);
    tx.outputs.push_back(TxOut{amount, Script::op_return()});
    uint64_t change_value = selection.change - fee;
    if (change_value > 0) {
        tx.outputs.push_back(TxOut{change_value, wallet.script_pubkey()});
    }
    tx.payload = AssetLockPayload{
        .version = ASSET_LOCK_PAYLOAD_VERSION,
        .credit_outputs = {TxOut{amount, Script::p2pkh(one_time_hash)}}
    };

    try {
        sign_inputs(tx, selection.selected, wallet);
    } catch (const AssetLockError&) {
        ledger.restore(selection.selected);
        throw;
    }

    LOG_DEBUG(logger(), "Built asset lock " << tx.txid_hex() << ": " << tx.inputs.size()
              << " inputs, lock " << amount << ", change " << change_value << ", fee " << fee);

    return BuiltAssetLock{
        .transaction = std::move(tx),
        .one_time_key = std::move(one_time_key),
        .spent = std::move(selection.selected)
    };
}

// Split the wallet into desired_count outputs of equal value.
//
// The value per output is (balance - SPLIT_RESERVE) / desired_count. A node
// relays at most MAX_OUTPUTS_PER_SPLIT_TX outputs per transaction, so the
// split is spread over ceil(desired_count / MAX_OUTPUTS_PER_SPLIT_TX)
// transactions. Each one takes the largest outputs first and pays
// n - 1 equal outputs plus one output with the excess (minus the fee) when
// the excess is above the dust threshold; below it the excess is left to
// the fee.
//
// If any transaction of the batch cannot be funded the ledger is rolled back
// to its state before the batch.
std::vector<BuiltSplit> TransactionBuilder::build_split(Wallet& wallet, size_t desired_count, uint64_t fee) {
    if (desired_count == 0) {
        throw AssetLockError(AssetLockError::ErrorType::InvalidState, "Split count must be positive");
    }

    return wallet.ledger().transact([&](UtxoLedger::Locked& ledger) {
        const auto snapshot = ledger.outputs();
        const uint64_t balance = ledger.balance();
        if (balance <= SPLIT_RESERVE) {
            throw insufficient("Balance " + std::to_string(balance) + " is below the split reserve");
        }
        const uint64_t split_value = (balance - SPLIT_RESERVE) / desired_count;
        if (split_value == 0) {
            throw insufficient("Balance too low to split into " + std::to_string(desired_count) + " outputs");
        }

        std::vector<BuiltSplit> built;
        size_t remaining = desired_count;
        try {
            while (remaining > 0) {
                size_t count = std::min(MAX_OUTPUTS_PER_SPLIT_TX, remaining);
                Selection selection = ledger.select_for(split_value * count, SelectionOrder::LargestFirst);
                uint64_t total = selection.total();

                Transaction tx;
                tx.version = TX_VERSION_CLASSIC;
                tx.type = TX_TYPE_NORMAL;
                tx.inputs = inputs_for(selection.selected);
                for (size_t i = 0; i + 1 < count; ++i) {
                    tx.outputs.push_back(TxOut{split_value, wallet.script_pubkey()});
                }

                uint64_t excess = total - split_value * (count - 1);
                if (excess > SPLIT_DUST_THRESHOLD) {
                    if (excess <= fee) {
                        throw insufficient("Split excess " + std::to_string(excess) +
                                           " does not cover fee " + std::to_string(fee));
                    }
                    tx.outputs.push_back(TxOut{excess - fee, wallet.script_pubkey()});
                }
                if (tx.outputs.empty()) {
                    throw insufficient("Split transaction would have no outputs");
                }

                sign_inputs(tx, selection.selected, wallet);

                Txid txid = tx.txid();
                for (uint32_t index = 0; index < tx.outputs.size(); ++index) {
                    ledger.add(UnspentOutput{
                        .outpoint = {txid, index},
                        .value = tx.outputs[index].value,
                        .script_pubkey = tx.outputs[index].script_pubkey
                    });
                }

                LOG_DEBUG(logger(), "Built split " << tx.txid_hex() << ": " << tx.inputs.size()
                          << " inputs, " << tx.outputs.size() << " outputs of " << split_value);

                built.push_back(BuiltSplit{std::move(tx), std::move(selection.selected)});
                remaining -= count;
            }
        } catch (const AssetLockError&) {
            ledger.reset(snapshot);
            throw;
        }
        return built;
    });
}

// Each input gets <DER signature || SIGHASH_ALL> <compressed public key>,
// signed over the legacy signature hash of that input. The previous locking
// script is the P2PKH script of the spent wallet output.
void TransactionBuilder::sign_inputs(Transaction& tx, const std::vector<UnspentOutput>& spent,
                                     const Wallet& wallet) {
    std::vector<std::vector<uint8_t>> script_sigs;
    script_sigs.reserve(tx.inputs.size());

    // Signature hashes are computed over the unsigned skeleton, so all of
    // them are taken before any unlocking script is filled in
    for (size_t i = 0; i < tx.inputs.size(); ++i) {
        Hash256 sighash = tx.signature_hash(i, spent[i].script_pubkey, SIGHASH_ALL);
        auto der = wallet.private_key().sign(sighash);
        script_sigs.push_back(Script::script_sig(der, static_cast<uint8_t>(SIGHASH_ALL), wallet.public_key()));
    }

    for (size_t i = 0; i < tx.inputs.size(); ++i) {
        tx.inputs[i].script_sig = std::move(script_sigs[i]);
    }
}

} // namespace assetlock
