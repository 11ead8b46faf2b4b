#pragma once

#include <cstdint>
#include <vector>
#include "keys.hpp"
#include "transaction.hpp"
#include "utxo_ledger.hpp"
#include "wallet.hpp"

namespace assetlock {

struct BuiltAssetLock {
    Transaction transaction;
    PrivateKey one_time_key;            // controls the credit output; never stored in the wallet
    std::vector<UnspentOutput> spent;   // spent[i] is consumed by transaction.inputs[i]
};

struct BuiltSplit {
    Transaction transaction;
    std::vector<UnspentOutput> spent;
};

class TransactionBuilder {
public:
    // Selects, builds and signs under one hold of the wallet's ledger lock.
    // Throws AssetLockError(InsufficientFunds) when the wallet cannot cover
    // amount plus fee; the ledger is then left as it was.
    static BuiltAssetLock build_asset_lock(Wallet& wallet, uint64_t amount, uint64_t fee);

    // Same, for a caller already inside wallet.ledger().transact()
    static BuiltAssetLock build_asset_lock(UtxoLedger::Locked& ledger, const Wallet& wallet,
                                           uint64_t amount, uint64_t fee);

    // Self-paying transactions splitting the wallet into desired_count
    // outputs. The outputs of each built transaction are added to the ledger
    // so later transactions of the batch can spend them.
    static std::vector<BuiltSplit> build_split(Wallet& wallet, size_t desired_count, uint64_t fee);

private:
    TransactionBuilder() = delete;

    // Fills every input's unlocking script with a wallet signature
    static void sign_inputs(Transaction& tx, const std::vector<UnspentOutput>& spent, const Wallet& wallet);
};

} // namespace assetlock
