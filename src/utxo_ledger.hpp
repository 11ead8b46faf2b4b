#pragma once

#include <cstdint>
#include <mutex>
#include <vector>
#include "utxo.hpp"

namespace assetlock {

// Outputs taken from the ledger by one selection, in the order they were
// taken, and the amount by which they exceed the request
struct Selection {
    std::vector<UnspentOutput> selected;
    uint64_t change = 0;

    uint64_t total() const;
};

enum class SelectionOrder {
    Insertion,     // ledger order: the order the outputs were refreshed or added in
    LargestFirst   // descending value, ties broken by ledger order
};

// The set of spendable outputs of one wallet.
//
// Every public method takes the ledger mutex for its whole duration. A caller
// that needs several steps to be atomic (select, build, and hand outputs back
// when the build is rejected) runs them inside transact(), which holds the
// mutex across the callback.
class UtxoLedger {
public:
    // Unlocked view handed to transact() callbacks
    class Locked {
    public:
        uint64_t balance() const;
        const std::vector<UnspentOutput>& outputs() const;

        // Throws AssetLockError(InsufficientFunds) and leaves the ledger
        // unchanged when the held outputs cannot cover amount
        Selection select_for(uint64_t amount, SelectionOrder order = SelectionOrder::Insertion);

        // Puts previously selected outputs back at the front of the ledger in
        // their original order
        void restore(const std::vector<UnspentOutput>& outputs);

        void add(UnspentOutput output);

        // Rolls the ledger back to an earlier snapshot of outputs()
        void reset(std::vector<UnspentOutput> outputs);

    private:
        friend class UtxoLedger;
        explicit Locked(UtxoLedger& ledger) : ledger_(ledger) {}
        UtxoLedger& ledger_;
    };

    UtxoLedger() = default;
    explicit UtxoLedger(std::vector<UnspentOutput> outputs);

    UtxoLedger(const UtxoLedger&) = delete;
    UtxoLedger& operator=(const UtxoLedger&) = delete;

    uint64_t balance() const;
    size_t size() const;
    std::vector<UnspentOutput> outputs() const;

    Selection select_for(uint64_t amount);

    // Full replacement: the source is authoritative for what is unspent
    void refresh(std::vector<UnspentOutput> outputs);

    void restore(const std::vector<UnspentOutput>& outputs);

    template <typename F>
    auto transact(F&& f) {
        std::lock_guard<std::mutex> lock(mutex_);
        Locked view(*this);
        return f(view);
    }

private:
    static std::vector<UnspentOutput> deduplicate(std::vector<UnspentOutput> outputs);

    mutable std::mutex mutex_;
    std::vector<UnspentOutput> outputs_;
};

} // namespace assetlock
