#include "utxo_ledger.hpp"
#include "error.hpp"
#include "logging.hpp"
#include <algorithm>
#include <numeric>
#include <set>

namespace assetlock {

namespace {
logging::Logger& logger() {
    static logging::Logger l = logging::get_logger("assetlock.ledger");
    return l;
}

uint64_t sum_values(const std::vector<UnspentOutput>& outputs) {
    return std::accumulate(outputs.begin(), outputs.end(), uint64_t{0},
        [](uint64_t sum, const UnspentOutput& output) {
            return sum + output.value;
        });
}
} // namespace

uint64_t Selection::total() const {
    return sum_values(selected);
}

uint64_t UtxoLedger::Locked::balance() const {
    return sum_values(ledger_.outputs_);
}

const std::vector<UnspentOutput>& UtxoLedger::Locked::outputs() const {
    return ledger_.outputs_;
}

// Coin selection walks the ledger in a fixed order and takes outputs until
// their running total reaches the requested amount. Taking and removing
// happen under the same lock, so two operations can never be handed the same
// output.
Selection UtxoLedger::Locked::select_for(uint64_t amount, SelectionOrder order) {
    auto& outputs = ledger_.outputs_;

    std::vector<size_t> positions(outputs.size());
    std::iota(positions.begin(), positions.end(), size_t{0});
    if (order == SelectionOrder::LargestFirst) {
        std::stable_sort(positions.begin(), positions.end(),
            [&outputs](size_t a, size_t b) {
                return outputs[a].value > outputs[b].value;
            });
    }

    uint64_t total = 0;
    std::vector<size_t> taken;
    for (size_t position : positions) {
        if (total >= amount) {
            break;
        }
        total += outputs[position].value;
        taken.push_back(position);
    }

    if (total < amount) {
        LOG_DEBUG(logger(), "Cannot cover " << amount << " with balance " << total);
        throw AssetLockError(AssetLockError::ErrorType::InsufficientFunds,
            "Not enough balance: requested " + std::to_string(amount) +
            ", available " + std::to_string(total));
    }

    Selection selection;
    selection.change = total - amount;
    selection.selected.reserve(taken.size());
    for (size_t position : taken) {
        selection.selected.push_back(outputs[position]);
    }

    std::set<size_t> erase_set(taken.begin(), taken.end());
    std::vector<UnspentOutput> remaining;
    remaining.reserve(outputs.size() - taken.size());
    for (size_t i = 0; i < outputs.size(); ++i) {
        if (!erase_set.contains(i)) {
            remaining.push_back(std::move(outputs[i]));
        }
    }
    outputs = std::move(remaining);

    LOG_DEBUG(logger(), "Selected " << selection.selected.size() << " outputs for " << amount
              << ", change " << selection.change);
    return selection;
}

void UtxoLedger::Locked::restore(const std::vector<UnspentOutput>& outputs) {
    auto& held = ledger_.outputs_;
    std::vector<UnspentOutput> merged;
    merged.reserve(held.size() + outputs.size());
    for (const auto& output : outputs) {
        bool present = std::any_of(held.begin(), held.end(),
            [&output](const UnspentOutput& h) { return h.outpoint == output.outpoint; });
        if (!present) {
            merged.push_back(output);
        }
    }
    merged.insert(merged.end(), std::make_move_iterator(held.begin()),
                  std::make_move_iterator(held.end()));
    held = std::move(merged);
}

void UtxoLedger::Locked::add(UnspentOutput output) {
    auto& held = ledger_.outputs_;
    bool present = std::any_of(held.begin(), held.end(),
        [&output](const UnspentOutput& h) { return h.outpoint == output.outpoint; });
    if (!present) {
        held.push_back(std::move(output));
    }
}

void UtxoLedger::Locked::reset(std::vector<UnspentOutput> outputs) {
    ledger_.outputs_ = deduplicate(std::move(outputs));
}

UtxoLedger::UtxoLedger(std::vector<UnspentOutput> outputs)
    : outputs_(deduplicate(std::move(outputs))) {}

uint64_t UtxoLedger::balance() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sum_values(outputs_);
}

size_t UtxoLedger::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outputs_.size();
}

std::vector<UnspentOutput> UtxoLedger::outputs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outputs_;
}

Selection UtxoLedger::select_for(uint64_t amount) {
    return transact([amount](Locked& ledger) { return ledger.select_for(amount); });
}

void UtxoLedger::refresh(std::vector<UnspentOutput> outputs) {
    auto fresh = deduplicate(std::move(outputs));
    std::lock_guard<std::mutex> lock(mutex_);
    LOG_INFO(logger(), "Refreshed ledger: " << outputs_.size() << " -> " << fresh.size() << " outputs");
    outputs_ = std::move(fresh);
}

void UtxoLedger::restore(const std::vector<UnspentOutput>& outputs) {
    transact([&outputs](Locked& ledger) { ledger.restore(outputs); });
}

// The first occurrence of an outpoint wins; a source listing the same
// outpoint twice must not double the balance
std::vector<UnspentOutput> UtxoLedger::deduplicate(std::vector<UnspentOutput> outputs) {
    std::set<Outpoint> seen;
    std::vector<UnspentOutput> unique;
    unique.reserve(outputs.size());
    for (auto& output : outputs) {
        if (seen.insert(output.outpoint).second) {
            unique.push_back(std::move(output));
        }
    }
    return unique;
}

} // namespace assetlock
