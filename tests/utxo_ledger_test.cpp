#include "gtest/gtest.h"
#include "error.hpp"
#include "test_fakes.hpp"
#include "utxo_ledger.hpp"

#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace assetlock;
using assetlock::test::make_output;

namespace {

const std::vector<uint8_t> kScript = {0x76, 0xa9, 0x14};

UtxoLedger make_ledger(std::initializer_list<uint64_t> values) {
    std::vector<UnspentOutput> outputs;
    uint8_t tag = 1;
    for (uint64_t value : values) {
        outputs.push_back(make_output(value, kScript, tag++));
    }
    return UtxoLedger(std::move(outputs));
}

uint64_t sum(const std::vector<UnspentOutput>& outputs) {
    uint64_t total = 0;
    for (const auto& o : outputs) total += o.value;
    return total;
}

TEST(utxo_ledger_test, balance_is_sum_of_outputs) {
    auto ledger = make_ledger({50, 70, 5});
    ASSERT_EQ(ledger.balance(), 125u);
    ASSERT_EQ(ledger.size(), 3u);

    UtxoLedger empty;
    ASSERT_EQ(empty.balance(), 0u);
}

TEST(utxo_ledger_test, select_takes_prefix_in_insertion_order) {
    auto ledger = make_ledger({50, 70, 30});
    Selection selection = ledger.select_for(100);

    ASSERT_EQ(selection.selected.size(), 2u);
    ASSERT_EQ(selection.selected[0].value, 50u);
    ASSERT_EQ(selection.selected[1].value, 70u);
    ASSERT_EQ(selection.change, 20u);
    ASSERT_EQ(selection.total(), 120u);

    // selected outputs are gone from the ledger
    ASSERT_EQ(ledger.balance(), 30u);
    ASSERT_EQ(ledger.outputs().front().outpoint.txid[0], 3);
}

TEST(utxo_ledger_test, exact_amount_leaves_no_change) {
    auto ledger = make_ledger({40, 60});
    Selection selection = ledger.select_for(40);
    ASSERT_EQ(selection.selected.size(), 1u);
    ASSERT_EQ(selection.change, 0u);
}

TEST(utxo_ledger_test, repeated_selects_never_overlap) {
    auto ledger = make_ledger({10, 10, 10, 10, 10});
    Selection first = ledger.select_for(15);
    Selection second = ledger.select_for(15);

    std::set<Outpoint> seen;
    for (const auto& o : first.selected) ASSERT_TRUE(seen.insert(o.outpoint).second);
    for (const auto& o : second.selected) ASSERT_TRUE(seen.insert(o.outpoint).second);
    ASSERT_EQ(ledger.balance(), 10u);
}

TEST(utxo_ledger_test, insufficient_funds_leaves_ledger_unchanged) {
    auto ledger = make_ledger({50, 70});
    auto before = ledger.outputs();

    try {
        ledger.select_for(121);
        FAIL() << "expected InsufficientFunds";
    } catch (const AssetLockError& e) {
        ASSERT_EQ(e.type(), AssetLockError::ErrorType::InsufficientFunds);
    }
    ASSERT_EQ(ledger.outputs(), before);
    ASSERT_EQ(ledger.balance(), 120u);
}

TEST(utxo_ledger_test, restore_returns_outputs_to_the_front) {
    auto ledger = make_ledger({50, 70, 30});
    auto before = ledger.outputs();

    Selection selection = ledger.select_for(100);
    ledger.restore(selection.selected);

    ASSERT_EQ(ledger.outputs(), before);
}

TEST(utxo_ledger_test, refresh_replaces_everything) {
    auto ledger = make_ledger({50, 70});
    ledger.refresh({make_output(5, kScript, 9), make_output(6, kScript, 9, 1)});

    ASSERT_EQ(ledger.size(), 2u);
    ASSERT_EQ(ledger.balance(), 11u);
    ASSERT_EQ(ledger.outputs()[0].outpoint.txid[0], 9);
}

TEST(utxo_ledger_test, refresh_drops_duplicate_outpoints) {
    UtxoLedger ledger;
    ledger.refresh({make_output(5, kScript, 9), make_output(5, kScript, 9), make_output(7, kScript, 8)});
    ASSERT_EQ(ledger.size(), 2u);
    ASSERT_EQ(ledger.balance(), 12u);
}

TEST(utxo_ledger_test, largest_first_order) {
    auto ledger = make_ledger({10, 90, 40, 90});
    Selection selection = ledger.transact([](UtxoLedger::Locked& locked) {
        return locked.select_for(150, SelectionOrder::LargestFirst);
    });

    ASSERT_EQ(selection.selected.size(), 2u);
    // equal values keep ledger order
    ASSERT_EQ(selection.selected[0].outpoint.txid[0], 2);
    ASSERT_EQ(selection.selected[1].outpoint.txid[0], 4);
    ASSERT_EQ(selection.change, 30u);
    ASSERT_EQ(ledger.balance(), 50u);
}

TEST(utxo_ledger_test, transact_rolls_back_with_reset) {
    auto ledger = make_ledger({10, 20});
    auto before = ledger.outputs();

    ledger.transact([&](UtxoLedger::Locked& locked) {
        locked.select_for(25);
        locked.add(make_output(99, kScript, 7));
        locked.reset(before);
    });
    ASSERT_EQ(ledger.outputs(), before);
}

TEST(utxo_ledger_test, concurrent_selects_get_disjoint_outputs) {
    std::vector<UnspentOutput> outputs;
    for (int i = 0; i < 200; ++i) {
        outputs.push_back(make_output(1, kScript, static_cast<uint8_t>(i % 256), static_cast<uint32_t>(i)));
    }
    UtxoLedger ledger(std::move(outputs));

    std::mutex results_mutex;
    std::vector<UnspentOutput> taken;
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 25; ++i) {
                Selection selection = ledger.select_for(1);
                std::lock_guard<std::mutex> lock(results_mutex);
                taken.insert(taken.end(), selection.selected.begin(), selection.selected.end());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::set<Outpoint> unique;
    for (const auto& o : taken) unique.insert(o.outpoint);
    ASSERT_EQ(unique.size(), 200u);
    ASSERT_EQ(sum(taken), 200u);
    ASSERT_EQ(ledger.balance(), 0u);
}

}  // namespace
