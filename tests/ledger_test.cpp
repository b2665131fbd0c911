// ============================================================================
// InMemoryLedger Tests
// ============================================================================

#include "pactum/escrow/ledger.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <string>
#include <thread>
#include <vector>

using namespace pactum;

namespace {

const Identity kAlice("alice");
const Identity kBob("bob");
const Identity kCarol("carol");

}  // namespace

TEST(LedgerTest, MintAndBalance) {
    InMemoryLedger ledger;
    EXPECT_EQ(ledger.BalanceOf(kAlice), 0u);

    ASSERT_FALSE(ledger.Mint(kAlice, 500));
    EXPECT_EQ(ledger.BalanceOf(kAlice), 500u);
    EXPECT_EQ(ledger.TotalSupply(), 500u);
}

TEST(LedgerTest, CollectMovesIntoCustody) {
    InMemoryLedger ledger;
    ASSERT_FALSE(ledger.Mint(kAlice, 500));

    EXPECT_FALSE(ledger.Collect(kAlice, 200));
    EXPECT_EQ(ledger.BalanceOf(kAlice), 300u);
    EXPECT_EQ(ledger.Custody(), 200u);
    EXPECT_EQ(ledger.TotalSupply(), 500u);
}

TEST(LedgerTest, CollectFailsOnInsufficientBalance) {
    InMemoryLedger ledger;
    ASSERT_FALSE(ledger.Mint(kAlice, 50));

    EXPECT_EQ(ledger.Collect(kAlice, 51), Errc::TransferFailure);
    EXPECT_EQ(ledger.Collect(kBob, 1), Errc::TransferFailure);
    EXPECT_EQ(ledger.BalanceOf(kAlice), 50u);
    EXPECT_EQ(ledger.Custody(), 0u);
}

TEST(LedgerTest, SettleDeliversBatch) {
    InMemoryLedger ledger;
    ASSERT_FALSE(ledger.Mint(kAlice, 100));
    ASSERT_FALSE(ledger.Collect(kAlice, 100));

    EXPECT_FALSE(ledger.Settle({Payment{kBob, 95}, Payment{kCarol, 5}}));
    EXPECT_EQ(ledger.BalanceOf(kBob), 95u);
    EXPECT_EQ(ledger.BalanceOf(kCarol), 5u);
    EXPECT_EQ(ledger.Custody(), 0u);
}

TEST(LedgerTest, SettleIsAllOrNothingWhenRecipientRejects) {
    InMemoryLedger ledger;
    ASSERT_FALSE(ledger.Mint(kAlice, 100));
    ASSERT_FALSE(ledger.Collect(kAlice, 100));
    ledger.RejectIncoming(kCarol);

    EXPECT_EQ(ledger.Settle({Payment{kBob, 95}, Payment{kCarol, 5}}), Errc::TransferFailure);
    EXPECT_EQ(ledger.BalanceOf(kBob), 0u);
    EXPECT_EQ(ledger.Custody(), 100u);

    ledger.AcceptIncoming(kCarol);
    EXPECT_FALSE(ledger.Settle({Payment{kBob, 95}, Payment{kCarol, 5}}));
}

TEST(LedgerTest, SettleFailsBeyondCustody) {
    InMemoryLedger ledger;
    ASSERT_FALSE(ledger.Mint(kAlice, 10));
    ASSERT_FALSE(ledger.Collect(kAlice, 10));

    EXPECT_EQ(ledger.Settle({Payment{kBob, 11}}), Errc::TransferFailure);
    EXPECT_EQ(ledger.Custody(), 10u);
}

TEST(LedgerTest, MintRejectsSupplyOverflow) {
    constexpr Amount kMax = std::numeric_limits<Amount>::max();
    InMemoryLedger ledger;
    ASSERT_FALSE(ledger.Mint(kAlice, kMax - 10));

    EXPECT_EQ(ledger.Mint(kBob, kMax - 10), Errc::TransferFailure);
    EXPECT_EQ(ledger.Mint(kAlice, 11), Errc::TransferFailure);
    EXPECT_EQ(ledger.BalanceOf(kBob), 0u);
    EXPECT_EQ(ledger.TotalSupply(), kMax - 10);

    EXPECT_FALSE(ledger.Mint(kBob, 10));
    EXPECT_EQ(ledger.TotalSupply(), kMax);
}

TEST(LedgerTest, SettleRejectsOverflowingBatch) {
    constexpr Amount kMax = std::numeric_limits<Amount>::max();
    InMemoryLedger ledger;
    ASSERT_FALSE(ledger.Mint(kAlice, 100));
    ASSERT_FALSE(ledger.Collect(kAlice, 100));

    // The wrapped total would be 99, which custody could otherwise cover
    EXPECT_EQ(ledger.Settle({Payment{kBob, kMax}, Payment{kCarol, 100}}), Errc::TransferFailure);
    EXPECT_EQ(ledger.BalanceOf(kBob), 0u);
    EXPECT_EQ(ledger.BalanceOf(kCarol), 0u);
    EXPECT_EQ(ledger.Custody(), 100u);
}

TEST(LedgerTest, ConcurrentCollectsConserveSupply) {
    InMemoryLedger ledger;
    constexpr int kThreads = 8;
    constexpr int kPerThread = 1000;
    for (int t = 0; t < kThreads; ++t) {
        ASSERT_FALSE(ledger.Mint(Identity("user-" + std::to_string(t)), kPerThread));
    }

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&ledger, t] {
            Identity who("user-" + std::to_string(t));
            for (int i = 0; i < kPerThread; ++i) {
                EXPECT_FALSE(ledger.Collect(who, 1));
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(ledger.Custody(), static_cast<Amount>(kThreads * kPerThread));
    EXPECT_EQ(ledger.TotalSupply(), static_cast<Amount>(kThreads * kPerThread));
}
