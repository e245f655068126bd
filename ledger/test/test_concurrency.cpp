#include "Ledger.h"
#include "SqliteStore.h"

#include <gtest/gtest.h>

#include <atomic>
#include <cstdio>
#include <thread>
#include <vector>

using namespace ff;

class ConcurrencyTest : public ::testing::Test {
protected:
  const OwnerId owner{ "alice" };

  void SetUp() override {
    path = ::testing::TempDir() + "ff_ledger_concurrency.db";
    removeFiles();
  }

  void TearDown() override { removeFiles(); }

  void removeFiles() {
    std::remove(path.c_str());
    std::remove((path + "-journal").c_str());
  }

  void initLedger(Ledger &ledger, int busyTimeoutMs) {
    Ledger::InitConfig config;
    config.dbPath = path;
    config.busyTimeoutMs = busyTimeoutMs;
    auto ready = ledger.init(config);
    ASSERT_TRUE(ready.isOk()) << ready.error().message;
  }

  static TransactionIntent spend(Id account, int64_t amount) {
    TransactionIntent intent;
    intent.kind = TxKind::EXPENSE;
    intent.amount = Money::fromUnits(amount);
    intent.sourceAccountId = account;
    return intent;
  }

  std::string path;
};

TEST_F(ConcurrencyTest, LockedWriterReportsConcurrentModification) {
  Ledger writer;
  initLedger(writer, 0);
  Ledger::NewAccount request;
  request.name = "Cash";
  request.kind = AccountKind::CASH;
  request.openingBalance = Money::fromUnits(100);
  auto cash = writer.createAccount(owner, request);
  ASSERT_TRUE(cash.isOk());

  SqliteStore holder;
  SqliteStore::Config config;
  config.path = path;
  config.busyTimeoutMs = 0;
  ASSERT_TRUE(holder.open(config).isOk());

  {
    Store::UnitOfWork unit(holder);
    ASSERT_TRUE(unit.begin().isOk());

    auto blocked = writer.createTransaction(owner, spend(cash->id, 10));
    ASSERT_TRUE(blocked.isError());
    EXPECT_EQ(blocked.error().code, LedgerError::E_CONCURRENT_MODIFICATION);
    // unit rolls back here
  }

  auto retried = writer.createTransaction(owner, spend(cash->id, 10));
  ASSERT_TRUE(retried.isOk()) << retried.error().message;
  auto account = writer.getAccount(owner, cash->id);
  ASSERT_TRUE(account.isOk());
  EXPECT_EQ(account->balance, Money::fromUnits(90));
}

TEST_F(ConcurrencyTest, ParallelWritersNeverOverspend) {
  Ledger setup;
  initLedger(setup, 5000);
  Ledger::NewAccount request;
  request.name = "Cash";
  request.kind = AccountKind::CASH;
  request.openingBalance = Money::fromUnits(100);
  auto cash = setup.createAccount(owner, request);
  ASSERT_TRUE(cash.isOk());

  const int workers = 4;
  const int attempts = 20;
  std::atomic<int> accepted{ 0 };
  std::atomic<int> refused{ 0 };
  std::atomic<int> unexpected{ 0 };

  std::vector<std::thread> threads;
  for (int i = 0; i < workers; ++i) {
    threads.emplace_back([&]() {
      Ledger ledger;
      Ledger::InitConfig config;
      config.dbPath = path;
      config.busyTimeoutMs = 5000;
      if (!ledger.init(config)) {
        ++unexpected;
        return;
      }
      for (int n = 0; n < attempts; ++n) {
        auto tx = ledger.createTransaction(owner, spend(cash->id, 3));
        if (tx) {
          ++accepted;
        } else if (tx.error().code == LedgerError::E_INSUFFICIENT_FUNDS) {
          ++refused;
        } else {
          ++unexpected;
        }
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }

  EXPECT_EQ(unexpected.load(), 0);
  EXPECT_EQ(accepted.load(), 33);
  EXPECT_EQ(accepted.load() + refused.load(), workers * attempts);

  auto account = setup.getAccount(owner, cash->id);
  ASSERT_TRUE(account.isOk());
  EXPECT_EQ(account->balance, Money::fromUnits(1));
  auto tags = setup.getTagBalances(owner, cash->id);
  ASSERT_TRUE(tags.isOk());
  ASSERT_EQ(tags->size(), 1u);
  EXPECT_EQ(tags->at(0).balance, Money::fromUnits(1));
}

TEST_F(ConcurrencyTest, WriteOffKeepsEditFromAnotherConnection) {
  Ledger first;
  initLedger(first, 0);
  Ledger second;
  initLedger(second, 0);

  Ledger::NewAccount request;
  request.name = "Cash";
  request.kind = AccountKind::CASH;
  request.openingBalance = Money::fromUnits(100);
  auto cash = first.createAccount(owner, request);
  ASSERT_TRUE(cash.isOk());

  DebtLedger::NewDebt loan;
  loan.direction = DebtDirection::LENDING;
  loan.amount = Money::fromUnits(40);
  loan.accountId = cash->id;
  loan.contactName = "Budi";
  auto created = first.createDebt(owner, loan);
  ASSERT_TRUE(created.isOk()) << created.error().message;
  Id debtId = created->debt.id;

  DebtLedger::Changes changes;
  changes.description = "Rent share";
  ASSERT_TRUE(second.editDebt(owner, debtId, changes).isOk());

  SqliteStore holder;
  SqliteStore::Config config;
  config.path = path;
  config.busyTimeoutMs = 0;
  ASSERT_TRUE(holder.open(config).isOk());
  {
    Store::UnitOfWork unit(holder);
    ASSERT_TRUE(unit.begin().isOk());
    auto blocked = first.markDebtPaid(owner, debtId, std::nullopt);
    ASSERT_TRUE(blocked.isError());
    EXPECT_EQ(blocked.error().code, LedgerError::E_CONCURRENT_MODIFICATION);
  }
  auto unchanged = second.getDebt(owner, debtId);
  ASSERT_TRUE(unchanged.isOk());
  EXPECT_FALSE(unchanged->paid);

  auto settled = first.markDebtPaid(owner, debtId, std::nullopt);
  ASSERT_TRUE(settled.isOk()) << settled.error().message;
  EXPECT_FALSE(settled->transaction.has_value());

  auto debt = second.getDebt(owner, debtId);
  ASSERT_TRUE(debt.isOk());
  EXPECT_TRUE(debt->paid);
  EXPECT_TRUE(debt->remaining.isZero());
  EXPECT_EQ(debt->amount, Money::fromUnits(40));
  EXPECT_EQ(debt->description, "Rent share");

  auto again = second.markDebtPaid(owner, debtId, std::nullopt);
  ASSERT_TRUE(again.isError());
  EXPECT_EQ(again.error().code, LedgerError::E_VALIDATION);

  auto account = second.getAccount(owner, cash->id);
  ASSERT_TRUE(account.isOk());
  EXPECT_EQ(account->balance, Money::fromUnits(60));
}
