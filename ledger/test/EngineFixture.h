#ifndef FF_LEDGER_TEST_ENGINE_FIXTURE_H
#define FF_LEDGER_TEST_ENGINE_FIXTURE_H

#include "SqliteStore.h"
#include "TransactionEngine.h"

#include <gtest/gtest.h>

namespace ff {

/**
 * In-memory store with an engine on top, plus shortcuts for the
 * transactions most tests start from.
 */
class EngineFixture : public ::testing::Test {
protected:
  const OwnerId owner{ "alice" };

  void SetUp() override {
    SqliteStore::Config config;
    config.path = ":memory:";
    auto opened = store.open(config);
    ASSERT_TRUE(opened.isOk()) << opened.error().message;
  }

  static Money units(int64_t n) { return Money::fromUnits(n); }

  Id addAccount(const std::string &name, AccountKind kind = AccountKind::CASH,
                std::optional<CreditTerms> credit = std::nullopt) {
    Account account;
    account.owner = owner;
    account.name = name;
    account.kind = kind;
    account.credit = credit;
    account.createdAt = 1;
    auto id = store.insertAccount(account);
    EXPECT_TRUE(id.isOk());
    return id ? id.value() : 0;
  }

  LedgerRoe<Transaction> income(Id account, int64_t amount, const std::string &source) {
    TransactionIntent intent;
    intent.kind = TxKind::INCOME;
    intent.amount = units(amount);
    intent.destAccountId = account;
    intent.fundingSourceName = source;
    return engine.apply(owner, intent);
  }

  LedgerRoe<Transaction> expense(Id account, int64_t amount,
                                 AllocationPlan plan = AutoAllocation{}) {
    TransactionIntent intent;
    intent.kind = TxKind::EXPENSE;
    intent.amount = units(amount);
    intent.sourceAccountId = account;
    intent.allocation = plan;
    return engine.apply(owner, intent);
  }

  LedgerRoe<Transaction> transfer(Id from, Id to, int64_t amount) {
    TransactionIntent intent;
    intent.kind = TxKind::TRANSFER;
    intent.amount = units(amount);
    intent.sourceAccountId = from;
    intent.destAccountId = to;
    return engine.apply(owner, intent);
  }

  Money balanceOf(Id account) {
    auto loaded = store.getAccount(owner, account);
    EXPECT_TRUE(loaded.isOk());
    return loaded.isOk() ? loaded->balance : Money();
  }

  std::vector<TagBalance> tagsOf(Id account) {
    auto tags = TagBalanceCalculator(store).compute(owner, account);
    EXPECT_TRUE(tags.isOk());
    return tags.isOk() ? tags.value() : std::vector<TagBalance>();
  }

  /** Balance recomputed from the transaction log */
  Money replayedBalance(Id account) {
    auto txes = store.listTransactions(owner, account, 0);
    EXPECT_TRUE(txes.isOk());
    Money sum;
    if (txes.isError()) {
      return sum;
    }
    for (const auto &tx : txes.value()) {
      if (tx.destAccountId == account) {
        sum += tx.amount;
      }
      if (tx.sourceAccountId == account) {
        sum -= tx.amount;
      }
    }
    return sum;
  }

  SqliteStore store;
  TransactionEngine engine{ store };
};

} // namespace ff

#endif // FF_LEDGER_TEST_ENGINE_FIXTURE_H
