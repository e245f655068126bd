#include "SqliteStore.h"
#include <gtest/gtest.h>

using namespace ff;

class SqliteStoreTest : public ::testing::Test {
protected:
  void SetUp() override {
    SqliteStore::Config config;
    config.path = ":memory:";
    auto opened = store.open(config);
    ASSERT_TRUE(opened.isOk()) << opened.error().message;
  }

  Id addAccount(const OwnerId &owner, const std::string &name, int64_t balanceUnits = 0) {
    Account account;
    account.owner = owner;
    account.name = name;
    account.kind = AccountKind::CASH;
    account.balance = Money::fromUnits(balanceUnits);
    account.createdAt = 1;
    auto id = store.insertAccount(account);
    EXPECT_TRUE(id.isOk());
    return id ? id.value() : 0;
  }

  SqliteStore store;
};

TEST_F(SqliteStoreTest, OpenTwiceFails) {
  SqliteStore::Config config;
  config.path = ":memory:";
  auto again = store.open(config);
  ASSERT_TRUE(again.isError());
  EXPECT_EQ(again.error().code, Store::E_STATE);
}

TEST_F(SqliteStoreTest, AccountsAreScopedByOwner) {
  Id id = addAccount("alice", "Cash", 10);
  auto mine = store.getAccount("alice", id);
  ASSERT_TRUE(mine.isOk());
  EXPECT_EQ(mine->name, "Cash");
  EXPECT_EQ(mine->balance, Money::fromUnits(10));

  auto foreign = store.getAccount("bob", id);
  ASSERT_TRUE(foreign.isError());
  EXPECT_EQ(foreign.error().code, Store::E_NOT_FOUND);

  auto list = store.listAccounts("bob");
  ASSERT_TRUE(list.isOk());
  EXPECT_TRUE(list->empty());
}

TEST_F(SqliteStoreTest, ListAccountsOrderedByName) {
  addAccount("alice", "Wallet");
  addAccount("alice", "Bank");
  auto list = store.listAccounts("alice");
  ASSERT_TRUE(list.isOk());
  ASSERT_EQ(list->size(), 2u);
  EXPECT_EQ((*list)[0].name, "Bank");
  EXPECT_EQ((*list)[1].name, "Wallet");
}

TEST_F(SqliteStoreTest, CreditTermsRoundTrip) {
  Account account;
  account.owner = "alice";
  account.name = "Card";
  account.kind = AccountKind::CREDIT;
  account.credit = CreditTerms{Money::fromUnits(5000), 25, 10};
  auto id = store.insertAccount(account);
  ASSERT_TRUE(id.isOk());
  auto loaded = store.getAccount("alice", id.value());
  ASSERT_TRUE(loaded.isOk());
  ASSERT_TRUE(loaded->credit.has_value());
  EXPECT_EQ(loaded->credit->limit, Money::fromUnits(5000));
  EXPECT_EQ(loaded->credit->statementDay, 25);
  EXPECT_EQ(loaded->credit->dueDay, 10);
  EXPECT_EQ(loaded->floor(), -Money::fromUnits(5000));
}

TEST_F(SqliteStoreTest, ConditionalDecrement) {
  Id id = addAccount("alice", "Cash", 100);
  auto ok = store.decrementBalanceIfCovered("alice", id, Money::fromUnits(60), Money());
  ASSERT_TRUE(ok.isOk());
  EXPECT_TRUE(ok.value());

  auto refused = store.decrementBalanceIfCovered("alice", id, Money::fromUnits(60), Money());
  ASSERT_TRUE(refused.isOk());
  EXPECT_FALSE(refused.value());
  EXPECT_EQ(store.getAccount("alice", id)->balance, Money::fromUnits(40));

  auto toFloor = store.decrementBalanceIfCovered("alice", id, Money::fromUnits(40), Money());
  ASSERT_TRUE(toFloor.isOk());
  EXPECT_TRUE(toFloor.value());
}

TEST_F(SqliteStoreTest, AdjustUnknownAccountIsNotFound) {
  auto r = store.adjustBalance("alice", 999, Money::fromUnits(1));
  ASSERT_TRUE(r.isError());
  EXPECT_EQ(r.error().code, Store::E_NOT_FOUND);
}

TEST_F(SqliteStoreTest, AdjustBalanceStaysRepresentable) {
  Id id = addAccount("alice", "Cash", 90000000000000000);
  Money start = Money::fromUnits(90000000000000000);

  auto past = store.adjustBalance("alice", id, start);
  ASSERT_TRUE(past.isError());
  EXPECT_EQ(past.error().code, Store::E_RANGE);
  EXPECT_EQ(store.getAccount("alice", id)->balance, start);

  ASSERT_TRUE(store.adjustBalance("alice", id, Money::max() - start).isOk());
  EXPECT_EQ(store.getAccount("alice", id)->balance, Money::max());
  auto oneMore = store.adjustBalance("alice", id, Money::fromMinor(1));
  ASSERT_TRUE(oneMore.isError());
  EXPECT_EQ(oneMore.error().code, Store::E_RANGE);
  EXPECT_EQ(store.getAccount("alice", id)->balance, Money::max());

  Id low = addAccount("alice", "Card");
  ASSERT_TRUE(store.adjustBalance("alice", low, Money::lowest()).isOk());
  auto below = store.adjustBalance("alice", low, Money::fromMinor(-1));
  ASSERT_TRUE(below.isError());
  EXPECT_EQ(below.error().code, Store::E_RANGE);
  EXPECT_EQ(store.getAccount("alice", low)->balance, Money::lowest());
}

TEST_F(SqliteStoreTest, ConditionalDecrementToMaximalCreditFloor) {
  Id id = addAccount("alice", "Card");
  Money floor = -Money::max();
  auto drawn = store.decrementBalanceIfCovered("alice", id, Money::max(), floor);
  ASSERT_TRUE(drawn.isOk());
  EXPECT_TRUE(drawn.value());
  EXPECT_EQ(store.getAccount("alice", id)->balance, floor);

  auto exhausted = store.decrementBalanceIfCovered("alice", id, Money::fromMinor(1), floor);
  ASSERT_TRUE(exhausted.isOk());
  EXPECT_FALSE(exhausted.value());
  EXPECT_EQ(store.getAccount("alice", id)->balance, floor);

  auto negative = store.decrementBalanceIfCovered("alice", id, Money::fromMinor(-1), floor);
  ASSERT_TRUE(negative.isError());
  EXPECT_EQ(negative.error().code, Store::E_STATE);
}

TEST_F(SqliteStoreTest, ResolveFundingSourceIsCaseInsensitive) {
  auto first = store.resolveFundingSource("alice", "Gaji", SourceCategory::INCOME);
  ASSERT_TRUE(first.isOk());
  auto second = store.resolveFundingSource("alice", "GAJI", SourceCategory::OTHER);
  ASSERT_TRUE(second.isOk());
  EXPECT_EQ(first->id, second->id);
  // The first spelling and category are kept
  EXPECT_EQ(second->name, "Gaji");
  EXPECT_EQ(second->category, SourceCategory::INCOME);

  auto other = store.resolveFundingSource("bob", "gaji", SourceCategory::INCOME);
  ASSERT_TRUE(other.isOk());
  EXPECT_NE(other->id, first->id);

  auto list = store.listFundingSources("alice");
  ASSERT_TRUE(list.isOk());
  EXPECT_EQ(list->size(), 1u);
}

TEST_F(SqliteStoreTest, CategoriesAreKeyedByKind) {
  auto expense = store.resolveCategory("alice", "Food", TxKind::EXPENSE);
  auto again = store.resolveCategory("alice", "food", TxKind::EXPENSE);
  auto income = store.resolveCategory("alice", "Food", TxKind::INCOME);
  ASSERT_TRUE(expense.isOk());
  ASSERT_TRUE(again.isOk());
  ASSERT_TRUE(income.isOk());
  EXPECT_EQ(expense->id, again->id);
  EXPECT_NE(expense->id, income->id);
}

TEST_F(SqliteStoreTest, InsertContactRejectsDuplicate) {
  auto first = store.insertContact("alice", "Budi");
  ASSERT_TRUE(first.isOk());
  auto dup = store.insertContact("alice", "budi");
  ASSERT_TRUE(dup.isError());
  EXPECT_EQ(dup.error().code, Store::E_CONSTRAINT);

  auto resolved = store.resolveContact("alice", "BUDI");
  ASSERT_TRUE(resolved.isOk());
  EXPECT_EQ(resolved->id, first->id);
}

TEST_F(SqliteStoreTest, TransactionWithChildren) {
  Id cash = addAccount("alice", "Cash");
  auto source = store.resolveFundingSource("alice", "Gaji", SourceCategory::INCOME);
  ASSERT_TRUE(source.isOk());
  auto food = store.resolveCategory("alice", "Food", TxKind::EXPENSE);
  ASSERT_TRUE(food.isOk());

  Transaction tx;
  tx.owner = "alice";
  tx.kind = TxKind::EXPENSE;
  tx.amount = Money::fromUnits(30);
  tx.date = 100;
  tx.description = "Lunch";
  tx.sourceAccountId = cash;
  auto id = store.insertTransaction(tx, food->id);
  ASSERT_TRUE(id.isOk()) << id.error().message;

  ASSERT_TRUE(store.insertAllocations(id.value(), {{source->id, "", Money::fromUnits(30)}}).isOk());
  Store::ItemRow row;
  row.item.name = "Rice";
  row.item.unitPrice = Money::fromUnits(10);
  row.item.quantity = 3;
  row.categoryId = food->id;
  ASSERT_TRUE(store.insertLineItems(id.value(), {row}).isOk());

  auto loaded = store.getTransaction("alice", id.value());
  ASSERT_TRUE(loaded.isOk()) << loaded.error().message;
  EXPECT_EQ(loaded->category, "Food");
  ASSERT_EQ(loaded->allocations.size(), 1u);
  EXPECT_EQ(loaded->allocations[0].sourceName, "Gaji");
  EXPECT_EQ(loaded->allocatedTotal(), Money::fromUnits(30));
  ASSERT_EQ(loaded->items.size(), 1u);
  EXPECT_EQ(loaded->items[0].total(), Money::fromUnits(30));
  EXPECT_EQ(loaded->items[0].category, "Food");

  auto removed = store.deleteAllocations(id.value());
  ASSERT_TRUE(removed.isOk());
  EXPECT_EQ(removed.value(), 1u);
  EXPECT_TRUE(store.getTransaction("bob", id.value()).isError());
}

TEST_F(SqliteStoreTest, HistoryNewestFirstWithLimit) {
  Id cash = addAccount("alice", "Cash");
  Id bank = addAccount("alice", "Bank");
  for (int64_t day = 1; day <= 3; ++day) {
    Transaction tx;
    tx.owner = "alice";
    tx.kind = TxKind::INCOME;
    tx.amount = Money::fromUnits(day);
    tx.date = day * 86400;
    tx.destAccountId = day == 2 ? bank : cash;
    ASSERT_TRUE(store.insertTransaction(tx, std::nullopt).isOk());
  }

  auto all = store.listTransactions("alice", std::nullopt, 0);
  ASSERT_TRUE(all.isOk());
  ASSERT_EQ(all->size(), 3u);
  EXPECT_EQ((*all)[0].amount, Money::fromUnits(3));
  EXPECT_EQ((*all)[2].amount, Money::fromUnits(1));

  auto cashOnly = store.listTransactions("alice", cash, 0);
  ASSERT_TRUE(cashOnly.isOk());
  EXPECT_EQ(cashOnly->size(), 2u);

  auto limited = store.listTransactions("alice", std::nullopt, 1);
  ASSERT_TRUE(limited.isOk());
  ASSERT_EQ(limited->size(), 1u);
  EXPECT_EQ((*limited)[0].amount, Money::fromUnits(3));
}

TEST_F(SqliteStoreTest, UnitRollsBackOnDestruction) {
  Id cash = addAccount("alice", "Cash", 100);
  {
    Store::UnitOfWork unit(store);
    ASSERT_TRUE(unit.begin().isOk());
    ASSERT_TRUE(store.adjustBalance("alice", cash, Money::fromUnits(50)).isOk());
  }
  EXPECT_EQ(store.getAccount("alice", cash)->balance, Money::fromUnits(100));
}

TEST_F(SqliteStoreTest, NestedUnitRollsBackOnlyItself) {
  Id cash = addAccount("alice", "Cash", 100);
  Store::UnitOfWork outer(store);
  ASSERT_TRUE(outer.begin().isOk());
  ASSERT_TRUE(store.adjustBalance("alice", cash, Money::fromUnits(1)).isOk());
  {
    Store::UnitOfWork inner(store);
    ASSERT_TRUE(inner.begin().isOk());
    ASSERT_TRUE(store.adjustBalance("alice", cash, Money::fromUnits(10)).isOk());
  }
  {
    Store::UnitOfWork inner(store);
    ASSERT_TRUE(inner.begin().isOk());
    ASSERT_TRUE(store.adjustBalance("alice", cash, Money::fromUnits(100)).isOk());
    ASSERT_TRUE(inner.commit().isOk());
  }
  ASSERT_TRUE(outer.commit().isOk());
  EXPECT_EQ(store.getAccount("alice", cash)->balance, Money::fromUnits(201));
}

TEST_F(SqliteStoreTest, CommitWithoutBeginFails) {
  Store::UnitOfWork unit(store);
  auto r = unit.commit();
  ASSERT_TRUE(r.isError());
  EXPECT_EQ(r.error().code, Store::E_STATE);
}

TEST_F(SqliteStoreTest, DeleteDebtUnlinksTransactions) {
  Id cash = addAccount("alice", "Cash", 100);
  auto contact = store.resolveContact("alice", "Budi");
  ASSERT_TRUE(contact.isOk());

  Debt debt;
  debt.owner = "alice";
  debt.amount = Money::fromUnits(50);
  debt.remaining = Money::fromUnits(50);
  debt.contactId = contact->id;
  auto debtId = store.insertDebt(debt);
  ASSERT_TRUE(debtId.isOk()) << debtId.error().message;

  Transaction tx;
  tx.owner = "alice";
  tx.kind = TxKind::LENDING;
  tx.amount = Money::fromUnits(50);
  tx.date = 1;
  tx.sourceAccountId = cash;
  tx.debtId = debtId.value();
  tx.debtRole = DebtRole::DISBURSEMENT;
  auto txId = store.insertTransaction(tx, std::nullopt);
  ASSERT_TRUE(txId.isOk());

  auto found = store.findDebtTransaction("alice", debtId.value(), DebtRole::DISBURSEMENT);
  ASSERT_TRUE(found.isOk());
  EXPECT_EQ(found->id, txId.value());

  ASSERT_TRUE(store.deleteDebt("alice", debtId.value()).isOk());
  auto unlinked = store.getTransaction("alice", txId.value());
  ASSERT_TRUE(unlinked.isOk());
  EXPECT_FALSE(unlinked->debtId.has_value());
  EXPECT_EQ(unlinked->debtRole, DebtRole::NONE);

  auto gone = store.deleteDebt("alice", debtId.value());
  ASSERT_TRUE(gone.isError());
  EXPECT_EQ(gone.error().code, Store::E_NOT_FOUND);
}

TEST_F(SqliteStoreTest, DebtRemainingBoundIsEnforced) {
  auto contact = store.resolveContact("alice", "Budi");
  ASSERT_TRUE(contact.isOk());
  Debt debt;
  debt.owner = "alice";
  debt.amount = Money::fromUnits(50);
  debt.remaining = Money::fromUnits(60);
  debt.contactId = contact->id;
  auto r = store.insertDebt(debt);
  ASSERT_TRUE(r.isError());
  EXPECT_EQ(r.error().code, Store::E_CONSTRAINT);
}
