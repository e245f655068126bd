#ifndef FF_LEDGER_SQLITE_STORE_H
#define FF_LEDGER_SQLITE_STORE_H

#include "Store.h"

#include <sqlite3.h>

#include <string>

namespace ff {

/**
 * Store backed by one SQLite connection. A connection serves one caller at a
 * time; concurrent callers open their own SqliteStore over the same file and
 * SQLite's write lock serializes them.
 */
class SqliteStore : public Store {
public:
  struct Config {
    std::string path;          // ":memory:" for a private in-memory database
    int busyTimeoutMs{ 5000 }; // how long a writer waits for the lock
  };

  SqliteStore();
  ~SqliteStore() override;

  /**
   * Open the database and create the schema when missing
   */
  Roe<void> open(const Config &config);
  void close();
  bool isOpen() const { return db_ != nullptr; }

  Roe<Id> insertAccount(const Account &account) override;
  Roe<Account> getAccount(const OwnerId &owner, Id id) const override;
  Roe<std::vector<Account>> listAccounts(const OwnerId &owner) const override;
  Roe<AccountStats> getAccountStats(const OwnerId &owner, Id id) const override;
  Roe<void> adjustBalance(const OwnerId &owner, Id id, const Money &delta) override;
  Roe<bool> decrementBalanceIfCovered(const OwnerId &owner, Id id,
                                      const Money &amount,
                                      const Money &floor) override;

  Roe<FundingSource> resolveFundingSource(const OwnerId &owner,
                                          const std::string &name,
                                          SourceCategory category) override;
  Roe<FundingSource> getFundingSource(const OwnerId &owner, Id id) const override;
  Roe<std::vector<FundingSource>> listFundingSources(const OwnerId &owner) const override;

  Roe<Category> resolveCategory(const OwnerId &owner, const std::string &name,
                                TxKind kind) override;

  Roe<Contact> resolveContact(const OwnerId &owner, const std::string &name) override;
  Roe<Contact> insertContact(const OwnerId &owner, const std::string &name) override;
  Roe<Contact> getContact(const OwnerId &owner, Id id) const override;
  Roe<std::vector<Contact>> listContacts(const OwnerId &owner) const override;

  Roe<Id> insertTransaction(const Transaction &tx, std::optional<Id> categoryId) override;
  Roe<void> updateTransaction(const Transaction &tx, std::optional<Id> categoryId) override;
  Roe<Transaction> getTransaction(const OwnerId &owner, Id id) const override;
  Roe<std::vector<Transaction>> listTransactions(const OwnerId &owner,
                                                 std::optional<Id> accountId,
                                                 size_t limit) const override;
  Roe<Transaction> findDebtTransaction(const OwnerId &owner, Id debtId,
                                       DebtRole role) const override;

  Roe<void> insertAllocations(Id txId,
                              const std::vector<FundingAllocation> &allocations) override;
  Roe<size_t> deleteAllocations(Id txId) override;
  Roe<void> insertLineItems(Id txId, const std::vector<ItemRow> &items) override;
  Roe<void> deleteLineItems(Id txId) override;

  Roe<std::vector<TagBalance>> provenanceTotals(const OwnerId &owner,
                                                Id accountId) const override;

  Roe<Id> insertDebt(const Debt &debt) override;
  Roe<Debt> getDebt(const OwnerId &owner, Id id) const override;
  Roe<void> updateDebt(const Debt &debt) override;
  Roe<void> deleteDebt(const OwnerId &owner, Id id) override;
  Roe<std::vector<Debt>> listDebts(const OwnerId &owner, bool activeOnly) const override;

protected:
  Roe<void> beginUnit() override;
  Roe<void> commitUnit() override;
  void rollbackUnit() override;

private:
  class Statement;

  Roe<void> exec(const std::string &sql) const;
  Roe<void> createSchema();
  Error errorFromCode(int rc, const std::string &context) const;
  Roe<void> loadChildren(Transaction &tx) const;

  sqlite3 *db_{ nullptr };
  int unitDepth_{ 0 };
};

} // namespace ff

#endif // FF_LEDGER_SQLITE_STORE_H
