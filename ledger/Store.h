#pragma once

#include "Module.h"
#include "ResultOrError.hpp"
#include "Types.h"

#include <optional>
#include <string>
#include <vector>

namespace ff {

/**
 * Persistence interface for accounts, funding provenance and debts.
 *
 * Every query is scoped by owner: a row belonging to another owner is
 * reported as not found. Writes are grouped with UnitOfWork; units nest.
 */
class Store : public Module {
public:
  constexpr static int32_t E_NOT_FOUND = 1;
  constexpr static int32_t E_CONSTRAINT = 2;
  constexpr static int32_t E_BUSY = 3;
  constexpr static int32_t E_IO = 4;
  constexpr static int32_t E_STATE = 5;
  constexpr static int32_t E_RANGE = 6;

  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  /**
   * Scoped unit of work. The outermost unit is a database transaction,
   * inner units are savepoints. Rolls back on destruction unless committed.
   */
  class UnitOfWork {
  public:
    explicit UnitOfWork(Store &store) : store_(store) {}
    ~UnitOfWork();

    UnitOfWork(const UnitOfWork &) = delete;
    UnitOfWork &operator=(const UnitOfWork &) = delete;

    Roe<void> begin();
    Roe<void> commit();

  private:
    Store &store_;
    bool active_{ false };
  };

  struct ItemRow {
    LineItem item;
    std::optional<Id> categoryId;
  };

  struct AccountStats {
    Money totalIn;
    Money totalOut;
    uint64_t transactionCount{ 0 };
  };

  explicit Store(const std::string &name) : Module(name) {}
  ~Store() override = default;

  // Accounts
  virtual Roe<Id> insertAccount(const Account &account) = 0;
  virtual Roe<Account> getAccount(const OwnerId &owner, Id id) const = 0;
  virtual Roe<std::vector<Account>> listAccounts(const OwnerId &owner) const = 0;
  virtual Roe<AccountStats> getAccountStats(const OwnerId &owner, Id id) const = 0;

  /**
   * Balance change by a signed delta, unconditional except that the result
   * must stay representable (E_RANGE otherwise).
   */
  virtual Roe<void> adjustBalance(const OwnerId &owner, Id id, const Money &delta) = 0;

  /**
   * Decrement by a non-negative amount only when the result stays at or
   * above floor.
   * @return false when no row qualified
   */
  virtual Roe<bool> decrementBalanceIfCovered(const OwnerId &owner, Id id,
                                              const Money &amount,
                                              const Money &floor) = 0;

  // Names are matched case-insensitively; the first spelling is kept
  virtual Roe<FundingSource> resolveFundingSource(const OwnerId &owner,
                                                  const std::string &name,
                                                  SourceCategory category) = 0;
  virtual Roe<FundingSource> getFundingSource(const OwnerId &owner, Id id) const = 0;
  virtual Roe<std::vector<FundingSource>> listFundingSources(const OwnerId &owner) const = 0;

  virtual Roe<Category> resolveCategory(const OwnerId &owner,
                                        const std::string &name, TxKind kind) = 0;

  virtual Roe<Contact> resolveContact(const OwnerId &owner, const std::string &name) = 0;
  /** Fails with E_CONSTRAINT when the name is taken */
  virtual Roe<Contact> insertContact(const OwnerId &owner, const std::string &name) = 0;
  virtual Roe<Contact> getContact(const OwnerId &owner, Id id) const = 0;
  virtual Roe<std::vector<Contact>> listContacts(const OwnerId &owner) const = 0;

  // Transactions
  virtual Roe<Id> insertTransaction(const Transaction &tx,
                                    std::optional<Id> categoryId) = 0;
  virtual Roe<void> updateTransaction(const Transaction &tx,
                                      std::optional<Id> categoryId) = 0;
  /** Loads the row together with its allocations and line items */
  virtual Roe<Transaction> getTransaction(const OwnerId &owner, Id id) const = 0;
  /**
   * Newest first. Without an account all of the owner's transactions are
   * listed; a limit of 0 means no limit.
   */
  virtual Roe<std::vector<Transaction>> listTransactions(const OwnerId &owner,
                                                         std::optional<Id> accountId,
                                                         size_t limit) const = 0;
  virtual Roe<Transaction> findDebtTransaction(const OwnerId &owner, Id debtId,
                                               DebtRole role) const = 0;

  virtual Roe<void> insertAllocations(Id txId,
                                      const std::vector<FundingAllocation> &allocations) = 0;
  virtual Roe<size_t> deleteAllocations(Id txId) = 0;
  virtual Roe<void> insertLineItems(Id txId, const std::vector<ItemRow> &items) = 0;
  virtual Roe<void> deleteLineItems(Id txId) = 0;

  /**
   * Per-source credit and debit totals of an account's allocation rows,
   * unfiltered and in no particular order.
   */
  virtual Roe<std::vector<TagBalance>> provenanceTotals(const OwnerId &owner,
                                                        Id accountId) const = 0;

  // Debts
  virtual Roe<Id> insertDebt(const Debt &debt) = 0;
  virtual Roe<Debt> getDebt(const OwnerId &owner, Id id) const = 0;
  virtual Roe<void> updateDebt(const Debt &debt) = 0;
  /** Linked transactions keep their rows and lose the debt reference */
  virtual Roe<void> deleteDebt(const OwnerId &owner, Id id) = 0;
  virtual Roe<std::vector<Debt>> listDebts(const OwnerId &owner, bool activeOnly) const = 0;

protected:
  virtual Roe<void> beginUnit() = 0;
  virtual Roe<void> commitUnit() = 0;
  virtual void rollbackUnit() = 0;
};

} // namespace ff
