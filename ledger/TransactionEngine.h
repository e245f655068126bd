#ifndef FF_LEDGER_TRANSACTION_ENGINE_H
#define FF_LEDGER_TRANSACTION_ENGINE_H

#include "LedgerError.h"
#include "Module.h"
#include "Store.h"
#include "TagBalance.h"
#include "Types.h"

#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace ff {

/** Draw from the account's tags with the waterfall */
struct AutoAllocation {};

/** Caller chosen (source, amount) rows; must sum to the amount */
struct ManualAllocation {
  std::vector<FundingAllocation> entries;
};

/** No provenance consumed; only for LENDING disbursements */
struct Untracked {};

using AllocationPlan = std::variant<AutoAllocation, ManualAllocation, Untracked>;

struct TransactionIntent {
  TxKind kind{ TxKind::EXPENSE };
  Money amount;
  int64_t date{ 0 };
  std::string description;
  std::string category;
  std::optional<Id> sourceAccountId;
  std::optional<Id> destAccountId;
  // Tag for INCOME and REPAYMENT, resolved case-insensitively
  std::string fundingSourceName;
  SourceCategory sourceCategory{ SourceCategory::INCOME };
  AllocationPlan allocation;
  std::vector<LineItem> items;
  std::optional<Id> debtId;
  DebtRole debtRole{ DebtRole::NONE };
};

/**
 * Applies transactions to balances and provenance rows, and edits them by
 * undoing the stored effects and re-applying the new intent. Each call is
 * one unit of work; when invoked inside an open unit it nests.
 */
class TransactionEngine : public Module {
public:
  explicit TransactionEngine(Store &store);
  ~TransactionEngine() override = default;

  LedgerRoe<Transaction> apply(const OwnerId &owner, const TransactionIntent &intent);

  /**
   * Replace a stored transaction in place. Debt-linked transactions keep
   * their kind and move the linked debt by the amount delta.
   */
  LedgerRoe<Transaction> edit(const OwnerId &owner, Id txId, const TransactionIntent &intent);

  /**
   * Intent that re-applies a stored transaction as it is. Debiting kinds
   * get an automatic allocation, which an unchanged edit resolves to the
   * stored rows.
   */
  static TransactionIntent intentFrom(const Transaction &tx);

  /** Pure checks that need no store access */
  static LedgerRoe<void> validate(const OwnerId &owner, const TransactionIntent &intent);

private:
  LedgerRoe<Transaction> applyInPlace(const OwnerId &owner, const TransactionIntent &intent,
                                      std::optional<Id> existingId);
  LedgerRoe<std::vector<FundingAllocation>>
  resolveAllocations(const OwnerId &owner, const TransactionIntent &intent);
  LedgerRoe<Transaction> editInUnit(const OwnerId &owner, Id txId,
                                    const TransactionIntent &intent);
  LedgerRoe<void> rollback(const OwnerId &owner, const Transaction &old,
                           std::set<Id> &touched);
  LedgerRoe<void> adjustLinkedDebt(const OwnerId &owner, const Transaction &old,
                                   const Money &newAmount);

  Store &store_;
  TagBalanceCalculator tagBalances_;
};

} // namespace ff

#endif // FF_LEDGER_TRANSACTION_ENGINE_H
