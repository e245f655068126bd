#ifndef FF_LEDGER_DEBT_LEDGER_H
#define FF_LEDGER_DEBT_LEDGER_H

#include "LedgerError.h"
#include "Module.h"
#include "Store.h"
#include "TransactionEngine.h"
#include "Types.h"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace ff {

/**
 * Lending and borrowing on top of the transaction engine. Every money
 * movement of a debt is a transaction carrying the debt id and its role.
 */
class DebtLedger : public Module {
public:
  struct NewDebt {
    DebtDirection direction{ DebtDirection::LENDING };
    Money amount;
    Id accountId{ 0 };
    // Existing contact, or a name resolved case-insensitively
    std::optional<Id> contactId;
    std::string contactName;
    std::string description;
    std::optional<int64_t> dueDate;
    int64_t date{ 0 };
  };

  struct Payment {
    Money amount;
    Id accountId{ 0 };
    int64_t date{ 0 };
    std::string description;
  };

  struct Changes {
    std::optional<Money> amount;
    std::optional<std::string> description;
    std::optional<int64_t> dueDate;
    bool clearDueDate{ false };
    std::optional<Id> contactId;
    std::string contactName;
  };

  struct Outcome {
    Debt debt;
    std::optional<Transaction> transaction;

    nlohmann::json toJson() const;
  };

  struct Summary {
    Money totalLending;
    uint64_t lendingCount{ 0 };
    Money totalBorrowing;
    uint64_t borrowingCount{ 0 };

    nlohmann::json toJson() const;
  };

  DebtLedger(Store &store, TransactionEngine &engine);
  ~DebtLedger() override = default;

  /** Record the debt and disburse its amount through the given account */
  LedgerRoe<Outcome> create(const OwnerId &owner, const NewDebt &request);
  LedgerRoe<Outcome> recordPayment(const OwnerId &owner, Id debtId, const Payment &payment);

  /**
   * Close a debt. With an account and a positive remaining this is a payment
   * of the full remaining; otherwise the debt is written off without any
   * balance effect.
   */
  LedgerRoe<Outcome> markPaid(const OwnerId &owner, Id debtId,
                              std::optional<Id> accountId, int64_t date = 0);
  LedgerRoe<Debt> edit(const OwnerId &owner, Id debtId, const Changes &changes);
  LedgerRoe<void> remove(const OwnerId &owner, Id debtId);

  LedgerRoe<Debt> get(const OwnerId &owner, Id debtId) const;
  LedgerRoe<std::vector<Debt>> list(const OwnerId &owner, bool activeOnly) const;
  LedgerRoe<Summary> summarize(const OwnerId &owner) const;

  LedgerRoe<Contact> createContact(const OwnerId &owner, const std::string &name);
  LedgerRoe<std::vector<Contact>> listContacts(const OwnerId &owner) const;

private:
  LedgerRoe<Contact> resolveContact(const OwnerId &owner, std::optional<Id> contactId,
                                    const std::string &contactName);
  LedgerRoe<Outcome> createInUnit(const OwnerId &owner, const NewDebt &request);
  LedgerRoe<Outcome> payInUnit(const OwnerId &owner, Id debtId, const Payment &payment);
  LedgerRoe<Outcome> markPaidInUnit(const OwnerId &owner, Id debtId,
                                    std::optional<Id> accountId, int64_t date);
  LedgerRoe<Debt> editInUnit(const OwnerId &owner, Id debtId, const Changes &changes);

  Store &store_;
  TransactionEngine &engine_;
};

} // namespace ff

#endif // FF_LEDGER_DEBT_LEDGER_H
