#pragma once

#include "DebtLedger.h"
#include "LedgerError.h"
#include "Module.h"
#include "SqliteStore.h"
#include "TagBalance.h"
#include "TransactionEngine.h"
#include "Types.h"

#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace ff {

/**
 * Public entry point of the ledger. Every call takes the verified owner id
 * explicitly; nothing is shared between owners.
 */
class Ledger : public Module {
public:
  struct InitConfig {
    std::string dbPath;
    int busyTimeoutMs{ 5000 };
  };

  struct NewAccount {
    std::string name;
    AccountKind kind{ AccountKind::BANK };
    Money openingBalance;
    std::optional<CreditTerms> credit;
    int64_t date{ 0 };
  };

  struct AccountDetail {
    Account account;
    Money totalIncome;
    Money totalExpense;
    uint64_t transactionCount{ 0 };

    nlohmann::json toJson() const;
  };

  /** Funding source every opening balance is tagged with */
  static constexpr const char *OPENING_SOURCE = "Initial Balance";

  Ledger();
  ~Ledger() override = default;

  LedgerRoe<void> init(const InitConfig &config);

  /**
   * A positive opening balance becomes an INCOME tagged "Initial Balance".
   * A negative one is only accepted for CREDIT accounts within the limit.
   */
  LedgerRoe<Account> createAccount(const OwnerId &owner, const NewAccount &request);
  LedgerRoe<std::vector<Account>> listAccounts(const OwnerId &owner) const;
  LedgerRoe<Account> getAccount(const OwnerId &owner, Id accountId) const;
  LedgerRoe<AccountDetail> getAccountDetail(const OwnerId &owner, Id accountId) const;
  LedgerRoe<std::vector<TagBalance>> getTagBalances(const OwnerId &owner, Id accountId) const;

  LedgerRoe<Transaction> createTransaction(const OwnerId &owner, const TransactionIntent &intent);
  LedgerRoe<Transaction> editTransaction(const OwnerId &owner, Id txId,
                                         const TransactionIntent &intent);
  LedgerRoe<Transaction> getTransaction(const OwnerId &owner, Id txId) const;
  // Newest first; without an account every transaction of the owner, limit 0 = all
  LedgerRoe<std::vector<Transaction>> getTransactionHistory(const OwnerId &owner,
                                                            std::optional<Id> accountId,
                                                            size_t limit) const;
  LedgerRoe<std::vector<FundingSource>> listFundingSources(const OwnerId &owner) const;

  LedgerRoe<DebtLedger::Outcome> createDebt(const OwnerId &owner,
                                            const DebtLedger::NewDebt &request);
  LedgerRoe<DebtLedger::Outcome> recordDebtPayment(const OwnerId &owner, Id debtId,
                                                   const DebtLedger::Payment &payment);
  LedgerRoe<DebtLedger::Outcome> markDebtPaid(const OwnerId &owner, Id debtId,
                                              std::optional<Id> accountId);
  LedgerRoe<Debt> editDebt(const OwnerId &owner, Id debtId, const DebtLedger::Changes &changes);
  LedgerRoe<void> deleteDebt(const OwnerId &owner, Id debtId);
  LedgerRoe<Debt> getDebt(const OwnerId &owner, Id debtId) const;
  LedgerRoe<std::vector<Debt>> listDebts(const OwnerId &owner, bool activeOnly) const;
  LedgerRoe<DebtLedger::Summary> debtSummary(const OwnerId &owner) const;
  LedgerRoe<Contact> createContact(const OwnerId &owner, const std::string &name);
  LedgerRoe<std::vector<Contact>> listContacts(const OwnerId &owner) const;

private:
  /**
   * Money arithmetic past the int64 range throws. Report it as a rejected
   * amount; any open unit of work rolls back while the exception unwinds.
   */
  template <typename T, typename Fn> LedgerRoe<T> guarded(Fn &&fn) {
    try {
      return fn();
    } catch (const std::overflow_error &e) {
      log().warning << "Amount out of range: " << e.what();
      return LedgerError(LedgerError::E_VALIDATION,
                         std::string("Amount out of range: ") + e.what());
    }
  }

  LedgerRoe<void> checkReady(const OwnerId &owner) const;
  LedgerRoe<Account> createAccountInUnit(const OwnerId &owner, const NewAccount &request);

  std::unique_ptr<SqliteStore> store_;
  std::unique_ptr<TransactionEngine> engine_;
  std::unique_ptr<DebtLedger> debts_;
};

} // namespace ff
