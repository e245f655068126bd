#include "Ledger.h"
#include "Utilities.h"

namespace ff {

nlohmann::json Ledger::AccountDetail::toJson() const {
  nlohmann::json j = account.toJson();
  j["totalIncome"] = totalIncome.toString();
  j["totalExpense"] = totalExpense.toString();
  j["transactionCount"] = transactionCount;
  return j;
}

Ledger::Ledger() : Module("ledger") {}

LedgerRoe<void> Ledger::init(const InitConfig &config) {
  if (store_) {
    return LedgerError(LedgerError::E_VALIDATION, "Ledger already initialized");
  }

  auto store = std::make_unique<SqliteStore>();
  SqliteStore::Config storeConfig;
  storeConfig.path = config.dbPath;
  storeConfig.busyTimeoutMs = config.busyTimeoutMs;
  auto opened = store->open(storeConfig);
  if (!opened) {
    return LedgerError::fromStore(opened.error());
  }

  store_ = std::move(store);
  engine_ = std::make_unique<TransactionEngine>(*store_);
  debts_ = std::make_unique<DebtLedger>(*store_, *engine_);
  log().info << "Ledger ready on " << config.dbPath;
  return {};
}

LedgerRoe<void> Ledger::checkReady(const OwnerId &owner) const {
  if (!store_) {
    return LedgerError(LedgerError::E_STORE, "Ledger is not initialized");
  }
  if (owner.empty()) {
    return LedgerError(LedgerError::E_VALIDATION, "Owner is required");
  }
  return {};
}

LedgerRoe<Account> Ledger::createAccount(const OwnerId &owner, const NewAccount &request) {
  auto ready = checkReady(owner);
  if (!ready) {
    return ready.error();
  }
  if (utl::trim(request.name).empty()) {
    return LedgerError(LedgerError::E_VALIDATION, "Account name is required");
  }
  if (request.credit) {
    if (request.kind != AccountKind::CREDIT) {
      return LedgerError(LedgerError::E_VALIDATION,
                         "Credit terms are only for CREDIT accounts");
    }
    if (request.credit->limit.isNegative()) {
      return LedgerError(LedgerError::E_VALIDATION, "Credit limit must not be negative");
    }
    for (int day : {request.credit->statementDay, request.credit->dueDay}) {
      if (day < 1 || day > 31) {
        return LedgerError(LedgerError::E_VALIDATION,
                           "Statement and due day must be within 1..31");
      }
    }
  }
  if (request.openingBalance.isNegative()) {
    Money limit = request.credit ? request.credit->limit : Money();
    if (request.kind != AccountKind::CREDIT || request.openingBalance < -limit) {
      return LedgerError(LedgerError::E_VALIDATION,
                         "Negative opening balance needs a CREDIT account within its limit");
    }
  }

  return guarded<Account>([&]() -> LedgerRoe<Account> {
    Store::UnitOfWork unit(*store_);
    auto begun = unit.begin();
    if (!begun) {
      return LedgerError::fromStore(begun.error());
    }
    auto result = createAccountInUnit(owner, request);
    if (!result) {
      log().warning << "Account rejected: " << result.error().message;
      return result;
    }
    auto committed = unit.commit();
    if (!committed) {
      return LedgerError::fromStore(committed.error());
    }
    log().info << "Created " << toString(result->kind) << " account " << result->id << " '"
               << result->name << "' with balance " << result->balance;
    return result;
  });
}

LedgerRoe<Account> Ledger::createAccountInUnit(const OwnerId &owner,
                                               const NewAccount &request) {
  Account account;
  account.owner = owner;
  account.name = utl::trim(request.name);
  account.kind = request.kind;
  account.credit = request.credit;
  account.createdAt = utl::getCurrentTime();

  auto inserted = store_->insertAccount(account);
  if (!inserted) {
    return LedgerError::fromStore(inserted.error());
  }
  account.id = inserted.value();

  if (!request.openingBalance.isZero()) {
    TransactionIntent intent;
    intent.date = request.date;
    intent.description = OPENING_SOURCE;
    intent.category = OPENING_SOURCE;
    if (request.openingBalance.isPositive()) {
      intent.kind = TxKind::INCOME;
      intent.amount = request.openingBalance;
      intent.destAccountId = account.id;
      intent.fundingSourceName = OPENING_SOURCE;
      intent.sourceCategory = SourceCategory::OTHER;
    } else {
      auto source = store_->resolveFundingSource(owner, OPENING_SOURCE, SourceCategory::OTHER);
      if (!source) {
        return LedgerError::fromStore(source.error());
      }
      intent.kind = TxKind::EXPENSE;
      intent.amount = -request.openingBalance;
      intent.sourceAccountId = account.id;
      intent.allocation = ManualAllocation{{{source->id, source->name, intent.amount}}};
    }
    auto tx = engine_->apply(owner, intent);
    if (!tx) {
      return tx.error();
    }
  }

  auto stored = store_->getAccount(owner, account.id);
  if (!stored) {
    return LedgerError::fromStore(stored.error());
  }
  return stored.value();
}

LedgerRoe<std::vector<Account>> Ledger::listAccounts(const OwnerId &owner) const {
  auto ready = checkReady(owner);
  if (!ready) {
    return ready.error();
  }
  auto accounts = store_->listAccounts(owner);
  if (!accounts) {
    return LedgerError::fromStore(accounts.error());
  }
  return accounts.value();
}

LedgerRoe<Account> Ledger::getAccount(const OwnerId &owner, Id accountId) const {
  auto ready = checkReady(owner);
  if (!ready) {
    return ready.error();
  }
  auto account = store_->getAccount(owner, accountId);
  if (!account) {
    return LedgerError::fromStore(account.error());
  }
  return account.value();
}

LedgerRoe<Ledger::AccountDetail> Ledger::getAccountDetail(const OwnerId &owner,
                                                          Id accountId) const {
  auto account = getAccount(owner, accountId);
  if (!account) {
    return account.error();
  }
  auto stats = store_->getAccountStats(owner, accountId);
  if (!stats) {
    return LedgerError::fromStore(stats.error());
  }
  AccountDetail detail;
  detail.account = account.value();
  detail.totalIncome = stats->totalIn;
  detail.totalExpense = stats->totalOut;
  detail.transactionCount = stats->transactionCount;
  return detail;
}

LedgerRoe<std::vector<TagBalance>> Ledger::getTagBalances(const OwnerId &owner,
                                                          Id accountId) const {
  auto ready = checkReady(owner);
  if (!ready) {
    return ready.error();
  }
  return TagBalanceCalculator(*store_).compute(owner, accountId);
}

LedgerRoe<Transaction> Ledger::createTransaction(const OwnerId &owner,
                                                 const TransactionIntent &intent) {
  auto ready = checkReady(owner);
  if (!ready) {
    return ready.error();
  }
  if (intent.debtId) {
    return LedgerError(LedgerError::E_VALIDATION,
                       "Debt transactions are created through the debt operations");
  }
  return guarded<Transaction>([&] { return engine_->apply(owner, intent); });
}

LedgerRoe<Transaction> Ledger::editTransaction(const OwnerId &owner, Id txId,
                                               const TransactionIntent &intent) {
  auto ready = checkReady(owner);
  if (!ready) {
    return ready.error();
  }
  return guarded<Transaction>([&] { return engine_->edit(owner, txId, intent); });
}

LedgerRoe<Transaction> Ledger::getTransaction(const OwnerId &owner, Id txId) const {
  auto ready = checkReady(owner);
  if (!ready) {
    return ready.error();
  }
  auto tx = store_->getTransaction(owner, txId);
  if (!tx) {
    return LedgerError::fromStore(tx.error());
  }
  return tx.value();
}

LedgerRoe<std::vector<Transaction>>
Ledger::getTransactionHistory(const OwnerId &owner, std::optional<Id> accountId,
                              size_t limit) const {
  auto ready = checkReady(owner);
  if (!ready) {
    return ready.error();
  }
  if (accountId) {
    auto account = store_->getAccount(owner, *accountId);
    if (!account) {
      return LedgerError::fromStore(account.error());
    }
  }
  auto txes = store_->listTransactions(owner, accountId, limit);
  if (!txes) {
    return LedgerError::fromStore(txes.error());
  }
  return txes.value();
}

LedgerRoe<std::vector<FundingSource>> Ledger::listFundingSources(const OwnerId &owner) const {
  auto ready = checkReady(owner);
  if (!ready) {
    return ready.error();
  }
  auto sources = store_->listFundingSources(owner);
  if (!sources) {
    return LedgerError::fromStore(sources.error());
  }
  return sources.value();
}

LedgerRoe<DebtLedger::Outcome> Ledger::createDebt(const OwnerId &owner,
                                                  const DebtLedger::NewDebt &request) {
  auto ready = checkReady(owner);
  if (!ready) {
    return ready.error();
  }
  return guarded<DebtLedger::Outcome>([&] { return debts_->create(owner, request); });
}

LedgerRoe<DebtLedger::Outcome> Ledger::recordDebtPayment(const OwnerId &owner, Id debtId,
                                                         const DebtLedger::Payment &payment) {
  auto ready = checkReady(owner);
  if (!ready) {
    return ready.error();
  }
  return guarded<DebtLedger::Outcome>(
      [&] { return debts_->recordPayment(owner, debtId, payment); });
}

LedgerRoe<DebtLedger::Outcome> Ledger::markDebtPaid(const OwnerId &owner, Id debtId,
                                                    std::optional<Id> accountId) {
  auto ready = checkReady(owner);
  if (!ready) {
    return ready.error();
  }
  return guarded<DebtLedger::Outcome>(
      [&] { return debts_->markPaid(owner, debtId, accountId); });
}

LedgerRoe<Debt> Ledger::editDebt(const OwnerId &owner, Id debtId,
                                 const DebtLedger::Changes &changes) {
  auto ready = checkReady(owner);
  if (!ready) {
    return ready.error();
  }
  return guarded<Debt>([&] { return debts_->edit(owner, debtId, changes); });
}

LedgerRoe<void> Ledger::deleteDebt(const OwnerId &owner, Id debtId) {
  auto ready = checkReady(owner);
  if (!ready) {
    return ready;
  }
  return debts_->remove(owner, debtId);
}

LedgerRoe<Debt> Ledger::getDebt(const OwnerId &owner, Id debtId) const {
  auto ready = checkReady(owner);
  if (!ready) {
    return ready.error();
  }
  return debts_->get(owner, debtId);
}

LedgerRoe<std::vector<Debt>> Ledger::listDebts(const OwnerId &owner, bool activeOnly) const {
  auto ready = checkReady(owner);
  if (!ready) {
    return ready.error();
  }
  return debts_->list(owner, activeOnly);
}

LedgerRoe<DebtLedger::Summary> Ledger::debtSummary(const OwnerId &owner) const {
  auto ready = checkReady(owner);
  if (!ready) {
    return ready.error();
  }
  return debts_->summarize(owner);
}

LedgerRoe<Contact> Ledger::createContact(const OwnerId &owner, const std::string &name) {
  auto ready = checkReady(owner);
  if (!ready) {
    return ready.error();
  }
  return debts_->createContact(owner, name);
}

LedgerRoe<std::vector<Contact>> Ledger::listContacts(const OwnerId &owner) const {
  auto ready = checkReady(owner);
  if (!ready) {
    return ready.error();
  }
  return debts_->listContacts(owner);
}

} // namespace ff
