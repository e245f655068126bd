#include "Commands.h"

namespace ff {
namespace cli {

static Error toError(const LedgerError &err) { return Error(err.code, err.message); }

template <typename T> static nlohmann::json toJsonArray(const std::vector<T> &items) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto &item : items) {
    arr.push_back(item.toJson());
  }
  return arr;
}

Roe<Money> parseAmount(const std::string &str) {
  auto money = Money::parse(str);
  if (!money) {
    return Error(money.error().code, money.error().message);
  }
  return money.value();
}

Roe<int64_t> parseDateOption(const std::string &str) {
  if (str.empty()) {
    return static_cast<int64_t>(0);
  }
  return utl::parseDate(str);
}

Roe<FundingAllocation> parseAllocation(const std::string &str) {
  auto parts = utl::split(str, ':');
  if (parts.size() != 2) {
    return Error(1, "Allocation must be <sourceId>:<amount>: " + str);
  }
  FundingAllocation allocation;
  if (!utl::parseUInt64(utl::trim(parts[0]), allocation.sourceId)) {
    return Error(1, "Invalid source id in allocation: " + str);
  }
  auto amount = parseAmount(parts[1]);
  if (!amount) {
    return amount.error();
  }
  allocation.amount = amount.value();
  return allocation;
}

Roe<LineItem> parseLineItem(const std::string &str) {
  auto parts = utl::split(str, ':');
  if (parts.size() < 3 || parts.size() > 4) {
    return Error(1, "Item must be <name>:<unitPrice>:<qty>[:<category>]: " + str);
  }
  LineItem item;
  item.name = utl::trim(parts[0]);
  auto price = parseAmount(parts[1]);
  if (!price) {
    return price.error();
  }
  item.unitPrice = price.value();
  if (!utl::parseInt64(utl::trim(parts[2]), item.quantity)) {
    return Error(1, "Invalid quantity in item: " + str);
  }
  if (parts.size() == 4) {
    item.category = utl::trim(parts[3]);
  }
  return item;
}

// ---------------------------------------------------------------- accounts

Roe<nlohmann::json> Commands::accountCreate(const AccountArgs &args) {
  Ledger::NewAccount request;
  request.name = args.name;
  if (!parseAccountKind(args.kind, request.kind)) {
    return Error(1, "Unknown account kind: " + args.kind);
  }
  auto opening = parseAmount(args.opening);
  if (!opening) {
    return opening.error();
  }
  request.openingBalance = opening.value();
  if (!args.creditLimit.empty()) {
    auto limit = parseAmount(args.creditLimit);
    if (!limit) {
      return limit.error();
    }
    CreditTerms terms;
    terms.limit = limit.value();
    terms.statementDay = args.statementDay;
    terms.dueDay = args.dueDay;
    request.credit = terms;
  }

  auto account = ledger_.createAccount(owner_, request);
  if (!account) {
    return toError(account.error());
  }
  return account->toJson();
}

Roe<nlohmann::json> Commands::accountList() {
  auto accounts = ledger_.listAccounts(owner_);
  if (!accounts) {
    return toError(accounts.error());
  }
  return toJsonArray(accounts.value());
}

Roe<nlohmann::json> Commands::accountShow(Id accountId) {
  auto detail = ledger_.getAccountDetail(owner_, accountId);
  if (!detail) {
    return toError(detail.error());
  }
  return detail->toJson();
}

Roe<nlohmann::json> Commands::tags(Id accountId) {
  auto balances = ledger_.getTagBalances(owner_, accountId);
  if (!balances) {
    return toError(balances.error());
  }
  return toJsonArray(balances.value());
}

// ---------------------------------------------------------------- transactions

Roe<void> Commands::applyTxArgs(const TxArgs &args, TransactionIntent &intent) const {
  if (!args.kind.empty() && !parseTxKind(args.kind, intent.kind)) {
    return Error(1, "Unknown transaction kind: " + args.kind);
  }
  if (!args.amount.empty()) {
    auto amount = parseAmount(args.amount);
    if (!amount) {
      return amount.error();
    }
    intent.amount = amount.value();
  }
  auto date = parseDateOption(args.date);
  if (!date) {
    return date.error();
  }
  if (date.value() != 0) {
    intent.date = date.value();
  }
  if (!args.description.empty()) {
    intent.description = args.description;
  }
  if (!args.category.empty()) {
    intent.category = args.category;
  }
  if (args.from != 0) {
    intent.sourceAccountId = args.from;
  }
  if (args.to != 0) {
    intent.destAccountId = args.to;
  }
  if (!args.source.empty()) {
    intent.fundingSourceName = args.source;
  }
  if (!parseSourceCategory(args.sourceCategory, intent.sourceCategory)) {
    return Error(1, "Unknown source category: " + args.sourceCategory);
  }

  if (!args.allocations.empty()) {
    ManualAllocation manual;
    for (const auto &entry : args.allocations) {
      auto allocation = parseAllocation(entry);
      if (!allocation) {
        return allocation.error();
      }
      manual.entries.push_back(allocation.value());
    }
    intent.allocation = manual;
  } else if (args.untracked) {
    intent.allocation = Untracked{};
  } else if (std::holds_alternative<Untracked>(intent.allocation) &&
             intent.kind != TxKind::LENDING) {
    intent.allocation = AutoAllocation{};
  }

  if (!args.items.empty()) {
    intent.items.clear();
    for (const auto &entry : args.items) {
      auto item = parseLineItem(entry);
      if (!item) {
        return item.error();
      }
      intent.items.push_back(item.value());
    }
  } else if (intent.kind != TxKind::EXPENSE) {
    intent.items.clear();
  }

  // Fields the kind does not use are dropped so a kind change needs no
  // explicit clearing
  if (!hasSourceAccount(intent.kind)) {
    intent.sourceAccountId.reset();
  }
  if (!hasDestAccount(intent.kind)) {
    intent.destAccountId.reset();
  }
  if (!isCrediting(intent.kind)) {
    intent.fundingSourceName.clear();
  }
  return {};
}

Roe<nlohmann::json> Commands::txAdd(const TxArgs &args) {
  if (args.kind.empty() || args.amount.empty()) {
    return Error(1, "Transaction kind and amount are required");
  }
  TransactionIntent intent;
  auto applied = applyTxArgs(args, intent);
  if (!applied) {
    return applied.error();
  }
  auto tx = ledger_.createTransaction(owner_, intent);
  if (!tx) {
    return toError(tx.error());
  }
  return tx->toJson();
}

Roe<nlohmann::json> Commands::txEdit(Id txId, const TxArgs &args) {
  auto stored = ledger_.getTransaction(owner_, txId);
  if (!stored) {
    return toError(stored.error());
  }
  TransactionIntent intent = TransactionEngine::intentFrom(stored.value());
  auto applied = applyTxArgs(args, intent);
  if (!applied) {
    return applied.error();
  }
  auto tx = ledger_.editTransaction(owner_, txId, intent);
  if (!tx) {
    return toError(tx.error());
  }
  return tx->toJson();
}

Roe<nlohmann::json> Commands::txShow(Id txId) {
  auto tx = ledger_.getTransaction(owner_, txId);
  if (!tx) {
    return toError(tx.error());
  }
  return tx->toJson();
}

Roe<nlohmann::json> Commands::txHistory(Id accountId, size_t limit) {
  std::optional<Id> account;
  if (accountId != 0) {
    account = accountId;
  }
  auto txes = ledger_.getTransactionHistory(owner_, account, limit);
  if (!txes) {
    return toError(txes.error());
  }
  return toJsonArray(txes.value());
}

Roe<nlohmann::json> Commands::sourceList() {
  auto sources = ledger_.listFundingSources(owner_);
  if (!sources) {
    return toError(sources.error());
  }
  return toJsonArray(sources.value());
}

// ---------------------------------------------------------------- debts

Roe<nlohmann::json> Commands::debtCreate(const DebtArgs &args) {
  DebtLedger::NewDebt request;
  if (!parseDebtDirection(args.direction, request.direction)) {
    return Error(1, "Debt direction must be LENDING or BORROWING: " + args.direction);
  }
  auto amount = parseAmount(args.amount);
  if (!amount) {
    return amount.error();
  }
  request.amount = amount.value();
  request.accountId = args.account;
  if (args.contactId != 0) {
    request.contactId = args.contactId;
  }
  request.contactName = args.contact;
  request.description = args.description;
  auto due = parseDateOption(args.dueDate);
  if (!due) {
    return due.error();
  }
  if (due.value() != 0) {
    request.dueDate = due.value();
  }
  auto date = parseDateOption(args.date);
  if (!date) {
    return date.error();
  }
  request.date = date.value();

  auto outcome = ledger_.createDebt(owner_, request);
  if (!outcome) {
    return toError(outcome.error());
  }
  return outcome->toJson();
}

Roe<nlohmann::json> Commands::debtPay(Id debtId, const PaymentArgs &args) {
  DebtLedger::Payment payment;
  auto amount = parseAmount(args.amount);
  if (!amount) {
    return amount.error();
  }
  payment.amount = amount.value();
  payment.accountId = args.account;
  auto date = parseDateOption(args.date);
  if (!date) {
    return date.error();
  }
  payment.date = date.value();
  payment.description = args.description;

  auto outcome = ledger_.recordDebtPayment(owner_, debtId, payment);
  if (!outcome) {
    return toError(outcome.error());
  }
  return outcome->toJson();
}

Roe<nlohmann::json> Commands::debtMarkPaid(Id debtId, Id accountId) {
  std::optional<Id> account;
  if (accountId != 0) {
    account = accountId;
  }
  auto outcome = ledger_.markDebtPaid(owner_, debtId, account);
  if (!outcome) {
    return toError(outcome.error());
  }
  return outcome->toJson();
}

Roe<nlohmann::json> Commands::debtEdit(Id debtId, const DebtEditArgs &args) {
  DebtLedger::Changes changes;
  if (!args.amount.empty()) {
    auto amount = parseAmount(args.amount);
    if (!amount) {
      return amount.error();
    }
    changes.amount = amount.value();
  }
  if (args.descriptionGiven) {
    changes.description = args.description;
  }
  changes.clearDueDate = args.clearDueDate;
  auto due = parseDateOption(args.dueDate);
  if (!due) {
    return due.error();
  }
  if (due.value() != 0) {
    changes.dueDate = due.value();
  }
  if (args.contactId != 0) {
    changes.contactId = args.contactId;
  }
  changes.contactName = args.contact;

  auto debt = ledger_.editDebt(owner_, debtId, changes);
  if (!debt) {
    return toError(debt.error());
  }
  return debt->toJson();
}

Roe<nlohmann::json> Commands::debtDelete(Id debtId) {
  auto removed = ledger_.deleteDebt(owner_, debtId);
  if (!removed) {
    return toError(removed.error());
  }
  nlohmann::json j;
  j["deleted"] = debtId;
  return j;
}

Roe<nlohmann::json> Commands::debtList(bool includePaid) {
  auto debts = ledger_.listDebts(owner_, !includePaid);
  if (!debts) {
    return toError(debts.error());
  }
  return toJsonArray(debts.value());
}

Roe<nlohmann::json> Commands::debtShow(Id debtId) {
  auto debt = ledger_.getDebt(owner_, debtId);
  if (!debt) {
    return toError(debt.error());
  }
  return debt->toJson();
}

Roe<nlohmann::json> Commands::debtSummary() {
  auto summary = ledger_.debtSummary(owner_);
  if (!summary) {
    return toError(summary.error());
  }
  return summary->toJson();
}

// ---------------------------------------------------------------- contacts

Roe<nlohmann::json> Commands::contactAdd(const std::string &name) {
  auto contact = ledger_.createContact(owner_, name);
  if (!contact) {
    return toError(contact.error());
  }
  return contact->toJson();
}

Roe<nlohmann::json> Commands::contactList() {
  auto contacts = ledger_.listContacts(owner_);
  if (!contacts) {
    return toError(contacts.error());
  }
  return toJsonArray(contacts.value());
}

} // namespace cli
} // namespace ff
