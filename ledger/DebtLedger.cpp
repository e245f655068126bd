#include "DebtLedger.h"
#include "Utilities.h"

namespace ff {

nlohmann::json DebtLedger::Outcome::toJson() const {
  nlohmann::json j;
  j["debt"] = debt.toJson();
  j["transaction"] = transaction ? transaction->toJson() : nlohmann::json(nullptr);
  return j;
}

nlohmann::json DebtLedger::Summary::toJson() const {
  nlohmann::json j;
  j["lending"] = {{"total", totalLending.toString()}, {"count", lendingCount}};
  j["borrowing"] = {{"total", totalBorrowing.toString()}, {"count", borrowingCount}};
  return j;
}

DebtLedger::DebtLedger(Store &store, TransactionEngine &engine)
    : Module("ledger.debts"), store_(store), engine_(engine) {}

LedgerRoe<Contact> DebtLedger::resolveContact(const OwnerId &owner,
                                              std::optional<Id> contactId,
                                              const std::string &contactName) {
  if (contactId) {
    auto contact = store_.getContact(owner, *contactId);
    if (!contact) {
      return LedgerError::fromStore(contact.error());
    }
    return contact.value();
  }
  std::string name = utl::trim(contactName);
  if (name.empty()) {
    return LedgerError(LedgerError::E_VALIDATION, "Contact is required");
  }
  auto contact = store_.resolveContact(owner, name);
  if (!contact) {
    return LedgerError::fromStore(contact.error());
  }
  return contact.value();
}

LedgerRoe<DebtLedger::Outcome> DebtLedger::create(const OwnerId &owner,
                                                  const NewDebt &request) {
  if (owner.empty()) {
    return LedgerError(LedgerError::E_VALIDATION, "Owner is required");
  }
  if (!request.amount.isPositive()) {
    return LedgerError(LedgerError::E_VALIDATION,
                       "Debt amount must be positive: " + request.amount.toString());
  }

  Store::UnitOfWork unit(store_);
  auto begun = unit.begin();
  if (!begun) {
    return LedgerError::fromStore(begun.error());
  }
  auto result = createInUnit(owner, request);
  if (!result) {
    log().warning << "Debt rejected: " << result.error().message;
    return result;
  }
  auto committed = unit.commit();
  if (!committed) {
    return LedgerError::fromStore(committed.error());
  }
  log().info << "Created " << toString(result->debt.direction) << " debt " << result->debt.id
             << " of " << result->debt.amount << " with " << result->debt.contactName;
  return result;
}

LedgerRoe<DebtLedger::Outcome> DebtLedger::createInUnit(const OwnerId &owner,
                                                        const NewDebt &request) {
  auto contact = resolveContact(owner, request.contactId, request.contactName);
  if (!contact) {
    return contact.error();
  }

  Debt debt;
  debt.owner = owner;
  debt.direction = request.direction;
  debt.amount = request.amount;
  debt.remaining = request.amount;
  debt.contactId = contact->id;
  debt.contactName = contact->name;
  debt.description = request.description;
  debt.dueDate = request.dueDate;
  debt.createdAt = utl::getCurrentTime();

  auto inserted = store_.insertDebt(debt);
  if (!inserted) {
    return LedgerError::fromStore(inserted.error());
  }
  debt.id = inserted.value();

  TransactionIntent intent;
  intent.amount = request.amount;
  intent.date = request.date;
  intent.debtId = debt.id;
  intent.debtRole = DebtRole::DISBURSEMENT;
  if (request.direction == DebtDirection::LENDING) {
    intent.kind = TxKind::LENDING;
    intent.sourceAccountId = request.accountId;
    intent.allocation = Untracked{};
    intent.description = "Loan to " + contact->name;
  } else {
    intent.kind = TxKind::INCOME;
    intent.destAccountId = request.accountId;
    intent.fundingSourceName = "Loan: " + contact->name;
    intent.sourceCategory = SourceCategory::LOAN;
    intent.description = "Loan from " + contact->name;
  }
  if (!request.description.empty()) {
    intent.description = request.description;
  }

  auto tx = engine_.apply(owner, intent);
  if (!tx) {
    return tx.error();
  }

  auto stored = store_.getDebt(owner, debt.id);
  if (!stored) {
    return LedgerError::fromStore(stored.error());
  }
  return Outcome{stored.value(), tx.value()};
}

LedgerRoe<DebtLedger::Outcome> DebtLedger::recordPayment(const OwnerId &owner, Id debtId,
                                                         const Payment &payment) {
  if (owner.empty()) {
    return LedgerError(LedgerError::E_VALIDATION, "Owner is required");
  }
  if (!payment.amount.isPositive()) {
    return LedgerError(LedgerError::E_VALIDATION,
                       "Payment amount must be positive: " + payment.amount.toString());
  }

  Store::UnitOfWork unit(store_);
  auto begun = unit.begin();
  if (!begun) {
    return LedgerError::fromStore(begun.error());
  }
  auto result = payInUnit(owner, debtId, payment);
  if (!result) {
    log().warning << "Payment on debt " << debtId << " rejected: " << result.error().message;
    return result;
  }
  auto committed = unit.commit();
  if (!committed) {
    return LedgerError::fromStore(committed.error());
  }
  log().info << "Payment of " << payment.amount << " on debt " << debtId << ", remaining "
             << result->debt.remaining;
  return result;
}

LedgerRoe<DebtLedger::Outcome> DebtLedger::payInUnit(const OwnerId &owner, Id debtId,
                                                     const Payment &payment) {
  auto loaded = store_.getDebt(owner, debtId);
  if (!loaded) {
    return LedgerError::fromStore(loaded.error());
  }
  Debt debt = loaded.value();
  if (debt.paid) {
    return LedgerError(LedgerError::E_VALIDATION,
                       "Debt " + std::to_string(debtId) + " is already paid");
  }
  if (payment.amount > debt.remaining) {
    return LedgerError(LedgerError::E_VALIDATION,
                       "Payment " + payment.amount.toString() + " exceeds remaining " +
                           debt.remaining.toString());
  }

  TransactionIntent intent;
  intent.amount = payment.amount;
  intent.date = payment.date;
  intent.debtId = debt.id;
  intent.debtRole = DebtRole::PAYMENT;
  if (debt.direction == DebtDirection::LENDING) {
    intent.kind = TxKind::REPAYMENT;
    intent.destAccountId = payment.accountId;
    intent.fundingSourceName = "Repayment: " + debt.contactName;
    intent.sourceCategory = SourceCategory::REPAYMENT;
    intent.description = "Repayment from " + debt.contactName;
  } else {
    intent.kind = TxKind::LENDING;
    intent.sourceAccountId = payment.accountId;
    intent.allocation = AutoAllocation{};
    intent.description = "Payment to " + debt.contactName;
  }
  if (!payment.description.empty()) {
    intent.description = payment.description;
  }

  auto tx = engine_.apply(owner, intent);
  if (!tx) {
    return tx.error();
  }

  debt.remaining -= payment.amount;
  debt.paid = !debt.remaining.isPositive();
  auto updated = store_.updateDebt(debt);
  if (!updated) {
    return LedgerError::fromStore(updated.error());
  }
  return Outcome{debt, tx.value()};
}

LedgerRoe<DebtLedger::Outcome> DebtLedger::markPaid(const OwnerId &owner, Id debtId,
                                                    std::optional<Id> accountId,
                                                    int64_t date) {
  if (owner.empty()) {
    return LedgerError(LedgerError::E_VALIDATION, "Owner is required");
  }

  Store::UnitOfWork unit(store_);
  auto begun = unit.begin();
  if (!begun) {
    return LedgerError::fromStore(begun.error());
  }
  auto result = markPaidInUnit(owner, debtId, accountId, date);
  if (!result) {
    log().warning << "Settling debt " << debtId << " rejected: " << result.error().message;
    return result;
  }
  auto committed = unit.commit();
  if (!committed) {
    return LedgerError::fromStore(committed.error());
  }
  if (result->transaction) {
    log().info << "Debt " << debtId << " paid off with tx " << result->transaction->id;
  } else {
    log().info << "Debt " << debtId << " marked paid without a transaction";
  }
  return result;
}

LedgerRoe<DebtLedger::Outcome> DebtLedger::markPaidInUnit(const OwnerId &owner, Id debtId,
                                                          std::optional<Id> accountId,
                                                          int64_t date) {
  auto loaded = store_.getDebt(owner, debtId);
  if (!loaded) {
    return LedgerError::fromStore(loaded.error());
  }
  Debt debt = loaded.value();
  if (debt.paid) {
    return LedgerError(LedgerError::E_VALIDATION,
                       "Debt " + std::to_string(debtId) + " is already paid");
  }

  if (accountId && debt.remaining.isPositive()) {
    Payment payment;
    payment.amount = debt.remaining;
    payment.accountId = *accountId;
    payment.date = date;
    return payInUnit(owner, debtId, payment);
  }

  debt.remaining = Money();
  debt.paid = true;
  auto updated = store_.updateDebt(debt);
  if (!updated) {
    return LedgerError::fromStore(updated.error());
  }
  return Outcome{debt, std::nullopt};
}

LedgerRoe<Debt> DebtLedger::edit(const OwnerId &owner, Id debtId, const Changes &changes) {
  if (owner.empty()) {
    return LedgerError(LedgerError::E_VALIDATION, "Owner is required");
  }
  if (changes.amount && !changes.amount->isPositive()) {
    return LedgerError(LedgerError::E_VALIDATION,
                       "Debt amount must be positive: " + changes.amount->toString());
  }

  Store::UnitOfWork unit(store_);
  auto begun = unit.begin();
  if (!begun) {
    return LedgerError::fromStore(begun.error());
  }
  auto result = editInUnit(owner, debtId, changes);
  if (!result) {
    log().warning << "Edit of debt " << debtId << " rejected: " << result.error().message;
    return result;
  }
  auto committed = unit.commit();
  if (!committed) {
    return LedgerError::fromStore(committed.error());
  }
  log().info << "Edited debt " << debtId;
  return result;
}

LedgerRoe<Debt> DebtLedger::editInUnit(const OwnerId &owner, Id debtId,
                                       const Changes &changes) {
  auto loaded = store_.getDebt(owner, debtId);
  if (!loaded) {
    return LedgerError::fromStore(loaded.error());
  }

  if (changes.amount && *changes.amount != loaded->amount) {
    auto disbursement = store_.findDebtTransaction(owner, debtId, DebtRole::DISBURSEMENT);
    if (disbursement) {
      // The engine moves amount and remaining of the debt by the same delta
      TransactionIntent intent = TransactionEngine::intentFrom(disbursement.value());
      intent.amount = *changes.amount;
      auto edited = engine_.edit(owner, disbursement->id, intent);
      if (!edited) {
        return edited.error();
      }
    } else if (disbursement.error().code == Store::E_NOT_FOUND) {
      Debt debt = loaded.value();
      Money delta = *changes.amount - debt.amount;
      debt.amount = *changes.amount;
      debt.remaining += delta;
      if (debt.remaining.isNegative()) {
        return LedgerError(LedgerError::E_VALIDATION,
                           "New amount is below what was already paid");
      }
      debt.paid = !debt.remaining.isPositive();
      auto updated = store_.updateDebt(debt);
      if (!updated) {
        return LedgerError::fromStore(updated.error());
      }
    } else {
      return LedgerError::fromStore(disbursement.error());
    }
  }

  auto current = store_.getDebt(owner, debtId);
  if (!current) {
    return LedgerError::fromStore(current.error());
  }
  Debt debt = current.value();

  if (changes.contactId || !utl::trim(changes.contactName).empty()) {
    auto contact = resolveContact(owner, changes.contactId, changes.contactName);
    if (!contact) {
      return contact.error();
    }
    debt.contactId = contact->id;
    debt.contactName = contact->name;
  }
  if (changes.description) {
    debt.description = *changes.description;
  }
  if (changes.clearDueDate) {
    debt.dueDate.reset();
  } else if (changes.dueDate) {
    debt.dueDate = changes.dueDate;
  }

  auto updated = store_.updateDebt(debt);
  if (!updated) {
    return LedgerError::fromStore(updated.error());
  }
  return debt;
}

LedgerRoe<void> DebtLedger::remove(const OwnerId &owner, Id debtId) {
  if (owner.empty()) {
    return LedgerError(LedgerError::E_VALIDATION, "Owner is required");
  }
  Store::UnitOfWork unit(store_);
  auto begun = unit.begin();
  if (!begun) {
    return LedgerError::fromStore(begun.error());
  }
  auto removed = store_.deleteDebt(owner, debtId);
  if (!removed) {
    return LedgerError::fromStore(removed.error());
  }
  auto committed = unit.commit();
  if (!committed) {
    return LedgerError::fromStore(committed.error());
  }
  log().info << "Deleted debt " << debtId;
  return {};
}

LedgerRoe<Debt> DebtLedger::get(const OwnerId &owner, Id debtId) const {
  auto debt = store_.getDebt(owner, debtId);
  if (!debt) {
    return LedgerError::fromStore(debt.error());
  }
  return debt.value();
}

LedgerRoe<std::vector<Debt>> DebtLedger::list(const OwnerId &owner, bool activeOnly) const {
  auto debts = store_.listDebts(owner, activeOnly);
  if (!debts) {
    return LedgerError::fromStore(debts.error());
  }
  return debts.value();
}

LedgerRoe<DebtLedger::Summary> DebtLedger::summarize(const OwnerId &owner) const {
  auto debts = store_.listDebts(owner, true);
  if (!debts) {
    return LedgerError::fromStore(debts.error());
  }
  Summary summary;
  for (const auto &debt : debts.value()) {
    bool lending = debt.direction == DebtDirection::LENDING;
    Money &total = lending ? summary.totalLending : summary.totalBorrowing;
    if (!Money::checkedAdd(total, debt.remaining, total)) {
      return LedgerError(LedgerError::E_VALIDATION,
                         "Outstanding " + toString(debt.direction) +
                             " exceeds the representable range");
    }
    if (lending) {
      ++summary.lendingCount;
    } else {
      ++summary.borrowingCount;
    }
  }
  return summary;
}

LedgerRoe<Contact> DebtLedger::createContact(const OwnerId &owner, const std::string &name) {
  if (owner.empty()) {
    return LedgerError(LedgerError::E_VALIDATION, "Owner is required");
  }
  std::string trimmed = utl::trim(name);
  if (trimmed.empty()) {
    return LedgerError(LedgerError::E_VALIDATION, "Contact name is required");
  }
  auto contact = store_.insertContact(owner, trimmed);
  if (!contact) {
    if (contact.error().code == Store::E_CONSTRAINT) {
      return LedgerError(LedgerError::E_VALIDATION, "Contact already exists: " + trimmed);
    }
    return LedgerError::fromStore(contact.error());
  }
  log().info << "Created contact " << contact->name;
  return contact.value();
}

LedgerRoe<std::vector<Contact>> DebtLedger::listContacts(const OwnerId &owner) const {
  auto contacts = store_.listContacts(owner);
  if (!contacts) {
    return LedgerError::fromStore(contacts.error());
  }
  return contacts.value();
}

} // namespace ff
