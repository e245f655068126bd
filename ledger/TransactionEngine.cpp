#include "TransactionEngine.h"
#include "Effects.h"
#include "Utilities.h"
#include "Waterfall.h"

#include <map>

namespace ff {

TransactionEngine::TransactionEngine(Store &store)
    : Module("ledger.engine"), store_(store), tagBalances_(store) {}

LedgerRoe<void> TransactionEngine::validate(const OwnerId &owner,
                                            const TransactionIntent &intent) {
  if (owner.empty()) {
    return LedgerError(LedgerError::E_VALIDATION, "Owner is required");
  }
  if (!intent.amount.isPositive()) {
    return LedgerError(LedgerError::E_VALIDATION,
                       "Amount must be positive: " + intent.amount.toString());
  }

  const std::string kind = toString(intent.kind);
  if (hasSourceAccount(intent.kind) != intent.sourceAccountId.has_value()) {
    return LedgerError(LedgerError::E_VALIDATION,
                       hasSourceAccount(intent.kind)
                           ? kind + " requires a source account"
                           : kind + " must not have a source account");
  }
  if (hasDestAccount(intent.kind) != intent.destAccountId.has_value()) {
    return LedgerError(LedgerError::E_VALIDATION,
                       hasDestAccount(intent.kind)
                           ? kind + " requires a destination account"
                           : kind + " must not have a destination account");
  }
  if (intent.kind == TxKind::TRANSFER &&
      *intent.sourceAccountId == *intent.destAccountId) {
    return LedgerError(LedgerError::E_VALIDATION,
                       "Transfer source and destination must differ");
  }

  if (isCrediting(intent.kind)) {
    if (utl::trim(intent.fundingSourceName).empty()) {
      return LedgerError(LedgerError::E_VALIDATION, kind + " requires a funding source name");
    }
    if (!std::holds_alternative<AutoAllocation>(intent.allocation)) {
      return LedgerError(LedgerError::E_VALIDATION,
                         kind + " is tagged by its funding source, not by an allocation");
    }
  }
  if (std::holds_alternative<Untracked>(intent.allocation) &&
      intent.kind != TxKind::LENDING) {
    return LedgerError(LedgerError::E_VALIDATION, "Untracked allocation is only for LENDING");
  }

  if (!intent.items.empty() && intent.kind != TxKind::EXPENSE) {
    return LedgerError(LedgerError::E_VALIDATION, "Line items are only allowed on EXPENSE");
  }
  for (const auto &item : intent.items) {
    if (utl::trim(item.name).empty()) {
      return LedgerError(LedgerError::E_VALIDATION, "Line item name is required");
    }
    if (item.quantity <= 0) {
      return LedgerError(LedgerError::E_VALIDATION,
                         "Line item quantity must be positive: " + item.name);
    }
    if (item.unitPrice.isNegative()) {
      return LedgerError(LedgerError::E_VALIDATION,
                         "Line item price must not be negative: " + item.name);
    }
    Money total;
    if (!Money::checkedMul(item.unitPrice, item.quantity, total)) {
      return LedgerError(LedgerError::E_VALIDATION, "Line item total is too large: " + item.name);
    }
  }

  if (intent.debtId.has_value() != (intent.debtRole != DebtRole::NONE)) {
    return LedgerError(LedgerError::E_VALIDATION, "Debt id and debt role go together");
  }
  return {};
}

TransactionIntent TransactionEngine::intentFrom(const Transaction &tx) {
  TransactionIntent intent;
  intent.kind = tx.kind;
  intent.amount = tx.amount;
  intent.date = tx.date;
  intent.description = tx.description;
  intent.category = tx.category;
  intent.sourceAccountId = tx.sourceAccountId;
  intent.destAccountId = tx.destAccountId;
  if (isCrediting(tx.kind) && !tx.allocations.empty()) {
    intent.fundingSourceName = tx.allocations.front().sourceName;
  }
  if (tx.kind == TxKind::LENDING && tx.allocations.empty()) {
    intent.allocation = Untracked{};
  }
  intent.items = tx.items;
  intent.debtId = tx.debtId;
  intent.debtRole = tx.debtRole;
  return intent;
}

LedgerRoe<Transaction> TransactionEngine::apply(const OwnerId &owner,
                                                const TransactionIntent &intent) {
  auto valid = validate(owner, intent);
  if (!valid) {
    log().warning << "Rejected " << toString(intent.kind) << ": " << valid.error().message;
    return valid.error();
  }

  Store::UnitOfWork unit(store_);
  auto begun = unit.begin();
  if (!begun) {
    return LedgerError::fromStore(begun.error());
  }

  auto result = applyInPlace(owner, intent, std::nullopt);
  if (!result) {
    log().warning << "Rejected " << toString(intent.kind) << " " << intent.amount << ": "
                  << result.error().message;
    return result;
  }

  auto committed = unit.commit();
  if (!committed) {
    return LedgerError::fromStore(committed.error());
  }
  log().info << "Applied " << toString(result->kind) << " " << result->amount << " as tx "
             << result->id;
  return result;
}

LedgerRoe<std::vector<FundingAllocation>>
TransactionEngine::resolveAllocations(const OwnerId &owner, const TransactionIntent &intent) {
  if (isCrediting(intent.kind)) {
    auto source = store_.resolveFundingSource(owner, utl::trim(intent.fundingSourceName),
                                              intent.sourceCategory);
    if (!source) {
      return LedgerError::fromStore(source.error());
    }
    return std::vector<FundingAllocation>{{source->id, source->name, intent.amount}};
  }

  if (std::holds_alternative<Untracked>(intent.allocation)) {
    return std::vector<FundingAllocation>{};
  }

  if (auto manual = std::get_if<ManualAllocation>(&intent.allocation)) {
    auto checked = WaterfallAllocator::validateManual(manual->entries, intent.amount);
    if (!checked) {
      return checked;
    }
    for (auto &entry : checked.value()) {
      auto source = store_.getFundingSource(owner, entry.sourceId);
      if (!source) {
        return LedgerError::fromStore(source.error());
      }
      entry.sourceName = source->name;
    }
    return checked;
  }

  auto ranked = tagBalances_.compute(owner, *intent.sourceAccountId);
  if (!ranked) {
    return ranked.error();
  }
  auto plan = WaterfallAllocator::allocate(ranked.value(), intent.amount, false);
  if (!plan) {
    return plan.error();
  }
  return plan->allocations;
}

LedgerRoe<Transaction> TransactionEngine::applyInPlace(const OwnerId &owner,
                                                       const TransactionIntent &intent,
                                                       std::optional<Id> existingId) {
  std::map<Id, Account> accounts;
  for (auto id : {intent.sourceAccountId, intent.destAccountId}) {
    if (!id) {
      continue;
    }
    auto account = store_.getAccount(owner, *id);
    if (!account) {
      return LedgerError::fromStore(account.error());
    }
    accounts[*id] = account.value();
  }

  std::optional<Id> categoryId;
  std::string categoryName = utl::trim(intent.category);
  if (!categoryName.empty()) {
    auto category = store_.resolveCategory(owner, categoryName, intent.kind);
    if (!category) {
      return LedgerError::fromStore(category.error());
    }
    categoryId = category->id;
  }

  auto allocations = resolveAllocations(owner, intent);
  if (!allocations) {
    return allocations.error();
  }

  if (intent.sourceAccountId) {
    const Account &source = accounts[*intent.sourceAccountId];
    Money threshold;
    if (!Money::checkedAdd(source.floor(), intent.amount, threshold) ||
        source.balance < threshold) {
      return LedgerError::insufficientFunds("Insufficient balance in " + source.name,
                                            intent.amount, source.balance - source.floor());
    }
  }
  if (intent.destAccountId) {
    const Account &dest = accounts[*intent.destAccountId];
    Money credited;
    if (!Money::checkedAdd(dest.balance, intent.amount, credited)) {
      return LedgerError(LedgerError::E_VALIDATION,
                         "Balance of " + dest.name + " cannot hold another " +
                             intent.amount.toString());
    }
  }

  Transaction tx;
  tx.owner = owner;
  tx.kind = intent.kind;
  tx.amount = intent.amount;
  tx.date = intent.date != 0 ? intent.date : utl::getCurrentTime();
  tx.description = intent.description;
  tx.sourceAccountId = intent.sourceAccountId;
  tx.destAccountId = intent.destAccountId;
  tx.debtId = intent.debtId;
  tx.debtRole = intent.debtRole;

  if (existingId) {
    tx.id = *existingId;
    auto updated = store_.updateTransaction(tx, categoryId);
    if (!updated) {
      return LedgerError::fromStore(updated.error());
    }
  } else {
    auto inserted = store_.insertTransaction(tx, categoryId);
    if (!inserted) {
      return LedgerError::fromStore(inserted.error());
    }
    tx.id = inserted.value();
  }

  auto stored = store_.insertAllocations(tx.id, allocations.value());
  if (!stored) {
    return LedgerError::fromStore(stored.error());
  }

  for (const auto &effect : effectsOf(tx)) {
    if (effect.guarded) {
      const Account &account = accounts[effect.accountId];
      auto covered = store_.decrementBalanceIfCovered(owner, effect.accountId, -effect.delta,
                                                      account.floor());
      if (!covered) {
        return LedgerError::fromStore(covered.error());
      }
      if (!covered.value()) {
        log().warning << "Balance of account " << effect.accountId
                      << " changed during the update";
        return LedgerError(LedgerError::E_CONCURRENT_MODIFICATION,
                           "Balance of " + account.name + " changed concurrently, retry");
      }
    } else {
      auto adjusted = store_.adjustBalance(owner, effect.accountId, effect.delta);
      if (!adjusted) {
        return LedgerError::fromStore(adjusted.error());
      }
    }
  }

  if (!intent.items.empty()) {
    std::vector<Store::ItemRow> rows;
    for (const auto &item : intent.items) {
      Store::ItemRow row;
      row.item = item;
      row.item.name = utl::trim(item.name);
      row.item.category = utl::trim(item.category);
      if (!row.item.category.empty()) {
        auto category = store_.resolveCategory(owner, row.item.category, TxKind::EXPENSE);
        if (!category) {
          return LedgerError::fromStore(category.error());
        }
        row.categoryId = category->id;
      }
      rows.push_back(std::move(row));
    }
    auto items = store_.insertLineItems(tx.id, rows);
    if (!items) {
      return LedgerError::fromStore(items.error());
    }
  }

  auto reloaded = store_.getTransaction(owner, tx.id);
  if (!reloaded) {
    return LedgerError::fromStore(reloaded.error());
  }
  return reloaded.value();
}

LedgerRoe<Transaction> TransactionEngine::edit(const OwnerId &owner, Id txId,
                                               const TransactionIntent &intent) {
  if (owner.empty()) {
    return LedgerError(LedgerError::E_VALIDATION, "Owner is required");
  }

  Store::UnitOfWork unit(store_);
  auto begun = unit.begin();
  if (!begun) {
    return LedgerError::fromStore(begun.error());
  }

  auto result = editInUnit(owner, txId, intent);
  if (!result) {
    log().warning << "Edit of tx " << txId << " rejected: " << result.error().message;
    return result;
  }

  auto committed = unit.commit();
  if (!committed) {
    return LedgerError::fromStore(committed.error());
  }
  log().info << "Edited tx " << txId << ": " << toString(result->kind) << " "
             << result->amount;
  return result;
}

LedgerRoe<void> TransactionEngine::rollback(const OwnerId &owner, const Transaction &old,
                                            std::set<Id> &touched) {
  for (const auto &effect : inverseOf(effectsOf(old))) {
    auto adjusted = store_.adjustBalance(owner, effect.accountId, effect.delta);
    if (!adjusted) {
      return LedgerError::fromStore(adjusted.error());
    }
    touched.insert(effect.accountId);
  }

  auto removed = store_.deleteAllocations(old.id);
  if (!removed) {
    return LedgerError::fromStore(removed.error());
  }
  auto items = store_.deleteLineItems(old.id);
  if (!items) {
    return LedgerError::fromStore(items.error());
  }
  return {};
}

LedgerRoe<Transaction> TransactionEngine::editInUnit(const OwnerId &owner, Id txId,
                                                     const TransactionIntent &intent) {
  auto loaded = store_.getTransaction(owner, txId);
  if (!loaded) {
    return LedgerError::fromStore(loaded.error());
  }
  const Transaction &old = loaded.value();

  TransactionIntent next = intent;
  next.debtId = old.debtId;
  next.debtRole = old.debtRole;
  if (next.date == 0) {
    next.date = old.date;
  }
  if (old.debtId) {
    if (next.kind != old.kind) {
      return LedgerError(LedgerError::E_VALIDATION,
                         "Kind of a debt transaction cannot change");
    }
    if (isCrediting(next.kind) && utl::trim(next.fundingSourceName).empty() &&
        !old.allocations.empty()) {
      next.fundingSourceName = old.allocations.front().sourceName;
    }
    if (old.debtRole == DebtRole::DISBURSEMENT && old.kind == TxKind::LENDING) {
      next.allocation = Untracked{};
    }
  }

  auto valid = validate(owner, next);
  if (!valid) {
    return valid.error();
  }

  // A LENDING without rows was applied untracked; every other stored kind
  // must carry rows for its full amount
  bool tracked = !(old.kind == TxKind::LENDING && old.allocations.empty());
  if (tracked && old.allocatedTotal() != old.amount) {
    log().critical << "Transaction " << old.id << " allocations sum to "
                   << old.allocatedTotal() << " but amount is " << old.amount;
    return LedgerError(LedgerError::E_INCONSISTENT,
                       "Stored allocations of transaction " + std::to_string(old.id) +
                           " do not match its amount");
  }

  std::set<Id> touched;
  auto undone = rollback(owner, old, touched);
  if (!undone) {
    return undone.error();
  }

  if (std::holds_alternative<AutoAllocation>(next.allocation) && !isCrediting(next.kind) &&
      next.kind == old.kind && next.amount == old.amount &&
      next.sourceAccountId == old.sourceAccountId && !old.allocations.empty()) {
    next.allocation = ManualAllocation{old.allocations};
  }

  auto applied = applyInPlace(owner, next, old.id);
  if (!applied) {
    return applied;
  }

  for (Id accountId : touched) {
    auto account = store_.getAccount(owner, accountId);
    if (!account) {
      return LedgerError::fromStore(account.error());
    }
    if (account->balance < account->floor()) {
      Money deficit = account->floor() - account->balance;
      return LedgerError::insufficientFunds("Edit would leave " + account->name +
                                                " below its floor",
                                            deficit, Money());
    }
  }

  if (old.debtId) {
    auto debt = adjustLinkedDebt(owner, old, next.amount);
    if (!debt) {
      return debt.error();
    }
  }
  return applied;
}

LedgerRoe<void> TransactionEngine::adjustLinkedDebt(const OwnerId &owner,
                                                    const Transaction &old,
                                                    const Money &newAmount) {
  auto loaded = store_.getDebt(owner, *old.debtId);
  if (!loaded) {
    return LedgerError::fromStore(loaded.error());
  }
  Debt debt = loaded.value();
  Money delta = newAmount - old.amount;
  if (delta.isZero()) {
    return {};
  }

  if (old.debtRole == DebtRole::PAYMENT) {
    debt.remaining -= delta;
  } else if (old.debtRole == DebtRole::DISBURSEMENT) {
    debt.amount += delta;
    debt.remaining += delta;
  }
  if (debt.remaining.isNegative() || debt.remaining > debt.amount ||
      !debt.amount.isPositive()) {
    return LedgerError(LedgerError::E_VALIDATION,
                       "Edit would put debt " + std::to_string(debt.id) +
                           " out of range (amount " + debt.amount.toString() +
                           ", remaining " + debt.remaining.toString() + ")");
  }
  debt.paid = !debt.remaining.isPositive();

  auto updated = store_.updateDebt(debt);
  if (!updated) {
    return LedgerError::fromStore(updated.error());
  }
  log().info << "Debt " << debt.id << " remaining now " << debt.remaining;
  return {};
}

} // namespace ff
