#include "Types.h"
#include "Utilities.h"

namespace ff {

std::string toString(AccountKind kind) {
  switch (kind) {
  case AccountKind::BANK:
    return "BANK";
  case AccountKind::EWALLET:
    return "EWALLET";
  case AccountKind::CASH:
    return "CASH";
  case AccountKind::INVESTMENT:
    return "INVESTMENT";
  case AccountKind::CREDIT:
    return "CREDIT";
  }
  return "UNKNOWN";
}

std::string toString(TxKind kind) {
  switch (kind) {
  case TxKind::INCOME:
    return "INCOME";
  case TxKind::EXPENSE:
    return "EXPENSE";
  case TxKind::TRANSFER:
    return "TRANSFER";
  case TxKind::LENDING:
    return "LENDING";
  case TxKind::REPAYMENT:
    return "REPAYMENT";
  }
  return "UNKNOWN";
}

std::string toString(DebtDirection direction) {
  switch (direction) {
  case DebtDirection::LENDING:
    return "LENDING";
  case DebtDirection::BORROWING:
    return "BORROWING";
  }
  return "UNKNOWN";
}

std::string toString(SourceCategory category) {
  switch (category) {
  case SourceCategory::INCOME:
    return "INCOME";
  case SourceCategory::LOAN:
    return "LOAN";
  case SourceCategory::REPAYMENT:
    return "REPAYMENT";
  case SourceCategory::OTHER:
    return "OTHER";
  }
  return "UNKNOWN";
}

std::string toString(DebtRole role) {
  switch (role) {
  case DebtRole::NONE:
    return "NONE";
  case DebtRole::DISBURSEMENT:
    return "DISBURSEMENT";
  case DebtRole::PAYMENT:
    return "PAYMENT";
  }
  return "UNKNOWN";
}

namespace {

template <typename E>
bool parseEnum(const std::string &str, std::initializer_list<E> values,
               E &out) {
  std::string lower = utl::toLower(utl::trim(str));
  for (E value : values) {
    if (utl::toLower(toString(value)) == lower) {
      out = value;
      return true;
    }
  }
  return false;
}

} // namespace

bool parseAccountKind(const std::string &str, AccountKind &kind) {
  return parseEnum(str,
                   {AccountKind::BANK, AccountKind::EWALLET, AccountKind::CASH,
                    AccountKind::INVESTMENT, AccountKind::CREDIT},
                   kind);
}

bool parseTxKind(const std::string &str, TxKind &kind) {
  return parseEnum(str,
                   {TxKind::INCOME, TxKind::EXPENSE, TxKind::TRANSFER,
                    TxKind::LENDING, TxKind::REPAYMENT},
                   kind);
}

bool parseDebtDirection(const std::string &str, DebtDirection &direction) {
  return parseEnum(str, {DebtDirection::LENDING, DebtDirection::BORROWING},
                   direction);
}

bool parseSourceCategory(const std::string &str, SourceCategory &category) {
  return parseEnum(str,
                   {SourceCategory::INCOME, SourceCategory::LOAN,
                    SourceCategory::REPAYMENT, SourceCategory::OTHER},
                   category);
}

bool parseDebtRole(const std::string &str, DebtRole &role) {
  return parseEnum(str,
                   {DebtRole::NONE, DebtRole::DISBURSEMENT, DebtRole::PAYMENT},
                   role);
}

nlohmann::json CreditTerms::toJson() const {
  nlohmann::json j;
  j["limit"] = limit.toString();
  j["statementDay"] = statementDay;
  j["dueDay"] = dueDay;
  return j;
}

Money Account::floor() const {
  if (kind == AccountKind::CREDIT && credit) {
    return -credit->limit;
  }
  return Money();
}

nlohmann::json Account::toJson() const {
  nlohmann::json j;
  j["id"] = id;
  j["name"] = name;
  j["kind"] = toString(kind);
  j["balance"] = balance.toString();
  j["createdAt"] = utl::formatDate(createdAt);
  if (credit) {
    j["credit"] = credit->toJson();
  }
  return j;
}

nlohmann::json FundingSource::toJson() const {
  nlohmann::json j;
  j["id"] = id;
  j["name"] = name;
  j["category"] = toString(category);
  return j;
}

nlohmann::json Category::toJson() const {
  nlohmann::json j;
  j["id"] = id;
  j["name"] = name;
  j["kind"] = toString(kind);
  return j;
}

nlohmann::json Contact::toJson() const {
  nlohmann::json j;
  j["id"] = id;
  j["name"] = name;
  return j;
}

nlohmann::json FundingAllocation::toJson() const {
  nlohmann::json j;
  j["sourceId"] = sourceId;
  j["source"] = sourceName;
  j["amount"] = amount.toString();
  return j;
}

Money LineItem::total() const {
  return unitPrice * quantity;
}

nlohmann::json LineItem::toJson() const {
  nlohmann::json j;
  j["name"] = name;
  j["unitPrice"] = unitPrice.toString();
  j["quantity"] = quantity;
  j["total"] = total().toString();
  if (!category.empty()) {
    j["category"] = category;
  }
  return j;
}

Money Transaction::allocatedTotal() const {
  Money sum;
  for (const auto &a : allocations) {
    sum += a.amount;
  }
  return sum;
}

nlohmann::json Transaction::toJson() const {
  nlohmann::json j;
  j["id"] = id;
  j["kind"] = toString(kind);
  j["amount"] = amount.toString();
  j["date"] = utl::formatDate(date);
  j["description"] = description;
  j["category"] = category;
  j["sourceAccountId"] = sourceAccountId ? nlohmann::json(*sourceAccountId)
                                         : nlohmann::json(nullptr);
  j["destAccountId"] = destAccountId ? nlohmann::json(*destAccountId)
                                     : nlohmann::json(nullptr);
  if (debtId) {
    j["debtId"] = *debtId;
    j["debtRole"] = toString(debtRole);
  }
  nlohmann::json allocs = nlohmann::json::array();
  for (const auto &a : allocations) {
    allocs.push_back(a.toJson());
  }
  j["allocations"] = allocs;
  if (!items.empty()) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto &item : items) {
      arr.push_back(item.toJson());
    }
    j["items"] = arr;
  }
  return j;
}

nlohmann::json Debt::toJson() const {
  nlohmann::json j;
  j["id"] = id;
  j["direction"] = toString(direction);
  j["amount"] = amount.toString();
  j["remaining"] = remaining.toString();
  j["contactId"] = contactId;
  j["contact"] = contactName;
  j["description"] = description;
  j["dueDate"] = dueDate ? nlohmann::json(utl::formatDate(*dueDate))
                         : nlohmann::json(nullptr);
  j["paid"] = paid;
  j["createdAt"] = utl::formatDate(createdAt);
  return j;
}

nlohmann::json TagBalance::toJson() const {
  nlohmann::json j;
  j["sourceId"] = sourceId;
  j["name"] = name;
  j["credit"] = credit.toString();
  j["debit"] = debit.toString();
  j["balance"] = balance.toString();
  return j;
}

} // namespace ff
