#pragma once

#include "Money.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace ff {

using OwnerId = std::string;
using Id = uint64_t;

enum class AccountKind { BANK, EWALLET, CASH, INVESTMENT, CREDIT };
enum class TxKind { INCOME, EXPENSE, TRANSFER, LENDING, REPAYMENT };
enum class DebtDirection { LENDING, BORROWING };
enum class SourceCategory { INCOME, LOAN, REPAYMENT, OTHER };
enum class DebtRole { NONE, DISBURSEMENT, PAYMENT };

std::string toString(AccountKind kind);
std::string toString(TxKind kind);
std::string toString(DebtDirection direction);
std::string toString(SourceCategory category);
std::string toString(DebtRole role);

// Case-insensitive; return false on an unknown name
bool parseAccountKind(const std::string &str, AccountKind &kind);
bool parseTxKind(const std::string &str, TxKind &kind);
bool parseDebtDirection(const std::string &str, DebtDirection &direction);
bool parseSourceCategory(const std::string &str, SourceCategory &category);
bool parseDebtRole(const std::string &str, DebtRole &role);

/** INCOME and REPAYMENT move money into an account from outside */
inline bool isCrediting(TxKind kind) {
  return kind == TxKind::INCOME || kind == TxKind::REPAYMENT;
}

/** Kinds that need a source account */
inline bool hasSourceAccount(TxKind kind) {
  return kind == TxKind::EXPENSE || kind == TxKind::LENDING ||
         kind == TxKind::TRANSFER;
}

/** Kinds that need a destination account */
inline bool hasDestAccount(TxKind kind) {
  return kind == TxKind::INCOME || kind == TxKind::REPAYMENT ||
         kind == TxKind::TRANSFER;
}

struct CreditTerms {
  Money limit;
  int statementDay{ 1 };
  int dueDay{ 1 };

  nlohmann::json toJson() const;
};

struct Account {
  Id id{ 0 };
  OwnerId owner;
  std::string name;
  AccountKind kind{ AccountKind::BANK };
  Money balance;
  int64_t createdAt{ 0 };
  std::optional<CreditTerms> credit;

  /** Lowest balance a decrement may leave behind */
  Money floor() const;

  nlohmann::json toJson() const;
};

struct FundingSource {
  Id id{ 0 };
  OwnerId owner;
  std::string name;
  SourceCategory category{ SourceCategory::OTHER };

  nlohmann::json toJson() const;
};

struct Category {
  Id id{ 0 };
  OwnerId owner;
  std::string name;
  TxKind kind{ TxKind::EXPENSE };

  nlohmann::json toJson() const;
};

struct Contact {
  Id id{ 0 };
  OwnerId owner;
  std::string name;

  nlohmann::json toJson() const;
};

struct FundingAllocation {
  Id sourceId{ 0 };
  std::string sourceName;
  Money amount;

  nlohmann::json toJson() const;
};

struct LineItem {
  std::string name;
  Money unitPrice;
  int64_t quantity{ 1 };
  std::string category;

  Money total() const;
  nlohmann::json toJson() const;
};

struct Transaction {
  Id id{ 0 };
  OwnerId owner;
  TxKind kind{ TxKind::EXPENSE };
  Money amount;
  int64_t date{ 0 };
  std::string description;
  std::string category;
  std::optional<Id> sourceAccountId;
  std::optional<Id> destAccountId;
  std::optional<Id> debtId;
  DebtRole debtRole{ DebtRole::NONE };
  std::vector<FundingAllocation> allocations;
  std::vector<LineItem> items;

  Money allocatedTotal() const;
  nlohmann::json toJson() const;
};

struct Debt {
  Id id{ 0 };
  OwnerId owner;
  DebtDirection direction{ DebtDirection::LENDING };
  Money amount;
  Money remaining;
  Id contactId{ 0 };
  std::string contactName;
  std::string description;
  std::optional<int64_t> dueDate;
  bool paid{ false };
  int64_t createdAt{ 0 };

  nlohmann::json toJson() const;
};

/** Per-source balance of one account */
struct TagBalance {
  Id sourceId{ 0 };
  std::string name;
  Money credit;
  Money debit;
  Money balance;

  nlohmann::json toJson() const;
};

} // namespace ff
