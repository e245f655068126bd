#pragma once

#include "Types.h"

#include <optional>
#include <vector>

namespace ff {

/**
 * One signed change to an account balance. Guarded effects are applied
 * with the conditional decrement so they cannot push the account below
 * its floor.
 */
struct BalanceEffect {
  Id accountId{ 0 };
  Money delta;
  bool guarded{ false };
};

// The source account loses the amount and the destination gains it
std::vector<BalanceEffect> effectsOf(TxKind kind, const Money &amount,
                                     std::optional<Id> sourceAccountId,
                                     std::optional<Id> destAccountId);

inline std::vector<BalanceEffect> effectsOf(const Transaction &tx) {
  return effectsOf(tx.kind, tx.amount, tx.sourceAccountId, tx.destAccountId);
}

/** Negated, unguarded effects; applying both leaves balances unchanged */
std::vector<BalanceEffect> inverseOf(const std::vector<BalanceEffect> &effects);

} // namespace ff
