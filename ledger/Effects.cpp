#include "Effects.h"

namespace ff {

std::vector<BalanceEffect> effectsOf(TxKind kind, const Money &amount,
                                     std::optional<Id> sourceAccountId,
                                     std::optional<Id> destAccountId) {
  std::vector<BalanceEffect> effects;
  if (hasSourceAccount(kind) && sourceAccountId) {
    effects.push_back({*sourceAccountId, -amount, true});
  }
  if (hasDestAccount(kind) && destAccountId) {
    effects.push_back({*destAccountId, amount, false});
  }
  return effects;
}

std::vector<BalanceEffect> inverseOf(const std::vector<BalanceEffect> &effects) {
  std::vector<BalanceEffect> inverse;
  inverse.reserve(effects.size());
  for (const auto &effect : effects) {
    inverse.push_back({effect.accountId, -effect.delta, false});
  }
  return inverse;
}

} // namespace ff
