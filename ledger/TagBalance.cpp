#include "TagBalance.h"

#include <algorithm>

namespace ff {

LedgerRoe<std::vector<TagBalance>> TagBalanceCalculator::compute(const OwnerId &owner,
                                                                 Id accountId) const {
  auto account = store_.getAccount(owner, accountId);
  if (!account) {
    return LedgerError::fromStore(account.error());
  }
  auto totals = store_.provenanceTotals(owner, accountId);
  if (!totals) {
    return LedgerError::fromStore(totals.error());
  }
  return rank(std::move(totals.value()));
}

std::vector<TagBalance> TagBalanceCalculator::rank(std::vector<TagBalance> totals) {
  totals.erase(std::remove_if(totals.begin(), totals.end(),
                              [](const TagBalance &t) { return !t.balance.isPositive(); }),
               totals.end());
  std::sort(totals.begin(), totals.end(), [](const TagBalance &a, const TagBalance &b) {
    if (a.balance != b.balance) {
      return a.balance > b.balance;
    }
    return a.sourceId < b.sourceId;
  });
  return totals;
}

} // namespace ff
