#pragma once

#include "LedgerError.h"
#include "Store.h"
#include "Types.h"

#include <vector>

namespace ff {

/**
 * Computes per-source balances of an account from its allocation rows.
 * Recomputed on every call.
 */
class TagBalanceCalculator {
public:
  explicit TagBalanceCalculator(const Store &store) : store_(store) {}

  /**
   * Positive per-source balances of one account, largest first
   * @return NotFound when the account does not exist for the owner
   */
  LedgerRoe<std::vector<TagBalance>> compute(const OwnerId &owner, Id accountId) const;

  /**
   * Drop non-positive entries and order by balance descending, then by
   * source id ascending
   */
  static std::vector<TagBalance> rank(std::vector<TagBalance> totals);

private:
  const Store &store_;
};

} // namespace ff
