#ifndef FF_LEDGER_WATERFALL_H
#define FF_LEDGER_WATERFALL_H

#include "LedgerError.h"
#include "Types.h"

#include <vector>

namespace ff {

/**
 * Greedy allocation of an amount across ranked funding sources.
 */
class WaterfallAllocator {
public:
  struct Result {
    std::vector<FundingAllocation> allocations;
    Money totalAllocated;
    Money shortfall;
  };

  /**
   * Draw min(balance, remaining) from each source in the given order.
   * @param ranked Tag balances in draw order
   * @param target Amount to cover, must be positive
   * @param allowShortfall Return a partial plan instead of InsufficientFunds
   */
  static LedgerRoe<Result> allocate(const std::vector<TagBalance> &ranked,
                                    const Money &target, bool allowShortfall);

  /**
   * Check a caller supplied allocation list: positive entries, duplicate
   * sources merged, exact sum. Source existence is checked by the caller.
   */
  static LedgerRoe<std::vector<FundingAllocation>>
  validateManual(const std::vector<FundingAllocation> &entries, const Money &target);
};

} // namespace ff

#endif // FF_LEDGER_WATERFALL_H
