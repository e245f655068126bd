#include "Waterfall.h"

namespace ff {

LedgerRoe<WaterfallAllocator::Result>
WaterfallAllocator::allocate(const std::vector<TagBalance> &ranked, const Money &target,
                             bool allowShortfall) {
  if (!target.isPositive()) {
    return LedgerError(LedgerError::E_VALIDATION,
                       "Allocation target must be positive: " + target.toString());
  }

  Result result;
  Money remaining = target;
  for (const auto &tag : ranked) {
    if (remaining.isZero()) {
      break;
    }
    if (!tag.balance.isPositive()) {
      continue;
    }
    Money draw = min(tag.balance, remaining);
    result.allocations.push_back({tag.sourceId, tag.name, draw});
    result.totalAllocated += draw;
    remaining -= draw;
  }

  if (remaining.isPositive()) {
    if (!allowShortfall) {
      return LedgerError::insufficientFunds("Insufficient tagged funds", target,
                                            result.totalAllocated);
    }
    result.shortfall = remaining;
  }
  return result;
}

LedgerRoe<std::vector<FundingAllocation>>
WaterfallAllocator::validateManual(const std::vector<FundingAllocation> &entries,
                                   const Money &target) {
  if (entries.empty()) {
    return LedgerError(LedgerError::E_VALIDATION, "Manual allocation is empty");
  }

  std::vector<FundingAllocation> merged;
  Money sum;
  for (const auto &entry : entries) {
    if (!entry.amount.isPositive()) {
      return LedgerError(LedgerError::E_VALIDATION,
                         "Allocation amounts must be positive: source " +
                             std::to_string(entry.sourceId));
    }
    if (!Money::checkedAdd(sum, entry.amount, sum)) {
      return LedgerError(LedgerError::E_VALIDATION,
                         "Allocations sum past the representable range");
    }
    bool found = false;
    for (auto &m : merged) {
      if (m.sourceId == entry.sourceId) {
        m.amount += entry.amount;
        found = true;
        break;
      }
    }
    if (!found) {
      merged.push_back(entry);
    }
  }

  if (sum != target) {
    LedgerError err(LedgerError::E_ALLOCATION_MISMATCH,
                    "Allocations sum to " + sum.toString() + ", expected " +
                        target.toString());
    err.requested = target;
    err.available = sum;
    return err;
  }
  return merged;
}

} // namespace ff
