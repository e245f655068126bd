#ifndef FF_LEDGER_LEDGER_ERROR_H
#define FF_LEDGER_LEDGER_ERROR_H

#include "Money.h"
#include "ResultOrError.hpp"
#include "Store.h"

namespace ff {

/**
 * Error returned by every engine operation. Insufficient-funds errors carry
 * the amount asked for and the amount that was actually available.
 */
struct LedgerError : RoeErrorBase {
  constexpr static int32_t E_VALIDATION = 1;
  constexpr static int32_t E_NOT_FOUND = 2;
  constexpr static int32_t E_INSUFFICIENT_FUNDS = 3;
  constexpr static int32_t E_ALLOCATION_MISMATCH = 4;
  constexpr static int32_t E_CONCURRENT_MODIFICATION = 5;
  constexpr static int32_t E_INCONSISTENT = 6;
  constexpr static int32_t E_STORE = 7;

  using RoeErrorBase::RoeErrorBase;

  Money requested;
  Money available;

  static LedgerError insufficientFunds(const std::string &msg,
                                       const Money &requested,
                                       const Money &available) {
    LedgerError e(E_INSUFFICIENT_FUNDS,
                  msg + " (requested " + requested.toString() +
                      ", available " + available.toString() + ")");
    e.requested = requested;
    e.available = available;
    return e;
  }

  /** Map a persistence failure onto the engine's error kinds */
  static LedgerError fromStore(const Store::Error &err) {
    switch (err.code) {
    case Store::E_NOT_FOUND:
      return LedgerError(E_NOT_FOUND, err.message);
    case Store::E_RANGE:
      return LedgerError(E_VALIDATION, err.message);
    case Store::E_BUSY:
      return LedgerError(E_CONCURRENT_MODIFICATION,
                         "Ledger is busy, retry: " + err.message);
    default:
      return LedgerError(E_STORE, err.message);
    }
  }
};

template <typename T> using LedgerRoe = ResultOrError<T, LedgerError>;

} // namespace ff

#endif // FF_LEDGER_LEDGER_ERROR_H
