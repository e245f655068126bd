#ifndef FF_LEDGER_MONEY_H
#define FF_LEDGER_MONEY_H

#include "ResultOrError.hpp"

#include <cstdint>
#include <limits>
#include <ostream>
#include <string>

namespace ff {

/**
 * Exact fixed-point amount, stored as a signed count of minor units (1/100).
 * Arithmetic throws std::overflow_error instead of wrapping.
 */
class Money {
public:
  constexpr static int64_t SCALE = 100;

  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  constexpr Money() = default;

  static constexpr Money fromMinor(int64_t minor) { return Money(minor); }
  static Money fromUnits(int64_t units);

  static constexpr Money max() { return Money(std::numeric_limits<int64_t>::max()); }
  static constexpr Money lowest() { return Money(std::numeric_limits<int64_t>::min()); }

  // Non-throwing arithmetic; false (out untouched) when the result does not fit
  static bool checkedAdd(const Money &a, const Money &b, Money &out);
  static bool checkedSub(const Money &a, const Money &b, Money &out);
  static bool checkedMul(const Money &a, int64_t factor, Money &out);

  /**
   * Parse "123", "-123", "123.4" or "123.45".
   * More than two fractional digits is an error, never rounded.
   */
  static ResultOrError<Money, Error> parse(const std::string &str);

  int64_t minor() const { return minor_; }
  bool isZero() const { return minor_ == 0; }
  bool isPositive() const { return minor_ > 0; }
  bool isNegative() const { return minor_ < 0; }

  /** Decimal rendering with two fractional digits, e.g. "-1234.50" */
  std::string toString() const;

  Money operator+(const Money &other) const;
  Money operator-(const Money &other) const;
  Money operator-() const;
  Money operator*(int64_t factor) const;
  Money &operator+=(const Money &other);
  Money &operator-=(const Money &other);

  bool operator==(const Money &other) const { return minor_ == other.minor_; }
  bool operator!=(const Money &other) const { return minor_ != other.minor_; }
  bool operator<(const Money &other) const { return minor_ < other.minor_; }
  bool operator<=(const Money &other) const { return minor_ <= other.minor_; }
  bool operator>(const Money &other) const { return minor_ > other.minor_; }
  bool operator>=(const Money &other) const { return minor_ >= other.minor_; }

private:
  explicit constexpr Money(int64_t minor) : minor_(minor) {}

  int64_t minor_{ 0 };
};

inline Money min(const Money &a, const Money &b) { return a < b ? a : b; }

std::ostream &operator<<(std::ostream &os, const Money &m);

} // namespace ff

#endif // FF_LEDGER_MONEY_H
