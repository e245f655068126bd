#include "Money.h"
#include "Utilities.h"

#include <limits>
#include <stdexcept>

namespace ff {

Money Money::fromUnits(int64_t units) {
  int64_t minor = 0;
  if (__builtin_mul_overflow(units, SCALE, &minor)) {
    throw std::overflow_error("Money overflow");
  }
  return Money(minor);
}

ResultOrError<Money, Money::Error> Money::parse(const std::string &input) {
  std::string str = utl::trim(input);
  if (str.empty()) {
    return Error(1, "Empty amount");
  }

  bool negative = false;
  size_t pos = 0;
  if (str[0] == '-' || str[0] == '+') {
    negative = str[0] == '-';
    pos = 1;
  }

  std::string whole = str.substr(pos);
  std::string frac;
  auto dot = whole.find('.');
  if (dot != std::string::npos) {
    frac = whole.substr(dot + 1);
    whole = whole.substr(0, dot);
    if (frac.empty()) {
      return Error(1, "Invalid amount: " + input);
    }
  }
  if (whole.empty()) {
    return Error(1, "Invalid amount: " + input);
  }
  for (char c : whole + frac) {
    if (c < '0' || c > '9') {
      return Error(1, "Invalid amount: " + input);
    }
  }
  if (frac.size() > 2) {
    return Error(2, "Too many decimal places: " + input);
  }

  uint64_t units = 0;
  if (!utl::parseUInt64(whole, units) ||
      units > static_cast<uint64_t>(std::numeric_limits<int64_t>::max() / SCALE)) {
    return Error(3, "Amount out of range: " + input);
  }
  while (frac.size() < 2) {
    frac += '0';
  }
  int64_t cents = (frac[0] - '0') * 10 + (frac[1] - '0');
  int64_t minor = static_cast<int64_t>(units) * SCALE + cents;
  return Money(negative ? -minor : minor);
}

std::string Money::toString() const {
  // Work in unsigned space so INT64_MIN renders
  uint64_t abs = minor_ < 0 ? 0 - static_cast<uint64_t>(minor_)
                            : static_cast<uint64_t>(minor_);
  uint64_t units = abs / SCALE;
  uint64_t cents = abs % SCALE;
  std::string out = minor_ < 0 ? "-" : "";
  out += std::to_string(units);
  out += '.';
  if (cents < 10) {
    out += '0';
  }
  out += std::to_string(cents);
  return out;
}

bool Money::checkedAdd(const Money &a, const Money &b, Money &out) {
  int64_t result = 0;
  if (__builtin_add_overflow(a.minor_, b.minor_, &result)) {
    return false;
  }
  out = Money(result);
  return true;
}

bool Money::checkedSub(const Money &a, const Money &b, Money &out) {
  int64_t result = 0;
  if (__builtin_sub_overflow(a.minor_, b.minor_, &result)) {
    return false;
  }
  out = Money(result);
  return true;
}

bool Money::checkedMul(const Money &a, int64_t factor, Money &out) {
  int64_t result = 0;
  if (__builtin_mul_overflow(a.minor_, factor, &result)) {
    return false;
  }
  out = Money(result);
  return true;
}

Money Money::operator+(const Money &other) const {
  Money result;
  if (!checkedAdd(*this, other, result)) {
    throw std::overflow_error("Money overflow");
  }
  return result;
}

Money Money::operator-(const Money &other) const {
  Money result;
  if (!checkedSub(*this, other, result)) {
    throw std::overflow_error("Money overflow");
  }
  return result;
}

Money Money::operator-() const {
  if (minor_ == std::numeric_limits<int64_t>::min()) {
    throw std::overflow_error("Money overflow");
  }
  return Money(-minor_);
}

Money Money::operator*(int64_t factor) const {
  Money result;
  if (!checkedMul(*this, factor, result)) {
    throw std::overflow_error("Money overflow");
  }
  return result;
}

Money &Money::operator+=(const Money &other) {
  *this = *this + other;
  return *this;
}

Money &Money::operator-=(const Money &other) {
  *this = *this - other;
  return *this;
}

std::ostream &operator<<(std::ostream &os, const Money &m) {
  return os << m.toString();
}

} // namespace ff
