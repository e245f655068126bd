#include "Money.h"
#include <gtest/gtest.h>

#include <limits>
#include <sstream>

using ff::Money;

TEST(MoneyTest, ParsesWholeAndFractional) {
  auto a = Money::parse("123");
  ASSERT_TRUE(a.isOk());
  EXPECT_EQ(a->minor(), 12300);

  auto b = Money::parse("123.4");
  ASSERT_TRUE(b.isOk());
  EXPECT_EQ(b->minor(), 12340);

  auto c = Money::parse(" 123.45 ");
  ASSERT_TRUE(c.isOk());
  EXPECT_EQ(c->minor(), 12345);

  auto d = Money::parse("-123");
  ASSERT_TRUE(d.isOk());
  EXPECT_EQ(d->minor(), -12300);

  auto e = Money::parse("+0.05");
  ASSERT_TRUE(e.isOk());
  EXPECT_EQ(e->minor(), 5);
}

TEST(MoneyTest, RejectsTooManyDecimals) {
  auto r = Money::parse("1.005");
  ASSERT_TRUE(r.isError());
  EXPECT_EQ(r.error().code, 2);
}

TEST(MoneyTest, RejectsMalformed) {
  for (const char *s : {"", "-", "abc", "1.", ".5", "1,000", "1.2.3", "12a"}) {
    auto r = Money::parse(s);
    ASSERT_TRUE(r.isError()) << s;
    EXPECT_EQ(r.error().code, 1) << s;
  }
}

TEST(MoneyTest, RejectsOutOfRange) {
  auto r = Money::parse("99999999999999999999");
  ASSERT_TRUE(r.isError());
  EXPECT_EQ(r.error().code, 3);
}

TEST(MoneyTest, ToStringHasTwoDecimals) {
  EXPECT_EQ(Money::fromMinor(0).toString(), "0.00");
  EXPECT_EQ(Money::fromMinor(5).toString(), "0.05");
  EXPECT_EQ(Money::fromMinor(-123450).toString(), "-1234.50");
  EXPECT_EQ(Money::fromUnits(100000).toString(), "100000.00");

  std::ostringstream os;
  os << Money::fromMinor(250);
  EXPECT_EQ(os.str(), "2.50");
}

TEST(MoneyTest, Arithmetic) {
  Money a = Money::fromUnits(10);
  Money b = Money::fromMinor(250);
  EXPECT_EQ((a + b).minor(), 1250);
  EXPECT_EQ((a - b).minor(), 750);
  EXPECT_EQ((-b).minor(), -250);
  EXPECT_EQ((b * 3).minor(), 750);
  a -= b;
  EXPECT_EQ(a.minor(), 750);
  a += b;
  EXPECT_EQ(a, Money::fromUnits(10));
  EXPECT_EQ(ff::min(a, b), b);
  EXPECT_TRUE(b < a);
  EXPECT_TRUE(Money().isZero());
  EXPECT_TRUE((-a).isNegative());
}

TEST(MoneyTest, OverflowThrows) {
  Money max = Money::fromMinor(std::numeric_limits<int64_t>::max());
  EXPECT_THROW(max + Money::fromMinor(1), std::overflow_error);
  EXPECT_THROW(-max - Money::fromMinor(2), std::overflow_error);
  EXPECT_THROW(max * 2, std::overflow_error);
  EXPECT_THROW(Money::fromUnits(std::numeric_limits<int64_t>::max()), std::overflow_error);
}

TEST(MoneyTest, CheckedArithmeticReportsOverflow) {
  Money out = Money::fromMinor(7);
  EXPECT_FALSE(Money::checkedAdd(Money::max(), Money::fromMinor(1), out));
  EXPECT_FALSE(Money::checkedSub(Money::lowest(), Money::fromMinor(1), out));
  EXPECT_FALSE(Money::checkedMul(Money::max(), 2, out));
  EXPECT_EQ(out.minor(), 7);

  EXPECT_TRUE(Money::checkedAdd(-Money::max(), Money::max(), out));
  EXPECT_TRUE(out.isZero());
  EXPECT_TRUE(Money::checkedSub(Money::fromUnits(3), Money::fromUnits(5), out));
  EXPECT_EQ(out, Money::fromUnits(-2));
  EXPECT_TRUE(Money::checkedMul(Money::fromMinor(250), 3, out));
  EXPECT_EQ(out.minor(), 750);
}
