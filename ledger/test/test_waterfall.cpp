#include "Effects.h"
#include "TagBalance.h"
#include "Waterfall.h"
#include <gtest/gtest.h>

using namespace ff;

namespace {

TagBalance tag(Id id, const std::string &name, int64_t units) {
  TagBalance t;
  t.sourceId = id;
  t.name = name;
  t.credit = Money::fromUnits(units);
  t.balance = Money::fromUnits(units);
  return t;
}

Money units(int64_t n) { return Money::fromUnits(n); }

} // namespace

TEST(WaterfallTest, DrawsRichestFirst) {
  std::vector<TagBalance> ranked = {tag(1, "Gaji", 500000), tag(2, "Bonus", 200000)};
  auto r = WaterfallAllocator::allocate(ranked, units(600000), false);
  ASSERT_TRUE(r.isOk()) << r.error().message;
  ASSERT_EQ(r->allocations.size(), 2u);
  EXPECT_EQ(r->allocations[0].sourceId, 1u);
  EXPECT_EQ(r->allocations[0].amount, units(500000));
  EXPECT_EQ(r->allocations[1].sourceId, 2u);
  EXPECT_EQ(r->allocations[1].amount, units(100000));
  EXPECT_EQ(r->totalAllocated, units(600000));
  EXPECT_TRUE(r->shortfall.isZero());
}

TEST(WaterfallTest, StopsWhenCovered) {
  std::vector<TagBalance> ranked = {tag(1, "A", 100), tag(2, "B", 50)};
  auto r = WaterfallAllocator::allocate(ranked, units(80), false);
  ASSERT_TRUE(r.isOk());
  ASSERT_EQ(r->allocations.size(), 1u);
  EXPECT_EQ(r->allocations[0].amount, units(80));
}

TEST(WaterfallTest, InsufficientCarriesTotals) {
  std::vector<TagBalance> ranked = {tag(1, "A", 200000), tag(2, "B", 100000)};
  auto r = WaterfallAllocator::allocate(ranked, units(1000000), false);
  ASSERT_TRUE(r.isError());
  EXPECT_EQ(r.error().code, LedgerError::E_INSUFFICIENT_FUNDS);
  EXPECT_EQ(r.error().requested, units(1000000));
  EXPECT_EQ(r.error().available, units(300000));
}

TEST(WaterfallTest, ShortfallUsesEveryUnit) {
  std::vector<TagBalance> ranked = {tag(1, "A", 200), tag(2, "B", 100)};
  auto r = WaterfallAllocator::allocate(ranked, units(1000), true);
  ASSERT_TRUE(r.isOk());
  EXPECT_EQ(r->totalAllocated, units(300));
  EXPECT_EQ(r->shortfall, units(700));
  EXPECT_EQ(r->allocations.size(), 2u);
}

TEST(WaterfallTest, EmptyRankingAllowsFullShortfall) {
  auto r = WaterfallAllocator::allocate({}, units(10), true);
  ASSERT_TRUE(r.isOk());
  EXPECT_TRUE(r->allocations.empty());
  EXPECT_EQ(r->shortfall, units(10));
}

TEST(WaterfallTest, NonPositiveTargetIsValidationError) {
  auto r = WaterfallAllocator::allocate({tag(1, "A", 10)}, Money(), false);
  ASSERT_TRUE(r.isError());
  EXPECT_EQ(r.error().code, LedgerError::E_VALIDATION);
}

TEST(WaterfallTest, DeterministicAcrossCalls) {
  std::vector<TagBalance> ranked = {tag(3, "C", 70), tag(1, "A", 50), tag(2, "B", 50)};
  auto first = WaterfallAllocator::allocate(ranked, units(150), false);
  auto second = WaterfallAllocator::allocate(ranked, units(150), false);
  ASSERT_TRUE(first.isOk());
  ASSERT_TRUE(second.isOk());
  ASSERT_EQ(first->allocations.size(), second->allocations.size());
  for (size_t i = 0; i < first->allocations.size(); ++i) {
    EXPECT_EQ(first->allocations[i].sourceId, second->allocations[i].sourceId);
    EXPECT_EQ(first->allocations[i].amount, second->allocations[i].amount);
  }
}

TEST(ManualAllocationTest, MergesDuplicates) {
  std::vector<FundingAllocation> entries = {{1, "", units(30)}, {2, "", units(20)},
                                            {1, "", units(50)}};
  auto r = WaterfallAllocator::validateManual(entries, units(100));
  ASSERT_TRUE(r.isOk()) << r.error().message;
  ASSERT_EQ(r->size(), 2u);
  EXPECT_EQ((*r)[0].sourceId, 1u);
  EXPECT_EQ((*r)[0].amount, units(80));
  EXPECT_EQ((*r)[1].amount, units(20));
}

TEST(ManualAllocationTest, SumMismatch) {
  std::vector<FundingAllocation> entries = {{1, "", units(30)}, {2, "", units(20)}};
  auto r = WaterfallAllocator::validateManual(entries, units(60));
  ASSERT_TRUE(r.isError());
  EXPECT_EQ(r.error().code, LedgerError::E_ALLOCATION_MISMATCH);
  EXPECT_EQ(r.error().requested, units(60));
  EXPECT_EQ(r.error().available, units(50));
}

TEST(ManualAllocationTest, RejectsEmptyAndNonPositive) {
  auto empty = WaterfallAllocator::validateManual({}, units(10));
  ASSERT_TRUE(empty.isError());
  EXPECT_EQ(empty.error().code, LedgerError::E_VALIDATION);

  auto zero = WaterfallAllocator::validateManual({{1, "", Money()}}, Money());
  ASSERT_TRUE(zero.isError());
  EXPECT_EQ(zero.error().code, LedgerError::E_VALIDATION);
}

TEST(TagRankTest, DropsNonPositiveAndOrders) {
  std::vector<TagBalance> totals = {tag(4, "D", 100), tag(2, "B", 300), tag(1, "A", 0),
                                    tag(3, "C", 100)};
  totals.push_back(tag(5, "E", -5));
  auto ranked = TagBalanceCalculator::rank(totals);
  ASSERT_EQ(ranked.size(), 3u);
  EXPECT_EQ(ranked[0].sourceId, 2u);
  // Ties are ordered by source id
  EXPECT_EQ(ranked[1].sourceId, 3u);
  EXPECT_EQ(ranked[2].sourceId, 4u);
}

TEST(EffectsTest, EffectsAndInverseCancel) {
  auto effects = effectsOf(TxKind::TRANSFER, units(40), Id(1), Id(2));
  ASSERT_EQ(effects.size(), 2u);
  EXPECT_EQ(effects[0].accountId, 1u);
  EXPECT_EQ(effects[0].delta, -units(40));
  EXPECT_TRUE(effects[0].guarded);
  EXPECT_EQ(effects[1].accountId, 2u);
  EXPECT_EQ(effects[1].delta, units(40));
  EXPECT_FALSE(effects[1].guarded);

  auto inverse = inverseOf(effects);
  ASSERT_EQ(inverse.size(), 2u);
  for (size_t i = 0; i < effects.size(); ++i) {
    EXPECT_EQ(effects[i].accountId, inverse[i].accountId);
    EXPECT_TRUE((effects[i].delta + inverse[i].delta).isZero());
    EXPECT_FALSE(inverse[i].guarded);
  }
}

TEST(EffectsTest, KindsTouchTheirAccounts) {
  auto income = effectsOf(TxKind::INCOME, units(5), std::nullopt, Id(7));
  ASSERT_EQ(income.size(), 1u);
  EXPECT_EQ(income[0].delta, units(5));

  auto lending = effectsOf(TxKind::LENDING, units(5), Id(7), std::nullopt);
  ASSERT_EQ(lending.size(), 1u);
  EXPECT_EQ(lending[0].delta, -units(5));
  EXPECT_TRUE(lending[0].guarded);
}
