#include <gtest/gtest.h>
#include <cw/metrics/derived.hpp>
#include "test_util.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

using namespace cw::metrics;
using cw::market::OptionSide;
using cw::test::make_derived;
using cw::test::make_quote;

namespace {
const cw::core::Date kDay{2025, 3, 10};
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
}

TEST(IntrinsicValueTest, CallAndPutFormulas) {
  for (double K : {4900.0, 4995.0, 5000.0, 5005.0, 5100.0}) {
    const double S = 5000.0;
    EXPECT_DOUBLE_EQ(intrinsic_value(OptionSide::Call, K, S), std::max(S - K, 0.0)) << "K=" << K;
    EXPECT_DOUBLE_EQ(intrinsic_value(OptionSide::Put,  K, S), std::max(K - S, 0.0)) << "K=" << K;
  }
}

TEST(IntrinsicValueTest, AtTheMoneyIsZeroBothSides) {
  EXPECT_DOUBLE_EQ(intrinsic_value(OptionSide::Call, 5000.0, 5000.0), 0.0);
  EXPECT_DOUBLE_EQ(intrinsic_value(OptionSide::Put,  5000.0, 5000.0), 0.0);
  EXPECT_FALSE(is_itm(OptionSide::Call, 5000.0, 5000.0));
  EXPECT_FALSE(is_itm(OptionSide::Put,  5000.0, 5000.0));
}

TEST(IntrinsicValueTest, NaNPropagates) {
  EXPECT_TRUE(std::isnan(intrinsic_value(OptionSide::Call, 5000.0, kNaN)));
  EXPECT_TRUE(std::isnan(intrinsic_value(OptionSide::Unknown, 5000.0, 5000.0)));
}

TEST(MoneynessTest, SignAndCategories) {
  EXPECT_NEAR(moneyness(5000.0, 5005.0), -5.0 / 5005.0, 1e-15);
  EXPECT_EQ(classify_moneyness(0.0), MoneynessCategory::ATM);
  EXPECT_EQ(classify_moneyness(0.0049), MoneynessCategory::ATM);
  EXPECT_EQ(classify_moneyness(-0.0049), MoneynessCategory::ATM);
  EXPECT_EQ(classify_moneyness(0.005), MoneynessCategory::OTM_CALL_ITM_PUT);
  EXPECT_EQ(classify_moneyness(0.02), MoneynessCategory::OTM_CALL_ITM_PUT);
  EXPECT_EQ(classify_moneyness(-0.005), MoneynessCategory::ITM_CALL_OTM_PUT);
  EXPECT_STREQ(to_string(MoneynessCategory::OTM_CALL_ITM_PUT), "OTM_Call/ITM_Put");
}

TEST(LiquidityCostTest, EffectiveCostDominatesSpreadCostWhenDiscounted) {
  // call ITM vendu sous son intrinsèque : 105 d'intrinsèque, last 100
  auto d = make_derived(OptionSide::Call, kDay, 4900.0, 5005.0, 100.0, 99.0, 101.0);
  EXPECT_TRUE(d.is_itm);
  EXPECT_DOUBLE_EQ(d.intrinsic_value, 105.0);
  EXPECT_DOUBLE_EQ(d.time_value, -5.0);      // négative, conservée
  EXPECT_DOUBLE_EQ(d.itm_discount, 5.0);
  EXPECT_DOUBLE_EQ(d.spread_cost, 1.0);
  EXPECT_DOUBLE_EQ(d.effective_liquidity_cost, 6.0);
  EXPECT_GE(d.effective_liquidity_cost, d.spread_cost);
  EXPECT_DOUBLE_EQ(d.mm_profit_per_contract, 600.0);
}

TEST(LiquidityCostTest, EqualsSpreadCostWithoutDiscount) {
  // ITM, last au-dessus de l'intrinsèque -> discount 0
  auto itm = make_derived(OptionSide::Put, kDay, 5100.0, 5005.0, 97.0, 96.0, 98.0);
  EXPECT_TRUE(itm.is_itm);
  EXPECT_DOUBLE_EQ(itm.itm_discount, 0.0);
  EXPECT_DOUBLE_EQ(itm.effective_liquidity_cost, itm.spread_cost);

  auto otm = make_derived(OptionSide::Call, kDay, 5100.0, 5005.0, 1.0, 0.9, 1.1);
  EXPECT_FALSE(otm.is_itm);
  EXPECT_DOUBLE_EQ(otm.itm_discount, 0.0);
  EXPECT_DOUBLE_EQ(otm.effective_liquidity_cost, otm.spread_cost);
}

TEST(DeriveQuoteTest, SpreadMidAndLastVsMid) {
  auto d = make_derived(OptionSide::Call, kDay, 5000.0, 5005.0, 12.0, 12.0, 13.0);
  EXPECT_DOUBLE_EQ(d.bid_ask_spread, 1.0);
  EXPECT_DOUBLE_EQ(d.mid_price, 12.5);
  EXPECT_DOUBLE_EQ(d.spread_cost, 0.5);
  EXPECT_NEAR(d.last_vs_mid, 0.5 / 12.5, 1e-15);
  EXPECT_EQ(d.moneyness_category, MoneynessCategory::ATM);

  auto zero_mid = make_derived(OptionSide::Call, kDay, 5100.0, 5005.0, 0.05, 0.0, 0.0);
  EXPECT_DOUBLE_EQ(zero_mid.last_vs_mid, 0.0);
}

TEST(DeriveQuoteTest, MissingBidAskGivesNaNCost) {
  auto d = make_derived(OptionSide::Call, kDay, 5100.0, 5005.0, 1.0, kNaN, 1.1);
  EXPECT_TRUE(std::isnan(d.bid_ask_spread));
  EXPECT_TRUE(std::isnan(d.effective_liquidity_cost));
  EXPECT_DOUBLE_EQ(d.intrinsic_value, 0.0);
}

TEST(DeriveQuoteTest, UnknownSideThrows) {
  auto q = make_quote(OptionSide::Unknown, kDay, 5000.0, 5005.0, 1.0, 0.9, 1.1);
  EXPECT_THROW(derive_quote(q), std::invalid_argument);
}

TEST(DeriveAllTest, SkipsUnknownSide) {
  std::vector<cw::market::OptionQuote> quotes;
  quotes.push_back(make_quote(OptionSide::Call, kDay, 5000.0, 5005.0, 12.5, 12.0, 13.0));
  auto u = make_quote(OptionSide::Unknown, kDay, 5000.0, 5005.0, 1.0, 0.9, 1.1);
  u.source_id = "spx_20250310.csv";
  quotes.push_back(u);
  quotes.push_back(u);
  quotes.push_back(make_quote(OptionSide::Put, kDay, 5000.0, 5005.0, 8.0, 7.5, 8.5));

  auto derived = derive_all(quotes);
  ASSERT_EQ(derived.size(), 2u);
  EXPECT_EQ(derived[0].quote.side, OptionSide::Call);
  EXPECT_EQ(derived[1].quote.side, OptionSide::Put);
}
