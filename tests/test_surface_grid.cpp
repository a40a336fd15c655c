#include <gtest/gtest.h>
#include <cw/surface/grid.hpp>
#include <cw/surface/presets.hpp>
#include "test_util.hpp"

#include <cmath>
#include <stdexcept>

using namespace cw::surface;
using cw::market::OptionSide;
using cw::metrics::DerivedQuote;
using cw::test::date;
using cw::test::make_derived;

namespace {

// deux jours de calls + un jour de puts
std::vector<DerivedQuote> sample_chain() {
  return {
    make_derived(OptionSide::Call, date(2025, 3, 10), 5000.0, 5005.0, 12.5, 12.0, 13.0, 100),
    make_derived(OptionSide::Call, date(2025, 3, 10), 5010.0, 5005.0,  7.0,  6.5,  7.5, 50),
    make_derived(OptionSide::Call, date(2025, 3, 10), 5020.0, 5005.0,  3.0,  2.8,  3.2, 20),
    make_derived(OptionSide::Call, date(2025, 3, 11), 5000.0, 4990.0,  4.0,  3.8,  4.2, 70),
    make_derived(OptionSide::Call, date(2025, 3, 11), 5030.0, 4990.0,  0.5,  0.4,  0.6, 10),
    make_derived(OptionSide::Put,  date(2025, 3, 12), 5000.0, 5020.0,  6.0,  5.5,  6.5, 30),
  };
}

SurfaceRequest strike_request(std::vector<double> axis, Tolerance tol,
                              SurfaceMetric metric = SurfaceMetric::LastPrice) {
  SurfaceRequest r;
  r.side = OptionSide::Call;
  r.metric = metric;
  r.axis.key = AxisKey::Strike;
  r.axis.values = std::move(axis);
  r.axis.tolerance = tol;
  return r;
}

} // namespace

TEST(SurfaceGridTest, ExactStrikeReturnsThatQuotesMetric) {
  const auto chain = sample_chain();
  auto g = build_surface(chain, strike_request({5010.0}, Tolerance::absolute(0.5)));
  ASSERT_EQ(g.dates.size(), 2u);
  ASSERT_EQ(g.axis.size(), 1u);
  EXPECT_DOUBLE_EQ(g.at(0, 0), 7.0);
  EXPECT_TRUE(g.is_missing(1, 0));   // 5000 et 5030 à 10 $ et 20 $
}

TEST(SurfaceGridTest, DatesAreSideSpecificAndAscending) {
  const auto chain = sample_chain();
  auto g = build_surface(chain, strike_request({5000.0}, Tolerance::absolute(0.5)));
  ASSERT_EQ(g.dates.size(), 2u);
  EXPECT_EQ(g.dates[0], date(2025, 3, 10));
  EXPECT_EQ(g.dates[1], date(2025, 3, 11));
  EXPECT_EQ(g.values.size(), 2u);
}

TEST(SurfaceGridTest, MissingCellsAreNaNNeverZero) {
  const auto chain = sample_chain();
  auto g = build_surface(chain, strike_request({4000.0, 5000.0}, Tolerance::absolute(0.5)));
  EXPECT_TRUE(std::isnan(g.at(0, 0)));
  EXPECT_TRUE(std::isnan(g.at(1, 0)));
  EXPECT_DOUBLE_EQ(g.at(1, 1), 4.0);
  EXPECT_EQ(g.filled_cells(), 2u);
}

TEST(SurfaceGridTest, ToleranceBoundaryIsInclusive) {
  std::vector<DerivedQuote> chain{
    make_derived(OptionSide::Call, date(2025, 3, 10), 5000.5, 5005.0, 9.0, 8.5, 9.5),
  };
  auto in = build_surface(chain, strike_request({5000.0}, Tolerance::absolute(0.5)));
  EXPECT_DOUBLE_EQ(in.at(0, 0), 9.0);
  auto out = build_surface(chain, strike_request({5000.0}, Tolerance::absolute(0.25)));
  EXPECT_TRUE(out.is_missing(0, 0));
}

TEST(SurfaceGridTest, TiesGoToFirstQuoteInInputOrder) {
  std::vector<DerivedQuote> chain{
    make_derived(OptionSide::Call, date(2025, 3, 10), 5010.0, 5005.0, 1.0, 0.9, 1.1),
    make_derived(OptionSide::Call, date(2025, 3, 10), 4990.0, 5005.0, 2.0, 1.9, 2.1),
  };
  auto g = build_surface(chain, strike_request({5000.0}, Tolerance::unbounded()));
  EXPECT_DOUBLE_EQ(g.at(0, 0), 1.0);

  std::swap(chain[0], chain[1]);
  auto h = build_surface(chain, strike_request({5000.0}, Tolerance::unbounded()));
  EXPECT_DOUBLE_EQ(h.at(0, 0), 2.0);
}

TEST(SurfaceGridTest, DuplicateKeysFirstQuoteWins) {
  std::vector<DerivedQuote> chain{
    make_derived(OptionSide::Call, date(2025, 3, 10), 5000.0, 5005.0, 11.0, 10.0, 12.0),
    make_derived(OptionSide::Call, date(2025, 3, 10), 5000.0, 5005.0, 99.0, 98.0, 100.0),
  };
  auto g = build_surface(chain, strike_request({5000.0}, Tolerance::absolute(0.5)));
  EXPECT_DOUBLE_EQ(g.at(0, 0), 11.0);
}

TEST(SurfaceGridTest, RelativeToleranceScalesWithSpot) {
  std::vector<DerivedQuote> chain{
    make_derived(OptionSide::Call, date(2025, 3, 10), 5004.0, 5000.0, 3.0, 2.9, 3.1),
    make_derived(OptionSide::Call, date(2025, 3, 11), 5006.0, 5000.0, 4.0, 3.9, 4.1),
  };
  auto g = build_surface(chain, strike_request({5000.0}, Tolerance::relative(0.001)));
  EXPECT_DOUBLE_EQ(g.at(0, 0), 3.0);
  EXPECT_TRUE(g.is_missing(1, 0));
}

TEST(SurfaceGridTest, BaselineIsExactUnderlyingClose) {
  const auto chain = sample_chain();
  auto g = build_surface(chain, strike_request({5000.0}, Tolerance::absolute(0.5)));
  ASSERT_EQ(g.baseline.size(), 2u);
  EXPECT_DOUBLE_EQ(g.baseline[0], 5005.0);
  EXPECT_DOUBLE_EQ(g.baseline[1], 4990.0);
}

TEST(SurfaceGridTest, SampleEveryKeepsEveryNthDate) {
  std::vector<DerivedQuote> chain;
  for (int d = 10; d <= 14; ++d) {
    chain.push_back(make_derived(OptionSide::Call, date(2025, 3, d), 5000.0, 5000.0 + d, 1.0 * d, 0.9, 1.1));
  }
  auto r = strike_request({5000.0}, Tolerance::absolute(0.5));
  r.sample_every = 2;
  auto g = build_surface(chain, r);
  ASSERT_EQ(g.dates.size(), 3u);
  EXPECT_EQ(g.dates[0], date(2025, 3, 10));
  EXPECT_EQ(g.dates[1], date(2025, 3, 12));
  EXPECT_EQ(g.dates[2], date(2025, 3, 14));
  EXPECT_DOUBLE_EQ(g.at(1, 0), 12.0);
}

TEST(SurfaceGridTest, InvalidRequestsThrow) {
  const auto chain = sample_chain();
  auto r = strike_request({5000.0}, Tolerance::absolute(0.5));
  r.sample_every = 0;
  EXPECT_THROW(build_surface(chain, r), std::invalid_argument);
  EXPECT_THROW(build_surface(chain, strike_request({5000.0}, Tolerance::absolute(-1.0))),
               std::invalid_argument);
}

TEST(SurfaceGridTest, EmptyInputGivesEmptyGrid) {
  auto g = build_surface({}, strike_request({5000.0}, Tolerance::absolute(0.5)));
  EXPECT_TRUE(g.dates.empty());
  EXPECT_TRUE(g.values.empty());
  EXPECT_EQ(g.filled_cells(), 0u);
}

TEST(SurfaceGridTest, MoneynessAndOffsetKeys) {
  const auto chain = sample_chain();
  SurfaceRequest r;
  r.side = OptionSide::Call;
  r.metric = SurfaceMetric::MidPrice;
  r.axis.key = AxisKey::StrikeOffset;
  r.axis.values = {5.0, 10.0};
  r.axis.tolerance = Tolerance::absolute(0.5);
  auto g = build_surface(chain, r);
  EXPECT_DOUBLE_EQ(g.at(0, 0), 7.0);     // 5010 - 5005
  EXPECT_DOUBLE_EQ(g.at(1, 1), 4.0);     // 5000 - 4990
  EXPECT_TRUE(g.is_missing(0, 1));

  r.axis.key = AxisKey::Moneyness;
  r.axis.values = {(5020.0 - 5005.0) / 5005.0};
  r.axis.tolerance = Tolerance::absolute(kMoneynessTolerance);
  r.metric = SurfaceMetric::UnderlyingPlusLast;
  auto m = build_surface(chain, r);
  EXPECT_DOUBLE_EQ(m.at(0, 0), 5005.0 + 3.0);
}

TEST(AxisHelpersTest, Linspace) {
  auto v = linspace(-200.0, 200.0, 41);
  ASSERT_EQ(v.size(), 41u);
  EXPECT_DOUBLE_EQ(v.front(), -200.0);
  EXPECT_DOUBLE_EQ(v.back(), 200.0);
  EXPECT_NEAR(v[20], 0.0, 1e-12);
  EXPECT_NEAR(v[21], 10.0, 1e-12);
  EXPECT_TRUE(linspace(0.0, 1.0, 0).empty());
  EXPECT_EQ(linspace(3.0, 9.0, 1), std::vector<double>{3.0});
}

TEST(AxisHelpersTest, DistinctKeysAndSpotRange) {
  const auto chain = sample_chain();
  auto k = distinct_keys(chain, OptionSide::Call, AxisKey::Strike);
  EXPECT_EQ(k, (std::vector<double>{5000.0, 5010.0, 5020.0, 5030.0}));
  auto bounded = distinct_keys(chain, OptionSide::Call, AxisKey::Strike, 5005.0, 5025.0);
  EXPECT_EQ(bounded, (std::vector<double>{5010.0, 5020.0}));

  auto s = spot_range(chain, OptionSide::Call, 0.95, 1.05, 50);
  ASSERT_EQ(s.size(), 50u);
  EXPECT_DOUBLE_EQ(s.front(), 4990.0 * 0.95);
  EXPECT_DOUBLE_EQ(s.back(), 5005.0 * 1.05);
  EXPECT_TRUE(spot_range({}, OptionSide::Call, 0.95, 1.05, 50).empty());
}

TEST(DaySliceTest, OneDayOneSideSortedByStrike) {
  std::vector<DerivedQuote> chain{
    make_derived(OptionSide::Call, date(2025, 3, 10), 5020.0, 5005.0, 3.0, 2.8, 3.2),
    make_derived(OptionSide::Put,  date(2025, 3, 10), 5000.0, 5005.0, 6.0, 5.5, 6.5),
    make_derived(OptionSide::Call, date(2025, 3, 10), 5000.0, 5005.0, 12.5, 12.0, 13.0),
    make_derived(OptionSide::Call, date(2025, 3, 11), 4990.0, 4990.0, 5.0, 4.8, 5.2),
  };
  auto s = day_slice(chain, date(2025, 3, 10), OptionSide::Call);
  ASSERT_EQ(s.size(), 2u);
  EXPECT_DOUBLE_EQ(s[0].quote.strike, 5000.0);
  EXPECT_DOUBLE_EQ(s[1].quote.strike, 5020.0);
}

TEST(PresetsTest, PriceAndIvUseDistinctStrikes) {
  const auto chain = sample_chain();
  auto p = price_surface(chain, OptionSide::Call);
  EXPECT_EQ(p.metric, SurfaceMetric::LastPrice);
  EXPECT_EQ(p.axis.key, AxisKey::Strike);
  EXPECT_EQ(p.axis.values.size(), 4u);
  EXPECT_EQ(p.axis.tolerance.mode, Tolerance::Mode::Absolute);
  EXPECT_DOUBLE_EQ(p.axis.tolerance.value, kStrikeTolerance);

  auto g = build_surface(chain, iv_surface(chain, OptionSide::Call));
  EXPECT_DOUBLE_EQ(g.at(0, 0), 0.2);
  EXPECT_EQ(g.filled_cells(), 5u);
}

TEST(PresetsTest, OffsetSpotAndLiquidityShapes) {
  const auto chain = sample_chain();
  auto off = strike_offset_surface(OptionSide::Put);
  EXPECT_EQ(off.axis.values.size(), kOffsetPoints);
  EXPECT_EQ(off.axis.tolerance.mode, Tolerance::Mode::Unbounded);

  auto spot = build_surface(chain, spot_level_surface(chain, OptionSide::Call));
  EXPECT_EQ(spot.axis.size(), kSpotPoints);
  EXPECT_EQ(spot.filled_cells(), spot.values.size());   // illimitée : tout est rempli

  auto liq = liquidity_cost_surface(OptionSide::Call, 3);
  EXPECT_EQ(liq.metric, SurfaceMetric::EffectiveLiquidityCost);
  EXPECT_EQ(liq.axis.key, AxisKey::Moneyness);
  EXPECT_EQ(liq.sample_every, 3u);

  auto mny = moneyness_surface(chain, OptionSide::Call);
  for (double m : mny.axis.values) {
    EXPECT_LE(std::fabs(m), kMoneynessBound);
  }
}

TEST(PresetsTest, ParseSurfaceKind) {
  EXPECT_EQ(parse_surface_kind("price"), SurfaceKind::Price);
  EXPECT_EQ(parse_surface_kind("IV"), SurfaceKind::ImpliedVol);
  EXPECT_EQ(parse_surface_kind("liquidity"), SurfaceKind::LiquidityCost);
  EXPECT_FALSE(parse_surface_kind("bogus").has_value());

  const auto chain = sample_chain();
  auto r = preset_request(SurfaceKind::SpotLevel, chain, OptionSide::Call);
  EXPECT_EQ(r.metric, SurfaceMetric::UnderlyingPlusLast);
}
