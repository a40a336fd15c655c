#include <gtest/gtest.h>
#include <cw/io/table_writer.hpp>
#include "test_util.hpp"

#include <sstream>
#include <stdexcept>

using cw::market::OptionSide;
using cw::test::date;
using cw::test::make_derived;

namespace {

std::vector<std::string> lines_of(const std::string& s) {
  std::vector<std::string> out;
  std::istringstream is(s);
  std::string line;
  while (std::getline(is, line)) out.push_back(line);
  return out;
}

cw::ingest::NormalizedDataset small_dataset() {
  cw::ingest::NormalizedDataset ds;
  ds.columns = {"strike", "note"};
  ds.sources = {"spx_calls_20250310.csv"};
  ds.source_columns = {ds.columns};
  cw::ingest::NormalizedRow r;
  r.cells = {"5000", "a,b"};
  r.trade_date = date(2025, 3, 10);
  r.side = OptionSide::Call;
  r.source = 0;
  ds.rows.push_back(r);
  return ds;
}

} // namespace

TEST(TableWriterTest, FormatNumber) {
  EXPECT_EQ(cw::io::format_number(0.5), "0.5");
  EXPECT_EQ(cw::io::format_number(5000.0), "5000");
  EXPECT_EQ(cw::io::format_number(std::nan("")), "");
}

TEST(TableWriterTest, NormalizedTableAppendsIdentityColumns) {
  std::ostringstream os;
  cw::io::write_normalized_csv(os, small_dataset());
  auto l = lines_of(os.str());
  ASSERT_EQ(l.size(), 2u);
  EXPECT_EQ(l[0], "strike,note,trade_date,option_side,source_id");
  EXPECT_EQ(l[1], "5000,\"a,b\",2025-03-10,call,spx_calls_20250310.csv");
}

TEST(TableWriterTest, DerivedTableUsesOriginRowAndBlankNaN) {
  auto d = make_derived(OptionSide::Call, date(2025, 3, 10), 5000.0, 5005.0, 12.5, std::nan(""), 13.0);
  d.quote.row = 0;
  std::ostringstream os;
  cw::io::write_derived_csv(os, small_dataset(), {d});
  auto l = lines_of(os.str());
  ASSERT_EQ(l.size(), 2u);
  EXPECT_EQ(l[0].rfind("strike,note,trade_date,option_side,source_id,moneyness,", 0), 0u);
  EXPECT_NE(l[0].find("effective_liquidity_cost"), std::string::npos);
  // spread NaN -> cellule vide ; intrinsèque 5
  EXPECT_NE(l[1].find(",5,"), std::string::npos);
  EXPECT_NE(l[1].find(",true,,"), std::string::npos);
  EXPECT_EQ(l[1].substr(l[1].size() - 3), "ATM");

  d.quote.row = 7;
  std::ostringstream bad;
  EXPECT_THROW(cw::io::write_derived_csv(bad, small_dataset(), {d}), std::out_of_range);
}

TEST(TableWriterTest, SurfaceLongFormat) {
  cw::surface::SurfaceGrid g;
  g.key = cw::surface::AxisKey::Strike;
  g.metric = cw::surface::SurfaceMetric::LastPrice;
  g.dates = {date(2025, 3, 10)};
  g.axis = {5000.0, 5010.0};
  g.values = {12.5, cw::surface::SurfaceGrid::kMissing};
  g.baseline = {5005.0};

  std::ostringstream os;
  cw::io::write_surface_csv(os, g);
  auto l = lines_of(os.str());
  ASSERT_EQ(l.size(), 3u);
  EXPECT_EQ(l[0], "trade_date,strike,last_price,baseline");
  EXPECT_EQ(l[1], "2025-03-10,5000,12.5,5005");
  EXPECT_EQ(l[2], "2025-03-10,5010,,5005");
}

TEST(TableWriterTest, LiquiditySummaryBlankWhenUndefined) {
  cw::metrics::LiquiditySummary s;
  s.side = OptionSide::Put;
  s.quotes = 2;
  s.mean_cost = 0.25;
  s.median_cost = 0.25;
  std::ostringstream os;
  cw::io::write_liquidity_summary_csv(os, {s});
  auto l = lines_of(os.str());
  ASSERT_EQ(l.size(), 2u);
  EXPECT_EQ(l[1], ",put,,2,0,,0.25,0.25,0,0,0");
}

TEST(TableWriterTest, PathVariantFailsOnUnwritableTarget) {
  cw::test::TempDir dir;
  // le chemin cible est un répertoire existant
  EXPECT_THROW(cw::io::write_normalized_csv(dir.path().string(), small_dataset()), std::runtime_error);
}
