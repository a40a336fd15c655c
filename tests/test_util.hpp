#pragma once
// Outils partagés par les tests : répertoire temporaire, fichiers de chaîne,
// quotes construites à la main.
#include <gtest/gtest.h>

#include <cw/core/date.hpp>
#include <cw/market/quote.hpp>
#include <cw/metrics/derived.hpp>

#include <filesystem>
#include <fstream>
#include <string>

namespace cw::test {

// Répertoire propre au test courant, supprimé à la destruction.
class TempDir {
public:
  TempDir() {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    std::string name = "cw_";
    if (info) name += std::string(info->test_suite_name()) + "_" + info->name();
    path_ = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove_all(path_);
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }

  std::filesystem::path write(const std::string& filename, const std::string& content) const {
    const auto p = path_ / filename;
    std::ofstream out(p, std::ios::binary);
    out << content;
    return p;
  }

private:
  std::filesystem::path path_;
};

inline const char* chain_header() {
  return "strike,bid,ask,lastPrice,volume,openInterest,impliedVolatility,"
         "inTheMoney,spx_close,vix_close,lastTradeDate\n";
}

inline core::Date date(int y, int m, int d) { return core::Date{y, m, d}; }

inline market::OptionQuote make_quote(market::OptionSide side, core::Date day,
                                      double strike, double spot,
                                      double last, double bid, double ask,
                                      std::optional<long long> volume = 0)
{
  market::OptionQuote q;
  q.trade_date = day;
  q.side = side;
  q.strike = strike;
  q.underlying_close = spot;
  q.vol_index_close = 18.0;
  q.last_price = last;
  q.bid = bid;
  q.ask = ask;
  q.volume = volume;
  q.open_interest = 0;
  q.implied_volatility = 0.2;
  q.source_id = std::string("spx_") + market::to_string(side) + "s_" + day.to_iso() + ".csv";
  return q;
}

inline metrics::DerivedQuote make_derived(market::OptionSide side, core::Date day,
                                          double strike, double spot,
                                          double last, double bid, double ask,
                                          std::optional<long long> volume = 0)
{
  return metrics::derive_quote(make_quote(side, day, strike, spot, last, bid, ask, volume));
}

} // namespace cw::test
