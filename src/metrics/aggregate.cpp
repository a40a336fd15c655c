#include "cw/metrics/aggregate.hpp"
#include "cw/core/stats.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <tuple>

namespace {

using cw::core::Date;
using cw::market::OptionSide;

// clé de groupe : -1 / date neutre quand l'axe n'est pas demandé
using GroupKey = std::tuple<long, int, int>;

struct Bucket {
  std::vector<const cw::metrics::DerivedQuote*> rows;
};

inline double mean_of(const std::vector<double>& v) {
  cw::core::RunningStats s;
  for (double x : v) s.add(x);
  return s.count() ? s.mean() : std::numeric_limits<double>::quiet_NaN();
}

} // namespace

namespace cw {
namespace metrics {

std::optional<double> weighted_average(const std::vector<double>& values,
                                       const std::vector<double>& weights)
{
  const std::size_t n = std::min(values.size(), weights.size());
  double num = 0.0, den = 0.0;
  for (std::size_t i=0;i<n;++i) {
    if (!std::isfinite(values[i]) || !std::isfinite(weights[i])) continue;
    num += values[i] * weights[i];
    den += weights[i];
  }
  if (den == 0.0) return std::nullopt;
  return num / den;
}

std::vector<LiquiditySummary>
summarize_liquidity(const std::vector<DerivedQuote>& derived,
                    GroupBy by,
                    std::vector<Diagnostic>* warnings)
{
  std::map<GroupKey, Bucket> groups;
  for (const auto& d : derived) {
    GroupKey k{
      by.date     ? d.quote.trade_date.serial() : 0L,
      by.side     ? static_cast<int>(d.quote.side) : -1,
      by.category ? static_cast<int>(d.moneyness_category) : -1
    };
    groups[k].rows.push_back(&d);
  }

  std::vector<LiquiditySummary> out;
  out.reserve(groups.size());

  for (const auto& kv : groups) {
    const auto& rows = kv.second.rows;
    LiquiditySummary s;
    if (by.date)     s.date     = rows.front()->quote.trade_date;
    if (by.side)     s.side     = rows.front()->quote.side;
    if (by.category) s.category = rows.front()->moneyness_category;
    s.quotes = rows.size();

    std::vector<double> costs, vols, discounts, spreads;
    costs.reserve(rows.size()); vols.reserve(rows.size());
    for (const auto* d : rows) {
      const long long v = market::volume_or_zero(d->quote);
      s.total_volume += v;
      costs.push_back(d->effective_liquidity_cost);
      vols.push_back(static_cast<double>(v));
      discounts.push_back(d->itm_discount);
      spreads.push_back(d->spread_cost);
      if (std::isfinite(d->effective_liquidity_cost)) {
        s.mm_profit += d->effective_liquidity_cost * static_cast<double>(v) * kContractMultiplier;
      }
    }

    s.weighted_cost     = weighted_average(costs, vols);
    s.mean_cost         = mean_of(costs);
    s.median_cost       = core::median(costs).value_or(std::numeric_limits<double>::quiet_NaN());
    s.mean_itm_discount = mean_of(discounts);
    s.mean_spread_cost  = mean_of(spreads);

    if (!s.weighted_cost && warnings) {
      std::string key;
      if (s.date)     key += s.date->to_iso() + " ";
      if (s.side)     key += std::string(market::to_string(*s.side)) + " ";
      if (s.category) key += std::string(to_string(*s.category)) + " ";
      if (key.empty()) key = "global ";
      warnings->push_back({DiagnosticCode::UndefinedAggregateWarning, std::string(),
                           "groupe " + key + "de volume nul : moyenne pondérée indéfinie"});
    }
    out.push_back(std::move(s));
  }
  return out;
}

double total_market_maker_profit(const std::vector<DerivedQuote>& derived) {
  double total = 0.0;
  for (const auto& d : derived) {
    if (!std::isfinite(d.effective_liquidity_cost)) continue;
    total += d.effective_liquidity_cost
           * static_cast<double>(market::volume_or_zero(d.quote))
           * kContractMultiplier;
  }
  return total;
}

std::vector<DailyVolume> daily_volumes(const std::vector<market::OptionQuote>& quotes) {
  std::map<Date, long long> by_date;
  for (const auto& q : quotes) by_date[q.trade_date] += market::volume_or_zero(q);

  std::vector<DailyVolume> out;
  out.reserve(by_date.size());
  for (const auto& kv : by_date) out.push_back({kv.first, kv.second});
  return out;
}

HighVolumeDays high_volume_days(const std::vector<DailyVolume>& daily, double q) {
  std::vector<double> vols;
  vols.reserve(daily.size());
  for (const auto& d : daily) vols.push_back(static_cast<double>(d.volume));

  HighVolumeDays res;
  auto thr = core::quantile_linear(vols, q);
  if (!thr) return res;
  res.threshold = *thr;

  for (const auto& d : daily) {
    if (static_cast<double>(d.volume) > res.threshold) res.days.push_back(d);
  }
  std::stable_sort(res.days.begin(), res.days.end(),
                   [](const DailyVolume& a, const DailyVolume& b){ return a.volume > b.volume; });
  return res;
}

std::vector<DailyProfit> daily_profits(const std::vector<DerivedQuote>& derived) {
  std::map<Date, DailyProfit> by_date;
  for (const auto& d : derived) {
    auto& p = by_date[d.quote.trade_date];
    p.date = d.quote.trade_date;
    const long long v = market::volume_or_zero(d.quote);
    p.volume += v;
    if (std::isfinite(d.effective_liquidity_cost)) {
      p.profit += d.effective_liquidity_cost * static_cast<double>(v) * kContractMultiplier;
    }
  }
  std::vector<DailyProfit> out;
  out.reserve(by_date.size());
  for (const auto& kv : by_date) out.push_back(kv.second);
  return out;
}

std::vector<DailyBar> daily_series(const std::vector<market::OptionQuote>& quotes) {
  std::map<Date, DailyBar> by_date;
  for (const auto& q : quotes) {
    auto it = by_date.find(q.trade_date);
    if (it == by_date.end()) {
      DailyBar b;
      b.date = q.trade_date;
      b.spx_close = q.underlying_close;
      b.vix_close = q.vol_index_close;
      it = by_date.emplace(q.trade_date, b).first;
    }
    auto& b = it->second;
    if (q.side == OptionSide::Call) b.call_volume += market::volume_or_zero(q);
    if (q.side == OptionSide::Put)  b.put_volume  += market::volume_or_zero(q);
    b.open_interest += q.open_interest.value_or(0);
  }

  std::vector<DailyBar> out;
  out.reserve(by_date.size());
  for (auto& kv : by_date) {
    auto& b = kv.second;
    if (b.call_volume > 0) {
      b.put_call_ratio = static_cast<double>(b.put_volume) / static_cast<double>(b.call_volume);
    }
    out.push_back(b);
  }
  return out;
}

DatasetSummary summarize_dataset(const std::vector<market::OptionQuote>& quotes,
                                 const std::vector<DerivedQuote>& derived)
{
  DatasetSummary s;
  s.rows = quotes.size();

  core::RunningStats spx, vix;
  for (const auto& q : quotes) {
    if (q.side == OptionSide::Call) ++s.calls;
    if (q.side == OptionSide::Put)  ++s.puts;
    spx.add(q.underlying_close);
    vix.add(q.vol_index_close);
    s.total_volume += market::volume_or_zero(q);
    s.total_open_interest += q.open_interest.value_or(0);
  }
  s.spx_mean = spx.mean(); s.spx_min = spx.min(); s.spx_max = spx.max();
  s.spx_stddev = spx.stddev();
  s.vix_mean = vix.mean(); s.vix_min = vix.min(); s.vix_max = vix.max();

  const auto bars = daily_series(quotes);
  s.dates = bars.size();
  if (!bars.empty()) {
    s.first_date = bars.front().date;
    s.last_date  = bars.back().date;
  }
  std::vector<double> spx_daily, vix_daily;
  for (const auto& b : bars) { spx_daily.push_back(b.spx_close); vix_daily.push_back(b.vix_close); }
  s.spx_vix_correlation = core::pearson_correlation(spx_daily, vix_daily);

  std::vector<double> costs, vols;
  for (const auto& d : derived) {
    costs.push_back(d.effective_liquidity_cost);
    vols.push_back(static_cast<double>(market::volume_or_zero(d.quote)));
  }
  s.weighted_liquidity_cost = weighted_average(costs, vols);
  s.total_mm_profit = total_market_maker_profit(derived);
  return s;
}

} // namespace metrics
} // namespace cw
