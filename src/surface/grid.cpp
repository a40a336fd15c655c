#include "cw/surface/grid.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>

using std::size_t;

namespace {
inline bool is_finite(double x){ return std::isfinite(x); }
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
} // namespace

namespace cw::surface {

const char* to_string(AxisKey k) noexcept {
  switch (k) {
    case AxisKey::Strike:       return "strike";
    case AxisKey::Moneyness:    return "moneyness";
    case AxisKey::StrikeOffset: return "strike_offset";
  }
  return "strike";
}

const char* to_string(SurfaceMetric m) noexcept {
  switch (m) {
    case SurfaceMetric::LastPrice:              return "last_price";
    case SurfaceMetric::MidPrice:               return "mid_price";
    case SurfaceMetric::ImpliedVolatility:      return "implied_volatility";
    case SurfaceMetric::BidAskSpread:           return "bid_ask_spread";
    case SurfaceMetric::SpreadCost:             return "spread_cost";
    case SurfaceMetric::ItmDiscount:            return "itm_discount";
    case SurfaceMetric::EffectiveLiquidityCost: return "effective_liquidity_cost";
    case SurfaceMetric::TimeValue:              return "time_value";
    case SurfaceMetric::IntrinsicValue:         return "intrinsic_value";
    case SurfaceMetric::Volume:                 return "volume";
    case SurfaceMetric::UnderlyingPlusLast:     return "underlying_plus_last";
  }
  return "last_price";
}

double key_value(const metrics::DerivedQuote& d, AxisKey key) noexcept {
  switch (key) {
    case AxisKey::Strike:       return d.quote.strike;
    case AxisKey::Moneyness:    return d.moneyness;
    case AxisKey::StrikeOffset: return d.quote.strike - d.quote.underlying_close;
  }
  return kNaN;
}

double metric_value(const metrics::DerivedQuote& d, SurfaceMetric metric) noexcept {
  switch (metric) {
    case SurfaceMetric::LastPrice:              return d.quote.last_price;
    case SurfaceMetric::MidPrice:               return d.mid_price;
    case SurfaceMetric::ImpliedVolatility:      return d.quote.implied_volatility;
    case SurfaceMetric::BidAskSpread:           return d.bid_ask_spread;
    case SurfaceMetric::SpreadCost:             return d.spread_cost;
    case SurfaceMetric::ItmDiscount:            return d.itm_discount;
    case SurfaceMetric::EffectiveLiquidityCost: return d.effective_liquidity_cost;
    case SurfaceMetric::TimeValue:              return d.time_value;
    case SurfaceMetric::IntrinsicValue:         return d.intrinsic_value;
    case SurfaceMetric::Volume:
      return d.quote.volume ? static_cast<double>(*d.quote.volume) : kNaN;
    case SurfaceMetric::UnderlyingPlusLast:     return d.quote.underlying_close + d.quote.last_price;
  }
  return kNaN;
}

double Tolerance::limit(double spot) const noexcept {
  switch (mode) {
    case Mode::Absolute:       return value;
    case Mode::RelativeToSpot: return value * spot;
    case Mode::Unbounded:      return std::numeric_limits<double>::infinity();
  }
  return value;
}

size_t SurfaceGrid::filled_cells() const {
  return static_cast<size_t>(std::count_if(values.begin(), values.end(),
    [](double v){ return !std::isnan(v); }));
}

// ===== builder =====

SurfaceGrid build_surface(const std::vector<metrics::DerivedQuote>& derived,
                          const SurfaceRequest& req)
{
  if (req.sample_every == 0) {
    throw std::invalid_argument("build_surface: sample_every must be >= 1");
  }
  if (req.axis.tolerance.mode != Tolerance::Mode::Unbounded && !(req.axis.tolerance.value >= 0.0)) {
    throw std::invalid_argument("build_surface: tolerance must be >= 0");
  }

  // 1) Regroupe les quotes du côté par date (ordre d'entrée conservé)
  std::map<core::Date, std::vector<const metrics::DerivedQuote*>> by_date;
  for (const auto& d : derived) {
    if (d.quote.side != req.side) continue;
    by_date[d.quote.trade_date].push_back(&d);
  }

  SurfaceGrid g;
  g.side   = req.side;
  g.metric = req.metric;
  g.key    = req.axis.key;
  g.axis   = req.axis.values;

  // 2) Échantillonne les dates (1 sur sample_every, à partir de la première)
  std::vector<const std::vector<const metrics::DerivedQuote*>*> kept;
  size_t idx = 0;
  for (const auto& kv : by_date) {
    if (idx++ % req.sample_every != 0) continue;
    g.dates.push_back(kv.first);
    kept.push_back(&kv.second);
  }

  const size_t nA = g.axis.size();
  g.values.assign(g.dates.size() * nA, SurfaceGrid::kMissing);
  g.baseline.reserve(g.dates.size());

  // 3) Plus proche voisin par cellule
  for (size_t i=0;i<kept.size();++i) {
    const auto& quotes = *kept[i];
    const double spot = quotes.front()->quote.underlying_close;
    g.baseline.push_back(spot);
    const double tol = req.axis.tolerance.limit(spot);

    for (size_t j=0;j<nA;++j) {
      const double target = g.axis[j];
      const metrics::DerivedQuote* best = nullptr;
      double best_dist = std::numeric_limits<double>::infinity();

      for (const auto* d : quotes) {
        const double k = key_value(*d, req.axis.key);
        if (!is_finite(k)) continue;
        const double dist = std::fabs(k - target);
        // strictement plus petit : en cas d'égalité la première quote gagne
        if (best == nullptr || dist < best_dist) {
          best = d;
          best_dist = dist;
        }
      }

      if (best != nullptr && best_dist <= tol) {
        g.values[i * nA + j] = metric_value(*best, req.metric);
      }
    }
  }
  return g;
}

// ===== axes =====

std::vector<double> linspace(double lo, double hi, size_t n) {
  std::vector<double> out;
  if (n == 0) return out;
  out.reserve(n);
  if (n == 1) { out.push_back(lo); return out; }
  for (size_t i=0;i<n;++i) {
    double u = double(i)/double(n-1);
    out.push_back((1.0-u)*lo + u*hi);
  }
  return out;
}

std::vector<double> distinct_keys(const std::vector<metrics::DerivedQuote>& derived,
                                  market::OptionSide side, AxisKey key,
                                  double lo, double hi)
{
  std::set<double> s;
  for (const auto& d : derived) {
    if (d.quote.side != side) continue;
    const double k = key_value(d, key);
    if (is_finite(k) && k >= lo && k <= hi) s.insert(k);
  }
  return std::vector<double>(s.begin(), s.end());
}

std::vector<double> spot_range(const std::vector<metrics::DerivedQuote>& derived,
                               market::OptionSide side,
                               double lo_factor, double hi_factor, size_t n)
{
  double smin = std::numeric_limits<double>::infinity();
  double smax = -std::numeric_limits<double>::infinity();
  for (const auto& d : derived) {
    if (d.quote.side != side || !is_finite(d.quote.underlying_close)) continue;
    smin = std::min(smin, d.quote.underlying_close);
    smax = std::max(smax, d.quote.underlying_close);
  }
  if (!(smin <= smax)) return {};
  return linspace(smin * lo_factor, smax * hi_factor, n);
}

std::vector<metrics::DerivedQuote> day_slice(const std::vector<metrics::DerivedQuote>& derived,
                                             const core::Date& date,
                                             market::OptionSide side)
{
  std::vector<metrics::DerivedQuote> out;
  for (const auto& d : derived) {
    if (d.quote.side == side && d.quote.trade_date == date) out.push_back(d);
  }
  std::stable_sort(out.begin(), out.end(),
    [](const metrics::DerivedQuote& a, const metrics::DerivedQuote& b){
      return a.quote.strike < b.quote.strike;
    });
  return out;
}

} // namespace cw::surface
