#include "cw/surface/presets.hpp"

#include <algorithm>
#include <cctype>

namespace {
inline std::string lower(std::string s){
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::tolower(c); });
  return s;
}
} // namespace

namespace cw::surface {

using market::OptionSide;

const char* to_string(SurfaceKind k) noexcept {
  switch (k) {
    case SurfaceKind::Price:         return "price";
    case SurfaceKind::ImpliedVol:    return "iv";
    case SurfaceKind::Moneyness:     return "moneyness";
    case SurfaceKind::SpotLevel:     return "spot";
    case SurfaceKind::StrikeOffset:  return "offset";
    case SurfaceKind::LiquidityCost: return "liquidity";
  }
  return "price";
}

std::optional<SurfaceKind> parse_surface_kind(const std::string& s) {
  const std::string k = lower(s);
  if (k == "price")     return SurfaceKind::Price;
  if (k == "iv")        return SurfaceKind::ImpliedVol;
  if (k == "moneyness") return SurfaceKind::Moneyness;
  if (k == "spot")      return SurfaceKind::SpotLevel;
  if (k == "offset")    return SurfaceKind::StrikeOffset;
  if (k == "liquidity") return SurfaceKind::LiquidityCost;
  return std::nullopt;
}

static SurfaceRequest make(OptionSide side, SurfaceMetric metric, AxisKey key,
                           std::vector<double> values, Tolerance tol, std::size_t every)
{
  SurfaceRequest r;
  r.side = side;
  r.metric = metric;
  r.axis.key = key;
  r.axis.values = std::move(values);
  r.axis.tolerance = tol;
  r.sample_every = every;
  return r;
}

SurfaceRequest price_surface(const std::vector<metrics::DerivedQuote>& derived,
                             OptionSide side, std::size_t every)
{
  return make(side, SurfaceMetric::LastPrice, AxisKey::Strike,
              distinct_keys(derived, side, AxisKey::Strike),
              Tolerance::absolute(kStrikeTolerance), every);
}

SurfaceRequest iv_surface(const std::vector<metrics::DerivedQuote>& derived,
                          OptionSide side, std::size_t every)
{
  return make(side, SurfaceMetric::ImpliedVolatility, AxisKey::Strike,
              distinct_keys(derived, side, AxisKey::Strike),
              Tolerance::absolute(kStrikeTolerance), every);
}

SurfaceRequest moneyness_surface(const std::vector<metrics::DerivedQuote>& derived,
                                 OptionSide side, std::size_t every)
{
  return make(side, SurfaceMetric::LastPrice, AxisKey::Moneyness,
              distinct_keys(derived, side, AxisKey::Moneyness, -kMoneynessBound, kMoneynessBound),
              Tolerance::absolute(kMoneynessTolerance), every);
}

SurfaceRequest spot_level_surface(const std::vector<metrics::DerivedQuote>& derived,
                                  OptionSide side, std::size_t every)
{
  return make(side, SurfaceMetric::UnderlyingPlusLast, AxisKey::Strike,
              spot_range(derived, side, 0.95, 1.05, kSpotPoints),
              Tolerance::unbounded(), every);
}

SurfaceRequest strike_offset_surface(OptionSide side, std::size_t every) {
  return make(side, SurfaceMetric::LastPrice, AxisKey::StrikeOffset,
              linspace(-200.0, 200.0, kOffsetPoints),
              Tolerance::unbounded(), every);
}

SurfaceRequest liquidity_cost_surface(OptionSide side, std::size_t every) {
  return make(side, SurfaceMetric::EffectiveLiquidityCost, AxisKey::Moneyness,
              linspace(-kLiquidityBound, kLiquidityBound, kOffsetPoints),
              Tolerance::absolute(kMoneynessTolerance), every);
}

SurfaceRequest preset_request(SurfaceKind kind,
                              const std::vector<metrics::DerivedQuote>& derived,
                              OptionSide side, std::size_t every)
{
  switch (kind) {
    case SurfaceKind::Price:         return price_surface(derived, side, every);
    case SurfaceKind::ImpliedVol:    return iv_surface(derived, side, every);
    case SurfaceKind::Moneyness:     return moneyness_surface(derived, side, every);
    case SurfaceKind::SpotLevel:     return spot_level_surface(derived, side, every);
    case SurfaceKind::StrikeOffset:  return strike_offset_surface(side, every);
    case SurfaceKind::LiquidityCost: return liquidity_cost_surface(side, every);
  }
  return price_surface(derived, side, every);
}

} // namespace cw::surface
