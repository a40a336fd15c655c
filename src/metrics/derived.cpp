#include "cw/metrics/derived.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace {
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

// max(0, x) qui propage NaN (std::max(0.0, NaN) renvoie 0.0)
inline double pos_part(double x) noexcept {
  if (std::isnan(x)) return kNaN;
  return x > 0.0 ? x : 0.0;
}
} // namespace

namespace cw {
namespace metrics {

using market::OptionSide;

const char* to_string(MoneynessCategory c) noexcept {
  switch (c) {
    case MoneynessCategory::ATM:              return "ATM";
    case MoneynessCategory::OTM_CALL_ITM_PUT: return "OTM_Call/ITM_Put";
    case MoneynessCategory::ITM_CALL_OTM_PUT: return "ITM_Call/OTM_Put";
  }
  return "ATM";
}

double moneyness(double strike, double spot) noexcept {
  return (strike - spot) / spot;
}

double intrinsic_value(OptionSide side, double strike, double spot) noexcept {
  switch (side) {
    case OptionSide::Call: return pos_part(spot - strike);
    case OptionSide::Put:  return pos_part(strike - spot);
    default:               return kNaN;
  }
}

bool is_itm(OptionSide side, double strike, double spot) noexcept {
  switch (side) {
    case OptionSide::Call: return spot > strike;
    case OptionSide::Put:  return strike > spot;
    default:               return false;
  }
}

double itm_discount(bool itm, double intrinsic, double last_price) noexcept {
  if (itm && intrinsic > 0.0) return pos_part(intrinsic - last_price);
  return 0.0;
}

double effective_liquidity_cost(bool itm, double discount, double spread_cost) noexcept {
  return itm ? discount + spread_cost : spread_cost;
}

MoneynessCategory classify_moneyness(double m) noexcept {
  if (std::fabs(m) < kAtmBand) return MoneynessCategory::ATM;
  if (m > 0.0) return MoneynessCategory::OTM_CALL_ITM_PUT;
  return MoneynessCategory::ITM_CALL_OTM_PUT;
}

DerivedQuote derive_quote(const market::OptionQuote& q) {
  if (q.side == OptionSide::Unknown) {
    throw std::invalid_argument("derive_quote: côté inconnu pour " + q.source_id);
  }

  const double S = q.underlying_close;
  const double K = q.strike;

  DerivedQuote d{};
  d.quote = q;

  d.moneyness       = moneyness(K, S);
  d.intrinsic_value = intrinsic_value(q.side, K, S);
  d.time_value      = q.last_price - d.intrinsic_value;
  d.is_itm          = is_itm(q.side, K, S);

  d.bid_ask_spread  = q.ask - q.bid;
  d.mid_price       = 0.5 * (q.bid + q.ask);

  d.itm_discount    = itm_discount(d.is_itm, d.intrinsic_value, q.last_price);
  d.spread_cost     = 0.5 * d.bid_ask_spread;
  d.effective_liquidity_cost = effective_liquidity_cost(d.is_itm, d.itm_discount, d.spread_cost);

  d.last_vs_mid = (d.mid_price > 0.0) ? (d.mid_price - q.last_price) / d.mid_price : 0.0;
  d.mm_profit_per_contract = d.effective_liquidity_cost * kContractMultiplier;

  d.moneyness_category = classify_moneyness(d.moneyness);
  return d;
}

std::vector<DerivedQuote>
derive_all(const std::vector<market::OptionQuote>& quotes)
{
  std::vector<DerivedQuote> out;
  out.reserve(quotes.size());
  for (const auto& q : quotes) {
    // intrinsèque indéfinie sans côté
    if (q.side == OptionSide::Unknown) continue;
    out.push_back(derive_quote(q));
  }
  return out;
}

} // namespace metrics
} // namespace cw
