#pragma once
/**
 * @file derived.hpp
 * @brief Métriques dérivées par quote : moneyness, valeur intrinsèque / temps,
 *        spread, décomposition du coût de liquidité.
 *
 * # Conventions
 * - moneyness = (K - S) / S, positif si strike au-dessus du spot.
 * - Valeur temps = last - intrinsèque, NON bornée : une valeur négative signale
 *   une quote périmée ou mal pricée et doit être conservée.
 * - is_itm est recalculé depuis (K, S) indépendamment du drapeau inTheMoney
 *   de la source (les écarts sont remontés par le QC, cf. qc.hpp).
 * - Catégorie de moneyness agnostique du côté : à lire avec option_side.
 *
 * Toutes les fonctions sont pures (pas d'état inter-lignes ni inter-dates).
 * Les NaN en entrée se propagent (bid/ask absents -> coût NaN).
 */

#include <cw/market/quote.hpp>

#include <vector>

namespace cw {
namespace metrics {

/// @brief Multiplicateur de contrat SPX (constante de conception).
inline constexpr double kContractMultiplier = 100.0;

/// @brief Demi-largeur de la bande ATM en moneyness (0.5 %).
inline constexpr double kAtmBand = 0.005;

enum class MoneynessCategory {
  ATM,              ///< |m| < 0.5 %
  OTM_CALL_ITM_PUT, ///< strike au-dessus du spot
  ITM_CALL_OTM_PUT  ///< strike au-dessous du spot
};

/// @return "ATM", "OTM_Call/ITM_Put" ou "ITM_Call/OTM_Put".
const char* to_string(MoneynessCategory c) noexcept;

/// @brief Quote + champs dérivés. Trace vers exactement une OptionQuote.
struct DerivedQuote {
  market::OptionQuote quote;

  double moneyness;
  double intrinsic_value;
  double time_value;
  bool   is_itm;
  double bid_ask_spread;
  double mid_price;
  double itm_discount;
  double spread_cost;
  double effective_liquidity_cost;
  double last_vs_mid;                 ///< (mid - last) / mid, 0 si mid <= 0
  double mm_profit_per_contract;      ///< effective_liquidity_cost * 100
  MoneynessCategory moneyness_category;
};

// --- fonctions ligne à ligne -------------------------------------------------

double moneyness(double strike, double spot) noexcept;
double intrinsic_value(market::OptionSide side, double strike, double spot) noexcept;
bool   is_itm(market::OptionSide side, double strike, double spot) noexcept;

/// @brief max(0, intrinsèque - last) si ITM et intrinsèque > 0, sinon 0.
double itm_discount(bool itm, double intrinsic, double last_price) noexcept;

/// @brief itm_discount + spread/2 si ITM, sinon spread/2.
double effective_liquidity_cost(bool itm, double itm_discount, double spread_cost) noexcept;

MoneynessCategory classify_moneyness(double m) noexcept;

/// @brief Calcule tous les champs dérivés d'une quote Call ou Put.
/// @throws std::invalid_argument si le côté est Unknown.
DerivedQuote derive_quote(const market::OptionQuote& q);

/// @brief Version lot : les quotes de côté Unknown sont ignorées.
/// Le diagnostic UnknownSide est émis une seule fois, à l'ingestion de la source.
std::vector<DerivedQuote>
derive_all(const std::vector<market::OptionQuote>& quotes);

} // namespace metrics
} // namespace cw
