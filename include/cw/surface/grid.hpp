#pragma once
#include <cw/core/date.hpp>
#include <cw/metrics/derived.hpp>

#include <cmath>
#include <cstddef>
#include <limits>
#include <vector>

namespace cw::surface {

// Champ de la quote comparé aux valeurs de l'axe
enum class AxisKey {
  Strike,       // K
  Moneyness,    // (K - S) / S
  StrikeOffset  // K - S, en dollars
};

// Métrique placée dans les cellules
enum class SurfaceMetric {
  LastPrice,
  MidPrice,
  ImpliedVolatility,
  BidAskSpread,
  SpreadCost,
  ItmDiscount,
  EffectiveLiquidityCost,
  TimeValue,
  IntrinsicValue,
  Volume,
  UnderlyingPlusLast   // S + last : options "au-dessus" de la ligne SPX
};

const char* to_string(AxisKey k) noexcept;
const char* to_string(SurfaceMetric m) noexcept;

double key_value(const metrics::DerivedQuote& d, AxisKey key) noexcept;
double metric_value(const metrics::DerivedQuote& d, SurfaceMetric metric) noexcept;

// Tolérance d'appariement au plus proche voisin
struct Tolerance {
  enum class Mode {
    Absolute,        // value dans l'unité de la clé
    RelativeToSpot,  // value * spot du jour (axes en dollars)
    Unbounded        // plus proche voisin sans limite
  };
  Mode mode = Mode::Absolute;
  double value = 0.0;

  static Tolerance absolute(double v)  { return {Mode::Absolute, v}; }
  static Tolerance relative(double v)  { return {Mode::RelativeToSpot, v}; }
  static Tolerance unbounded()         { return {Mode::Unbounded, 0.0}; }

  // seuil effectif en unité de clé pour un spot donné
  double limit(double spot) const noexcept;
};

struct AxisSpec {
  AxisKey key = AxisKey::Strike;
  std::vector<double> values;
  Tolerance tolerance;
};

struct SurfaceRequest {
  market::OptionSide side = market::OptionSide::Call;
  SurfaceMetric metric = SurfaceMetric::LastPrice;
  AxisSpec axis;
  std::size_t sample_every = 1; // garde une date sur n (1 = toutes)
};

// Grille dense (date × axe) ; NaN = cellule manquante (jamais 0)
struct SurfaceGrid {
  static constexpr double kMissing = std::numeric_limits<double>::quiet_NaN();

  market::OptionSide side = market::OptionSide::Call;
  SurfaceMetric metric = SurfaceMetric::LastPrice;
  AxisKey key = AxisKey::Strike;

  std::vector<core::Date> dates;  // croissantes
  std::vector<double> axis;
  std::vector<double> values;     // row-major : values[i*axis.size() + j]
  std::vector<double> baseline;   // clôture du sous-jacent par date, exacte

  double at(std::size_t i, std::size_t j) const { return values[i * axis.size() + j]; }
  bool is_missing(std::size_t i, std::size_t j) const { return std::isnan(at(i, j)); }
  std::size_t filled_cells() const;
};

// Construit la grille par appariement au plus proche voisin.
// - dates : dates distinctes du côté demandé, croissantes, puis 1 sur sample_every
// - cellule (i, j) : quote de la date i minimisant |clé - axis[j]| ;
//   égalité -> première dans l'ordre d'entrée ; métrique retenue si
//   distance <= tolérance, sinon NaN
// - baseline[i] : spot de la première quote de la date i (jamais "snappé")
// Lève std::invalid_argument si sample_every == 0 ou tolérance négative.
SurfaceGrid build_surface(const std::vector<metrics::DerivedQuote>& derived,
                          const SurfaceRequest& request);

// n points régulièrement espacés de lo à hi inclus (n == 1 -> {lo})
std::vector<double> linspace(double lo, double hi, std::size_t n);

// valeurs distinctes triées de la clé pour un côté, bornées à [lo, hi]
std::vector<double> distinct_keys(const std::vector<metrics::DerivedQuote>& derived,
                                  market::OptionSide side, AxisKey key,
                                  double lo = -std::numeric_limits<double>::infinity(),
                                  double hi =  std::numeric_limits<double>::infinity());

// linspace sur [lo_factor * min(spot), hi_factor * max(spot)] ; vide si aucune quote
std::vector<double> spot_range(const std::vector<metrics::DerivedQuote>& derived,
                               market::OptionSide side,
                               double lo_factor, double hi_factor, std::size_t n);

// quotes d'un jour et d'un côté, triées par strike (stable)
std::vector<metrics::DerivedQuote> day_slice(const std::vector<metrics::DerivedQuote>& derived,
                                             const core::Date& date,
                                             market::OptionSide side);

} // namespace cw::surface
