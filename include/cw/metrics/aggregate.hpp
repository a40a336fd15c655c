#pragma once
/**
 * @file aggregate.hpp
 * @brief Agrégats par groupe (date, côté, catégorie de moneyness) et séries
 *        journalières.
 *
 * # Moyennes pondérées
 * - weighted_avg = Σ(metric_i × volume_i) / Σ(volume_i), volume absent = 0.
 * - Σ(volume_i) == 0 -> valeur ABSENTE (nullopt), jamais 0 ni NaN propagé.
 *
 * # Jours à fort volume
 * - Seuil = quantile 90 % (interpolation linéaire) des volumes journaliers.
 * - Un jour est signalé si son volume est strictement supérieur au seuil.
 *
 * Les agrégats s'exécutent après la dérivation de toutes les lignes.
 */

#include <cw/core/date.hpp>
#include <cw/core/diagnostics.hpp>
#include <cw/metrics/derived.hpp>

#include <cstddef>
#include <optional>
#include <vector>

namespace cw {
namespace metrics {

/// @brief Σ v·w / Σ w sur les couples à valeur finie ; nullopt si Σ w == 0.
std::optional<double> weighted_average(const std::vector<double>& values,
                                       const std::vector<double>& weights);

/// @brief Axes de regroupement (combinables).
struct GroupBy {
  bool date     = false;
  bool side     = false;
  bool category = false;
};

/// @brief Résumé du coût de liquidité d'un groupe.
struct LiquiditySummary {
  std::optional<core::Date> date;
  std::optional<market::OptionSide> side;
  std::optional<MoneynessCategory> category;

  std::size_t quotes = 0;
  long long total_volume = 0;
  std::optional<double> weighted_cost;   ///< coût effectif pondéré par le volume
  double mean_cost = 0.0;                ///< moyenne simple (NaN exclus)
  double median_cost = 0.0;
  double mean_itm_discount = 0.0;
  double mean_spread_cost = 0.0;
  double mm_profit = 0.0;                ///< Σ coût × volume × 100
};

/// @brief Regroupe et résume ; groupes triés par clé.
/// Un groupe de volume nul produit un UndefinedAggregateWarning.
std::vector<LiquiditySummary>
summarize_liquidity(const std::vector<DerivedQuote>& derived,
                    GroupBy by,
                    std::vector<Diagnostic>* warnings = nullptr);

/// @brief Σ coût effectif × volume × 100 (coûts non finis ignorés).
double total_market_maker_profit(const std::vector<DerivedQuote>& derived);

struct DailyVolume {
  core::Date date;
  long long volume = 0;
};

/// @brief Volume total par date (volumes absents = 0), dates croissantes.
std::vector<DailyVolume> daily_volumes(const std::vector<market::OptionQuote>& quotes);

struct HighVolumeDays {
  double threshold = 0.0;
  std::vector<DailyVolume> days;  ///< volume > seuil, tri décroissant
};

/// @throws std::invalid_argument si q hors de [0, 1].
HighVolumeDays high_volume_days(const std::vector<DailyVolume>& daily, double q = 0.9);

struct DailyProfit {
  core::Date date;
  double profit = 0.0;
  long long volume = 0;
};

std::vector<DailyProfit> daily_profits(const std::vector<DerivedQuote>& derived);

/// @brief Ligne de la série journalière (timeline SPX / VIX / volumes).
struct DailyBar {
  core::Date date;
  double spx_close = 0.0;   ///< première quote de la date (ordre d'entrée)
  double vix_close = 0.0;
  long long call_volume = 0;
  long long put_volume = 0;
  long long open_interest = 0;
  std::optional<double> put_call_ratio;  ///< absent si volume call nul
};

std::vector<DailyBar> daily_series(const std::vector<market::OptionQuote>& quotes);

/// @brief Statistiques descriptives globales du jeu de données.
struct DatasetSummary {
  std::size_t rows = 0;
  std::size_t dates = 0;
  std::size_t calls = 0;
  std::size_t puts = 0;
  std::optional<core::Date> first_date;
  std::optional<core::Date> last_date;
  double spx_mean = 0.0, spx_min = 0.0, spx_max = 0.0, spx_stddev = 0.0;
  double vix_mean = 0.0, vix_min = 0.0, vix_max = 0.0;
  long long total_volume = 0;
  long long total_open_interest = 0;
  std::optional<double> spx_vix_correlation;  ///< sur les clôtures journalières
  std::optional<double> weighted_liquidity_cost;
  double total_mm_profit = 0.0;
};

DatasetSummary summarize_dataset(const std::vector<market::OptionQuote>& quotes,
                                 const std::vector<DerivedQuote>& derived);

} // namespace metrics
} // namespace cw
