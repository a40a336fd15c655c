#pragma once
/**
 * @file coverage.hpp
 * @brief Couverture calendaire des dates de négociation observées.
 *
 * # Trous
 * - Dates triées et dédupliquées, écart = jours calendaires entre deux
 *   dates successives.
 * - Un trou est signalé si écart > seuil (strictement). Un week-end normal
 *   (vendredi -> lundi = 3 jours) n'est donc jamais un trou avec le seuil 4.
 *
 * # Couverture mensuelle
 * - Jours distincts observés par mois calendaire, comparés à une attente
 *   fournie par l'appelant (pas de calendrier de jours fériés).
 */

#include <cw/core/date.hpp>

#include <cstddef>
#include <vector>

namespace cw {
namespace calendar {

struct CoverageGap {
  core::Date before;   ///< dernière date observée avant le trou
  core::Date after;    ///< première date observée après
  long gap_days = 0;   ///< after - before en jours calendaires
};

/// @brief Trous strictement supérieurs à threshold_days, dans l'ordre chronologique.
/// @throws std::invalid_argument si threshold_days < 0.
std::vector<CoverageGap> find_gaps(std::vector<core::Date> dates, long threshold_days = 4);

struct MonthCoverage {
  int year = 0;
  int month = 0;
  std::size_t observed = 0;
  std::size_t expected = 0;
  double ratio() const noexcept {
    return expected ? static_cast<double>(observed) / static_cast<double>(expected) : 0.0;
  }
};

/// @brief Un élément par mois ayant au moins une date, mois croissants.
std::vector<MonthCoverage> monthly_coverage(std::vector<core::Date> dates,
                                            std::size_t expected_per_month = 22);

/// @brief Jours ouvrés (lundi-vendredi) entre la première et la dernière date
///        qui n'ont pas été observés.
std::vector<core::Date> missing_weekdays(std::vector<core::Date> dates);

} // namespace calendar
} // namespace cw
