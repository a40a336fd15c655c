#pragma once
/**
 * @file stats.hpp
 * @brief Accumulateurs statistiques en streaming (Welford) + quantiles.
 *
 * - Algorithme de Welford : stable numériquement, une passe.
 * - Variance : échantillon (diviseur n-1).
 * - Quantile : interpolation linéaire entre rangs voisins (index q*(n-1)),
 *   même définition que la "linear" de numpy/pandas ; reproductible à
 *   l'identique pour une même série.
 *
 * Comportement aux petits n :
 * - n == 0 : mean()=NaN, min()/max()=NaN, variance()=NaN.
 * - n == 1 : variance()=NaN (indéfinie).
 */

#include <cstddef> // std::size_t
#include <optional>
#include <vector>

namespace cw {
namespace core {

struct RunningStats {
public:
  /// @brief Initialise les accumulateurs (n=0, mean=0, M2=0).
  RunningStats() noexcept;

  /// @brief Ajoute un échantillon. Les valeurs non finies sont ignorées.
  void add(double x) noexcept;

  /// @return Nombre d'échantillons retenus.
  std::size_t count() const noexcept;

  /// @return Moyenne courante (NaN si vide).
  double mean() const noexcept;

  double min() const noexcept;
  double max() const noexcept;

  /// @return Variance d'échantillon (diviseur n-1), NaN si n < 2.
  [[nodiscard]] double variance() const noexcept;

  /// @return Écart-type d'échantillon, NaN si n < 2.
  [[nodiscard]] double stddev() const noexcept;

private:
  std::size_t n_{0};
  double mean_{0.0};
  double m2_{0.0}; // somme des carrés des écarts à la moyenne (Welford)
  double min_{0.0};
  double max_{0.0};
};

/// @brief Quantile d'ordre q par interpolation linéaire.
/// @param values échantillon (copié puis trié ; NaN ignorés)
/// @param q      ordre dans [0, 1]
/// @return nullopt si l'échantillon est vide.
/// @throws std::invalid_argument si q hors de [0, 1].
[[nodiscard]] std::optional<double> quantile_linear(std::vector<double> values, double q);

/// @brief Médiane (= quantile_linear(values, 0.5)).
[[nodiscard]] std::optional<double> median(std::vector<double> values);

/// @brief Corrélation de Pearson sur les paires finies.
/// @return nullopt si moins de 2 paires ou variance nulle d'un côté.
[[nodiscard]] std::optional<double> pearson_correlation(const std::vector<double>& x,
                                                        const std::vector<double>& y);

} // namespace core
} // namespace cw
