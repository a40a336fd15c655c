#pragma once
/**
 * @file pipeline_config.hpp
 * @brief Configuration standard d'un run du pipeline (ingestion -> métriques -> surfaces).
 *
 * # Contenu
 * - data_dir          : répertoire des fichiers source (un fichier par jour et par côté).
 * - extension         : extension des fichiers retenus (comparaison insensible à la casse).
 * - gap_threshold_days: seuil des trous calendaires (écart **strictement** supérieur).
 * - expected_per_month: jours de négociation attendus par mois (estimation, ~22).
 * - high_volume_q     : quantile des volumes journaliers au-delà duquel un jour est signalé.
 * - sample_every      : une date sur n dans les surfaces (1 = toutes).
 *
 * Valeurs par défaut dans le code, surchargées par les options de chaque outil CLI.
 */

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace cw {
namespace config {

/// @brief Configuration d'un run du pipeline.
struct PipelineConfig {
  std::string data_dir;          ///< Répertoire source.
  std::string extension;         ///< Extension des fichiers (".csv").
  long        gap_threshold_days;///< Seuil des trous (jours calendaires).
  std::size_t expected_per_month;///< Jours attendus par mois.
  double      high_volume_q;     ///< Quantile des jours à fort volume.
  std::size_t sample_every;      ///< Pas d'échantillonnage des dates.

  /// @brief Construit une configuration avec valeurs par défaut.
  PipelineConfig(std::string data_dir = "dataset",
                 std::string extension = ".csv",
                 long gap_threshold_days = 4,
                 std::size_t expected_per_month = 22,
                 double high_volume_q = 0.9,
                 std::size_t sample_every = 1)
      : data_dir(std::move(data_dir)),
        extension(std::move(extension)),
        gap_threshold_days(gap_threshold_days),
        expected_per_month(expected_per_month),
        high_volume_q(high_volume_q),
        sample_every(sample_every) {}

  /// @throws std::invalid_argument si un champ est hors domaine.
  void validate() const {
    if (data_dir.empty())        throw std::invalid_argument("PipelineConfig: data_dir vide");
    if (gap_threshold_days < 0)  throw std::invalid_argument("PipelineConfig: gap_threshold_days < 0");
    if (!(high_volume_q >= 0.0 && high_volume_q <= 1.0))
      throw std::invalid_argument("PipelineConfig: high_volume_q hors de [0, 1]");
    if (sample_every == 0)       throw std::invalid_argument("PipelineConfig: sample_every doit être >= 1");
  }
};

} // namespace config
} // namespace cw
