#pragma once
/**
 * @file dataset.hpp
 * @brief Ingestion des fichiers de chaîne (un fichier par jour et par côté)
 *        et concaténation en une table normalisée unique.
 *
 * # Identifiants source
 * - Date : premier bloc de 8 chiffres du nom de fichier (YYYYMMDD).
 *   Absent ou invalide -> SourceParseError, fichier ignoré, la suite continue.
 * - Côté : sous-chaîne "calls" -> Call, sinon "puts" -> Put, sinon Unknown
 *   (fichier ingéré quand même, diagnostic UnknownSide).
 *
 * # Table normalisée
 * - Colonnes : union des colonnes source (ordre de première apparition),
 *   puis trade_date, option_side, source_id.
 * - Nom répété dans un même en-tête : les répétitions deviennent x.1, x.2, ...
 *   (suffixe sauté s'il figure déjà tel quel dans l'en-tête).
 * - Ordre des lignes : ordre de traitement des fichiers, puis ordre du fichier.
 * - Les doublons (date, côté, strike) ne sont PAS dédoublonnés.
 *
 * Aucune écriture disque ici : la persistance est à la charge de l'appelant.
 */

#include <cw/core/date.hpp>
#include <cw/core/diagnostics.hpp>
#include <cw/market/quote.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cw {
namespace ingest {

/// @brief Colonnes exigées pour extraire des OptionQuote typées.
const std::vector<std::string>& required_columns();

/// @brief Noms des colonnes ajoutées à la table normalisée.
inline constexpr const char* kTradeDateColumn  = "trade_date";
inline constexpr const char* kOptionSideColumn = "option_side";
inline constexpr const char* kSourceIdColumn   = "source_id";

/// @brief Une ligne de la table normalisée (cellules alignées sur columns).
struct NormalizedRow {
  std::vector<std::string> cells;   ///< colonnes source, texte brut
  core::Date trade_date;
  market::OptionSide side = market::OptionSide::Unknown;
  std::size_t source = 0;           ///< index dans NormalizedDataset::sources
};

/// @brief Table combinée de toutes les sources ingérées avec succès.
struct NormalizedDataset {
  std::vector<std::string> columns;   ///< colonnes source uniquement
  std::vector<std::string> sources;   ///< source_id, ordre de traitement
  std::vector<std::vector<std::string>> source_columns; ///< en-tête propre à chaque source
  std::vector<NormalizedRow> rows;

  /// @brief Index d'une colonne source, -1 si absente.
  int column(const std::string& name) const;

  /// @brief Cellule brute (vide si colonne absente).
  const std::string& cell(std::size_t row, const std::string& name) const;

  const std::string& source_id(std::size_t row) const { return sources[rows[row].source]; }

  /// @brief En-tête complet : colonnes source + trade_date, option_side, source_id.
  std::vector<std::string> output_columns() const;

  /// @brief Dates distinctes triées.
  std::vector<core::Date> distinct_dates() const;
};

/// @brief Journal par source (succès ou cause de l'échec).
struct SourceStatus {
  std::string source_id;
  std::string path;
  bool ok = false;
  std::size_t rows = 0;
  std::optional<core::Date> trade_date;
  market::OptionSide side = market::OptionSide::Unknown;
  std::string error;
};

/// @brief Résultat d'ingestion : table + journal + diagnostics.
struct IngestResult {
  NormalizedDataset dataset;
  std::vector<SourceStatus> log;
  std::vector<Diagnostic> warnings;

  std::size_t sources_ok() const;
  std::size_t sources_failed() const;
};

/// @brief Premier bloc de 8 chiffres consécutifs, interprété YYYYMMDD.
std::optional<core::Date> extract_trade_date(const std::string& source_id);

/// @brief "calls" -> Call, sinon "puts" -> Put, sinon Unknown.
market::OptionSide extract_option_side(const std::string& source_id);

/// @brief Fichiers réguliers de dir portant l'extension, triés par nom.
/// @throws std::filesystem::filesystem_error si dir n'est pas lisible.
std::vector<std::filesystem::path>
discover_sources(const std::filesystem::path& dir,
                 const std::string& extension = ".csv");

/// @brief Ingère les fichiers dans l'ordre donné.
/// @throws EmptyDatasetError si aucune source, ou aucune source ingérée.
IngestResult ingest_sources(const std::vector<std::filesystem::path>& paths);

/// @brief discover_sources + ingest_sources.
IngestResult ingest_directory(const std::filesystem::path& dir,
                              const std::string& extension = ".csv");

/// @brief Extrait les quotes typées de la table normalisée.
///
/// Une source à laquelle manque une colonne requise est exclue
/// (MissingFieldError, une fois par source) mais reste dans la table.
/// Une ligne sans strike ou spx_close numérique est exclue (InvalidRow).
std::vector<market::OptionQuote>
extract_quotes(const NormalizedDataset& dataset,
               std::vector<Diagnostic>* warnings = nullptr);

} // namespace ingest
} // namespace cw
