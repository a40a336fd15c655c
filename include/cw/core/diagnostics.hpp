#pragma once
/**
 * @file diagnostics.hpp
 * @brief Diagnostics structurés remontés par chaque étape du pipeline.
 *
 * Les échecs par fichier ou par ligne sont récupérés localement (ligne/fichier
 * ignoré + diagnostic). Seul un jeu de données vide est fatal
 * (EmptyDatasetError). Les appelants choisissent comment afficher les
 * diagnostics ; la bibliothèque n'écrit jamais sur la console.
 */

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace cw {

enum class DiagnosticCode {
  SourceParseError,          ///< fichier non daté ou illisible : ignoré
  MissingFieldError,         ///< colonne requise absente : lignes exclues des métriques
  UndefinedAggregateWarning, ///< groupe de volume total nul : moyenne pondérée absente
  DuplicateKeyWarning,       ///< même (date, côté, strike) sur plusieurs lignes
  UnknownSide,               ///< ni "calls" ni "puts" dans l'identifiant
  InvalidRow,                ///< strike ou spx_close non numérique
  ItmFlagMismatch,           ///< inTheMoney source != is_itm recalculé
  CrossedQuote               ///< ask < bid (transmis tel quel)
};

struct Diagnostic {
  DiagnosticCode code;
  std::string source;  ///< identifiant du fichier concerné (peut être vide)
  std::string message;
};

/// @brief Nom stable du code (ex : "SourceParseError").
const char* to_string(DiagnosticCode code) noexcept;

/// @brief "[Code] source: message", pour affichage console.
std::string format_diagnostic(const Diagnostic& d);

/// @brief Compte les diagnostics d'un code donné.
std::size_t count_code(const std::vector<Diagnostic>& diags, DiagnosticCode code) noexcept;

/// @brief Aucune source exploitable : le pipeline s'arrête avant les métriques.
class EmptyDatasetError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace cw
