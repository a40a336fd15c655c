#pragma once
/**
 * @file quote.hpp
 * @brief Snapshot d'une option 0DTE (une ligne d'un fichier de chaîne).
 *
 * # Contenu
 * - Côté (call / put) et date de négociation : tirés du nom de fichier,
 *   jamais du contenu des lignes.
 * - Prix strike / bid / ask / last (>= 0 attendus, non contrôlés ici :
 *   ask < bid est transmis tel quel et signalé par le QC).
 * - Volume et open interest : optionnels, jamais remplacés par 0 à
 *   l'ingestion (0 uniquement au moment des agrégations).
 * - Clôtures SPX / VIX : une valeur par date, dupliquée sur chaque ligne.
 *
 * # Convention
 * - Décimaux absents = NaN (comme dans tout le reste de la lib).
 * - Volatilité implicite en fraction décimale (0.21 = 21 %).
 * - Immuable une fois ingéré.
 */

#include <cw/core/date.hpp>

#include <cstddef>
#include <limits>
#include <optional>
#include <string>

namespace cw {
namespace market {

/// @brief Côté de l'option, déduit de l'identifiant source.
enum class OptionSide {
  Call,    ///< jeton "calls"
  Put,     ///< jeton "puts"
  Unknown  ///< aucun jeton : ligne conservée pour audit
};

/// @return "call", "put" ou "unknown".
inline const char* to_string(OptionSide s) noexcept {
  switch (s) {
    case OptionSide::Call: return "call";
    case OptionSide::Put:  return "put";
    default:               return "unknown";
  }
}

/// @brief Quote typée extraite de la table normalisée.
struct OptionQuote {
  core::Date trade_date{};
  OptionSide side = OptionSide::Unknown;

  double strike     = std::numeric_limits<double>::quiet_NaN();
  double bid        = std::numeric_limits<double>::quiet_NaN();
  double ask        = std::numeric_limits<double>::quiet_NaN();
  double last_price = std::numeric_limits<double>::quiet_NaN();

  std::optional<long long> volume;
  std::optional<long long> open_interest;

  double implied_volatility = std::numeric_limits<double>::quiet_NaN();

  double underlying_close = std::numeric_limits<double>::quiet_NaN(); ///< SPX
  double vol_index_close  = std::numeric_limits<double>::quiet_NaN(); ///< VIX

  std::optional<bool> in_the_money;  ///< tel qu'enregistré par la source
  std::string last_trade_date;       ///< texte brut de la source
  std::string source_id;             ///< nom du fichier d'origine
  std::size_t row = 0;               ///< index dans la table normalisée
};

/// @brief Volume, avec 0 si absent (usage : agrégations uniquement).
inline long long volume_or_zero(const OptionQuote& q) noexcept {
  return q.volume.value_or(0);
}

} // namespace market
} // namespace cw
