#pragma once
/**
 * @file date.hpp
 * @brief Date calendaire (grégorien proleptique), sans fuseau ni heure.
 *
 * # Contenu
 * - Triplet année / mois / jour, comparable et ordonné.
 * - serial() : nombre de jours depuis le 1970-01-01 (peut être négatif).
 *
 * # Formats
 * - Compact "YYYYMMDD" (jeton des noms de fichiers source).
 * - ISO "YYYY-MM-DD" (colonnes trade_date des tables de sortie).
 */

#include <optional>
#include <string>

namespace cw {
namespace core {

struct Date {
  int year  = 1970;
  int month = 1;
  int day   = 1;

  /// @brief Parse "YYYYMMDD". Retourne nullopt si non numérique ou date invalide.
  static std::optional<Date> from_compact(const std::string& s);

  /// @brief Parse "YYYY-MM-DD".
  static std::optional<Date> from_iso(const std::string& s);

  /// @brief Date depuis un numéro de jour (inverse de serial()).
  static Date from_serial(long days) noexcept;

  /// @return Jours écoulés depuis 1970-01-01.
  long serial() const noexcept;

  /// @return 0 = lundi ... 6 = dimanche.
  int weekday() const noexcept;

  Date add_days(long n) const noexcept { return from_serial(serial() + n); }

  std::string to_iso() const;
};

/// @brief Vrai si (y, m, d) désigne un jour existant.
bool is_valid_date(int y, int m, int d) noexcept;

/// @brief Nombre de jours du mois m de l'année y.
int days_in_month(int y, int m) noexcept;

/// @brief b - a en jours calendaires.
inline long days_between(const Date& a, const Date& b) noexcept {
  return b.serial() - a.serial();
}

inline bool operator==(const Date& a, const Date& b) noexcept {
  return a.year == b.year && a.month == b.month && a.day == b.day;
}
inline bool operator!=(const Date& a, const Date& b) noexcept { return !(a == b); }
inline bool operator<(const Date& a, const Date& b) noexcept {
  if (a.year != b.year) return a.year < b.year;
  if (a.month != b.month) return a.month < b.month;
  return a.day < b.day;
}
inline bool operator>(const Date& a, const Date& b) noexcept { return b < a; }
inline bool operator<=(const Date& a, const Date& b) noexcept { return !(b < a); }
inline bool operator>=(const Date& a, const Date& b) noexcept { return !(a < b); }

} // namespace core
} // namespace cw
