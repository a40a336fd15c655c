#include <cw/core/date.hpp>

#include <cctype>
#include <cstdio>

namespace {

bool all_digits(const std::string& s, std::size_t from, std::size_t n) {
  if (from + n > s.size()) return false;
  for (std::size_t i = from; i < from + n; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
  }
  return true;
}

int to_int(const std::string& s, std::size_t from, std::size_t n) {
  int v = 0;
  for (std::size_t i = from; i < from + n; ++i) v = v * 10 + (s[i] - '0');
  return v;
}

} // namespace

namespace cw {
namespace core {

int days_in_month(int y, int m) noexcept {
  static constexpr int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (m < 1 || m > 12) return 0;
  const bool leap = (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0);
  return (m == 2 && leap) ? 29 : kDays[m - 1];
}

bool is_valid_date(int y, int m, int d) noexcept {
  return m >= 1 && m <= 12 && d >= 1 && d <= days_in_month(y, m);
}

std::optional<Date> Date::from_compact(const std::string& s) {
  if (s.size() != 8 || !all_digits(s, 0, 8)) return std::nullopt;
  const int y = to_int(s, 0, 4);
  const int m = to_int(s, 4, 2);
  const int d = to_int(s, 6, 2);
  if (!is_valid_date(y, m, d)) return std::nullopt;
  return Date{y, m, d};
}

std::optional<Date> Date::from_iso(const std::string& s) {
  if (s.size() != 10 || s[4] != '-' || s[7] != '-') return std::nullopt;
  if (!all_digits(s, 0, 4) || !all_digits(s, 5, 2) || !all_digits(s, 8, 2)) return std::nullopt;
  const int y = to_int(s, 0, 4);
  const int m = to_int(s, 5, 2);
  const int d = to_int(s, 8, 2);
  if (!is_valid_date(y, m, d)) return std::nullopt;
  return Date{y, m, d};
}

// Algorithmes days_from_civil / civil_from_days (H. Hinnant)
long Date::serial() const noexcept {
  const long y   = static_cast<long>(year) - (month <= 2 ? 1 : 0);
  const long era = (y >= 0 ? y : y - 399) / 400;
  const long yoe = y - era * 400;
  const long mp  = (month + 9) % 12;
  const long doy = (153 * mp + 2) / 5 + day - 1;
  const long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

Date Date::from_serial(long days) noexcept {
  days += 719468;
  const long era = (days >= 0 ? days : days - 146096) / 146097;
  const long doe = days - era * 146097;
  const long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const long mp  = (5 * doy + 2) / 153;
  const long d   = doy - (153 * mp + 2) / 5 + 1;
  const long m   = mp < 10 ? mp + 3 : mp - 9;
  const long y   = yoe + era * 400 + (m <= 2 ? 1 : 0);
  return Date{static_cast<int>(y), static_cast<int>(m), static_cast<int>(d)};
}

int Date::weekday() const noexcept {
  // 1970-01-01 était un jeudi (index 3)
  const long s = serial();
  const long w = (s % 7 + 7 + 3) % 7;
  return static_cast<int>(w);
}

std::string Date::to_iso() const {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
  return std::string(buf);
}

} // namespace core
} // namespace cw
