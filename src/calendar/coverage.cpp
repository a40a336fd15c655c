#include "cw/calendar/coverage.hpp"

#include <algorithm>
#include <stdexcept>

namespace {

inline void sort_unique(std::vector<cw::core::Date>& v) {
  std::sort(v.begin(), v.end());
  v.erase(std::unique(v.begin(), v.end()), v.end());
}

} // namespace

namespace cw {
namespace calendar {

std::vector<CoverageGap> find_gaps(std::vector<core::Date> dates, long threshold_days) {
  if (threshold_days < 0) throw std::invalid_argument("find_gaps: threshold_days must be >= 0");
  sort_unique(dates);

  std::vector<CoverageGap> out;
  for (std::size_t i=1;i<dates.size();++i) {
    const long d = core::days_between(dates[i-1], dates[i]);
    if (d > threshold_days) out.push_back({dates[i-1], dates[i], d});
  }
  return out;
}

std::vector<MonthCoverage> monthly_coverage(std::vector<core::Date> dates,
                                            std::size_t expected_per_month)
{
  sort_unique(dates);
  std::vector<MonthCoverage> out;
  for (const auto& d : dates) {
    if (out.empty() || out.back().year != d.year || out.back().month != d.month) {
      MonthCoverage m;
      m.year = d.year;
      m.month = d.month;
      m.expected = expected_per_month;
      out.push_back(m);
    }
    ++out.back().observed;
  }
  return out;
}

std::vector<core::Date> missing_weekdays(std::vector<core::Date> dates) {
  sort_unique(dates);
  std::vector<core::Date> out;
  if (dates.size() < 2) return out;

  std::size_t k = 0;
  for (long s = dates.front().serial(); s <= dates.back().serial(); ++s) {
    const core::Date d = core::Date::from_serial(s);
    if (k < dates.size() && dates[k] == d) { ++k; continue; }
    if (d.weekday() < 5) out.push_back(d);
  }
  return out;
}

} // namespace calendar
} // namespace cw
