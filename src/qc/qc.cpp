#include "cw/qc/qc.hpp"

#include <cmath>
#include <map>
#include <sstream>
#include <tuple>

namespace {
inline bool fin(double x){ return std::isfinite(x); }

inline std::string fmt_num(double x){
  std::ostringstream os;
  os << x;
  return os.str();
}
} // namespace

namespace cw::qc {

std::vector<DuplicateGroup>
find_duplicate_keys(const std::vector<market::OptionQuote>& quotes)
{
  using Key = std::tuple<long, int, double>;
  std::map<Key, DuplicateGroup> groups;

  for (const auto& q : quotes) {
    if (!fin(q.strike)) continue;
    Key k{q.trade_date.serial(), static_cast<int>(q.side), q.strike};
    auto& g = groups[k];
    if (g.rows.empty()) {
      g.trade_date = q.trade_date;
      g.side = q.side;
      g.strike = q.strike;
    }
    g.rows.push_back(q.row);
  }

  std::vector<DuplicateGroup> out;
  for (auto& kv : groups) {
    if (kv.second.rows.size() > 1) out.push_back(std::move(kv.second));
  }
  return out;
}

std::vector<ItmMismatch>
compare_itm_flags(const std::vector<metrics::DerivedQuote>& derived)
{
  std::vector<ItmMismatch> out;
  for (const auto& d : derived) {
    if (!d.quote.in_the_money) continue;
    if (*d.quote.in_the_money == d.is_itm) continue;

    ItmMismatch m;
    m.row = d.quote.row;
    m.source_id = d.quote.source_id;
    m.strike = d.quote.strike;
    m.spot = d.quote.underlying_close;
    m.flag = *d.quote.in_the_money;
    m.derived = d.is_itm;
    out.push_back(m);
  }
  return out;
}

std::vector<CrossedQuote>
find_crossed_quotes(const std::vector<market::OptionQuote>& quotes)
{
  std::vector<CrossedQuote> out;
  for (const auto& q : quotes) {
    if (fin(q.bid) && fin(q.ask) && q.ask < q.bid) {
      out.push_back({q.row, q.source_id, q.bid, q.ask});
    }
  }
  return out;
}

void append_warnings(const std::vector<DuplicateGroup>& dups, std::vector<Diagnostic>& out) {
  for (const auto& g : dups) {
    out.push_back({DiagnosticCode::DuplicateKeyWarning, std::string(),
                   g.trade_date.to_iso() + " " + market::to_string(g.side)
                   + " K=" + fmt_num(g.strike) + " : "
                   + std::to_string(g.rows.size()) + " lignes conservées"});
  }
}

void append_warnings(const std::vector<ItmMismatch>& mism, std::vector<Diagnostic>& out) {
  for (const auto& m : mism) {
    out.push_back({DiagnosticCode::ItmFlagMismatch, m.source_id,
                   "ligne " + std::to_string(m.row) + " K=" + fmt_num(m.strike)
                   + " S=" + fmt_num(m.spot)
                   + " inTheMoney=" + (m.flag ? "true" : "false")
                   + " is_itm=" + (m.derived ? "true" : "false")});
  }
}

void append_warnings(const std::vector<CrossedQuote>& crossed, std::vector<Diagnostic>& out) {
  for (const auto& c : crossed) {
    out.push_back({DiagnosticCode::CrossedQuote, c.source_id,
                   "ligne " + std::to_string(c.row) + " ask " + fmt_num(c.ask)
                   + " < bid " + fmt_num(c.bid)});
  }
}

} // namespace cw::qc
