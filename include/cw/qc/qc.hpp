#pragma once
#include <cw/core/diagnostics.hpp>
#include <cw/market/quote.hpp>
#include <cw/metrics/derived.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace cw::qc {

// Lignes partageant la même clé (date, côté, strike). Toutes sont conservées.
struct DuplicateGroup {
  core::Date trade_date;
  market::OptionSide side{market::OptionSide::Unknown};
  double strike{0.0};
  std::vector<std::size_t> rows;   // OptionQuote::row des lignes concernées
};

// Désaccord entre le drapeau inTheMoney de la source et is_itm recalculé
struct ItmMismatch {
  std::size_t row{0};
  std::string source_id;
  double strike{0.0};
  double spot{0.0};
  bool flag{false};      // valeur source
  bool derived{false};   // is_itm (fait foi pour les métriques)
};

// ask < bid : transmis tel quel, signalé pour audit
struct CrossedQuote {
  std::size_t row{0};
  std::string source_id;
  double bid{0.0};
  double ask{0.0};
};

// Groupes triés par (date, côté, strike) ; strikes NaN ignorés.
std::vector<DuplicateGroup> find_duplicate_keys(const std::vector<market::OptionQuote>& quotes);

// Ignore les lignes sans drapeau source.
std::vector<ItmMismatch> compare_itm_flags(const std::vector<metrics::DerivedQuote>& derived);

std::vector<CrossedQuote> find_crossed_quotes(const std::vector<market::OptionQuote>& quotes);

// Un diagnostic par groupe / par ligne.
void append_warnings(const std::vector<DuplicateGroup>& dups, std::vector<Diagnostic>& out);
void append_warnings(const std::vector<ItmMismatch>& mism, std::vector<Diagnostic>& out);
void append_warnings(const std::vector<CrossedQuote>& crossed, std::vector<Diagnostic>& out);

} // namespace cw::qc
