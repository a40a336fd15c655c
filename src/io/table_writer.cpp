#include "cw/io/table_writer.hpp"
#include "cw/io/chain_csv.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace {

std::ofstream open_for_write(const std::string& path) {
  std::filesystem::path p(path);
  if (p.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(p.parent_path(), ec);
  }
  std::ofstream out(path);
  if (!out) throw std::runtime_error("cannot open " + path + " for write");
  return out;
}

inline void write_row(std::ostream& out, const std::vector<std::string>& cells) {
  for (std::size_t i=0;i<cells.size();++i) {
    if (i) out << ',';
    out << cw::io::escape_csv_field(cells[i]);
  }
  out << '\n';
}

inline std::string opt_num(const std::optional<double>& v) {
  return v ? cw::io::format_number(*v) : std::string();
}

} // namespace

namespace cw::io {

std::string format_number(double x) {
  if (!std::isfinite(x)) return std::string();
  std::ostringstream os;
  os.precision(10);
  os << x;
  return os.str();
}

// ===== table normalisée =====

static std::vector<std::string> normalized_cells(const ingest::NormalizedDataset& ds, std::size_t i) {
  const auto& r = ds.rows[i];
  std::vector<std::string> cells = r.cells;
  cells.resize(ds.columns.size());
  cells.push_back(r.trade_date.to_iso());
  cells.push_back(market::to_string(r.side));
  cells.push_back(ds.sources[r.source]);
  return cells;
}

void write_normalized_csv(std::ostream& out, const ingest::NormalizedDataset& ds) {
  write_row(out, ds.output_columns());
  for (std::size_t i=0;i<ds.rows.size();++i) write_row(out, normalized_cells(ds, i));
}

void write_normalized_csv(const std::string& path, const ingest::NormalizedDataset& ds) {
  auto out = open_for_write(path);
  write_normalized_csv(out, ds);
}

// ===== table dérivée =====

static const std::vector<std::string>& derived_columns() {
  static const std::vector<std::string> cols = {
    "moneyness", "intrinsic_value", "time_value", "is_itm",
    "bid_ask_spread", "mid_price", "itm_discount", "spread_cost",
    "effective_liquidity_cost", "last_vs_mid", "mm_profit_per_contract",
    "moneyness_category"
  };
  return cols;
}

void write_derived_csv(std::ostream& out,
                       const ingest::NormalizedDataset& ds,
                       const std::vector<metrics::DerivedQuote>& derived)
{
  auto header = ds.output_columns();
  header.insert(header.end(), derived_columns().begin(), derived_columns().end());
  write_row(out, header);

  for (const auto& d : derived) {
    if (d.quote.row >= ds.rows.size()) {
      throw std::out_of_range("write_derived_csv: row " + std::to_string(d.quote.row)
                              + " absente de la table normalisée");
    }
    auto cells = normalized_cells(ds, d.quote.row);
    cells.push_back(format_number(d.moneyness));
    cells.push_back(format_number(d.intrinsic_value));
    cells.push_back(format_number(d.time_value));
    cells.push_back(d.is_itm ? "true" : "false");
    cells.push_back(format_number(d.bid_ask_spread));
    cells.push_back(format_number(d.mid_price));
    cells.push_back(format_number(d.itm_discount));
    cells.push_back(format_number(d.spread_cost));
    cells.push_back(format_number(d.effective_liquidity_cost));
    cells.push_back(format_number(d.last_vs_mid));
    cells.push_back(format_number(d.mm_profit_per_contract));
    cells.push_back(metrics::to_string(d.moneyness_category));
    write_row(out, cells);
  }
}

void write_derived_csv(const std::string& path,
                       const ingest::NormalizedDataset& ds,
                       const std::vector<metrics::DerivedQuote>& derived)
{
  auto out = open_for_write(path);
  write_derived_csv(out, ds, derived);
}

// ===== surface =====

void write_surface_csv(std::ostream& out, const surface::SurfaceGrid& g) {
  write_row(out, {"trade_date", surface::to_string(g.key), surface::to_string(g.metric), "baseline"});
  for (std::size_t i=0;i<g.dates.size();++i) {
    const std::string date = g.dates[i].to_iso();
    const std::string base = format_number(g.baseline[i]);
    for (std::size_t j=0;j<g.axis.size();++j) {
      write_row(out, {date, format_number(g.axis[j]), format_number(g.at(i, j)), base});
    }
  }
}

void write_surface_csv(const std::string& path, const surface::SurfaceGrid& g) {
  auto out = open_for_write(path);
  write_surface_csv(out, g);
}

// ===== résumés de liquidité =====

void write_liquidity_summary_csv(std::ostream& out,
                                 const std::vector<metrics::LiquiditySummary>& rows)
{
  write_row(out, {"trade_date", "option_side", "moneyness_category", "quotes", "total_volume",
                  "weighted_cost", "mean_cost", "median_cost", "mean_itm_discount",
                  "mean_spread_cost", "mm_profit"});
  for (const auto& s : rows) {
    write_row(out, {
      s.date ? s.date->to_iso() : std::string(),
      s.side ? market::to_string(*s.side) : std::string(),
      s.category ? metrics::to_string(*s.category) : std::string(),
      std::to_string(s.quotes),
      std::to_string(s.total_volume),
      opt_num(s.weighted_cost),
      format_number(s.mean_cost),
      format_number(s.median_cost),
      format_number(s.mean_itm_discount),
      format_number(s.mean_spread_cost),
      format_number(s.mm_profit)
    });
  }
}

void write_liquidity_summary_csv(const std::string& path,
                                 const std::vector<metrics::LiquiditySummary>& rows)
{
  auto out = open_for_write(path);
  write_liquidity_summary_csv(out, rows);
}

} // namespace cw::io
