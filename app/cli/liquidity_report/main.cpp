// app/cli/liquidity_report/main.cpp
#include "cw/config/pipeline_config.hpp"
#include "cw/ingest/dataset.hpp"
#include "cw/io/table_writer.hpp"
#include "cw/metrics/aggregate.hpp"
#include "cw/qc/qc.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>
#include <stdexcept>
#include <cstdlib>

static void usage(const char* argv0){
  std::cerr <<
    "Usage: " << argv0 << " -d <dir> [-o derived.csv] [-s summary.csv] [-q 0.9] [-w]\n"
    "Options:\n"
    "  -d / --dir       repertoire des fichiers de chaine (def: dataset)\n"
    "  -o / --out       ecrit la table des metriques derivees\n"
    "  -s / --summary   ecrit le resume par (date, cote, categorie)\n"
    "  -q / --quantile  quantile des jours a fort volume (def: 0.9)\n"
    "  -w               affiche les diagnostics\n";
}

static std::string opt_str(const std::optional<double>& v){
  if (!v) return "n/a";
  std::ostringstream os; os << std::fixed << std::setprecision(4) << *v;
  return os.str();
}

int main(int argc, char** argv){
  cw::config::PipelineConfig cfg;
  std::string derived_path, summary_path;
  bool show_warnings = false;

  for (int i=1;i<argc;++i){
    std::string a = argv[i];
    if ((a=="-d" || a=="--dir") && i+1<argc) cfg.data_dir = argv[++i];
    else if ((a=="-o" || a=="--out") && i+1<argc) derived_path = argv[++i];
    else if ((a=="-s" || a=="--summary") && i+1<argc) summary_path = argv[++i];
    else if ((a=="-q" || a=="--quantile") && i+1<argc) cfg.high_volume_q = std::atof(argv[++i]);
    else if (a=="-w" || a=="--show-warnings") show_warnings = true;
    else if (a=="-h" || a=="--help") { usage(argv[0]); return 0; }
    else { usage(argv[0]); return 1; }
  }

  cw::ingest::IngestResult res;
  try {
    cfg.validate();
    res = cw::ingest::ingest_directory(cfg.data_dir, cfg.extension);
  } catch (const std::invalid_argument& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 2;
  }

  std::vector<cw::Diagnostic> diags = res.warnings;
  const auto quotes  = cw::ingest::extract_quotes(res.dataset, &diags);
  const auto derived = cw::metrics::derive_all(quotes);
  std::cout << "Derived quotes: " << derived.size() << " / " << quotes.size() << "\n";

  // 1) Coût de liquidité par côté et catégorie
  cw::metrics::GroupBy by; by.side = true; by.category = true;
  const auto groups = cw::metrics::summarize_liquidity(derived, by, &diags);
  std::cout << "Liquidity cost by side and moneyness:\n";
  for (const auto& g : groups) {
    std::cout << "  " << std::left << std::setw(5) << cw::market::to_string(*g.side)
              << " " << std::setw(18) << cw::metrics::to_string(*g.category) << std::right
              << " n=" << g.quotes
              << " vol=" << g.total_volume
              << " wavg=" << opt_str(g.weighted_cost)
              << " mean=" << g.mean_cost
              << " median=" << g.median_cost
              << "\n";
  }

  // 2) Jours à fort volume
  const auto daily = cw::metrics::daily_volumes(quotes);
  cw::metrics::HighVolumeDays hv;
  try { hv = cw::metrics::high_volume_days(daily, cfg.high_volume_q); }
  catch (const std::exception& e) { std::cerr << "error: " << e.what() << "\n"; return 1; }
  std::cout << "High-volume days (q=" << cfg.high_volume_q << ", threshold=" << hv.threshold << "): "
            << hv.days.size() << "\n";
  for (const auto& d : hv.days) std::cout << "  " << d.date.to_iso() << "  " << d.volume << "\n";

  // 3) Profit teneur de marché
  std::cout << "Total market-maker profit: " << std::fixed << std::setprecision(2)
            << cw::metrics::total_market_maker_profit(derived) << "\n" << std::defaultfloat;

  // 4) QC
  const auto dups    = cw::qc::find_duplicate_keys(quotes);
  const auto mism    = cw::qc::compare_itm_flags(derived);
  const auto crossed = cw::qc::find_crossed_quotes(quotes);
  std::cout << "QC: duplicate keys=" << dups.size()
            << " itm flag mismatches=" << mism.size()
            << " crossed quotes=" << crossed.size() << "\n";
  cw::qc::append_warnings(dups, diags);
  cw::qc::append_warnings(mism, diags);
  cw::qc::append_warnings(crossed, diags);

  // 5) Exports
  try {
    if (!derived_path.empty()) {
      cw::io::write_derived_csv(derived_path, res.dataset, derived);
      std::cout << "Derived table written to: " << derived_path << "\n";
    }
    if (!summary_path.empty()) {
      cw::metrics::GroupBy all; all.date = true; all.side = true; all.category = true;
      cw::io::write_liquidity_summary_csv(summary_path, cw::metrics::summarize_liquidity(derived, all));
      std::cout << "Summary written to: " << summary_path << "\n";
    }
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 4;
  }

  if (show_warnings) {
    for (const auto& d : diags) std::cerr << "[warn] " << cw::format_diagnostic(d) << "\n";
  }
  return 0;
}
