// app/cli/chain_ingest/main.cpp
#include "cw/config/pipeline_config.hpp"
#include "cw/ingest/dataset.hpp"
#include "cw/io/table_writer.hpp"
#include "cw/metrics/aggregate.hpp"
#include <iostream>
#include <string>
#include <vector>
#include <stdexcept>
#include <optional>

static void usage(const char* argv0){
  std::cerr <<
    "Usage: " << argv0 << " -d <dir> [-o combined.csv] [-e .csv] [-w]\n"
    "Options:\n"
    "  -d / --dir     repertoire des fichiers de chaine (def: dataset)\n"
    "  -o / --out     ecrit la table normalisee combinee\n"
    "  -e / --ext     extension des fichiers (def: .csv)\n"
    "  -w             affiche les diagnostics\n";
}

static void print_opt(const char* label, const std::optional<double>& v){
  std::cout << label;
  if (v) std::cout << *v; else std::cout << "n/a";
  std::cout << "\n";
}

int main(int argc, char** argv){
  cw::config::PipelineConfig cfg;
  std::string out_path;
  bool show_warnings = false;

  for (int i=1;i<argc;++i){
    std::string a = argv[i];
    if ((a=="-d" || a=="--dir") && i+1<argc) cfg.data_dir = argv[++i];
    else if ((a=="-o" || a=="--out") && i+1<argc) out_path = argv[++i];
    else if ((a=="-e" || a=="--ext") && i+1<argc) cfg.extension = argv[++i];
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

  // 1) Journal par source
  for (const auto& s : res.log) {
    std::cout << (s.ok ? "  ok   " : "  FAIL ") << s.source_id;
    if (s.ok) {
      std::cout << "  date=" << (s.trade_date ? s.trade_date->to_iso() : std::string("?"))
                << " side=" << cw::market::to_string(s.side)
                << " rows=" << s.rows;
    } else {
      std::cout << "  (" << s.error << ")";
    }
    std::cout << "\n";
  }
  std::cout << "Sources: ok=" << res.sources_ok() << " failed=" << res.sources_failed() << "\n";
  std::cout << "Normalized rows: " << res.dataset.rows.size()
            << "  columns: " << res.dataset.output_columns().size() << "\n";

  // 2) Résumé du jeu de données
  std::vector<cw::Diagnostic> diags = res.warnings;
  const auto quotes  = cw::ingest::extract_quotes(res.dataset, &diags);
  const auto derived = cw::metrics::derive_all(quotes);
  const auto sum = cw::metrics::summarize_dataset(quotes, derived);

  std::cout << "Quotes: " << sum.rows << " (calls=" << sum.calls << ", puts=" << sum.puts << ")\n";
  if (sum.first_date && sum.last_date) {
    std::cout << "Dates: " << sum.dates << " from " << sum.first_date->to_iso()
              << " to " << sum.last_date->to_iso() << "\n";
  }
  std::cout << "SPX: mean=" << sum.spx_mean << " min=" << sum.spx_min
            << " max=" << sum.spx_max << " sd=" << sum.spx_stddev << "\n";
  std::cout << "VIX: mean=" << sum.vix_mean << " min=" << sum.vix_min
            << " max=" << sum.vix_max << "\n";
  std::cout << "Volume: " << sum.total_volume << "  open interest: " << sum.total_open_interest << "\n";
  print_opt("SPX/VIX correlation: ", sum.spx_vix_correlation);

  // 3) Export éventuel
  if (!out_path.empty()) {
    try { cw::io::write_normalized_csv(out_path, res.dataset); }
    catch (const std::exception& e) { std::cerr << "error: " << e.what() << "\n"; return 4; }
    std::cout << "Normalized table written to: " << out_path << "\n";
  }

  if (show_warnings) {
    for (const auto& d : diags) std::cerr << "[warn] " << cw::format_diagnostic(d) << "\n";
  }
  return 0;
}
