// app/cli/surface_export/main.cpp
#include "cw/config/pipeline_config.hpp"
#include "cw/ingest/dataset.hpp"
#include "cw/io/table_writer.hpp"
#include "cw/surface/presets.hpp"
#include <iostream>
#include <string>
#include <vector>
#include <stdexcept>
#include <cstdlib>

static void usage(const char* argv0){
  std::cerr <<
    "Usage: " << argv0 << " -d <dir> --surface price|iv|moneyness|spot|offset|liquidity\n"
    "                [--side call|put] [--every n] [-o grid.csv] [-w]\n"
    "Options:\n"
    "  -d / --dir     repertoire des fichiers de chaine (def: dataset)\n"
    "  --surface      type de surface (def: price)\n"
    "  --side         call ou put (def: call)\n"
    "  --every        garde une date sur n (def: 1)\n"
    "  -o / --out     CSV de sortie (def: <surface>_<side>_surface.csv)\n"
    "  -w             affiche les diagnostics\n";
}

int main(int argc, char** argv){
  cw::config::PipelineConfig cfg;
  std::string kind_str = "price", side_str = "call", out_path;
  bool show_warnings = false;

  for (int i=1;i<argc;++i){
    std::string a = argv[i];
    if ((a=="-d" || a=="--dir") && i+1<argc) cfg.data_dir = argv[++i];
    else if (a=="--surface" && i+1<argc) kind_str = argv[++i];
    else if (a=="--side" && i+1<argc) side_str = argv[++i];
    else if (a=="--every" && i+1<argc) {
      const long n = std::atol(argv[++i]);
      if (n < 1) { std::cerr << "error: --every doit etre >= 1\n"; return 1; }
      cfg.sample_every = static_cast<std::size_t>(n);
    }
    else if ((a=="-o" || a=="--out") && i+1<argc) out_path = argv[++i];
    else if (a=="-w" || a=="--show-warnings") show_warnings = true;
    else if (a=="-h" || a=="--help") { usage(argv[0]); return 0; }
    else { usage(argv[0]); return 1; }
  }

  const auto kind = cw::surface::parse_surface_kind(kind_str);
  if (!kind) { std::cerr << "error: surface inconnue '" << kind_str << "'\n"; usage(argv[0]); return 1; }
  cw::market::OptionSide side;
  if (side_str == "call")     side = cw::market::OptionSide::Call;
  else if (side_str == "put") side = cw::market::OptionSide::Put;
  else { std::cerr << "error: --side attend call ou put\n"; return 1; }

  if (out_path.empty()) {
    out_path = std::string(cw::surface::to_string(*kind)) + "_" + side_str + "_surface.csv";
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

  // 1) Configuration + construction (un seul constructeur pour toutes les surfaces)
  const auto req = cw::surface::preset_request(*kind, derived, side, cfg.sample_every);
  cw::surface::SurfaceGrid grid;
  try { grid = cw::surface::build_surface(derived, req); }
  catch (const std::exception& e) { std::cerr << "error: " << e.what() << "\n"; return 2; }

  const std::size_t cells = grid.dates.size() * grid.axis.size();
  std::cout << "Surface " << cw::surface::to_string(*kind) << " (" << side_str << "): dates="
            << grid.dates.size() << " axis=" << grid.axis.size()
            << " (" << cw::surface::to_string(grid.key) << ")"
            << " filled=" << grid.filled_cells() << "/" << cells << "\n";

  // 2) Export
  try { cw::io::write_surface_csv(out_path, grid); }
  catch (const std::exception& e) { std::cerr << "error: " << e.what() << "\n"; return 4; }
  std::cout << "Grid exported to: " << out_path << "\n";

  if (show_warnings) {
    for (const auto& d : diags) std::cerr << "[warn] " << cw::format_diagnostic(d) << "\n";
  }
  return 0;
}
